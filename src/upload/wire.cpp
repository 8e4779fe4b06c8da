#include "chunkup/upload/wire.hpp"
#include "chunkup/upload/errors.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace chunkup {
namespace wire {

namespace {

json parseBody(const std::string &body, const std::string &what) {
  try {
    return json::parse(body);
  } catch (const json::parse_error &e) {
    ThrowUploadException(ErrorKind::Protocol,
                         "Malformed " + what + " response: " + e.what());
  }
}

Digest checksumFromJson(const json &value, const std::string &what) {
  if (!value.is_string()) {
    ThrowUploadException(ErrorKind::Protocol,
                         "Non-string checksum in " + what);
  }
  try {
    return digestFromHex(value.get<std::string>());
  } catch (const std::invalid_argument &e) {
    ThrowUploadException(ErrorKind::Protocol,
                         "Invalid checksum in " + what + ": " + e.what());
  }
}

json checksumArray(const std::vector<Digest> &checksums) {
  json arr = json::array();
  for (const auto &d : checksums)
    arr.push_back(digestToHex(d));
  return arr;
}

std::vector<std::string> stringList(const json &doc, const char *key) {
  std::vector<std::string> out;
  if (doc.contains(key) && doc[key].is_array()) {
    for (const auto &v : doc[key]) {
      if (v.is_string())
        out.push_back(v.get<std::string>());
    }
  }
  return out;
}

} // namespace

std::string capabilityFor(ArtifactKind kind) {
  switch (kind) {
  case ArtifactKind::DebugFile:
    return "debug_files";
  case ArtifactKind::SourceFile:
  case ArtifactKind::SourceBundle:
    return "sources";
  case ArtifactKind::ArtifactBundle:
    return "artifact_bundles";
  default:
    return "";
  }
}

ChunkServerOptions parseServerOptions(const std::string &body) {
  json doc = parseBody(body, "chunk-upload options");
  ChunkServerOptions opts;
  std::string algorithm;
  try {
    opts.url = doc.at("url").get<std::string>();
    opts.chunkSize = doc.at("chunkSize").get<uint64_t>();
    opts.maxRequestSize = doc.at("maxRequestSize").get<uint64_t>();
    opts.concurrency = doc.at("concurrency").get<unsigned>();
    algorithm = doc.at("hashAlgorithm").get<std::string>();
    opts.maxFileSize = doc.value("maxFileSize", uint64_t{0});
    opts.maxWait = doc.value("maxWait", uint64_t{0});
  } catch (const json::exception &e) {
    ThrowUploadException(ErrorKind::Protocol,
                         std::string("Invalid chunk-upload options: ") +
                             e.what());
  }
  try {
    opts.hashAlgorithm = hashAlgorithmFromString(algorithm);
  } catch (const std::invalid_argument &e) {
    ThrowUploadException(ErrorKind::Config, e.what());
  }
  opts.compression = stringList(doc, "compression");
  opts.accept = stringList(doc, "accept");
  if (opts.accept.empty())
    opts.accept.push_back("debug_files");
  return opts;
}

std::string encodeChecksumList(const std::vector<Digest> &checksums) {
  json doc;
  doc["checksums"] = checksumArray(checksums);
  return doc.dump();
}

std::vector<Digest> decodeMissingList(const std::string &body) {
  json doc = parseBody(body, "missing-chunks");
  if (!doc.is_object() || !doc.contains("missing") ||
      !doc["missing"].is_array()) {
    ThrowUploadException(ErrorKind::Protocol,
                         "missing-chunks response lacks a 'missing' array");
  }
  std::vector<Digest> out;
  for (const auto &v : doc["missing"])
    out.push_back(checksumFromJson(v, "missing-chunks response"));
  return out;
}

AssemblyStatus parseFileState(const std::string &state) {
  if (state == "created")
    return AssemblyStatus::Pending;
  if (state == "assembling")
    return AssemblyStatus::InProgress;
  if (state == "ok")
    return AssemblyStatus::Ok;
  if (state == "error")
    return AssemblyStatus::Error;
  if (state == "not_found")
    return AssemblyStatus::NotFound;
  ThrowUploadException(ErrorKind::Protocol, "Unknown file state: " + state);
}

std::string encodeAssembleRequest(const std::vector<AssemblyManifest> &batch) {
  json doc = json::object();
  for (const auto &m : batch) {
    json entry;
    entry["name"] = m.name;
    if (m.debugId)
      entry["debug_id"] = *m.debugId;
    entry["chunks"] = checksumArray(m.chunks);
    doc[digestToHex(m.artifactChecksum)] = std::move(entry);
  }
  return doc.dump();
}

std::map<Digest, AssembleEntryResponse>
decodeAssembleResponse(const std::string &body) {
  json doc = parseBody(body, "assemble");
  if (!doc.is_object()) {
    ThrowUploadException(ErrorKind::Protocol,
                         "Assemble response is not an object");
  }
  std::map<Digest, AssembleEntryResponse> out;
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    Digest key = checksumFromJson(json(it.key()), "assemble response");
    const json &entry = it.value();
    if (!entry.is_object() || !entry.contains("state") ||
        !entry["state"].is_string()) {
      ThrowUploadException(ErrorKind::Protocol,
                           "Assemble entry " + it.key() + " lacks a state");
    }
    AssembleEntryResponse r;
    r.state = parseFileState(entry["state"].get<std::string>());
    if (entry.contains("missingChunks") && entry["missingChunks"].is_array()) {
      for (const auto &c : entry["missingChunks"])
        r.missingChunks.push_back(checksumFromJson(c, "missingChunks"));
    }
    if (entry.contains("detail") && entry["detail"].is_string())
      r.detail = entry["detail"].get<std::string>();
    out.emplace(key, std::move(r));
  }
  return out;
}

std::string multipartContentType(const std::string &boundary) {
  return "multipart/form-data; boundary=" + boundary;
}

std::string chunkFieldName(ChunkCompression compression) {
  switch (compression) {
  case ChunkCompression::Gzip:
    return "file_gzip";
  default:
    return "file";
  }
}

std::string encodeMultipartChunk(const std::string &boundary,
                                 const Digest &checksum,
                                 const std::vector<std::byte> &data,
                                 ChunkCompression compression) {
  std::string body;
  body.reserve(data.size() + 256);
  body += "--" + boundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"" +
          chunkFieldName(compression) + "\"; filename=\"" +
          digestToHex(checksum) + "\"\r\n";
  body += "Content-Type: application/octet-stream\r\n\r\n";
  body.append(reinterpret_cast<const char *>(data.data()), data.size());
  body += "\r\n--" + boundary + "--\r\n";
  return body;
}

} // namespace wire
} // namespace chunkup
