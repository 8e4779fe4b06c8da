#include "chunkup/upload/chunk_index.hpp"
#include "chunkup/upload/chunker.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/upload/upload_config.hpp"
#include "chunkup/utilities/logger.h"

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace chunkup;

static int plan_command(const std::vector<std::string> &files,
                        const UploadConfig &config) {
  Chunker chunker(config.chunkSize);
  ChunkIndex index;
  nlohmann::json doc;
  doc["chunk_size"] = config.chunkSize;
  doc["artifacts"] = nlohmann::json::array();
  doc["skipped"] = nlohmann::json::array();
  size_t referenced = 0;
  int rc = 0;

  for (size_t i = 0; i < files.size(); ++i) {
    Artifact artifact;
    artifact.localPath = files[i];
    artifact.displayName = std::filesystem::path(files[i]).filename().string();
    try {
      uint64_t size = Chunker::measure(artifact);
      if (size > config.maxFileSize) {
        doc["skipped"].push_back(
            {{"name", artifact.displayName},
             {"size", size},
             {"reason", "above max_file_size"}});
        continue;
      }
      ChunkedArtifact chunked = chunker.chunk(i, artifact);
      index.insertArtifact(chunked);
      referenced += chunked.chunks.size();

      nlohmann::json chunks = nlohmann::json::array();
      for (const auto &c : chunked.chunks) {
        chunks.push_back({{"checksum", digestToHex(c.checksum)},
                          {"offset", c.offset},
                          {"length", c.length}});
      }
      doc["artifacts"].push_back({{"name", artifact.displayName},
                                  {"checksum", digestToHex(chunked.checksum)},
                                  {"size", chunked.size},
                                  {"chunks", chunks}});
    } catch (const UploadException &e) {
      doc["skipped"].push_back(
          {{"name", artifact.displayName}, {"reason", e.what()}});
      rc = 1;
    }
  }
  doc["referenced_chunks"] = referenced;
  doc["distinct_chunks"] = index.size();
  std::cout << doc.dump(2) << std::endl;
  return rc;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cout << "Usage: chunkup plan <file>...\n"
              << "       chunkup config\n";
    return 1;
  }

  try {
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  UploadConfig config;
  try {
    config = loadUploadConfig();
  } catch (const UploadException &e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  std::string cmd = argv[1];
  if (cmd == "plan" && argc >= 3) {
    return plan_command(std::vector<std::string>(argv + 2, argv + argc),
                        config);
  } else if (cmd == "config") {
    std::cout << configToYaml(config) << std::endl;
    return 0;
  }
  std::cout << "Unknown command" << std::endl;
  return 1;
}
