#include "chunkup/upload/upload_config.hpp"
#include "chunkup/upload/errors.hpp"
#include "chunkup/utilities/logger.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace chunkup {

namespace {

WaitMode waitModeFromString(const std::string &s) {
  if (s == "blocking")
    return WaitMode::Blocking;
  if (s == "bounded")
    return WaitMode::BoundedWait;
  if (s == "none" || s == "fire_and_forget")
    return WaitMode::FireAndForget;
  ThrowUploadException(ErrorKind::Config, "Unknown wait mode: " + s);
}

std::string waitModeToString(WaitMode mode) {
  switch (mode) {
  case WaitMode::Blocking:
    return "blocking";
  case WaitMode::BoundedWait:
    return "bounded";
  default:
    return "none";
  }
}

uint64_t parseUnsignedEnv(const char *name, const char *value) {
  try {
    size_t pos = 0;
    std::string s(value);
    if (!s.empty() && s[0] == '-')
      throw std::invalid_argument("negative");
    unsigned long long v = std::stoull(s, &pos);
    if (pos != s.size())
      throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::invalid_argument &) {
    ThrowUploadException(ErrorKind::Config, std::string("Invalid value for ") +
                                                name + ": " + value);
  } catch (const std::out_of_range &) {
    ThrowUploadException(ErrorKind::Config, std::string("Out of range ") +
                                                name + ": " + value);
  }
}

bool parseBoolEnv(const char *value) {
  std::string s(value);
  return !(s.empty() || s == "0" || s == "false" || s == "no");
}

void loadYaml(UploadConfig &config, const YAML::Node &node) {
  auto mark = [&config](const char *key) { config.explicitKeys.insert(key); };

  if (node["chunk_size"]) {
    config.chunkSize = node["chunk_size"].as<uint64_t>();
    mark("chunk_size");
  }
  if (node["max_file_size"]) {
    config.maxFileSize = node["max_file_size"].as<uint64_t>();
    mark("max_file_size");
  }
  if (node["concurrency"]) {
    config.concurrency = node["concurrency"].as<unsigned>();
    mark("concurrency");
  }
  if (node["hash_concurrency"])
    config.hashConcurrency = node["hash_concurrency"].as<unsigned>();
  if (node["dedup"])
    config.dedup = node["dedup"].as<bool>();
  if (node["diff_page_size"]) {
    config.diffPageSize = node["diff_page_size"].as<size_t>();
    mark("diff_page_size");
  }
  if (node["assemble_batch_size"])
    config.assembleBatchSize = node["assemble_batch_size"].as<size_t>();
  if (node["compression"]) {
    try {
      config.compression =
          chunkCompressionFromString(node["compression"].as<std::string>());
    } catch (const std::invalid_argument &e) {
      ThrowUploadException(ErrorKind::Config, e.what());
    }
    mark("compression");
  }

  if (const YAML::Node wait = node["wait"]) {
    if (wait["mode"])
      config.wait.mode = waitModeFromString(wait["mode"].as<std::string>());
    if (wait["wait_for"]) {
      config.wait.waitFor = std::chrono::seconds(wait["wait_for"].as<long>());
      mark("wait_for");
    }
    if (wait["global_timeout"])
      config.wait.globalTimeout =
          std::chrono::seconds(wait["global_timeout"].as<long>());
    if (wait["strict"])
      config.wait.strict = wait["strict"].as<bool>();
  }

  if (const YAML::Node retry = node["retry"]) {
    if (retry["max_attempts"])
      config.retry.maxAttempts = retry["max_attempts"].as<unsigned>();
    if (retry["initial_delay_ms"])
      config.retry.initialDelay =
          std::chrono::milliseconds(retry["initial_delay_ms"].as<long>());
    if (retry["multiplier"])
      config.retry.multiplier = retry["multiplier"].as<double>();
    if (retry["max_delay_ms"])
      config.retry.maxDelay =
          std::chrono::milliseconds(retry["max_delay_ms"].as<long>());
    if (retry["jitter"])
      config.retry.jitter = retry["jitter"].as<bool>();
  }

  if (const YAML::Node poll = node["poll"]) {
    if (poll["interval_ms"])
      config.poll.interval =
          std::chrono::milliseconds(poll["interval_ms"].as<long>());
    if (poll["backoff_factor"])
      config.poll.backoffFactor = poll["backoff_factor"].as<double>();
    if (poll["max_interval_ms"])
      config.poll.maxInterval =
          std::chrono::milliseconds(poll["max_interval_ms"].as<long>());
  }

  if (const YAML::Node ep = node["endpoints"]) {
    if (ep["options"])
      config.endpoints.options = ep["options"].as<std::string>();
    if (ep["chunk_upload"]) {
      config.endpoints.chunkUpload = ep["chunk_upload"].as<std::string>();
      mark("chunk_upload");
    }
    if (ep["chunk_diff"])
      config.endpoints.chunkDiff = ep["chunk_diff"].as<std::string>();
    if (ep["artifact_diff"])
      config.endpoints.artifactDiff = ep["artifact_diff"].as<std::string>();
    if (ep["assemble"])
      config.endpoints.assemble = ep["assemble"].as<std::string>();
  }
}

} // namespace

void validateUploadConfig(const UploadConfig &config) {
  if (config.chunkSize == 0)
    ThrowUploadException(ErrorKind::Config, "chunk_size must be positive");
  if (config.concurrency == 0)
    ThrowUploadException(ErrorKind::Config, "concurrency must be positive");
  if (config.hashConcurrency == 0)
    ThrowUploadException(ErrorKind::Config,
                         "hash_concurrency must be positive");
  if (config.diffPageSize == 0)
    ThrowUploadException(ErrorKind::Config,
                         "diff_page_size must be positive");
  if (config.assembleBatchSize == 0)
    ThrowUploadException(ErrorKind::Config,
                         "assemble_batch_size must be positive");
  if (config.retry.maxAttempts == 0)
    ThrowUploadException(ErrorKind::Config,
                         "retry.max_attempts must be positive");
}

void applyEnvironmentOverrides(UploadConfig &config) {
  if (const char *env = std::getenv("CHUNKUP_CONCURRENCY")) {
    config.concurrency =
        static_cast<unsigned>(parseUnsignedEnv("CHUNKUP_CONCURRENCY", env));
    config.explicitKeys.insert("concurrency");
  }
  if (const char *env = std::getenv("CHUNKUP_MAX_CHUNK_SIZE")) {
    config.chunkSize = parseUnsignedEnv("CHUNKUP_MAX_CHUNK_SIZE", env);
    config.explicitKeys.insert("chunk_size");
  }
  if (const char *env = std::getenv("CHUNKUP_MAX_FILE_SIZE")) {
    config.maxFileSize = parseUnsignedEnv("CHUNKUP_MAX_FILE_SIZE", env);
    config.explicitKeys.insert("max_file_size");
  }
  if (const char *env = std::getenv("CHUNKUP_WAIT")) {
    if (parseBoolEnv(env))
      config.wait.mode = WaitMode::Blocking;
  }
  if (const char *env = std::getenv("CHUNKUP_WAIT_FOR")) {
    config.wait.mode = WaitMode::BoundedWait;
    config.wait.waitFor = std::chrono::seconds(
        static_cast<long>(parseUnsignedEnv("CHUNKUP_WAIT_FOR", env)));
    config.explicitKeys.insert("wait_for");
  }
  if (const char *env = std::getenv("CHUNKUP_NO_DEDUP")) {
    if (parseBoolEnv(env))
      config.dedup = false;
  }
  if (const char *env = std::getenv("CHUNKUP_HTTP_MAX_RETRIES")) {
    config.retry.maxAttempts =
        static_cast<unsigned>(
            parseUnsignedEnv("CHUNKUP_HTTP_MAX_RETRIES", env)) +
        1;
  }
}

UploadConfig loadUploadConfig(const std::string &path) {
  UploadConfig config;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      if (node.IsMap()) {
        loadYaml(config, node);
      } else if (!node.IsNull()) {
        ThrowUploadException(ErrorKind::Config,
                             path + ": top level must be a mapping");
      }
    } catch (const YAML::Exception &e) {
      ThrowUploadException(ErrorKind::Config,
                           "Failed to parse " + path + ": " + e.what());
    }
  } else {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "No config at " + path + ", using defaults");
  }
  applyEnvironmentOverrides(config);
  validateUploadConfig(config);
  return config;
}

UploadConfig loadUploadConfig() {
  const char *cfg = std::getenv("CHUNKUP_CONFIG");
  if (!cfg)
    cfg = "chunkup.yaml";
  return loadUploadConfig(cfg);
}

void applyServerOptions(UploadConfig &config,
                        const wire::ChunkServerOptions &options) {
  if (options.chunkSize > 0) {
    if (!config.isExplicit("chunk_size"))
      config.chunkSize = options.chunkSize;
    else
      config.chunkSize = std::min(config.chunkSize, options.chunkSize);
  }
  if (options.maxFileSize > 0 && !config.isExplicit("max_file_size"))
    config.maxFileSize = options.maxFileSize;
  if (options.concurrency > 0 && !config.isExplicit("concurrency"))
    config.concurrency = options.concurrency;
  if (!options.url.empty() && !config.isExplicit("chunk_upload"))
    config.endpoints.chunkUpload = options.url;
  if (options.maxRequestSize > 0) {
    // Each hex checksum costs 43 bytes of JSON including quotes and comma.
    size_t fit = std::max<size_t>(1, options.maxRequestSize / 43);
    config.diffPageSize = std::min(config.diffPageSize, fit);
  }
  if (!config.isExplicit("compression")) {
    config.compression = selectCompression(options.compression);
  } else if (selectCompression(options.compression) < config.compression) {
    Logger::getInstance().log(
        LogLevel::WARN, "Server does not accept " +
                            ChunkCompressionToString(config.compression) +
                            " chunks, sending them uncompressed");
    config.compression = ChunkCompression::Uncompressed;
  }
  config.acceptedCapabilities = options.accept;
  if (options.maxWait > 0) {
    auto cap = std::chrono::seconds(static_cast<long>(options.maxWait));
    if (config.wait.mode == WaitMode::BoundedWait && config.wait.waitFor > cap)
      config.wait.waitFor = cap;
    config.wait.globalTimeout = std::min(config.wait.globalTimeout, cap);
  }
}

wire::ChunkServerOptions fetchServerOptions(http::Transport &transport,
                                            const std::string &path) {
  http::Request req;
  req.method = http::HttpMethod::GET;
  req.path = path;
  http::Response resp;
  try {
    resp = transport.send(req);
  } catch (const http::TransportError &e) {
    ThrowUploadException(ErrorKind::Transport,
                         "Fetching chunk-upload options failed: " +
                             std::string(e.what()));
  }
  if (!resp.isSuccess()) {
    ThrowUploadException(ErrorKind::Protocol,
                         "Chunk-upload options returned HTTP " +
                             std::to_string(resp.status) + " " +
                             http::ReasonPhrase(resp.status));
  }
  return wire::parseServerOptions(resp.body);
}

std::string configToYaml(const UploadConfig &config) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "chunk_size" << YAML::Value << config.chunkSize;
  out << YAML::Key << "max_file_size" << YAML::Value << config.maxFileSize;
  out << YAML::Key << "concurrency" << YAML::Value << config.concurrency;
  out << YAML::Key << "hash_concurrency" << YAML::Value
      << config.hashConcurrency;
  out << YAML::Key << "dedup" << YAML::Value << config.dedup;
  out << YAML::Key << "diff_page_size" << YAML::Value << config.diffPageSize;
  out << YAML::Key << "assemble_batch_size" << YAML::Value
      << config.assembleBatchSize;
  out << YAML::Key << "compression" << YAML::Value
      << ChunkCompressionToString(config.compression);

  out << YAML::Key << "wait" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "mode" << YAML::Value
      << waitModeToString(config.wait.mode);
  out << YAML::Key << "wait_for" << YAML::Value
      << static_cast<long>(config.wait.waitFor.count());
  out << YAML::Key << "global_timeout" << YAML::Value
      << static_cast<long>(config.wait.globalTimeout.count());
  out << YAML::Key << "strict" << YAML::Value << config.wait.strict;
  out << YAML::EndMap;

  out << YAML::Key << "retry" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "max_attempts" << YAML::Value
      << config.retry.maxAttempts;
  out << YAML::Key << "initial_delay_ms" << YAML::Value
      << static_cast<long>(config.retry.initialDelay.count());
  out << YAML::Key << "multiplier" << YAML::Value << config.retry.multiplier;
  out << YAML::Key << "max_delay_ms" << YAML::Value
      << static_cast<long>(config.retry.maxDelay.count());
  out << YAML::Key << "jitter" << YAML::Value << config.retry.jitter;
  out << YAML::EndMap;

  out << YAML::Key << "poll" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "interval_ms" << YAML::Value
      << static_cast<long>(config.poll.interval.count());
  out << YAML::Key << "backoff_factor" << YAML::Value
      << config.poll.backoffFactor;
  out << YAML::Key << "max_interval_ms" << YAML::Value
      << static_cast<long>(config.poll.maxInterval.count());
  out << YAML::EndMap;

  out << YAML::Key << "endpoints" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "options" << YAML::Value << config.endpoints.options;
  out << YAML::Key << "chunk_upload" << YAML::Value
      << config.endpoints.chunkUpload;
  out << YAML::Key << "chunk_diff" << YAML::Value
      << config.endpoints.chunkDiff;
  out << YAML::Key << "artifact_diff" << YAML::Value
      << config.endpoints.artifactDiff;
  out << YAML::Key << "assemble" << YAML::Value << config.endpoints.assemble;
  out << YAML::EndMap;

  out << YAML::EndMap;
  return out.c_str();
}

} // namespace chunkup
