#include "config_parser.hpp"

#include <fstream>
#include <stdexcept>

#define FERRY_LOG_COMPONENT "config_parser"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace engine {

using logging::kv;

bool ConfigParser::load_from_file(const std::string& path, FerryConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node node = YAML::LoadFile(path);
    if (!parse(node, config)) {
      return false;
    }
    FERRY_LOG_DEBUG("Loaded configuration" << kv("path", path));
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, FerryConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    return parse(node, config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse(const YAML::Node& node, FerryConfig& config) {
  if (!node.IsNull() && !node.IsMap()) {
    last_error_ = "Configuration root must be a mapping";
    return false;
  }

  if (node["s3"] && !parse_s3(node["s3"], config)) {
    return false;
  }
  try {
    config.transfer.endpoint = Endpoint::parse(config.s3.endpoint_url);
  } catch (const std::invalid_argument& e) {
    last_error_ = "Invalid s3.endpoint_url: " + std::string(e.what());
    return false;
  }
  if (node["transfer"] && !parse_transfer(node["transfer"], config.transfer)) {
    return false;
  }
  if (node["checksum"] && !parse_checksum(node["checksum"], config.checksum)) {
    return false;
  }
  if (node["retry"] && !parse_retry(node["retry"], config.transfer.retry)) {
    return false;
  }
  if (node["connection"] && !parse_connection(node["connection"], config.connection)) {
    return false;
  }
  if (node["state"] && !parse_state(node["state"], config.state)) {
    return false;
  }
  if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
    return false;
  }
  return true;
}

bool ConfigParser::parse_s3(const YAML::Node& node, FerryConfig& config) {
  S3Settings& s3 = config.s3;
  if (node["endpoint_url"]) {
    s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["access_key"]) {
    s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["session_token"]) {
    s3.session_token = node["session_token"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_transfer(const YAML::Node& node, ClientConfig& transfer) {
  if (node["part_size_mb"]) {
    transfer.part_size = node["part_size_mb"].as<uint64_t>() * kMiB;
  }
  if (node["multipart_threshold_mb"]) {
    transfer.multipart_threshold = node["multipart_threshold_mb"].as<uint64_t>() * kMiB;
  }
  if (node["min_final_part_size_kb"]) {
    transfer.min_final_part_size = node["min_final_part_size_kb"].as<uint64_t>() * 1024;
  }
  if (node["max_parts"]) {
    transfer.max_parts = node["max_parts"].as<uint32_t>();
  }
  if (node["max_concurrency"]) {
    transfer.max_concurrency = node["max_concurrency"].as<size_t>();
  }
  if (node["part_timeout_ms"]) {
    transfer.part_timeout = std::chrono::milliseconds(node["part_timeout_ms"].as<int64_t>());
  }
  if (node["discover_size_with_head"]) {
    transfer.discover_size_with_head = node["discover_size_with_head"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_checksum(const YAML::Node& node, ChecksumConfig& checksum) {
  try {
    if (node["algorithm"]) {
      checksum.algorithm = checksumAlgorithmFromName(node["algorithm"].as<std::string>());
    }
    if (node["location"]) {
      checksum.location = checksumLocationFromName(node["location"].as<std::string>());
    }
  } catch (const std::invalid_argument& e) {
    last_error_ = "Invalid checksum section: " + std::string(e.what());
    return false;
  }
  if (node["validate_response"]) {
    checksum.validate_response = node["validate_response"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_retry(const YAML::Node& node, RetryConfig& retry) {
  if (node["max_retries"]) {
    retry.max_retries = node["max_retries"].as<int>();
  }
  if (node["initial_delay_ms"]) {
    retry.initial_delay = std::chrono::milliseconds(node["initial_delay_ms"].as<int>());
  }
  if (node["max_delay_ms"]) {
    retry.max_delay = std::chrono::milliseconds(node["max_delay_ms"].as<int>());
  }
  if (node["exponential_base"]) {
    retry.exponential_base = node["exponential_base"].as<double>();
  }
  if (node["jitter"]) {
    retry.jitter = node["jitter"].as<bool>();
  }
  if (node["jitter_factor"]) {
    retry.jitter_factor = node["jitter_factor"].as<double>();
  }
  if (node["retryable_statuses"]) {
    if (!node["retryable_statuses"].IsSequence()) {
      last_error_ = "retry.retryable_statuses must be a list of HTTP status codes";
      return false;
    }
    retry.retryable_statuses.clear();
    for (const auto& status : node["retryable_statuses"]) {
      retry.retryable_statuses.insert(status.as<int>());
    }
  }
  return true;
}

bool ConfigParser::parse_connection(const YAML::Node& node, ConnectionConfig& connection) {
  if (node["max_connections"]) {
    connection.max_connections = node["max_connections"].as<size_t>();
  }
  if (node["connect_timeout_ms"]) {
    connection.connect_timeout =
      std::chrono::milliseconds(node["connect_timeout_ms"].as<int64_t>());
  }
  if (node["request_timeout_ms"]) {
    connection.request_timeout =
      std::chrono::milliseconds(node["request_timeout_ms"].as<int64_t>());
  }
  if (node["keep_alive"]) {
    connection.keep_alive = node["keep_alive"].as<bool>();
  }
  return true;
}

bool ConfigParser::parse_state(const YAML::Node& node, StateConfig& state) {
  if (node["db_path"]) {
    state.db_path = node["db_path"].as<std::string>();
  }
  if (node["keep_finished_hours"]) {
    state.keep_finished_hours = node["keep_finished_hours"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, logging::LoggingConfig& logging) {
  auto level = [this](const YAML::Node& value, logging::severity_level& out) {
    auto parsed = logging::parse_severity_level(value.as<std::string>());
    if (!parsed) {
      last_error_ = "Invalid log level: " + value.as<std::string>();
      return false;
    }
    out = *parsed;
    return true;
  };

  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"] && !level(console["level"], logging.console_level)) {
      return false;
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"] && !level(file["level"], logging.file_level)) {
      return false;
    }
    if (file["directory"]) {
      logging.file_config.directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_config.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      std::string format = file["format"].as<std::string>();
      if (format != "json" && format != "text") {
        last_error_ = "logging.file.format must be 'json' or 'text'";
        return false;
      }
      logging.file_config.format_json = format == "json";
    }
    if (file["rotation_size_mb"]) {
      logging.file_config.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      logging.file_config.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      logging.file_config.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::validate(const FerryConfig& config, std::string& error_msg) {
  if (config.transfer.endpoint.host.empty()) {
    error_msg = "s3.endpoint_url has no host";
    return false;
  }

  const ClientConfig& transfer = config.transfer;
  if (transfer.part_size == 0) {
    error_msg = "transfer.part_size_mb must be > 0";
    return false;
  }
  if (transfer.part_size > kMaxUploadPartSize) {
    error_msg = "transfer.part_size_mb exceeds the 5 GiB S3 part limit";
    return false;
  }
  if (transfer.max_parts == 0 || transfer.max_parts > kMaxUploadParts) {
    error_msg = "transfer.max_parts must be between 1 and 10000";
    return false;
  }
  if (transfer.min_final_part_size > transfer.part_size) {
    error_msg = "transfer.min_final_part_size_kb must not exceed the part size";
    return false;
  }
  if (transfer.part_timeout.count() < 0) {
    error_msg = "transfer.part_timeout_ms must be >= 0";
    return false;
  }

  const RetryConfig& retry = transfer.retry;
  if (retry.max_retries < 0) {
    error_msg = "retry.max_retries must be >= 0";
    return false;
  }
  if (retry.initial_delay.count() < 0 || retry.max_delay < retry.initial_delay) {
    error_msg = "retry delays must satisfy 0 <= initial_delay_ms <= max_delay_ms";
    return false;
  }
  if (retry.exponential_base < 1.0) {
    error_msg = "retry.exponential_base must be >= 1.0";
    return false;
  }
  if (retry.jitter_factor < 0.0 || retry.jitter_factor > 1.0) {
    error_msg = "retry.jitter_factor must be between 0 and 1";
    return false;
  }

  if (config.connection.max_connections == 0) {
    error_msg = "connection.max_connections must be > 0";
    return false;
  }
  if (config.state.db_path.empty()) {
    error_msg = "state.db_path is empty";
    return false;
  }
  if (config.logging.file_enabled && config.logging.file_config.directory.empty()) {
    error_msg = "logging.file.directory is empty";
    return false;
  }

  return true;
}

}  // namespace engine
}  // namespace ferry
