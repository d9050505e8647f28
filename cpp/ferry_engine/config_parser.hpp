#ifndef FERRY_ENGINE_CONFIG_PARSER_HPP
#define FERRY_ENGINE_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "ferry_config.hpp"

namespace ferry {
namespace engine {

/**
 * Loads FerryConfig from YAML. Sections: s3, transfer, checksum, retry,
 * connection, state, logging. Missing keys keep their defaults.
 */
class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, FerryConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, FerryConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const FerryConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse(const YAML::Node& node, FerryConfig& config);
  bool parse_s3(const YAML::Node& node, FerryConfig& config);
  bool parse_transfer(const YAML::Node& node, ClientConfig& transfer);
  bool parse_checksum(const YAML::Node& node, ChecksumConfig& checksum);
  bool parse_retry(const YAML::Node& node, RetryConfig& retry);
  bool parse_connection(const YAML::Node& node, ConnectionConfig& connection);
  bool parse_state(const YAML::Node& node, StateConfig& state);
  bool parse_logging(const YAML::Node& node, logging::LoggingConfig& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_CONFIG_PARSER_HPP
