#ifndef FERRY_ENGINE_FERRY_CONFIG_HPP
#define FERRY_ENGINE_FERRY_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string>

#include <ferry_log_init.hpp>

#include "client_config.hpp"
#include "engine_types.hpp"

namespace ferry {
namespace engine {

/**
 * Service endpoint and credentials.
 * Empty keys fall back to AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY /
 * AWS_SESSION_TOKEN, then to the SDK default provider chain.
 */
struct S3Settings {
  std::string endpoint_url = "http://127.0.0.1:9000";
  std::string region = "us-east-1";
  std::string access_key;
  std::string secret_key;
  std::string session_token;
};

/**
 * Connection pool settings (per endpoint)
 */
struct ConnectionConfig {
  size_t max_connections = 16;
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds request_timeout{300000};
  bool keep_alive = true;
};

/**
 * Request signing settings
 */
struct SigningConfig {
  std::string region = "us-east-1";
  std::string service = "s3";
  std::string access_key;
  std::string secret_key;
  std::string session_token;
  bool sign_payload = false;  // UNSIGNED-PAYLOAD unless set
};

struct StateConfig {
  std::string db_path = "/var/lib/ferry/resume_state.db";
  int keep_finished_hours = 168;
};

/**
 * Complete configuration of the ferry tool, loaded from YAML
 */
struct FerryConfig {
  S3Settings s3;
  ClientConfig transfer;  // includes the retry section
  ChecksumConfig checksum;
  ConnectionConfig connection;
  StateConfig state;
  logging::LoggingConfig logging;

  SigningConfig signingConfig() const {
    SigningConfig signing;
    signing.region = s3.region;
    signing.access_key = s3.access_key;
    signing.secret_key = s3.secret_key;
    signing.session_token = s3.session_token;
    return signing;
  }
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_FERRY_CONFIG_HPP
