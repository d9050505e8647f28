// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CLI_COMMANDS_HPP
#define FERRY_CLI_COMMANDS_HPP

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <connection.hpp>
#include <engine_types.hpp>
#include <ferry_config.hpp>
#include <meta_request.hpp>
#include <resume_state_store.hpp>
#include <s3_client.hpp>

namespace ferry {
namespace cli {

/**
 * Flags of the put command
 */
struct PutOptions {
  bool resumable = false;
  std::optional<engine::ChecksumAlgorithm> checksum;  // overrides the config file
  bool trailer = false;
};

/**
 * Command handler for the ferry CLI
 */
class Commands {
public:
  Commands();
  ~Commands();

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  void set_verbose(bool verbose) {
    verbose_ = verbose;
  }

  void set_config_path(const std::string& path) {
    config_path_ = path;
  }

  /**
   * Download bucket/key into a local file
   */
  int get(const std::string& object, const std::string& file);

  /**
   * Upload a local file to bucket/key
   */
  int put(const std::string& file, const std::string& object, const PutOptions& options);

  /**
   * Server-side copy between two objects
   */
  int copy(const std::string& source, const std::string& destination);

  /**
   * Continue a paused upload from the state database
   */
  int resume(const std::string& upload_id, const std::string& file);

  /**
   * List paused uploads
   */
  int paused();

  /**
   * Drop a paused upload from the state database (the remote upload is left as is)
   */
  int forget(const std::string& upload_id);

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

  /**
   * Ask the running transfer to pause. Async-signal-safe.
   */
  void interrupt() {
    interrupted_.store(true);
  }

#ifdef FERRY_CLI_TESTING
  void set_config(const engine::FerryConfig& config) {
    config_ = config;
    config_loaded_ = true;
  }

  /**
   * Use an externally driven provider instead of the Beast pool
   */
  void set_connection_provider(std::shared_ptr<engine::IConnectionProvider> provider) {
    provider_ = std::move(provider);
  }

  engine::ResumeStateStore* state_store_for_testing() {
    return state_store();
  }
#endif

private:
  bool ensure_config();
  bool ensure_client();
  engine::ResumeStateStore* state_store();

  /**
   * Submit, wait while honouring interrupt(), and report the outcome
   * @param local_path Stored with a resume token if the transfer pauses
   */
  int run_transfer(
    engine::MetaRequestOptions options, const std::string& local_path, const std::string& label
  );

  void print_usage();

  std::string format_size(uint64_t size);

  /**
   * "bucket/key" -> "/bucket/key" (URI-encoded); false if either part is empty
   */
  static bool object_path(const std::string& object, std::string& path);

  std::string config_path_;
  bool verbose_;
  bool config_loaded_;
  engine::FerryConfig config_;

  std::unique_ptr<boost::asio::io_context> io_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::thread io_thread_;

  std::shared_ptr<engine::IConnectionProvider> provider_;
  std::shared_ptr<engine::ISigner> signer_;
  std::unique_ptr<engine::S3Client> client_;
  std::unique_ptr<engine::ResumeStateStore> store_;

  std::atomic<bool> interrupted_;
};

}  // namespace cli
}  // namespace ferry

#endif  // FERRY_CLI_COMMANDS_HPP
