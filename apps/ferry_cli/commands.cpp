// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <aws_sigv4_signer.hpp>
#include <beast_connection_provider.hpp>
#include <config_parser.hpp>
#include <engine_errors.hpp>
#include <ferry_log_init.hpp>

#define FERRY_LOG_COMPONENT "ferry_cli"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace cli {

namespace fs = std::filesystem;
using logging::kv;

namespace {

const char* kDefaultConfigPath = "/etc/ferry/ferry.yaml";

// Exit status of a transfer that was paused and can be resumed
constexpr int kExitPaused = 2;

bool has_credentials(const engine::FerryConfig& config) {
  if (!config.s3.access_key.empty() && !config.s3.secret_key.empty()) {
    return true;
  }
  return std::getenv("AWS_ACCESS_KEY_ID") != nullptr;
}

}  // namespace

Commands::Commands()
    : verbose_(false)
    , config_loaded_(false)
    , interrupted_(false) {}

Commands::~Commands() {
  client_.reset();
  if (io_) {
    work_.reset();
    io_->stop();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
  }
}

bool Commands::ensure_config() {
  if (config_loaded_) {
    return true;
  }

  std::string path = config_path_;
  if (path.empty() && fs::exists(kDefaultConfigPath)) {
    path = kDefaultConfigPath;
  }

  engine::ConfigParser parser;
  if (!path.empty()) {
    if (!parser.load_from_file(path, config_)) {
      std::cerr << "Error: " << parser.get_last_error() << std::endl;
      return false;
    }
  }

  std::string error_msg;
  if (!engine::ConfigParser::validate(config_, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    return false;
  }

  logging::LoggingConfig log_config = config_.logging;
  logging::apply_env_overrides(log_config);
  if (verbose_) {
    log_config.console_level = logging::severity_level::debug;
  }
  logging::init_logging(log_config);

  config_loaded_ = true;
  if (verbose_) {
    std::cout << "Config: " << (path.empty() ? std::string("(defaults)") : path) << std::endl;
    std::cout << "Endpoint: " << config_.s3.endpoint_url << std::endl;
  }
  return true;
}

bool Commands::ensure_client() {
  if (client_) {
    return true;
  }
  if (!ensure_config()) {
    return false;
  }

  if (!provider_) {
    io_ = std::make_unique<boost::asio::io_context>();
    work_.emplace(boost::asio::make_work_guard(*io_));
    provider_ = std::make_shared<transport::BeastConnectionProvider>(
      io_->get_executor(), config_.connection
    );
    io_thread_ = std::thread([this]() { io_->run(); });
  }

  if (has_credentials(config_)) {
    signer_ = std::make_shared<transport::AwsSigV4Signer>(config_.signingConfig());
  } else {
    FERRY_LOG_INFO("No credentials configured, sending anonymous requests");
    signer_ = std::make_shared<engine::NoopSigner>();
  }

  try {
    client_ = std::make_unique<engine::S3Client>(config_.transfer, provider_, signer_);
  } catch (const engine::FerryError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return false;
  }
  return true;
}

engine::ResumeStateStore* Commands::state_store() {
  if (store_) {
    return store_.get();
  }
  if (!ensure_config()) {
    return nullptr;
  }

  const std::string& db_path = config_.state.db_path;
  fs::path parent = fs::path(db_path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      std::cerr << "Error: Cannot create " << parent.string() << ": " << ec.message()
                << std::endl;
      return nullptr;
    }
  }

  try {
    store_ = std::make_unique<engine::ResumeStateStore>(db_path);
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return nullptr;
  }

  if (config_.state.keep_finished_hours > 0) {
    store_->deleteOlderThan(std::chrono::hours(config_.state.keep_finished_hours));
  }
  return store_.get();
}

bool Commands::object_path(const std::string& object, std::string& path) {
  auto slash = object.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 >= object.size()) {
    return false;
  }
  path = "/" + engine::uriEncode(object, true);
  return true;
}

int Commands::get(const std::string& object, const std::string& file) {
  std::string path;
  if (!object_path(object, path)) {
    std::cerr << "Error: Expected bucket/key, got '" << object << "'" << std::endl;
    return 1;
  }
  if (!ensure_client()) {
    return 1;
  }

  auto out = std::make_shared<std::ofstream>(file, std::ios::binary | std::ios::trunc);
  if (!out->is_open()) {
    std::cerr << "Error: Cannot open " << file << " for writing" << std::endl;
    return 1;
  }

  engine::MetaRequestOptions options;
  options.type = engine::MetaRequestType::GET_OBJECT;
  options.request.method = "GET";
  options.request.path = path;
  options.checksum = config_.checksum;
  options.handler.on_body = [out](uint64_t, const char* data, size_t size) {
    out->write(data, static_cast<std::streamsize>(size));
  };

  int rc = run_transfer(std::move(options), "", "download");
  out->close();
  if (rc != 0) {
    std::error_code ec;
    fs::remove(file, ec);
  } else if (!*out) {
    std::cerr << "Error: Failed writing " << file << std::endl;
    return 1;
  }
  return rc;
}

int Commands::put(const std::string& file, const std::string& object, const PutOptions& put_options) {
  std::string path;
  if (!object_path(object, path)) {
    std::cerr << "Error: Expected bucket/key, got '" << object << "'" << std::endl;
    return 1;
  }
  if (!fs::is_regular_file(file)) {
    std::cerr << "Error: " << file << " is not a regular file" << std::endl;
    return 1;
  }
  if (!ensure_client()) {
    return 1;
  }

  engine::MetaRequestOptions options;
  options.type = engine::MetaRequestType::PUT_OBJECT;
  options.request.method = "PUT";
  options.request.path = path;
  options.body_file_path = file;
  options.checksum = config_.checksum;
  if (put_options.checksum) {
    options.checksum.algorithm = *put_options.checksum;
    if (options.checksum.location == engine::ChecksumLocation::NONE) {
      options.checksum.location = engine::ChecksumLocation::HEADER;
    }
  }
  if (put_options.trailer) {
    options.checksum.location = engine::ChecksumLocation::TRAILER;
  }
  options.resumable = put_options.resumable;

  return run_transfer(std::move(options), fs::absolute(file).string(), "upload");
}

int Commands::copy(const std::string& source, const std::string& destination) {
  std::string source_path;
  std::string destination_path;
  if (!object_path(source, source_path) || !object_path(destination, destination_path)) {
    std::cerr << "Error: Expected bucket/key for source and destination" << std::endl;
    return 1;
  }
  if (!ensure_client()) {
    return 1;
  }

  engine::MetaRequestOptions options;
  options.type = engine::MetaRequestType::COPY_OBJECT;
  options.request.method = "PUT";
  options.request.path = destination_path;
  options.request.headers.set("x-amz-copy-source", source_path);

  return run_transfer(std::move(options), source, "copy");
}

int Commands::resume(const std::string& upload_id, const std::string& file) {
  auto* store = state_store();
  if (!store) {
    return 1;
  }

  auto record = store->get(upload_id);
  if (!record) {
    std::cerr << "Error: No saved state for upload " << upload_id << std::endl;
    return 1;
  }
  if (record->status != engine::ResumeStatus::PAUSED) {
    std::cerr << "Error: Upload " << upload_id << " is "
              << engine::resumeStatusToString(record->status) << std::endl;
    return 1;
  }

  auto token = store->loadToken(upload_id);
  if (!token) {
    std::cerr << "Error: Saved state for " << upload_id << " is unreadable: " << store->lastError()
              << std::endl;
    return 1;
  }

  std::string local_path = file.empty() ? record->local_path : file;
  if (local_path.empty()) {
    std::cerr << "Error: No file given for upload " << upload_id << std::endl;
    return 1;
  }
  if (!ensure_client()) {
    return 1;
  }

  engine::MetaRequestOptions options;
  options.type = token->type;
  options.request.method = "PUT";
  options.request.path = token->object_path;
  try {
    options.endpoint = engine::Endpoint::parse(token->endpoint);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: Saved endpoint is invalid: " << e.what() << std::endl;
    return 1;
  }

  if (token->type == engine::MetaRequestType::COPY_OBJECT) {
    std::string source_path;
    if (!object_path(local_path, source_path)) {
      std::cerr << "Error: Expected the copy source as bucket/key, got '" << local_path << "'"
                << std::endl;
      return 1;
    }
    options.request.headers.set("x-amz-copy-source", source_path);
  } else {
    if (!fs::is_regular_file(local_path)) {
      std::cerr << "Error: " << local_path << " is not a regular file" << std::endl;
      return 1;
    }
    options.body_file_path = local_path;
    options.checksum = config_.checksum;
    options.checksum.algorithm = token->checksum_algorithm;
    if (token->checksum_algorithm != engine::ChecksumAlgorithm::NONE &&
        options.checksum.location == engine::ChecksumLocation::NONE) {
      options.checksum.location = engine::ChecksumLocation::HEADER;
    }
  }
  options.resume_token = std::move(*token);
  options.resumable = true;

  if (verbose_) {
    std::cout << "Resuming " << upload_id << " (" << record->completed_parts
              << " parts already uploaded)" << std::endl;
  }
  return run_transfer(std::move(options), local_path, "upload");
}

int Commands::paused() {
  auto* store = state_store();
  if (!store) {
    return 1;
  }

  auto records = store->getPaused();
  if (records.empty()) {
    std::cout << "No paused uploads." << std::endl;
    return 0;
  }

  for (const auto& record : records) {
    std::cout << record.upload_id << std::endl;
    std::cout << "  Object:  " << record.object_path << std::endl;
    if (!record.local_path.empty()) {
      std::cout << "  Source:  " << record.local_path << std::endl;
    }
    std::cout << "  Parts:   " << record.completed_parts << " ("
              << format_size(record.completed_bytes) << ")" << std::endl;
    std::cout << "  Updated: " << record.updated_at << std::endl;
  }
  return 0;
}

int Commands::forget(const std::string& upload_id) {
  auto* store = state_store();
  if (!store) {
    return 1;
  }
  if (!store->get(upload_id)) {
    std::cerr << "Error: No saved state for upload " << upload_id << std::endl;
    return 1;
  }
  if (!store->remove(upload_id)) {
    std::cerr << "Error: " << store->lastError() << std::endl;
    return 1;
  }
  std::cout << "Forgot upload " << upload_id << std::endl;
  return 0;
}

int Commands::run_transfer(
  engine::MetaRequestOptions options, const std::string& local_path, const std::string& label
) {
  std::optional<std::string> resumed_id;
  if (options.resume_token) {
    resumed_id = options.resume_token->upload_id;
  }
  if (verbose_) {
    options.handler.on_progress = [](uint64_t done, uint64_t total) {
      std::cout << "\r" << done << " / " << total << " bytes" << std::flush;
    };
  }

  std::shared_ptr<engine::MetaRequest> request;
  try {
    request = client_->makeMetaRequest(std::move(options));
  } catch (const engine::FerryError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  auto future = request->future();
  bool pause_requested = false;
  while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
    if (!pause_requested && interrupted_.load()) {
      std::cout << "\nInterrupted, pausing " << label << "..." << std::endl;
      request->cancel(engine::CancelMode::RESUMABLE);
      pause_requested = true;
    }
  }
  engine::MetaRequestResult result = future.get();
  if (verbose_) {
    std::cout << std::endl;
  }

  if (result.success) {
    std::cout << "Completed " << label << " (" << format_size(result.bytes_transferred) << ")";
    if (!result.etag.empty()) {
      std::cout << " etag " << result.etag;
    }
    std::cout << std::endl;
    if (result.checksum_validation != engine::ChecksumValidation::NOT_VALIDATED) {
      std::cout << "Checksum: " << engine::toString(result.checksum_validation) << std::endl;
    }
    if (resumed_id) {
      if (auto* store = state_store()) {
        store->markCompleted(*resumed_id);
      }
    }
    return 0;
  }

  if (result.resume_token) {
    const auto& token = *result.resume_token;
    auto* store = state_store();
    if (!store || !store->save(token, local_path)) {
      std::cerr << "Error: Failed to save resume state"
                << (store ? ": " + store->lastError() : std::string()) << std::endl;
      std::cerr << token.toJson() << std::endl;
      return 1;
    }
    std::cout << "Paused " << label << " after " << token.completed_parts.size() << " of "
              << token.total_num_parts << " parts (" << result.error.describe() << ")"
              << std::endl;
    std::cout << "Resume with: ferry resume " << token.upload_id << " " << local_path
              << std::endl;
    return kExitPaused;
  }

  std::cerr << "Error: " << result.error.describe() << std::endl;
  for (const auto& part_error : result.part_errors) {
    if (verbose_) {
      std::cerr << "  " << part_error.describe() << std::endl;
    }
  }
  if (result.abort_error) {
    std::cerr << "Warning: " << result.abort_error->describe() << std::endl;
  }
  return 1;
}

int Commands::execute(int argc, char* argv[]) {
  std::vector<std::string> positional;
  PutOptions put_options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a path" << std::endl;
        return 1;
      }
      config_path_ = argv[++i];
    } else if (arg == "--verbose" || arg == "-v") {
      verbose_ = true;
    } else if (arg == "--resumable") {
      put_options.resumable = true;
    } else if (arg == "--trailer") {
      put_options.trailer = true;
    } else if (arg == "--checksum") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --checksum requires an algorithm" << std::endl;
        return 1;
      }
      try {
        put_options.checksum = engine::checksumAlgorithmFromName(argv[++i]);
      } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
      }
    } else if (arg == "-h" || arg == "--help") {
      positional.insert(positional.begin(), "help");
    } else {
      positional.push_back(arg);
    }
  }

  std::string command = positional.empty() ? std::string() : positional[0];
  if (command.empty() || command == "help") {
    print_usage();
    return 0;
  }

  auto require = [&](size_t count) {
    if (positional.size() != count + 1) {
      std::cerr << "Error: '" << command << "' expects " << count << " argument"
                << (count == 1 ? "" : "s") << std::endl;
      print_usage();
      return false;
    }
    return true;
  };

  if (command == "get") {
    return require(2) ? get(positional[1], positional[2]) : 1;
  } else if (command == "put") {
    return require(2) ? put(positional[1], positional[2], put_options) : 1;
  } else if (command == "copy") {
    return require(2) ? copy(positional[1], positional[2]) : 1;
  } else if (command == "resume") {
    if (positional.size() == 2) {
      return resume(positional[1], "");
    }
    return require(2) ? resume(positional[1], positional[2]) : 1;
  } else if (command == "paused") {
    return require(0) ? paused() : 1;
  } else if (command == "forget") {
    return require(1) ? forget(positional[1]) : 1;
  }

  std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
  print_usage();
  return 1;
}

std::string Commands::format_size(uint64_t size) {
  const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit_index = 0;

  double value = static_cast<double>(size);
  while (value >= 1024.0 && unit_index < 4) {
    value /= 1024.0;
    unit_index++;
  }

  std::ostringstream oss;
  if (unit_index == 0) {
    oss << size << " B";
  } else {
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << value << " " << units[unit_index];
  }
  return oss.str();
}

void Commands::print_usage() {
  std::cout << "Usage: ferry [-c config.yaml] [-v] <command> [arguments]" << std::endl;
  std::cout << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  get <bucket/key> <file>       Download an object" << std::endl;
  std::cout << "  put <file> <bucket/key>       Upload a file" << std::endl;
  std::cout << "  copy <src/key> <dst/key>      Server-side copy" << std::endl;
  std::cout << "  resume <upload-id> [file]     Continue a paused upload" << std::endl;
  std::cout << "  paused                        List paused uploads" << std::endl;
  std::cout << "  forget <upload-id>            Drop saved state of a paused upload" << std::endl;
  std::cout << "  help                          Show this help message" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config, -c PATH     YAML configuration (default " << kDefaultConfigPath
            << ")" << std::endl;
  std::cout << "  --verbose, -v         Verbose output" << std::endl;
  std::cout << "  --resumable           put: keep the upload on failure" << std::endl;
  std::cout << "  --checksum ALG        put: crc32, crc32c, sha1 or sha256" << std::endl;
  std::cout << "  --trailer             put: send the checksum as a trailer" << std::endl;
  std::cout << std::endl;
  std::cout << "Ctrl+C pauses a running upload; exit status 2 means paused." << std::endl;
}

}  // namespace cli
}  // namespace ferry
