// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include "commands.hpp"
#include "fake_s3_service.hpp"

namespace fs = std::filesystem;

namespace ferry {
namespace cli {
namespace test {

using engine::test::FakeS3Service;
using engine::test::IoThread;
using engine::test::makePayload;

constexpr size_t kKiB = 1024;

// =============================================================================
// Test: execute command parsing - basic smoke tests
// =============================================================================

TEST(CommandsExecuteTest, HandlesHelpCommand) {
  Commands commands;
  char argv0[] = "ferry";
  char* argv[] = {argv0};
  EXPECT_EQ(commands.execute(1, argv), 0);
}

TEST(CommandsExecuteTest, HandlesHelpFlag) {
  Commands commands;
  char argv0[] = "ferry";
  char argv1[] = "paused";
  char argv2[] = "--help";
  char* argv[] = {argv0, argv1, argv2};
  EXPECT_EQ(commands.execute(3, argv), 0);
}

TEST(CommandsExecuteTest, HandlesUnknownCommand) {
  Commands commands;
  char argv0[] = "ferry";
  char argv1[] = "unknown";
  char* argv[] = {argv0, argv1};
  EXPECT_EQ(commands.execute(2, argv), 1);
}

TEST(CommandsExecuteTest, RejectsWrongArgumentCount) {
  Commands commands;
  char argv0[] = "ferry";
  char argv1[] = "get";
  char argv2[] = "bucket/key";
  char* argv[] = {argv0, argv1, argv2};
  EXPECT_EQ(commands.execute(3, argv), 1);
}

TEST(CommandsExecuteTest, RejectsUnknownChecksum) {
  Commands commands;
  char argv0[] = "ferry";
  char argv1[] = "--checksum";
  char argv2[] = "md5";
  char* argv[] = {argv0, argv1, argv2};
  EXPECT_EQ(commands.execute(3, argv), 1);
}

TEST(CommandsExecuteTest, ConfigFlagNeedsPath) {
  Commands commands;
  char argv0[] = "ferry";
  char argv1[] = "paused";
  char argv2[] = "--config";
  char* argv[] = {argv0, argv1, argv2};
  EXPECT_EQ(commands.execute(3, argv), 1);
}

TEST(CommandsExecuteTest, MissingConfigFile) {
  Commands commands;
  char argv0[] = "ferry";
  char argv1[] = "-c";
  char argv2[] = "/nonexistent/ferry.yaml";
  char argv3[] = "paused";
  char* argv[] = {argv0, argv1, argv2, argv3};
  EXPECT_EQ(commands.execute(4, argv), 1);
}

// =============================================================================
// Test: transfers against an in-memory service
// =============================================================================

class CommandsTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::string dir_name = "ferry_commands_test_" +
                           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    test_dir_ = fs::temp_directory_path() / dir_name;
    fs::create_directory(test_dir_);

    service_ = std::make_shared<FakeS3Service>(io_.context());

    config_.transfer.endpoint = engine::Endpoint::parse(config_.s3.endpoint_url);
    config_.transfer.part_size = 8 * kKiB;
    config_.transfer.min_final_part_size = 1 * kKiB;
    config_.transfer.retry.initial_delay = std::chrono::milliseconds(1);
    config_.transfer.retry.max_delay = std::chrono::milliseconds(5);
    config_.transfer.retry.jitter = false;
    config_.state.db_path = (test_dir_ / "state" / "resume.db").string();
  }

  void TearDown() override {
    if (fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
  }

  void attach(Commands& commands) {
    commands.set_config(config_);
    commands.set_connection_provider(service_);
  }

  // Helper to create a test file
  std::string create_test_file(const std::string& name, const std::string& content) {
    fs::path path = test_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    file.close();
    return path.string();
  }

  std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  fs::path test_dir_;
  IoThread io_;
  std::shared_ptr<FakeS3Service> service_;
  engine::FerryConfig config_;
};

TEST_F(CommandsTest, PutThenGet) {
  std::string payload = makePayload(20 * kKiB + 100);
  std::string source = create_test_file("source.bin", payload);
  std::string target = (test_dir_ / "target.bin").string();

  Commands commands;
  attach(commands);

  ASSERT_EQ(commands.put(source, "bucket/data.bin", PutOptions()), 0);
  EXPECT_EQ(service_->object("/bucket/data.bin"), payload);
  EXPECT_EQ(service_->count("UploadPart"), 3u);

  ASSERT_EQ(commands.get("bucket/data.bin", target), 0);
  EXPECT_EQ(read_file(target), payload);
}

TEST_F(CommandsTest, PutWithChecksumFlag) {
  std::string source = create_test_file("small.bin", makePayload(2 * kKiB));

  Commands commands;
  attach(commands);

  PutOptions options;
  options.checksum = engine::ChecksumAlgorithm::CRC32C;
  ASSERT_EQ(commands.put(source, "bucket/small.bin", options), 0);

  auto puts = service_->requests("PutObject");
  ASSERT_EQ(puts.size(), 1u);
  EXPECT_TRUE(puts[0].headers.has("x-amz-checksum-crc32c"));
}

TEST_F(CommandsTest, CopyObject) {
  std::string payload = makePayload(3 * kKiB);
  service_->putObject("/bucket/original", payload);

  Commands commands;
  attach(commands);

  ASSERT_EQ(commands.copy("bucket/original", "bucket/duplicate"), 0);
  EXPECT_EQ(service_->object("/bucket/duplicate"), payload);
}

TEST_F(CommandsTest, GetMissingObjectRemovesPartialFile) {
  std::string target = (test_dir_ / "missing.bin").string();

  Commands commands;
  attach(commands);

  EXPECT_EQ(commands.get("bucket/absent", target), 1);
  EXPECT_FALSE(fs::exists(target));
}

TEST_F(CommandsTest, RejectsMalformedObjectNames) {
  std::string source = create_test_file("source.bin", "data");

  Commands commands;
  attach(commands);

  EXPECT_EQ(commands.put(source, "no-key", PutOptions()), 1);
  EXPECT_EQ(commands.put(source, "/leading-slash", PutOptions()), 1);
  EXPECT_EQ(commands.put(source, "bucket/", PutOptions()), 1);
  EXPECT_EQ(commands.put((test_dir_ / "absent").string(), "bucket/key", PutOptions()), 1);
  EXPECT_EQ(service_->requests().size(), 0u);
}

TEST_F(CommandsTest, PausedUploadCanBeResumed) {
  config_.transfer.max_concurrency = 1;
  std::string payload = makePayload(40 * kKiB);
  std::string source = create_test_file("big.bin", payload);
  service_->failPart(4, 100, 403, "AccessDenied");

  Commands commands;
  attach(commands);

  PutOptions options;
  options.resumable = true;
  ASSERT_EQ(commands.put(source, "bucket/big.bin", options), 2);

  auto* store = commands.state_store_for_testing();
  ASSERT_NE(store, nullptr);
  auto paused = store->getPaused();
  ASSERT_EQ(paused.size(), 1u);
  EXPECT_EQ(paused[0].completed_parts, 3u);
  EXPECT_EQ(paused[0].local_path, fs::absolute(source).string());
  EXPECT_EQ(commands.paused(), 0);

  std::string upload_id = paused[0].upload_id;
  service_->failPart(4, 0);
  service_->clearRequests();

  ASSERT_EQ(commands.resume(upload_id, ""), 0);
  EXPECT_EQ(service_->object("/bucket/big.bin"), payload);
  EXPECT_EQ(service_->count("UploadPart"), 2u);
  EXPECT_EQ(service_->count("CreateMultipartUpload"), 0u);

  auto record = store->get(upload_id);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->status, engine::ResumeStatus::COMPLETED);

  // A finished upload cannot be resumed again
  EXPECT_EQ(commands.resume(upload_id, ""), 1);
}

TEST_F(CommandsTest, ForgetDropsSavedState) {
  Commands commands;
  attach(commands);

  auto* store = commands.state_store_for_testing();
  ASSERT_NE(store, nullptr);

  engine::ResumeToken token;
  token.type = engine::MetaRequestType::PUT_OBJECT;
  token.endpoint = config_.transfer.endpoint.toString();
  token.object_path = "/bucket/forgotten";
  token.upload_id = "upload-forget";
  token.part_size = 8 * kKiB;
  token.object_size = 16 * kKiB;
  token.total_num_parts = 2;
  token.completed_parts.push_back({1, "\"etag-1\"", 8 * kKiB, ""});
  token.next_part_number = 2;
  ASSERT_TRUE(store->save(token, "/data/forgotten.bin"));

  EXPECT_EQ(commands.forget("upload-forget"), 0);
  EXPECT_FALSE(store->get("upload-forget").has_value());
  EXPECT_EQ(commands.forget("upload-forget"), 1);
}

TEST_F(CommandsTest, ResumeUnknownUpload) {
  Commands commands;
  attach(commands);
  EXPECT_EQ(commands.resume("does-not-exist", ""), 1);
}

TEST_F(CommandsTest, PausedWithEmptyStore) {
  Commands commands;
  attach(commands);
  EXPECT_EQ(commands.paused(), 0);
  EXPECT_TRUE(fs::exists(test_dir_ / "state" / "resume.db"));
}

}  // namespace test
}  // namespace cli
}  // namespace ferry
