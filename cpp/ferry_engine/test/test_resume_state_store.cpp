/**
 * Unit tests for ResumeStateStore
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

#include "resume_state_store.hpp"

namespace fs = std::filesystem;
using namespace ferry::engine;

class ResumeStateStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    db_path_ = "/tmp/test_ferry_resume_" +
               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db";
    store_ = std::make_unique<ResumeStateStore>(db_path_);
  }

  void TearDown() override {
    store_.reset();

    if (fs::exists(db_path_)) {
      fs::remove(db_path_);
    }
    if (fs::exists(db_path_ + "-wal")) {
      fs::remove(db_path_ + "-wal");
    }
    if (fs::exists(db_path_ + "-shm")) {
      fs::remove(db_path_ + "-shm");
    }
  }

  ResumeToken createToken(const std::string& upload_id, uint32_t completed) {
    ResumeToken token;
    token.type = MetaRequestType::PUT_OBJECT;
    token.endpoint = "http://127.0.0.1:9000";
    token.object_path = "/bucket/" + upload_id + ".bin";
    token.upload_id = upload_id;
    token.part_size = 8 * 1024 * 1024;
    token.object_size = 100ULL * 1024 * 1024;
    token.total_num_parts = 13;
    for (uint32_t n = 1; n <= completed; ++n) {
      token.completed_parts.push_back({n, "\"etag-" + std::to_string(n) + "\"", token.part_size, ""});
    }
    token.next_part_number = completed + 1;
    return token;
  }

  std::string db_path_;
  std::unique_ptr<ResumeStateStore> store_;
};

TEST_F(ResumeStateStoreTest, SaveAndGet) {
  ASSERT_TRUE(store_->save(createToken("upload-1", 5), "/data/big.bin"));

  auto record = store_->get("upload-1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->upload_id, "upload-1");
  EXPECT_EQ(record->object_path, "/bucket/upload-1.bin");
  EXPECT_EQ(record->local_path, "/data/big.bin");
  EXPECT_EQ(record->status, ResumeStatus::PAUSED);
  EXPECT_EQ(record->completed_parts, 5u);
  EXPECT_EQ(record->completed_bytes, 5ULL * 8 * 1024 * 1024);
  EXPECT_FALSE(record->created_at.empty());
  EXPECT_FALSE(record->updated_at.empty());
}

TEST_F(ResumeStateStoreTest, GetNonExistent) {
  EXPECT_FALSE(store_->get("nope").has_value());
  EXPECT_FALSE(store_->loadToken("nope").has_value());
  EXPECT_NE(store_->lastError().find("nope"), std::string::npos);
}

TEST_F(ResumeStateStoreTest, LoadTokenRoundTrip) {
  ResumeToken token = createToken("upload-2", 3);
  token.checksum_algorithm = ChecksumAlgorithm::CRC32C;
  ASSERT_TRUE(store_->save(token));

  auto loaded = store_->loadToken("upload-2");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, token);
}

TEST_F(ResumeStateStoreTest, SaveReplacesExistingToken) {
  ASSERT_TRUE(store_->save(createToken("upload-3", 2)));
  ASSERT_TRUE(store_->markAborted("upload-3"));
  ASSERT_TRUE(store_->save(createToken("upload-3", 7)));

  auto record = store_->get("upload-3");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->completed_parts, 7u);
  EXPECT_EQ(record->status, ResumeStatus::PAUSED);

  auto loaded = store_->loadToken("upload-3");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->next_part_number, 8u);
}

TEST_F(ResumeStateStoreTest, StatusTransitions) {
  ASSERT_TRUE(store_->save(createToken("upload-4", 1)));

  ASSERT_TRUE(store_->markCompleted("upload-4"));
  EXPECT_EQ(store_->get("upload-4")->status, ResumeStatus::COMPLETED);

  ASSERT_TRUE(store_->markAborted("upload-4"));
  EXPECT_EQ(store_->get("upload-4")->status, ResumeStatus::ABORTED);

  EXPECT_FALSE(store_->markCompleted("missing"));
  EXPECT_FALSE(store_->lastError().empty());
}

TEST_F(ResumeStateStoreTest, GetPausedOldestFirst) {
  ASSERT_TRUE(store_->save(createToken("first", 1)));
  ASSERT_TRUE(store_->save(createToken("second", 1)));
  ASSERT_TRUE(store_->save(createToken("third", 1)));
  ASSERT_TRUE(store_->markCompleted("second"));

  auto paused = store_->getPaused();
  ASSERT_EQ(paused.size(), 2u);
  EXPECT_EQ(paused[0].upload_id, "first");
  EXPECT_EQ(paused[1].upload_id, "third");
}

TEST_F(ResumeStateStoreTest, Remove) {
  ASSERT_TRUE(store_->save(createToken("upload-5", 1)));
  EXPECT_TRUE(store_->remove("upload-5"));
  EXPECT_FALSE(store_->get("upload-5").has_value());
  EXPECT_FALSE(store_->remove("upload-5"));
}

TEST_F(ResumeStateStoreTest, DeleteFinishedKeepsPaused) {
  ASSERT_TRUE(store_->save(createToken("paused", 1)));
  ASSERT_TRUE(store_->save(createToken("done", 1)));
  ASSERT_TRUE(store_->save(createToken("aborted", 1)));
  ASSERT_TRUE(store_->markCompleted("done"));
  ASSERT_TRUE(store_->markAborted("aborted"));

  EXPECT_EQ(store_->deleteFinished(), 2);
  EXPECT_TRUE(store_->get("paused").has_value());
  EXPECT_FALSE(store_->get("done").has_value());
  EXPECT_FALSE(store_->get("aborted").has_value());
}

TEST_F(ResumeStateStoreTest, DeleteOlderThanSparesRecentRows) {
  ASSERT_TRUE(store_->save(createToken("recent", 1)));
  ASSERT_TRUE(store_->markCompleted("recent"));

  EXPECT_EQ(store_->deleteOlderThan(std::chrono::hours(24)), 0);
  EXPECT_TRUE(store_->get("recent").has_value());
}

TEST_F(ResumeStateStoreTest, PersistsAcrossReopen) {
  ASSERT_TRUE(store_->save(createToken("durable", 4), "/data/durable.bin"));
  store_.reset();

  store_ = std::make_unique<ResumeStateStore>(db_path_);
  auto record = store_->get("durable");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->local_path, "/data/durable.bin");
  EXPECT_EQ(store_->dbPath(), db_path_);
}

TEST_F(ResumeStateStoreTest, ConcurrentSaves) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, t]() {
      for (int i = 0; i < 10; ++i) {
        store_->save(createToken("upload-" + std::to_string(t) + "-" + std::to_string(i), 1));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(store_->getPaused().size(), 40u);
}

TEST_F(ResumeStateStoreTest, UnopenableDatabaseThrows) {
  EXPECT_THROW(ResumeStateStore("/nonexistent-dir/ferry/state.db"), std::runtime_error);
}

TEST(ResumeStatusTest, NameConversion) {
  EXPECT_EQ(resumeStatusToString(ResumeStatus::PAUSED), "paused");
  EXPECT_EQ(resumeStatusToString(ResumeStatus::COMPLETED), "completed");
  EXPECT_EQ(resumeStatusToString(ResumeStatus::ABORTED), "aborted");
  EXPECT_EQ(resumeStatusFromString("completed"), ResumeStatus::COMPLETED);
  EXPECT_THROW(resumeStatusFromString("running"), std::invalid_argument);
}
