#ifndef FERRY_ENGINE_RESUME_STATE_STORE_HPP
#define FERRY_ENGINE_RESUME_STATE_STORE_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "resume_token.hpp"

namespace ferry {
namespace engine {

enum class ResumeStatus {
  PAUSED,     // upload kept on the server, token can be resumed
  COMPLETED,  // resumed to completion
  ABORTED     // given up and aborted
};

std::string resumeStatusToString(ResumeStatus status);

/**
 * @throws std::invalid_argument for unknown names
 */
ResumeStatus resumeStatusFromString(const std::string& name);

/**
 * One persisted resume token
 */
struct ResumeRecord {
  std::string upload_id;
  std::string object_path;
  std::string local_path;  // body file, or "bucket/key" copy source for copies
  ResumeStatus status = ResumeStatus::PAUSED;
  std::string token_json;
  uint32_t completed_parts = 0;
  uint64_t completed_bytes = 0;
  std::string created_at;
  std::string updated_at;
};

/**
 * SQLite-backed store of resume tokens, so interrupted uploads survive a
 * process restart.
 *
 * Uses WAL mode; all methods are thread-safe. Failures are reported through
 * the return value with details in lastError().
 */
class ResumeStateStore {
public:
  /**
   * @throws std::runtime_error if the database cannot be opened or created
   */
  explicit ResumeStateStore(const std::string& db_path);
  ~ResumeStateStore();

  ResumeStateStore(const ResumeStateStore&) = delete;
  ResumeStateStore& operator=(const ResumeStateStore&) = delete;

  /**
   * Insert or replace the token of an upload and mark it paused
   */
  bool save(const ResumeToken& token, const std::string& local_path = "");

  bool markCompleted(const std::string& upload_id);
  bool markAborted(const std::string& upload_id);

  std::optional<ResumeRecord> get(const std::string& upload_id);

  /**
   * Parsed token of a stored upload, nullopt if missing or unreadable
   */
  std::optional<ResumeToken> loadToken(const std::string& upload_id);

  /**
   * Uploads that can be resumed, oldest first
   */
  std::vector<ResumeRecord> getPaused();

  bool remove(const std::string& upload_id);

  /**
   * Delete completed and aborted rows; returns the number deleted
   */
  int deleteFinished();

  /**
   * Delete finished rows last updated more than `age` ago
   */
  int deleteOlderThan(std::chrono::hours age);

  const std::string& lastError() const;
  const std::string& dbPath() const;

private:
  bool setStatus(const std::string& upload_id, ResumeStatus status);

  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_RESUME_STATE_STORE_HPP
