#include "resume_state_store.hpp"

#include <sqlite3.h>

#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

#define FERRY_LOG_COMPONENT "resume_state_store"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace engine {

using logging::kv;

namespace {

std::string formatTimestamp(std::chrono::system_clock::time_point point) {
  auto time = std::chrono::system_clock::to_time_t(point);
  std::tm tm{};
  gmtime_r(&time, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

std::string columnText(sqlite3_stmt* stmt, int column) {
  const unsigned char* text = sqlite3_column_text(stmt, column);
  return text ? reinterpret_cast<const char*>(text) : "";
}

}  // namespace

std::string resumeStatusToString(ResumeStatus status) {
  switch (status) {
    case ResumeStatus::PAUSED:
      return "paused";
    case ResumeStatus::COMPLETED:
      return "completed";
    case ResumeStatus::ABORTED:
      return "aborted";
  }
  return "paused";
}

ResumeStatus resumeStatusFromString(const std::string& name) {
  if (name == "paused") {
    return ResumeStatus::PAUSED;
  }
  if (name == "completed") {
    return ResumeStatus::COMPLETED;
  }
  if (name == "aborted") {
    return ResumeStatus::ABORTED;
  }
  throw std::invalid_argument("Unknown resume status: " + name);
}

class ResumeStateStore::Impl {
public:
  sqlite3* db = nullptr;
  std::string db_path;
  std::string last_error;
  mutable std::mutex mutex;

  ~Impl() {
    if (db) {
      sqlite3_close(db);
    }
  }

  void initDatabase() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
      std::string error = db ? sqlite3_errmsg(db) : "out of memory";
      throw std::runtime_error("Cannot open SQLite database " + db_path + ": " + error);
    }

    exec("PRAGMA journal_mode=WAL;", true);
    exec("PRAGMA synchronous=NORMAL;", false);
    exec("PRAGMA busy_timeout=5000;", false);

    const char* create_sql = R"(
      CREATE TABLE IF NOT EXISTS resume_state (
        upload_id TEXT PRIMARY KEY,
        object_path TEXT NOT NULL,
        local_path TEXT,
        status TEXT NOT NULL CHECK(status IN ('paused', 'completed', 'aborted')),
        token_json TEXT NOT NULL,
        completed_parts INTEGER DEFAULT 0,
        completed_bytes INTEGER DEFAULT 0,
        created_at TEXT NOT NULL,
        updated_at TEXT NOT NULL
      );
      CREATE INDEX IF NOT EXISTS idx_resume_status ON resume_state(status);
      CREATE INDEX IF NOT EXISTS idx_resume_updated_at ON resume_state(updated_at);
    )";
    exec(create_sql, true);
  }

  // Runs a statement without results; `required` failures throw
  void exec(const char* sql, bool required) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (rc == SQLITE_OK) {
      return;
    }
    std::string error = err_msg ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    if (required) {
      throw std::runtime_error("SQLite statement failed: " + error);
    }
    FERRY_LOG_WARN("Optional SQLite pragma failed" << kv("error", error));
  }

  sqlite3_stmt* prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      last_error = sqlite3_errmsg(db);
      return nullptr;
    }
    return stmt;
  }

  bool stepDone(sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      last_error = sqlite3_errmsg(db);
      return false;
    }
    return true;
  }

  static ResumeRecord parseRecord(sqlite3_stmt* stmt) {
    ResumeRecord record;
    record.upload_id = columnText(stmt, 0);
    record.object_path = columnText(stmt, 1);
    record.local_path = columnText(stmt, 2);
    record.status = resumeStatusFromString(columnText(stmt, 3));
    record.token_json = columnText(stmt, 4);
    record.completed_parts = static_cast<uint32_t>(sqlite3_column_int(stmt, 5));
    record.completed_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    record.created_at = columnText(stmt, 7);
    record.updated_at = columnText(stmt, 8);
    return record;
  }
};

static const char* kSelectColumns =
  "SELECT upload_id, object_path, local_path, status, token_json, completed_parts, "
  "completed_bytes, created_at, updated_at FROM resume_state";

ResumeStateStore::ResumeStateStore(const std::string& db_path)
    : impl_(std::make_unique<Impl>()) {
  impl_->db_path = db_path;
  impl_->initDatabase();
}

ResumeStateStore::~ResumeStateStore() = default;

bool ResumeStateStore::save(const ResumeToken& token, const std::string& local_path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  const char* sql = R"(
    INSERT INTO resume_state
    (upload_id, object_path, local_path, status, token_json, completed_parts, completed_bytes,
     created_at, updated_at)
    VALUES (?, ?, ?, 'paused', ?, ?, ?, ?, ?)
    ON CONFLICT(upload_id) DO UPDATE SET
      object_path = excluded.object_path,
      local_path = excluded.local_path,
      status = 'paused',
      token_json = excluded.token_json,
      completed_parts = excluded.completed_parts,
      completed_bytes = excluded.completed_bytes,
      updated_at = excluded.updated_at
  )";

  sqlite3_stmt* stmt = impl_->prepare(sql);
  if (!stmt) {
    return false;
  }

  uint64_t completed_bytes = 0;
  for (const auto& part : token.completed_parts) {
    completed_bytes += part.size;
  }
  std::string json = token.toJson();
  std::string now = formatTimestamp(std::chrono::system_clock::now());

  sqlite3_bind_text(stmt, 1, token.upload_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, token.object_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, local_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 5, static_cast<int>(token.completed_parts.size()));
  sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(completed_bytes));
  sqlite3_bind_text(stmt, 7, now.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 8, now.c_str(), -1, SQLITE_TRANSIENT);

  if (!impl_->stepDone(stmt)) {
    FERRY_LOG_ERROR(
      "Failed to persist resume token" << kv("upload_id", token.upload_id)
                                       << kv("error", impl_->last_error)
    );
    return false;
  }
  FERRY_LOG_DEBUG(
    "Persisted resume token" << kv("upload_id", token.upload_id)
                             << kv("completed_parts", token.completed_parts.size())
  );
  return true;
}

bool ResumeStateStore::setStatus(const std::string& upload_id, ResumeStatus status) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  sqlite3_stmt* stmt =
    impl_->prepare("UPDATE resume_state SET status = ?, updated_at = ? WHERE upload_id = ?");
  if (!stmt) {
    return false;
  }

  std::string name = resumeStatusToString(status);
  std::string now = formatTimestamp(std::chrono::system_clock::now());
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, now.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, upload_id.c_str(), -1, SQLITE_TRANSIENT);

  if (!impl_->stepDone(stmt)) {
    return false;
  }
  if (sqlite3_changes(impl_->db) == 0) {
    impl_->last_error = "No resume state for upload " + upload_id;
    return false;
  }
  return true;
}

bool ResumeStateStore::markCompleted(const std::string& upload_id) {
  return setStatus(upload_id, ResumeStatus::COMPLETED);
}

bool ResumeStateStore::markAborted(const std::string& upload_id) {
  return setStatus(upload_id, ResumeStatus::ABORTED);
}

std::optional<ResumeRecord> ResumeStateStore::get(const std::string& upload_id) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::string sql = std::string(kSelectColumns) + " WHERE upload_id = ?";
  sqlite3_stmt* stmt = impl_->prepare(sql.c_str());
  if (!stmt) {
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<ResumeRecord> result;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    result = Impl::parseRecord(stmt);
  }
  sqlite3_finalize(stmt);
  return result;
}

std::optional<ResumeToken> ResumeStateStore::loadToken(const std::string& upload_id) {
  auto record = get(upload_id);
  if (!record) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->last_error = "No resume state for upload " + upload_id;
    return std::nullopt;
  }
  try {
    return ResumeToken::fromJson(record->token_json);
  } catch (const ResumeStateError& e) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->last_error = e.what();
    FERRY_LOG_ERROR("Stored resume token is unreadable" << kv("upload_id", upload_id)
                                                        << kv("error", e.what()));
    return std::nullopt;
  }
}

std::vector<ResumeRecord> ResumeStateStore::getPaused() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::vector<ResumeRecord> records;
  std::string sql = std::string(kSelectColumns) + " WHERE status = 'paused' ORDER BY created_at, rowid";
  sqlite3_stmt* stmt = impl_->prepare(sql.c_str());
  if (!stmt) {
    return records;
  }
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    records.push_back(Impl::parseRecord(stmt));
  }
  sqlite3_finalize(stmt);
  return records;
}

bool ResumeStateStore::remove(const std::string& upload_id) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  sqlite3_stmt* stmt = impl_->prepare("DELETE FROM resume_state WHERE upload_id = ?");
  if (!stmt) {
    return false;
  }
  sqlite3_bind_text(stmt, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);
  if (!impl_->stepDone(stmt)) {
    return false;
  }
  return sqlite3_changes(impl_->db) > 0;
}

int ResumeStateStore::deleteFinished() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  sqlite3_stmt* stmt =
    impl_->prepare("DELETE FROM resume_state WHERE status IN ('completed', 'aborted')");
  if (!stmt || !impl_->stepDone(stmt)) {
    return 0;
  }
  return sqlite3_changes(impl_->db);
}

int ResumeStateStore::deleteOlderThan(std::chrono::hours age) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::string cutoff = formatTimestamp(std::chrono::system_clock::now() - age);
  sqlite3_stmt* stmt = impl_->prepare(
    "DELETE FROM resume_state WHERE status IN ('completed', 'aborted') AND updated_at < ?"
  );
  if (!stmt) {
    return 0;
  }
  sqlite3_bind_text(stmt, 1, cutoff.c_str(), -1, SQLITE_TRANSIENT);
  if (!impl_->stepDone(stmt)) {
    return 0;
  }
  return sqlite3_changes(impl_->db);
}

const std::string& ResumeStateStore::lastError() const {
  return impl_->last_error;
}

const std::string& ResumeStateStore::dbPath() const {
  return impl_->db_path;
}

}  // namespace engine
}  // namespace ferry
