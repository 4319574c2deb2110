#include "queue/job_store.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "core/uuid.hpp"

#include <sqlite3.h>

#include <string>
#include <string_view>

namespace hwbridge::queue {

namespace {

constexpr const char* kSchemaSql = R"sql(
CREATE TABLE IF NOT EXISTS queue_jobs (
  id TEXT PRIMARY KEY,
  seq INTEGER NOT NULL,
  device_id TEXT NOT NULL,
  device_type TEXT NOT NULL,
  operation TEXT NOT NULL,
  parameters TEXT NOT NULL,
  status TEXT NOT NULL DEFAULT 'pending',
  created_at INTEGER NOT NULL,
  started_at INTEGER,
  completed_at INTEGER,
  error TEXT,
  retry_count INTEGER NOT NULL DEFAULT 0,
  available_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_queue_jobs_device_id ON queue_jobs(device_id);
CREATE INDEX IF NOT EXISTS idx_queue_jobs_status ON queue_jobs(status);
CREATE INDEX IF NOT EXISTS idx_queue_jobs_created_at ON queue_jobs(created_at);
)sql";

// Column order shared by every statement that materializes a QueueJob.
constexpr std::string_view kJobColumns =
    "id, device_id, device_type, operation, parameters, status, created_at, started_at, "
    "completed_at, error, retry_count, available_at";

std::string SelectJobsWhere(std::string_view condition) {
  std::string sql = "SELECT ";
  sql += kJobColumns;
  sql += " FROM queue_jobs WHERE ";
  sql += condition;
  return sql;
}

// Thin RAII wrapper over a prepared statement. Bind failures are remembered
// and surface from Step().
class Statement {
public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    ok_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) == SQLITE_OK;
  }
  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int index, const std::string& value) {
    Track(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT));
  }
  void BindInt64(int index, std::int64_t value) {
    Track(sqlite3_bind_int64(stmt_, index, value));
  }
  void BindNull(int index) {
    Track(sqlite3_bind_null(stmt_, index));
  }
  void BindOptionalText(int index, const std::optional<std::string>& value) {
    if (value.has_value()) {
      BindText(index, *value);
    } else {
      BindNull(index);
    }
  }

  // SQLITE_ROW, SQLITE_DONE, or an error code with `error` filled.
  int Step(std::string& error) {
    if (!ok_) {
      error = sqlite3_errmsg(db_);
      return SQLITE_ERROR;
    }
    const int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      error = sqlite3_errmsg(db_);
    }
    return rc;
  }

  // Drains remaining RETURNING rows so the statement completes.
  bool Finish(std::string& error) {
    int rc = SQLITE_ROW;
    while (rc == SQLITE_ROW) {
      rc = Step(error);
    }
    return rc == SQLITE_DONE;
  }

  sqlite3_stmt* get() const {
    return stmt_;
  }

private:
  void Track(int rc) {
    ok_ = ok_ && rc == SQLITE_OK;
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  bool ok_ = false;
};

std::string ColumnText(sqlite3_stmt* stmt, int column) {
  const unsigned char* text = sqlite3_column_text(stmt, column);
  if (text == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

std::optional<std::chrono::system_clock::time_point> ColumnTime(sqlite3_stmt* stmt, int column) {
  if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return core::FromEpochMillis(sqlite3_column_int64(stmt, column));
}

bool ReadJob(sqlite3_stmt* stmt, QueueJob& job, std::string& error) {
  job.id = ColumnText(stmt, 0);
  job.device_id = ColumnText(stmt, 1);
  job.device_type = ColumnText(stmt, 2);
  job.operation = ColumnText(stmt, 3);

  const std::string parameters = ColumnText(stmt, 4);
  std::string parse_error;
  if (!core::json::Parse(parameters, job.parameters, parse_error)) {
    error = "job " + job.id + " has corrupt parameters: " + parse_error;
    return false;
  }
  const std::string status = ColumnText(stmt, 5);
  if (!ParseJobStatus(status, job.status)) {
    error = "job " + job.id + " has unknown status '" + status + "'";
    return false;
  }

  job.created_at = core::FromEpochMillis(sqlite3_column_int64(stmt, 6));
  job.started_at = ColumnTime(stmt, 7);
  job.completed_at = ColumnTime(stmt, 8);
  if (sqlite3_column_type(stmt, 9) == SQLITE_NULL) {
    job.error.reset();
  } else {
    job.error = ColumnText(stmt, 9);
  }
  job.retry_count = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 10));
  job.available_at = core::FromEpochMillis(sqlite3_column_int64(stmt, 11));
  return true;
}

std::int64_t NowMillis() {
  return core::ToEpochMillis(std::chrono::system_clock::now());
}

bool NotOpen(sqlite3* db, StoreError& error) {
  if (db != nullptr) {
    return false;
  }
  error = {StoreErrorKind::kStorage, "queue store is not open"};
  return true;
}

} // namespace

JobStore::JobStore(std::filesystem::path database_path, core::logging::Logger logger)
    : database_path_(std::move(database_path)), logger_(std::move(logger)) {}

JobStore::~JobStore() {
  Close();
}

bool JobStore::Open(std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    return true;
  }
  if (!core::EnsureParentDirectory(database_path_, error)) {
    return false;
  }

  sqlite3* db = nullptr;
  const int rc = sqlite3_open_v2(database_path_.string().c_str(), &db,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                     SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  if (rc != SQLITE_OK) {
    error = "failed to open queue store " + database_path_.string() + ": " +
            (db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    sqlite3_close(db);
    return false;
  }
  db_ = db;
  sqlite3_busy_timeout(db_, 5000);

  if (!ExecLocked("PRAGMA journal_mode=WAL;", error) ||
      !ExecLocked("PRAGMA synchronous=NORMAL;", error) || !ExecLocked(kSchemaSql, error)) {
    error = "failed to initialize queue store: " + error;
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }

  logger_.Info("queue store opened", {{"path", database_path_.string()}});
  return true;
}

void JobStore::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return;
  }
  sqlite3_close(db_);
  db_ = nullptr;
}

bool JobStore::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return db_ != nullptr;
}

bool JobStore::ExecLocked(const char* sql, std::string& error) {
  char* message = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &message) != SQLITE_OK) {
    error = message != nullptr ? message : sqlite3_errmsg(db_);
    sqlite3_free(message);
    return false;
  }
  return true;
}

bool JobStore::CountActiveLocked(std::size_t& count, StoreError& error) {
  Statement stmt(db_, "SELECT COUNT(*) FROM queue_jobs WHERE status IN ('pending', 'processing')");
  if (stmt.Step(error.message) != SQLITE_ROW) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  count = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
  return true;
}

bool JobStore::CountActive(std::size_t& count, StoreError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }
  return CountActiveLocked(count, error);
}

bool JobStore::AddJob(const NewJob& job, std::size_t max_active, std::string& job_id,
                      StoreError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  if (max_active > 0U) {
    std::size_t active = 0;
    if (!CountActiveLocked(active, error)) {
      return false;
    }
    if (active >= max_active) {
      error = {StoreErrorKind::kQueueFull,
               "Queue is full (" + std::to_string(active) + " active jobs)"};
      return false;
    }
  }

  const std::string id = core::GenerateUuid();
  const std::int64_t now = NowMillis();
  Statement stmt(db_,
                 "INSERT INTO queue_jobs (id, seq, device_id, device_type, operation, parameters, "
                 "status, created_at, retry_count, available_at) VALUES (?1, "
                 "(SELECT COALESCE(MAX(seq), 0) + 1 FROM queue_jobs), ?2, ?3, ?4, ?5, 'pending', "
                 "?6, 0, ?6)");
  stmt.BindText(1, id);
  stmt.BindText(2, job.device_id);
  stmt.BindText(3, job.device_type);
  stmt.BindText(4, job.operation);
  stmt.BindText(5, core::json::Serialize(job.parameters));
  stmt.BindInt64(6, now);
  if (stmt.Step(error.message) != SQLITE_DONE) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }

  job_id = id;
  logger_.Info("job enqueued", {{"job_id", id},
                                {"device_id", job.device_id},
                                {"operation", job.operation}});
  return true;
}

bool JobStore::GetNextPendingJob(std::optional<QueueJob>& job, StoreError& error) {
  job.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  Statement stmt(db_, SelectJobsWhere("status = 'pending' AND available_at <= ?1 "
                                      "ORDER BY created_at ASC, seq ASC LIMIT 1"));
  stmt.BindInt64(1, NowMillis());
  const int rc = stmt.Step(error.message);
  if (rc == SQLITE_DONE) {
    return true;
  }
  QueueJob row;
  if (rc != SQLITE_ROW || !ReadJob(stmt.get(), row, error.message)) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  job = std::move(row);
  return true;
}

bool JobStore::ClaimNextJob(std::optional<QueueJob>& job, StoreError& error) {
  job.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  std::string sql = "UPDATE queue_jobs SET status = 'processing', started_at = ?1 "
                    "WHERE id = (SELECT id FROM queue_jobs WHERE status = 'pending' "
                    "AND available_at <= ?1 ORDER BY created_at ASC, seq ASC LIMIT 1) "
                    "AND status = 'pending' RETURNING ";
  sql += kJobColumns;
  Statement stmt(db_, sql);
  const std::int64_t now = NowMillis();
  stmt.BindInt64(1, now);
  const int rc = stmt.Step(error.message);
  if (rc == SQLITE_DONE) {
    return true;
  }
  if (rc != SQLITE_ROW) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }

  QueueJob row;
  std::string read_error;
  const bool readable = ReadJob(stmt.get(), row, read_error);
  if (!stmt.Finish(error.message)) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  if (!readable) {
    // The row is already processing; park it as failed so it is not stranded
    // until the next startup recovery.
    Statement park(db_, "UPDATE queue_jobs SET status = 'failed', completed_at = ?2, "
                        "error = ?3 WHERE id = ?1 AND status = 'processing'");
    park.BindText(1, row.id);
    park.BindInt64(2, now);
    park.BindText(3, read_error);
    std::string park_error;
    if (park.Step(park_error) != SQLITE_DONE) {
      read_error += "; marking it failed also failed: " + park_error;
    }
    logger_.Error("claimed job is unreadable", {{"job_id", row.id}, {"error", read_error}});
    error = {StoreErrorKind::kStorage, read_error};
    return false;
  }
  logger_.Debug("job claimed", {{"job_id", row.id}, {"retry_count", std::to_string(row.retry_count)}});
  job = std::move(row);
  return true;
}

bool JobStore::UpdateJobStatus(const std::string& job_id, JobStatus status,
                               const std::optional<std::string>& job_error,
                               std::uint32_t max_retry_attempts, StoreError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  // Each target state names the only states it may be entered from. ?3 is
  // the timestamp, ?4 the optional error, ?5 the retry budget.
  std::string sql;
  switch (status) {
  case JobStatus::kProcessing:
    sql = "UPDATE queue_jobs SET status = 'processing', started_at = ?3, completed_at = NULL, "
          "error = COALESCE(?4, error) WHERE id = ?1 AND status = 'pending'";
    break;
  case JobStatus::kCompleted:
    sql = "UPDATE queue_jobs SET status = 'completed', completed_at = ?3, error = ?4 "
          "WHERE id = ?1 AND status = 'processing'";
    break;
  case JobStatus::kFailed:
    sql = "UPDATE queue_jobs SET status = 'failed', completed_at = ?3, "
          "error = COALESCE(?4, error) WHERE id = ?1 AND status = 'processing'";
    break;
  case JobStatus::kCancelled:
    sql = "UPDATE queue_jobs SET status = 'cancelled', completed_at = ?3, "
          "error = COALESCE(?4, error) WHERE id = ?1 AND status IN ('pending', 'processing')";
    break;
  case JobStatus::kPending:
    sql = "UPDATE queue_jobs SET status = 'pending', retry_count = retry_count + 1, "
          "started_at = NULL, completed_at = NULL, available_at = ?3, "
          "error = COALESCE(?4, error) "
          "WHERE id = ?1 AND status = 'failed' AND retry_count < ?5";
    break;
  }

  Statement stmt(db_, sql);
  stmt.BindText(1, job_id);
  stmt.BindInt64(3, NowMillis());
  stmt.BindOptionalText(4, job_error);
  if (status == JobStatus::kPending) {
    stmt.BindInt64(5, static_cast<std::int64_t>(max_retry_attempts));
  }
  if (stmt.Step(error.message) != SQLITE_DONE) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  if (sqlite3_changes(db_) > 0) {
    logger_.Debug("job status updated", {{"job_id", job_id}, {"status", ToString(status)}});
    return true;
  }

  Statement current(db_, "SELECT status, retry_count FROM queue_jobs WHERE id = ?1");
  current.BindText(1, job_id);
  const int rc = current.Step(error.message);
  if (rc == SQLITE_DONE) {
    error = {StoreErrorKind::kNotFound, "Job not found: " + job_id};
    return false;
  }
  if (rc != SQLITE_ROW) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  const std::string from = ColumnText(current.get(), 0);
  const std::int64_t retry_count = sqlite3_column_int64(current.get(), 1);
  std::string message = "Job " + job_id + " cannot move from " + from + " to " + ToString(status);
  if (status == JobStatus::kPending && from == "failed") {
    message += " (retry limit of " + std::to_string(max_retry_attempts) + " reached after " +
               std::to_string(retry_count) + " retries)";
  }
  error = {StoreErrorKind::kInvalidTransition, std::move(message)};
  return false;
}

bool JobStore::CompleteJob(const std::string& job_id, bool& applied, StoreError& error) {
  applied = false;
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  Statement stmt(db_, "UPDATE queue_jobs SET status = 'completed', completed_at = ?2, "
                      "error = NULL WHERE id = ?1 AND status = 'processing'");
  stmt.BindText(1, job_id);
  stmt.BindInt64(2, NowMillis());
  if (stmt.Step(error.message) != SQLITE_DONE) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  applied = sqlite3_changes(db_) > 0;
  return true;
}

bool JobStore::FailJob(const std::string& job_id, const std::string& job_error,
                       std::uint32_t max_retry_attempts, std::chrono::milliseconds retry_delay,
                       FailOutcome& outcome, StoreError& error) {
  outcome = FailOutcome::kSkipped;
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  // SET expressions all see the pre-update row, so every CASE tests the
  // same retry_count.
  Statement stmt(db_,
                 "UPDATE queue_jobs SET "
                 "status = CASE WHEN retry_count < ?2 THEN 'pending' ELSE 'failed' END, "
                 "retry_count = CASE WHEN retry_count < ?2 THEN retry_count + 1 "
                 "ELSE retry_count END, "
                 "available_at = CASE WHEN retry_count < ?2 THEN ?3 + ?4 ELSE available_at END, "
                 "started_at = CASE WHEN retry_count < ?2 THEN NULL ELSE started_at END, "
                 "completed_at = CASE WHEN retry_count < ?2 THEN NULL ELSE ?3 END, "
                 "error = ?5 "
                 "WHERE id = ?1 AND status = 'processing' RETURNING status, retry_count");
  stmt.BindText(1, job_id);
  stmt.BindInt64(2, static_cast<std::int64_t>(max_retry_attempts));
  stmt.BindInt64(3, NowMillis());
  stmt.BindInt64(4, static_cast<std::int64_t>(retry_delay.count()));
  stmt.BindText(5, job_error);

  const int rc = stmt.Step(error.message);
  if (rc == SQLITE_DONE) {
    return true;
  }
  if (rc != SQLITE_ROW) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  const std::string status = ColumnText(stmt.get(), 0);
  const std::int64_t retry_count = sqlite3_column_int64(stmt.get(), 1);
  if (!stmt.Finish(error.message)) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }

  if (status == "pending") {
    outcome = FailOutcome::kRetryScheduled;
    logger_.Warn("job failed; retry scheduled",
                 {{"job_id", job_id},
                  {"retry_count", std::to_string(retry_count)},
                  {"delay_ms", std::to_string(retry_delay.count())},
                  {"error", job_error}});
  } else {
    outcome = FailOutcome::kFailed;
    logger_.Error("job failed permanently",
                  {{"job_id", job_id},
                   {"retry_count", std::to_string(retry_count)},
                   {"error", job_error}});
  }
  return true;
}

bool JobStore::CancelJob(const std::string& job_id, bool& cancelled, StoreError& error) {
  cancelled = false;
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  Statement update(db_, "UPDATE queue_jobs SET status = 'cancelled', completed_at = ?2 "
                        "WHERE id = ?1 AND status IN ('pending', 'processing')");
  update.BindText(1, job_id);
  update.BindInt64(2, NowMillis());
  if (update.Step(error.message) != SQLITE_DONE) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  if (sqlite3_changes(db_) > 0) {
    cancelled = true;
    logger_.Info("job cancelled", {{"job_id", job_id}});
    return true;
  }

  Statement exists(db_, "SELECT 1 FROM queue_jobs WHERE id = ?1");
  exists.BindText(1, job_id);
  const int rc = exists.Step(error.message);
  if (rc == SQLITE_DONE) {
    error = {StoreErrorKind::kNotFound, "Job not found: " + job_id};
    return false;
  }
  if (rc != SQLITE_ROW) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  return true;
}

bool JobStore::GetJob(const std::string& job_id, std::optional<QueueJob>& job,
                      StoreError& error) {
  job.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  Statement stmt(db_, SelectJobsWhere("id = ?1"));
  stmt.BindText(1, job_id);
  const int rc = stmt.Step(error.message);
  if (rc == SQLITE_DONE) {
    return true;
  }
  QueueJob row;
  if (rc != SQLITE_ROW || !ReadJob(stmt.get(), row, error.message)) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  job = std::move(row);
  return true;
}

bool JobStore::GetJobs(const JobFilter& filter, std::vector<QueueJob>& jobs, StoreError& error) {
  jobs.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  std::string sql = SelectJobsWhere("1 = 1");
  int next_index = 1;
  int device_index = 0;
  int status_index = 0;
  if (filter.device_id.has_value()) {
    device_index = next_index++;
    sql += " AND device_id = ?" + std::to_string(device_index);
  }
  if (filter.status.has_value()) {
    status_index = next_index++;
    sql += " AND status = ?" + std::to_string(status_index);
  }
  const int limit_index = next_index;
  sql += " ORDER BY created_at DESC, seq DESC LIMIT ?" + std::to_string(limit_index);

  Statement stmt(db_, sql);
  if (device_index != 0) {
    stmt.BindText(device_index, *filter.device_id);
  }
  if (status_index != 0) {
    stmt.BindText(status_index, ToString(*filter.status));
  }
  stmt.BindInt64(limit_index, static_cast<std::int64_t>(filter.limit == 0U ? 100U : filter.limit));

  int rc = stmt.Step(error.message);
  while (rc == SQLITE_ROW) {
    QueueJob row;
    if (!ReadJob(stmt.get(), row, error.message)) {
      error.kind = StoreErrorKind::kStorage;
      return false;
    }
    jobs.push_back(std::move(row));
    rc = stmt.Step(error.message);
  }
  if (rc != SQLITE_DONE) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  return true;
}

bool JobStore::GetQueueStatus(QueueStatus& status, StoreError& error) {
  status = {};
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  Statement stmt(db_,
                 "SELECT COUNT(*), "
                 "SUM(CASE WHEN status = 'pending' THEN 1 ELSE 0 END), "
                 "SUM(CASE WHEN status = 'processing' THEN 1 ELSE 0 END), "
                 "SUM(CASE WHEN status = 'completed' THEN 1 ELSE 0 END), "
                 "SUM(CASE WHEN status = 'failed' THEN 1 ELSE 0 END), "
                 "SUM(CASE WHEN status = 'cancelled' THEN 1 ELSE 0 END), "
                 "MAX(CASE WHEN status = 'completed' THEN completed_at END), "
                 "AVG(CASE WHEN status = 'completed' AND started_at IS NOT NULL "
                 "AND completed_at IS NOT NULL THEN completed_at - started_at END) "
                 "FROM queue_jobs");
  if (stmt.Step(error.message) != SQLITE_ROW) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  sqlite3_stmt* row = stmt.get();
  status.total = static_cast<std::uint64_t>(sqlite3_column_int64(row, 0));
  status.pending = static_cast<std::uint64_t>(sqlite3_column_int64(row, 1));
  status.processing = static_cast<std::uint64_t>(sqlite3_column_int64(row, 2));
  status.completed = static_cast<std::uint64_t>(sqlite3_column_int64(row, 3));
  status.failed = static_cast<std::uint64_t>(sqlite3_column_int64(row, 4));
  status.cancelled = static_cast<std::uint64_t>(sqlite3_column_int64(row, 5));
  status.last_processed = ColumnTime(row, 6);
  status.average_processing_ms =
      sqlite3_column_type(row, 7) == SQLITE_NULL ? 0.0 : sqlite3_column_double(row, 7);
  return true;
}

bool JobStore::RecoverStaleJobs(std::uint32_t max_retry_attempts, std::size_t& recovered,
                                StoreError& error) {
  recovered = 0;
  std::lock_guard<std::mutex> lock(mutex_);
  if (NotOpen(db_, error)) {
    return false;
  }

  Statement stmt(db_,
                 "UPDATE queue_jobs SET "
                 "status = CASE WHEN retry_count < ?1 THEN 'pending' ELSE 'failed' END, "
                 "retry_count = CASE WHEN retry_count < ?1 THEN retry_count + 1 "
                 "ELSE retry_count END, "
                 "started_at = CASE WHEN retry_count < ?1 THEN NULL ELSE started_at END, "
                 "completed_at = CASE WHEN retry_count < ?1 THEN NULL ELSE ?2 END, "
                 "available_at = ?2, "
                 "error = COALESCE(error, 'interrupted by gateway restart') "
                 "WHERE status = 'processing'");
  stmt.BindInt64(1, static_cast<std::int64_t>(max_retry_attempts));
  stmt.BindInt64(2, NowMillis());
  if (stmt.Step(error.message) != SQLITE_DONE) {
    error.kind = StoreErrorKind::kStorage;
    return false;
  }
  recovered = static_cast<std::size_t>(sqlite3_changes(db_));
  if (recovered > 0U) {
    logger_.Warn("recovered interrupted jobs", {{"count", std::to_string(recovered)}});
  }
  return true;
}

} // namespace hwbridge::queue
