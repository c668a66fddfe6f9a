#include "transfer_store.hpp"

#include <filesystem>

namespace {

const char* kColumns =
  "transfer_id, job_id, file_id, type, priority, status, source, destination, "
  "relative_path, filename, size, ssh_json, rsync_json, max_retries, retry_count, "
  "progress, speed, eta, bytes_transferred, error_message, error_category, "
  "concurrency_slot, queued_at, started_at, completed_at, last_state_change, "
  "last_progress_at, history_json";

const char* kActiveStatuses = "('QUEUED','SCHEDULED','TRANSFERRING')";

std::string column_text(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::optional<std::int64_t> column_optional_int(sqlite3_stmt* stmt, int col) {
  if(sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int64(stmt, col);
}

void bind_optional_time(sqlite3_stmt* stmt, int idx, const std::optional<TimePoint>& tp) {
  if(tp) sqlite3_bind_int64(stmt, idx, to_millis(*tp));
  else sqlite3_bind_null(stmt, idx);
}

std::optional<ErrorCategory> category_from_text(const std::string& text) {
  for(auto c : {ErrorCategory::Validation, ErrorCategory::Connection, ErrorCategory::Transfer,
                ErrorCategory::Timeout, ErrorCategory::Consistency, ErrorCategory::Cancelled}) {
    if(text == to_string(c)) return c;
  }
  return std::nullopt;
}

} // namespace

TransferStore::TransferStore(std::string db_path) : db_path_(std::move(db_path)) {}

TransferStore::~TransferStore() {
  close();
}

bool TransferStore::open(std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(db_) return true;

  if(db_path_ != ":memory:") {
    std::filesystem::path p(db_path_);
    if(p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
    }
  }

  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if(sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    err = db_ ? sqlite3_errmsg(db_) : "sqlite3_open_v2 failed";
    if(db_) sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  sqlite3_busy_timeout(db_, 5000);
  if(!init_schema(err)) {
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  return true;
}

void TransferStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool TransferStore::init_schema(std::string& err) {
  const char* sql = R"SQL(
PRAGMA journal_mode = WAL;
PRAGMA synchronous = NORMAL;

CREATE TABLE IF NOT EXISTS transfers (
    transfer_id       TEXT PRIMARY KEY,
    job_id            TEXT NOT NULL,
    file_id           TEXT NOT NULL,
    type              TEXT NOT NULL,
    priority          INTEGER NOT NULL,
    status            TEXT NOT NULL,
    source            TEXT NOT NULL,
    destination       TEXT NOT NULL,
    relative_path     TEXT NOT NULL DEFAULT '',
    filename          TEXT NOT NULL DEFAULT '',
    size              INTEGER NOT NULL DEFAULT 0,
    ssh_json          TEXT NOT NULL,
    rsync_json        TEXT NOT NULL,
    max_retries       INTEGER NOT NULL,
    retry_count       INTEGER NOT NULL DEFAULT 0,
    progress          REAL NOT NULL DEFAULT 0,
    speed             TEXT NOT NULL DEFAULT '',
    eta               TEXT NOT NULL DEFAULT '',
    bytes_transferred INTEGER NOT NULL DEFAULT 0,
    error_message     TEXT NOT NULL DEFAULT '',
    error_category    TEXT NOT NULL DEFAULT '',
    concurrency_slot  INTEGER,
    queued_at         INTEGER NOT NULL,
    started_at        INTEGER,
    completed_at      INTEGER,
    last_state_change INTEGER NOT NULL,
    last_progress_at  INTEGER,
    history_json      TEXT NOT NULL DEFAULT '[]'
);

CREATE INDEX IF NOT EXISTS idx_transfers_job_status
    ON transfers(job_id, status);
CREATE INDEX IF NOT EXISTS idx_transfers_last_state_change
    ON transfers(last_state_change);
CREATE INDEX IF NOT EXISTS idx_transfers_job_file
    ON transfers(job_id, file_id);
)SQL";

  char* errmsg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
  if(rc != SQLITE_OK) {
    err = errmsg ? errmsg : "Unknown SQLite error";
    if(errmsg) sqlite3_free(errmsg);
    return false;
  }
  return true;
}

bool TransferStore::save(const Transfer& t, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!db_) {
    err = "transfer store is not open";
    return false;
  }
  std::string sql = std::string("INSERT OR REPLACE INTO transfers (") + kColumns +
    ") VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* stmt = nullptr;
  if(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    err = sqlite3_errmsg(db_);
    return false;
  }

  const std::string ssh_json = nlohmann::json(t.ssh).dump();
  const std::string rsync_json = nlohmann::json(t.rsync).dump();
  const std::string history_json = nlohmann::json(t.history).dump();
  const std::string type = to_string(t.type);
  const std::string status = to_string(t.status);
  const std::string category = t.error_category ? to_string(*t.error_category) : "";

  sqlite3_bind_text(stmt, 1, t.transfer_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, t.job_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, t.file_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 5, priority_rank(t.priority));
  sqlite3_bind_text(stmt, 6, status.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 7, t.source.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 8, t.destination.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 9, t.relative_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 10, t.filename.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 11, static_cast<sqlite3_int64>(t.size));
  sqlite3_bind_text(stmt, 12, ssh_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 13, rsync_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt, 14, t.max_retries);
  sqlite3_bind_int(stmt, 15, t.retry_count);
  sqlite3_bind_double(stmt, 16, t.progress);
  sqlite3_bind_text(stmt, 17, t.speed.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 18, t.eta.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 19, static_cast<sqlite3_int64>(t.bytes_transferred));
  sqlite3_bind_text(stmt, 20, t.error_message.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 21, category.c_str(), -1, SQLITE_TRANSIENT);
  if(t.concurrency_slot) sqlite3_bind_int(stmt, 22, *t.concurrency_slot);
  else sqlite3_bind_null(stmt, 22);
  sqlite3_bind_int64(stmt, 23, to_millis(t.queued_at));
  bind_optional_time(stmt, 24, t.started_at);
  bind_optional_time(stmt, 25, t.completed_at);
  sqlite3_bind_int64(stmt, 26, to_millis(t.last_state_change));
  bind_optional_time(stmt, 27, t.last_progress_at);
  sqlite3_bind_text(stmt, 28, history_json.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(stmt);
  if(rc != SQLITE_DONE) {
    err = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return false;
  }
  sqlite3_finalize(stmt);
  return true;
}

Transfer TransferStore::row_to_transfer(sqlite3_stmt* stmt) {
  Transfer t;
  t.transfer_id = column_text(stmt, 0);
  t.job_id = column_text(stmt, 1);
  t.file_id = column_text(stmt, 2);
  t.type = transfer_type_from_string(column_text(stmt, 3));
  int rank = sqlite3_column_int(stmt, 4);
  if(rank < 0 || rank > 3) rank = priority_rank(TransferPriority::Normal);
  t.priority = static_cast<TransferPriority>(rank);
  t.status = status_from_string(column_text(stmt, 5));
  t.source = column_text(stmt, 6);
  t.destination = column_text(stmt, 7);
  t.relative_path = column_text(stmt, 8);
  t.filename = column_text(stmt, 9);
  t.size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 10));
  t.ssh = nlohmann::json::parse(column_text(stmt, 11)).get<SshTarget>();
  t.rsync = nlohmann::json::parse(column_text(stmt, 12)).get<RsyncOptions>();
  t.max_retries = sqlite3_column_int(stmt, 13);
  t.retry_count = sqlite3_column_int(stmt, 14);
  t.progress = sqlite3_column_double(stmt, 15);
  t.speed = column_text(stmt, 16);
  t.eta = column_text(stmt, 17);
  t.bytes_transferred = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 18));
  t.error_message = column_text(stmt, 19);
  t.error_category = category_from_text(column_text(stmt, 20));
  if(auto slot = column_optional_int(stmt, 21)) t.concurrency_slot = static_cast<int>(*slot);
  t.queued_at = from_millis(sqlite3_column_int64(stmt, 22));
  if(auto v = column_optional_int(stmt, 23)) t.started_at = from_millis(*v);
  if(auto v = column_optional_int(stmt, 24)) t.completed_at = from_millis(*v);
  t.last_state_change = from_millis(sqlite3_column_int64(stmt, 25));
  if(auto v = column_optional_int(stmt, 26)) t.last_progress_at = from_millis(*v);
  t.history = nlohmann::json::parse(column_text(stmt, 27)).get<std::vector<StateChange>>();
  return t;
}

bool TransferStore::query(const std::string& sql,
                          const std::vector<std::string>& text_params,
                          std::vector<Transfer>& out,
                          std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!db_) {
    err = "transfer store is not open";
    return false;
  }
  sqlite3_stmt* stmt = nullptr;
  if(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    err = sqlite3_errmsg(db_);
    return false;
  }
  for(std::size_t i = 0; i < text_params.size(); ++i) {
    sqlite3_bind_text(stmt, static_cast<int>(i + 1), text_params[i].c_str(), -1, SQLITE_TRANSIENT);
  }

  bool ok = true;
  int rc = SQLITE_ROW;
  while((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    try {
      out.push_back(row_to_transfer(stmt));
    } catch(const std::exception& e) {
      err = "corrupt transfer row '" + column_text(stmt, 0) + "': " + e.what();
      ok = false;
      break;
    }
  }
  if(ok && rc != SQLITE_DONE) {
    err = sqlite3_errmsg(db_);
    ok = false;
  }
  sqlite3_finalize(stmt);
  return ok;
}

bool TransferStore::load(const std::string& transfer_id, Transfer& out, bool& found, std::string& err) {
  std::vector<Transfer> rows;
  std::string sql = std::string("SELECT ") + kColumns + " FROM transfers WHERE transfer_id = ?;";
  if(!query(sql, {transfer_id}, rows, err)) return false;
  found = !rows.empty();
  if(found) out = std::move(rows.front());
  return true;
}

bool TransferStore::load_active(std::vector<Transfer>& out, std::string& err) {
  std::string sql = std::string("SELECT ") + kColumns + " FROM transfers WHERE status IN " +
    kActiveStatuses + " ORDER BY priority DESC, queued_at ASC;";
  return query(sql, {}, out, err);
}

bool TransferStore::load_matching(const TransferFilter& filter, std::vector<Transfer>& out, std::string& err) {
  std::string sql = std::string("SELECT ") + kColumns + " FROM transfers";
  std::vector<std::string> params;
  std::vector<std::string> clauses;
  if(!filter.job_id.empty()) {
    clauses.push_back("job_id = ?");
    params.push_back(filter.job_id);
  }
  if(!filter.file_id.empty()) {
    clauses.push_back("file_id = ?");
    params.push_back(filter.file_id);
  }
  for(std::size_t i = 0; i < clauses.size(); ++i) {
    sql += (i == 0 ? " WHERE " : " AND ") + clauses[i];
  }
  sql += " ORDER BY queued_at ASC;";

  std::vector<Transfer> rows;
  if(!query(sql, params, rows, err)) return false;
  for(auto& row : rows) {
    if(filter.matches(row)) out.push_back(std::move(row));
  }
  return true;
}

bool TransferStore::find_active_by_pair(const std::string& job_id,
                                        const std::string& file_id,
                                        std::vector<Transfer>& out,
                                        std::string& err) {
  std::string sql = std::string("SELECT ") + kColumns +
    " FROM transfers WHERE job_id = ? AND file_id = ? AND status IN " + kActiveStatuses + ";";
  return query(sql, {job_id, file_id}, out, err);
}

bool TransferStore::count_by_status(std::map<TransferStatus, std::size_t>& out, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!db_) {
    err = "transfer store is not open";
    return false;
  }
  const char* sql = "SELECT status, COUNT(*) FROM transfers GROUP BY status;";
  sqlite3_stmt* stmt = nullptr;
  if(sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    err = sqlite3_errmsg(db_);
    return false;
  }
  int rc = SQLITE_ROW;
  bool ok = true;
  while((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    try {
      out[status_from_string(column_text(stmt, 0))] = static_cast<std::size_t>(sqlite3_column_int64(stmt, 1));
    } catch(const ValidationError& e) {
      err = e.what();
      ok = false;
      break;
    }
  }
  if(ok && rc != SQLITE_DONE) {
    err = sqlite3_errmsg(db_);
    ok = false;
  }
  sqlite3_finalize(stmt);
  return ok;
}

bool TransferStore::remove_terminal_before(TimePoint cutoff, std::size_t& removed, std::string& err) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!db_) {
    err = "transfer store is not open";
    return false;
  }
  const char* sql =
    "DELETE FROM transfers WHERE status IN ('COMPLETED','FAILED','CANCELLED') "
    "AND last_state_change < ?;";
  sqlite3_stmt* stmt = nullptr;
  if(sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    err = sqlite3_errmsg(db_);
    return false;
  }
  sqlite3_bind_int64(stmt, 1, to_millis(cutoff));
  int rc = sqlite3_step(stmt);
  if(rc != SQLITE_DONE) {
    err = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return false;
  }
  removed = static_cast<std::size_t>(sqlite3_changes(db_));
  sqlite3_finalize(stmt);
  return true;
}
