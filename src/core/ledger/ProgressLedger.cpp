#include "ProgressLedger.hpp"
#include <algorithm>
#include <ctime>
#include <sqlite3.h>

#include "core/errors/Errors.hpp"

namespace frl {

namespace {

// Finalizes on scope exit; every sqlite failure becomes LedgerIOError.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      std::string err = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw LedgerIOError("prepare failed: " + err);
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& text(int i, const std::string& v) {
    sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
  }
  Statement& real(int i, double v) {
    sqlite3_bind_double(st_, i, v);
    return *this;
  }
  Statement& int64(int i, int64_t v) {
    sqlite3_bind_int64(st_, i, v);
    return *this;
  }

  // true while a row is available
  bool step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw LedgerIOError(std::string("step failed: ") + sqlite3_errmsg(db_));
  }

  void run() {
    while (step()) {}
  }

  std::optional<std::string> optText(int col) const {
    if (sqlite3_column_type(st_, col) == SQLITE_NULL) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(sqlite3_column_text(st_, col)));
  }
  std::string textAt(int col) const { return optText(col).value_or(std::string()); }
  double realAt(int col) const { return sqlite3_column_double(st_, col); }
  int64_t int64At(int col) const { return sqlite3_column_int64(st_, col); }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw LedgerIOError(std::string("exec failed (") + sql + "): " + msg);
  }
}

// BEGIN IMMEDIATE takes the write lock up front so the read in a
// read-modify-write cannot be invalidated by another connection.
class Transaction {
public:
  explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE;"); }
  ~Transaction() {
    if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  void commit() {
    exec(db_, "COMMIT;");
    done_ = true;
  }

private:
  sqlite3* db_;
  bool done_ = false;
};

constexpr const char* kSelectColumns =
  "SELECT route_id, camera, downloaded_at, processed_at, uploaded_until, updated_at "
  "FROM route_cameras";

LedgerEntry rowToEntry(const Statement& st) {
  LedgerEntry e;
  e.route_id       = st.textAt(0);
  e.camera         = st.textAt(1);
  e.downloaded_at  = st.optText(2);
  e.processed_at   = st.optText(3);
  e.uploaded_until = st.realAt(4);
  e.updated_at     = st.int64At(5);
  return e;
}

int64_t now() { return static_cast<int64_t>(std::time(nullptr)); }

} // namespace

ProgressLedger::ProgressLedger(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw LedgerIOError("failed to open ledger db " + dbPath + ": " + msg);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

ProgressLedger::~ProgressLedger() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

double ProgressLedger::read(const std::string& route_id, const std::string& camera) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto e = getLocked(route_id, camera);
  return e ? e->uploaded_until : 0.0;
}

double ProgressLedger::advance(const std::string& route_id, const std::string& camera, double candidate) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto* db = static_cast<sqlite3*>(db_);

  Transaction tx(db);
  double stored = 0.0;
  if (auto e = getLocked(route_id, camera)) stored = e->uploaded_until;
  const double merged = std::max(stored, candidate);

  Statement st(db, R"SQL(
    INSERT INTO route_cameras (route_id, camera, uploaded_until, updated_at)
    VALUES (?,?,?,?)
    ON CONFLICT(route_id, camera) DO UPDATE SET
      uploaded_until = excluded.uploaded_until,
      updated_at     = excluded.updated_at
  )SQL");
  st.text(1, route_id).text(2, camera).real(3, merged).int64(4, now()).run();
  tx.commit();
  return merged;
}

void ProgressLedger::markProcessed(const std::string& route_id, const std::string& camera, const std::string& at) {
  std::lock_guard<std::mutex> lk(mtx_);
  setTimestampLocked("processed_at", route_id, camera, at);
}

bool ProgressLedger::isProcessed(const std::string& route_id, const std::string& camera) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto e = getLocked(route_id, camera);
  return e && e->processed_at.has_value();
}

void ProgressLedger::markDownloaded(const std::string& route_id, const std::string& camera, const std::string& at) {
  std::lock_guard<std::mutex> lk(mtx_);
  setTimestampLocked("downloaded_at", route_id, camera, at);
}

bool ProgressLedger::isDownloaded(const std::string& route_id, const std::string& camera) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto e = getLocked(route_id, camera);
  return e && e->downloaded_at.has_value();
}

void ProgressLedger::resetUpload(const std::string& route_id, const std::string& camera) {
  std::lock_guard<std::mutex> lk(mtx_);
  Statement st(static_cast<sqlite3*>(db_), R"SQL(
    UPDATE route_cameras SET uploaded_until = 0, processed_at = NULL, updated_at = ?
    WHERE route_id = ? AND camera = ?
  )SQL");
  st.int64(1, now()).text(2, route_id).text(3, camera).run();
}

void ProgressLedger::forgetRoute(const std::string& route_id) {
  std::lock_guard<std::mutex> lk(mtx_);
  Statement st(static_cast<sqlite3*>(db_), "DELETE FROM route_cameras WHERE route_id = ?");
  st.text(1, route_id).run();
}

void ProgressLedger::clear() {
  std::lock_guard<std::mutex> lk(mtx_);
  exec(static_cast<sqlite3*>(db_), "DELETE FROM route_cameras;");
}

std::optional<LedgerEntry> ProgressLedger::get(const std::string& route_id, const std::string& camera) {
  std::lock_guard<std::mutex> lk(mtx_);
  return getLocked(route_id, camera);
}

std::vector<LedgerEntry> ProgressLedger::list() {
  std::lock_guard<std::mutex> lk(mtx_);
  Statement st(static_cast<sqlite3*>(db_),
               (std::string(kSelectColumns) + " ORDER BY route_id, camera").c_str());
  std::vector<LedgerEntry> out;
  while (st.step()) out.push_back(rowToEntry(st));
  return out;
}

std::optional<LedgerEntry> ProgressLedger::getLocked(const std::string& route_id, const std::string& camera) {
  Statement st(static_cast<sqlite3*>(db_),
               (std::string(kSelectColumns) + " WHERE route_id = ? AND camera = ?").c_str());
  st.text(1, route_id).text(2, camera);
  if (!st.step()) return std::nullopt;
  return rowToEntry(st);
}

void ProgressLedger::setTimestampLocked(const char* column,
                                        const std::string& route_id,
                                        const std::string& camera,
                                        const std::string& at) {
  const std::string sql =
    std::string("INSERT INTO route_cameras (route_id, camera, ") + column + ", updated_at) "
    "VALUES (?,?,?,?) "
    "ON CONFLICT(route_id, camera) DO UPDATE SET " + column + " = excluded." + column +
    ", updated_at = excluded.updated_at";
  Statement st(static_cast<sqlite3*>(db_), sql.c_str());
  st.text(1, route_id).text(2, camera).text(3, at).int64(4, now()).run();
}

} // namespace frl
