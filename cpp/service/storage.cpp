// service/storage.cpp
#include "storage.h"
#include <sqlite3.h>
#include <stdexcept>
#include <filesystem>

#include "chainseg/format.h"

static void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "sqlite error";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

static sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
  }
  return st;
}

static void step_done(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  const std::string msg = rc == SQLITE_DONE ? "" : sqlite3_errmsg(db);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite step failed: " + msg);
}

SqliteMetaSink::SqliteMetaSink(const std::string& db_path) : path_(db_path) {
  std::error_code ec;
  std::filesystem::create_directories(std::filesystem::path(path_).parent_path(), ec);

  sqlite3* db = nullptr;
  if (sqlite3_open(path_.c_str(), &db) != SQLITE_OK) {
    if (db) sqlite3_close(db);
    throw std::runtime_error("cannot open sqlite: " + path_);
  }
  db_ = db;
  sqlite3_busy_timeout(db, 5000);
}

SqliteMetaSink::~SqliteMetaSink() {
  if (db_) sqlite3_close((sqlite3*)db_);
}

void SqliteMetaSink::init() {
  auto* db = (sqlite3*)db_;
  exec(db, R"SQL(
    PRAGMA journal_mode=WAL;
    PRAGMA synchronous=NORMAL;

    CREATE TABLE IF NOT EXISTS meta (
      key TEXT PRIMARY KEY,
      dirty INTEGER DEFAULT 0,
      value TEXT,
      updated_at TEXT
    );
  )SQL");
}

void SqliteMetaSink::mark_dirty(const std::string& key) {
  auto* db = (sqlite3*)db_;
  const char* sql = R"SQL(
    INSERT INTO meta(key, dirty, updated_at) VALUES(?, 1, ?)
    ON CONFLICT(key) DO UPDATE SET dirty=1, updated_at=excluded.updated_at;
  )SQL";

  const std::string now = chainseg::utc_now_iso();
  sqlite3_stmt* st = prepare(db, sql);
  sqlite3_bind_text(st, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 2, now.c_str(), -1, SQLITE_TRANSIENT);
  step_done(db, st);
}

void SqliteMetaSink::set_timestamp(const std::string& key, const std::string& value) {
  auto* db = (sqlite3*)db_;
  const char* sql = R"SQL(
    INSERT INTO meta(key, value, updated_at) VALUES(?, ?, ?)
    ON CONFLICT(key) DO UPDATE SET value=excluded.value, updated_at=excluded.updated_at;
  )SQL";

  const std::string now = chainseg::utc_now_iso();
  sqlite3_stmt* st = prepare(db, sql);
  sqlite3_bind_text(st, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 2, value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 3, now.c_str(), -1, SQLITE_TRANSIENT);
  step_done(db, st);
}

void SqliteMetaSink::clear_dirty(const std::string& key) {
  auto* db = (sqlite3*)db_;
  sqlite3_stmt* st = prepare(db, "UPDATE meta SET dirty=0 WHERE key=?;");
  sqlite3_bind_text(st, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  step_done(db, st);
}

std::optional<MetaRow> SqliteMetaSink::get(const std::string& key) {
  auto* db = (sqlite3*)db_;
  sqlite3_stmt* st = prepare(db, "SELECT key, dirty, value, updated_at FROM meta WHERE key=? LIMIT 1;");
  sqlite3_bind_text(st, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  MetaRow r;
  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) {
    r.key = (const char*)sqlite3_column_text(st, 0);
    r.dirty = sqlite3_column_int(st, 1);

    const unsigned char* v = sqlite3_column_text(st, 2);
    r.value = v ? (const char*)v : "";

    const unsigned char* u = sqlite3_column_text(st, 3);
    r.updated_at_utc = u ? (const char*)u : "";

    sqlite3_finalize(st);
    return r;
  }
  const std::string msg = rc == SQLITE_DONE ? "" : sqlite3_errmsg(db);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) throw std::runtime_error("sqlite step failed: " + msg);
  return std::nullopt;
}
