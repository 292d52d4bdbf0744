#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace roster::db::sqlite {

struct SqliteOptions {
  int busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every SqliteTransaction; writer_mutex_
  serializes them so BEGIN IMMEDIATE never nests on the connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Execute a SQL string (used for pragmas/bootstrap)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    writer_mutex_;
};

} // namespace roster::db::sqlite
