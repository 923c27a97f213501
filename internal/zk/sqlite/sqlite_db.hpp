#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace datastream::zk::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Rows modified by the most recent statement.
  int Changes() const;

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement, finalized on destruction.
*/
class Statement {
 public:
  Statement(SqliteDB& db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& value);
  void BindInt(int idx, int64_t value);

  // True while a row is available; throws on errors.
  bool Step();

  std::string                ColumnText(int col) const;
  std::optional<std::string> ColumnOptionalText(int col) const;
  int64_t                    ColumnInt(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

/*
  BEGIN IMMEDIATE scope: grabs the write lock up front. Rolled back on
  destruction unless committed.
*/
class ImmediateTransaction {
 public:
  explicit ImmediateTransaction(SqliteDB& db);
  ~ImmediateTransaction();

  ImmediateTransaction(const ImmediateTransaction&)            = delete;
  ImmediateTransaction& operator=(const ImmediateTransaction&) = delete;

  void Commit();

 private:
  SqliteDB& db_;
  bool      done_ = false;
};

} // namespace datastream::zk::sqlite
