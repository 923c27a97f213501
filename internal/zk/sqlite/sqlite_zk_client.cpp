#include "sqlite_zk_client.hpp"

#include <utility>

namespace datastream::zk::sqlite {

namespace {

const char* kBootstrapSql[] = {
    "CREATE TABLE IF NOT EXISTS znodes (path TEXT PRIMARY KEY, parent TEXT NOT NULL, data TEXT, version INTEGER NOT NULL DEFAULT 0);",
    "CREATE INDEX IF NOT EXISTS znodes_parent ON znodes(parent);",
    "INSERT OR IGNORE INTO znodes(path, parent, data, version) VALUES('/', '', NULL, 0);"};

// Backend failures surface as kInternal; client errors pass through untouched.
template <typename Fn>
auto Translate(const std::string& path, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const ZkClientException&) {
    throw;
  } catch (const std::exception& e) {
    throw ZkClientException(ZkErrorCode::kInternal, path + ": " + e.what());
  }
}

} // namespace

SqliteZkClient::SqliteZkClient(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  Bootstrap();
}

void SqliteZkClient::Bootstrap() {
  std::scoped_lock lock(mutex_);
  for (const char* sql : kBootstrapSql) {
    db_->Exec(sql);
  }
}

bool SqliteZkClient::ExistsLocked(const std::string& path) {
  Statement st(*db_, "SELECT 1 FROM znodes WHERE path=?;");
  st.BindText(1, path);
  return st.Step();
}

bool SqliteZkClient::Exists(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  return Translate(path, [&] { return ExistsLocked(path); });
}

std::optional<std::string> SqliteZkClient::ReadData(const std::string& path, bool return_null_if_absent) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  return Translate(path, [&]() -> std::optional<std::string> {
    Statement st(*db_, "SELECT data FROM znodes WHERE path=?;");
    st.BindText(1, path);
    if (!st.Step()) {
      if (return_null_if_absent) return std::nullopt;
      throw ZkClientException(ZkErrorCode::kNoNode, path);
    }
    return st.ColumnOptionalText(0);
  });
}

void SqliteZkClient::WriteData(const std::string& path, const std::string& data) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  Translate(path, [&] {
    Statement st(*db_, "UPDATE znodes SET data=?, version=version+1 WHERE path=?;");
    st.BindText(1, data);
    st.BindText(2, path);
    st.Step();
    if (db_->Changes() == 0) {
      throw ZkClientException(ZkErrorCode::kNoNode, path);
    }
  });
}

void SqliteZkClient::EnsurePath(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  Translate(path, [&] {
    ImmediateTransaction tx(*db_);
    for (const auto& ancestor : AncestorPaths(path)) {
      Statement st(*db_, "INSERT OR IGNORE INTO znodes(path, parent, data, version) VALUES(?, ?, NULL, 0);");
      st.BindText(1, ancestor);
      st.BindText(2, ParentPath(ancestor));
      st.Step();
    }
    tx.Commit();
  });
}

std::vector<std::string> SqliteZkClient::GetChildren(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  return Translate(path, [&] {
    if (!ExistsLocked(path)) {
      throw ZkClientException(ZkErrorCode::kNoNode, path);
    }
    Statement st(*db_, "SELECT path FROM znodes WHERE parent=? AND path<>'/' ORDER BY path;");
    st.BindText(1, path);
    std::vector<std::string> children;
    while (st.Step()) {
      children.push_back(BaseName(st.ColumnText(0)));
    }
    return children;
  });
}

bool SqliteZkClient::Delete(const std::string& path) {
  ValidatePath(path);
  if (path == "/") {
    throw ZkClientException(ZkErrorCode::kBadArguments, "cannot delete the root node");
  }
  std::scoped_lock lock(mutex_);
  return Translate(path, [&] {
    ImmediateTransaction tx(*db_);
    if (!ExistsLocked(path)) {
      return false;
    }
    {
      Statement children(*db_, "SELECT 1 FROM znodes WHERE parent=? LIMIT 1;");
      children.BindText(1, path);
      if (children.Step()) {
        throw ZkClientException(ZkErrorCode::kNotEmpty, path);
      }
    }
    Statement st(*db_, "DELETE FROM znodes WHERE path=?;");
    st.BindText(1, path);
    st.Step();
    tx.Commit();
    return true;
  });
}

void SqliteZkClient::DeleteRecursively(const std::string& path) {
  ValidatePath(path);
  if (path == "/") {
    throw ZkClientException(ZkErrorCode::kBadArguments, "cannot delete the root node");
  }
  std::scoped_lock lock(mutex_);
  Translate(path, [&] {
    ImmediateTransaction tx(*db_);
    Statement st(*db_, "DELETE FROM znodes WHERE path=?1 OR substr(path, 1, length(?2))=?2;");
    st.BindText(1, path);
    st.BindText(2, path + "/");
    st.Step();
    tx.Commit();
  });
}

VersionedData SqliteZkClient::ReadVersioned(const std::string& path) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  return Translate(path, [&] {
    Statement st(*db_, "SELECT data, version FROM znodes WHERE path=?;");
    st.BindText(1, path);
    if (!st.Step()) {
      throw ZkClientException(ZkErrorCode::kNoNode, path);
    }
    return VersionedData{st.ColumnOptionalText(0), static_cast<int32_t>(st.ColumnInt(1))};
  });
}

bool SqliteZkClient::WriteIfVersion(const std::string& path, const std::string& data, int32_t expected_version) {
  ValidatePath(path);
  std::scoped_lock lock(mutex_);
  return Translate(path, [&] {
    Statement st(*db_, "UPDATE znodes SET data=?, version=version+1 WHERE path=? AND version=?;");
    st.BindText(1, data);
    st.BindText(2, path);
    st.BindInt(3, expected_version);
    st.Step();
    if (db_->Changes() == 1) {
      return true;
    }
    if (!ExistsLocked(path)) {
      throw ZkClientException(ZkErrorCode::kNoNode, path);
    }
    return false;
  });
}

} // namespace datastream::zk::sqlite
