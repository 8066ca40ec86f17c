#include "drover/context/embedding_cache.hpp"

#include "drover/common/hash.hpp"

#include <chrono>
#include <cstring>

namespace drover::context {

namespace {

std::vector<unsigned char> vector_to_blob(const std::vector<float> &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), values.data(), blob.size());
  }
  return blob;
}

std::vector<float> blob_to_vector(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }
  std::vector<float> values(static_cast<std::size_t>(bytes) / sizeof(float));
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::int64_t epoch_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

common::Result<std::unique_ptr<EmbeddingCache>>
EmbeddingCache::open(const std::filesystem::path &path, const std::size_t max_entries) {
  std::string target = ":memory:";
  if (!path.empty()) {
    std::error_code ec;
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec) {
        return common::Result<std::unique_ptr<EmbeddingCache>>::failure(
            "cannot create " + path.parent_path().string() + ": " + ec.message());
      }
    }
    target = path.string();
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(target.c_str(), &db) != SQLITE_OK) {
    const std::string message = db == nullptr ? "sqlite open failed" : sqlite3_errmsg(db);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return common::Result<std::unique_ptr<EmbeddingCache>>::failure(message);
  }

  std::unique_ptr<EmbeddingCache> cache(new EmbeddingCache(db, max_entries));
  auto status = cache->init_schema();
  if (!status.ok()) {
    return common::Result<std::unique_ptr<EmbeddingCache>>::failure(status.error());
  }
  return common::Result<std::unique_ptr<EmbeddingCache>>::success(std::move(cache));
}

EmbeddingCache::EmbeddingCache(sqlite3 *db, const std::size_t max_entries)
    : db_(db), max_entries_(max_entries) {}

EmbeddingCache::~EmbeddingCache() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status EmbeddingCache::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS embedding_cache (
  text_hash TEXT PRIMARY KEY,
  embedding BLOB NOT NULL,
  created_at INTEGER NOT NULL
);
)");
}

common::Result<std::optional<std::vector<float>>> EmbeddingCache::get(const std::string &text) {
  const std::string hash = common::sha256_hex(text);
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT embedding FROM embedding_cache WHERE text_hash = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::optional<std::vector<float>>>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    auto embedding = blob_to_vector(sqlite3_column_blob(stmt, 0), sqlite3_column_bytes(stmt, 0));
    sqlite3_finalize(stmt);
    ++stats_.hits;
    return common::Result<std::optional<std::vector<float>>>::success(std::move(embedding));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::optional<std::vector<float>>>::failure(sqlite3_errmsg(db_));
  }
  ++stats_.misses;
  return common::Result<std::optional<std::vector<float>>>::success(std::nullopt);
}

common::Status EmbeddingCache::put(const std::string &text, const std::vector<float> &embedding) {
  const std::string hash = common::sha256_hex(text);
  const auto blob = vector_to_blob(embedding);
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT OR REPLACE INTO embedding_cache(text_hash, embedding, created_at) VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, epoch_ms());

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return evict_overflow();
}

common::Status EmbeddingCache::evict_overflow() {
  sqlite3_stmt *count_stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &count_stmt, nullptr) !=
      SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  if (sqlite3_step(count_stmt) == SQLITE_ROW) {
    stats_.size = static_cast<std::size_t>(sqlite3_column_int64(count_stmt, 0));
  }
  sqlite3_finalize(count_stmt);

  if (max_entries_ == 0 || stats_.size <= max_entries_) {
    return common::Status::success();
  }
  const std::size_t overflow = stats_.size - max_entries_;
  auto status = exec_sql(db_, "DELETE FROM embedding_cache WHERE text_hash IN (SELECT text_hash "
                              "FROM embedding_cache ORDER BY created_at ASC LIMIT " +
                                  std::to_string(overflow) + ")");
  if (!status.ok()) {
    return status;
  }
  stats_.size = max_entries_;
  return common::Status::success();
}

EmbeddingCacheStats EmbeddingCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

} // namespace drover::context
