#pragma once

#include "drover/common/result.hpp"

#include <sqlite3.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace drover::context {

struct EmbeddingCacheStats {
  std::size_t hits = 0;
  std::size_t misses = 0;
  std::size_t size = 0;
};

/// SQLite-backed map from text digest to embedding vector.
class EmbeddingCache {
public:
  /// Opens (creating when needed) the cache at `path`; an empty path keeps it in memory.
  [[nodiscard]] static common::Result<std::unique_ptr<EmbeddingCache>>
  open(const std::filesystem::path &path, std::size_t max_entries = 10'000);

  ~EmbeddingCache();

  EmbeddingCache(const EmbeddingCache &) = delete;
  EmbeddingCache &operator=(const EmbeddingCache &) = delete;

  [[nodiscard]] common::Result<std::optional<std::vector<float>>> get(const std::string &text);
  [[nodiscard]] common::Status put(const std::string &text, const std::vector<float> &embedding);

  [[nodiscard]] EmbeddingCacheStats stats() const;

private:
  EmbeddingCache(sqlite3 *db, std::size_t max_entries);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status evict_overflow();

  sqlite3 *db_ = nullptr;
  std::size_t max_entries_;
  mutable std::mutex mutex_;
  EmbeddingCacheStats stats_;
};

} // namespace drover::context
