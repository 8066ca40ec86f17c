#include "drover/context/scorers.hpp"

#include "drover/observability/global.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_set>

namespace drover::context {

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (const char raw : text) {
    const auto ch = static_cast<unsigned char>(raw);
    if (std::isalnum(ch) != 0 || ch == '_' || ch >= 0x80) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0;
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }
  if (norm_a < 1e-12 || norm_b < 1e-12) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

ChunkScores Bm25Scorer::score(const std::vector<ConversationChunk> &chunks,
                              std::string_view query) const {
  ChunkScores scores;
  for (const auto &chunk : chunks) {
    scores[chunk.id] = 0.0;
  }
  const auto query_terms = tokenize(query);
  if (chunks.empty() || query_terms.empty()) {
    return scores;
  }

  std::vector<std::unordered_map<std::string, std::size_t>> term_counts(chunks.size());
  std::vector<std::size_t> lengths(chunks.size(), 0);
  std::unordered_map<std::string, std::size_t> document_frequency;
  double total_length = 0.0;

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const auto terms = tokenize(chunks[i].content);
    lengths[i] = terms.size();
    total_length += static_cast<double>(terms.size());
    for (const auto &term : terms) {
      ++term_counts[i][term];
    }
    for (const auto &[term, count] : term_counts[i]) {
      ++document_frequency[term];
    }
  }

  const double n = static_cast<double>(chunks.size());
  const double average_length = std::max(1.0, total_length / n);
  const std::unordered_set<std::string> unique_terms(query_terms.begin(), query_terms.end());

  double best = 0.0;
  std::vector<double> raw(chunks.size(), 0.0);
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    double sum = 0.0;
    for (const auto &term : unique_terms) {
      const auto tf_it = term_counts[i].find(term);
      if (tf_it == term_counts[i].end()) {
        continue;
      }
      const double df = static_cast<double>(document_frequency[term]);
      const double idf = std::log(1.0 + (n - df + 0.5) / (df + 0.5));
      const double tf = static_cast<double>(tf_it->second);
      const double norm = 1.0 - b_ + b_ * static_cast<double>(lengths[i]) / average_length;
      sum += idf * (tf * (k1_ + 1.0)) / (tf + k1_ * norm);
    }
    raw[i] = sum;
    best = std::max(best, sum);
  }

  if (best <= 0.0) {
    return scores;
  }
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    scores[chunks[i].id] = raw[i] / best;
  }
  return scores;
}

ChunkScores RecencyScorer::score(const std::vector<ConversationChunk> &chunks,
                                 const std::int64_t now_ms) const {
  ChunkScores scores;
  const double half_life = static_cast<double>(std::max<std::uint64_t>(1, half_life_ms_));
  for (const auto &chunk : chunks) {
    const double age = static_cast<double>(std::max<std::int64_t>(0, now_ms - chunk.timestamp_ms));
    scores[chunk.id] = std::exp(-std::log(2.0) * age / half_life);
  }
  return scores;
}

EmbeddingScorer::EmbeddingScorer(providers::ContentGenerator &generator, EmbeddingCache *cache)
    : generator_(generator), cache_(cache) {}

common::Result<std::vector<float>> EmbeddingScorer::embedding_for(const std::string &text) {
  if (cache_ != nullptr) {
    auto cached = cache_->get(text);
    if (cached.ok() && cached.value().has_value()) {
      return common::Result<std::vector<float>>::success(*cached.value());
    }
    if (!cached.ok()) {
      observability::log_warn("context", "embedding cache read failed: " + cached.error());
    }
  }

  ++embed_calls_;
  auto embedded = generator_.embed(text);
  if (!embedded.ok()) {
    return embedded;
  }
  if (cache_ != nullptr) {
    auto stored = cache_->put(text, embedded.value());
    if (!stored.ok()) {
      observability::log_warn("context", "embedding cache write failed: " + stored.error());
    }
  }
  return embedded;
}

ChunkScores EmbeddingScorer::score(const std::vector<ConversationChunk> &chunks,
                                   std::string_view query) {
  ChunkScores scores;
  for (const auto &chunk : chunks) {
    scores[chunk.id] = 0.0;
  }
  if (chunks.empty()) {
    return scores;
  }

  auto query_embedding = embedding_for(std::string(query));
  if (!query_embedding.ok()) {
    observability::log_debug("context", "query embedding unavailable: " + query_embedding.error());
    return scores;
  }

  for (const auto &chunk : chunks) {
    auto chunk_embedding = embedding_for(chunk.content);
    if (!chunk_embedding.ok()) {
      continue;
    }
    const double similarity = cosine_similarity(query_embedding.value(), chunk_embedding.value());
    scores[chunk.id] = std::clamp(similarity, 0.0, 1.0);
  }
  return scores;
}

} // namespace drover::context
