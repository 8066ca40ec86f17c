#pragma once

#include "drover/common/cancellation.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace drover::providers {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HttpHeaders headers;
  bool timeout = false;
  bool network_error = false;
  bool cancelled = false;
  std::string network_error_message;
};

/// Receives raw body bytes as they arrive.
using StreamChunkCallback = std::function<void(std::string_view)>;

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;

  /// Like post_json but delivers the body incrementally. A cancelled token aborts
  /// the transfer and sets `cancelled` on the response.
  [[nodiscard]] virtual HttpResponse
  post_json_stream(const std::string &url, const HttpHeaders &headers, const std::string &body,
                   std::uint64_t timeout_ms, const StreamChunkCallback &on_chunk,
                   const common::CancellationToken &cancel) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;

  [[nodiscard]] HttpResponse post_json_stream(const std::string &url, const HttpHeaders &headers,
                                              const std::string &body, std::uint64_t timeout_ms,
                                              const StreamChunkCallback &on_chunk,
                                              const common::CancellationToken &cancel) override;
};

} // namespace drover::providers
