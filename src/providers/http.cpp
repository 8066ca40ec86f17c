#include "drover/providers/http.hpp"

#include "drover/common/fs.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>
#include <mutex>

namespace drover::providers {

namespace {

constexpr const char *kUserAgent = "drover/0.1";

struct TransferContext {
  HttpResponse *response = nullptr;
  const StreamChunkCallback *on_chunk = nullptr;
  const common::CancellationToken *cancel = nullptr;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<TransferContext *>(userdata);
  if (context->on_chunk != nullptr && *context->on_chunk) {
    // Error bodies are kept whole so the status mapping can report them.
    if (context->response->status == 0 || context->response->status < 400) {
      (*context->on_chunk)(std::string_view(ptr, total));
    } else {
      context->response->body.append(ptr, total);
    }
  } else {
    context->response->body.append(ptr, total);
  }
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  auto *context = static_cast<TransferContext *>(userdata);
  const std::string_view line(buffer, total);

  if (line.rfind("HTTP/", 0) == 0) {
    const auto space = line.find(' ');
    if (space != std::string_view::npos && space + 4 <= line.size()) {
      const std::string code(line.substr(space + 1, 3));
      context->response->status = static_cast<std::uint16_t>(std::strtoul(code.c_str(), nullptr, 10));
    }
    return total;
  }

  const auto separator = line.find(':');
  if (separator != std::string_view::npos) {
    context->response->headers[common::to_lower(common::trim(line.substr(0, separator)))] =
        common::trim(line.substr(separator + 1));
  }
  return total;
}

int progress_callback(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto *context = static_cast<TransferContext *>(userdata);
  if (context->cancel != nullptr && context->cancel->cancelled()) {
    context->response->cancelled = true;
    return 1;
  }
  return 0;
}

void ensure_global_init() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse perform(const std::string &url, const HttpHeaders &headers, const std::string &body,
                     const std::uint64_t timeout_ms, const StreamChunkCallback *on_chunk,
                     const common::CancellationToken *cancel) {
  HttpResponse response;
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  TransferContext context{.response = &response, .on_chunk = on_chunk, .cancel = cancel};
  CURL *handle = curl.get();
  curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(handle, CURLOPT_HEADERDATA, &context);
  curl_easy_setopt(handle, CURLOPT_POST, 1L);
  curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  if (cancel != nullptr) {
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &context);
  }

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(nullptr,
                                                                         &curl_slist_free_all);
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list.reset(curl_slist_append(header_list.release(), line.c_str()));
  }
  if (header_list) {
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
  }

  const CURLcode code = curl_easy_perform(handle);
  if (code == CURLE_ABORTED_BY_CALLBACK && response.cancelled) {
    return response;
  }
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    return response;
  }
  long status = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() { ensure_global_init(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return perform(url, headers, body, timeout_ms, nullptr, nullptr);
}

HttpResponse CurlHttpClient::post_json_stream(const std::string &url, const HttpHeaders &headers,
                                              const std::string &body,
                                              const std::uint64_t timeout_ms,
                                              const StreamChunkCallback &on_chunk,
                                              const common::CancellationToken &cancel) {
  return perform(url, headers, body, timeout_ms, &on_chunk, &cancel);
}

} // namespace drover::providers
