#pragma once

#include "drover/providers/content.hpp"
#include "drover/providers/http.hpp"

#include <map>
#include <memory>
#include <string>

namespace drover::providers {

/// Incremental decoder for OpenAI-style `chat.completion.chunk` server-sent events.
/// Text deltas are forwarded immediately; tool-call fragments are assembled by
/// index and emitted by finish().
class SseStreamDecoder {
public:
  explicit SseStreamDecoder(StreamEventCallback on_event);

  void feed(std::string_view bytes);
  [[nodiscard]] GenerateSummary finish();

  [[nodiscard]] bool emitted_output() const { return emitted_output_; }
  [[nodiscard]] bool saw_done() const { return saw_done_; }
  [[nodiscard]] const std::string &stream_error() const { return stream_error_; }

private:
  struct PartialCall {
    std::string id;
    std::string name;
    std::string arguments;
  };

  void handle_event(const std::string &data);
  void handle_tool_call_delta(const std::string &raw);

  StreamEventCallback on_event_;
  std::string line_buffer_;
  std::string event_data_;
  std::map<int, PartialCall> partial_calls_;
  GenerateSummary summary_;
  bool emitted_output_ = false;
  bool saw_done_ = false;
  std::string stream_error_;
};

struct CompatibleGeneratorOptions {
  std::string base_url;
  std::string api_key;
  std::string model;
  std::string embedding_model;
  std::uint64_t timeout_ms = 120'000;
};

/// Content generator for any OpenAI-compatible `/chat/completions` endpoint.
class CompatibleGenerator final : public ContentGenerator {
public:
  CompatibleGenerator(CompatibleGeneratorOptions options, std::shared_ptr<HttpClient> http_client);

  [[nodiscard]] GenerateResult generate_stream(const GenerateRequest &request,
                                               const StreamEventCallback &on_event,
                                               const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Result<std::vector<float>> embed(const std::string &text) override;
  [[nodiscard]] std::string name() const override { return "compatible"; }

  [[nodiscard]] std::string build_body(const GenerateRequest &request) const;
  [[nodiscard]] static std::optional<GeneratorError> map_status(const HttpResponse &response);

private:
  [[nodiscard]] HttpHeaders headers() const;

  CompatibleGeneratorOptions options_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace drover::providers
