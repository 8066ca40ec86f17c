#include "drover/providers/factory.hpp"

#include "drover/providers/compatible.hpp"
#include "drover/providers/reliable.hpp"

namespace drover::providers {

std::shared_ptr<ContentGenerator> create_generator(const config::ProviderConfig &config,
                                                   std::shared_ptr<HttpClient> http_client) {
  if (!http_client) {
    http_client = std::make_shared<CurlHttpClient>();
  }
  auto compatible = std::make_shared<CompatibleGenerator>(
      CompatibleGeneratorOptions{.base_url = config.base_url,
                                 .api_key = config.api_key.value_or(""),
                                 .model = config.model,
                                 .embedding_model = config.embedding_model,
                                 .timeout_ms = config.timeout_ms},
      std::move(http_client));
  return std::make_shared<ReliableGenerator>(std::move(compatible), config.max_retries,
                                             config.backoff_ms);
}

} // namespace drover::providers
