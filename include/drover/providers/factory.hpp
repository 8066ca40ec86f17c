#pragma once

#include "drover/config/schema.hpp"
#include "drover/providers/content.hpp"
#include "drover/providers/http.hpp"

#include <memory>

namespace drover::providers {

/// OpenAI-compatible generator wrapped in retry handling.
[[nodiscard]] std::shared_ptr<ContentGenerator>
create_generator(const config::ProviderConfig &config,
                 std::shared_ptr<HttpClient> http_client = nullptr);

} // namespace drover::providers
