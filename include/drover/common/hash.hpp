#pragma once

#include <string>
#include <string_view>

namespace drover::common {

/// Lower-case hex SHA-256 digest.
[[nodiscard]] std::string sha256_hex(std::string_view data);

/// Random hex identifier with `bytes` bytes of entropy, optionally prefixed.
[[nodiscard]] std::string random_id(std::string_view prefix = "", std::size_t bytes = 8);

} // namespace drover::common
