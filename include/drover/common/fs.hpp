#pragma once

#include "drover/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace drover::common {

[[nodiscard]] std::string trim(std::string_view input);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);

/// Expands a leading `~` and `$VAR` / `${VAR}` references.
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);
[[nodiscard]] Status write_text_file(const std::filesystem::path &path, std::string_view content);

/// Shell-style glob with `*` and `?`, matched case-insensitively.
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view value);

} // namespace drover::common
