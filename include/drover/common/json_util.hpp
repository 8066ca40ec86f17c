#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace drover::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(std::string_view value);

/// Decode the body of a JSON string literal (without the quotes), including \uXXXX.
[[nodiscard]] std::string json_unescape(std::string_view raw);

[[nodiscard]] std::size_t json_skip_ws(std::string_view text, std::size_t pos);

/// Position one past the end of the JSON value starting at `pos`, or npos if malformed.
[[nodiscard]] std::size_t json_value_end(std::string_view json, std::size_t pos);

enum class JsonKind { String, Number, Boolean, Null, Object, Array, Invalid };

[[nodiscard]] JsonKind json_kind(std::string_view raw);

/// Top-level members of an object as (key, raw value) pairs in document order.
using JsonFields = std::vector<std::pair<std::string, std::string>>;
[[nodiscard]] std::optional<JsonFields> json_object_fields(std::string_view json);

/// Raw text of a top-level member, e.g. `"abc"`, `12`, `{...}`.
[[nodiscard]] std::optional<std::string> json_field(std::string_view json, std::string_view key);

/// Raw elements of an array value.
[[nodiscard]] std::vector<std::string> json_array_items(std::string_view raw);

[[nodiscard]] std::optional<std::string> json_as_string(std::string_view raw);
[[nodiscard]] std::optional<double> json_as_number(std::string_view raw);

/// Shorthands for reading a member of a known type; empty/fallback when absent.
[[nodiscard]] std::string json_get_string(std::string_view json, std::string_view key);
[[nodiscard]] std::optional<double> json_get_number(std::string_view json, std::string_view key);

/// Serializes an object whose values are already raw JSON. Keys come out sorted,
/// which gives a canonical encoding for equal argument sets.
[[nodiscard]] std::string json_object_from_raw(const std::map<std::string, std::string> &members);

} // namespace drover::common
