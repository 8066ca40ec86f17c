#include "drover/common/toml.hpp"

#include "drover/common/fs.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace drover::common {

namespace {

// Removes a trailing comment, respecting basic and literal strings.
std::string strip_comment(const std::string &line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote != '\0') {
      if (ch == '\\' && quote == '"') {
        ++i;
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

int bracket_balance(const std::string &text) {
  int depth = 0;
  char quote = '\0';
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (quote != '\0') {
      if (ch == '\\' && quote == '"') {
        ++i;
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
  }
  return depth;
}

std::string decode_string(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2) {
    return value;
  }
  if (value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    char ch = value[i];
    if (ch == '\\' && i + 2 < value.size()) {
      ch = value[++i];
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      default:
        out.push_back(ch);
        break;
      }
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

std::vector<std::string> split_array(const std::string &body) {
  std::vector<std::string> out;
  std::string current;
  char quote = '\0';
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (quote != '\0') {
      current.push_back(ch);
      if (ch == '\\' && quote == '"' && i + 1 < body.size()) {
        current.push_back(body[++i]);
      } else if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      current.push_back(ch);
    } else if (ch == ',') {
      out.push_back(trim(current));
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  if (!trim(current).empty()) {
    out.push_back(trim(current));
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : decode_string(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::int64_t TomlDocument::get_int(const std::string &key, std::int64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  std::string digits;
  for (const char ch : trim(it->second)) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::int64_t parsed = 0;
  const char *last = digits.data() + digits.size();
  auto [ptr, ec] = std::from_chars(digits.data(), last, parsed);
  return (ec != std::errc() || ptr != last) ? fallback : parsed;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const std::int64_t parsed = get_int(key, -1);
  if (!has(key) || parsed < 0) {
    return fallback;
  }
  return static_cast<std::uint64_t>(parsed);
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string text = trim(it->second);
  if (text.empty()) {
    return fallback;
  }
  errno = 0;
  char *end = nullptr;
  const double parsed = std::strtod(text.c_str(), &end);
  if (errno != 0 || end != text.c_str() + text.size()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }
  std::vector<std::string> out;
  for (const auto &element : split_array(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      out.push_back(decode_string(element));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string table;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[' && clean.back() == ']' && clean.find('=') == std::string::npos) {
      table = trim(clean.substr(1, clean.size() - 2));
      if (table.empty()) {
        return Result<TomlDocument>::failure("Empty table name at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure("Expected key = value at line " +
                                           std::to_string(line_number));
    }
    const std::string key = trim(clean.substr(0, equals));
    std::string value = trim(clean.substr(equals + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number));
    }

    // Arrays may continue over several lines.
    const std::size_t start_line = line_number;
    while (bracket_balance(value) > 0) {
      std::string next;
      if (!std::getline(stream, next)) {
        return Result<TomlDocument>::failure("Unterminated array starting at line " +
                                             std::to_string(start_line));
      }
      ++line_number;
      value += " " + trim(strip_comment(next));
    }

    const std::string full_key = table.empty() ? key : table + "." + key;
    if (document.values.contains(full_key)) {
      return Result<TomlDocument>::failure("Duplicate key '" + full_key + "' at line " +
                                           std::to_string(start_line));
    }
    document.values.emplace(full_key, value);
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  out.push_back('"');
  return out;
}

} // namespace drover::common
