#include "drover/common/json_util.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace drover::common {

namespace {

void append_utf8(std::string &out, unsigned int cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::optional<unsigned int> parse_hex4(std::string_view raw, std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  unsigned int value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<unsigned int>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<unsigned int>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<unsigned int>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

std::size_t string_end(std::string_view json, std::size_t quote_pos) {
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
    } else if (json[i] == '"') {
      return i;
    }
  }
  return std::string_view::npos;
}

std::string_view strip(std::string_view raw) {
  std::size_t first = json_skip_ws(raw, 0);
  std::size_t last = raw.size();
  while (last > first && std::isspace(static_cast<unsigned char>(raw[last - 1])) != 0) {
    --last;
  }
  return raw.substr(first, last - first);
}

} // namespace

std::string json_escape(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(std::string_view value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto cp = parse_hex4(raw, i + 1);
      if (!cp.has_value()) {
        out.push_back('u');
        break;
      }
      i += 4;
      unsigned int code = *cp;
      // Surrogate pair.
      if (code >= 0xD800 && code <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        if (auto low = parse_hex4(raw, i + 3); low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(std::string_view text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_value_end(std::string_view json, std::size_t pos) {
  pos = json_skip_ws(json, pos);
  if (pos >= json.size()) {
    return std::string_view::npos;
  }
  const char first = json[pos];
  if (first == '"') {
    const auto end = string_end(json, pos);
    return end == std::string_view::npos ? end : end + 1;
  }
  if (first == '{' || first == '[') {
    std::size_t depth = 0;
    for (std::size_t i = pos; i < json.size(); ++i) {
      const char ch = json[i];
      if (ch == '"') {
        i = string_end(json, i);
        if (i == std::string_view::npos) {
          return i;
        }
      } else if (ch == '{' || ch == '[') {
        ++depth;
      } else if (ch == '}' || ch == ']') {
        if (--depth == 0) {
          return i + 1;
        }
      }
    }
    return std::string_view::npos;
  }
  std::size_t i = pos;
  while (i < json.size() && json[i] != ',' && json[i] != '}' && json[i] != ']' &&
         std::isspace(static_cast<unsigned char>(json[i])) == 0) {
    ++i;
  }
  return i == pos ? std::string_view::npos : i;
}

JsonKind json_kind(std::string_view raw) {
  raw = strip(raw);
  if (raw.empty()) {
    return JsonKind::Invalid;
  }
  switch (raw.front()) {
  case '"':
    return JsonKind::String;
  case '{':
    return JsonKind::Object;
  case '[':
    return JsonKind::Array;
  default:
    break;
  }
  if (raw == "true" || raw == "false") {
    return JsonKind::Boolean;
  }
  if (raw == "null") {
    return JsonKind::Null;
  }
  return json_as_number(raw).has_value() ? JsonKind::Number : JsonKind::Invalid;
}

std::optional<JsonFields> json_object_fields(std::string_view json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::nullopt;
  }
  JsonFields fields;
  ++pos;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      return std::nullopt;
    }
    if (json[pos] == '}') {
      return fields;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      return std::nullopt;
    }
    const auto key_end = string_end(json, pos);
    if (key_end == std::string_view::npos) {
      return std::nullopt;
    }
    std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return std::nullopt;
    }
    const std::size_t value_start = json_skip_ws(json, pos + 1);
    const std::size_t value_end = json_value_end(json, value_start);
    if (value_end == std::string_view::npos) {
      return std::nullopt;
    }
    fields.emplace_back(std::move(key),
                        std::string(json.substr(value_start, value_end - value_start)));
    pos = value_end;
  }
}

std::optional<std::string> json_field(std::string_view json, std::string_view key) {
  auto fields = json_object_fields(json);
  if (!fields.has_value()) {
    return std::nullopt;
  }
  for (auto &[name, raw] : *fields) {
    if (name == key) {
      return std::move(raw);
    }
  }
  return std::nullopt;
}

std::vector<std::string> json_array_items(std::string_view raw) {
  std::vector<std::string> items;
  std::size_t pos = json_skip_ws(raw, 0);
  if (pos >= raw.size() || raw[pos] != '[') {
    return items;
  }
  ++pos;
  while (true) {
    pos = json_skip_ws(raw, pos);
    if (pos >= raw.size() || raw[pos] == ']') {
      break;
    }
    if (raw[pos] == ',') {
      ++pos;
      continue;
    }
    const std::size_t end = json_value_end(raw, pos);
    if (end == std::string_view::npos) {
      break;
    }
    items.emplace_back(raw.substr(pos, end - pos));
    pos = end;
  }
  return items;
}

std::optional<std::string> json_as_string(std::string_view raw) {
  raw = strip(raw);
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return std::nullopt;
  }
  return json_unescape(raw.substr(1, raw.size() - 2));
}

std::optional<double> json_as_number(std::string_view raw) {
  const std::string text(strip(raw));
  if (text.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::string json_get_string(std::string_view json, std::string_view key) {
  const auto raw = json_field(json, key);
  if (!raw.has_value()) {
    return "";
  }
  return json_as_string(*raw).value_or("");
}

std::optional<double> json_get_number(std::string_view json, std::string_view key) {
  const auto raw = json_field(json, key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return json_as_number(*raw);
}

std::string json_object_from_raw(const std::map<std::string, std::string> &members) {
  std::string out = "{";
  bool first = true;
  for (const auto &[key, raw] : members) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    out += json_quote(key);
    out.push_back(':');
    out += std::string(strip(raw));
  }
  out.push_back('}');
  return out;
}

} // namespace drover::common
