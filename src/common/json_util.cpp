#include "codebox/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace codebox::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

std::optional<std::uint32_t> parse_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4U;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

bool is_literal_char(const char ch) {
  return ch != ',' && ch != '}' && ch != ']' && std::isspace(static_cast<unsigned char>(ch)) == 0;
}

} // namespace

std::string json_escape(const std::string &value) {
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
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_string(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
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
      std::uint32_t value = *cp;
      // Surrogate pair.
      if (value >= 0xD800U && value <= 0xDBFFU && i + 6 < raw.size() + 0 && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        if (auto low = parse_hex4(raw, i + 3); low.has_value() && *low >= 0xDC00U &&
                                               *low <= 0xDFFFU) {
          value = 0x10000U + ((value - 0xD800U) << 10U) + (*low - 0xDC00U);
          i += 6;
        }
      }
      append_utf8(out, value);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::optional<bool> JsonValue::as_bool() const {
  if (kind != Kind::Bool) {
    return std::nullopt;
  }
  return text == "true";
}

Result<JsonObject> json_parse_object(const std::string &json) {
  JsonObject result;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return Result<JsonObject>::failure("expected JSON object", ErrorCode::InvalidArgument);
  }
  const auto object_end = json_find_matching_token(json, pos, '{', '}');
  if (object_end == std::string::npos || json_skip_ws(json, object_end + 1) != json.size()) {
    return Result<JsonObject>::failure("malformed JSON object", ErrorCode::InvalidArgument);
  }

  ++pos;
  bool expect_member = true;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= object_end) {
      break;
    }
    if (json[pos] == ',' && !expect_member) {
      expect_member = true;
      ++pos;
      continue;
    }
    if (json[pos] != '"' || !expect_member) {
      return Result<JsonObject>::failure("expected member name at offset " + std::to_string(pos),
                                         ErrorCode::InvalidArgument);
    }

    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos || key_end >= object_end) {
      return Result<JsonObject>::failure("unterminated member name", ErrorCode::InvalidArgument);
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= object_end || json[pos] != ':') {
      return Result<JsonObject>::failure("expected ':' after \"" + key + "\"",
                                         ErrorCode::InvalidArgument);
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= object_end) {
      return Result<JsonObject>::failure("missing value for \"" + key + "\"",
                                         ErrorCode::InvalidArgument);
    }

    JsonValue value;
    const char lead = json[pos];
    if (lead == '"') {
      const auto end = json_find_string_end(json, pos);
      if (end == std::string::npos || end >= object_end) {
        return Result<JsonObject>::failure("unterminated string", ErrorCode::InvalidArgument);
      }
      value.kind = JsonValue::Kind::String;
      value.text = json_unescape(json.substr(pos + 1, end - pos - 1));
      pos = end + 1;
    } else if (lead == '{' || lead == '[') {
      const char close = lead == '{' ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, lead, close);
      if (end == std::string::npos || end >= object_end) {
        return Result<JsonObject>::failure("unbalanced nested value", ErrorCode::InvalidArgument);
      }
      value.kind = lead == '{' ? JsonValue::Kind::Object : JsonValue::Kind::Array;
      value.text = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t start = pos;
      while (pos < object_end && is_literal_char(json[pos])) {
        ++pos;
      }
      value.text = json.substr(start, pos - start);
      if (value.text == "true" || value.text == "false") {
        value.kind = JsonValue::Kind::Bool;
      } else if (value.text == "null") {
        value.kind = JsonValue::Kind::Null;
      } else if (!value.text.empty() &&
                 (std::isdigit(static_cast<unsigned char>(value.text.front())) != 0 ||
                  value.text.front() == '-')) {
        value.kind = JsonValue::Kind::Number;
      } else {
        return Result<JsonObject>::failure("invalid literal '" + value.text + "'",
                                           ErrorCode::InvalidArgument);
      }
    }

    result[key] = std::move(value);
    expect_member = false;
  }

  if (expect_member && !result.empty()) {
    return Result<JsonObject>::failure("trailing comma in object", ErrorCode::InvalidArgument);
  }
  return Result<JsonObject>::success(std::move(result));
}

std::optional<std::string> json_member_string(const JsonObject &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->second.is_string()) {
    return std::nullopt;
  }
  return it->second.text;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

} // namespace codebox::common
