#pragma once

#include "codebox/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codebox::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_string(const std::string &value);

/// Unescape the body of a JSON string literal, including \uXXXX sequences.
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

struct JsonValue {
  enum class Kind { String, Number, Bool, Null, Object, Array };

  Kind kind = Kind::Null;
  // Unescaped text for strings, raw source text for everything else.
  std::string text;

  [[nodiscard]] bool is_string() const { return kind == Kind::String; }
  [[nodiscard]] std::optional<bool> as_bool() const;
};

using JsonObject = std::unordered_map<std::string, JsonValue>;

/// Parse the top level of a JSON object. Nested values are kept as raw text.
[[nodiscard]] Result<JsonObject> json_parse_object(const std::string &json);

/// String member of an object, std::nullopt when absent or not a string.
[[nodiscard]] std::optional<std::string> json_member_string(const JsonObject &object,
                                                            const std::string &key);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace codebox::common
