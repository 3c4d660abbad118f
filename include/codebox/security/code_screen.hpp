#pragma once

#include "codebox/common/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace codebox::security {

// Longer submissions are rejected without being scanned.
constexpr std::size_t kMaxScreenedBytes = 1024 * 1024;

struct DenyRule {
  const char *label;
  // ECMAScript regex, matched case-insensitively.
  const char *pattern;
};

/// The denylist applied by the pattern screen, in evaluation order.
[[nodiscard]] const std::vector<DenyRule> &deny_rules();

/// Folds fullwidth ASCII forms to ASCII so "ｅｖａｌ(" screens like "eval(", and collapses
/// every whitespace run to one space. Rules only use `\s*` and `\s+` for whitespace.
[[nodiscard]] std::string normalize_for_screen(const std::string &code);

/// Labels of every rule the code matches, in table order.
[[nodiscard]] std::vector<std::string> match_dangerous_patterns(const std::string &code);

/// Rejects with ValidationRejected on the first matching rule. Oversized code and regex engine
/// failures reject too.
[[nodiscard]] common::Status screen_patterns(const std::string &code);

} // namespace codebox::security
