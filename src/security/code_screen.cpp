#include "codebox/security/code_screen.hpp"

#include <cstdint>
#include <regex>

namespace codebox::security {

namespace {

struct CompiledRule {
  std::string label;
  std::regex regex;
};

const std::vector<CompiledRule> &compiled_rules() {
  static const std::vector<CompiledRule> rules = [] {
    std::vector<CompiledRule> out;
    out.reserve(deny_rules().size());
    for (const auto &rule : deny_rules()) {
      out.push_back(CompiledRule{
          .label = rule.label,
          .regex = std::regex(rule.pattern, std::regex::ECMAScript | std::regex::icase),
      });
    }
    return out;
  }();
  return rules;
}

std::size_t utf8_sequence_length(const unsigned char lead) {
  if ((lead & 0xE0U) == 0xC0U) {
    return 2;
  }
  if ((lead & 0xF0U) == 0xE0U) {
    return 3;
  }
  if ((lead & 0xF8U) == 0xF0U) {
    return 4;
  }
  return 1;
}

bool is_screen_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

void append_folded(std::string &output, const char ch) {
  if (is_screen_space(ch)) {
    if (output.empty() || output.back() != ' ') {
      output.push_back(' ');
    }
    return;
  }
  output.push_back(ch);
}

common::Status check_screen_size(const std::string &code) {
  if (code.size() > kMaxScreenedBytes) {
    return common::Status::error("code exceeds " + std::to_string(kMaxScreenedBytes) +
                                     " bytes and cannot be screened",
                                 common::ErrorCode::ValidationRejected);
  }
  return common::Status::success();
}

} // namespace

const std::vector<DenyRule> &deny_rules() {
  static const std::vector<DenyRule> rules = {
      {"os.system", R"(\bos\.system\s*\()"},
      {"subprocess", R"(\bsubprocess\s*\.\s*)"},
      {"exec", R"(\bexec\s*\()"},
      {"eval", R"(\beval\s*\()"},
      {"__import__", R"(__import__\s*\()"},
      {"open absolute path", R"(open\s*\(\s*['"]/)"},
      {"rm -rf", R"(rm\s+-rf)"},
      {"rm -r /", R"(rm\s+-r\s+/)"},
      {"import os", R"(\bimport\s+os\b)"},
      {"import subprocess", R"(\bimport\s+subprocess\b)"},
      {"import sys", R"(\bimport\s+sys\b)"},
      {"from os|subprocess|sys import", R"(\bfrom\s+(os|subprocess|sys)\b[\w.]{0,256}\s+import\b)"},
      {"__builtins__", R"(__builtins__)"},
      {"breakpoint", R"(breakpoint\s*\()"},
      {"compile", R"(compile\s*\()"},
  };
  return rules;
}

std::string normalize_for_screen(const std::string &code) {
  std::string output;
  output.reserve(code.size());

  std::size_t index = 0;
  while (index < code.size()) {
    const auto lead = static_cast<unsigned char>(code[index]);
    const std::size_t length = utf8_sequence_length(lead);
    if (length == 3 && index + 2 < code.size()) {
      const auto b1 = static_cast<unsigned char>(code[index + 1]);
      const auto b2 = static_cast<unsigned char>(code[index + 2]);
      const std::uint32_t cp = ((lead & 0x0FU) << 12U) | ((b1 & 0x3FU) << 6U) | (b2 & 0x3FU);
      if (cp >= 0xFF01U && cp <= 0xFF5EU) {
        append_folded(output, static_cast<char>(cp - 0xFEE0U));
        index += 3;
        continue;
      }
      if (cp == 0x3000U) {
        append_folded(output, ' ');
        index += 3;
        continue;
      }
    }
    if (length == 1) {
      append_folded(output, code[index]);
      ++index;
      continue;
    }
    const std::size_t take = index + length <= code.size() ? length : code.size() - index;
    output.append(code, index, take);
    index += take;
  }
  return output;
}

std::vector<std::string> match_dangerous_patterns(const std::string &code) {
  std::vector<std::string> matches;
  if (!check_screen_size(code).ok()) {
    matches.emplace_back("size limit");
    return matches;
  }
  const std::string normalized = normalize_for_screen(code);
  for (const auto &rule : compiled_rules()) {
    if (std::regex_search(normalized, rule.regex)) {
      matches.push_back(rule.label);
    }
  }
  return matches;
}

common::Status screen_patterns(const std::string &code) {
  if (auto size = check_screen_size(code); !size.ok()) {
    return size;
  }
  try {
    const std::string normalized = normalize_for_screen(code);
    for (const auto &rule : compiled_rules()) {
      if (std::regex_search(normalized, rule.regex)) {
        return common::Status::error("code matches forbidden pattern: " + rule.label,
                                     common::ErrorCode::ValidationRejected);
      }
    }
  } catch (const std::regex_error &err) {
    return common::Status::error(std::string("pattern screen failed: ") + err.what(),
                                 common::ErrorCode::ValidationRejected);
  }
  return common::Status::success();
}

} // namespace codebox::security
