#pragma once

#include "codebox/common/result.hpp"
#include "codebox/security/python_syntax.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace codebox::security {

struct SyntaxScreenPolicy {
  std::vector<NodeKind> forbidden_kinds;
  // Checked on Name nodes and on the object of an Attribute when that object is a Name.
  std::unordered_set<std::string> forbidden_names;
};

/// Import, ImportFrom, Global, Nonlocal, Lambda, AsyncFunctionDef, ClassDef and the
/// os/sys/subprocess/eval/exec/compile/__import__/open names.
[[nodiscard]] const SyntaxScreenPolicy &default_syntax_policy();

/// Parses the code and walks the tree breadth-first; the first violation rejects with
/// ValidationRejected. Unparseable code is rejected as "Invalid syntax: ...".
[[nodiscard]] common::Status screen_syntax(const std::string &code,
                                           const SyntaxScreenPolicy &policy = default_syntax_policy());

} // namespace codebox::security
