#include "codebox/security/syntax_screen.hpp"

#include <algorithm>
#include <exception>

namespace codebox::security {

const SyntaxScreenPolicy &default_syntax_policy() {
  static const SyntaxScreenPolicy policy{
      .forbidden_kinds = {NodeKind::Import, NodeKind::ImportFrom, NodeKind::Global,
                          NodeKind::Nonlocal, NodeKind::Lambda, NodeKind::AsyncFunctionDef,
                          NodeKind::ClassDef},
      .forbidden_names = {"os", "sys", "subprocess", "eval", "exec", "compile", "__import__",
                          "open"},
  };
  return policy;
}

common::Status screen_syntax(const std::string &code, const SyntaxScreenPolicy &policy) {
  try {
    auto tree = parse_python(code);
    if (!tree.ok()) {
      return common::Status::error("Invalid syntax: " + tree.error(),
                                   common::ErrorCode::ValidationRejected);
    }

    std::string violation;
    walk_syntax(*tree.value().root, [&](const SyntaxNode &node) {
      if (std::find(policy.forbidden_kinds.begin(), policy.forbidden_kinds.end(), node.kind) !=
          policy.forbidden_kinds.end()) {
        violation = "Forbidden construct: " + std::string(node_kind_name(node.kind));
        return false;
      }
      if (node.kind == NodeKind::Name && policy.forbidden_names.contains(node.value)) {
        violation = "Forbidden name: " + node.value;
        return false;
      }
      if (node.kind == NodeKind::Attribute && !node.children.empty()) {
        const SyntaxNode &object = *node.children.front();
        if (object.kind == NodeKind::Name && policy.forbidden_names.contains(object.value)) {
          violation = "Forbidden attribute: " + object.value + "." + node.value;
          return false;
        }
      }
      return true;
    });

    if (!violation.empty()) {
      return common::Status::error(violation, common::ErrorCode::ValidationRejected);
    }
  } catch (const std::exception &err) {
    return common::Status::error(std::string("syntax screen failed: ") + err.what(),
                                 common::ErrorCode::ValidationRejected);
  }
  return common::Status::success();
}

} // namespace codebox::security
