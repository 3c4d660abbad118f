#pragma once

#include "codebox/common/result.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace codebox::security {

enum class PyTokenType { Name, Number, String, Op, Newline, Indent, Dedent, EndMarker };

struct PyToken {
  PyTokenType type = PyTokenType::EndMarker;
  std::string text;
  int line = 0;
  // String tokens only: lowercase prefix and the text between the quotes.
  std::string prefix;
  std::string body;
};

/// Node kinds, named after the classes of Python's own `ast` module.
enum class NodeKind {
  Module,
  FunctionDef,
  AsyncFunctionDef,
  ClassDef,
  Return,
  Delete,
  Assign,
  AugAssign,
  AnnAssign,
  For,
  AsyncFor,
  While,
  If,
  With,
  AsyncWith,
  Raise,
  Try,
  TryStar,
  Assert,
  Import,
  ImportFrom,
  Global,
  Nonlocal,
  Expr,
  Pass,
  Break,
  Continue,
  BoolOp,
  NamedExpr,
  BinOp,
  UnaryOp,
  Lambda,
  IfExp,
  Dict,
  Set,
  ListComp,
  SetComp,
  DictComp,
  GeneratorExp,
  Await,
  Yield,
  YieldFrom,
  Compare,
  Call,
  FormattedValue,
  JoinedStr,
  Constant,
  Attribute,
  Subscript,
  Starred,
  Name,
  List,
  Tuple,
  Slice,
  Comprehension,
  ExceptHandler,
  Arguments,
  Arg,
  Keyword,
  Alias,
  WithItem,
};

[[nodiscard]] std::string_view node_kind_name(NodeKind kind);

struct SyntaxNode {
  NodeKind kind = NodeKind::Module;
  int line = 0;
  // Identifier for Name/Arg/Keyword/Alias and definitions, attribute name for Attribute,
  // operator for operator nodes, literal text for Constant.
  std::string value;
  std::vector<std::unique_ptr<SyntaxNode>> children;
};

struct SyntaxTree {
  std::unique_ptr<SyntaxNode> root;
};

[[nodiscard]] bool is_python_keyword(std::string_view word);

[[nodiscard]] common::Result<std::vector<PyToken>> tokenize_python(const std::string &source);

/// Parses a Python 3 module. `match` statements are reported as unsupported.
/// Failures carry InvalidArgument and a message ending in "(line N)".
[[nodiscard]] common::Result<SyntaxTree> parse_python(const std::string &source);

/// Breadth-first walk over every node, parent before children.
/// The visitor returns false to stop the walk early.
void walk_syntax(const SyntaxNode &root, const std::function<bool(const SyntaxNode &)> &visit);

} // namespace codebox::security
