#include "test_framework.hpp"

#include "codebox/security/python_syntax.hpp"
#include "codebox/security/syntax_screen.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace {

namespace sec = codebox::security;

std::vector<sec::NodeKind> kinds_of(const std::string &source) {
  auto tree = sec::parse_python(source);
  if (!tree.ok()) {
    throw std::runtime_error("parse failed: " + tree.error());
  }
  std::vector<sec::NodeKind> kinds;
  sec::walk_syntax(*tree.value().root, [&](const sec::SyntaxNode &node) {
    kinds.push_back(node.kind);
    return true;
  });
  return kinds;
}

bool contains(const std::vector<sec::NodeKind> &kinds, const sec::NodeKind kind) {
  return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

} // namespace

void register_python_syntax_tests(std::vector<codebox::tests::TestCase> &tests) {
  using codebox::tests::require;

  tests.push_back({"python_tokenizer_emits_indent_and_dedent", [] {
                     const auto tokens = sec::tokenize_python("if x:\n    y = 1\nz = 2\n");
                     require(tokens.ok(), tokens.error());
                     const auto &list = tokens.value();
                     const auto count = [&](sec::PyTokenType type) {
                       return std::count_if(list.begin(), list.end(),
                                            [&](const auto &t) { return t.type == type; });
                     };
                     require(count(sec::PyTokenType::Indent) == 1, "one indent");
                     require(count(sec::PyTokenType::Dedent) == 1, "one dedent");
                     require(list.back().type == sec::PyTokenType::EndMarker, "ends with marker");
                   }});

  tests.push_back({"python_tokenizer_reads_strings_with_prefixes", [] {
                     const auto tokens = sec::tokenize_python("x = rb'\\d' + f\"{y}\"\n");
                     require(tokens.ok(), tokens.error());
                     std::vector<sec::PyToken> strings;
                     for (const auto &token : tokens.value()) {
                       if (token.type == sec::PyTokenType::String) {
                         strings.push_back(token);
                       }
                     }
                     require(strings.size() == 2, "two string tokens");
                     require(strings[0].prefix == "rb" && strings[0].body == "\\d", "raw bytes");
                     require(strings[1].prefix == "f" && strings[1].body == "{y}", "f-string");
                   }});

  tests.push_back({"python_tokenizer_ignores_newlines_inside_brackets", [] {
                     const auto tokens = sec::tokenize_python("x = [\n  1,\n  2,\n]\n");
                     require(tokens.ok(), tokens.error());
                     const auto newlines = std::count_if(
                         tokens.value().begin(), tokens.value().end(),
                         [](const auto &t) { return t.type == sec::PyTokenType::Newline; });
                     require(newlines == 1, "only the logical line ends");
                   }});

  tests.push_back({"python_parser_accepts_common_programs", [] {
                     const std::vector<std::string> programs = {
                         "x = 1\n",
                         "",
                         "# comment only\n",
                         "a, *b = [1, 2, 3]\n",
                         "x: int = 5\n",
                         "x += 1\n",
                         "del x[0], y.z\n",
                         "assert x > 0, 'positive'\n",
                         "print(1 if x else 2)\n",
                         "y = 1 < x <= 3 and not z\n",
                         "values = {k: v for k, v in items if v}\n",
                         "s = {1, 2}\nt = ()\nu = (1,)\n",
                         "gen = sum(x * x for x in range(10))\n",
                         "if (n := len(a)) > 10:\n    pass\n",
                         "print(a[1:2], a[::2], a[:, 0])\n",
                         "f(*args, key=1, **kwargs)\n",
                         "n = 1_000 + 0x1F + 0o7 + 0b1 + 1.5e-3 + 2j\n",
                         "s = 'a' 'b' \"c\"\n",
                         "doc = '''multi\nline'''\n",
                         "@decorator\ndef f(a, /, b=1, *args, c, **kw) -> int:\n    return a\n",
                         "for i in range(3):\n    continue\nelse:\n    pass\n",
                         "while True:\n    break\n",
                         "try:\n    x()\nexcept (ValueError, TypeError) as err:\n    raise\n"
                         "except Exception:\n    pass\nelse:\n    pass\nfinally:\n    pass\n",
                         "with a() as b, c() as d:\n    pass\n",
                         "with (a() as b,\n      c() as d):\n    pass\n",
                         "def g():\n    yield 1\n    yield from range(2)\n",
                         "def outer():\n    def inner():\n        return 1\n    return inner()\n",
                         "x = f'{a + 1} and {b!r:>10}'\n",
                         "if a:\n    pass\nelif b:\n    pass\nelse:\n    pass\n",
                         "x = [i for row in grid for i in row if i]\n",
                         "match = 1\nprint(match)\n",
                         "x = 1; y = 2\n",
                         "x = \\\n    1\n",
                     };
                     for (const auto &program : programs) {
                       const auto tree = sec::parse_python(program);
                       require(tree.ok(), "should parse: " + program + " -> " + tree.error());
                     }
                   }});

  tests.push_back({"python_parser_rejects_invalid_programs", [] {
                     const std::vector<std::string> programs = {
                         "x = (1,\n",
                         "1 = x\n",
                         "f() = 1\n",
                         "if x\n    pass\n",
                         "def f(:\n    pass\n",
                         "x = 'unterminated\n",
                         "  x = 1\n",
                         "if x:\npass\n",
                         "x = 1 +\n",
                         "x = ]\n",
                         "return return\n",
                         "for in x:\n    pass\n",
                         "x = 1abc\n",
                     };
                     for (const auto &program : programs) {
                       const auto tree = sec::parse_python(program);
                       require(!tree.ok(), "should not parse: " + program);
                       require(tree.code() == codebox::common::ErrorCode::InvalidArgument,
                               "error kind for: " + program);
                       require(tree.error().find("(line ") != std::string::npos,
                               "message carries a line: " + tree.error());
                     }
                   }});

  tests.push_back({"python_parser_reports_line_numbers", [] {
                     const auto unclosed = sec::parse_python("x = 1\ny = (\n");
                     require(!unclosed.ok(), "unclosed bracket");
                     require(unclosed.error() == "'(' was never closed (line 2)", unclosed.error());

                     const auto target = sec::parse_python("a = 1\nb = 2\n3 = c\n");
                     require(!target.ok(), "literal target");
                     require(target.error().find("cannot assign to literal") != std::string::npos,
                             target.error());
                     require(target.error().find("(line 3)") != std::string::npos, target.error());
                   }});

  tests.push_back({"python_parser_rejects_match_statements", [] {
                     const auto tree =
                         sec::parse_python("match x:\n    case 1:\n        pass\n");
                     require(!tree.ok(), "match statements are not supported");
                     require(tree.error().find("match") != std::string::npos, tree.error());
                   }});

  tests.push_back({"python_parser_builds_expected_nodes", [] {
                     const auto kinds = kinds_of("import os\nx = os.path\n");
                     require(kinds.front() == sec::NodeKind::Module, "root is a module");
                     require(contains(kinds, sec::NodeKind::Import), "import node");
                     require(contains(kinds, sec::NodeKind::Alias), "alias node");
                     require(contains(kinds, sec::NodeKind::Attribute), "attribute node");

                     const auto fstring = kinds_of("msg = f'{value}'\n");
                     require(contains(fstring, sec::NodeKind::JoinedStr), "joined string");
                     require(contains(fstring, sec::NodeKind::FormattedValue), "formatted value");
                   }});

  tests.push_back({"python_walk_is_breadth_first_and_stoppable", [] {
                     auto tree = sec::parse_python("def f():\n    x = 1\ny = 2\n");
                     require(tree.ok(), tree.error());
                     std::vector<sec::NodeKind> order;
                     sec::walk_syntax(*tree.value().root, [&](const sec::SyntaxNode &node) {
                       order.push_back(node.kind);
                       return true;
                     });
                     require(order.size() >= 3, "walk visits the tree");
                     require(order[0] == sec::NodeKind::Module, "module first");
                     require(order[1] == sec::NodeKind::FunctionDef, "top-level statements next");
                     require(order[2] == sec::NodeKind::Assign, "second top-level statement");

                     std::size_t visited = 0;
                     sec::walk_syntax(*tree.value().root, [&](const sec::SyntaxNode &) {
                       ++visited;
                       return visited < 2;
                     });
                     require(visited == 2, "walk stops when the visitor returns false");
                   }});

  tests.push_back({"python_fstring_expressions_are_screened", [] {
                     const auto status = sec::screen_syntax("x = f'{os.getcwd()}'\n");
                     require(!status.ok(), "names inside f-strings are visible");
                     require(status.error() == "Forbidden attribute: os.getcwd", status.error());
                   }});

  tests.push_back({"python_parser_depth_is_bounded", [] {
                     std::string deep = "x = ";
                     for (int i = 0; i < 50; ++i) {
                       deep += "(";
                     }
                     deep += "1";
                     for (int i = 0; i < 50; ++i) {
                       deep += ")";
                     }
                     deep += "\n";
                     const auto tree = sec::parse_python(deep);
                     require(tree.ok(), "moderate nesting parses: " + tree.error());

                     std::string deeper = "x = ";
                     for (int i = 0; i < 5000; ++i) {
                       deeper += "-";
                     }
                     deeper += "1\n";
                     require(!sec::parse_python(deeper).ok(), "excessive nesting is rejected");
                   }});

  tests.push_back({"python_keywords", [] {
                     require(sec::is_python_keyword("lambda"), "lambda is a keyword");
                     require(sec::is_python_keyword("None"), "None is a keyword");
                     require(!sec::is_python_keyword("match"), "match is a soft keyword");
                     require(!sec::is_python_keyword("print"), "print is a name");
                     require(sec::node_kind_name(sec::NodeKind::ImportFrom) == "ImportFrom",
                             "kind names follow the ast module");
                   }});
}
