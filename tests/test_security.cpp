#include "test_framework.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/security/code_screen.hpp"
#include "codebox/security/credentials.hpp"
#include "codebox/security/syntax_screen.hpp"

#include <algorithm>
#include <set>
#include <thread>

void register_security_tests(std::vector<codebox::tests::TestCase> &tests) {
  using codebox::tests::require;
  namespace sec = codebox::security;
  using codebox::common::ErrorCode;

  tests.push_back({"pattern_screen_accepts_plain_code", [] {
                     require(sec::screen_patterns("print(1 + 1)").ok(), "arithmetic is allowed");
                     require(sec::screen_patterns("import math\nprint(math.sqrt(4))").ok(),
                             "math import is allowed");
                     require(sec::screen_patterns("").ok(), "empty code is allowed");
                   }});

  tests.push_back({"pattern_screen_rejects_denylist", [] {
                     const std::vector<std::string> samples = {
                         "os.system('ls')",
                         "import subprocess",
                         "exec('1')",
                         "eval ('1')",
                         "__import__('os')",
                         "open('/etc/passwd')",
                         "rm -rf /tmp",
                         "import os",
                         "import sys",
                         "from os import path",
                         "from subprocess import run",
                         "print(__builtins__)",
                         "breakpoint()",
                         "compile('1', 'x', 'eval')",
                     };
                     for (const auto &sample : samples) {
                       const auto status = sec::screen_patterns(sample);
                       require(!status.ok(), "should reject: " + sample);
                       require(status.code() == ErrorCode::ValidationRejected,
                               "rejection kind for: " + sample);
                     }
                   }});

  tests.push_back({"pattern_screen_is_case_insensitive", [] {
                     require(!sec::screen_patterns("IMPORT OS").ok(), "uppercase import os");
                     require(!sec::screen_patterns("Eval('1')").ok(), "mixed-case eval");
                   }});

  tests.push_back({"pattern_screen_folds_fullwidth_forms", [] {
                     // "ｅｖａｌ(" in fullwidth letters.
                     const std::string code = "\xEF\xBD\x85\xEF\xBD\x96\xEF\xBD\x81\xEF\xBD\x8C('1')";
                     require(sec::normalize_for_screen(code) == "eval('1')",
                             "fullwidth letters fold to ASCII");
                     require(!sec::screen_patterns(code).ok(), "fullwidth eval is rejected");
                   }});

  tests.push_back({"pattern_screen_reports_rule_label", [] {
                     const auto status = sec::screen_patterns("x = 1\nimport os\n");
                     require(!status.ok(), "import os rejected");
                     require(status.error().find("import os") != std::string::npos,
                             "message names the rule: " + status.error());
                     const auto matches = sec::match_dangerous_patterns("import os; os.system('x')");
                     require(std::find(matches.begin(), matches.end(), "os.system") != matches.end(),
                             "os.system listed");
                     require(std::find(matches.begin(), matches.end(), "import os") != matches.end(),
                             "import os listed");
                   }});

  tests.push_back({"pattern_screen_word_boundaries", [] {
                     require(sec::screen_patterns("import osmosis").ok(),
                             "module names starting with os are fine");
                     require(sec::screen_patterns("retrieval(1)").ok(),
                             "eval inside another word without a call is fine");
                   }});

  tests.push_back({"pattern_screen_collapses_whitespace_runs", [] {
                     require(sec::normalize_for_screen("import \t\n  os") == "import os",
                             "runs become one space");
                     const std::string padded =
                         "compile" + std::string(200'000, ' ') + "\t\n" + std::string(1000, ' ') + "(1)";
                     require(sec::normalize_for_screen(padded) == "compile (1)", "padded collapse");

                     using codebox::common::Status;
                     Status compile_status = Status::success();
                     Status rm_status = Status::success();
                     Status benign_status = Status::error("unset");
                     std::thread worker([&] {
                       compile_status = sec::screen_patterns(padded);
                       rm_status = sec::screen_patterns("rm" + std::string(500'000, ' ') + "-rf /");
                       benign_status =
                           sec::screen_patterns("x = 1" + std::string(500'000, ' ') + "\nprint(x)\n");
                     });
                     worker.join();
                     require(!compile_status.ok() &&
                                 compile_status.code() == ErrorCode::ValidationRejected,
                             "compile after whitespace");
                     require(!rm_status.ok(), "rm -rf after whitespace");
                     require(benign_status.ok(), benign_status.error());
                   }});

  tests.push_back({"pattern_screen_bounds_long_identifier_runs", [] {
                     const std::string code =
                         "from os." + std::string(200'000, 'a') + " import x\n";
                     codebox::common::Status status = codebox::common::Status::error("unset");
                     std::thread worker([&] { status = sec::screen_patterns(code); });
                     worker.join();
                     require(status.ok(), status.error());
                     require(!sec::screen_patterns("from os.path import join").ok(),
                             "short module paths still match");
                   }});

  tests.push_back({"pattern_screen_rejects_oversized_code", [] {
                     const std::string code(sec::kMaxScreenedBytes + 1, 'x');
                     const auto status = sec::screen_patterns(code);
                     require(!status.ok() && status.code() == ErrorCode::ValidationRejected,
                             "oversized code fails closed");
                     require(sec::match_dangerous_patterns(code) ==
                                 std::vector<std::string>{"size limit"},
                             "size limit reported");
                   }});

  tests.push_back({"syntax_screen_accepts_ordinary_functions", [] {
                     const std::string code = "def add(a, b=2):\n"
                                              "    \"\"\"Adds.\"\"\"\n"
                                              "    total = [x * 2 for x in range(a)]\n"
                                              "    return sum(total) + b\n";
                     const auto status = sec::screen_syntax(code);
                     require(status.ok(), "plain function accepted: " + status.error());
                   }});

  tests.push_back({"syntax_screen_rejects_import_built_to_dodge_patterns", [] {
                     const std::string code = "import json, os\n";
                     require(sec::screen_patterns(code).ok(),
                             "no denylisted substring remains in the source");
                     const auto status = sec::screen_syntax(code);
                     require(!status.ok(), "syntax screen rejects the import");
                     require(status.error() == "Forbidden construct: Import",
                             "unexpected message: " + status.error());
                   }});

  tests.push_back({"syntax_screen_rejects_forbidden_constructs", [] {
                     const std::vector<std::pair<std::string, std::string>> cases = {
                         {"from json import loads\n", "Forbidden construct: ImportFrom"},
                         {"f = lambda x: x\n", "Forbidden construct: Lambda"},
                         {"class A:\n    pass\n", "Forbidden construct: ClassDef"},
                         {"async def f():\n    pass\n", "Forbidden construct: AsyncFunctionDef"},
                         {"def f():\n    global x\n    x = 1\n", "Forbidden construct: Global"},
                     };
                     for (const auto &[code, expected] : cases) {
                       const auto status = sec::screen_syntax(code);
                       require(!status.ok(), "should reject: " + code);
                       require(status.error() == expected,
                               "expected '" + expected + "', got '" + status.error() + "'");
                     }
                   }});

  tests.push_back({"syntax_screen_rejects_forbidden_names", [] {
                     const auto name = sec::screen_syntax("handle = open\n");
                     require(name.error() == "Forbidden name: open", name.error());
                     const auto attr = sec::screen_syntax("x = os.path.join('a', 'b')\n");
                     require(attr.error() == "Forbidden attribute: os.path", attr.error());
                     require(attr.code() == codebox::common::ErrorCode::ValidationRejected,
                             "rejection kind");
                   }});

  tests.push_back({"syntax_screen_reports_invalid_syntax", [] {
                     const auto status = sec::screen_syntax("def f(:\n    pass\n");
                     require(!status.ok(), "broken code rejected");
                     require(codebox::common::starts_with(status.error(), "Invalid syntax: "),
                             status.error());
                   }});

  tests.push_back({"syntax_screen_custom_policy", [] {
                     sec::SyntaxScreenPolicy policy;
                     policy.forbidden_names = {"print"};
                     require(!sec::screen_syntax("print(1)\n", policy).ok(), "print forbidden");
                     require(sec::screen_syntax("import os\n", policy).ok(),
                             "imports allowed under this policy");
                   }});

  tests.push_back({"random_hex_is_lowercase_and_sized", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 32; ++i) {
                       const auto hex = sec::random_hex(4);
                       require(hex.ok(), "random_hex failed");
                       require(hex.value().size() == 8, "8 characters");
                       require(hex.value().find_first_not_of("0123456789abcdef") ==
                                   std::string::npos,
                               "lowercase hex");
                       seen.insert(hex.value());
                     }
                     require(seen.size() > 30, "ids should not repeat");
                   }});

  tests.push_back({"bearer_token_parsing", [] {
                     require(sec::parse_bearer_token("Bearer abc") == std::optional<std::string>("abc"),
                             "plain bearer");
                     require(sec::parse_bearer_token("bearer   abc ") ==
                                 std::optional<std::string>("abc"),
                             "case-insensitive scheme and trimmed token");
                     require(!sec::parse_bearer_token("Basic abc").has_value(), "other scheme");
                     require(!sec::parse_bearer_token("Bearer").has_value(), "missing token");
                     require(!sec::parse_bearer_token("").has_value(), "empty header");
                   }});

  tests.push_back({"constant_time_equals_compares_values", [] {
                     require(sec::constant_time_equals("secret", "secret"), "equal strings");
                     require(!sec::constant_time_equals("secret", "secreT"), "different strings");
                     require(!sec::constant_time_equals("secret", "secret2"), "different lengths");
                     require(sec::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256 of abc");
                   }});
}
