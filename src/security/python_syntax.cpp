#include "codebox/security/python_syntax.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <deque>
#include <stdexcept>
#include <unordered_set>

namespace codebox::security {

namespace {

constexpr std::size_t kMaxBracketDepth = 200;
constexpr std::size_t kMaxIndentLevels = 100;
constexpr int kMaxRecursion = 400;

class PySyntaxError : public std::runtime_error {
public:
  PySyntaxError(const std::string &message, const int line)
      : std::runtime_error(message), line_(line) {}

  [[nodiscard]] int line() const { return line_; }

private:
  int line_;
};

const std::array<std::string_view, 35> kKeywords = {
    "False", "None",   "True",    "and",      "as",       "assert", "async",
    "await", "break",  "class",   "continue", "def",      "del",    "elif",
    "else",  "except", "finally", "for",      "from",     "global", "if",
    "import", "in",    "is",      "lambda",   "nonlocal", "not",    "or",
    "pass",  "raise",  "return",  "try",      "while",    "with",   "yield",
};

const std::array<std::string_view, 12> kAugAssignOps = {
    "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=",
};

const std::array<std::string_view, 24> kOperators = {
    "**=", "//=", ">>=", "<<=", "...", "->", ":=", "**", "//", "<<", ">>", "<=",
    ">=",  "==",  "!=",  "+=",  "-=",  "*=", "/=", "%=", "&=", "|=", "^=", "@=",
};

constexpr std::string_view kSingleCharOps = "()[]{}+-*/%@&|^~<>,:.;=";

bool is_aug_assign(const std::string &op) {
  return std::find(kAugAssignOps.begin(), kAugAssignOps.end(), op) != kAugAssignOps.end();
}

bool is_string_prefix(const std::string &lowered) {
  static const std::unordered_set<std::string> prefixes = {"r",  "u",  "b",  "br", "rb",
                                                           "f",  "fr", "rf"};
  return prefixes.contains(lowered);
}

std::string normalize_newlines(const std::string &source) {
  std::string out;
  out.reserve(source.size());
  for (std::size_t i = 0; i < source.size(); ++i) {
    if (source[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < source.size() && source[i + 1] == '\n') {
        ++i;
      }
      continue;
    }
    out.push_back(source[i]);
  }
  return out;
}

// ---------------------------------------------------------------------------
// Tokenizer

class Tokenizer {
public:
  Tokenizer(const std::string &source, const int first_line)
      : src_(normalize_newlines(source)), line_(first_line) {}

  std::vector<PyToken> run() {
    bool at_line_start = true;
    while (true) {
      if (at_line_start && brackets_.empty()) {
        if (!handle_indentation()) {
          break;
        }
        at_line_start = false;
      }
      if (pos_ >= src_.size()) {
        break;
      }

      const char ch = src_[pos_];
      if (ch == ' ' || ch == '\t' || ch == '\f') {
        ++pos_;
        continue;
      }
      if (ch == '#') {
        skip_comment();
        continue;
      }
      if (ch == '\n') {
        ++pos_;
        if (brackets_.empty()) {
          emit(PyTokenType::Newline, "");
          at_line_start = true;
        }
        ++line_;
        continue;
      }
      if (ch == '\\') {
        if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') {
          pos_ += 2;
          ++line_;
          continue;
        }
        throw PySyntaxError("unexpected character after line continuation character", line_);
      }
      if (ch == '"' || ch == '\'') {
        read_string("");
        continue;
      }
      if (std::isdigit(static_cast<unsigned char>(ch)) != 0 ||
          (ch == '.' && pos_ + 1 < src_.size() &&
           std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])) != 0)) {
        read_number();
        continue;
      }
      if (std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_' ||
          static_cast<unsigned char>(ch) >= 0x80U) {
        read_name_or_prefixed_string();
        continue;
      }
      read_operator();
    }

    if (!brackets_.empty()) {
      throw PySyntaxError(std::string("'") + brackets_.back().first + "' was never closed",
                          brackets_.back().second);
    }
    if (!tokens_.empty() && tokens_.back().type != PyTokenType::Newline &&
        tokens_.back().type != PyTokenType::Dedent) {
      emit(PyTokenType::Newline, "");
    }
    while (indents_.size() > 1) {
      indents_.pop_back();
      emit(PyTokenType::Dedent, "");
    }
    emit(PyTokenType::EndMarker, "");
    return std::move(tokens_);
  }

private:
  void emit(const PyTokenType type, std::string text) {
    PyToken token;
    token.type = type;
    token.text = std::move(text);
    token.line = line_;
    tokens_.push_back(std::move(token));
  }

  void skip_comment() {
    while (pos_ < src_.size() && src_[pos_] != '\n') {
      ++pos_;
    }
  }

  // Returns false at end of input.
  bool handle_indentation() {
    while (true) {
      std::size_t column = 0;
      while (pos_ < src_.size()) {
        const char ch = src_[pos_];
        if (ch == ' ') {
          ++column;
        } else if (ch == '\t') {
          column = (column / 8 + 1) * 8;
        } else if (ch == '\f') {
          column = 0;
        } else {
          break;
        }
        ++pos_;
      }
      if (pos_ >= src_.size()) {
        return false;
      }

      const char ch = src_[pos_];
      if (ch == '#') {
        skip_comment();
        continue;
      }
      if (ch == '\n') {
        ++pos_;
        ++line_;
        continue;
      }

      if (column > indents_.back()) {
        if (indents_.size() >= kMaxIndentLevels) {
          throw PySyntaxError("too many levels of indentation", line_);
        }
        indents_.push_back(column);
        emit(PyTokenType::Indent, "");
      } else {
        while (column < indents_.back()) {
          indents_.pop_back();
          emit(PyTokenType::Dedent, "");
        }
        if (column != indents_.back()) {
          throw PySyntaxError("unindent does not match any outer indentation level", line_);
        }
      }
      return true;
    }
  }

  void read_string(const std::string &prefix) {
    const int start_line = line_;
    const char quote = src_[pos_];
    const bool triple = src_.compare(pos_, 3, std::string(3, quote)) == 0;
    pos_ += triple ? 3 : 1;
    const std::size_t body_start = pos_;

    while (true) {
      if (pos_ >= src_.size()) {
        throw PySyntaxError(triple ? "unterminated triple-quoted string literal"
                                   : "unterminated string literal",
                            start_line);
      }
      const char ch = src_[pos_];
      if (ch == '\\') {
        if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') {
          ++line_;
        }
        pos_ += 2;
        continue;
      }
      if (ch == '\n') {
        if (!triple) {
          throw PySyntaxError("unterminated string literal", start_line);
        }
        ++line_;
        ++pos_;
        continue;
      }
      if (ch == quote && (!triple || src_.compare(pos_, 3, std::string(3, quote)) == 0)) {
        break;
      }
      ++pos_;
    }

    PyToken token;
    token.type = PyTokenType::String;
    token.line = start_line;
    token.prefix = prefix;
    token.body = src_.substr(body_start, pos_ - body_start);
    pos_ += triple ? 3 : 1;
    token.text = prefix + std::string(triple ? 3 : 1, quote) + token.body +
                 std::string(triple ? 3 : 1, quote);
    tokens_.push_back(std::move(token));
  }

  void read_number() {
    const std::size_t start = pos_;
    auto is_digit_or_sep = [this](const std::size_t at) {
      return at < src_.size() &&
             (std::isdigit(static_cast<unsigned char>(src_[at])) != 0 || src_[at] == '_');
    };

    if (src_[pos_] == '0' && pos_ + 1 < src_.size() &&
        std::string_view("xXoObB").find(src_[pos_ + 1]) != std::string_view::npos) {
      pos_ += 2;
      while (pos_ < src_.size() &&
             (std::isalnum(static_cast<unsigned char>(src_[pos_])) != 0 || src_[pos_] == '_')) {
        ++pos_;
      }
    } else {
      while (is_digit_or_sep(pos_)) {
        ++pos_;
      }
      if (pos_ < src_.size() && src_[pos_] == '.') {
        ++pos_;
        while (is_digit_or_sep(pos_)) {
          ++pos_;
        }
      }
      if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
        std::size_t probe = pos_ + 1;
        if (probe < src_.size() && (src_[probe] == '+' || src_[probe] == '-')) {
          ++probe;
        }
        if (probe < src_.size() && std::isdigit(static_cast<unsigned char>(src_[probe])) != 0) {
          pos_ = probe;
          while (is_digit_or_sep(pos_)) {
            ++pos_;
          }
        }
      }
      if (pos_ < src_.size() && (src_[pos_] == 'j' || src_[pos_] == 'J')) {
        ++pos_;
      }
    }

    if (pos_ < src_.size() &&
        (std::isalpha(static_cast<unsigned char>(src_[pos_])) != 0 || src_[pos_] == '_')) {
      throw PySyntaxError("invalid decimal literal", line_);
    }
    emit(PyTokenType::Number, src_.substr(start, pos_ - start));
  }

  // Decodes one identifier character at pos_, folding fullwidth forms to ASCII the way
  // NFKC normalisation of identifiers does. Returns false when the byte ends the name.
  bool take_identifier_char(std::string &out) {
    const auto lead = static_cast<unsigned char>(src_[pos_]);
    if (lead < 0x80U) {
      if (std::isalnum(lead) != 0 || lead == '_') {
        out.push_back(static_cast<char>(lead));
        ++pos_;
        return true;
      }
      return false;
    }

    if ((lead & 0xF0U) == 0xE0U && pos_ + 2 < src_.size()) {
      const auto b1 = static_cast<unsigned char>(src_[pos_ + 1]);
      const auto b2 = static_cast<unsigned char>(src_[pos_ + 2]);
      const std::uint32_t cp = ((lead & 0x0FU) << 12U) | ((b1 & 0x3FU) << 6U) | (b2 & 0x3FU);
      const bool fullwidth_word = (cp >= 0xFF10U && cp <= 0xFF19U) ||
                                  (cp >= 0xFF21U && cp <= 0xFF3AU) ||
                                  (cp >= 0xFF41U && cp <= 0xFF5AU) || cp == 0xFF3FU;
      if (fullwidth_word) {
        out.push_back(static_cast<char>(cp - 0xFEE0U));
        pos_ += 3;
        return true;
      }
    }
    throw PySyntaxError("non-ASCII identifier characters are not supported", line_);
  }

  void read_name_or_prefixed_string() {
    std::string name;
    while (pos_ < src_.size() && take_identifier_char(name)) {
    }

    if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'')) {
      std::string lowered = name;
      std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (is_string_prefix(lowered)) {
        read_string(lowered);
        return;
      }
    }
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
      throw PySyntaxError("invalid syntax", line_);
    }
    emit(PyTokenType::Name, std::move(name));
  }

  void read_operator() {
    for (const auto op : kOperators) {
      if (src_.compare(pos_, op.size(), op) == 0) {
        pos_ += op.size();
        emit(PyTokenType::Op, std::string(op));
        return;
      }
    }

    const char ch = src_[pos_];
    if (kSingleCharOps.find(ch) == std::string_view::npos) {
      if (ch == '!') {
        throw PySyntaxError("invalid syntax", line_);
      }
      throw PySyntaxError(std::string("invalid character '") + ch + "'", line_);
    }
    ++pos_;
    if (ch == '(' || ch == '[' || ch == '{') {
      open_bracket(ch);
    } else if (ch == ')' || ch == ']' || ch == '}') {
      close_bracket(ch);
    }
    emit(PyTokenType::Op, std::string(1, ch));
  }

  void open_bracket(const char ch) {
    if (brackets_.size() >= kMaxBracketDepth) {
      throw PySyntaxError("too many nested parentheses", line_);
    }
    brackets_.emplace_back(ch, line_);
  }

  void close_bracket(const char ch) {
    const char expected_open = ch == ')' ? '(' : (ch == ']' ? '[' : '{');
    if (brackets_.empty()) {
      throw PySyntaxError(std::string("unmatched '") + ch + "'", line_);
    }
    if (brackets_.back().first != expected_open) {
      throw PySyntaxError(std::string("closing parenthesis '") + ch +
                              "' does not match opening parenthesis '" + brackets_.back().first +
                              "'",
                          line_);
    }
    brackets_.pop_back();
  }

  std::string src_;
  std::size_t pos_ = 0;
  int line_ = 1;
  std::vector<std::size_t> indents_{0};
  std::vector<std::pair<char, int>> brackets_;
  std::vector<PyToken> tokens_;
};

// ---------------------------------------------------------------------------
// Parser

using NodePtr = std::unique_ptr<SyntaxNode>;

NodePtr make_node(const NodeKind kind, const int line, std::string value = {}) {
  auto node = std::make_unique<SyntaxNode>();
  node->kind = kind;
  node->line = line;
  node->value = std::move(value);
  return node;
}

void add_child(SyntaxNode &parent, NodePtr child) {
  if (child != nullptr) {
    parent.children.push_back(std::move(child));
  }
}

std::string describe_for_assignment(const SyntaxNode &node) {
  switch (node.kind) {
  case NodeKind::Call:
    return "function call";
  case NodeKind::Constant:
  case NodeKind::JoinedStr:
    return "literal";
  case NodeKind::Compare:
    return "comparison";
  case NodeKind::Lambda:
    return "lambda";
  case NodeKind::IfExp:
    return "conditional expression";
  case NodeKind::NamedExpr:
    return "named expression";
  case NodeKind::Await:
    return "await expression";
  case NodeKind::Yield:
  case NodeKind::YieldFrom:
    return "yield expression";
  case NodeKind::ListComp:
    return "list comprehension";
  case NodeKind::SetComp:
    return "set comprehension";
  case NodeKind::DictComp:
    return "dict comprehension";
  case NodeKind::GeneratorExp:
    return "generator expression";
  case NodeKind::Dict:
    return "dict literal";
  case NodeKind::Set:
    return "set display";
  default:
    return "expression";
  }
}

class Parser {
public:
  explicit Parser(std::vector<PyToken> tokens) : tokens_(std::move(tokens)) {}

  NodePtr parse_module() {
    auto module = make_node(NodeKind::Module, 1);
    while (peek().type != PyTokenType::EndMarker) {
      parse_statement(*module);
    }
    return module;
  }

  // Body of an f-string replacement field, tokenized with surrounding parentheses.
  NodePtr parse_embedded_expression() {
    expect_op("(");
    NodePtr expr;
    if (check_keyword("yield")) {
      expr = parse_yield_expr();
    } else {
      expr = parse_star_expressions();
    }
    expect_op(")");
    if (peek().type == PyTokenType::Newline) {
      advance();
    }
    if (peek().type != PyTokenType::EndMarker) {
      fail("f-string: expecting '}'");
    }
    return expr;
  }

private:
  class DepthGuard {
  public:
    explicit DepthGuard(Parser &parser) : parser_(parser) {
      if (++parser_.depth_ > kMaxRecursion) {
        parser_.fail("too many nested expressions or blocks");
      }
    }
    ~DepthGuard() { --parser_.depth_; }
    DepthGuard(const DepthGuard &) = delete;
    DepthGuard &operator=(const DepthGuard &) = delete;

  private:
    Parser &parser_;
  };

  // -- token helpers --------------------------------------------------------

  [[nodiscard]] const PyToken &peek(const std::size_t ahead = 0) const {
    const std::size_t index = std::min(pos_ + ahead, tokens_.size() - 1);
    return tokens_[index];
  }

  const PyToken &advance() {
    const PyToken &token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
      ++pos_;
    }
    return token;
  }

  [[nodiscard]] bool check_op(const std::string_view op, const std::size_t ahead = 0) const {
    const auto &token = peek(ahead);
    return token.type == PyTokenType::Op && token.text == op;
  }

  [[nodiscard]] bool check_keyword(const std::string_view keyword,
                                   const std::size_t ahead = 0) const {
    const auto &token = peek(ahead);
    return token.type == PyTokenType::Name && token.text == keyword;
  }

  [[nodiscard]] bool check_identifier(const std::size_t ahead = 0) const {
    const auto &token = peek(ahead);
    return token.type == PyTokenType::Name && !is_python_keyword(token.text);
  }

  bool accept_op(const std::string_view op) {
    if (check_op(op)) {
      advance();
      return true;
    }
    return false;
  }

  bool accept_keyword(const std::string_view keyword) {
    if (check_keyword(keyword)) {
      advance();
      return true;
    }
    return false;
  }

  void expect_op(const std::string_view op) {
    if (!accept_op(op)) {
      fail(peek().type == PyTokenType::Newline || peek().type == PyTokenType::EndMarker
               ? "expected '" + std::string(op) + "'"
               : "invalid syntax");
    }
  }

  void expect_keyword(const std::string_view keyword) {
    if (!accept_keyword(keyword)) {
      fail("expected '" + std::string(keyword) + "'");
    }
  }

  std::string expect_identifier() {
    if (!check_identifier()) {
      fail("invalid syntax");
    }
    return advance().text;
  }

  void expect_newline() {
    if (peek().type == PyTokenType::Newline) {
      advance();
      return;
    }
    if (peek().type == PyTokenType::EndMarker) {
      return;
    }
    fail("invalid syntax");
  }

  [[noreturn]] void fail(const std::string &message) const { throw PySyntaxError(message, peek().line); }

  [[noreturn]] static void fail_at(const std::string &message, const int line) {
    throw PySyntaxError(message, line);
  }

  [[nodiscard]] bool at_simple_statement_end() const {
    const auto &token = peek();
    return token.type == PyTokenType::Newline || token.type == PyTokenType::EndMarker ||
           check_op(";");
  }

  // -- target validation ----------------------------------------------------

  void validate_assign_target(const SyntaxNode &node) {
    switch (node.kind) {
    case NodeKind::Name:
    case NodeKind::Attribute:
    case NodeKind::Subscript:
      return;
    case NodeKind::Starred:
      validate_assign_target(*node.children.front());
      return;
    case NodeKind::Tuple:
    case NodeKind::List: {
      int starred = 0;
      for (const auto &child : node.children) {
        if (child->kind == NodeKind::Starred) {
          ++starred;
        }
        validate_assign_target(*child);
      }
      if (starred > 1) {
        fail_at("multiple starred expressions in assignment", node.line);
      }
      return;
    }
    default:
      fail_at("cannot assign to " + describe_for_assignment(node), node.line);
    }
  }

  void validate_single_target(const SyntaxNode &node, const std::string &context) {
    if (node.kind == NodeKind::Name || node.kind == NodeKind::Attribute ||
        node.kind == NodeKind::Subscript) {
      return;
    }
    fail_at("'" + std::string(node_kind_name(node.kind)) + "' is an illegal expression for " +
                context,
            node.line);
  }

  void validate_delete_target(const SyntaxNode &node) {
    switch (node.kind) {
    case NodeKind::Name:
    case NodeKind::Attribute:
    case NodeKind::Subscript:
      return;
    case NodeKind::Tuple:
    case NodeKind::List:
      for (const auto &child : node.children) {
        validate_delete_target(*child);
      }
      return;
    default:
      fail_at("cannot delete " + describe_for_assignment(node), node.line);
    }
  }

  // -- statements -----------------------------------------------------------

  void parse_statement(SyntaxNode &parent) {
    DepthGuard guard(*this);
    const auto &token = peek();
    if (token.type == PyTokenType::Indent) {
      fail("unexpected indent");
    }
    if (token.type == PyTokenType::Dedent) {
      fail("unindent does not match any outer indentation level");
    }
    if (token.type == PyTokenType::Newline) {
      advance();
      return;
    }

    if (check_op("@")) {
      add_child(parent, parse_decorated());
      return;
    }
    if (token.type == PyTokenType::Name) {
      const std::string &word = token.text;
      if (word == "def") {
        add_child(parent, parse_function({}, false, token.line));
        return;
      }
      if (word == "class") {
        add_child(parent, parse_class({}));
        return;
      }
      if (word == "if") {
        add_child(parent, parse_if());
        return;
      }
      if (word == "while") {
        add_child(parent, parse_while());
        return;
      }
      if (word == "for") {
        add_child(parent, parse_for(false));
        return;
      }
      if (word == "try") {
        add_child(parent, parse_try());
        return;
      }
      if (word == "with") {
        add_child(parent, parse_with(false));
        return;
      }
      if (word == "async") {
        const int line = token.line;
        if (check_keyword("def", 1)) {
          advance();
          add_child(parent, parse_function({}, true, line));
          return;
        }
        if (check_keyword("for", 1)) {
          advance();
          add_child(parent, parse_for(true));
          return;
        }
        if (check_keyword("with", 1)) {
          advance();
          add_child(parent, parse_with(true));
          return;
        }
        fail("invalid syntax");
      }
      if (word == "match" && looks_like_match_statement()) {
        fail("match statements are not supported");
      }
    }
    parse_simple_statements(parent);
  }

  [[nodiscard]] bool looks_like_match_statement() const {
    std::size_t index = pos_ + 1;
    while (index < tokens_.size() && tokens_[index].type != PyTokenType::Newline &&
           tokens_[index].type != PyTokenType::EndMarker) {
      ++index;
    }
    if (index + 2 >= tokens_.size() || index == pos_ + 1) {
      return false;
    }
    const auto &colon = tokens_[index - 1];
    return colon.type == PyTokenType::Op && colon.text == ":" &&
           tokens_[index + 1].type == PyTokenType::Indent &&
           tokens_[index + 2].type == PyTokenType::Name && tokens_[index + 2].text == "case";
  }

  void parse_simple_statements(SyntaxNode &parent) {
    while (true) {
      add_child(parent, parse_simple_statement());
      if (!accept_op(";")) {
        break;
      }
      if (peek().type == PyTokenType::Newline || peek().type == PyTokenType::EndMarker) {
        break;
      }
    }
    expect_newline();
  }

  void parse_block(SyntaxNode &parent) {
    expect_op(":");
    if (peek().type != PyTokenType::Newline) {
      parse_simple_statements(parent);
      return;
    }
    advance();
    if (peek().type != PyTokenType::Indent) {
      fail("expected an indented block");
    }
    advance();
    while (peek().type != PyTokenType::Dedent && peek().type != PyTokenType::EndMarker) {
      parse_statement(parent);
    }
    if (peek().type == PyTokenType::Dedent) {
      advance();
    }
  }

  NodePtr parse_simple_statement() {
    const auto &token = peek();
    const int line = token.line;
    if (token.type == PyTokenType::Name) {
      const std::string word = token.text;
      if (word == "pass") {
        advance();
        return make_node(NodeKind::Pass, line);
      }
      if (word == "break") {
        advance();
        return make_node(NodeKind::Break, line);
      }
      if (word == "continue") {
        advance();
        return make_node(NodeKind::Continue, line);
      }
      if (word == "return") {
        advance();
        auto node = make_node(NodeKind::Return, line);
        if (!at_simple_statement_end()) {
          add_child(*node, parse_star_expressions());
        }
        return node;
      }
      if (word == "raise") {
        advance();
        auto node = make_node(NodeKind::Raise, line);
        if (!at_simple_statement_end()) {
          add_child(*node, parse_expression());
          if (accept_keyword("from")) {
            add_child(*node, parse_expression());
          }
        }
        return node;
      }
      if (word == "global" || word == "nonlocal") {
        advance();
        auto node = make_node(word == "global" ? NodeKind::Global : NodeKind::Nonlocal, line);
        node->value = expect_identifier();
        while (accept_op(",")) {
          node->value += "," + expect_identifier();
        }
        return node;
      }
      if (word == "del") {
        advance();
        auto node = make_node(NodeKind::Delete, line);
        do {
          if (at_simple_statement_end()) {
            break;
          }
          auto target = parse_bitwise_or();
          validate_delete_target(*target);
          add_child(*node, std::move(target));
        } while (accept_op(","));
        if (node->children.empty()) {
          fail("invalid syntax");
        }
        return node;
      }
      if (word == "assert") {
        advance();
        auto node = make_node(NodeKind::Assert, line);
        add_child(*node, parse_expression());
        if (accept_op(",")) {
          add_child(*node, parse_expression());
        }
        return node;
      }
      if (word == "import") {
        return parse_import();
      }
      if (word == "from") {
        return parse_import_from();
      }
    }
    return parse_expression_statement();
  }

  NodePtr parse_expression_statement() {
    const int line = peek().line;
    NodePtr first = check_keyword("yield") ? parse_yield_expr() : parse_star_expressions();

    if (check_op(":")) {
      advance();
      validate_single_target(*first, "annotation");
      auto node = make_node(NodeKind::AnnAssign, line);
      add_child(*node, std::move(first));
      add_child(*node, parse_expression());
      if (accept_op("=")) {
        add_child(*node, parse_assigned_value());
      }
      return node;
    }

    if (peek().type == PyTokenType::Op && is_aug_assign(peek().text)) {
      const std::string op = advance().text;
      validate_single_target(*first, "augmented assignment");
      auto node = make_node(NodeKind::AugAssign, line, op);
      add_child(*node, std::move(first));
      add_child(*node, parse_assigned_value());
      return node;
    }

    if (check_op("=")) {
      std::vector<NodePtr> parts;
      parts.push_back(std::move(first));
      while (accept_op("=")) {
        parts.push_back(parse_assigned_value());
      }
      auto node = make_node(NodeKind::Assign, line);
      for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        validate_assign_target(*parts[i]);
      }
      for (auto &part : parts) {
        add_child(*node, std::move(part));
      }
      return node;
    }

    if (first->kind == NodeKind::Starred) {
      fail_at("can't use starred expression here", first->line);
    }
    auto node = make_node(NodeKind::Expr, line);
    add_child(*node, std::move(first));
    return node;
  }

  NodePtr parse_assigned_value() {
    if (check_keyword("yield")) {
      return parse_yield_expr();
    }
    auto value = parse_star_expressions();
    if (value->kind == NodeKind::Starred) {
      fail_at("can't use starred expression here", value->line);
    }
    return value;
  }

  std::string parse_dotted_name() {
    std::string name = expect_identifier();
    while (accept_op(".")) {
      name += "." + expect_identifier();
    }
    return name;
  }

  NodePtr parse_import() {
    auto node = make_node(NodeKind::Import, advance().line);
    do {
      auto alias = make_node(NodeKind::Alias, peek().line);
      alias->value = parse_dotted_name();
      if (accept_keyword("as")) {
        alias->value += " as " + expect_identifier();
      }
      add_child(*node, std::move(alias));
    } while (accept_op(","));
    return node;
  }

  NodePtr parse_import_from() {
    auto node = make_node(NodeKind::ImportFrom, advance().line);
    std::string module;
    while (check_op(".") || check_op("...")) {
      module += advance().text;
    }
    if (!check_keyword("import")) {
      module += parse_dotted_name();
    } else if (module.empty()) {
      fail("invalid syntax");
    }
    node->value = module;
    expect_keyword("import");

    if (accept_op("*")) {
      add_child(*node, make_node(NodeKind::Alias, node->line, "*"));
      return node;
    }

    const bool parenthesized = accept_op("(");
    while (true) {
      auto alias = make_node(NodeKind::Alias, peek().line, expect_identifier());
      if (accept_keyword("as")) {
        alias->value += " as " + expect_identifier();
      }
      add_child(*node, std::move(alias));
      if (!accept_op(",")) {
        break;
      }
      if (parenthesized && check_op(")")) {
        break;
      }
      if (!parenthesized && at_simple_statement_end()) {
        fail("trailing comma not allowed without surrounding parentheses");
      }
    }
    if (parenthesized) {
      expect_op(")");
    }
    return node;
  }

  NodePtr parse_decorated() {
    std::vector<NodePtr> decorators;
    while (accept_op("@")) {
      decorators.push_back(parse_named_expression());
      expect_newline();
    }
    const int line = peek().line;
    if (check_keyword("def")) {
      return parse_function(std::move(decorators), false, line);
    }
    if (check_keyword("async") && check_keyword("def", 1)) {
      advance();
      return parse_function(std::move(decorators), true, line);
    }
    if (check_keyword("class")) {
      return parse_class(std::move(decorators));
    }
    fail("invalid syntax");
  }

  NodePtr parse_function(std::vector<NodePtr> decorators, const bool is_async, const int line) {
    expect_keyword("def");
    auto node = make_node(is_async ? NodeKind::AsyncFunctionDef : NodeKind::FunctionDef, line,
                          expect_identifier());
    for (auto &decorator : decorators) {
      add_child(*node, std::move(decorator));
    }
    expect_op("(");
    add_child(*node, parse_parameters(")", true));
    expect_op(")");
    if (accept_op("->")) {
      add_child(*node, parse_expression());
    }
    parse_block(*node);
    return node;
  }

  NodePtr parse_parameters(const std::string_view closing, const bool annotations) {
    auto node = make_node(NodeKind::Arguments, peek().line);
    std::unordered_set<std::string> seen;
    bool seen_default = false;
    bool seen_star = false;
    bool seen_slash = false;

    auto add_arg = [&](const bool allow_default) {
      const int line = peek().line;
      std::string name = expect_identifier();
      if (!seen.insert(name).second) {
        fail_at("duplicate argument '" + name + "' in function definition", line);
      }
      auto arg = make_node(NodeKind::Arg, line, std::move(name));
      if (annotations && accept_op(":")) {
        add_child(*arg, parse_expression());
      }
      add_child(*node, std::move(arg));
      if (allow_default && accept_op("=")) {
        add_child(*node, parse_expression());
        seen_default = true;
      } else if (allow_default && seen_default && !seen_star) {
        fail_at("non-default argument follows default argument", line);
      }
    };

    while (!check_op(closing)) {
      if (accept_op("/")) {
        if (seen_slash || seen_star || node->children.empty()) {
          fail("invalid syntax");
        }
        seen_slash = true;
      } else if (accept_op("**")) {
        add_arg(false);
        accept_op(",");
        if (!check_op(closing)) {
          fail("arguments cannot follow var-keyword argument");
        }
        break;
      } else if (accept_op("*")) {
        if (seen_star) {
          fail("* argument may appear only once");
        }
        seen_star = true;
        if (check_op(",") || check_op(closing)) {
          if (check_op(closing) || check_op(closing, 1) || check_op("**", 1)) {
            fail("named arguments must follow bare *");
          }
        } else {
          add_arg(false);
        }
      } else {
        add_arg(true);
      }
      if (!accept_op(",")) {
        break;
      }
    }
    return node;
  }

  NodePtr parse_class(std::vector<NodePtr> decorators) {
    const int line = advance().line;
    auto node = make_node(NodeKind::ClassDef, line, expect_identifier());
    for (auto &decorator : decorators) {
      add_child(*node, std::move(decorator));
    }
    if (accept_op("(")) {
      parse_call_arguments(*node);
    }
    parse_block(*node);
    return node;
  }

  NodePtr parse_if() {
    const int line = advance().line;
    auto node = make_node(NodeKind::If, line);
    add_child(*node, parse_named_expression());
    parse_block(*node);
    if (check_keyword("elif")) {
      add_child(*node, parse_if());
    } else if (accept_keyword("else")) {
      parse_block(*node);
    }
    return node;
  }

  NodePtr parse_while() {
    const int line = advance().line;
    auto node = make_node(NodeKind::While, line);
    add_child(*node, parse_named_expression());
    parse_block(*node);
    if (accept_keyword("else")) {
      parse_block(*node);
    }
    return node;
  }

  NodePtr parse_for(const bool is_async) {
    const int line = advance().line;
    auto node = make_node(is_async ? NodeKind::AsyncFor : NodeKind::For, line);
    auto target = parse_target_list();
    validate_assign_target(*target);
    add_child(*node, std::move(target));
    expect_keyword("in");
    add_child(*node, parse_star_expressions());
    parse_block(*node);
    if (accept_keyword("else")) {
      parse_block(*node);
    }
    return node;
  }

  NodePtr parse_try() {
    const int line = advance().line;
    auto node = make_node(NodeKind::Try, line);
    parse_block(*node);

    bool has_handlers = false;
    bool seen_bare = false;
    bool seen_star_handler = false;
    bool seen_plain_handler = false;
    while (check_keyword("except")) {
      const int handler_line = advance().line;
      auto handler = make_node(NodeKind::ExceptHandler, handler_line);
      if (seen_bare) {
        fail_at("default 'except:' must be last", handler_line);
      }
      if (accept_op("*")) {
        seen_star_handler = true;
        node->kind = NodeKind::TryStar;
        if (check_op(":")) {
          fail("expected one or more exception types");
        }
      } else {
        seen_plain_handler = true;
      }
      if (seen_star_handler && seen_plain_handler) {
        fail_at("cannot have both 'except' and 'except*' on the same 'try'", handler_line);
      }
      if (check_op(":")) {
        seen_bare = true;
      } else {
        add_child(*handler, parse_expression());
        if (check_op(",")) {
          fail("multiple exception types must be parenthesized");
        }
        if (accept_keyword("as")) {
          handler->value = expect_identifier();
        }
      }
      parse_block(*handler);
      add_child(*node, std::move(handler));
      has_handlers = true;
    }

    if (has_handlers && accept_keyword("else")) {
      parse_block(*node);
    }
    if (accept_keyword("finally")) {
      parse_block(*node);
    } else if (!has_handlers) {
      fail("expected 'except' or 'finally' block");
    }
    return node;
  }

  NodePtr parse_with_item() {
    auto item = make_node(NodeKind::WithItem, peek().line);
    add_child(*item, parse_expression());
    if (accept_keyword("as")) {
      auto target = parse_target();
      validate_assign_target(*target);
      add_child(*item, std::move(target));
    }
    return item;
  }

  NodePtr parse_with(const bool is_async) {
    const int line = advance().line;
    auto node = make_node(is_async ? NodeKind::AsyncWith : NodeKind::With, line);

    // Parenthesised item list: with (a as b, c as d):
    if (check_op("(")) {
      const std::size_t saved = pos_;
      try {
        advance();
        std::vector<NodePtr> items;
        do {
          if (check_op(")")) {
            break;
          }
          items.push_back(parse_with_item());
        } while (accept_op(","));
        expect_op(")");
        if (!check_op(":") || items.empty()) {
          throw PySyntaxError("not a parenthesised with-item list", line);
        }
        for (auto &item : items) {
          add_child(*node, std::move(item));
        }
        parse_block(*node);
        return node;
      } catch (const PySyntaxError &) {
        pos_ = saved;
        node->children.clear();
      }
    }

    do {
      add_child(*node, parse_with_item());
    } while (accept_op(","));
    parse_block(*node);
    return node;
  }

  // -- targets --------------------------------------------------------------

  NodePtr parse_target() {
    if (check_op("*")) {
      const int line = advance().line;
      auto node = make_node(NodeKind::Starred, line);
      add_child(*node, parse_bitwise_or());
      return node;
    }
    return parse_bitwise_or();
  }

  NodePtr parse_target_list() {
    const int line = peek().line;
    auto first = parse_target();
    if (!check_op(",")) {
      return first;
    }
    auto tuple = make_node(NodeKind::Tuple, line);
    add_child(*tuple, std::move(first));
    while (accept_op(",")) {
      if (check_keyword("in") || check_op("=") || check_op(")")) {
        break;
      }
      add_child(*tuple, parse_target());
    }
    return tuple;
  }

  // -- expressions ----------------------------------------------------------

  [[nodiscard]] bool at_expression_list_end() const {
    const auto &token = peek();
    if (token.type == PyTokenType::Newline || token.type == PyTokenType::EndMarker) {
      return true;
    }
    if (token.type != PyTokenType::Op) {
      return false;
    }
    return token.text == ")" || token.text == "]" || token.text == "}" || token.text == "=" ||
           token.text == ":" || token.text == ";" || is_aug_assign(token.text);
  }

  NodePtr parse_star_expressions() {
    const int line = peek().line;
    auto first = parse_star_expression();
    if (!check_op(",")) {
      return first;
    }
    auto tuple = make_node(NodeKind::Tuple, line);
    add_child(*tuple, std::move(first));
    while (accept_op(",")) {
      if (at_expression_list_end()) {
        break;
      }
      add_child(*tuple, parse_star_expression());
    }
    return tuple;
  }

  NodePtr parse_star_expression() {
    if (check_op("*")) {
      const int line = advance().line;
      auto node = make_node(NodeKind::Starred, line);
      add_child(*node, parse_bitwise_or());
      return node;
    }
    return parse_expression();
  }

  NodePtr parse_star_named_expression() {
    if (check_op("*")) {
      const int line = advance().line;
      auto node = make_node(NodeKind::Starred, line);
      add_child(*node, parse_bitwise_or());
      return node;
    }
    return parse_named_expression();
  }

  NodePtr parse_named_expression() {
    if (check_identifier() && check_op(":=", 1)) {
      const auto &name_token = advance();
      auto node = make_node(NodeKind::NamedExpr, name_token.line);
      add_child(*node, make_node(NodeKind::Name, name_token.line, name_token.text));
      advance();
      add_child(*node, parse_expression());
      return node;
    }
    auto expr = parse_expression();
    if (check_op(":=")) {
      fail("cannot use assignment expressions with " + describe_for_assignment(*expr));
    }
    return expr;
  }

  NodePtr parse_expression() {
    DepthGuard guard(*this);
    if (check_keyword("lambda")) {
      return parse_lambda();
    }
    const int line = peek().line;
    auto body = parse_disjunction();
    if (!check_keyword("if")) {
      return body;
    }
    advance();
    auto node = make_node(NodeKind::IfExp, line);
    add_child(*node, parse_disjunction());
    add_child(*node, std::move(body));
    expect_keyword("else");
    add_child(*node, parse_expression());
    return node;
  }

  NodePtr parse_lambda() {
    const int line = advance().line;
    auto node = make_node(NodeKind::Lambda, line);
    add_child(*node, parse_parameters(":", false));
    expect_op(":");
    add_child(*node, parse_expression());
    return node;
  }

  NodePtr parse_yield_expr() {
    const int line = advance().line;
    if (accept_keyword("from")) {
      auto node = make_node(NodeKind::YieldFrom, line);
      add_child(*node, parse_expression());
      return node;
    }
    auto node = make_node(NodeKind::Yield, line);
    if (!at_expression_list_end()) {
      add_child(*node, parse_star_expressions());
    }
    return node;
  }

  NodePtr parse_disjunction() {
    const int line = peek().line;
    auto first = parse_conjunction();
    if (!check_keyword("or")) {
      return first;
    }
    auto node = make_node(NodeKind::BoolOp, line, "or");
    add_child(*node, std::move(first));
    while (accept_keyword("or")) {
      add_child(*node, parse_conjunction());
    }
    return node;
  }

  NodePtr parse_conjunction() {
    const int line = peek().line;
    auto first = parse_inversion();
    if (!check_keyword("and")) {
      return first;
    }
    auto node = make_node(NodeKind::BoolOp, line, "and");
    add_child(*node, std::move(first));
    while (accept_keyword("and")) {
      add_child(*node, parse_inversion());
    }
    return node;
  }

  NodePtr parse_inversion() {
    DepthGuard guard(*this);
    if (check_keyword("not")) {
      const int line = advance().line;
      auto node = make_node(NodeKind::UnaryOp, line, "not");
      add_child(*node, parse_inversion());
      return node;
    }
    return parse_comparison();
  }

  // Returns the operator text when the next tokens form a comparison operator.
  [[nodiscard]] std::string peek_comparison_operator(std::size_t &width) const {
    const auto &token = peek();
    width = 1;
    if (token.type == PyTokenType::Op &&
        (token.text == "<" || token.text == ">" || token.text == "==" || token.text == ">=" ||
         token.text == "<=" || token.text == "!=")) {
      return token.text;
    }
    if (check_keyword("in")) {
      return "in";
    }
    if (check_keyword("not") && check_keyword("in", 1)) {
      width = 2;
      return "not in";
    }
    if (check_keyword("is")) {
      if (check_keyword("not", 1)) {
        width = 2;
        return "is not";
      }
      return "is";
    }
    return {};
  }

  NodePtr parse_comparison() {
    const int line = peek().line;
    auto first = parse_bitwise_or();
    std::size_t width = 0;
    std::string op = peek_comparison_operator(width);
    if (op.empty()) {
      return first;
    }
    auto node = make_node(NodeKind::Compare, line, op);
    add_child(*node, std::move(first));
    while (!op.empty()) {
      for (std::size_t i = 0; i < width; ++i) {
        advance();
      }
      add_child(*node, parse_bitwise_or());
      op = peek_comparison_operator(width);
    }
    return node;
  }

  template <typename Next>
  NodePtr parse_binary(const std::initializer_list<std::string_view> ops, Next next) {
    const int line = peek().line;
    auto left = (this->*next)();
    while (true) {
      const auto &token = peek();
      if (token.type != PyTokenType::Op ||
          std::find(ops.begin(), ops.end(), token.text) == ops.end()) {
        return left;
      }
      const std::string op = advance().text;
      auto node = make_node(NodeKind::BinOp, line, op);
      add_child(*node, std::move(left));
      add_child(*node, (this->*next)());
      left = std::move(node);
    }
  }

  NodePtr parse_bitwise_or() { return parse_binary({"|"}, &Parser::parse_bitwise_xor); }
  NodePtr parse_bitwise_xor() { return parse_binary({"^"}, &Parser::parse_bitwise_and); }
  NodePtr parse_bitwise_and() { return parse_binary({"&"}, &Parser::parse_shift); }
  NodePtr parse_shift() { return parse_binary({"<<", ">>"}, &Parser::parse_sum); }
  NodePtr parse_sum() { return parse_binary({"+", "-"}, &Parser::parse_term); }
  NodePtr parse_term() { return parse_binary({"*", "/", "//", "%", "@"}, &Parser::parse_factor); }

  NodePtr parse_factor() {
    DepthGuard guard(*this);
    if (check_op("+") || check_op("-") || check_op("~")) {
      const auto &token = advance();
      auto node = make_node(NodeKind::UnaryOp, token.line, token.text);
      add_child(*node, parse_factor());
      return node;
    }
    return parse_power();
  }

  NodePtr parse_power() {
    const int line = peek().line;
    auto base = parse_await_primary();
    if (!accept_op("**")) {
      return base;
    }
    auto node = make_node(NodeKind::BinOp, line, "**");
    add_child(*node, std::move(base));
    add_child(*node, parse_factor());
    return node;
  }

  NodePtr parse_await_primary() {
    if (check_keyword("await")) {
      const int line = advance().line;
      auto node = make_node(NodeKind::Await, line);
      add_child(*node, parse_primary());
      return node;
    }
    return parse_primary();
  }

  NodePtr parse_primary() {
    auto node = parse_atom();
    while (true) {
      const int line = peek().line;
      if (accept_op(".")) {
        auto attribute = make_node(NodeKind::Attribute, line, expect_identifier());
        add_child(*attribute, std::move(node));
        node = std::move(attribute);
      } else if (accept_op("(")) {
        auto call = make_node(NodeKind::Call, line);
        add_child(*call, std::move(node));
        parse_call_arguments(*call);
        node = std::move(call);
      } else if (accept_op("[")) {
        auto subscript = make_node(NodeKind::Subscript, line);
        add_child(*subscript, std::move(node));
        add_child(*subscript, parse_slices());
        expect_op("]");
        node = std::move(subscript);
      } else {
        return node;
      }
    }
  }

  // Consumes the argument list and the closing parenthesis.
  void parse_call_arguments(SyntaxNode &call) {
    bool seen_keyword = false;
    bool seen_keyword_unpack = false;
    const std::size_t first_argument = call.children.size();
    while (!check_op(")")) {
      const int line = peek().line;
      if (accept_op("**")) {
        auto keyword = make_node(NodeKind::Keyword, line);
        add_child(*keyword, parse_expression());
        add_child(call, std::move(keyword));
        seen_keyword_unpack = true;
      } else if (accept_op("*")) {
        if (seen_keyword_unpack) {
          fail_at("iterable argument unpacking follows keyword argument unpacking", line);
        }
        auto starred = make_node(NodeKind::Starred, line);
        add_child(*starred, parse_expression());
        add_child(call, std::move(starred));
      } else if (check_identifier() && check_op("=", 1)) {
        auto keyword = make_node(NodeKind::Keyword, line, advance().text);
        advance();
        add_child(*keyword, parse_expression());
        add_child(call, std::move(keyword));
        seen_keyword = true;
      } else {
        auto argument = parse_named_expression();
        if (check_keyword("for") || (check_keyword("async") && check_keyword("for", 1))) {
          auto generator = make_node(NodeKind::GeneratorExp, line);
          add_child(*generator, std::move(argument));
          parse_comprehension_clauses(*generator);
          argument = std::move(generator);
          if (call.children.size() != first_argument || !check_op(")")) {
            fail_at("Generator expression must be parenthesized", line);
          }
        } else if (check_op("=")) {
          fail("expression cannot contain assignment, perhaps you meant \"==\"?");
        }
        if (seen_keyword_unpack) {
          fail_at("positional argument follows keyword argument unpacking", line);
        }
        if (seen_keyword) {
          fail_at("positional argument follows keyword argument", line);
        }
        add_child(call, std::move(argument));
      }
      if (!accept_op(",")) {
        break;
      }
    }
    expect_op(")");
  }

  NodePtr parse_slices() {
    const int line = peek().line;
    auto first = parse_slice();
    if (!check_op(",")) {
      return first;
    }
    auto tuple = make_node(NodeKind::Tuple, line);
    add_child(*tuple, std::move(first));
    while (accept_op(",")) {
      if (check_op("]")) {
        break;
      }
      add_child(*tuple, parse_slice());
    }
    return tuple;
  }

  NodePtr parse_slice() {
    const int line = peek().line;
    NodePtr lower;
    if (!check_op(":")) {
      lower = parse_star_named_expression();
      if (!check_op(":")) {
        return lower;
      }
    }
    expect_op(":");
    auto node = make_node(NodeKind::Slice, line);
    add_child(*node, std::move(lower));
    if (!check_op(":") && !check_op("]") && !check_op(",")) {
      add_child(*node, parse_expression());
    }
    if (accept_op(":")) {
      if (!check_op("]") && !check_op(",")) {
        add_child(*node, parse_expression());
      }
    }
    return node;
  }

  void parse_comprehension_clauses(SyntaxNode &owner) {
    while (check_keyword("for") || (check_keyword("async") && check_keyword("for", 1))) {
      const int line = peek().line;
      accept_keyword("async");
      advance();
      auto clause = make_node(NodeKind::Comprehension, line);
      auto target = parse_target_list();
      validate_assign_target(*target);
      add_child(*clause, std::move(target));
      expect_keyword("in");
      add_child(*clause, parse_disjunction());
      while (accept_keyword("if")) {
        add_child(*clause, parse_disjunction());
      }
      add_child(owner, std::move(clause));
    }
  }

  [[nodiscard]] bool at_comprehension() const {
    return check_keyword("for") || (check_keyword("async") && check_keyword("for", 1));
  }

  NodePtr parse_atom() {
    DepthGuard guard(*this);
    const auto &token = peek();
    const int line = token.line;
    switch (token.type) {
    case PyTokenType::Name:
      if (token.text == "True" || token.text == "False" || token.text == "None") {
        return make_node(NodeKind::Constant, line, advance().text);
      }
      if (is_python_keyword(token.text)) {
        fail("invalid syntax");
      }
      return make_node(NodeKind::Name, line, advance().text);
    case PyTokenType::Number:
      return make_node(NodeKind::Constant, line, advance().text);
    case PyTokenType::String:
      return parse_strings();
    case PyTokenType::Op:
      if (token.text == "...") {
        return make_node(NodeKind::Constant, line, advance().text);
      }
      if (token.text == "(") {
        return parse_parenthesized();
      }
      if (token.text == "[") {
        return parse_list_display();
      }
      if (token.text == "{") {
        return parse_brace_display();
      }
      break;
    case PyTokenType::Indent:
      fail("unexpected indent");
    default:
      break;
    }
    fail("invalid syntax");
  }

  NodePtr parse_parenthesized() {
    const int line = advance().line;
    if (accept_op(")")) {
      return make_node(NodeKind::Tuple, line);
    }
    if (check_keyword("yield")) {
      auto yield = parse_yield_expr();
      expect_op(")");
      return yield;
    }
    auto first = parse_star_named_expression();
    if (at_comprehension()) {
      auto generator = make_node(NodeKind::GeneratorExp, line);
      add_child(*generator, std::move(first));
      parse_comprehension_clauses(*generator);
      expect_op(")");
      return generator;
    }
    if (check_op(",")) {
      auto tuple = make_node(NodeKind::Tuple, line);
      add_child(*tuple, std::move(first));
      while (accept_op(",")) {
        if (check_op(")")) {
          break;
        }
        add_child(*tuple, parse_star_named_expression());
      }
      expect_op(")");
      return tuple;
    }
    expect_op(")");
    if (first->kind == NodeKind::Starred) {
      fail_at("cannot use starred expression here", first->line);
    }
    return first;
  }

  NodePtr parse_list_display() {
    const int line = advance().line;
    auto list = make_node(NodeKind::List, line);
    if (accept_op("]")) {
      return list;
    }
    auto first = parse_star_named_expression();
    if (at_comprehension()) {
      auto comprehension = make_node(NodeKind::ListComp, line);
      add_child(*comprehension, std::move(first));
      parse_comprehension_clauses(*comprehension);
      expect_op("]");
      return comprehension;
    }
    add_child(*list, std::move(first));
    while (accept_op(",")) {
      if (check_op("]")) {
        break;
      }
      add_child(*list, parse_star_named_expression());
    }
    expect_op("]");
    return list;
  }

  NodePtr parse_brace_display() {
    const int line = advance().line;
    if (accept_op("}")) {
      return make_node(NodeKind::Dict, line);
    }

    if (check_op("**")) {
      return parse_dict_rest(make_node(NodeKind::Dict, line));
    }

    auto first = parse_star_named_expression();
    if (accept_op(":")) {
      if (first->kind == NodeKind::Starred) {
        fail("cannot use a starred expression in a dictionary key");
      }
      auto value = parse_expression();
      if (at_comprehension()) {
        auto comprehension = make_node(NodeKind::DictComp, line);
        add_child(*comprehension, std::move(first));
        add_child(*comprehension, std::move(value));
        parse_comprehension_clauses(*comprehension);
        expect_op("}");
        return comprehension;
      }
      auto dict = make_node(NodeKind::Dict, line);
      add_child(*dict, std::move(first));
      add_child(*dict, std::move(value));
      if (!accept_op(",")) {
        expect_op("}");
        return dict;
      }
      return parse_dict_rest(std::move(dict));
    }

    if (at_comprehension()) {
      auto comprehension = make_node(NodeKind::SetComp, line);
      add_child(*comprehension, std::move(first));
      parse_comprehension_clauses(*comprehension);
      expect_op("}");
      return comprehension;
    }

    auto set = make_node(NodeKind::Set, line);
    add_child(*set, std::move(first));
    while (accept_op(",")) {
      if (check_op("}")) {
        break;
      }
      add_child(*set, parse_star_named_expression());
    }
    expect_op("}");
    return set;
  }

  // Remaining `key: value` / `**mapping` entries up to and including the closing brace.
  NodePtr parse_dict_rest(NodePtr dict) {
    while (!check_op("}")) {
      if (accept_op("**")) {
        add_child(*dict, parse_bitwise_or());
      } else {
        add_child(*dict, parse_expression());
        expect_op(":");
        add_child(*dict, parse_expression());
      }
      if (!accept_op(",")) {
        break;
      }
    }
    expect_op("}");
    return dict;
  }

  NodePtr parse_strings() {
    const int line = peek().line;
    bool has_fstring = false;
    bool has_bytes = false;
    bool has_text = false;
    std::vector<NodePtr> fields;
    std::string literal;

    while (peek().type == PyTokenType::String) {
      const PyToken &token = advance();
      const bool is_bytes = token.prefix.find('b') != std::string::npos;
      (is_bytes ? has_bytes : has_text) = true;
      if (token.prefix.find('f') != std::string::npos) {
        has_fstring = true;
        parse_fstring_body(token.body, token.prefix.find('r') != std::string::npos, token.line,
                           fields);
      }
      literal += token.text;
    }

    if (has_bytes && has_text) {
      fail_at("cannot mix bytes and nonbytes literals", line);
    }
    if (!has_fstring) {
      return make_node(NodeKind::Constant, line, literal);
    }
    auto joined = make_node(NodeKind::JoinedStr, line);
    for (auto &field : fields) {
      add_child(*joined, std::move(field));
    }
    return joined;
  }

  // f-string replacement fields -----------------------------------------------

  static int line_at(const std::string &body, const std::size_t offset, const int first_line) {
    return first_line +
           static_cast<int>(std::count(body.begin(), body.begin() + static_cast<long>(offset),
                                       '\n'));
  }

  void parse_fstring_body(const std::string &body, const bool raw, const int line,
                          std::vector<NodePtr> &fields) {
    std::size_t i = 0;
    while (i < body.size()) {
      const char ch = body[i];
      if (ch == '{') {
        if (i + 1 < body.size() && body[i + 1] == '{') {
          i += 2;
          continue;
        }
        i = parse_replacement_field(body, i, line, fields);
        continue;
      }
      if (ch == '}') {
        if (i + 1 < body.size() && body[i + 1] == '}') {
          i += 2;
          continue;
        }
        fail_at("f-string: single '}' is not allowed", line_at(body, i, line));
      }
      if (ch == '\\' && !raw) {
        if (i + 2 < body.size() && body[i + 1] == 'N' && body[i + 2] == '{') {
          const auto close = body.find('}', i + 3);
          if (close == std::string::npos) {
            fail_at("malformed \\N character escape", line_at(body, i, line));
          }
          i = close + 1;
          continue;
        }
        i += 2;
        continue;
      }
      ++i;
    }
  }

  // `open` indexes the '{'; returns the index just past the matching '}'.
  std::size_t parse_replacement_field(const std::string &body, const std::size_t open,
                                      const int line, std::vector<NodePtr> &fields) {
    DepthGuard guard(*this);
    const int field_line = line_at(body, open, line);
    std::size_t i = open + 1;
    const std::size_t expr_start = i;
    std::size_t expr_end = std::string::npos;
    int depth = 0;
    char in_quote = 0;

    while (i < body.size()) {
      const char ch = body[i];
      if (in_quote != 0) {
        if (ch == '\\') {
          fail_at("f-string expression part cannot include a backslash", field_line);
        }
        if (ch == in_quote) {
          in_quote = 0;
        }
        ++i;
        continue;
      }
      if (ch == '\'' || ch == '"') {
        in_quote = ch;
      } else if (ch == '(' || ch == '[' || ch == '{') {
        ++depth;
      } else if (ch == ')' || ch == ']' || (ch == '}' && depth > 0)) {
        if (depth == 0) {
          fail_at(std::string("f-string: unmatched '") + ch + "'", field_line);
        }
        --depth;
      } else if (depth == 0 && (ch == '}' || ch == ':')) {
        expr_end = i;
        break;
      } else if (depth == 0 && ch == '!' && (i + 1 >= body.size() || body[i + 1] != '=')) {
        expr_end = i;
        break;
      } else if (depth == 0 && ch == '=' && i + 1 < body.size() && body[i + 1] != '=' &&
                 i > expr_start &&
                 std::string_view("=!<>").find(body[i - 1]) == std::string_view::npos) {
        // Self-documenting `{expr=}`.
        expr_end = i;
        ++i;
        break;
      } else if (ch == '#') {
        fail_at("f-string expression part cannot include '#'", field_line);
      } else if (ch == '\\') {
        fail_at("f-string expression part cannot include a backslash", field_line);
      }
      ++i;
    }
    if (expr_end == std::string::npos) {
      fail_at("f-string: expecting '}'", field_line);
    }

    const std::string expression = body.substr(expr_start, expr_end - expr_start);
    if (std::all_of(expression.begin(), expression.end(),
                    [](unsigned char c) { return std::isspace(c) != 0; })) {
      fail_at("f-string: empty expression not allowed", field_line);
    }

    auto field = make_node(NodeKind::FormattedValue, field_line);
    add_child(*field, parse_fstring_expression(expression, field_line));

    if (i < body.size() && body[i] == '!') {
      ++i;
      if (i >= body.size() || std::string_view("sra").find(body[i]) == std::string_view::npos) {
        fail_at("f-string: invalid conversion character", field_line);
      }
      field->value = std::string("!") + body[i];
      ++i;
    }
    if (i < body.size() && body[i] == ':') {
      ++i;
      std::vector<NodePtr> spec_fields;
      while (i < body.size() && body[i] != '}') {
        if (body[i] == '{') {
          i = parse_replacement_field(body, i, line, spec_fields);
          continue;
        }
        ++i;
      }
      for (auto &spec_field : spec_fields) {
        add_child(*field, std::move(spec_field));
      }
    }
    if (i >= body.size() || body[i] != '}') {
      fail_at("f-string: expecting '}'", field_line);
    }
    fields.push_back(std::move(field));
    return i + 1;
  }

  NodePtr parse_fstring_expression(const std::string &expression, int line);

  std::vector<PyToken> tokens_;
  std::size_t pos_ = 0;
  int depth_ = 0;
};

std::vector<PyToken> run_tokenizer(const std::string &source, const int first_line) {
  Tokenizer tokenizer(source, first_line);
  return tokenizer.run();
}

NodePtr Parser::parse_fstring_expression(const std::string &expression, const int line) {
  Parser nested(run_tokenizer("(" + expression + ")", line));
  nested.depth_ = depth_;
  return nested.parse_embedded_expression();
}

} // namespace

std::string_view node_kind_name(const NodeKind kind) {
  switch (kind) {
  case NodeKind::Module:
    return "Module";
  case NodeKind::FunctionDef:
    return "FunctionDef";
  case NodeKind::AsyncFunctionDef:
    return "AsyncFunctionDef";
  case NodeKind::ClassDef:
    return "ClassDef";
  case NodeKind::Return:
    return "Return";
  case NodeKind::Delete:
    return "Delete";
  case NodeKind::Assign:
    return "Assign";
  case NodeKind::AugAssign:
    return "AugAssign";
  case NodeKind::AnnAssign:
    return "AnnAssign";
  case NodeKind::For:
    return "For";
  case NodeKind::AsyncFor:
    return "AsyncFor";
  case NodeKind::While:
    return "While";
  case NodeKind::If:
    return "If";
  case NodeKind::With:
    return "With";
  case NodeKind::AsyncWith:
    return "AsyncWith";
  case NodeKind::Raise:
    return "Raise";
  case NodeKind::Try:
    return "Try";
  case NodeKind::TryStar:
    return "TryStar";
  case NodeKind::Assert:
    return "Assert";
  case NodeKind::Import:
    return "Import";
  case NodeKind::ImportFrom:
    return "ImportFrom";
  case NodeKind::Global:
    return "Global";
  case NodeKind::Nonlocal:
    return "Nonlocal";
  case NodeKind::Expr:
    return "Expr";
  case NodeKind::Pass:
    return "Pass";
  case NodeKind::Break:
    return "Break";
  case NodeKind::Continue:
    return "Continue";
  case NodeKind::BoolOp:
    return "BoolOp";
  case NodeKind::NamedExpr:
    return "NamedExpr";
  case NodeKind::BinOp:
    return "BinOp";
  case NodeKind::UnaryOp:
    return "UnaryOp";
  case NodeKind::Lambda:
    return "Lambda";
  case NodeKind::IfExp:
    return "IfExp";
  case NodeKind::Dict:
    return "Dict";
  case NodeKind::Set:
    return "Set";
  case NodeKind::ListComp:
    return "ListComp";
  case NodeKind::SetComp:
    return "SetComp";
  case NodeKind::DictComp:
    return "DictComp";
  case NodeKind::GeneratorExp:
    return "GeneratorExp";
  case NodeKind::Await:
    return "Await";
  case NodeKind::Yield:
    return "Yield";
  case NodeKind::YieldFrom:
    return "YieldFrom";
  case NodeKind::Compare:
    return "Compare";
  case NodeKind::Call:
    return "Call";
  case NodeKind::FormattedValue:
    return "FormattedValue";
  case NodeKind::JoinedStr:
    return "JoinedStr";
  case NodeKind::Constant:
    return "Constant";
  case NodeKind::Attribute:
    return "Attribute";
  case NodeKind::Subscript:
    return "Subscript";
  case NodeKind::Starred:
    return "Starred";
  case NodeKind::Name:
    return "Name";
  case NodeKind::List:
    return "List";
  case NodeKind::Tuple:
    return "Tuple";
  case NodeKind::Slice:
    return "Slice";
  case NodeKind::Comprehension:
    return "comprehension";
  case NodeKind::ExceptHandler:
    return "ExceptHandler";
  case NodeKind::Arguments:
    return "arguments";
  case NodeKind::Arg:
    return "arg";
  case NodeKind::Keyword:
    return "keyword";
  case NodeKind::Alias:
    return "alias";
  case NodeKind::WithItem:
    return "withitem";
  }
  return "Unknown";
}

bool is_python_keyword(const std::string_view word) {
  return std::find(kKeywords.begin(), kKeywords.end(), word) != kKeywords.end();
}

common::Result<std::vector<PyToken>> tokenize_python(const std::string &source) {
  try {
    return common::Result<std::vector<PyToken>>::success(run_tokenizer(source, 1));
  } catch (const PySyntaxError &err) {
    return common::Result<std::vector<PyToken>>::failure(
        std::string(err.what()) + " (line " + std::to_string(err.line()) + ")",
        common::ErrorCode::InvalidArgument);
  }
}

common::Result<SyntaxTree> parse_python(const std::string &source) {
  try {
    Parser parser(run_tokenizer(source, 1));
    SyntaxTree tree;
    tree.root = parser.parse_module();
    return common::Result<SyntaxTree>::success(std::move(tree));
  } catch (const PySyntaxError &err) {
    return common::Result<SyntaxTree>::failure(std::string(err.what()) + " (line " +
                                                   std::to_string(err.line()) + ")",
                                               common::ErrorCode::InvalidArgument);
  }
}

void walk_syntax(const SyntaxNode &root, const std::function<bool(const SyntaxNode &)> &visit) {
  std::deque<const SyntaxNode *> queue;
  queue.push_back(&root);
  while (!queue.empty()) {
    const SyntaxNode *node = queue.front();
    queue.pop_front();
    if (!visit(*node)) {
      return;
    }
    for (const auto &child : node->children) {
      queue.push_back(child.get());
    }
  }
}

} // namespace codebox::security
