#include "codebox/tools/dynamic_registry.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/observability/global.hpp"
#include "codebox/security/code_screen.hpp"
#include "codebox/security/python_syntax.hpp"
#include "codebox/security/syntax_screen.hpp"

#include <cctype>

namespace codebox::tools {

namespace {

constexpr const char *kComponent = "tools";

common::Status screen_source(const std::string &source) {
  const auto patterns = security::screen_patterns(source);
  if (!patterns.ok()) {
    observability::record_validation_rejected("pattern", patterns.error());
    return patterns;
  }
  const auto syntax = security::screen_syntax(source);
  if (!syntax.ok()) {
    observability::record_validation_rejected("syntax", syntax.error());
    return syntax;
  }
  return common::Status::success();
}

} // namespace

bool is_valid_tool_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  const auto first = static_cast<unsigned char>(name.front());
  if (std::isalpha(first) == 0 && first != '_') {
    return false;
  }
  for (const char ch : name) {
    const auto c = static_cast<unsigned char>(ch);
    if (c >= 0x80U || (std::isalnum(c) == 0 && c != '_')) {
      return false;
    }
  }
  return !security::is_python_keyword(name);
}

std::string assemble_tool_source(const std::string &name, const std::string &params,
                                 const std::string &body, const std::string &doc) {
  std::string indented;
  const auto lines = common::split(common::trim(body), '\n');
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      indented += "\n    ";
    }
    indented += lines[i];
  }
  return "def " + name + "(" + params + "):\n    \"\"\"" + doc + "\"\"\"\n    " + indented + "\n";
}

DynamicToolRegistry::DynamicToolRegistry(std::shared_ptr<ToolStore> store)
    : store_(std::move(store)) {}

common::Status DynamicToolRegistry::ensure_loaded_locked() {
  if (loaded_) {
    return common::Status::success();
  }
  if (store_ == nullptr) {
    return common::Status::error("tool store is not configured");
  }
  auto rows = store_->list();
  if (!rows.ok()) {
    return common::Status::error(rows.error(), rows.code());
  }

  for (auto &row : rows.value()) {
    const auto screened = screen_source(row.source);
    if (!screened.ok()) {
      observability::record_error(kComponent, "skipping stored tool '" + row.name +
                                                  "': " + screened.error());
      continue;
    }
    if (tools_.contains(row.name)) {
      continue;
    }
    order_.push_back(row.name);
    tools_.emplace(row.name, std::move(row));
  }
  loaded_ = true;
  return common::Status::success();
}

common::Result<ToolEntry> DynamicToolRegistry::register_tool(const std::string &name,
                                                             const std::string &params,
                                                             const std::string &body,
                                                             const std::string &doc) {
  if (!is_valid_tool_name(name)) {
    return common::Result<ToolEntry>::failure("'" + name + "' is not a valid Python identifier",
                                              common::ErrorCode::InvalidArgument);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto loaded = ensure_loaded_locked();
  if (!loaded.ok()) {
    return common::Result<ToolEntry>::propagate(loaded);
  }
  if (tools_.contains(name)) {
    return common::Result<ToolEntry>::failure("tool '" + name + "' already exists",
                                              common::ErrorCode::AlreadyExists);
  }

  ToolEntry entry{
      .name = name,
      .params = params,
      .body = body,
      .doc = doc,
      .source = assemble_tool_source(name, params, body, doc),
      .created_at = common::now_rfc3339(),
  };
  const auto screened = screen_source(entry.source);
  if (!screened.ok()) {
    return common::Result<ToolEntry>::propagate(screened);
  }

  const auto stored = store_->insert(entry);
  if (!stored.ok()) {
    return common::Result<ToolEntry>::propagate(stored);
  }

  order_.push_back(name);
  tools_.emplace(name, entry);
  observability::record_tool_registered(name);
  return common::Result<ToolEntry>::success(std::move(entry));
}

common::Result<std::vector<ToolEntry>> DynamicToolRegistry::list_tools() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto loaded = ensure_loaded_locked();
  if (!loaded.ok()) {
    return common::Result<std::vector<ToolEntry>>::propagate(loaded);
  }
  std::vector<ToolEntry> out;
  out.reserve(order_.size());
  for (const auto &name : order_) {
    out.push_back(tools_.at(name));
  }
  return common::Result<std::vector<ToolEntry>>::success(std::move(out));
}

common::Result<ToolEntry> DynamicToolRegistry::find(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto loaded = ensure_loaded_locked();
  if (!loaded.ok()) {
    return common::Result<ToolEntry>::propagate(loaded);
  }
  const auto it = tools_.find(name);
  if (it == tools_.end()) {
    return common::Result<ToolEntry>::failure("tool not found: " + name,
                                              common::ErrorCode::NotFound);
  }
  return common::Result<ToolEntry>::success(it->second);
}

common::Result<std::string> DynamicToolRegistry::build_invocation(const std::string &name,
                                                                  const std::string &args) {
  if (args.find('\n') != std::string::npos || args.find('\r') != std::string::npos) {
    return common::Result<std::string>::failure("tool arguments must be a single line",
                                                common::ErrorCode::InvalidArgument);
  }
  auto tool = find(name);
  if (!tool.ok()) {
    return common::Result<std::string>::propagate(tool);
  }
  return common::Result<std::string>::success(tool.value().source + "\nprint(" + name + "(" +
                                              args + "))\n");
}

} // namespace codebox::tools
