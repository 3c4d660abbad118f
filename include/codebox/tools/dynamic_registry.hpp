#pragma once

#include "codebox/common/result.hpp"
#include "codebox/tools/tool_store.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace codebox::tools {

/// ASCII Python identifier that is not a keyword.
[[nodiscard]] bool is_valid_tool_name(const std::string &name);

/// `def name(params):\n    """doc"""\n    <body, each line indented by four spaces>\n`
[[nodiscard]] std::string assemble_tool_source(const std::string &name, const std::string &params,
                                               const std::string &body, const std::string &doc);

/// Tools are screened by both the pattern screen and the syntax-tree screen before they are
/// persisted, and again when loaded back from the store.
class DynamicToolRegistry {
public:
  explicit DynamicToolRegistry(std::shared_ptr<ToolStore> store);

  [[nodiscard]] common::Result<ToolEntry> register_tool(const std::string &name,
                                                        const std::string &params,
                                                        const std::string &body,
                                                        const std::string &doc);
  [[nodiscard]] common::Result<std::vector<ToolEntry>> list_tools();
  [[nodiscard]] common::Result<ToolEntry> find(const std::string &name);

  /// Tool source followed by `print(name(args))`.
  [[nodiscard]] common::Result<std::string> build_invocation(const std::string &name,
                                                             const std::string &args);

private:
  [[nodiscard]] common::Status ensure_loaded_locked();

  std::shared_ptr<ToolStore> store_;
  std::mutex mutex_;
  bool loaded_ = false;
  std::map<std::string, ToolEntry> tools_;
  std::vector<std::string> order_;
};

} // namespace codebox::tools
