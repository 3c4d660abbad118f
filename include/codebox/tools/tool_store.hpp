#pragma once

#include "codebox/common/result.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace codebox::tools {

struct ToolEntry {
  std::string name;
  std::string params;
  std::string body;
  std::string doc;
  // Assembled function source, exactly as screened.
  std::string source;
  std::string created_at;
};

/// sqlite-backed persistence for registered tools. Rows are insert-only.
class ToolStore {
public:
  explicit ToolStore(std::filesystem::path db_path);
  ~ToolStore();

  ToolStore(const ToolStore &) = delete;
  ToolStore &operator=(const ToolStore &) = delete;

  [[nodiscard]] bool is_open() const { return db_ != nullptr; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  /// AlreadyExists when a tool with the same name is stored.
  [[nodiscard]] common::Status insert(const ToolEntry &entry);
  [[nodiscard]] common::Result<std::vector<ToolEntry>> list();

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  std::string open_error_;
  std::mutex mutex_;
  sqlite3 *db_ = nullptr;
};

} // namespace codebox::tools
