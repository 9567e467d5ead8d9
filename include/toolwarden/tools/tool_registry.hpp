#pragma once

#include "toolwarden/tools/tool.hpp"

#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace toolwarden::tools {

/// Owns tool implementations. Names resolve case-insensitively.
class ToolRegistry {
public:
  ToolRegistry() = default;

  /// Fails when a tool with the same name is already registered.
  common::Status register_tool(std::unique_ptr<ITool> tool);
  [[nodiscard]] ITool *get_tool(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSchema> all_schemas() const;
  [[nodiscard]] std::size_t size() const { return tools_.size(); }

private:
  std::vector<std::unique_ptr<ITool>> tools_;
  std::unordered_map<std::string, ITool *> by_name_;
};

} // namespace toolwarden::tools
