#include "toolwarden/tools/tool_registry.hpp"

#include "toolwarden/common/strings.hpp"

namespace toolwarden::tools {

common::Status ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
  if (tool == nullptr) {
    return common::Status::error("cannot register a null tool");
  }
  const std::string key = common::to_lower(std::string(tool->name()));
  if (key.empty()) {
    return common::Status::error("tool name is empty");
  }
  if (by_name_.contains(key)) {
    return common::Status::error("tool already registered: " + std::string(tool->name()));
  }
  by_name_[key] = tool.get();
  tools_.push_back(std::move(tool));
  return common::Status::success();
}

ITool *ToolRegistry::get_tool(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<ToolSchema> ToolRegistry::all_schemas() const {
  std::vector<ToolSchema> schemas;
  schemas.reserve(tools_.size());
  for (const auto &tool : tools_) {
    schemas.push_back(tool->schema());
  }
  return schemas;
}

} // namespace toolwarden::tools
