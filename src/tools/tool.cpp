#include "toolwarden/tools/tool.hpp"

namespace toolwarden::tools {

ToolSchema ITool::schema() const {
  return ToolSchema{.name = std::string(name()),
                    .description = std::string(description()),
                    .parameters_json = parameters_schema()};
}

ToolResult text_result(std::string text) {
  ToolResult result;
  result.content.push_back(ContentUnit{.type = "text", .text = std::move(text)});
  return result;
}

} // namespace toolwarden::tools
