#pragma once

#include "toolwarden/common/result.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace toolwarden::tools {

/// Argument values are JSON texts: numbers, booleans, objects and arrays stay raw,
/// strings are stored unquoted.
using ToolArgs = std::unordered_map<std::string, std::string>;

struct ContentUnit {
  std::string type = "text";
  std::string text;
};

struct ToolResult {
  std::vector<ContentUnit> content;
  bool success = true;
  std::unordered_map<std::string, std::string> metadata;
};

/// `parameters_json` is a JSON schema object: {"properties": {name: {description, examples}}}.
struct ToolSchema {
  std::string name;
  std::string description;
  std::string parameters_json;
};

struct ToolContext {
  std::string principal_id;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  [[nodiscard]] ToolSchema schema() const;
};

/// Single text unit result.
[[nodiscard]] ToolResult text_result(std::string text);

} // namespace toolwarden::tools
