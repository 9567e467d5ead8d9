#include "toolwarden/cli/commands.hpp"

#include "toolwarden/common/json_util.hpp"
#include "toolwarden/common/strings.hpp"
#include "toolwarden/config/config.hpp"
#include "toolwarden/runtime/security_service.hpp"
#include "toolwarden/security/sanitizer.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace toolwarden::cli {

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_THREATS = 2;

std::string version_string() {
#ifdef TOOLWARDEN_VERSION
  return std::string("toolwarden ") + TOOLWARDEN_VERSION;
#else
  return "toolwarden 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 std::string &out_value, std::string &error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + long_name;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  std::string path;
  if (take_option(args, "--config", path, error)) {
    if (path.empty()) {
      error = "missing value for --config";
      return false;
    }
    config::set_config_path_override(path);
    return true;
  }
  return error.empty();
}

std::string join_tokens(const std::vector<std::string> &args) {
  std::ostringstream out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

/// `-` or no positional text means read from stdin.
std::string text_argument(const std::vector<std::string> &args) {
  if (args.empty() || (args.size() == 1 && args[0] == "-")) {
    return read_stdin_all();
  }
  return join_tokens(args);
}

common::Result<std::shared_ptr<runtime::SecurityService>>
build_service(const std::optional<std::string> &mode_override = std::nullopt) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<std::shared_ptr<runtime::SecurityService>>::failure(loaded.error());
  }
  if (mode_override.has_value()) {
    loaded.value().security.sanitization_mode = *mode_override;
  }
  return runtime::SecurityService::create(std::move(loaded.value()));
}

void print_help() {
  std::cout << "usage: toolwarden [--config PATH] <command> [args]\n\n"
            << "commands:\n"
            << "  scan-text [--context C] <text|->      scan text for injection patterns\n"
            << "  scan-schema <file.json>                scan one tool schema or an array of them\n"
            << "  sanitize [--mode M] <text|->           scan text as a tool response and sanitize it\n"
            << "  check-config                           validate the configuration file\n"
            << "  config-path                            print the resolved config path\n"
            << "  version                                print the version\n\n"
            << "Scans exit with status 2 when threats are found.\n";
}

int run_scan_text(std::vector<std::string> args) {
  std::string context;
  std::string error;
  const bool has_context = take_option(args, "--context", context, error);
  if (!error.empty()) {
    std::cerr << error << "\n";
    return EXIT_ERROR;
  }

  auto service = build_service();
  if (!service.ok()) {
    std::cerr << service.error() << "\n";
    return EXIT_ERROR;
  }

  const std::string text = text_argument(args);
  const auto result = service.value()->scanner()->scan_text(
      text, has_context ? std::optional<std::string>(context) : std::nullopt);
  std::cout << security::scan_result_to_json(result) << "\n";
  return result.safe() ? EXIT_OK : EXIT_THREATS;
}

int run_scan_schema(const std::vector<std::string> &args) {
  if (args.size() != 1) {
    std::cerr << "usage: toolwarden scan-schema <file.json>\n";
    return EXIT_ERROR;
  }
  std::ifstream file(args[0]);
  if (!file) {
    std::cerr << "Unable to open schema file: " << args[0] << "\n";
    return EXIT_ERROR;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  const std::string json = common::trim(buffer.str());

  std::vector<std::string> documents;
  if (!json.empty() && json.front() == '[') {
    documents = common::json_split_array(json);
  } else if (!json.empty() && json.front() == '{') {
    documents.push_back(json);
  } else {
    std::cerr << "schema file must contain a JSON object or array: " << args[0] << "\n";
    return EXIT_ERROR;
  }

  auto service = build_service();
  if (!service.ok()) {
    std::cerr << service.error() << "\n";
    return EXIT_ERROR;
  }

  bool all_safe = true;
  std::cout << "[";
  for (std::size_t i = 0; i < documents.size(); ++i) {
    const auto fields = common::json_parse_flat(documents[i]);
    tools::ToolSchema schema;
    if (const auto it = fields.find("name"); it != fields.end()) {
      schema.name = it->second;
    }
    if (const auto it = fields.find("description"); it != fields.end()) {
      schema.description = it->second;
    }
    if (const auto it = fields.find("parameters"); it != fields.end()) {
      schema.parameters_json = it->second;
    } else if (const auto alt = fields.find("inputSchema"); alt != fields.end()) {
      schema.parameters_json = alt->second;
    }

    const auto result = service.value()->scanner()->scan_tool_schema(schema);
    all_safe = all_safe && result.safe();
    if (i > 0) {
      std::cout << ",";
    }
    std::cout << "{\"tool\":" << common::json_quote(schema.name)
              << ",\"result\":" << security::scan_result_to_json(result) << "}";
  }
  std::cout << "]\n";
  return all_safe ? EXIT_OK : EXIT_THREATS;
}

int run_sanitize(std::vector<std::string> args) {
  std::string mode;
  std::string error;
  const bool has_mode = take_option(args, "--mode", mode, error);
  if (!error.empty()) {
    std::cerr << error << "\n";
    return EXIT_ERROR;
  }

  auto service =
      build_service(has_mode ? std::optional<std::string>(mode) : std::optional<std::string>());
  if (!service.ok()) {
    std::cerr << service.error() << "\n";
    return EXIT_ERROR;
  }

  const std::string text = text_argument(args);
  auto result = service.value()->scanner()->scan_tool_response(text);
  const std::string output = service.value()->sanitizer()->sanitize(text, result);
  std::cout << "{\"mode\":"
            << common::json_quote(
                   security::sanitization_mode_to_string(service.value()->sanitizer()->mode()))
            << ",\"content\":" << common::json_quote(output)
            << ",\"scan\":" << security::scan_result_to_json(result) << "}\n";
  return result.safe() ? EXIT_OK : EXIT_THREATS;
}

int run_check_config() {
  const auto path = config::config_path();
  if (path.ok()) {
    std::cout << "Config: " << path.value().string() << "\n";
  }

  std::vector<std::string> warnings;
  common::Result<config::Config> loaded = common::Result<config::Config>::failure("");
  if (path.ok() && std::filesystem::exists(path.value())) {
    std::ifstream file(path.value());
    std::stringstream buffer;
    buffer << file.rdbuf();
    loaded = config::parse_config(buffer.str(), &warnings);
    if (loaded.ok()) {
      config::apply_env_overrides(loaded.value());
    }
  } else {
    loaded = config::load_config();
    warnings.push_back("config file not found; using defaults");
  }
  if (!loaded.ok()) {
    std::cerr << "[FAIL] " << loaded.error() << "\n";
    return EXIT_ERROR;
  }

  const auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    std::cerr << "[FAIL] " << validated.error() << "\n";
    return EXIT_ERROR;
  }
  for (const auto &warning : warnings) {
    std::cout << "[WARN] " << warning << "\n";
  }
  for (const auto &warning : validated.value()) {
    std::cout << "[WARN] " << warning << "\n";
  }
  std::cout << "[OK] configuration is valid\n";
  return EXIT_OK;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return EXIT_ERROR;
  }

  if (args.empty()) {
    print_help();
    return EXIT_OK;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return EXIT_OK;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return EXIT_OK;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return EXIT_ERROR;
    }
    std::cout << path_result.value().string() << "\n";
    return EXIT_OK;
  }
  if (subcommand == "scan-text") {
    return run_scan_text(std::move(args));
  }
  if (subcommand == "scan-schema") {
    return run_scan_schema(args);
  }
  if (subcommand == "sanitize") {
    return run_sanitize(std::move(args));
  }
  if (subcommand == "check-config") {
    return run_check_config();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return EXIT_ERROR;
}

} // namespace toolwarden::cli
