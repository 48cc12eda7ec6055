#include "cdpgate/cli/commands.hpp"

#include "cdpgate/common/fs.hpp"
#include "cdpgate/common/json_util.hpp"
#include "cdpgate/common/version.hpp"
#include "cdpgate/config/config.hpp"
#include "cdpgate/service/runtime.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace cdpgate::cli {

namespace {

std::string version_string() {
  std::string version = common::version();
#ifdef CDPGATE_GIT_COMMIT
  const std::string commit = CDPGATE_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "cdpgate " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string error_body(const common::ErrorCode code, const std::string &message) {
  return common::json_object({{"code", common::json_quote(std::string(
                                           common::error_code_name(code)))},
                              {"message", common::json_quote(message)}});
}

std::string failure_line(const std::string &id, const common::ErrorCode code,
                         const std::string &message) {
  return common::json_object(
      {{"id", id}, {"ok", "false"}, {"error", error_body(code, message)}});
}

common::Result<std::unique_ptr<service::Runtime>> start_runtime(const bool prewarm) {
  auto runtime = service::Runtime::from_disk();
  if (!runtime.ok()) {
    return runtime;
  }
  if (auto status = runtime.value()->start(prewarm); !status.ok()) {
    return common::Result<std::unique_ptr<service::Runtime>>::propagate(status);
  }
  return runtime;
}

int run_serve(std::vector<std::string> args) {
  const bool lazy = take_flag(args, "--lazy");
  auto runtime = start_runtime(!lazy);
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  if (auto *bridge = runtime.value()->bridge(); bridge != nullptr) {
    std::cerr << "Extension bridge listening on " << runtime.value()->config().bridge.host
              << ":" << bridge->port() << "\n";
  }
  (void)serve_stream(runtime.value()->dispatcher(), std::cin, std::cout);
  runtime.value()->stop();
  return 0;
}

int run_call(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: cdpgate call <method> [params-json]\n";
    return 1;
  }
  const std::string method = args[0];
  const std::string params_json = args.size() > 1 ? args[1] : "{}";
  const std::string trimmed = common::trim(params_json);
  if (!trimmed.starts_with('{') || !trimmed.ends_with('}')) {
    std::cerr << "params must be a JSON object\n";
    return 1;
  }

  auto runtime = start_runtime(false);
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto result = runtime.value()->dispatcher().dispatch(method, common::json_parse_object(trimmed));
  runtime.value()->stop();
  if (!result.ok()) {
    std::cerr << common::error_code_name(result.code()) << ": " << result.error() << "\n";
    return 1;
  }
  std::cout << result.value() << "\n";
  return 0;
}

int run_methods() {
  for (const auto &method : service::Dispatcher::methods()) {
    std::cout << "  " << std::left << std::setw(24) << method.name << method.description << "\n";
  }
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto validated = config::validate_config(cfg.value());
  if (!args.empty() && args[0] == "validate") {
    if (!validated.ok()) {
      std::cerr << "[FAIL] " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "[WARN] " << warning << "\n";
    }
    std::cout << "[OK] configuration is valid\n";
    return 0;
  }
  if (!args.empty() && args[0] != "show") {
    std::cerr << "unknown config command\n";
    return 1;
  }

  const auto &c = cfg.value();
  std::cout << "DevTools: "
            << (c.browser.devtools_url.empty()
                    ? c.browser.devtools_host + ":" + std::to_string(c.browser.devtools_port)
                    : c.browser.devtools_url)
            << "\n";
  std::cout << "Default session: " << c.sessions.default_id
            << (c.sessions.auto_create ? " (auto-create)" : "") << "\n";
  std::cout << "Bridge: "
            << (c.bridge.enabled
                    ? c.bridge.host + ":" + std::to_string(c.bridge.port)
                    : std::string("disabled"))
            << "\n";
  std::cout << "State dir: " << common::expand_path(c.state.dir) << "\n";
  std::cout << "Observability: " << c.observability.backend
            << (c.observability.events.empty() ? "" : " (" + c.observability.events + ")") << "\n";
  return validated.ok() ? 0 : 1;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  cdpgate" << RESET << DIM << " - browser automation gateway over CDP"
            << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "cdpgate [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "serve" << RESET << DIM
            << "                Answer NDJSON requests on stdin (--lazy skips prewarm)" << RESET
            << "\n";
  std::cout << "  " << GREEN << "call" << RESET << " METHOD [JSON]" << DIM
            << "   Dispatch a single method and print its result" << RESET << "\n";
  std::cout << "  " << GREEN << "methods" << RESET << DIM << "              List methods" << RESET
            << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM
            << "          Display effective configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config validate" << RESET << DIM
            << "      Check configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config path" << RESET << DIM << "          Print config path"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "              Show version" << RESET
            << "\n\n";
}

} // namespace

std::string handle_request_line(service::Dispatcher &dispatcher, const std::string &line) {
  const std::string trimmed = common::trim(line);
  if (!trimmed.starts_with('{')) {
    return failure_line("null", common::ErrorCode::InvalidArgument,
                        "request must be a JSON object");
  }
  const auto request = common::json_parse_object(trimmed);
  const std::string id = common::json_raw_field(request, "id");
  const auto method = common::json_string_field(request, "method");
  if (!method.has_value()) {
    return failure_line(id, common::ErrorCode::InvalidArgument, "Missing 'method' field");
  }
  const std::string params_raw = common::json_raw_field(request, "params", "{}");
  const auto params = common::json_is_null(params_raw) ? common::JsonRawMap{}
                                                       : common::json_parse_object(params_raw);

  auto result = dispatcher.dispatch(*method, params);
  if (!result.ok()) {
    return failure_line(id, result.code(), result.error());
  }
  return common::json_object({{"id", id}, {"ok", "true"}, {"result", result.value()}});
}

std::size_t serve_stream(service::Dispatcher &dispatcher, std::istream &in, std::ostream &out) {
  std::size_t answered = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (common::trim(line).empty()) {
      continue;
    }
    out << handle_request_line(dispatcher, line) << "\n";
    out.flush();
    ++answered;
  }
  return answered;
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "call") {
    return run_call(std::move(args));
  }
  if (subcommand == "methods") {
    return run_methods();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace cdpgate::cli
