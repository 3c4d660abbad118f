#include "codebox/cli/commands.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/config/config.hpp"
#include "codebox/gateway/sandbox_api.hpp"
#include "codebox/kernel/kernel_server.hpp"
#include "codebox/observability/factory.hpp"
#include "codebox/observability/global.hpp"
#include "codebox/sandbox/manager.hpp"
#include "codebox/security/code_screen.hpp"
#include "codebox/security/syntax_screen.hpp"
#include "codebox/tools/dynamic_registry.hpp"
#include "codebox/tools/tool_store.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace codebox::cli {

namespace {

volatile std::sig_atomic_t g_signal = 0;

void handle_signal(const int signal) { g_signal = signal; }

std::string version_string() {
#ifdef CODEBOX_VERSION
  return std::string("codebox ") + CODEBOX_VERSION;
#else
  return "codebox 0.1.0";
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
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
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

template <typename T> bool parse_unsigned(const std::string &raw, T &out) {
  unsigned long long value = 0;
  const auto *begin = raw.data();
  const auto *end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (raw.empty() || ec != std::errc() || ptr != end ||
      value > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
    return false;
  }
  out = static_cast<T>(value);
  return true;
}

common::Result<std::string> read_source(const std::string &path) {
  std::ostringstream out;
  if (path == "-") {
    out << std::cin.rdbuf();
    return common::Result<std::string>::success(out.str());
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return common::Result<std::string>::failure("cannot read " + path,
                                                common::ErrorCode::NotFound);
  }
  out << file.rdbuf();
  return common::Result<std::string>::success(out.str());
}

void install_signal_handlers() {
  g_signal = 0;
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);
  std::signal(SIGPIPE, SIG_IGN);
}

void wait_for_signal() {
  while (g_signal == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
}

common::Result<config::Config> load_validated_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<config::Config>::propagate(warnings);
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return cfg;
}

int run_serve(std::vector<std::string> args) {
  auto cfg = load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  config::Config config = cfg.value();

  std::string host;
  std::string port_raw;
  const bool skip_image = take_flag(args, "--skip-image-check");
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  if (!host.empty()) {
    config.server.host = host;
  }
  if (!port_raw.empty() && !parse_unsigned(port_raw, config.server.port)) {
    std::cerr << "invalid port: " << port_raw << "\n";
    return 1;
  }

  observability::set_global_observer(observability::create_observer(config));

  sandbox::SandboxManager manager(config.sandbox);
  if (!skip_image) {
    const auto image = manager.prepare_image();
    if (!image.ok()) {
      std::cerr << image.error() << "\n";
      return 1;
    }
  }

  std::shared_ptr<tools::ToolStore> store;
  std::unique_ptr<tools::DynamicToolRegistry> registry;
  if (config.tools.enabled) {
    store = std::make_shared<tools::ToolStore>(common::expand_path(config.tools.db_path));
    if (!store->is_open()) {
      std::cerr << "cannot open tool database " << store->path().string() << "\n";
      return 1;
    }
    registry = std::make_unique<tools::DynamicToolRegistry>(store);
  }

  gateway::SandboxApi api(manager, registry.get(),
                          gateway::make_access_control(config.server, config.rate_limit));
  gateway::HttpServer server([&api](const gateway::HttpRequest &request) {
    return api.handle(request);
  });

  install_signal_handlers();
  manager.start_reaper();
  const auto started = server.start(gateway::HttpServerOptions{
      .host = config.server.host,
      .port = config.server.port,
      .read_timeout = std::chrono::milliseconds(config.server.read_timeout_ms),
      .max_body_bytes = config.server.max_body_bytes,
  });
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    manager.shutdown();
    return 1;
  }

  std::cout << "codebox listening on " << config.server.host << ":" << server.port() << "\n";
  observability::record_lifecycle("cli", "serving on port " + std::to_string(server.port()));

  wait_for_signal();

  observability::record_lifecycle("cli", "signal " + std::to_string(g_signal) + ", shutting down");
  server.stop();
  manager.shutdown();
  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_check(std::vector<std::string> args) {
  const bool as_tool = take_flag(args, "--tool");
  if (args.size() != 1) {
    std::cerr << "usage: codebox check <file|-> [--tool]\n";
    return 1;
  }
  auto source = read_source(args[0]);
  if (!source.ok()) {
    std::cerr << source.error() << "\n";
    return 1;
  }

  auto status = security::screen_patterns(source.value());
  if (status.ok() && as_tool) {
    status = security::screen_syntax(source.value());
  }
  if (!status.ok()) {
    std::cout << "rejected: " << status.error() << "\n";
    return 2;
  }
  std::cout << "ok\n";
  return 0;
}

int run_tools(std::vector<std::string> args) {
  if (args.empty() || args[0] != "list") {
    std::cerr << "usage: codebox tools list\n";
    return 1;
  }
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  auto store = std::make_shared<tools::ToolStore>(common::expand_path(cfg.value().tools.db_path));
  tools::DynamicToolRegistry registry(store);
  auto listed = registry.list_tools();
  if (!listed.ok()) {
    std::cerr << listed.error() << "\n";
    return 1;
  }
  if (listed.value().empty()) {
    std::cout << "No tools registered.\n";
    return 0;
  }
  for (const auto &tool : listed.value()) {
    std::cout << tool.name << "(" << tool.params << ")";
    if (!tool.doc.empty()) {
      std::cout << "  " << tool.doc;
    }
    std::cout << "\n";
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: codebox [--config <path>] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  serve [--host H] [--port P] [--skip-image-check]  Run the sandbox API server\n";
  std::cout << "  check <file|-> [--tool]                           Screen code without running it\n";
  std::cout << "  tools list                                        List registered tools\n";
  std::cout << "  config-path                                       Print the config file path\n";
  std::cout << "  version                                           Print the version\n";
  std::cout << "  help                                              Show this help\n";
}

} // namespace

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
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "check") {
    return run_check(std::move(args));
  }
  if (subcommand == "tools") {
    return run_tools(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

int run_kernel_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  if (take_flag(args, "--help") || take_flag(args, "-h")) {
    std::cout << "Usage: codebox-kernel [--host H] [--port P] [--timeout-ms N] [--python BIN]\n";
    return 0;
  }

  const config::KernelConfig defaults;
  std::string host = defaults.host;
  std::string port_raw;
  std::string timeout_raw;
  std::string python;
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  (void)take_option(args, "--timeout-ms", "", timeout_raw);
  (void)take_option(args, "--python", "", python);
  if (!args.empty()) {
    std::cerr << "unexpected argument: " << args[0] << "\n";
    return 1;
  }

  std::uint16_t port = defaults.port;
  if (!port_raw.empty() && !parse_unsigned(port_raw, port)) {
    std::cerr << "invalid port: " << port_raw << "\n";
    return 1;
  }
  std::uint32_t timeout_ms = defaults.exec_timeout_ms;
  if (!timeout_raw.empty() && (!parse_unsigned(timeout_raw, timeout_ms) || timeout_ms == 0)) {
    std::cerr << "invalid timeout: " << timeout_raw << "\n";
    return 1;
  }

  kernel::ExecutorOptions executor{
      .interpreter = defaults.interpreter,
      .timeout = std::chrono::milliseconds(timeout_ms),
      .max_output_bytes = defaults.max_output_bytes,
  };
  if (!python.empty()) {
    executor.interpreter.front() = python;
  }

  install_signal_handlers();
  kernel::KernelServer server(std::move(executor));
  const auto started = server.start(gateway::HttpServerOptions{.host = host, .port = port});
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }
  std::cout << "codebox-kernel listening on " << host << ":" << server.port() << "\n"
            << std::flush;

  wait_for_signal();
  server.stop();
  return 0;
}

} // namespace codebox::cli
