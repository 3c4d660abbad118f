#include "codebox/config/config.hpp"

#include "codebox/common/fs.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace codebox::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".codebox";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("CODEBOX_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

template <typename T>
common::Status read_unsigned(const common::TomlDocument &doc, const std::string &key, T &out) {
  if (!doc.has(key)) {
    return common::Status::success();
  }
  const auto parsed = doc.get_integer(key);
  if (!parsed.has_value() || *parsed < 0 ||
      static_cast<std::uint64_t>(*parsed) > std::numeric_limits<T>::max()) {
    return common::Status::error(key + " must be an integer between 0 and " +
                                     std::to_string(std::numeric_limits<T>::max()),
                                 common::ErrorCode::InvalidArgument);
  }
  out = static_cast<T>(*parsed);
  return common::Status::success();
}

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }
  static const std::regex host_re(
      R"(^(([a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)*[a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?|((25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9])\.){3}(25[0-5]|2[0-4][0-9]|[01]?[0-9]?[0-9]))$)");
  return std::regex_match(host, host_re);
}

bool is_valid_memory_limit(const std::string &value) {
  static const std::regex memory_re(R"(^[0-9]+[bkmgBKMG]?$)");
  return std::regex_match(value, memory_re);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::propagate(home);
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec)) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::propagate(dir);
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *key = std::getenv("SANDBOX_API_KEY"); key != nullptr && *key != '\0') {
    config.server.api_key = key;
  }
  if (const char *host = std::getenv("CODEBOX_HOST"); host != nullptr && *host != '\0') {
    config.server.host = host;
  }
  if (const char *port = std::getenv("CODEBOX_PORT"); port != nullptr && *port != '\0') {
    char *end = nullptr;
    const long parsed = std::strtol(port, &end, 10);
    if (end != nullptr && *end == '\0' && parsed > 0 && parsed <= 65535) {
      config.server.port = static_cast<std::uint16_t>(parsed);
    }
  }
  if (const char *image = std::getenv("CODEBOX_SANDBOX_IMAGE");
      image != nullptr && *image != '\0') {
    config.sandbox.image = image;
  }
  if (const char *db = std::getenv("CODEBOX_TOOLS_DB"); db != nullptr && *db != '\0') {
    config.tools.db_path = common::expand_path(db);
  }
}

common::Result<Config> config_from_toml(const common::TomlDocument &doc) {
  Config config;

  config.server.host = doc.get_string("server.host", config.server.host);
  config.server.api_key = expand_config_value(doc.get_string("server.api_key"));

  auto &sandbox = config.sandbox;
  sandbox.image = doc.get_string("sandbox.image", sandbox.image);
  sandbox.build_context = expand_config_value(doc.get_string("sandbox.build_context"));
  sandbox.container_prefix = doc.get_string("sandbox.container_prefix", sandbox.container_prefix);
  sandbox.memory_limit = doc.get_string("sandbox.memory_limit", sandbox.memory_limit);

  config.rate_limit.enabled = doc.get_bool("rate_limit.enabled", config.rate_limit.enabled);
  config.tools.enabled = doc.get_bool("tools.enabled", config.tools.enabled);
  config.tools.db_path = doc.get_string("tools.db_path", config.tools.db_path);

  config.kernel.host = doc.get_string("kernel.host", config.kernel.host);
  config.kernel.interpreter = doc.get_string_array("kernel.interpreter", config.kernel.interpreter);

  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));

  const common::Status numeric[] = {
      read_unsigned(doc, "server.port", config.server.port),
      read_unsigned(doc, "server.read_timeout_ms", config.server.read_timeout_ms),
      read_unsigned(doc, "server.max_body_bytes", config.server.max_body_bytes),
      read_unsigned(doc, "sandbox.kernel_port", sandbox.kernel_port),
      read_unsigned(doc, "sandbox.cpu_quota", sandbox.cpu_quota),
      read_unsigned(doc, "sandbox.cpu_period", sandbox.cpu_period),
      read_unsigned(doc, "sandbox.pids_limit", sandbox.pids_limit),
      read_unsigned(doc, "sandbox.port_range_start", sandbox.port_range_start),
      read_unsigned(doc, "sandbox.port_range_end", sandbox.port_range_end),
      read_unsigned(doc, "sandbox.idle_ttl_seconds", sandbox.idle_ttl_seconds),
      read_unsigned(doc, "sandbox.reap_interval_seconds", sandbox.reap_interval_seconds),
      read_unsigned(doc, "sandbox.execute_timeout_ms", sandbox.execute_timeout_ms),
      read_unsigned(doc, "sandbox.kernel_ready_timeout_ms", sandbox.kernel_ready_timeout_ms),
      read_unsigned(doc, "sandbox.stop_grace_seconds", sandbox.stop_grace_seconds),
      read_unsigned(doc, "sandbox.shutdown_grace_seconds", sandbox.shutdown_grace_seconds),
      read_unsigned(doc, "sandbox.docker_timeout_ms", sandbox.docker_timeout_ms),
      read_unsigned(doc, "rate_limit.max_requests", config.rate_limit.max_requests),
      read_unsigned(doc, "rate_limit.window_seconds", config.rate_limit.window_seconds),
      read_unsigned(doc, "kernel.port", config.kernel.port),
      read_unsigned(doc, "kernel.exec_timeout_ms", config.kernel.exec_timeout_ms),
      read_unsigned(doc, "kernel.max_output_bytes", config.kernel.max_output_bytes),
  };
  for (const auto &status : numeric) {
    if (!status.ok()) {
      return common::Result<Config>::propagate(status);
    }
  }

  config.tools.db_path = common::expand_path(config.tools.db_path);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Result<Config>::propagate(path_result);
  }

  const auto &path = path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    config.tools.db_path = common::expand_path(config.tools.db_path);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  const auto parsed = common::parse_toml(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(),
                                           parsed.code());
  }

  auto config = config_from_toml(parsed.value());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Outcome = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.server.port == 0) {
    return Outcome::failure("server.port must be 1-65535", common::ErrorCode::InvalidArgument);
  }
  if (!is_valid_host(config.server.host)) {
    return Outcome::failure("server.host is invalid: " + config.server.host,
                            common::ErrorCode::InvalidArgument);
  }
  if (config.server.api_key.empty()) {
    warnings.push_back("server.api_key is empty; authentication is disabled");
  }
  if (config.server.host != "127.0.0.1" && config.server.host != "localhost" &&
      config.server.api_key.empty()) {
    warnings.push_back("server binds " + config.server.host + " without an api key");
  }

  const auto &sandbox = config.sandbox;
  if (common::trim(sandbox.image).empty()) {
    return Outcome::failure("sandbox.image must not be empty", common::ErrorCode::InvalidArgument);
  }
  if (!is_valid_memory_limit(sandbox.memory_limit)) {
    return Outcome::failure("sandbox.memory_limit is invalid: " + sandbox.memory_limit,
                            common::ErrorCode::InvalidArgument);
  }
  if (sandbox.port_range_start == 0 || sandbox.port_range_start > sandbox.port_range_end) {
    return Outcome::failure("sandbox.port_range_start must be 1-65535 and not above "
                            "sandbox.port_range_end",
                            common::ErrorCode::InvalidArgument);
  }
  if (sandbox.port_range_start <= config.server.port &&
      config.server.port <= sandbox.port_range_end) {
    warnings.push_back("server.port lies inside the sandbox port range");
  }
  if (sandbox.kernel_port == 0) {
    return Outcome::failure("sandbox.kernel_port must be 1-65535",
                            common::ErrorCode::InvalidArgument);
  }
  if (sandbox.cpu_period == 0 || sandbox.cpu_quota == 0) {
    return Outcome::failure("sandbox.cpu_quota and sandbox.cpu_period must be positive",
                            common::ErrorCode::InvalidArgument);
  }
  if (sandbox.idle_ttl_seconds == 0 || sandbox.reap_interval_seconds == 0) {
    return Outcome::failure("sandbox.idle_ttl_seconds and sandbox.reap_interval_seconds must "
                            "be positive",
                            common::ErrorCode::InvalidArgument);
  }
  if (sandbox.execute_timeout_ms == 0 || sandbox.docker_timeout_ms == 0) {
    return Outcome::failure("sandbox timeouts must be positive",
                            common::ErrorCode::InvalidArgument);
  }

  if (config.rate_limit.enabled &&
      (config.rate_limit.max_requests == 0 || config.rate_limit.window_seconds == 0)) {
    return Outcome::failure("rate_limit.max_requests and rate_limit.window_seconds must be "
                            "positive",
                            common::ErrorCode::InvalidArgument);
  }

  if (config.tools.enabled && common::trim(config.tools.db_path).empty()) {
    return Outcome::failure("tools.db_path must be set when tools are enabled",
                            common::ErrorCode::InvalidArgument);
  }

  if (config.kernel.interpreter.empty()) {
    return Outcome::failure("kernel.interpreter must name a program",
                            common::ErrorCode::InvalidArgument);
  }
  if (config.kernel.exec_timeout_ms >= sandbox.execute_timeout_ms) {
    warnings.push_back("kernel.exec_timeout_ms should be below sandbox.execute_timeout_ms");
  }

  const std::string &backend = config.observability.backend;
  if (backend != "log" && backend != "none" && backend != "noop") {
    return Outcome::failure("Invalid observability.backend: " + backend,
                            common::ErrorCode::InvalidArgument);
  }

  return Outcome::success(std::move(warnings));
}

} // namespace codebox::config
