#include "test_framework.hpp"
#include "helpers/test_helpers.hpp"

#include "codebox/config/config.hpp"

namespace {

namespace cfg = codebox::config;

cfg::Config parse_config(const std::string &text) {
  const auto doc = codebox::common::parse_toml(text);
  codebox::tests::require(doc.ok(), doc.error());
  const auto config = cfg::config_from_toml(doc.value());
  codebox::tests::require(config.ok(), config.error());
  return config.value();
}

bool has_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  for (const auto &warning : warnings) {
    if (warning.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

void require_invalid(cfg::Config config, const std::string &needle) {
  const auto outcome = cfg::validate_config(config);
  codebox::tests::require(!outcome.ok(), "expected invalid config: " + needle);
  codebox::tests::require(outcome.code() == codebox::common::ErrorCode::InvalidArgument,
                          "invalid_argument code");
  codebox::tests::require(outcome.error().find(needle) != std::string::npos, outcome.error());
}

} // namespace

void register_config_tests(std::vector<codebox::tests::TestCase> &tests) {
  using codebox::tests::require;

  tests.push_back({"config_defaults_are_valid", [] {
                     const auto config = parse_config("");
                     require(config.server.host == "127.0.0.1", "default host");
                     require(config.server.port == 8000, "default port");
                     require(config.sandbox.image == "codebox-kernel:latest", "default image");
                     require(config.sandbox.port_range_start == 49'152, "range start");
                     require(config.sandbox.idle_ttl_seconds == 1800, "idle ttl");
                     require(config.rate_limit.max_requests == 100 &&
                                 config.rate_limit.window_seconds == 60,
                             "rate limit defaults");
                     require(config.tools.enabled, "tools enabled");
                     require(config.tools.db_path.ends_with(".codebox/tools.db"), "db path");

                     const auto outcome = cfg::validate_config(config);
                     require(outcome.ok(), outcome.error());
                     require(has_warning(outcome.value(), "authentication is disabled"),
                             "missing key warning");
                   }});

  tests.push_back({"config_reads_every_section", [] {
                     const auto config = parse_config(R"(
# gateway
[server]
host = "0.0.0.0"
port = 9100
api_key = "secret"

[sandbox]
image = "custom:1"
memory_limit = "256m"
port_range_start = 52_000
port_range_end = 52_010
idle_ttl_seconds = 120

[rate_limit]
enabled = false
max_requests = 5

[tools]
enabled = false
db_path = "/tmp/codebox-tools.db"

[kernel]
interpreter = ["python3", "-u", "-"]
exec_timeout_ms = 1000

[observability]
backend = "NONE"
)");
                     require(config.server.host == "0.0.0.0" && config.server.port == 9100,
                             "server");
                     require(config.server.api_key == "secret", "api key");
                     require(config.sandbox.image == "custom:1", "image");
                     require(config.sandbox.memory_limit == "256m", "memory");
                     require(config.sandbox.port_range_start == 52'000 &&
                                 config.sandbox.port_range_end == 52'010,
                             "port range");
                     require(config.sandbox.idle_ttl_seconds == 120, "ttl");
                     require(!config.rate_limit.enabled && config.rate_limit.max_requests == 5,
                             "rate limit");
                     require(!config.tools.enabled &&
                                 config.tools.db_path == "/tmp/codebox-tools.db",
                             "tools");
                     require(config.kernel.interpreter ==
                                 std::vector<std::string>{"python3", "-u", "-"},
                             "interpreter");
                     require(config.kernel.exec_timeout_ms == 1000, "kernel timeout");
                     require(config.observability.backend == "none", "backend lowercased");

                     const auto outcome = cfg::validate_config(config);
                     require(outcome.ok(), outcome.error());
                     require(!has_warning(outcome.value(), "without an api key"),
                             "key present");
                   }});

  tests.push_back({"config_rejects_bad_numbers", [] {
                     for (const auto &text : {std::string("[server]\nport = 70000\n"),
                                              std::string("[server]\nport = -1\n"),
                                              std::string("[sandbox]\nidle_ttl_seconds = \"soon\"\n")}) {
                       const auto doc = codebox::common::parse_toml(text);
                       require(doc.ok(), doc.error());
                       const auto config = cfg::config_from_toml(doc.value());
                       require(!config.ok(), "rejected: " + text);
                       require(config.error().find("must be an integer between 0 and") !=
                                   std::string::npos,
                               config.error());
                     }
                   }});

  tests.push_back({"config_toml_syntax_errors", [] {
                     require(!codebox::common::parse_toml("[server\nport = 1\n").ok(),
                             "unterminated section");
                     require(!codebox::common::parse_toml("port\n").ok(), "missing equals");
                     require(!codebox::common::parse_toml("a = 1\na = 2\n").ok(), "duplicate key");
                   }});

  tests.push_back({"config_validation_failures", [] {
                     cfg::Config base;
                     base.server.api_key = "k";

                     auto config = base;
                     config.server.port = 0;
                     require_invalid(config, "server.port");

                     config = base;
                     config.server.host = "bad host!";
                     require_invalid(config, "server.host");

                     config = base;
                     config.sandbox.image = "  ";
                     require_invalid(config, "sandbox.image");

                     config = base;
                     config.sandbox.memory_limit = "lots";
                     require_invalid(config, "memory_limit");

                     config = base;
                     config.sandbox.port_range_start = 60'000;
                     config.sandbox.port_range_end = 50'000;
                     require_invalid(config, "port_range_start");

                     config = base;
                     config.sandbox.idle_ttl_seconds = 0;
                     require_invalid(config, "idle_ttl_seconds");

                     config = base;
                     config.rate_limit.window_seconds = 0;
                     require_invalid(config, "rate_limit");
                     config.rate_limit.enabled = false;
                     require(cfg::validate_config(config).ok(), "disabled limiter ignores window");

                     config = base;
                     config.tools.db_path = "";
                     require_invalid(config, "tools.db_path");
                     config.tools.enabled = false;
                     require(cfg::validate_config(config).ok(), "disabled tools need no path");

                     config = base;
                     config.kernel.interpreter.clear();
                     require_invalid(config, "kernel.interpreter");

                     config = base;
                     config.observability.backend = "prometheus";
                     require_invalid(config, "observability.backend");
                   }});

  tests.push_back({"config_validation_warnings", [] {
                     cfg::Config config;
                     config.server.host = "0.0.0.0";
                     config.server.port = 49'200;
                     config.kernel.exec_timeout_ms = config.sandbox.execute_timeout_ms;
                     const auto outcome = cfg::validate_config(config);
                     require(outcome.ok(), outcome.error());
                     require(has_warning(outcome.value(), "without an api key"), "public bind");
                     require(has_warning(outcome.value(), "inside the sandbox port range"),
                             "port overlap");
                     require(has_warning(outcome.value(), "kernel.exec_timeout_ms"),
                             "timeout ordering");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     codebox::testing::EnvGuard key("SANDBOX_API_KEY", "from-env");
                     codebox::testing::EnvGuard host("CODEBOX_HOST", "0.0.0.0");
                     codebox::testing::EnvGuard port("CODEBOX_PORT", "9001");
                     codebox::testing::EnvGuard image("CODEBOX_SANDBOX_IMAGE", "img:2");
                     codebox::testing::EnvGuard db("CODEBOX_TOOLS_DB", "/var/tmp/t.db");

                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.server.api_key == "from-env", "api key");
                     require(config.server.host == "0.0.0.0", "host");
                     require(config.server.port == 9001, "port");
                     require(config.sandbox.image == "img:2", "image");
                     require(config.tools.db_path == "/var/tmp/t.db", "db path");

                     codebox::testing::EnvGuard bad_port("CODEBOX_PORT", "99999");
                     cfg::Config untouched;
                     cfg::apply_env_overrides(untouched);
                     require(untouched.server.port == 8000, "out-of-range port ignored");
                   }});

  tests.push_back({"config_load_from_override_path", [] {
                     codebox::testing::EnvGuard key("SANDBOX_API_KEY", std::nullopt);
                     codebox::testing::EnvGuard port("CODEBOX_PORT", std::nullopt);
                     codebox::testing::EnvGuard host("CODEBOX_HOST", std::nullopt);
                     codebox::testing::TempDir dir;

                     cfg::set_config_path_override(dir.path() / "missing.toml");
                     const auto defaults = cfg::load_config();
                     require(defaults.ok(), defaults.error());
                     require(defaults.value().server.port == 8000, "missing file gives defaults");

                     dir.create_file("config.toml", "[server]\nport = 8100\napi_key = \"abc\"\n");
                     cfg::set_config_path_override(dir.path());
                     const auto path = cfg::config_path();
                     require(path.ok() && path.value() == dir.path() / "config.toml",
                             "directory override resolves to config.toml");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().server.port == 8100, "port from file");
                     require(loaded.value().server.api_key == "abc", "key from file");

                     {
                       codebox::testing::EnvGuard env_key("SANDBOX_API_KEY", "env-wins");
                       const auto overridden = cfg::load_config();
                       require(overridden.ok() && overridden.value().server.api_key == "env-wins",
                               "env overrides file");
                     }

                     dir.create_file("broken.toml", "[server\n");
                     cfg::set_config_path_override(dir.path() / "broken.toml");
                     const auto broken = cfg::load_config();
                     require(!broken.ok(), "syntax error surfaces");
                     require(broken.error().find("broken.toml") != std::string::npos,
                             broken.error());

                     cfg::clear_config_path_override();
                   }});
}
