#include "test_framework.hpp"

#include "codebox/kernel/executor.hpp"
#include "codebox/kernel/kernel_server.hpp"
#include "codebox/kernel/protocol.hpp"
#include "codebox/sandbox/kernel_client.hpp"

#include <chrono>
#include <thread>

namespace {

namespace kn = codebox::kernel;

kn::ExecutorOptions shell_options(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  return kn::ExecutorOptions{.interpreter = {"sh"}, .timeout = timeout, .max_output_bytes = 4096};
}

codebox::gateway::HttpRequest kernel_request(const std::string &method, const std::string &path,
                                             const std::string &body = "") {
  codebox::gateway::HttpRequest request;
  request.method = method;
  request.path = path;
  request.body = body;
  return request;
}

} // namespace

void register_kernel_tests(std::vector<codebox::tests::TestCase> &tests) {
  using codebox::tests::require;
  using codebox::common::ErrorCode;

  tests.push_back({"kernel_protocol_result_json", [] {
                     const kn::ExecutionResult result{
                         .type = "result", .stdout_text = "a\"b\n", .stderr_text = "", .success = true};
                     require(result.to_json() ==
                                 "{\"type\":\"result\",\"stdout\":\"a\\\"b\\n\",\"stderr\":\"\","
                                 "\"success\":true}",
                             result.to_json());

                     const auto parsed = kn::parse_execution_result(result.to_json());
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().stdout_text == "a\"b\n", "stdout unescaped");

                     const auto defaults = kn::parse_execution_result("{\"stdout\":\"x\"}");
                     require(defaults.ok() && defaults.value().success, "success defaults to true");
                     const auto bad = kn::parse_execution_result("not json");
                     require(!bad.ok() && bad.code() == ErrorCode::SandboxUnreachable,
                             "malformed reply");
                     const auto bad_flag =
                         kn::parse_execution_result("{\"success\":\"yes\"}");
                     require(!bad_flag.ok(), "non-boolean success");
                   }});

  tests.push_back({"kernel_protocol_execute_request", [] {
                     const auto body = kn::render_execute_request("print(\"hi\")\n");
                     const auto code = kn::parse_execute_request(body);
                     require(code.ok() && code.value() == "print(\"hi\")\n", "code extracted");
                     const auto missing = kn::parse_execute_request("{\"code\":1}");
                     require(!missing.ok() && missing.code() == ErrorCode::InvalidArgument,
                             "code must be a string");
                   }});

  tests.push_back({"kernel_executor_captures_output", [] {
                     kn::CodeExecutor executor(shell_options());
                     const auto result = executor.run("echo hello\necho oops >&2\n");
                     require(result.success, "exit 0 is success");
                     require(result.stdout_text == "hello\n", result.stdout_text);
                     require(result.stderr_text == "oops\n", result.stderr_text);
                     require(result.type == "result", "envelope type");
                   }});

  tests.push_back({"kernel_executor_reports_failures_as_results", [] {
                     kn::CodeExecutor executor(shell_options());
                     const auto failed = executor.run("echo partial\nexit 3\n");
                     require(!failed.success, "nonzero exit is a failure");
                     require(failed.stdout_text == "partial\n", "output kept");
                     require(failed.stderr_text.find("status 3") != std::string::npos,
                             failed.stderr_text);

                     kn::CodeExecutor missing(kn::ExecutorOptions{
                         .interpreter = {"/nonexistent/codebox-interpreter"}});
                     const auto spawn = missing.run("1");
                     require(!spawn.success, "missing interpreter");
                     require(spawn.stderr_text.find("failed to start interpreter") !=
                                 std::string::npos,
                             spawn.stderr_text);
                   }});

  tests.push_back({"kernel_executor_enforces_timeout", [] {
                     kn::CodeExecutor executor(shell_options(std::chrono::milliseconds(200)));
                     const auto started = std::chrono::steady_clock::now();
                     const auto result = executor.run("sleep 5\n");
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(!result.success, "timed out");
                     require(result.stderr_text.find("timed out") != std::string::npos,
                             result.stderr_text);
                     require(elapsed < std::chrono::seconds(4), "process killed early");
                   }});

  tests.push_back({"kernel_executor_truncates_output", [] {
                     kn::CodeExecutor executor(kn::ExecutorOptions{
                         .interpreter = {"sh"},
                         .timeout = std::chrono::seconds(5),
                         .max_output_bytes = 16});
                     const auto result =
                         executor.run("i=0\nwhile [ $i -lt 100 ]; do echo line$i; i=$((i+1)); done\n");
                     require(result.stdout_text.size() <= 16, "stdout capped");
                     require(result.stderr_text.find("truncated") != std::string::npos,
                             result.stderr_text);
                   }});

  tests.push_back({"kernel_executor_spawns_from_many_threads", [] {
                     kn::CodeExecutor executor(shell_options());
                     constexpr int kThreads = 8;
                     constexpr int kRuns = 5;
                     std::vector<std::string> outputs(kThreads * kRuns);
                     std::vector<std::thread> workers;
                     for (int t = 0; t < kThreads; ++t) {
                       workers.emplace_back([&executor, &outputs, t] {
                         for (int r = 0; r < kRuns; ++r) {
                           const int slot = t * kRuns + r;
                           const auto result = executor.run("echo " + std::to_string(slot) + "\n");
                           outputs[static_cast<std::size_t>(slot)] =
                               result.success ? result.stdout_text : "failed: " + result.stderr_text;
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     for (int slot = 0; slot < kThreads * kRuns; ++slot) {
                       require(outputs[static_cast<std::size_t>(slot)] ==
                                   std::to_string(slot) + "\n",
                               outputs[static_cast<std::size_t>(slot)]);
                     }
                   }});

  tests.push_back({"kernel_server_routes", [] {
                     kn::KernelServer server(shell_options());
                     const auto health = server.handle(kernel_request("GET", "/health"));
                     require(health.status == 200 && health.body == "{\"status\":\"ok\"}",
                             health.body);
                     require(server.handle(kernel_request("POST", "/health")).status == 405,
                             "wrong method");
                     require(server.handle(kernel_request("GET", "/execute")).status == 405,
                             "execute needs POST");
                     require(server.handle(kernel_request("POST", "/execute", "{}")).status == 400,
                             "missing code");
                     require(server.handle(kernel_request("GET", "/other")).status == 404,
                             "unknown path");
                     const auto executed =
                         server.handle(kernel_request("POST", "/execute", "{\"code\":\"echo 7\"}"));
                     require(executed.status == 200, executed.body);
                     require(executed.body.find("\"stdout\":\"7\\n\"") != std::string::npos,
                             executed.body);
                   }});

  tests.push_back({"kernel_server_over_http_with_curl_client", [] {
                     kn::KernelServer server(shell_options());
                     const auto started =
                         server.start(codebox::gateway::HttpServerOptions{.host = "127.0.0.1",
                                                                          .port = 0});
                     require(started.ok(), started.error());

                     codebox::sandbox::CurlKernelClient client;
                     const auto health = client.health(server.port(), std::chrono::seconds(2));
                     require(health.ok(), health.error());

                     const auto result = client.execute(server.port(), "echo \"quoted\"\nexit 0\n",
                                                        std::chrono::seconds(5));
                     require(result.ok(), result.error());
                     require(result.value().success, "success");
                     require(result.value().stdout_text == "quoted\n", result.value().stdout_text);

                     const auto port = server.port();
                     server.stop();
                     const auto down = client.health(port, std::chrono::milliseconds(500));
                     require(!down.ok() && down.code() == ErrorCode::SandboxUnreachable,
                             "stopped kernel is unreachable");
                     const auto exec_down =
                         client.execute(port, "echo 1", std::chrono::milliseconds(500));
                     require(!exec_down.ok() && exec_down.code() == ErrorCode::SandboxUnreachable,
                             "execute against stopped kernel");
                   }});
}
