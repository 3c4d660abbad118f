#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"

#include "codebox/sandbox/manager.hpp"
#include "codebox/sandbox/port_allocator.hpp"
#include "codebox/sandbox/sandbox.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>

namespace {

namespace sb = codebox::sandbox;
using codebox::common::ErrorCode;
using codebox::testing::ManagerFixture;
using codebox::testing::test_sandbox_settings;

bool has_arg(const std::vector<std::string> &args, const std::string &value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

} // namespace

void register_sandbox_manager_tests(std::vector<codebox::tests::TestCase> &tests) {
  using codebox::tests::require;

  tests.push_back({"sandbox_docker_run_args_are_hardened", [] {
                     auto settings = test_sandbox_settings();
                     const auto args = sb::build_docker_run_args(settings, "a1b2c3d4", 50'001);
                     require(args.front() == "run", "run verb");
                     require(has_arg(args, "sandbox-a1b2c3d4"), "container name");
                     require(has_arg(args, "127.0.0.1:50001:8000/tcp"), "loopback publish");
                     require(has_arg(args, "--cap-drop") && has_arg(args, "ALL"), "caps dropped");
                     require(has_arg(args, "no-new-privileges"), "no new privileges");
                     require(has_arg(args, "--memory") && has_arg(args, "512m"), "memory limit");
                     require(args.back() == settings.image, "image last");
                     require(sb::build_docker_remove_args("c1") ==
                                 std::vector<std::string>{"rm", "-f", "c1"},
                             "remove args");
                   }});

  tests.push_back({"sandbox_port_allocator_skips_reserved_and_busy_ports", [] {
                     sb::PortAllocator ports(50'000, 50'002,
                                             [](std::uint16_t port) { return port != 50'000; });
                     const auto first = ports.allocate();
                     require(first.ok() && first.value() == 50'001, "busy port skipped");
                     const auto second = ports.allocate();
                     require(second.ok() && second.value() == 50'002, "next free port");
                     const auto third = ports.allocate();
                     require(!third.ok(), "range exhausted");
                     require(third.code() == ErrorCode::RuntimeUnavailable, "exhaustion kind");
                     require(ports.reserved_count() == 2, "two reservations");
                     ports.release(50'001);
                     require(!ports.is_reserved(50'001), "released");
                     const auto again = ports.allocate();
                     require(again.ok() && again.value() == 50'001, "released port reused");
                   }});

  tests.push_back({"sandbox_create_then_get_reports_running", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());
                     require(created.value().id == "a1b2c3d4", "fixed id");
                     require(created.value().status == "running", "running after create");
                     require(created.value().port >= 50'000 && created.value().port <= 50'002,
                             "port inside range");

                     const auto fetched = manager.get("a1b2c3d4");
                     require(fetched.ok(), fetched.error());
                     require(fetched.value().status == "running", "status from runtime");
                     require(fetched.value().port == created.value().port, "same port");
                     require(fetched.value().to_json() ==
                                 "{\"id\":\"a1b2c3d4\",\"status\":\"running\",\"port\":50000}",
                             fetched.value().to_json());
                     require(fx.docker->count_verb("run") == 1, "one container started");
                   }});

  tests.push_back({"sandbox_create_rejects_other_languages", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("ruby");
                     require(!created.ok(), "ruby unsupported");
                     require(created.code() == ErrorCode::InvalidArgument, "kind");
                     require(fx.docker->commands().empty(), "runtime untouched");
                   }});

  tests.push_back({"sandbox_create_reports_runtime_unavailable_and_frees_port", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     fx.docker->runtime_down = true;
                     const auto failed = manager.create("python");
                     require(!failed.ok(), "create fails");
                     require(failed.code() == ErrorCode::RuntimeUnavailable, "kind");
                     require(manager.size() == 0, "nothing registered");

                     fx.docker->runtime_down = false;
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());
                     require(created.value().port == 50'000, "port from the failed attempt reused");
                   }});

  tests.push_back({"sandbox_create_failure_removes_partial_container", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     fx.docker->fail_run = true;
                     const auto failed = manager.create("python");
                     require(!failed.ok(), "create fails");
                     require(manager.size() == 0, "nothing registered");

                     const auto commands = fx.docker->commands();
                     require(commands.size() == 2, "run then cleanup");
                     require(commands[1] == std::vector<std::string>{"rm", "-f", "sandbox-a1b2c3d4"},
                             "named container force-removed");

                     fx.docker->fail_run = false;
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());
                     require(created.value().port == 50'000, "port released after cleanup");
                   }});

  tests.push_back({"sandbox_create_fails_when_ports_exhausted", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     for (int i = 0; i < 3; ++i) {
                       require(manager.create("python").ok(), "create within range");
                     }
                     const auto fourth = manager.create("python");
                     require(!fourth.ok(), "fourth create fails");
                     require(fourth.code() == ErrorCode::RuntimeUnavailable, "kind");
                     require(fx.docker->count_verb("run") == 3, "no container for the fourth");
                   }});

  tests.push_back({"sandbox_execute_runs_code_in_kernel", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());
                     const auto result = manager.execute(created.value().id, "print(1 + 1)");
                     require(result.ok(), result.error());
                     require(result.value().success, "success flag");
                     require(result.value().stdout_text == "2\n", "stdout from kernel");
                     require(fx.kernel->executed() == std::vector<std::string>{"print(1 + 1)"},
                             "code forwarded unchanged");
                   }});

  tests.push_back({"sandbox_execute_unknown_id_is_not_found", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto result = manager.execute("deadbeef", "1+1");
                     require(!result.ok(), "unknown sandbox");
                     require(result.code() == ErrorCode::NotFound, "kind");
                   }});

  tests.push_back({"sandbox_execute_rejects_denylisted_code_before_kernel", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());
                     const auto result = manager.execute(created.value().id, "import os\nprint(1)");
                     require(!result.ok(), "rejected");
                     require(result.code() == ErrorCode::ValidationRejected, "kind");
                     require(fx.kernel->executed().empty(), "kernel never invoked");
                   }});

  tests.push_back({"sandbox_execute_reports_unreachable_kernel", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());

                     fx.kernel->unreachable = true;
                     const auto result = manager.execute(created.value().id, "1+1");
                     require(!result.ok(), "transport failure");
                     require(result.code() == ErrorCode::SandboxUnreachable, "kind");
                     require(manager.get(created.value().id).ok(), "sandbox kept");
                   }});

  tests.push_back({"sandbox_execute_times_out_waiting_for_kernel", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());

                     fx.kernel->healthy = false;
                     const auto result = manager.execute(created.value().id, "1+1");
                     require(!result.ok(), "kernel never became ready");
                     require(result.code() == ErrorCode::SandboxUnreachable, "kind");
                     require(fx.kernel->executed().empty(), "no execute before ready");
                   }});

  tests.push_back({"sandbox_user_code_failure_is_a_result", [] {
                     ManagerFixture fx;
                     fx.kernel->reply = codebox::kernel::ExecutionResult{
                         .type = "result",
                         .stdout_text = "",
                         .stderr_text = "ZeroDivisionError: division by zero\n",
                         .success = false};
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());
                     const auto result = manager.execute(created.value().id, "1/0");
                     require(result.ok(), "user errors are not manager errors");
                     require(!result.value().success, "success=false");
                     require(result.value().stderr_text.find("ZeroDivisionError") !=
                                 std::string::npos,
                             "stderr carried through");
                   }});

  tests.push_back({"sandbox_delete_removes_and_releases_port", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());
                     const auto port = created.value().port;

                     require(manager.remove(created.value().id).ok(), "delete succeeds");
                     const auto fetched = manager.get(created.value().id);
                     require(!fetched.ok() && fetched.code() == ErrorCode::NotFound,
                             "gone after delete");
                     require(fx.docker->count_verb("stop") == 1, "container stopped");
                     require(fx.docker->count_verb("rm") == 1, "container removed");

                     const auto again = manager.create("python");
                     require(again.ok(), again.error());
                     require(again.value().port == port, "port reused after delete");
                     require(again.value().id != created.value().id, "new id");
                   }});

  tests.push_back({"sandbox_delete_unknown_is_not_found", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto status = manager.remove("nope");
                     require(!status.ok() && status.code() == ErrorCode::NotFound, "not found");
                   }});

  tests.push_back({"sandbox_delete_failure_still_forgets_entry", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());
                     fx.docker->fail_remove = true;
                     const auto status = manager.remove(created.value().id);
                     require(!status.ok(), "removal failure reported");
                     require(status.code() == ErrorCode::Internal, "kind");
                     require(manager.size() == 0, "entry forgotten");
                   }});

  tests.push_back({"sandbox_list_is_in_creation_order_with_runtime_status", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     require(manager.create("python").ok(), "first");
                     require(manager.create("python").ok(), "second");
                     fx.docker->inspect_status = "exited";
                     const auto listed = manager.list();
                     require(listed.size() == 2, "two sandboxes");
                     require(listed[0].id == "a1b2c3d4" && listed[1].id == "a1b2c3d5",
                             "creation order");
                     require(listed[0].status == "exited", "status polled from runtime");
                   }});

  tests.push_back({"sandbox_status_unknown_when_runtime_down", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());
                     fx.docker->runtime_down = true;
                     const auto fetched = manager.get(created.value().id);
                     require(fetched.ok(), fetched.error());
                     require(fetched.value().status == "unknown", fetched.value().status);
                   }});

  tests.push_back({"sandbox_probe_states", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto created = manager.create("python");
                     require(created.ok(), created.error());
                     const auto id = created.value().id;

                     fx.kernel->healthy = false;
                     require(manager.probe(id).value() == sb::ProbeState::Starting, "starting");
                     fx.kernel->healthy = true;
                     require(manager.probe(id).value() == sb::ProbeState::Ready, "ready");
                     fx.docker->inspect_status = "exited";
                     require(manager.probe(id).value() == sb::ProbeState::Unreachable,
                             "unreachable");
                     require(sb::probe_state_to_string(sb::ProbeState::Ready) == "ready", "name");
                     require(!manager.probe("missing").ok(), "unknown id");
                   }});

  tests.push_back({"sandbox_reaper_removes_only_idle_sandboxes", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto idle = manager.create("python");
                     const auto busy = manager.create("python");
                     require(idle.ok() && busy.ok(), "created");

                     fx.clock.advance(std::chrono::seconds(30));
                     require(manager.execute(busy.value().id, "1+1").ok(), "touch busy sandbox");
                     fx.clock.advance(std::chrono::seconds(40));

                     require(manager.reap_idle() == 1, "one sandbox idle past the TTL");
                     require(!manager.get(idle.value().id).ok(), "idle sandbox reaped");
                     require(manager.get(busy.value().id).ok(), "recently used sandbox kept");

                     fx.clock.advance(std::chrono::seconds(61));
                     require(manager.reap_idle() == 1, "second sandbox reaped later");
                     require(manager.size() == 0, "registry empty");
                   }});

  tests.push_back({"sandbox_reaper_thread_starts_and_stops", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     manager.start_reaper();
                     manager.start_reaper();
                     manager.stop_reaper();
                     manager.stop_reaper();
                     require(manager.size() == 0, "nothing touched");
                   }});

  tests.push_back({"sandbox_shutdown_is_best_effort", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     require(manager.create("python").ok(), "first");
                     require(manager.create("python").ok(), "second");
                     fx.docker->fail_remove = true;
                     manager.shutdown();
                     require(manager.size() == 0, "registry cleared");
                     require(fx.docker->count_verb("rm") == 2, "every container attempted");

                     const auto stop_args = fx.docker->commands();
                     const auto stop = std::find_if(stop_args.begin(), stop_args.end(),
                                                    [](const auto &a) { return a[0] == "stop"; });
                     require(stop != stop_args.end() && (*stop)[2] == "2",
                             "shutdown grace period used");
                   }});

  tests.push_back({"sandbox_prepare_image", [] {
                     ManagerFixture fx;
                     auto settings = test_sandbox_settings();
                     {
                       sb::SandboxManager manager(settings, fx.dependencies());
                       require(manager.prepare_image().ok(), "present image");
                       require(fx.docker->count_verb("build") == 0, "no build needed");
                     }

                     fx.docker->image_present = false;
                     {
                       sb::SandboxManager manager(settings, fx.dependencies());
                       const auto status = manager.prepare_image();
                       require(!status.ok() && status.code() == ErrorCode::NotFound,
                               "missing image without build context");
                     }

                     settings.build_context = "/srv/codebox";
                     {
                       sb::SandboxManager manager(settings, fx.dependencies());
                       require(manager.prepare_image().ok(), "image built");
                       require(fx.docker->count_verb("build") == 1, "build invoked");
                     }
                   }});

  tests.push_back({"sandbox_execute_in_flight_does_not_block_other_sandboxes", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto a = manager.create("python");
                     const auto b = manager.create("python");
                     require(a.ok() && b.ok(), "two sandboxes");

                     fx.kernel->hold_on("slow = 1");
                     std::optional<codebox::common::Result<codebox::kernel::ExecutionResult>> held;
                     std::thread worker(
                         [&] { held.emplace(manager.execute(a.value().id, "slow = 1")); });

                     const bool in_flight = fx.kernel->wait_until_held(std::chrono::seconds(5));
                     const auto started = std::chrono::steady_clock::now();
                     const auto other = manager.execute(b.value().id, "print(1)");
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     const auto busy = manager.get(a.value().id);
                     const auto listed = manager.list();

                     fx.kernel->release_held();
                     worker.join();

                     require(in_flight, "first execute reached the kernel");
                     require(other.ok(), other.error());
                     require(elapsed < std::chrono::seconds(1), "other sandbox not blocked");
                     require(busy.ok() && busy.value().status == "running", "busy sandbox readable");
                     require(listed.size() == 2, "list not blocked");
                     require(held.has_value() && held->ok(), "held execute completes");
                   }});

  tests.push_back({"sandbox_delete_waits_for_in_flight_execute", [] {
                     ManagerFixture fx;
                     sb::SandboxManager manager(test_sandbox_settings(), fx.dependencies());
                     const auto a = manager.create("python");
                     require(a.ok(), a.error());
                     const std::string id = a.value().id;

                     fx.kernel->hold_on("slow = 1");
                     std::optional<codebox::common::Result<codebox::kernel::ExecutionResult>> held;
                     std::optional<codebox::common::Status> removed;
                     std::thread worker([&] { held.emplace(manager.execute(id, "slow = 1")); });
                     const bool in_flight = fx.kernel->wait_until_held(std::chrono::seconds(5));
                     std::thread deleter([&] { removed.emplace(manager.remove(id)); });

                     bool saw_stopping = false;
                     for (int i = 0; i < 500 && !saw_stopping; ++i) {
                       const auto info = manager.get(id);
                       saw_stopping = info.ok() && info.value().status == "stopping";
                       if (!saw_stopping) {
                         std::this_thread::sleep_for(std::chrono::milliseconds(10));
                       }
                     }
                     const auto rm_while_busy = fx.docker->count_verb("rm");
                     const auto rejected = manager.execute(id, "print(1)");

                     fx.kernel->release_held();
                     worker.join();
                     deleter.join();

                     require(in_flight, "execute reached the kernel");
                     require(saw_stopping, "sandbox reported as stopping");
                     require(rm_while_busy == 0, "container kept until the execute finished");
                     require(!rejected.ok() && rejected.code() == ErrorCode::NotFound,
                             "stopping sandbox refuses new work");
                     require(held.has_value() && held->ok(), "in-flight execute finishes");
                     require(removed.has_value() && removed->ok(), "delete succeeds");
                     require(fx.docker->count_verb("rm") == 1, "container removed");
                     const auto gone = manager.get(id);
                     require(!gone.ok() && gone.code() == ErrorCode::NotFound, "gone after delete");
                   }});
}
