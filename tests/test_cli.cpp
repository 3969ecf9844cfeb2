#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <fstream>

namespace {

using pathfence::testing::CapturedOutput;
using pathfence::testing::EnvGuard;
using pathfence::testing::TempWorkspace;

bool contains_text(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

// Points the CLI at an empty config directory with logging disabled.
struct CliEnv {
  TempWorkspace config_dir{"pathfence-test-cli-config"};
  EnvGuard config{"PATHFENCE_CONFIG_PATH", config_dir.path().string()};
  EnvGuard workspace{"PATHFENCE_WORKSPACE", std::nullopt};
  EnvGuard observability{"PATHFENCE_OBSERVABILITY", "none"};
};

} // namespace

void register_cli_tests(std::vector<pathfence::tests::TestCase> &tests) {
  using pathfence::tests::require;
  using pathfence::testing::run_cli_args;

  tests.push_back({"cli_resolve_prints_canonical_path", [] {
                     CliEnv env;
                     TempWorkspace ws;
                     ws.create_file("data/test.txt", "x");

                     CapturedOutput captured;
                     const int code =
                         run_cli_args({"resolve", "--workspace", ws.path().string(), "data/test.txt"});
                     require(code == 0, "exit code " + std::to_string(code) + ": " + captured.err());
                     require(captured.out() == (ws.canonical() / "data" / "test.txt").string() + "\n",
                             captured.out());
                   }});

  tests.push_back({"cli_resolve_rejection_exit_codes", [] {
                     CliEnv env;
                     TempWorkspace ws;

                     {
                       CapturedOutput captured;
                       const int code = run_cli_args(
                           {"resolve", "-w", ws.path().string(), "../../../etc/passwd"});
                       require(code == 2, "traversal exit code " + std::to_string(code));
                       require(contains_text(captured.err(), "traversal_denied: Path traversal denied"),
                               captured.err());
                     }
                     {
                       CapturedOutput captured;
                       const int code =
                           run_cli_args({"resolve", "-w", ws.path().string(), "/etc/passwd"});
                       require(code == 2, "access exit code " + std::to_string(code));
                       require(contains_text(captured.err(), "Access denied"), captured.err());
                       require(contains_text(captured.err(), "mcp_filesystem_read_file"),
                               captured.err());
                     }
                     {
                       CapturedOutput captured;
                       const int code = run_cli_args({"resolve", "--no-hint",
                                                      "--workspace=" + ws.path().string(),
                                                      "/etc/passwd"});
                       require(code == 2, "no-hint exit code " + std::to_string(code));
                       require(!contains_text(captured.err(), "mcp_filesystem"), captured.err());
                     }
                     {
                       CapturedOutput captured;
                       const int code = run_cli_args(
                           {"resolve", "-w", (ws.path() / "missing").string(), "a.txt"});
                       require(code == 1, "missing root is a configuration error");
                       require(contains_text(captured.err(), "root_resolution"), captured.err());
                     }
                   }});

  tests.push_back({"cli_resolve_uses_configured_workspace", [] {
                     CliEnv env;
                     TempWorkspace ws;
                     ws.create_dir("notes");
                     {
                       std::ofstream out(env.config_dir.path() / "config.toml");
                       out << "[sandbox]\nworkspace_dir = \"" << ws.path().string() << "\"\n";
                     }

                     CapturedOutput captured;
                     const int code = run_cli_args({"resolve", "notes/today.md"});
                     require(code == 0, captured.err());
                     require(captured.out() == (ws.canonical() / "notes" / "today.md").string() + "\n",
                             captured.out());
                   }});

  tests.push_back({"cli_check_reports_each_path", [] {
                     CliEnv env;
                     TempWorkspace ws;
                     ws.create_file("a.txt", "x");

                     CapturedOutput captured;
                     const int code = run_cli_args({"check", "-w", ws.path().string(), "a.txt", "../b",
                                                    "missing/c.txt"});
                     require(code == 2, "any rejection yields exit 2");
                     const std::string out = captured.out();
                     require(contains_text(out, "ok " + (ws.canonical() / "a.txt").string()), out);
                     require(contains_text(out, "denied traversal_denied ../b"), out);
                     require(contains_text(out, "denied parent_resolution missing/c.txt"), out);
                   }});

  tests.push_back({"cli_check_all_ok", [] {
                     CliEnv env;
                     TempWorkspace ws;

                     CapturedOutput captured;
                     const int code = run_cli_args({"check", "-w", ws.path().string(), "one.txt",
                                                    "two.txt"});
                     require(code == 0, captured.err());
                   }});

  tests.push_back({"cli_option_like_paths_cannot_change_workspace", [] {
                     CliEnv env;
                     TempWorkspace ws;
                     ws.create_file("a.txt", "x");
                     {
                       std::ofstream out(env.config_dir.path() / "config.toml");
                       out << "[sandbox]\nworkspace_dir = \"" << ws.path().string() << "\"\n";
                     }

                     {
                       CapturedOutput captured;
                       const int code =
                           run_cli_args({"check", "a.txt", "--workspace=/", "/etc/passwd"});
                       require(code == 2, "exit code " + std::to_string(code));
                       require(contains_text(captured.out(), "denied access_denied /etc/passwd"),
                               captured.out());
                       require(!contains_text(captured.out(), "ok /etc/passwd"), captured.out());
                     }
                     {
                       CapturedOutput captured;
                       const int code =
                           run_cli_args({"check", "--", "--workspace=/", "-w", "/etc/passwd"});
                       require(code == 2, "exit code " + std::to_string(code));
                       require(contains_text(captured.out(), "denied access_denied /etc/passwd"),
                               captured.out());
                     }
                     {
                       CapturedOutput captured;
                       const int code = run_cli_args(
                           {"check", "a.txt", "--config=/nonexistent/pf.toml", "/etc/passwd"});
                       require(code == 2, "exit code " + std::to_string(code));
                       require(contains_text(captured.out(),
                                             "denied parent_resolution --config=/nonexistent/pf.toml"),
                               captured.out());
                       require(contains_text(captured.out(), "denied access_denied /etc/passwd"),
                               captured.out());
                     }
                   }});

  tests.push_back({"cli_double_dash_resolves_option_named_files", [] {
                     CliEnv env;
                     TempWorkspace ws;
                     ws.create_file("-w", "x");
                     ws.create_file("--no-hint", "x");

                     for (const std::string name : {"-w", "--no-hint", "--"}) {
                       CapturedOutput captured;
                       const int code = run_cli_args({"resolve", "-w", ws.path().string(), "--", name});
                       require(code == 0, name + ": " + captured.err());
                       require(captured.out() == (ws.canonical() / name).string() + "\n",
                               captured.out());
                     }
                     {
                       CapturedOutput captured;
                       require(run_cli_args({"resolve", "-w", ws.path().string(), "--bogus"}) == 1,
                               "unknown option is a usage error");
                       require(contains_text(captured.err(), "unknown option"), captured.err());
                     }
                     {
                       CapturedOutput captured;
                       require(run_cli_args({"resolve", "--no-hint"}) == 1,
                               "flag alone leaves no operand");
                     }
                   }});

  tests.push_back({"cli_config_set_get_validate", [] {
                     CliEnv env;
                     TempWorkspace ws;

                     {
                       CapturedOutput captured;
                       require(run_cli_args({"config", "set", "sandbox.workspace_dir",
                                             ws.path().string()}) == 0,
                               captured.err());
                     }
                     {
                       CapturedOutput captured;
                       require(run_cli_args({"config", "get", "sandbox.workspace_dir"}) == 0,
                               captured.err());
                       require(captured.out() == ws.path().string() + "\n", captured.out());
                     }
                     {
                       CapturedOutput captured;
                       require(run_cli_args({"config", "set", "sandbox.suggest_external_access",
                                             "maybe"}) == 1,
                               "invalid bool should fail");
                     }
                     {
                       CapturedOutput captured;
                       require(run_cli_args({"config", "set", "observability.backend", "statsd"}) ==
                                   1,
                               "unknown backend should fail validation");
                     }
                     {
                       CapturedOutput captured;
                       require(run_cli_args({"config", "validate"}) == 0, captured.err());
                       require(contains_text(captured.out(), "[OK]"), captured.out());
                     }
                     {
                       CapturedOutput captured;
                       require(run_cli_args({"config", "get", "nope"}) == 1, "unknown key");
                     }
                   }});

  tests.push_back({"cli_usage_errors", [] {
                     CliEnv env;
                     CapturedOutput captured;
                     require(run_cli_args({"resolve"}) == 1, "resolve without path");
                     require(run_cli_args({"check"}) == 1, "check without paths");
                     require(run_cli_args({"frobnicate"}) == 1, "unknown command");
                     require(run_cli_args({"--config"}) == 1, "dangling --config");
                     require(run_cli_args({"version"}) == 0, "version");
                     require(contains_text(captured.out(), "pathfence "), captured.out());
                   }});

  tests.push_back({"cli_status_shows_roots", [] {
                     CliEnv env;
                     TempWorkspace ws;

                     CapturedOutput captured;
                     require(run_cli_args({"status", "-w", ws.path().string()}) == 0, captured.err());
                     require(contains_text(captured.out(), "Workspace: " + ws.path().string()),
                             captured.out());
                     require(contains_text(captured.out(),
                                           "Canonical workspace: " + ws.canonical().string()),
                             captured.out());
                   }});
}
