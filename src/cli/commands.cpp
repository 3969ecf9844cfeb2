#include "pathfence/cli/commands.hpp"

#include "pathfence/common/fs.hpp"
#include "pathfence/config/config.hpp"
#include "pathfence/observability/factory.hpp"
#include "pathfence/observability/global.hpp"
#include "pathfence/sandbox/workspace.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace pathfence::cli {

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_REJECTED = 2;

std::string version_string() {
#ifdef PATHFENCE_VERSION
  std::string version = PATHFENCE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "pathfence " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

// Options of path-taking commands. They are read up to the first operand or a literal
// "--"; every later argument is an operand.
struct SandboxArgs {
  std::optional<std::string> workspace;
  bool no_hint = false;
  std::vector<std::string> operands;
};

bool parse_sandbox_args(const std::vector<std::string> &args, SandboxArgs &out,
                        std::string &error) {
  std::size_t i = 0;
  for (; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--") {
      ++i;
      break;
    }
    if (arg == "--workspace" || arg == "-w") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + arg;
        return false;
      }
      out.workspace = args[++i];
      continue;
    }
    if (common::starts_with(arg, "--workspace=")) {
      out.workspace = arg.substr(std::string("--workspace=").size());
      continue;
    }
    if (arg == "--no-hint") {
      out.no_hint = true;
      continue;
    }
    if (arg.size() > 1 && arg.front() == '-') {
      error = "unknown option: " + arg + " (use -- before paths that start with '-')";
      return false;
    }
    break;
  }
  out.operands.assign(args.begin() + static_cast<long>(i), args.end());
  return true;
}

// Consumes leading --config options; they are only recognized before the subcommand.
bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  while (!args.empty()) {
    std::string value;
    if (args[0] == "--config") {
      if (args.size() < 2) {
        error = "missing value for --config";
        return false;
      }
      value = args[1];
      args.erase(args.begin(), args.begin() + 2);
    } else if (common::starts_with(args[0], "--config=")) {
      value = args[0].substr(std::string("--config=").size());
      args.erase(args.begin());
    } else {
      break;
    }
    if (value.empty()) {
      error = "missing value for --config";
      return false;
    }
    config::set_config_path_override(value);
  }
  return true;
}

// Loads config, applies command-line overrides and installs the configured observer.
common::Result<config::Config> prepare_config(const SandboxArgs &parsed) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }

  if (parsed.workspace.has_value()) {
    cfg.value().sandbox.workspace_dir = *parsed.workspace;
  }
  if (parsed.no_hint) {
    cfg.value().sandbox.suggest_external_access = false;
  }

  observability::set_global_observer(observability::create_observer(cfg.value()));
  if (const auto path = config::config_path(); path.ok() && config::config_exists()) {
    observability::record_config_loaded(path.value());
  }
  return cfg;
}

common::Result<config::Config> prepare_command(const std::vector<std::string> &args,
                                               SandboxArgs &parsed) {
  std::string error;
  if (!parse_sandbox_args(args, parsed, error)) {
    return common::Result<config::Config>::failure(error);
  }
  return prepare_config(parsed);
}

void print_rejection(const std::string &user_path, const sandbox::Rejection &rejection) {
  std::cerr << sandbox::rejection_kind_name(rejection.kind) << ": " << rejection.message;
  if (rejection.kind != sandbox::RejectionKind::AccessDenied) {
    std::cerr << " (input: '" << user_path << "')";
  }
  std::cerr << "\n";
}

int run_resolve(const std::vector<std::string> &args) {
  SandboxArgs parsed;
  auto cfg = prepare_command(args, parsed);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return EXIT_USAGE;
  }
  if (parsed.operands.size() != 1) {
    std::cerr << "usage: pathfence resolve [--workspace DIR] [--no-hint] [--] <path>\n";
    return EXIT_USAGE;
  }
  const std::string &user_path = parsed.operands[0];

  auto guard = sandbox::WorkspaceSandbox::from_config(cfg.value());
  if (!guard.ok()) {
    std::cerr << guard.error() << "\n";
    return EXIT_USAGE;
  }

  const auto resolved = guard.value().resolve(user_path);
  if (!resolved.ok()) {
    print_rejection(user_path, resolved.error());
    return resolved.error().kind == sandbox::RejectionKind::RootResolution ? EXIT_USAGE
                                                                           : EXIT_REJECTED;
  }

  std::cout << resolved.value().string() << "\n";
  return 0;
}

int run_check(const std::vector<std::string> &args) {
  SandboxArgs parsed;
  auto cfg = prepare_command(args, parsed);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return EXIT_USAGE;
  }
  if (parsed.operands.empty()) {
    std::cerr << "usage: pathfence check [--workspace DIR] [--no-hint] [--] <path>...\n";
    return EXIT_USAGE;
  }

  auto guard = sandbox::WorkspaceSandbox::from_config(cfg.value());
  if (!guard.ok()) {
    std::cerr << guard.error() << "\n";
    return EXIT_USAGE;
  }

  std::uint64_t rejected = 0;
  for (const auto &path : parsed.operands) {
    const auto resolved = guard.value().resolve(path);
    if (resolved.ok()) {
      std::cout << "ok " << resolved.value().string() << "\n";
      continue;
    }
    ++rejected;
    std::cout << "denied " << sandbox::rejection_kind_name(resolved.error().kind) << " " << path
              << "\n";
  }
  observability::record_check_batch(parsed.operands.size(), rejected);

  return rejected == 0 ? 0 : EXIT_REJECTED;
}

int run_status(const std::vector<std::string> &args) {
  SandboxArgs parsed;
  auto cfg = prepare_command(args, parsed);
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return EXIT_USAGE;
  }
  if (!parsed.operands.empty()) {
    std::cerr << "usage: pathfence status [--workspace DIR]\n";
    return EXIT_USAGE;
  }

  if (const auto cp = config::config_path(); cp.ok()) {
    std::cout << "Config: " << cp.value().string()
              << (config::config_exists() ? "" : " (not found, using defaults)") << "\n";
  }

  const auto ws = config::effective_workspace_dir(cfg.value());
  if (!ws.ok()) {
    std::cerr << ws.error() << "\n";
    return EXIT_USAGE;
  }
  std::cout << "Workspace: " << ws.value().string() << "\n";

  std::error_code ec;
  const auto canonical = std::filesystem::canonical(ws.value(), ec);
  if (ec) {
    std::cout << "Canonical workspace: unavailable (" << ec.message() << ")\n";
  } else {
    std::cout << "Canonical workspace: " << canonical.string() << "\n";
  }
  std::cout << "External access hint: "
            << (cfg.value().sandbox.suggest_external_access ? "enabled" : "disabled") << "\n";
  std::cout << "Observability: " << cfg.value().observability.backend << "\n";
  return 0;
}

bool read_config_key(const config::Config &cfg, const std::string &key, std::string &out) {
  if (key == "sandbox.workspace_dir") {
    out = cfg.sandbox.workspace_dir;
  } else if (key == "sandbox.suggest_external_access") {
    out = cfg.sandbox.suggest_external_access ? "true" : "false";
  } else if (key == "sandbox.external_read_tool") {
    out = cfg.sandbox.external_read_tool;
  } else if (key == "sandbox.external_list_tool") {
    out = cfg.sandbox.external_list_tool;
  } else if (key == "sandbox.external_tool_prefix") {
    out = cfg.sandbox.external_tool_prefix;
  } else if (key == "observability.backend") {
    out = cfg.observability.backend;
  } else {
    return false;
  }
  return true;
}

bool write_config_key(config::Config &cfg, const std::string &key, const std::string &value,
                      std::string &error) {
  if (key == "sandbox.workspace_dir") {
    cfg.sandbox.workspace_dir = value;
  } else if (key == "sandbox.suggest_external_access") {
    const std::string normalized = common::to_lower(common::trim(value));
    if (normalized != "true" && normalized != "false") {
      error = "expected true or false for " + key;
      return false;
    }
    cfg.sandbox.suggest_external_access = normalized == "true";
  } else if (key == "sandbox.external_read_tool") {
    cfg.sandbox.external_read_tool = value;
  } else if (key == "sandbox.external_list_tool") {
    cfg.sandbox.external_list_tool = value;
  } else if (key == "sandbox.external_tool_prefix") {
    cfg.sandbox.external_tool_prefix = value;
  } else if (key == "observability.backend") {
    cfg.observability.backend = value;
  } else {
    error = "unknown key: " + key;
    return false;
  }
  return true;
}

int run_config(std::vector<std::string> args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return EXIT_USAGE;
  }

  if (args.empty() || args[0] == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }

  if (args[0] == "get") {
    if (args.size() < 2) {
      std::cerr << "usage: pathfence config get <key>\n";
      return EXIT_USAGE;
    }
    std::string value;
    if (!read_config_key(cfg.value(), args[1], value)) {
      std::cerr << "unknown key: " << args[1] << "\n";
      return EXIT_USAGE;
    }
    std::cout << value << "\n";
    return 0;
  }

  if (args[0] == "set") {
    if (args.size() < 3) {
      std::cerr << "usage: pathfence config set <key> <value>\n";
      return EXIT_USAGE;
    }
    std::string error;
    if (!write_config_key(cfg.value(), args[1], args[2], error)) {
      std::cerr << error << "\n";
      return EXIT_USAGE;
    }
    const auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << validated.error() << "\n";
      return EXIT_USAGE;
    }
    auto saved = config::save_config(cfg.value());
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return EXIT_USAGE;
    }
    return 0;
  }

  if (args[0] == "validate") {
    const auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "[FAIL] " << validated.error() << "\n";
      return EXIT_USAGE;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "[WARN] " << warning << "\n";
    }
    std::cout << "[OK] configuration is valid\n";
    return 0;
  }

  std::cerr << "unknown config command\n";
  return EXIT_USAGE;
}

} // namespace

void print_help() {
  std::cout << version_string() << " - confine agent file paths to a workspace\n\n";
  std::cout << "USAGE\n";
  std::cout << "  pathfence [--config PATH] <command> [options] [--] [path...]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  resolve <path>       Print the canonical path inside the workspace\n";
  std::cout << "  check <path>...      Report ok/denied for each path\n";
  std::cout << "  status               Show config and workspace roots\n";
  std::cout << "  config show|get|set|validate\n";
  std::cout << "  version              Show version\n\n";
  std::cout << "OPTIONS\n";
  std::cout << "  -w, --workspace DIR  Override sandbox.workspace_dir\n";
  std::cout << "  --no-hint            Omit external-access guidance from denials\n";
  std::cout << "  --                   End of options; later arguments are paths\n\n";
  std::cout << "Options must come before the first path.\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return EXIT_USAGE;
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
  if (subcommand == "resolve") {
    return run_resolve(args);
  }
  if (subcommand == "check") {
    return run_check(args);
  }
  if (subcommand == "status") {
    return run_status(args);
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return EXIT_USAGE;
}

} // namespace pathfence::cli
