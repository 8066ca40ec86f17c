#include "drover/cli/commands.hpp"

#include "drover/agent/delegate_tool.hpp"
#include "drover/agent/orchestrator.hpp"
#include "drover/bus/message_bus.hpp"
#include "drover/common/fs.hpp"
#include "drover/config/config.hpp"
#include "drover/context/embedding_cache.hpp"
#include "drover/observability/factory.hpp"
#include "drover/observability/global.hpp"
#include "drover/providers/factory.hpp"
#include "drover/scheduler/executor.hpp"
#include "drover/security/policy.hpp"
#include "drover/tools/builtin/builtins.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace drover::cli {

namespace {

std::string version_string() {
#ifdef DROVER_VERSION
  std::string version = DROVER_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef DROVER_GIT_COMMIT
  const std::string commit = DROVER_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "drover " + version;
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
                 std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name) {
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
      config::set_config_path_override(std::filesystem::path(args[i + 1]));
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (args[i].rfind("--config=", 0) == 0) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(std::filesystem::path(value));
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
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

bool parse_unsigned(const std::string &raw, std::uint64_t &out) {
  try {
    std::size_t used = 0;
    const auto value = std::stoull(raw, &used);
    if (used != raw.size()) {
      return false;
    }
    out = value;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

common::Result<config::Config> load_validated_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    return common::Result<config::Config>::failure(validated.error());
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return cfg;
}

/// Everything a run needs, built once per process.
struct Runtime {
  config::Config config;
  std::filesystem::path workspace;
  std::shared_ptr<providers::ContentGenerator> generator;
  tools::ToolRegistry registry;
  std::unique_ptr<security::PolicyEngine> policy;
  std::unique_ptr<scheduler::RegistryToolExecutor> executor;
  bus::MessageBus bus;
  std::unique_ptr<context::EmbeddingCache> embedding_cache;
  agent::AgentRegistry agents;

  [[nodiscard]] agent::OrchestratorDeps deps() {
    return agent::OrchestratorDeps{.generator = *generator,
                                   .registry = registry,
                                   .policy = *policy,
                                   .executor = *executor,
                                   .bus = bus,
                                   .embedding_cache = embedding_cache.get()};
  }
};

common::Result<std::unique_ptr<Runtime>> build_runtime(config::Config cfg) {
  auto runtime = std::make_unique<Runtime>();
  runtime->config = std::move(cfg);
  runtime->workspace = std::filesystem::current_path();

  observability::set_global_observer(observability::create_observer(runtime->config));

  runtime->generator = providers::create_generator(runtime->config.provider);
  if (runtime->generator == nullptr) {
    return common::Result<std::unique_ptr<Runtime>>::failure("could not create model backend");
  }

  if (runtime->config.context.use_embeddings) {
    auto cache = context::EmbeddingCache::open(
        common::expand_path(runtime->config.context.embedding_cache_path));
    if (!cache.ok()) {
      observability::log_warn("cli", "embedding cache unavailable: " + cache.error());
    } else {
      runtime->embedding_cache = std::move(cache.value());
    }
  }

  tools::register_builtin_tools(runtime->registry, runtime->config);
  Runtime *raw = runtime.get();
  runtime->registry.register_tool(std::make_shared<agent::DelegateToAgentTool>(
      runtime->agents,
      [raw](const agent::AgentDefinition &definition, const std::string &task,
            const common::CancellationToken &cancel) {
        auto runner = agent::make_subagent_runner(raw->deps(), raw->config, raw->workspace);
        return runner(definition, task, cancel);
      }));

  auto rules = security::rules_from_config(runtime->config.security);
  if (!rules.ok()) {
    return common::Result<std::unique_ptr<Runtime>>::failure(rules.error());
  }
  runtime->policy = std::make_unique<security::PolicyEngine>(rules.value(), runtime->registry);
  runtime->executor = std::make_unique<scheduler::RegistryToolExecutor>(runtime->registry);
  return common::Result<std::unique_ptr<Runtime>>::success(std::move(runtime));
}

void print_activity(const agent::ActivityEvent &event) {
  switch (event.kind) {
  case agent::ActivityKind::Delta:
    std::cout << event.text << std::flush;
    break;
  case agent::ActivityKind::ToolCallRequested:
    std::cout << "\n[tool] " << event.tool_name << " " << event.text << "\n";
    break;
  case agent::ActivityKind::ToolCallFinished:
    std::cout << "[tool] " << event.tool_name << " -> " << event.text << "\n";
    break;
  case agent::ActivityKind::Compressed:
  case agent::ActivityKind::Pruned:
  case agent::ActivityKind::TimeWarning:
  case agent::ActivityKind::LoopDetected:
  case agent::ActivityKind::Recovery:
    std::cout << "\n[" << agent::activity_kind_name(event.kind) << "] " << event.text << "\n";
    break;
  case agent::ActivityKind::Error:
    std::cerr << "\n[error] " << event.text << "\n";
    break;
  case agent::ActivityKind::TurnStarted:
    break;
  }
}

int run_once(std::vector<std::string> args) {
  std::string raw;
  std::uint64_t max_turns = 0;
  std::uint64_t timeout_ms = 0;
  if (take_option(args, "--max-turns", raw) && !parse_unsigned(raw, max_turns)) {
    std::cerr << "invalid --max-turns: " << raw << "\n";
    return 1;
  }
  if (take_option(args, "--timeout-ms", raw) && !parse_unsigned(raw, timeout_ms)) {
    std::cerr << "invalid --timeout-ms: " << raw << "\n";
    return 1;
  }
  const bool yolo = take_flag(args, "--yolo");
  const std::string prompt = join_tokens(args);
  if (common::trim(prompt).empty()) {
    std::cerr << "usage: drover run [--max-turns N] [--timeout-ms N] [--yolo] <prompt>\n";
    return 1;
  }

  auto cfg = load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  if (max_turns > 0) {
    cfg.value().agent.max_turns = static_cast<std::uint32_t>(max_turns);
  }
  if (timeout_ms > 0) {
    cfg.value().agent.timeout_ms = timeout_ms;
  }
  if (yolo) {
    cfg.value().security.approval_mode = "yolo";
  }
  cfg.value().security.interactive = false;

  auto runtime = build_runtime(cfg.value());
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto &rt = *runtime.value();
  agent::AgentRunOrchestrator orchestrator(rt.deps(), agent::generalist_definition(), rt.config,
                                           rt.workspace);
  agent::RunOptions options;
  options.on_activity = print_activity;
  const auto result = orchestrator.run(prompt, options);

  std::cout << "\n";
  if (!result.output.empty()) {
    std::cout << result.output << "\n";
  }
  std::cout << "[" << agent::termination_mode_name(result.mode) << "]";
  if (!result.reason.empty()) {
    std::cout << " " << result.reason;
  }
  std::cout << "\n";
  return result.mode == agent::TerminationMode::Goal ? 0 : 1;
}

bus::ConfirmationOutcome ask_user(const bus::ConfirmationRequest &request) {
  std::cout << "\nAllow " << request.tool_name << "?\n  " << request.details << "\n"
            << "[y]es / [a]lways / [n]o: " << std::flush;
  std::string line;
  if (!std::getline(std::cin, line)) {
    return bus::ConfirmationOutcome::Cancel;
  }
  return bus::confirmation_outcome_from_string(common::trim(line))
      .value_or(bus::ConfirmationOutcome::Cancel);
}

int run_chat(std::vector<std::string> args) {
  if (!args.empty()) {
    std::cerr << "usage: drover chat\n";
    return 1;
  }
  auto cfg = load_validated_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  cfg.value().security.interactive = true;

  auto runtime = build_runtime(cfg.value());
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto &rt = *runtime.value();

  std::mutex console_mutex;
  const auto subscription =
      rt.bus.subscribe_requests([&rt, &console_mutex](const bus::ConfirmationRequest &request) {
        std::lock_guard<std::mutex> lock(console_mutex);
        const auto outcome = ask_user(request);
        auto status = rt.bus.respond(bus::ConfirmationResponse{
            .correlation_id = request.correlation_id, .outcome = outcome, .edited_args = {}});
        if (!status.ok()) {
          observability::log_warn("cli", status.error());
        }
      });

  agent::AgentRunOrchestrator orchestrator(rt.deps(), agent::generalist_definition(), rt.config,
                                           rt.workspace);
  agent::RunOptions options;
  options.interactive = true;
  options.on_activity = print_activity;

  std::cout << version_string() << "  (empty line or /quit to exit)\n";
  std::string line;
  while (true) {
    std::cout << "\n> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    const std::string prompt = common::trim(line);
    if (prompt.empty() || prompt == "/quit" || prompt == "/exit") {
      break;
    }
    const auto result = orchestrator.run(prompt, options);
    std::cout << "\n";
    if (result.mode != agent::TerminationMode::Goal) {
      std::cout << "[" << agent::termination_mode_name(result.mode) << "] " << result.reason
                << "\n";
    }
  }
  rt.bus.unsubscribe(subscription);
  return 0;
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  if (action == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }
  if (action == "validate") {
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "invalid: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "ok\n";
    return 0;
  }
  if (action == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return 1;
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }
  std::cerr << "unknown config command: " << action << "\n";
  return 1;
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n"
            << "usage: drover [--config PATH] <command> [options]\n\n"
            << "commands:\n"
            << "  run [--max-turns N] [--timeout-ms N] [--yolo] <prompt>\n"
            << "                      Run one autonomous task and exit\n"
            << "  chat                Interactive session with tool confirmations\n"
            << "  config show         Print the effective configuration\n"
            << "  config validate     Check the configuration file\n"
            << "  config path         Print the configuration file location\n"
            << "  version             Show version\n"
            << "  help                Show this help\n";
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
  if (subcommand == "run") {
    return run_once(std::move(args));
  }
  if (subcommand == "chat") {
    return run_chat(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace drover::cli
