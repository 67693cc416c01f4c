#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "core/notifier.hpp"
#include "core/orchestrator.hpp"
#include "core/run_status.hpp"
#include "detection/crs_rule_catalog.hpp"
#include "io/db/mongo_manager.hpp"
#include "io/rules/rule_set_store.hpp"
#include "io/store/cursor_store.hpp"
#include "io/store/mongo_audit_store.hpp"
#include "io/web/web_server.hpp"
#include "models/classifier.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
  else if (signum == SIGHUP)
    g_reload_config_requested = true;
}

namespace {

struct CommandLine {
  std::string config_path = "config.ini";
  std::optional<std::string> once;
  std::optional<uint64_t> rollback_version;
  bool show_help = false;
};

void print_usage(const char *program) {
  std::cout << "Usage: " << program << " [config.ini] [options]\n"
            << "  --once classify|harden   Run a single classification run or "
               "hardening cycle, then exit\n"
            << "  --rollback <version>     Revert the rule changes committed as "
               "<version>\n"
            << "  --help                   Show this message\n";
}

// Returns nullopt on a malformed command line.
std::optional<CommandLine> parse_command_line(int argc, char *argv[]) {
  CommandLine cli;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      cli.show_help = true;
    } else if (arg == "--once") {
      if (i + 1 >= argc)
        return std::nullopt;
      cli.once = argv[++i];
      if (*cli.once != "classify" && *cli.once != "harden")
        return std::nullopt;
    } else if (arg == "--rollback") {
      if (i + 1 >= argc)
        return std::nullopt;
      cli.rollback_version = Utils::string_to_number<uint64_t>(argv[++i]);
      if (!cli.rollback_version || *cli.rollback_version == 0)
        return std::nullopt;
    } else if (!arg.empty() && arg[0] == '-') {
      return std::nullopt;
    } else {
      cli.config_path = arg;
    }
  }
  if (cli.once && cli.rollback_version)
    return std::nullopt;
  return cli;
}

int exit_code_for(const RunStatus &status) {
  return status.outcome == RunOutcome::COMPLETED ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  auto cli = parse_command_line(argc, argv);
  if (!cli || cli->show_help) {
    print_usage(argv[0]);
    return cli ? 0 : 2;
  }

  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);

  // A mail command that exits early must not kill the daemon.
  struct sigaction ignore;
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  ignore.sa_flags = 0;
  sigaction(SIGPIPE, &ignore, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (!config_manager.load_configuration(cli->config_path)) {
    std::cerr << "Refusing to start: configuration " << cli->config_path
              << " could not be loaded." << std::endl;
    return 1;
  }
  auto current_config = config_manager.get_config();
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE,
      "waf_hardener starting up (PID " << getpid() << ")");

  try {
    auto mongo = std::make_shared<MongoManager>(current_config->store.uri);
    MongoAuditStore audit_store(mongo, current_config->store);
    FileCursorStore cursor_store(current_config->cursor_state_path);
    FileRuleSetStore rule_store(current_config->hardening.rule_state_path);
    RunStatusLog run_log(current_config->run_status_path);
    Notifier notifier(current_config->notification);

    auto catalog = std::make_shared<const CrsRuleCatalog>(CrsRuleCatalog::load(
        current_config->hardening.crs_rule_sources,
        current_config->hardening.min_paranoia_level));

    std::shared_ptr<const Classifier> classifier;
    if (!cli->rollback_version) {
      try {
        classifier = Classifier::load(current_config->classifier);
      } catch (const ModelLoadError &e) {
        LOG(LogLevel::FATAL, LogComponent::ML_LIFECYCLE,
            "Cannot start without a model: " << e.what());
        notifier.notify(Notification(NotificationKind::CLASSIFIER_ERROR,
                                     "model_load", "Model failed to load",
                                     {{"error", e.what()}}));
        return 1;
      }
    }

    PipelineDependencies deps{audit_store, audit_store, cursor_store,
                              rule_store,  classifier,  catalog,
                              notifier,    &run_log,    {},
                              {}};
    Orchestrator orchestrator(current_config, deps);

    if (cli->rollback_version)
      return exit_code_for(orchestrator.rollback(*cli->rollback_version));
    if (cli->once)
      return exit_code_for(*cli->once == "classify"
                               ? orchestrator.run_classification()
                               : orchestrator.run_hardening_cycle());

    if (!mongo->ping())
      LOG(LogLevel::WARN, LogComponent::IO_STORE,
          "Document store not reachable yet. Runs will retry on schedule.");

    std::unique_ptr<WebServer> web_server;
    if (current_config->monitoring.web_server_enabled) {
      web_server = std::make_unique<WebServer>(
          current_config->monitoring.web_server_host,
          current_config->monitoring.web_server_port, MetricsRegistry::instance(),
          orchestrator, run_log, notifier);
      web_server->start();
    }

    orchestrator.start();

    while (!g_shutdown_requested) {
      if (g_reload_config_requested.exchange(false)) {
        LOG(LogLevel::INFO, LogComponent::CORE,
            "SIGHUP detected. Reloading configuration from "
                << cli->config_path << "...");
        if (config_manager.load_configuration(cli->config_path)) {
          current_config = config_manager.get_config();
          LogManager::instance().configure(current_config->logging);
          orchestrator.update_config(current_config);
        } else {
          LOG(LogLevel::ERROR, LogComponent::CONFIG,
              "Failed to reload configuration. Keeping old settings.");
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown requested.");
    if (web_server)
      web_server->stop();
    orchestrator.stop();
  } catch (const WafError &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Startup failed: " << e.what());
    return 1;
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "waf_hardener exited cleanly.");
  return 0;
}
