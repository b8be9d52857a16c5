#include "admapper/cli/router.hpp"

#include "admapper/replay/replay_plan.hpp"
#include "admapper/replay/replay_runner.hpp"
#include "config/service_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace admapper::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitReplayInputInvalid =
    core::errors::ToInt(core::errors::ExitCode::kReplayInputInvalid);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  admapper replay <replay.json> [--config <config.json>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  admapper validate-config <config.json>\n"
      << "  admapper version\n";
}

struct ReplayOptions {
  std::string replay_path;
  std::string config_path;
  std::optional<core::logging::LogLevel> log_level;
};

// Exactly one replay path; `--config` and `--log-level` each take one value.
// `--log-level` overrides the level from the config file.
bool ParseReplayOptions(const std::vector<std::string_view>& args, ReplayOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      options.config_path = std::string(args[++i]);
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[++i], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.replay_path.empty()) {
      error = "replay accepts exactly 1 replay path";
      return false;
    }
    options.replay_path = std::string(token);
  }

  if (options.replay_path.empty()) {
    error = "replay requires exactly 1 argument: <replay.json>";
    return false;
  }
  return true;
}

int CommandReplay(const std::vector<std::string_view>& args) {
  ReplayOptions options;
  std::string error;
  if (!ParseReplayOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  config::ServiceConfig service_config;
  if (!options.config_path.empty() &&
      !config::LoadServiceConfigFile(options.config_path, service_config, error)) {
    std::cerr << "error: invalid config: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (options.log_level.has_value()) {
    service_config.log_level = *options.log_level;
  }

  replay::ReplayPlan plan;
  if (!replay::LoadReplayPlanFile(options.replay_path, plan, error)) {
    std::cerr << "error: invalid replay input: " << error << '\n';
    return kExitReplayInputInvalid;
  }

  core::logging::Logger logger(service_config.log_level);
  logger.SetComponent("replay");
  replay::RunReplay(plan, service_config, std::cout, logger);
  return kExitSuccess;
}

int CommandValidateConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: validate-config requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  config::ServiceConfig service_config;
  std::string error;
  if (!config::LoadServiceConfigFile(std::string(args.front()), service_config, error)) {
    std::cerr << "error: invalid config: " << error << '\n';
    return kExitConfigInvalid;
  }
  std::cout << "config ok: " << config::DescribeServiceConfig(service_config) << '\n';
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "admapper 0.1.0\n";
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "replay") {
    return CommandReplay(args);
  }
  if (command == "validate-config") {
    return CommandValidateConfig(args);
  }
  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace admapper::cli
