#include <mcp_manager/cli/command_executor.hpp>
#include <mcp_manager/cli/command_router.hpp>
#include <mcp_manager/cli/output_formatter.hpp>
#include <mcp_manager/config/config_loader.hpp>
#include <mcp_manager/core/log.hpp>
#include <mcp_manager/core/terminal.hpp>
#include <mcp_manager/registry/process_registry.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using namespace mcp_manager;

int PrintError(const Error& error, bool json_output) {
    OutputFormatter fmt(json_output, IsStderrTty() && !NoColorEnvSet());
    fmt.PrintError(error);
    return error.ExitCode();
}

LogLevel LevelFor(const AppConfig& config) {
    if (config.verbose) return LogLevel::Debug;
    if (config.quiet) return LogLevel::Error;
    return LogLevel::Warn;
}

// Route log records to --log-file when given, otherwise to stderr.
Result<void, Error> InstallLogger(const AppConfig& config) {
    if (config.log_file.has_value()) {
        auto sink = std::make_unique<JsonFileSink>(*config.log_file);
        if (!sink->IsOpen()) {
            return Result<void, Error>::Err(
                Error{"ConfigLoader", "", std::nullopt,
                      "Cannot open log file: " + *config.log_file, std::nullopt,
                      std::nullopt, ErrorCategory::Config});
        }
        InitGlobalLogger(std::move(sink), LevelFor(config));
        return Result<void, Error>::Ok();
    }
    bool use_color = IsStderrTty() && !NoColorEnvSet();
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), LevelFor(config));
    return Result<void, Error>::Ok();
}

HandlerOptions OptionsFor(const AppConfig& config) {
    HandlerOptions options;
    if (config.request_timeout_seconds > 0) {
        options.request_timeout = std::chrono::seconds(config.request_timeout_seconds);
    }
    options.stream.connect_timeout = std::chrono::seconds(config.connect_timeout_seconds);
    return options;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    // Step 1: global options and command tokens (argparse handles --help/--version).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return PrintError(cli_result.Error(), false);
    }
    auto invocation = std::move(cli_result).Value();

    // Step 2: YAML config, overridden by CLI options.
    AppConfig config;
    if (invocation.config_path.has_value()) {
        auto yaml_result = LoadFromYaml(*invocation.config_path);
        if (yaml_result.IsErr()) {
            return PrintError(yaml_result.Error(), invocation.overrides.json_output);
        }
        config = MergeConfigs(std::move(yaml_result).Value(), invocation.overrides);
    } else {
        config = MergeConfigs(AppConfig{}, invocation.overrides);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return PrintError(valid.Error(), config.json_output);
    }

    auto logger = InstallLogger(config);
    if (logger.IsErr()) {
        return PrintError(logger.Error(), config.json_output);
    }
    LogDebug("cli", "Loaded " + std::to_string(config.servers.size()) + " server(s)");

    // Step 3: dispatch.
    ProcessRegistry registry(OptionsFor(config));
    CommandContext context{config, registry, std::cin, std::cout, std::cerr,
                           IsStdoutTty() && !NoColorEnvSet(), invocation.config_path};
    CommandRouter router;
    RegisterAllCommands(router, context);

    int rc = router.Dispatch(invocation.command, config.json_output, std::cout, std::cerr);
    registry.StopAll();
    return rc;
}
