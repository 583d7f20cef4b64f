// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <toolbridge/App.hpp>
#include <toolbridge/Config.hpp>

#include <CLI/CLI.hpp>

#include <chrono>
#include <iostream>
#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "toolbridge - run model tool calls against stdio tool servers" };

    auto configPath = std::string {};
    auto runtimePath = std::string {};
    auto verbose = false;
    auto trace = false;
    auto listTools = false;
    auto sequential = false;
    auto approve = false;
    auto cacheTtlSeconds = 0;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--runtime-path", runtimePath, "Base directory for relative server paths");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_flag("--trace", trace, "Log every JSON-RPC message");
    app.add_flag("--list-tools", listTools, "Print the tools prompt and exit");
    app.add_flag("--sequential", sequential, "Execute tool calls one after another");
    app.add_flag("--approve", approve, "Execute tool calls that require confirmation without asking");
    app.add_option("--cache-ttl", cacheTtlSeconds, "Serve repeated tool calls from a cache for N seconds")
        ->check(CLI::NonNegativeNumber);

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = configPath.empty() ? toolbridge::loadConfig() : toolbridge::loadConfigFromFile(configPath);

    if (!configResult)
    {
        toolbridge::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!runtimePath.empty())
        config.runtimePath = runtimePath;
    if (cacheTtlSeconds > 0)
        config.tools.cacheTtlSeconds = cacheTtlSeconds;

    if (auto const level = toolbridge::log::levelFromString(config.logLevel))
        toolbridge::log::setLevel(*level);
    if (verbose)
        toolbridge::log::setLevel(toolbridge::log::Level::Debug);
    if (trace)
        toolbridge::log::setLevel(toolbridge::log::Level::Trace);

    auto options = toolbridge::AppOptions {};
    options.listTools = listTools;
    options.agent.autoApprove = approve;
    if (config.tools.cacheTtlSeconds > 0)
    {
        options.agent.mode = toolbridge::ExecutionMode::Cached;
        options.agent.cacheTtl = std::chrono::seconds(config.tools.cacheTtlSeconds);
    }
    else if (sequential)
    {
        options.agent.mode = toolbridge::ExecutionMode::Sequential;
    }

    auto application = toolbridge::App(std::move(config), std::move(options));
    auto initResult = application.initialize();
    if (!initResult)
    {
        toolbridge::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run(std::cin, std::cout);
}
