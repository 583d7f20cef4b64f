// SPDX-License-Identifier: Apache-2.0
#include "CapabilityEvolver.hpp"

#include <core/Log.hpp>
#include <mcp/Events.hpp>
#include <mcp/ToolManager.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>

namespace toolbridge
{

namespace
{

    struct Runtime
    {
        std::string_view command;
        std::string_view entrypoint;
    };

    auto runtimeForLanguage(std::string_view language) -> std::optional<Runtime>
    {
        if (language == "javascript")
            return Runtime { .command = "node", .entrypoint = "index.js" };
        if (language == "python")
            return Runtime { .command = "python3", .entrypoint = "server.py" };
        return std::nullopt;
    }

} // namespace

DirectoryCapabilityEvolver::DirectoryCapabilityEvolver(ToolManager& manager, EventSink* events):
    _manager(manager), _events(events)
{
}

auto DirectoryCapabilityEvolver::isValidServerName(std::string_view name) -> bool
{
    return !name.empty() && std::ranges::all_of(name, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}

auto DirectoryCapabilityEvolver::createServer(std::string_view name, std::string_view language, std::string_view code)
    -> Result<std::string>
{
    if (!isValidServerName(name))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Invalid capability name '{}': use letters, digits, '_' or '-'", name));

    auto const runtime = runtimeForLanguage(language);
    if (!runtime)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Unsupported language '{}': expected javascript or python", language));

    auto const serverDir = _manager.dynamicServersPath() / std::string(name);
    auto ec = std::error_code {};
    std::filesystem::create_directories(serverDir, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create directory '{}': {}", serverDir.string(), ec.message()));

    // A previous entrypoint in the other language would shadow the new one on reload.
    for (auto const other: { "index.js", "server.py" })
    {
        if (other != runtime->entrypoint)
            std::filesystem::remove(serverDir / other, ec);
    }

    auto const entrypoint = serverDir / std::string(runtime->entrypoint);
    {
        auto file = std::ofstream(entrypoint, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write {}", entrypoint.string()));
        file << code;
        if (!file.good())
            return makeError(ErrorCode::IoError, std::format("Failed to write {}", entrypoint.string()));
    }

    log::info("Created capability '{}' ({}) at {}", name, language, entrypoint.string());

    auto started = _manager.addDynamicServer(name, runtime->command, { entrypoint.string() });
    if (!started)
        return makeError(ErrorCode::EvolutionError,
                         std::format("Capability '{}' was written but failed to start: {}", name, started.error().message));

    if (_events)
        _events->publish(CapabilityCreated {
            .name = std::string(name),
            .language = std::string(language),
            .sourceCode = std::string(code),
        });

    auto toolNames = std::string {};
    if (auto process = _manager.server(name))
    {
        for (const auto& tool: process->tools())
        {
            if (!toolNames.empty())
                toolNames += ", ";
            toolNames += tool.name;
        }
    }

    if (toolNames.empty())
        return std::format("Capability '{}' is installed and running, but it exposes no tools.", name);
    return std::format("Capability '{}' is installed and running. New tools: {}", name, toolNames);
}

} // namespace toolbridge
