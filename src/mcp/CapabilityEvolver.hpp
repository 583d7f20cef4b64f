// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace toolbridge
{

class EventSink;
class ToolManager;

/// @brief Turns source code supplied by the model into a running tool server.
class CapabilityEvolver
{
  public:
    virtual ~CapabilityEvolver() = default;

    /// @brief Creates (or replaces) a tool server and starts it.
    /// @param name Server name; letters, digits, '_' and '-' only.
    /// @param language "javascript" or "python".
    /// @param code Complete source of the server.
    /// @return A human-readable confirmation for the conversation.
    [[nodiscard]] virtual auto createServer(std::string_view name, std::string_view language, std::string_view code)
        -> Result<std::string> = 0;
};

/// @brief Writes new servers below the manager's dynamic server directory and hot-loads them.
///
/// Servers written here are picked up again by ToolManager::startServers() on the next run.
class DirectoryCapabilityEvolver: public CapabilityEvolver
{
  public:
    /// @param manager The manager that loads the new servers; must outlive the evolver.
    /// @param events Optional sink for CapabilityCreated events.
    explicit DirectoryCapabilityEvolver(ToolManager& manager, EventSink* events = nullptr);

    [[nodiscard]] auto createServer(std::string_view name, std::string_view language, std::string_view code)
        -> Result<std::string> override;

    /// @brief Returns true if @p name is usable as a server directory name.
    [[nodiscard]] static auto isValidServerName(std::string_view name) -> bool;

  private:
    ToolManager& _manager;
    EventSink* _events;
};

} // namespace toolbridge
