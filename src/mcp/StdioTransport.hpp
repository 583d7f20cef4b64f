// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace toolbridge
{

/// @brief Configuration for spawning a tool server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

/// @brief Transport that communicates with a tool server via stdio pipes.
///
/// Spawns a child process with piped stdin, stdout and stderr. Messages are
/// newline-delimited JSON. Closing the transport force-kills the child.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the tool server process.
    /// @param config The process configuration.
    /// @return Success or a SpawnError.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    [[nodiscard]] auto receiveDiagnostic() -> Result<std::string> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Returns the child's process id, or -1 if none is running.
    [[nodiscard]] auto processId() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
