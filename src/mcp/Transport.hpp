// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace toolbridge
{

/// @brief Abstract interface for line-framed JSON-RPC communication with a tool server.
///
/// The three channels are used by three different threads: one sender, one
/// receiver of protocol messages and one receiver of diagnostics. close() may be
/// called from yet another thread and must unblock pending receives.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the server as a single line.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives the next JSON message from the server (blocking).
    /// @return The received JSON message, a ProtocolError for a malformed line,
    ///         or a TransportError once the stream has ended.
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    /// @brief Receives the next diagnostic (stderr) line from the server (blocking).
    /// @return The line, or a TransportError once the stream has ended.
    [[nodiscard]] virtual auto receiveDiagnostic() -> Result<std::string> = 0;

    /// @brief Closes the transport connection and terminates the server.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;
};

} // namespace toolbridge
