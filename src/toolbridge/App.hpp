// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agent/AgentLoop.hpp>
#include <core/Error.hpp>
#include <toolbridge/Config.hpp>

#include <istream>
#include <memory>
#include <ostream>

namespace toolbridge
{

/// @brief Command line settings that are not part of the config file.
struct AppOptions
{
    bool listTools = false;
    AgentConfig agent;
};

/// @brief Application orchestrator: starts the tool servers and drives the agent loop over stdin.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    App(AppConfig config, AppOptions options);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Starts the tool servers and wires the capability evolver.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Reads model turns from @p input until end of stream and writes the outcome to @p output.
    ///
    /// Turns are separated by a line containing only "---".
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::istream& input, std::ostream& output) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
