// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace toolbridge
{

/// @brief Emitted after every routed tool call, successful or not.
struct ToolCalled
{
    std::string toolName;
    std::string serverName;
    bool success = false;
    uint64_t responseTimeMs = 0;
};

/// @brief Emitted after a server was restarted by the health monitor.
struct ServerRestarted
{
    std::string name;
};

/// @brief Emitted after a new tool server was created from source code.
struct CapabilityCreated
{
    std::string name;
    std::string language;
    std::string sourceCode;
};

using SystemEvent = std::variant<ToolCalled, ServerRestarted, CapabilityCreated>;

/// @brief Receives system events. Implementations must accept calls from any thread.
class EventSink
{
  public:
    virtual ~EventSink() = default;

    virtual void publish(const SystemEvent& event) = 0;
};

/// @brief One-line human readable summary of @p event. Source code is left out.
[[nodiscard]] auto describeEvent(const SystemEvent& event) -> std::string;

/// @brief Event sink that writes each event to the debug log and keeps nothing.
class LoggingEventSink: public EventSink
{
  public:
    void publish(const SystemEvent& event) override;
};

/// @brief Event sink that keeps every published event in memory.
class RecordingEventSink: public EventSink
{
  public:
    void publish(const SystemEvent& event) override
    {
        auto const lock = std::lock_guard { _mutex };
        _events.push_back(event);
    }

    [[nodiscard]] auto events() const -> std::vector<SystemEvent>
    {
        auto const lock = std::lock_guard { _mutex };
        return _events;
    }

    void clear()
    {
        auto const lock = std::lock_guard { _mutex };
        _events.clear();
    }

  private:
    mutable std::mutex _mutex;
    std::vector<SystemEvent> _events;
};

} // namespace toolbridge
