// SPDX-License-Identifier: Apache-2.0
#include "Events.hpp"

#include <core/Log.hpp>
#include <core/Overloaded.hpp>

#include <format>

namespace toolbridge
{

auto describeEvent(const SystemEvent& event) -> std::string
{
    return std::visit(Overloaded {
                          [](const ToolCalled& e) {
                              return std::format("tool called: {} on {} ({}, {} ms)",
                                                 e.toolName,
                                                 e.serverName,
                                                 e.success ? "ok" : "failed",
                                                 e.responseTimeMs);
                          },
                          [](const ServerRestarted& e) { return std::format("server restarted: {}", e.name); },
                          [](const CapabilityCreated& e) {
                              return std::format("capability created: {} ({})", e.name, e.language);
                          },
                      },
                      event);
}

void LoggingEventSink::publish(const SystemEvent& event)
{
    log::debug("Event: {}", describeEvent(event));
}

} // namespace toolbridge
