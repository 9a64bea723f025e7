#pragma once

#include <warden/schema/event.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace warden::events {

/// Receives every signal a component emits. Sinks must not call back into
/// the emitting component.
using event_sink_t = std::function<void(const warden::schema::event_t&)>;

/// Sink that writes each event through spdlog; failures at warn level.
event_sink_t log_sink();

bool is_failure(const warden::schema::event_t& event);

/// Single-line `type key=value ...` rendering used by `log_sink`.
std::string render(const warden::schema::event_t& event);

warden::schema::event_attribute_t attribute(const std::string_view key,
                                            std::string value,
                                            const bool index = false);

}  // namespace warden::events
