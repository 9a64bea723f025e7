#include <warden/events/sink.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace warden::events {

event_sink_t log_sink() {
  return [](const warden::schema::event_t& event) {
    if (is_failure(event)) {
      spdlog::warn("{}", render(event));
    } else {
      spdlog::info("{}", render(event));
    }
  };
}

bool is_failure(const warden::schema::event_t& event) {
  return event.type.ends_with("_failed");
}

std::string render(const warden::schema::event_t& event) {
  auto out = event.type;
  for (const auto& attribute : event.attributes) {
    out.push_back(' ');
    out.append(attribute.key);
    out.push_back('=');
    out.append(attribute.value);
  }
  return out;
}

warden::schema::event_attribute_t attribute(const std::string_view key,
                                            std::string value,
                                            const bool index) {
  return warden::schema::event_attribute_t{
      .version = 1,
      .key = std::string{key},
      .value = std::move(value),
      .index = index};
}

}  // namespace warden::events
