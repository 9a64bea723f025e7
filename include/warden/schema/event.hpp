#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: event.
// Observability signal emitted for deposits, withdrawals and authorization
// consumption. Consumed by audit sinks; never used for control flow.
namespace warden::schema {

template <uint16_t Version>
struct event_attribute;

template <>
struct event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using event_attribute_t = event_attribute<1>;

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;
};

using event_t = event<1>;

inline constexpr auto kDepositEvent = std::string_view{"deposit"};
inline constexpr auto kWithdrawalEvent = std::string_view{"withdrawal"};
inline constexpr auto kWithdrawalFailedEvent =
    std::string_view{"withdrawal_failed"};
inline constexpr auto kAuthorizationConsumedEvent =
    std::string_view{"authorization_consumed"};
inline constexpr auto kAuthorizationFailedEvent =
    std::string_view{"authorization_failed"};

inline std::optional<std::string> find_attribute(const event_t& value,
                                                 const std::string_view key) {
  for (const auto& attribute : value.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return std::nullopt;
}

}  // namespace warden::schema
