#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: error code.
// Rejection taxonomy shared by the ledger and the vault. Every code is
// terminal for the call that produced it; nothing is retried internally.
namespace warden::schema {

enum class error_code : uint32_t {
  ok = 0,
  replay_rejected = 1,
  invalid_credential = 2,
  already_initialized = 3,
  invalid_reference = 4,
  not_initialized = 5,
  invalid_recipient = 6,
  zero_value = 7,
  insufficient_funds = 8,
  authorization_denied = 9,
  transfer_failed = 10,
  amount_overflow = 11,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"replay_rejected",
                                            error_code::replay_rejected},
    std::pair<std::string_view, error_code>{"invalid_credential",
                                            error_code::invalid_credential},
    std::pair<std::string_view, error_code>{"already_initialized",
                                            error_code::already_initialized},
    std::pair<std::string_view, error_code>{"invalid_reference",
                                            error_code::invalid_reference},
    std::pair<std::string_view, error_code>{"not_initialized",
                                            error_code::not_initialized},
    std::pair<std::string_view, error_code>{"invalid_recipient",
                                            error_code::invalid_recipient},
    std::pair<std::string_view, error_code>{"zero_value",
                                            error_code::zero_value},
    std::pair<std::string_view, error_code>{"insufficient_funds",
                                            error_code::insufficient_funds},
    std::pair<std::string_view, error_code>{"authorization_denied",
                                            error_code::authorization_denied},
    std::pair<std::string_view, error_code>{"transfer_failed",
                                            error_code::transfer_failed},
    std::pair<std::string_view, error_code>{"amount_overflow",
                                            error_code::amount_overflow}};

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value);

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  for (const auto& [name, code] : kErrorCodeMappings) {
    if (name == value) {
      return code;
    }
  }
  return std::nullopt;
}

inline constexpr std::string_view to_string(const error_code value) {
  for (const auto& [name, code] : kErrorCodeMappings) {
    if (code == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace warden::schema
