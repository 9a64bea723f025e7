#pragma once

#include <warden/schema/error_code.hpp>
#include <warden/schema/event.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: operation result.
// Outcome of a ledger or vault operation. `code` is the verdict; `cause`
// carries the underlying ledger verdict when a withdrawal is denied.
namespace warden::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  error_code code{error_code::ok};
  std::optional<error_code> cause;
  std::string log;
  std::string codespace;
  std::optional<authorization_key_t> authorization_key;
  std::vector<event_t> events;
};

using operation_result_t = operation_result<1>;

}  // namespace warden::schema
