#pragma once

#include <warden/schema/primitives.hpp>

// Schema type: authorization tuple.
// The exact scope of a single-use permission. The ledger derives its
// consumption key from these five fields and nothing else.
namespace warden::schema {

template <uint16_t Version>
struct authorization_tuple;

template <>
struct authorization_tuple<1> final {
  uint16_t version{1};
  address_t vault{};
  address_t recipient{};
  amount_t amount{};
  authorization_id_t authorization_id{};
  domain_id_t domain{};
};

using authorization_tuple_t = authorization_tuple<1>;

}  // namespace warden::schema
