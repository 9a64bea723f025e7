#pragma once

#include <warden/schema/authorization_tuple.hpp>
#include <warden/schema/primitives.hpp>

#include <string_view>

namespace warden::authorization {

/// Domain tag mixed into every derivation; bump the suffix when the layout
/// changes so keys from different layouts can never collide.
inline constexpr auto kAuthorizationKeyTag =
    std::string_view{"WARDEN|AUTHORIZATION|v1"};

/// Deterministic one-way binding of an authorization tuple.
///
/// BLAKE3 over the SCALE encoding of
/// (tag, domain, vault, recipient, amount as 32-byte big-endian, id).
/// Identical tuples always map to the same key; the domain field keeps a
/// credential minted for one deployment from being accepted by another.
warden::schema::authorization_key_t derive_key(
    const warden::schema::authorization_tuple_t& tuple);

/// Material hashed by `derive_key`, exposed for off-line signers and tests.
warden::schema::bytes_t derivation_material(
    const warden::schema::authorization_tuple_t& tuple);

}  // namespace warden::authorization
