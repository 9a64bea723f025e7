#pragma once

#include <warden/schema/primitives.hpp>

namespace warden::crypto {

/// True when the linked OpenSSL exposes both ed25519 and secp256k1.
bool available();

/// Verify `signature` by `signer` over `message`.
///
/// ed25519 signs the raw message; secp256k1 signs its SHA-256 digest. Named
/// signers carry no key material and never verify.
bool verify_signature(const warden::schema::bytes_view_t& message,
                      const warden::schema::signer_id_t& signer,
                      const warden::schema::signature_t& signature);

}  // namespace warden::crypto
