#pragma once

#include <warden/schema/authorization_tuple.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace warden::authorization {

/// Decides whether `credential` authorizes the tuple bound to `key`.
///
/// Supplied by the deployment; the ledger only consults the verdict.
using credential_verifier_t =
    std::function<bool(const warden::schema::authorization_key_t& key,
                       const warden::schema::authorization_tuple_t& tuple,
                       const warden::schema::bytes_view_t& credential)>;

enum class signature_scheme : uint8_t { ed25519 = 0, secp256k1 = 1 };

struct signed_credential final {
  warden::schema::signer_id_t signer;
  warden::schema::signature_t signature;
};

/// Placeholder verifier: accepts any non-empty credential.
///
/// Performs no cryptography. Deployments holding real funds must install a
/// signature-checking verifier such as `make_signer_set_verifier`.
credential_verifier_t presence_verifier();

/// Accepts a credential only when it carries a signature over the 32-byte
/// authorization key by one of `signers`.
credential_verifier_t make_signer_set_verifier(
    std::vector<warden::schema::signer_id_t> signers);

/// SCALE layout: (uint8 scheme, bytes public_key, bytes signature).
///
/// Returns std::nullopt for named signers and for mismatched
/// signer/signature schemes.
std::optional<warden::schema::bytes_t> encode_credential(
    const warden::schema::signer_id_t& signer,
    const warden::schema::signature_t& signature);

std::optional<signed_credential> decode_credential(
    const warden::schema::bytes_view_t& credential);

}  // namespace warden::authorization
