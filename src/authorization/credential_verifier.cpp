#include <warden/authorization/credential_verifier.hpp>
#include <warden/crypto/verify.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

namespace warden::authorization {

namespace {

using credential_layout_t =
    std::tuple<uint8_t, warden::schema::bytes_t, warden::schema::bytes_t>;

template <std::size_t N>
std::optional<std::array<uint8_t, N>> to_fixed(
    const warden::schema::bytes_t& bytes) {
  if (bytes.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(out));
  return out;
}

template <std::size_t N>
warden::schema::bytes_t to_vector(const std::array<uint8_t, N>& bytes) {
  return warden::schema::bytes_t{std::begin(bytes), std::end(bytes)};
}

}  // namespace

credential_verifier_t presence_verifier() {
  spdlog::warn(
      "Using presence-only credential verifier; credentials are not "
      "cryptographically checked");
  return [](const warden::schema::authorization_key_t&,
            const warden::schema::authorization_tuple_t&,
            const warden::schema::bytes_view_t& credential) {
    return !credential.empty();
  };
}

credential_verifier_t make_signer_set_verifier(
    std::vector<warden::schema::signer_id_t> signers) {
  spdlog::info("Signer-set credential verifier installed with {} signer(s)",
               signers.size());
  return [signers = std::move(signers)](
             const warden::schema::authorization_key_t& key,
             const warden::schema::authorization_tuple_t&,
             const warden::schema::bytes_view_t& credential) {
    auto decoded = decode_credential(credential);
    if (!decoded) {
      spdlog::debug("Rejecting malformed credential ({} bytes)",
                    credential.size());
      return false;
    }
    if (std::find(std::begin(signers), std::end(signers), decoded->signer) ==
        std::end(signers)) {
      spdlog::debug("Rejecting credential from unauthorized signer");
      return false;
    }
    return warden::crypto::verify_signature(
        warden::schema::bytes_view_t{key.data(), key.size()}, decoded->signer,
        decoded->signature);
  };
}

std::optional<warden::schema::bytes_t> encode_credential(
    const warden::schema::signer_id_t& signer,
    const warden::schema::signature_t& signature) {
  auto layout = std::visit(
      overloaded{
          [&](const warden::schema::ed25519_signer_id& value)
              -> std::optional<credential_layout_t> {
            const auto* sig =
                std::get_if<warden::schema::ed25519_signature_t>(&signature);
            if (sig == nullptr) {
              return std::nullopt;
            }
            return credential_layout_t{
                static_cast<uint8_t>(signature_scheme::ed25519),
                to_vector(value.public_key), to_vector(*sig)};
          },
          [&](const warden::schema::secp256k1_signer_id& value)
              -> std::optional<credential_layout_t> {
            const auto* sig =
                std::get_if<warden::schema::secp256k1_signature_t>(&signature);
            if (sig == nullptr) {
              return std::nullopt;
            }
            return credential_layout_t{
                static_cast<uint8_t>(signature_scheme::secp256k1),
                to_vector(value.public_key), to_vector(*sig)};
          },
          [](const warden::schema::named_signer_t&)
              -> std::optional<credential_layout_t> { return std::nullopt; }},
      signer);
  if (!layout) {
    return std::nullopt;
  }
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  return encoder.encode(*layout);
}

std::optional<signed_credential> decode_credential(
    const warden::schema::bytes_view_t& credential) {
  if (credential.empty()) {
    return std::nullopt;
  }
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto layout = encoder.try_decode<credential_layout_t>(credential);
  if (!layout) {
    return std::nullopt;
  }
  const auto& [scheme, public_key, signature] = *layout;

  if (scheme == static_cast<uint8_t>(signature_scheme::ed25519)) {
    auto key = to_fixed<32>(public_key);
    auto sig = to_fixed<64>(signature);
    if (!key || !sig) {
      return std::nullopt;
    }
    return signed_credential{
        .signer = warden::schema::ed25519_signer_id{.public_key = *key},
        .signature = *sig};
  }
  if (scheme == static_cast<uint8_t>(signature_scheme::secp256k1)) {
    auto key = to_fixed<33>(public_key);
    auto sig = to_fixed<65>(signature);
    if (!key || !sig) {
      return std::nullopt;
    }
    return signed_credential{
        .signer = warden::schema::secp256k1_signer_id{.public_key = *key},
        .signature = *sig};
  }
  return std::nullopt;
}

}  // namespace warden::authorization
