#include <warden/authorization/key.hpp>
#include <warden/blake3/hash.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <string>
#include <tuple>

namespace warden::authorization {

warden::schema::bytes_t derivation_material(
    const warden::schema::authorization_tuple_t& tuple) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  return encoder.encode(std::tuple{
      std::string{kAuthorizationKeyTag}, tuple.domain, tuple.vault,
      tuple.recipient, warden::schema::encode_amount(tuple.amount),
      tuple.authorization_id});
}

warden::schema::authorization_key_t derive_key(
    const warden::schema::authorization_tuple_t& tuple) {
  auto material = derivation_material(tuple);
  return warden::blake3::hash(
      warden::schema::bytes_view_t{material.data(), material.size()});
}

}  // namespace warden::authorization
