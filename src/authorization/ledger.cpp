#include <warden/authorization/key.hpp>
#include <warden/authorization/ledger.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

using namespace warden::schema;

namespace {

std::vector<event_attribute_t> tuple_attributes(
    const authorization_key_t& key,
    const authorization_tuple_t& tuple) {
  return {warden::events::attribute("authorization_key", to_hex(key), true),
          warden::events::attribute("vault", to_hex(tuple.vault)),
          warden::events::attribute("recipient", to_hex(tuple.recipient)),
          warden::events::attribute("amount", tuple.amount.str()),
          warden::events::attribute("authorization_id",
                                    to_hex(tuple.authorization_id)),
          warden::events::attribute("domain", to_hex(tuple.domain))};
}

event_t make_consumed_event(const authorization_key_t& key,
                            const authorization_tuple_t& tuple) {
  return event_t{.version = 1,
                 .type = std::string{kAuthorizationConsumedEvent},
                 .attributes = tuple_attributes(key, tuple)};
}

event_t make_failed_event(const authorization_key_t& key,
                          const error_code code,
                          const std::string& reason) {
  return event_t{
      .version = 1,
      .type = std::string{kAuthorizationFailedEvent},
      .attributes = {
          warden::events::attribute("authorization_key", to_hex(key), true),
          warden::events::attribute("code", std::string{to_string(code)}),
          warden::events::attribute("reason", reason)}};
}

}  // namespace

namespace warden::authorization {

authorization_ledger::authorization_ledger(
    storage_t& storage,
    const warden::schema::address_t& identity,
    credential_verifier_t verifier,
    warden::events::event_sink_t sink)
    : storage_{storage},
      identity_{identity},
      verifier_{std::move(verifier)},
      sink_{std::move(sink)} {
  spdlog::info("Authorization ledger {} ready", to_hex(identity_));
}

operation_result_t authorization_ledger::try_consume(
    const authorization_tuple_t& tuple,
    const bytes_view_t& credential) {
  auto lock = std::scoped_lock{mutex_};
  auto result = operation_result_t{};
  result.codespace = std::string{kLedgerCodespace};

  auto key = derive_key(tuple);
  result.authorization_key = key;

  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto storage_key = warden::schema::key::make_consumed_key(key);
  auto consumed =
      storage_.get<bool>(encoder, make_bytes_view(storage_key)).value_or(false);
  if (consumed) {
    result.code = error_code::replay_rejected;
    result.log = "authorization already consumed";
    emit(result, make_failed_event(key, result.code, result.log));
    return result;
  }

  if (!verifier_ || !verifier_(key, tuple, credential)) {
    result.code = error_code::invalid_credential;
    result.log = "credential rejected by verifier";
    emit(result, make_failed_event(key, result.code, result.log));
    return result;
  }

  storage_.put(encoder, make_bytes_view(storage_key), true);
  emit(result, make_consumed_event(key, tuple));
  return result;
}

bool authorization_ledger::is_consumed(
    const authorization_tuple_t& tuple) const {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto storage_key = warden::schema::key::make_consumed_key(derive_key(tuple));
  return storage_.get<bool>(encoder, make_bytes_view(storage_key))
      .value_or(false);
}

const address_t& authorization_ledger::identity() const {
  return identity_;
}

void authorization_ledger::emit(operation_result_t& result,
                                event_t event) const {
  if (sink_) {
    sink_(event);
  }
  result.events.push_back(std::move(event));
}

}  // namespace warden::authorization
