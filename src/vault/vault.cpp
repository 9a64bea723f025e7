#include <warden/schema/authorization_tuple.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/key/keys.hpp>
#include <warden/vault/vault.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>
#include <vector>

using namespace warden::schema;

namespace {

using encoder_t = warden::schema::encoding::scale_encoder_t;

event_t make_deposit_event(const address_t& depositor,
                           const amount_t& amount,
                           const amount_t& balance) {
  return event_t{
      .version = 1,
      .type = std::string{kDepositEvent},
      .attributes = {
          warden::events::attribute("depositor", to_hex(depositor), true),
          warden::events::attribute("amount", amount.str()),
          warden::events::attribute("balance", balance.str())}};
}

event_t make_withdrawal_event(const address_t& recipient,
                              const amount_t& amount,
                              const authorization_id_t& authorization_id,
                              const amount_t& balance) {
  return event_t{
      .version = 1,
      .type = std::string{kWithdrawalEvent},
      .attributes = {
          warden::events::attribute("recipient", to_hex(recipient), true),
          warden::events::attribute("amount", amount.str()),
          warden::events::attribute("authorization_id",
                                    to_hex(authorization_id), true),
          warden::events::attribute("balance", balance.str())}};
}

event_t make_withdrawal_failed_event(const address_t& recipient,
                                     const amount_t& amount,
                                     const authorization_id_t& authorization_id,
                                     const operation_result_t& result) {
  auto event = event_t{
      .version = 1,
      .type = std::string{kWithdrawalFailedEvent},
      .attributes = {
          warden::events::attribute("recipient", to_hex(recipient), true),
          warden::events::attribute("amount", amount.str()),
          warden::events::attribute("authorization_id",
                                    to_hex(authorization_id), true),
          warden::events::attribute("code",
                                    std::string{to_string(result.code)}),
          warden::events::attribute("reason", result.log)}};
  if (result.cause) {
    event.attributes.push_back(warden::events::attribute(
        "cause", std::string{to_string(*result.cause)}));
  }
  return event;
}

bytes_t encode_amount_value(encoder_t& encoder, const amount_t& amount) {
  return encoder.encode(encode_amount(amount));
}

template <typename Storage>
amount_t load_amount(const Storage& storage,
                     encoder_t& encoder,
                     const bytes_t& key) {
  auto stored = storage.template get<hash32_t>(encoder, make_bytes_view(key));
  if (!stored) {
    return amount_t{};
  }
  return decode_amount(*stored);
}

}  // namespace

namespace warden::vault {

vault::vault(storage_t& storage,
             const address_t& identity,
             const domain_id_t& domain,
             transfer_handler_t transfer,
             warden::events::event_sink_t sink)
    : storage_{storage},
      identity_{identity},
      domain_{domain},
      transfer_{std::move(transfer)},
      sink_{std::move(sink)} {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_t{};
  balance_ =
      load_amount(storage_, encoder, warden::schema::key::make_balance_key());
  if (!transfer_) {
    spdlog::warn("Vault {} has no transfer handler; withdrawals will fail",
                 to_hex(identity_));
  }
  spdlog::info("Vault {} ready on domain {} with balance {}", to_hex(identity_),
               to_hex(domain_), balance_.str());
}

operation_result_t vault::initialize(
    warden::authorization::authorization_ledger* ledger) {
  auto lock = std::scoped_lock{mutex_};
  if (ledger == nullptr) {
    return reject(error_code::invalid_reference, "ledger reference is null");
  }
  if (ledger_ != nullptr) {
    return reject(error_code::already_initialized,
                  "vault is already bound to ledger " +
                      to_hex(ledger_->identity()));
  }

  auto encoder = encoder_t{};
  auto binding_key = warden::schema::key::make_ledger_binding_key();
  auto binding =
      storage_.get<address_t>(encoder, make_bytes_view(binding_key));
  if (binding && *binding != ledger->identity()) {
    return reject(error_code::already_initialized,
                  "vault store is bound to ledger " + to_hex(*binding));
  }
  if (!binding) {
    storage_.put(encoder, make_bytes_view(binding_key), ledger->identity());
  } else {
    spdlog::info("Vault {} re-attached to ledger {}", to_hex(identity_),
                 to_hex(*binding));
  }

  ledger_ = ledger;
  spdlog::info("Vault {} initialized with ledger {}", to_hex(identity_),
               to_hex(ledger->identity()));

  auto result = operation_result_t{};
  result.codespace = std::string{kVaultCodespace};
  return result;
}

operation_result_t vault::deposit(const address_t& depositor,
                                  const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  if (amount == 0) {
    return reject(error_code::zero_value, "deposit amount must be non-zero");
  }
  if (is_null(depositor)) {
    return reject(error_code::invalid_recipient, "depositor address is null");
  }

  auto encoder = encoder_t{};
  auto deposit_key = warden::schema::key::make_deposit_key(depositor);
  auto deposited = load_amount(storage_, encoder, deposit_key);

  // uint256 arithmetic wraps; a wrapped sum is smaller than its operand.
  auto updated_balance = balance_ + amount;
  auto updated_deposit = deposited + amount;
  if (updated_balance < balance_ || updated_deposit < deposited) {
    return reject(error_code::amount_overflow,
                  "deposit would overflow the vault balance");
  }

  storage_.write_batch(
      {{warden::schema::key::make_balance_key(),
        encode_amount_value(encoder, updated_balance)},
       {deposit_key, encode_amount_value(encoder, updated_deposit)}});
  balance_ = updated_balance;

  auto result = operation_result_t{};
  result.codespace = std::string{kVaultCodespace};
  emit(result, make_deposit_event(depositor, amount, balance_));
  return result;
}

operation_result_t vault::withdraw(const address_t& recipient,
                                   const amount_t& amount,
                                   const authorization_id_t& authorization_id,
                                   const bytes_view_t& credential) {
  auto lock = std::scoped_lock{mutex_};
  if (ledger_ == nullptr) {
    return reject(error_code::not_initialized, "vault is not initialized");
  }
  if (is_null(recipient)) {
    return reject(error_code::invalid_recipient, "recipient address is null");
  }
  if (amount == 0) {
    return reject(error_code::zero_value, "withdrawal amount must be non-zero");
  }
  if (balance_ < amount) {
    return reject(error_code::insufficient_funds,
                  "requested " + amount.str() + " exceeds balance " +
                      balance_.str());
  }

  auto tuple = authorization_tuple_t{.version = 1,
                                     .vault = identity_,
                                     .recipient = recipient,
                                     .amount = amount,
                                     .authorization_id = authorization_id,
                                     .domain = domain_};
  auto verdict = ledger_->try_consume(tuple, credential);

  auto result = operation_result_t{};
  result.codespace = std::string{kVaultCodespace};
  result.authorization_key = verdict.authorization_key;
  result.events = std::move(verdict.events);

  if (verdict.code != error_code::ok) {
    result.code = error_code::authorization_denied;
    result.cause = verdict.code;
    result.log = "authorization denied: " + verdict.log;
    emit(result, make_withdrawal_failed_event(recipient, amount,
                                              authorization_id, result));
    return result;
  }

  // Effects are committed before the interaction so a re-entrant call from
  // the transfer handler sees the debit and the consumed authorization.
  balance_ -= amount;
  persist_balance();

  if (!transfer(recipient, amount)) {
    // Undo only this call's debit; a re-entrant withdrawal may have moved the
    // balance in the meantime.
    balance_ += amount;
    persist_balance();
    result.code = error_code::transfer_failed;
    result.log = "transfer to recipient failed";
    emit(result, make_withdrawal_failed_event(recipient, amount,
                                              authorization_id, result));
    return result;
  }

  emit(result, make_withdrawal_event(recipient, amount, authorization_id,
                                     balance_));
  return result;
}

amount_t vault::balance() const {
  auto lock = std::scoped_lock{mutex_};
  return balance_;
}

bool vault::is_initialized() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_ != nullptr;
}

amount_t vault::deposit_of(const address_t& depositor) const {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_t{};
  auto deposit_key = warden::schema::key::make_deposit_key(depositor);
  return load_amount(storage_, encoder, deposit_key);
}

std::map<address_t, amount_t> vault::deposits() const {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_t{};
  auto prefix = make_bytes(warden::schema::key::kDepositKeyPrefix);
  auto out = std::map<address_t, amount_t>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto depositor =
        warden::schema::key::parse_deposit_key(make_bytes_view(key));
    if (!depositor) {
      spdlog::warn("Skipping malformed deposit key of {} bytes", key.size());
      continue;
    }
    auto word = encoder.decode<hash32_t>(make_bytes_view(value));
    out.emplace(*depositor, decode_amount(word));
  }
  return out;
}

const address_t& vault::identity() const {
  return identity_;
}

const domain_id_t& vault::domain() const {
  return domain_;
}

operation_result_t vault::reject(const error_code code,
                                 std::string log,
                                 std::optional<error_code> cause) const {
  spdlog::debug("Vault {} rejected operation: {} ({})", to_hex(identity_),
                to_string(code), log);
  auto result = operation_result_t{};
  result.code = code;
  result.cause = cause;
  result.log = std::move(log);
  result.codespace = std::string{kVaultCodespace};
  return result;
}

void vault::emit(operation_result_t& result, event_t event) const {
  if (sink_) {
    sink_(event);
  }
  result.events.push_back(std::move(event));
}

void vault::persist_balance() {
  auto encoder = encoder_t{};
  auto balance_key = warden::schema::key::make_balance_key();
  storage_.put(encoder, make_bytes_view(balance_key), encode_amount(balance_));
}

bool vault::transfer(const address_t& recipient, const amount_t& amount) {
  if (!transfer_) {
    spdlog::error("Vault {} cannot transfer: no transfer handler",
                  to_hex(identity_));
    return false;
  }
  try {
    return transfer_(recipient, amount);
  } catch (const std::exception& ex) {
    spdlog::error("Transfer of {} to {} raised: {}", amount.str(),
                  to_hex(recipient), ex.what());
    return false;
  }
}

}  // namespace warden::vault
