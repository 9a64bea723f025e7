#pragma once

#include <warden/authorization/ledger.hpp>
#include <warden/events/sink.hpp>
#include <warden/schema/operation_result.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace warden::vault {

inline constexpr auto kVaultCodespace = std::string_view{"warden.vault"};

/// Moves `amount` to `recipient`; returns false when the transfer is refused.
///
/// Invoked after the vault has already committed the debit, so the handler may
/// re-enter the vault and will observe the post-debit state.
using transfer_handler_t =
    std::function<bool(const warden::schema::address_t& recipient,
                       const warden::schema::amount_t& amount)>;

/// Custody of pooled funds, gated by an authorization ledger.
///
/// Every public operation is one indivisible unit: a single recursive mutex is
/// held across consume, debit and transfer, so no caller observes a partial
/// withdrawal and a re-entrant call from the transfer handler sees the debit.
class vault final {
 public:
  using storage_t =
      warden::storage::storage<warden::storage::rocksdb_storage_tag>;

  vault(storage_t& storage,
        const warden::schema::address_t& identity,
        const warden::schema::domain_id_t& domain,
        transfer_handler_t transfer,
        warden::events::event_sink_t sink = warden::events::log_sink());

  vault(const vault&) = delete;
  vault& operator=(const vault&) = delete;

  /// Bind the vault to its ledger. One-shot.
  ///
  /// Fails with `invalid_reference` for a null ledger and with
  /// `already_initialized` when a ledger is already bound, either in this
  /// instance or (with a different identity) in the backing store.
  warden::schema::operation_result_t initialize(
      warden::authorization::authorization_ledger* ledger);

  /// Credit `amount` to the pool and to the depositor's informational total.
  warden::schema::operation_result_t deposit(
      const warden::schema::address_t& depositor,
      const warden::schema::amount_t& amount);

  /// Pay `amount` to `recipient` if the ledger consumes the authorization.
  ///
  /// Preconditions are checked in order: initialized, recipient, non-zero
  /// amount, sufficient balance. Only then is the ledger consulted; a ledger
  /// rejection yields `authorization_denied` with the ledger verdict in
  /// `cause`. A refused transfer restores the balance and yields
  /// `transfer_failed`; the authorization stays consumed.
  warden::schema::operation_result_t withdraw(
      const warden::schema::address_t& recipient,
      const warden::schema::amount_t& amount,
      const warden::schema::authorization_id_t& authorization_id,
      const warden::schema::bytes_view_t& credential);

  warden::schema::amount_t balance() const;
  bool is_initialized() const;

  /// Informational total deposited by `depositor`; never a withdrawal limit.
  warden::schema::amount_t deposit_of(
      const warden::schema::address_t& depositor) const;
  std::map<warden::schema::address_t, warden::schema::amount_t> deposits()
      const;

  const warden::schema::address_t& identity() const;
  const warden::schema::domain_id_t& domain() const;

 private:
  warden::schema::operation_result_t reject(
      warden::schema::error_code code,
      std::string log,
      std::optional<warden::schema::error_code> cause = std::nullopt) const;
  void emit(warden::schema::operation_result_t& result,
            warden::schema::event_t event) const;
  void persist_balance();
  bool transfer(const warden::schema::address_t& recipient,
                const warden::schema::amount_t& amount);

  mutable std::recursive_mutex mutex_;
  storage_t& storage_;
  warden::schema::address_t identity_;
  warden::schema::domain_id_t domain_;
  transfer_handler_t transfer_;
  warden::events::event_sink_t sink_;
  warden::authorization::authorization_ledger* ledger_{nullptr};
  warden::schema::amount_t balance_{};
};

}  // namespace warden::vault
