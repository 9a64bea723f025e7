#pragma once

#include <warden/authorization/credential_verifier.hpp>
#include <warden/events/sink.hpp>
#include <warden/schema/authorization_tuple.hpp>
#include <warden/schema/operation_result.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <mutex>
#include <string_view>

namespace warden::authorization {

inline constexpr auto kLedgerCodespace = std::string_view{"warden.ledger"};

/// Exactly-once registry of authorization keys.
///
/// The ledger is the sole source of replay-protection truth: once a key is
/// consumed it stays consumed, across restarts, for every caller. It owns its
/// store exclusively.
class authorization_ledger final {
 public:
  using storage_t =
      warden::storage::storage<warden::storage::rocksdb_storage_tag>;

  authorization_ledger(storage_t& storage,
                       const warden::schema::address_t& identity,
                       credential_verifier_t verifier = presence_verifier(),
                       warden::events::event_sink_t sink =
                           warden::events::log_sink());

  authorization_ledger(const authorization_ledger&) = delete;
  authorization_ledger& operator=(const authorization_ledger&) = delete;

  /// Atomically check and consume the authorization bound to `tuple`.
  ///
  /// Succeeds (`error_code::ok`) at most once per derived key. Fails with
  /// `replay_rejected` when the key was already consumed and with
  /// `invalid_credential` when the verifier rejects `credential`; neither
  /// failure mutates state. The derived key is always returned.
  warden::schema::operation_result_t try_consume(
      const warden::schema::authorization_tuple_t& tuple,
      const warden::schema::bytes_view_t& credential);

  /// Whether the key derived from `tuple` has been consumed.
  bool is_consumed(const warden::schema::authorization_tuple_t& tuple) const;

  const warden::schema::address_t& identity() const;

 private:
  void emit(warden::schema::operation_result_t& result,
            warden::schema::event_t event) const;

  mutable std::mutex mutex_;
  storage_t& storage_;
  warden::schema::address_t identity_;
  credential_verifier_t verifier_;
  warden::events::event_sink_t sink_;
};

}  // namespace warden::authorization
