#pragma once

#include <warden/schema/primitives.hpp>

#include <array>
#include <optional>
#include <string_view>

// Schema key type: component keys.
// Canonical storage keys for the consumption record and the vault account.
// Each component owns its own store, so the keyspaces never overlap in
// practice; distinct prefixes keep them separable if a deployment co-locates
// them.
namespace warden::schema::key {

inline constexpr std::string_view kConsumedKeyPrefix{"SYS|STATE|CONSUMED|"};
inline constexpr std::string_view kBalanceKey{"SYS|STATE|BALANCE"};
inline constexpr std::string_view kDepositKeyPrefix{"SYS|STATE|DEPOSIT|"};
inline constexpr std::string_view kLedgerBindingKey{"SYS|STATE|LEDGER"};

// No entry may be a prefix of another.
inline constexpr std::array<std::string_view, 4> kKeyspaces{
    kConsumedKeyPrefix, kBalanceKey, kDepositKeyPrefix, kLedgerBindingKey};

bytes_t make_consumed_key(const authorization_key_t& key);
bytes_t make_deposit_key(const address_t& depositor);
bytes_t make_balance_key();
bytes_t make_ledger_binding_key();

/// Recover the depositor address from a deposit key, if it is one.
std::optional<address_t> parse_deposit_key(const bytes_view_t& key);

}  // namespace warden::schema::key
