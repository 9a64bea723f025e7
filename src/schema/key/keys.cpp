#include <warden/schema/key/keys.hpp>

#include <algorithm>
#include <iterator>

namespace warden::schema::key {

namespace {

template <std::size_t N>
bytes_t make_prefixed_key(const std::string_view prefix,
                          const std::array<uint8_t, N>& id) {
  auto out = make_bytes(prefix);
  out.insert(std::end(out), std::begin(id), std::end(id));
  return out;
}

}  // namespace

bytes_t make_consumed_key(const authorization_key_t& key) {
  return make_prefixed_key(kConsumedKeyPrefix, key);
}

bytes_t make_deposit_key(const address_t& depositor) {
  return make_prefixed_key(kDepositKeyPrefix, depositor);
}

bytes_t make_balance_key() {
  return make_bytes(kBalanceKey);
}

bytes_t make_ledger_binding_key() {
  return make_bytes(kLedgerBindingKey);
}

std::optional<address_t> parse_deposit_key(const bytes_view_t& key) {
  auto prefix = make_bytes_view(kDepositKeyPrefix);
  auto depositor = address_t{};
  if (key.size() != prefix.size() + depositor.size() ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  std::copy(std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size()),
            std::end(key), std::begin(depositor));
  return depositor;
}

}  // namespace warden::schema::key
