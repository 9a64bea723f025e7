#include <gtest/gtest.h>
#include <warden/authorization/ledger.hpp>
#include <warden/schema/event.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/vault_fixture.hpp>
#include <warden/vault/vault.hpp>

#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using warden::schema::error_code;

warden::schema::bytes_view_t view(const warden::schema::bytes_t& bytes) {
  return warden::schema::make_bytes_view(bytes);
}

const auto kCredential = warden::testing::vault_fixture::credential();
const auto kEmpty = warden::schema::bytes_t{};

class vault_test : public ::testing::Test {
 protected:
  vault_test() : fixture_{"warden_vault"} {}

  void initialize_and_fund(const warden::schema::amount_t& amount) {
    ASSERT_EQ(vault().initialize(&fixture_.ledger()).code, error_code::ok);
    ASSERT_EQ(vault().deposit(depositor(), amount).code, error_code::ok);
  }

  warden::vault::vault& vault() { return fixture_.vault(); }

  static warden::schema::address_t depositor() {
    return warden::testing::make_address(0x50);
  }
  static warden::schema::address_t recipient_x() {
    return warden::testing::make_address(0x60);
  }
  static warden::schema::address_t recipient_y() {
    return warden::testing::make_address(0x70);
  }

  warden::testing::vault_fixture fixture_;
};

}  // namespace

TEST_F(vault_test, starts_uninitialized_with_zero_balance) {
  EXPECT_FALSE(vault().is_initialized());
  EXPECT_EQ(vault().balance(), 0);
  EXPECT_EQ(vault().identity(), warden::testing::vault_fixture::vault_address());
  EXPECT_EQ(vault().domain(), warden::testing::vault_fixture::domain());
}

TEST_F(vault_test, initialize_is_one_shot) {
  auto first = vault().initialize(&fixture_.ledger());
  EXPECT_EQ(first.code, error_code::ok);
  EXPECT_TRUE(vault().is_initialized());

  auto second = vault().initialize(&fixture_.ledger());
  EXPECT_EQ(second.code, error_code::already_initialized);
  EXPECT_TRUE(vault().is_initialized());
}

TEST_F(vault_test, initialize_rejects_null_ledger) {
  auto result = vault().initialize(nullptr);
  EXPECT_EQ(result.code, error_code::invalid_reference);
  EXPECT_FALSE(vault().is_initialized());
}

TEST_F(vault_test, deposit_accepts_funds_before_initialization) {
  auto result = vault().deposit(depositor(), 25);
  EXPECT_EQ(result.code, error_code::ok);
  EXPECT_EQ(vault().balance(), 25);
}

TEST_F(vault_test, deposit_rejects_zero_value_and_null_depositor) {
  EXPECT_EQ(vault().deposit(depositor(), 0).code, error_code::zero_value);
  EXPECT_EQ(vault().deposit(warden::schema::address_t{}, 5).code,
            error_code::invalid_recipient);
  EXPECT_EQ(vault().balance(), 0);
}

TEST_F(vault_test, deposit_rejects_overflow) {
  auto max = std::numeric_limits<warden::schema::amount_t>::max();
  ASSERT_EQ(vault().deposit(depositor(), max).code, error_code::ok);
  auto result = vault().deposit(warden::testing::make_address(0x51), 1);
  EXPECT_EQ(result.code, error_code::amount_overflow);
  EXPECT_EQ(vault().balance(), max);
}

TEST_F(vault_test, deposits_accumulate_per_depositor) {
  auto other = warden::testing::make_address(0x51);
  ASSERT_EQ(vault().deposit(depositor(), 10).code, error_code::ok);
  ASSERT_EQ(vault().deposit(depositor(), 15).code, error_code::ok);
  ASSERT_EQ(vault().deposit(other, 7).code, error_code::ok);

  EXPECT_EQ(vault().balance(), 32);
  EXPECT_EQ(vault().deposit_of(depositor()), 25);
  EXPECT_EQ(vault().deposit_of(other), 7);
  EXPECT_EQ(vault().deposit_of(recipient_x()), 0);

  auto deposits = vault().deposits();
  ASSERT_EQ(deposits.size(), 2u);
  EXPECT_EQ(deposits.at(depositor()), 25);
  EXPECT_EQ(deposits.at(other), 7);
}

TEST_F(vault_test, deposit_emits_signal) {
  auto result = vault().deposit(depositor(), 1000);
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, warden::schema::kDepositEvent);
  EXPECT_EQ(warden::schema::find_attribute(result.events[0], "amount"),
            std::optional<std::string>{"1000"});
  EXPECT_EQ(warden::schema::find_attribute(result.events[0], "depositor"),
            std::optional{warden::schema::to_hex(depositor())});
}

TEST_F(vault_test, withdraw_requires_initialization) {
  ASSERT_EQ(vault().deposit(depositor(), 100).code, error_code::ok);
  auto result =
      vault().withdraw(recipient_x(), 10, warden::testing::make_hash(1),
                       view(kCredential));
  EXPECT_EQ(result.code, error_code::not_initialized);
  EXPECT_EQ(vault().balance(), 100);
}

TEST_F(vault_test, withdraw_checks_preconditions_before_authorization) {
  initialize_and_fund(100);
  auto id = warden::testing::make_hash(1);

  EXPECT_EQ(vault()
                .withdraw(warden::schema::address_t{}, 10, id,
                          view(kCredential))
                .code,
            error_code::invalid_recipient);
  EXPECT_EQ(vault().withdraw(recipient_x(), 0, id, view(kCredential)).code,
            error_code::zero_value);
  EXPECT_EQ(vault().withdraw(recipient_x(), 101, id, view(kCredential)).code,
            error_code::insufficient_funds);

  EXPECT_EQ(
      fixture_.recorder().count(warden::schema::kAuthorizationConsumedEvent),
      0u);
  EXPECT_FALSE(
      fixture_.ledger().is_consumed(fixture_.tuple_for(recipient_x(), 101, id)));
  EXPECT_TRUE(fixture_.transfers().empty());
}

TEST_F(vault_test, deposit_then_authorized_withdrawals) {
  // A: deposit 1000.
  initialize_and_fund(1000);
  EXPECT_EQ(vault().balance(), 1000);

  // B: withdraw 400 to X with id 1.
  auto id1 = warden::testing::make_hash(1);
  auto withdrawn = vault().withdraw(recipient_x(), 400, id1, view(kCredential));
  EXPECT_EQ(withdrawn.code, error_code::ok);
  EXPECT_EQ(vault().balance(), 600);
  ASSERT_EQ(fixture_.transfers().size(), 1u);
  EXPECT_EQ(fixture_.transfers()[0].recipient, recipient_x());
  EXPECT_EQ(fixture_.transfers()[0].amount, 400);
  ASSERT_FALSE(withdrawn.events.empty());
  EXPECT_EQ(withdrawn.events.back().type, warden::schema::kWithdrawalEvent);
  EXPECT_EQ(
      warden::schema::find_attribute(withdrawn.events.back(), "authorization_id"),
      std::optional{warden::schema::to_hex(id1)});

  // C: replay of B.
  auto replay = vault().withdraw(recipient_x(), 400, id1, view(kCredential));
  EXPECT_EQ(replay.code, error_code::authorization_denied);
  EXPECT_EQ(replay.cause, std::optional{error_code::replay_rejected});
  EXPECT_EQ(vault().balance(), 600);
  EXPECT_EQ(fixture_.transfers().size(), 1u);

  // D: empty credential.
  auto id2 = warden::testing::make_hash(2);
  auto unsigned_request = vault().withdraw(recipient_y(), 50, id2, view(kEmpty));
  EXPECT_EQ(unsigned_request.code, error_code::authorization_denied);
  EXPECT_EQ(unsigned_request.cause,
            std::optional{error_code::invalid_credential});
  EXPECT_EQ(vault().balance(), 600);

  // E: more than the balance.
  auto id3 = warden::testing::make_hash(3);
  auto too_much = vault().withdraw(recipient_x(), 700, id3, view(kCredential));
  EXPECT_EQ(too_much.code, error_code::insufficient_funds);
  EXPECT_EQ(vault().balance(), 600);
  EXPECT_FALSE(
      fixture_.ledger().is_consumed(fixture_.tuple_for(recipient_x(), 700, id3)));
}

TEST_F(vault_test, unconsumed_authorization_remains_usable_after_insufficient_funds) {
  initialize_and_fund(600);
  auto id3 = warden::testing::make_hash(3);
  ASSERT_EQ(vault().withdraw(recipient_x(), 700, id3, view(kCredential)).code,
            error_code::insufficient_funds);

  ASSERT_EQ(vault().deposit(depositor(), 100).code, error_code::ok);
  EXPECT_EQ(vault().withdraw(recipient_x(), 700, id3, view(kCredential)).code,
            error_code::ok);
  EXPECT_EQ(vault().balance(), 0);
}

TEST_F(vault_test, same_id_with_different_terms_is_a_different_authorization) {
  initialize_and_fund(1000);
  auto id = warden::testing::make_hash(1);
  EXPECT_EQ(vault().withdraw(recipient_x(), 100, id, view(kCredential)).code,
            error_code::ok);
  EXPECT_EQ(vault().withdraw(recipient_y(), 100, id, view(kCredential)).code,
            error_code::ok);
  EXPECT_EQ(vault().withdraw(recipient_x(), 200, id, view(kCredential)).code,
            error_code::ok);
  EXPECT_EQ(vault().balance(), 600);
}

TEST_F(vault_test, failed_transfer_restores_balance_and_keeps_authorization_consumed) {
  initialize_and_fund(1000);
  fixture_.set_transfer_handler(
      [](const warden::schema::address_t&, const warden::schema::amount_t&) {
        return false;
      });
  auto id = warden::testing::make_hash(1);

  auto failed = vault().withdraw(recipient_x(), 400, id, view(kCredential));
  EXPECT_EQ(failed.code, error_code::transfer_failed);
  EXPECT_EQ(vault().balance(), 1000);
  EXPECT_TRUE(
      fixture_.ledger().is_consumed(fixture_.tuple_for(recipient_x(), 400, id)));
  ASSERT_FALSE(failed.events.empty());
  EXPECT_EQ(failed.events.back().type, warden::schema::kWithdrawalFailedEvent);

  fixture_.set_transfer_handler(nullptr);
  auto retry = vault().withdraw(recipient_x(), 400, id, view(kCredential));
  EXPECT_EQ(retry.code, error_code::authorization_denied);
  EXPECT_EQ(retry.cause, std::optional{error_code::replay_rejected});
  EXPECT_EQ(vault().balance(), 1000);
}

TEST_F(vault_test, throwing_transfer_is_treated_as_failure) {
  initialize_and_fund(1000);
  fixture_.set_transfer_handler(
      [](const warden::schema::address_t&,
         const warden::schema::amount_t&) -> bool {
        throw std::runtime_error{"recipient unreachable"};
      });
  auto result = vault().withdraw(recipient_x(), 400,
                                 warden::testing::make_hash(1),
                                 view(kCredential));
  EXPECT_EQ(result.code, error_code::transfer_failed);
  EXPECT_EQ(vault().balance(), 1000);
}

TEST_F(vault_test, reentrant_transfer_observes_committed_effects) {
  initialize_and_fund(1000);
  auto id = warden::testing::make_hash(1);
  auto observed_balance = std::optional<warden::schema::amount_t>{};
  auto observed_consumed = false;
  auto reentry = std::optional<warden::schema::operation_result_t>{};

  fixture_.set_transfer_handler(
      [&](const warden::schema::address_t& recipient,
          const warden::schema::amount_t& amount) {
        observed_balance = vault().balance();
        observed_consumed = fixture_.ledger().is_consumed(
            fixture_.tuple_for(recipient, amount, id));
        reentry = vault().withdraw(recipient, amount, id, view(kCredential));
        return true;
      });

  auto result = vault().withdraw(recipient_x(), 400, id, view(kCredential));
  EXPECT_EQ(result.code, error_code::ok);
  EXPECT_EQ(observed_balance, std::optional<warden::schema::amount_t>{600});
  EXPECT_TRUE(observed_consumed);
  ASSERT_TRUE(reentry.has_value());
  EXPECT_EQ(reentry->code, error_code::authorization_denied);
  EXPECT_EQ(reentry->cause, std::optional{error_code::replay_rejected});
  EXPECT_EQ(vault().balance(), 600);
}

TEST_F(vault_test, rollback_preserves_reentrant_debit) {
  initialize_and_fund(1000);
  auto outer_id = warden::testing::make_hash(1);
  auto inner_id = warden::testing::make_hash(2);
  auto depth = 0;

  fixture_.set_transfer_handler(
      [&](const warden::schema::address_t& recipient,
          const warden::schema::amount_t&) {
        if (depth++ > 0) {
          return true;
        }
        auto inner =
            vault().withdraw(recipient, 100, inner_id, view(kCredential));
        EXPECT_EQ(inner.code, error_code::ok);
        return false;
      });

  auto outer = vault().withdraw(recipient_x(), 400, outer_id, view(kCredential));
  EXPECT_EQ(outer.code, error_code::transfer_failed);
  EXPECT_EQ(vault().balance(), 900);
}

TEST_F(vault_test, concurrent_withdrawals_of_one_authorization_pay_once) {
  initialize_and_fund(1000);
  auto id = warden::testing::make_hash(9);
  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      static_cast<void>(
          vault().withdraw(recipient_x(), 100, id, view(kCredential)));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(vault().balance(), 900);
  EXPECT_EQ(fixture_.transfers().size(), 1u);
  EXPECT_EQ(fixture_.recorder().count(warden::schema::kWithdrawalEvent), 1u);
  EXPECT_EQ(
      fixture_.recorder().count(warden::schema::kWithdrawalFailedEvent), 7u);
}

TEST(vault_persistence, balance_and_binding_survive_restart) {
  auto ledger_db = warden::testing::scoped_path{"warden_vault_restart_ledger"};
  auto vault_db = warden::testing::scoped_path{"warden_vault_restart_vault"};
  auto ledger_address = warden::testing::make_address(0x10);
  auto vault_address = warden::testing::make_address(0xA0);
  auto domain = warden::testing::make_hash(0xD0);
  auto accept = [](const warden::schema::address_t&,
                   const warden::schema::amount_t&) { return true; };
  auto credential = warden::testing::vault_fixture::credential();
  auto id = warden::testing::make_hash(1);
  auto recipient = warden::testing::make_address(0x60);

  {
    auto ledger_storage = warden::testing::open_storage(ledger_db.path);
    auto vault_storage = warden::testing::open_storage(vault_db.path);
    auto ledger = warden::authorization::authorization_ledger{ledger_storage,
                                                              ledger_address};
    auto vault = warden::vault::vault{vault_storage, vault_address, domain,
                                      accept};
    ASSERT_EQ(vault.initialize(&ledger).code, error_code::ok);
    ASSERT_EQ(vault.deposit(warden::testing::make_address(0x50), 1000).code,
              error_code::ok);
    ASSERT_EQ(vault.withdraw(recipient, 400, id, view(credential)).code,
              error_code::ok);
  }

  auto ledger_storage = warden::testing::open_storage(ledger_db.path);
  auto vault_storage = warden::testing::open_storage(vault_db.path);
  auto ledger = warden::authorization::authorization_ledger{ledger_storage,
                                                            ledger_address};
  auto vault =
      warden::vault::vault{vault_storage, vault_address, domain, accept};
  EXPECT_EQ(vault.balance(), 600);
  EXPECT_EQ(vault.deposit_of(warden::testing::make_address(0x50)), 1000);
  EXPECT_FALSE(vault.is_initialized());

  EXPECT_EQ(vault.initialize(&ledger).code, error_code::ok);
  auto replay = vault.withdraw(recipient, 400, id, view(credential));
  EXPECT_EQ(replay.code, error_code::authorization_denied);
  EXPECT_EQ(replay.cause, std::optional{error_code::replay_rejected});
  EXPECT_EQ(vault.balance(), 600);
}

TEST(vault_persistence, store_bound_to_one_ledger_rejects_another) {
  auto ledger_db = warden::testing::scoped_path{"warden_vault_rebind_ledger"};
  auto other_db = warden::testing::scoped_path{"warden_vault_rebind_other"};
  auto vault_db = warden::testing::scoped_path{"warden_vault_rebind_vault"};
  auto accept = [](const warden::schema::address_t&,
                   const warden::schema::amount_t&) { return true; };

  auto ledger_storage = warden::testing::open_storage(ledger_db.path);
  auto other_storage = warden::testing::open_storage(other_db.path);
  auto ledger = warden::authorization::authorization_ledger{
      ledger_storage, warden::testing::make_address(0x10)};
  auto other = warden::authorization::authorization_ledger{
      other_storage, warden::testing::make_address(0x20)};
  {
    auto vault_storage = warden::testing::open_storage(vault_db.path);
    auto vault = warden::vault::vault{
        vault_storage, warden::testing::make_address(0xA0),
        warden::testing::make_hash(0xD0), accept};
    ASSERT_EQ(vault.initialize(&ledger).code, error_code::ok);
  }

  auto vault_storage = warden::testing::open_storage(vault_db.path);
  auto vault = warden::vault::vault{vault_storage,
                                    warden::testing::make_address(0xA0),
                                    warden::testing::make_hash(0xD0), accept};
  EXPECT_EQ(vault.initialize(&other).code, error_code::already_initialized);
  EXPECT_FALSE(vault.is_initialized());
}
