#include <beacon/execution/registry.hpp>
#include <beacon/schema/constants.hpp>
#include <beacon/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <optional>
#include <variant>
#include <vector>

namespace {

using beacon::schema::amount_t;
using beacon::schema::intent_side_t;
using beacon::schema::registry_error_code;
using beacon::testing::kController;
using beacon::testing::kKeeper;
using beacon::testing::kOwner;
using beacon::testing::kStranger;
using beacon::testing::make_entry;
using beacon::testing::make_submit;

uint32_t code_of(const registry_error_code code) {
  return static_cast<uint32_t>(code);
}

beacon::schema::execute_intent_t make_execute(
    const beacon::schema::intent_id_t intent_id,
    const amount_t& executed_amount) {
  return beacon::schema::execute_intent_t{.intent_id = intent_id,
                                          .executed_amount = executed_amount,
                                          .average_price = 2990};
}

beacon::schema::cancel_intent_t make_cancel(
    const beacon::schema::intent_id_t intent_id) {
  return beacon::schema::cancel_intent_t{.intent_id = intent_id};
}

}  // namespace

TEST(registry_integration, submit_assigns_monotonic_ids_and_emits_event) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_submit"};
  auto& registry = fixture.registry();
  fixture.clock().advance(4);

  for (auto expected = beacon::schema::intent_id_t{1}; expected <= 3;
       ++expected) {
    auto result = registry.submit_intent(kController, make_submit(100));
    ASSERT_EQ(result.code, 0u) << result.log;
    EXPECT_EQ(result.codespace, "beacon.submit_intent");
    EXPECT_EQ(fixture.encoder().decode<beacon::schema::intent_id_t>(
                  beacon::schema::bytes_view_t{result.data.data(),
                                               result.data.size()}),
              expected);
    ASSERT_EQ(result.events.size(), 1u);
    const auto& event =
        std::get<beacon::schema::intent_submitted_t>(result.events[0]);
    EXPECT_EQ(event.intent_id, expected);
    EXPECT_EQ(event.submitter, kController);
    EXPECT_EQ(event.amount, 100);
    EXPECT_EQ(event.sequence, 5u);
  }

  auto intent = registry.intents().get(2);
  ASSERT_TRUE(intent.has_value());
  EXPECT_EQ(intent->created_at, 5u);
  EXPECT_EQ(fixture.published.size(), 3u);
}

TEST(registry_integration, fee_must_cover_rate_exactly) {
  auto fixture = beacon::testing::registry_fixture{
      "beacon_registry_fee", beacon::testing::make_options(25)};
  auto& registry = fixture.registry();
  auto amount = amount_t{"1000000000000000"};
  auto fee = amount_t{"2500000000000"};

  auto short_fee = registry.submit_intent(
      kController, make_submit(amount, intent_side_t::buy, "ETH", fee - 1));
  EXPECT_EQ(short_fee.code, code_of(registry_error_code::insufficient_fee));
  EXPECT_EQ(short_fee.log, "insufficient fee");
  EXPECT_TRUE(short_fee.events.empty());
  EXPECT_EQ(registry.intents().count(), 0u);
  EXPECT_EQ(registry.treasury().balance(), 0);

  auto paid = registry.submit_intent(
      kController, make_submit(amount, intent_side_t::buy, "ETH", fee));
  ASSERT_EQ(paid.code, 0u) << paid.log;
  EXPECT_EQ(registry.treasury().balance(), fee);
  ASSERT_EQ(paid.events.size(), 2u);
  const auto& topped =
      std::get<beacon::schema::treasury_topped_t>(paid.events[1]);
  EXPECT_EQ(topped.amount, fee);
  EXPECT_EQ(topped.from, kController);
}

TEST(registry_integration, counts_and_recent_ids_after_one_execution) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_counts"};
  auto& registry = fixture.registry();
  for (auto i = 0; i < 3; ++i) {
    ASSERT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);
  }
  ASSERT_EQ(registry.execute_intent(kKeeper, make_execute(2, 100)).code, 0u);

  auto stats = registry.stats();
  EXPECT_EQ(stats.total_intents, 3u);
  EXPECT_EQ(stats.pending, 2u);
  EXPECT_EQ(stats.executed, 1u);
  EXPECT_EQ(stats.cancelled, 0u);
  EXPECT_EQ(stats.total_executions, 1u);
  EXPECT_EQ(stats.fill_rate_bps, 10000u);
  EXPECT_EQ(stats.execution_rate_bps, 3333u);
  EXPECT_EQ(registry.intents().last(2),
            (std::vector<beacon::schema::intent_id_t>{3, 2}));
}

TEST(registry_integration, pause_blocks_submit_and_execute_but_not_cancel) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_pause"};
  auto& registry = fixture.registry();
  ASSERT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);
  ASSERT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);

  auto paused =
      registry.set_paused(kOwner, beacon::schema::set_paused_t{.paused = true});
  ASSERT_EQ(paused.code, 0u);
  ASSERT_EQ(paused.events.size(), 1u);
  EXPECT_TRUE(std::get<beacon::schema::pause_changed_t>(paused.events[0]).paused);
  EXPECT_TRUE(registry.config().paused);

  EXPECT_EQ(registry.submit_intent(kController, make_submit(100)).code,
            code_of(registry_error_code::paused));
  auto batch = beacon::schema::submit_intent_batch_t{};
  batch.entries.push_back(make_entry(100));
  EXPECT_EQ(registry.submit_intent_batch(kController, batch).code,
            code_of(registry_error_code::paused));
  EXPECT_EQ(registry.execute_intent(kKeeper, make_execute(1, 100)).code,
            code_of(registry_error_code::paused));

  EXPECT_EQ(registry.cancel_intent(kController, make_cancel(1)).code, 0u);
  EXPECT_EQ(registry.cancel_intent(kOwner, make_cancel(2)).code, 0u);
  EXPECT_EQ(registry.intents().count(), 2u);
}

TEST(registry_integration, roles_gate_each_operation) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_roles"};
  auto& registry = fixture.registry();
  EXPECT_EQ(registry.submit_intent(kStranger, make_submit(100)).code,
            code_of(registry_error_code::not_controller));
  EXPECT_EQ(registry.submit_intent(kKeeper, make_submit(100)).code,
            code_of(registry_error_code::not_controller));
  ASSERT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);

  EXPECT_EQ(registry.execute_intent(kController, make_execute(1, 10)).code,
            code_of(registry_error_code::not_keeper));
  EXPECT_EQ(registry.cancel_intent(kStranger, make_cancel(1)).code,
            code_of(registry_error_code::unauthorized));

  EXPECT_EQ(registry
                .set_controller(kController, beacon::schema::set_controller_t{
                                                 .controller = kStranger})
                .code,
            code_of(registry_error_code::not_owner));
  EXPECT_EQ(registry
                .set_fee_rate(kKeeper, beacon::schema::set_fee_rate_t{
                                           .fee_bps = 10})
                .code,
            code_of(registry_error_code::not_owner));
  EXPECT_EQ(registry.set_paused(kStranger, beacon::schema::set_paused_t{}).code,
            code_of(registry_error_code::not_owner));
  EXPECT_EQ(registry
                .withdraw(kController, beacon::schema::withdraw_treasury_t{
                                           .to = kController, .amount = 1})
                .code,
            code_of(registry_error_code::unauthorized));
}

TEST(registry_integration, config_changes_apply_immediately) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_config"};
  auto& registry = fixture.registry();

  auto changed = registry.set_controller(
      kOwner, beacon::schema::set_controller_t{.controller = kStranger});
  ASSERT_EQ(changed.code, 0u);
  const auto& event =
      std::get<beacon::schema::controller_changed_t>(changed.events[0]);
  EXPECT_EQ(event.previous, kController);
  EXPECT_EQ(event.controller, kStranger);
  EXPECT_EQ(registry.submit_intent(kController, make_submit(100)).code,
            code_of(registry_error_code::not_controller));
  EXPECT_EQ(registry.submit_intent(kStranger, make_submit(100)).code, 0u);

  EXPECT_EQ(registry
                .set_controller(kOwner, beacon::schema::set_controller_t{
                                            .controller = beacon::schema::make_zero_hash()})
                .code,
            code_of(registry_error_code::zero_address));
  EXPECT_EQ(registry
                .set_keeper(kOwner, beacon::schema::set_keeper_t{
                                        .keeper = beacon::schema::make_zero_hash()})
                .code,
            code_of(registry_error_code::zero_address));

  EXPECT_EQ(registry
                .set_execution_bounds(kOwner,
                                      beacon::schema::set_execution_bounds_t{
                                          .min_amount = 11, .max_amount = 10})
                .code,
            code_of(registry_error_code::bounds_invalid));
  auto bounds = registry.set_execution_bounds(
      kOwner, beacon::schema::set_execution_bounds_t{.min_amount = 10,
                                                     .max_amount = 10});
  ASSERT_EQ(bounds.code, 0u);
  const auto& bounds_event =
      std::get<beacon::schema::bounds_changed_t>(bounds.events[0]);
  EXPECT_EQ(bounds_event.previous_min_amount, 1);
  EXPECT_EQ(bounds_event.min_amount, 10);

  EXPECT_EQ(registry
                .set_fee_rate(kOwner, beacon::schema::set_fee_rate_t{
                                          .fee_bps = beacon::schema::kFeeDenominator + 1})
                .code,
            code_of(registry_error_code::bounds_invalid));
  auto fee = registry.set_fee_rate(
      kOwner,
      beacon::schema::set_fee_rate_t{.fee_bps = beacon::schema::kFeeDenominator});
  ASSERT_EQ(fee.code, 0u);
  EXPECT_EQ(std::get<beacon::schema::fee_changed_t>(fee.events[0]).previous_bps,
            0u);
  EXPECT_EQ(registry.config().fee_bps, beacon::schema::kFeeDenominator);
}

TEST(registry_integration, amount_bounds_are_inclusive) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_bounds"};
  auto& registry = fixture.registry();
  ASSERT_EQ(registry
                .set_execution_bounds(kOwner,
                                      beacon::schema::set_execution_bounds_t{
                                          .min_amount = 100, .max_amount = 200})
                .code,
            0u);

  EXPECT_EQ(registry.submit_intent(kController, make_submit(99)).code,
            code_of(registry_error_code::amount_out_of_bounds));
  EXPECT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);
  EXPECT_EQ(registry.submit_intent(kController, make_submit(200)).code, 0u);
  EXPECT_EQ(registry.submit_intent(kController, make_submit(201)).code,
            code_of(registry_error_code::amount_out_of_bounds));
  EXPECT_EQ(registry.submit_intent(kController, make_submit(0)).code,
            code_of(registry_error_code::zero_amount));

  auto bad_side = make_submit(150);
  bad_side.side = static_cast<intent_side_t>(0);
  EXPECT_EQ(registry.submit_intent(kController, bad_side).code,
            code_of(registry_error_code::invalid_side));
  EXPECT_EQ(registry.intents().count(), 2u);
}

TEST(registry_integration, batch_with_one_invalid_entry_commits_nothing) {
  auto fixture = beacon::testing::registry_fixture{
      "beacon_registry_batch", beacon::testing::make_options(100)};
  auto& registry = fixture.registry();

  auto batch = beacon::schema::submit_intent_batch_t{};
  batch.entries = {make_entry(1000), make_entry(0), make_entry(3000)};
  batch.total_fee_paid = 40;
  auto rejected = registry.submit_intent_batch(kController, batch);
  EXPECT_EQ(rejected.code, code_of(registry_error_code::zero_amount));
  EXPECT_TRUE(rejected.events.empty());
  EXPECT_EQ(registry.intents().count(), 0u);
  EXPECT_EQ(registry.treasury().balance(), 0);
  EXPECT_TRUE(registry.events(1, 100).empty());
  EXPECT_TRUE(fixture.published.empty());

  batch.entries[1].amount = 2000;
  batch.total_fee_paid = 59;
  EXPECT_EQ(registry.submit_intent_batch(kController, batch).code,
            code_of(registry_error_code::insufficient_fee));

  batch.total_fee_paid = 60;
  auto accepted = registry.submit_intent_batch(kController, batch);
  ASSERT_EQ(accepted.code, 0u) << accepted.log;
  EXPECT_EQ(fixture.encoder().decode<std::vector<beacon::schema::intent_id_t>>(
                beacon::schema::bytes_view_t{accepted.data.data(),
                                             accepted.data.size()}),
            (std::vector<beacon::schema::intent_id_t>{1, 2, 3}));
  EXPECT_EQ(accepted.events.size(), 4u);
  EXPECT_EQ(registry.treasury().balance(), 60);

  batch.entries.clear();
  EXPECT_EQ(registry.submit_intent_batch(kController, batch).code,
            code_of(registry_error_code::bounds_invalid));
}

TEST(registry_integration, terminal_states_are_exclusive) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_terminal"};
  auto& registry = fixture.registry();
  ASSERT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);
  ASSERT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);

  EXPECT_EQ(registry.execute_intent(kKeeper, make_execute(1, 101)).code,
            code_of(registry_error_code::amount_out_of_bounds));
  EXPECT_EQ(registry.execute_intent(kKeeper, make_execute(1, 100)).code, 0u);
  EXPECT_EQ(registry.execute_intent(kKeeper, make_execute(1, 100)).code,
            code_of(registry_error_code::already_executed));
  EXPECT_EQ(registry.cancel_intent(kOwner, make_cancel(1)).code,
            code_of(registry_error_code::already_executed));

  EXPECT_EQ(registry.cancel_intent(kController, make_cancel(2)).code, 0u);
  EXPECT_EQ(registry.cancel_intent(kController, make_cancel(2)).code,
            code_of(registry_error_code::already_cancelled));
  EXPECT_EQ(registry.execute_intent(kKeeper, make_execute(2, 100)).code,
            code_of(registry_error_code::already_cancelled));
  EXPECT_EQ(registry.execute_intent(kKeeper, make_execute(3, 100)).code,
            code_of(registry_error_code::not_found));
  EXPECT_EQ(registry.cancel_intent(kOwner, make_cancel(3)).code,
            code_of(registry_error_code::not_found));

  auto first = registry.intents().get(1);
  auto second = registry.intents().get(2);
  ASSERT_TRUE(first.has_value() && second.has_value());
  EXPECT_TRUE(first->executed && !first->cancelled);
  EXPECT_TRUE(second->cancelled && !second->executed);
}

TEST(registry_integration, withdraw_at_balance_succeeds_and_above_fails) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_withdraw"};
  auto& registry = fixture.registry();
  auto deposit = registry.deposit(
      kStranger, beacon::schema::deposit_treasury_t{.amount = 500});
  ASSERT_EQ(deposit.code, 0u);
  EXPECT_EQ(std::get<beacon::schema::treasury_topped_t>(deposit.events[0]).from,
            kStranger);

  auto transfers = std::vector<amount_t>{};
  fixture.on_transfer = [&](const beacon::schema::account_id_t&,
                            const amount_t& amount) {
    transfers.push_back(amount);
    return true;
  };

  auto to = beacon::testing::make_account(9);
  EXPECT_EQ(registry
                .withdraw(kOwner, beacon::schema::withdraw_treasury_t{
                                      .to = to, .amount = 501})
                .code,
            code_of(registry_error_code::transfer_failed));
  EXPECT_EQ(registry
                .withdraw(kOwner, beacon::schema::withdraw_treasury_t{
                                      .to = beacon::schema::make_zero_hash(),
                                      .amount = 1})
                .code,
            code_of(registry_error_code::zero_address));
  EXPECT_EQ(registry
                .withdraw(kOwner, beacon::schema::withdraw_treasury_t{
                                      .to = to, .amount = 0})
                .code,
            code_of(registry_error_code::zero_amount));
  EXPECT_TRUE(transfers.empty());

  auto withdrawn = registry.withdraw(
      kOwner, beacon::schema::withdraw_treasury_t{.to = to, .amount = 500});
  ASSERT_EQ(withdrawn.code, 0u) << withdrawn.log;
  EXPECT_EQ(registry.treasury().balance(), 0);
  ASSERT_EQ(transfers.size(), 1u);
  EXPECT_EQ(transfers[0], 500);
  const auto& event =
      std::get<beacon::schema::treasury_withdrawn_t>(withdrawn.events[0]);
  EXPECT_EQ(event.to, to);
  EXPECT_EQ(event.amount, 500);
}

TEST(registry_integration, failed_transfer_restores_balance) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_refund"};
  auto& registry = fixture.registry();
  ASSERT_EQ(registry
                .deposit(kOwner, beacon::schema::deposit_treasury_t{.amount = 300})
                .code,
            0u);

  auto balance_during_transfer = std::optional<amount_t>{};
  fixture.on_transfer = [&](const beacon::schema::account_id_t&,
                            const amount_t&) {
    balance_during_transfer = registry.treasury().balance();
    return false;
  };
  auto published_before = fixture.published.size();

  auto result = registry.withdraw(
      kOwner, beacon::schema::withdraw_treasury_t{
                  .to = beacon::testing::make_account(9), .amount = 200});
  EXPECT_EQ(result.code, code_of(registry_error_code::transfer_failed));
  EXPECT_TRUE(result.events.empty());
  ASSERT_TRUE(balance_during_transfer.has_value());
  EXPECT_EQ(*balance_during_transfer, 100);
  EXPECT_EQ(registry.treasury().balance(), 300);
  EXPECT_EQ(fixture.published.size(), published_before);
}

TEST(registry_integration, treasury_overflow_rejects_the_whole_operation) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_overflow"};
  auto& registry = fixture.registry();
  auto max = std::numeric_limits<amount_t>::max();
  ASSERT_EQ(registry
                .deposit(kOwner, beacon::schema::deposit_treasury_t{.amount = max})
                .code,
            0u);

  auto deposit = registry.deposit(
      kOwner, beacon::schema::deposit_treasury_t{.amount = 1});
  EXPECT_EQ(deposit.code, code_of(registry_error_code::balance_overflow));
  EXPECT_TRUE(deposit.events.empty());

  auto submit = registry.submit_intent(
      kController, make_submit(500, intent_side_t::buy, "ETH", 1));
  EXPECT_EQ(submit.code, code_of(registry_error_code::balance_overflow));
  EXPECT_TRUE(submit.events.empty());
  EXPECT_EQ(registry.intents().count(), 0u);
  EXPECT_EQ(registry.treasury().balance(), max);
}

TEST(registry_integration, nested_withdraw_from_transfer_is_rejected) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_reentry"};
  auto& registry = fixture.registry();
  ASSERT_EQ(registry
                .deposit(kOwner, beacon::schema::deposit_treasury_t{.amount = 300})
                .code,
            0u);

  auto nested_code = std::optional<uint32_t>{};
  fixture.on_transfer = [&](const beacon::schema::account_id_t& to,
                            const amount_t& amount) {
    nested_code =
        registry
            .withdraw(kOwner,
                      beacon::schema::withdraw_treasury_t{.to = to,
                                                          .amount = amount})
            .code;
    return true;
  };

  auto result = registry.withdraw(
      kOwner, beacon::schema::withdraw_treasury_t{
                  .to = beacon::testing::make_account(9), .amount = 100});
  EXPECT_EQ(result.code, 0u) << result.log;
  ASSERT_TRUE(nested_code.has_value());
  EXPECT_EQ(*nested_code, code_of(registry_error_code::reentrancy));
  EXPECT_EQ(registry.treasury().balance(), 200);

  fixture.on_transfer = {};
  EXPECT_EQ(registry
                .withdraw(kOwner, beacon::schema::withdraw_treasury_t{
                                      .to = beacon::testing::make_account(9),
                                      .amount = 200})
                .code,
            0u);
}

TEST(registry_integration, nested_execute_from_event_sink_is_rejected) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_sink"};
  auto& registry = fixture.registry();
  ASSERT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);
  ASSERT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);

  auto nested_code = std::optional<uint32_t>{};
  fixture.on_event = [&](const beacon::schema::registry_event_t& event) {
    if (std::holds_alternative<beacon::schema::intent_executed_t>(event) &&
        !nested_code) {
      nested_code =
          registry.execute_intent(kKeeper, make_execute(2, 100)).code;
    }
  };

  EXPECT_EQ(registry.execute_intent(kKeeper, make_execute(1, 100)).code, 0u);
  ASSERT_TRUE(nested_code.has_value());
  EXPECT_EQ(*nested_code, code_of(registry_error_code::reentrancy));
  EXPECT_EQ(beacon::schema::status_of(*registry.intents().get(2)),
            beacon::schema::intent_status_t::pending);

  fixture.on_event = {};
  EXPECT_EQ(registry.execute_intent(kKeeper, make_execute(2, 100)).code, 0u);
}

TEST(registry_integration, bulk_fetches_keep_their_distinct_failure_modes) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_bulk"};
  auto& registry = fixture.registry();
  ASSERT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);
  ASSERT_EQ(registry.execute_intent(kKeeper, make_execute(1, 80)).code, 0u);

  auto ids = std::vector<beacon::schema::intent_id_t>{1, 5};
  auto intents = std::vector<beacon::schema::intent_state_t>{};
  EXPECT_EQ(registry.intents().get_many(ids, intents),
            registry_error_code::not_found);
  auto records = std::vector<beacon::schema::execution_record_t>{};
  EXPECT_EQ(registry.executions().get_many(ids, records),
            registry_error_code::ok);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].executed_amount, 80);
  EXPECT_EQ(records[1].intent_id, 0u);
}

TEST(registry_integration, event_log_matches_results) {
  auto fixture = beacon::testing::registry_fixture{
      "beacon_registry_events", beacon::testing::make_options(100)};
  auto& registry = fixture.registry();
  ASSERT_EQ(registry
                .submit_intent(kController,
                               make_submit(1000, intent_side_t::sell, "ETH", 10))
                .code,
            0u);
  ASSERT_EQ(registry.cancel_intent(kController, make_cancel(1)).code, 0u);

  auto records = registry.events(1, 10);
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].event_id, 1u);
  EXPECT_EQ(records[2].event_id, 3u);
  EXPECT_EQ(beacon::schema::event_name(records[0].event), "IntentSubmitted");
  EXPECT_EQ(beacon::schema::event_name(records[1].event), "TreasuryTopped");
  EXPECT_EQ(beacon::schema::event_name(records[2].event), "IntentCancelled");
  EXPECT_EQ(std::get<beacon::schema::intent_cancelled_t>(records[2].event)
                .cancelled_by,
            kController);

  ASSERT_EQ(fixture.published.size(), 3u);
  EXPECT_EQ(beacon::schema::event_name(fixture.published[1]), "TreasuryTopped");
  EXPECT_EQ(registry.events(2, 2).size(), 1u);
  EXPECT_TRUE(registry.events(4, 10).empty());
}

TEST(registry_integration, encoded_operations_match_typed_calls) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_encoded"};
  auto& registry = fixture.registry();

  auto operation = beacon::schema::operation_t{.caller = kController,
                                               .payload = make_submit(100)};
  auto encoded = fixture.encoder().encode(operation);
  auto result = registry.apply_encoded(
      beacon::schema::bytes_view_t{encoded.data(), encoded.size()});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(result.codespace, "beacon.submit_intent");
  EXPECT_EQ(registry.intents().count(), 1u);

  operation.caller = kStranger;
  encoded = fixture.encoder().encode(operation);
  EXPECT_EQ(registry
                .apply_encoded(
                    beacon::schema::bytes_view_t{encoded.data(), encoded.size()})
                .code,
            code_of(registry_error_code::not_controller));

  auto garbage = beacon::schema::bytes_t{0x01, 0x00, 0xFF};
  auto invalid = registry.apply_encoded(
      beacon::schema::bytes_view_t{garbage.data(), garbage.size()});
  EXPECT_EQ(invalid.code, code_of(registry_error_code::invalid_operation));
  EXPECT_EQ(invalid.codespace, "beacon.apply");
  EXPECT_EQ(registry.apply_encoded({}).code,
            code_of(registry_error_code::invalid_operation));

  auto cancel = registry.apply(beacon::schema::operation_t{
      .caller = kOwner, .payload = make_cancel(1)});
  EXPECT_EQ(cancel.code, 0u);
  EXPECT_EQ(cancel.codespace, "beacon.cancel_intent");
}

TEST(registry_integration, persisted_state_survives_reopen) {
  auto fixture = beacon::testing::registry_fixture{"beacon_registry_reopen"};
  ASSERT_EQ(fixture.registry().submit_intent(kController, make_submit(100)).code,
            0u);
  ASSERT_EQ(fixture.registry()
                .set_fee_rate(kOwner, beacon::schema::set_fee_rate_t{.fee_bps = 30})
                .code,
            0u);

  auto other = beacon::testing::make_options(77);
  other.owner = kStranger;
  fixture.reopen(other);

  auto& registry = fixture.registry();
  EXPECT_EQ(registry.config().owner, kOwner);
  EXPECT_EQ(registry.config().fee_bps, 30u);
  EXPECT_EQ(registry.intents().count(), 1u);
  EXPECT_EQ(registry.events(1, 10).size(), 2u);
  ASSERT_EQ(registry.submit_intent(kController, make_submit(100)).code, 0u);
  EXPECT_EQ(registry.intents().last(1),
            (std::vector<beacon::schema::intent_id_t>{2}));
}
