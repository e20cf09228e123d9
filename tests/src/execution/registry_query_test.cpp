#include <beacon/execution/registry.hpp>
#include <beacon/schema/constants.hpp>
#include <beacon/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <string_view>
#include <tuple>
#include <vector>

namespace {

using beacon::schema::amount_t;
using beacon::schema::intent_id_t;
using beacon::schema::intent_side_t;
using beacon::schema::registry_error_code;
using beacon::testing::kController;
using beacon::testing::kKeeper;
using beacon::testing::kOwner;
using beacon::testing::kStranger;
using beacon::testing::make_submit;

template <typename Request>
beacon::schema::query_result_t query(beacon::testing::registry_fixture& fixture,
                                     const std::string_view path,
                                     const Request& request) {
  auto data = fixture.encoder().encode(request);
  return fixture.registry().query(
      path, beacon::schema::bytes_view_t{data.data(), data.size()});
}

beacon::schema::query_result_t query(beacon::testing::registry_fixture& fixture,
                                     const std::string_view path) {
  return fixture.registry().query(path, {});
}

template <typename T>
T decode_value(beacon::testing::registry_fixture& fixture,
               const beacon::schema::query_result_t& result) {
  EXPECT_EQ(result.code, 0u) << result.log;
  return fixture.encoder().decode<T>(
      beacon::schema::bytes_view_t{result.value.data(), result.value.size()});
}

// Three ETH/BTC intents from the controller: #1 executed, #2 cancelled,
// #3 pending.
void seed(beacon::testing::registry_fixture& fixture) {
  auto& registry = fixture.registry();
  ASSERT_EQ(registry.submit_intent(kController, make_submit(1000)).code, 0u);
  fixture.clock().advance();
  ASSERT_EQ(registry
                .submit_intent(kController,
                               make_submit(400, intent_side_t::sell, "BTC"))
                .code,
            0u);
  fixture.clock().advance();
  ASSERT_EQ(registry.submit_intent(kController, make_submit(600)).code, 0u);
  ASSERT_EQ(registry
                .execute_intent(kKeeper, beacon::schema::execute_intent_t{
                                             .intent_id = 1,
                                             .executed_amount = 750,
                                             .average_price = 2999})
                .code,
            0u);
  ASSERT_EQ(registry
                .cancel_intent(kController,
                               beacon::schema::cancel_intent_t{.intent_id = 2})
                .code,
            0u);
}

}  // namespace

TEST(registry_query, registry_views_answer_without_arguments) {
  auto fixture = beacon::testing::registry_fixture{"beacon_query_registry"};
  seed(fixture);
  ASSERT_EQ(fixture.registry()
                .set_fee_rate(kOwner, beacon::schema::set_fee_rate_t{.fee_bps = 50})
                .code,
            0u);
  fixture.clock().advance(10);

  auto config_result = query(fixture, "/registry/config");
  EXPECT_EQ(config_result.codespace, "beacon.query");
  EXPECT_EQ(config_result.sequence, 13u);
  auto config =
      decode_value<beacon::schema::registry_config_t>(fixture, config_result);
  EXPECT_EQ(config.owner, kOwner);
  EXPECT_EQ(config.fee_bps, 50u);

  EXPECT_EQ(
      decode_value<amount_t>(fixture, query(fixture, "/registry/treasury")), 0);
  EXPECT_EQ(decode_value<uint64_t>(fixture, query(fixture, "/intents/count")),
            3u);
  EXPECT_EQ(decode_value<uint64_t>(fixture, query(fixture, "/executions/count")),
            1u);

  auto stats = decode_value<beacon::schema::registry_stats_t>(
      fixture, query(fixture, "/registry/stats"));
  EXPECT_EQ(stats.pending, 1u);
  EXPECT_EQ(stats.executed, 1u);
  EXPECT_EQ(stats.cancelled, 1u);
  EXPECT_EQ(stats.fill_rate_bps, 7500u);
  EXPECT_EQ(stats.cancellation_rate_bps, 3333u);
}

TEST(registry_query, intent_lookups_and_indexes) {
  auto fixture = beacon::testing::registry_fixture{"beacon_query_intents"};
  seed(fixture);

  auto intent = decode_value<beacon::schema::intent_state_t>(
      fixture, query(fixture, "/intent/get", intent_id_t{2}));
  EXPECT_EQ(intent.intent_id, 2u);
  EXPECT_EQ(intent.side, intent_side_t::sell);
  EXPECT_TRUE(intent.cancelled);
  EXPECT_EQ(intent.created_at, 2u);

  auto missing = query(fixture, "/intent/get", intent_id_t{9});
  EXPECT_EQ(missing.code, static_cast<uint32_t>(registry_error_code::not_found));
  EXPECT_EQ(missing.log, "not found");
  EXPECT_TRUE(missing.value.empty());

  EXPECT_EQ(decode_value<std::vector<intent_id_t>>(
                fixture, query(fixture, "/intents/by_submitter", kController)),
            (std::vector<intent_id_t>{1, 2, 3}));
  EXPECT_TRUE(decode_value<std::vector<intent_id_t>>(
                  fixture, query(fixture, "/intents/by_submitter", kStranger))
                  .empty());
  EXPECT_EQ(decode_value<std::vector<intent_id_t>>(
                fixture, query(fixture, "/intents/by_symbol",
                               beacon::schema::make_symbol_id("ETH"))),
            (std::vector<intent_id_t>{1, 3}));

  EXPECT_EQ(decode_value<intent_id_t>(
                fixture, query(fixture, "/intents/at", uint64_t{1})),
            2u);
  EXPECT_EQ(query(fixture, "/intents/at", uint64_t{3}).code,
            static_cast<uint32_t>(registry_error_code::bounds_invalid));
  EXPECT_EQ(decode_value<std::vector<intent_id_t>>(
                fixture, query(fixture, "/intents/range",
                               std::tuple{uint64_t{1}, uint64_t{10}})),
            (std::vector<intent_id_t>{2, 3}));
  EXPECT_EQ(decode_value<std::vector<intent_id_t>>(
                fixture, query(fixture, "/intents/last", uint64_t{2})),
            (std::vector<intent_id_t>{3, 2}));
  EXPECT_EQ(decode_value<std::vector<intent_id_t>>(
                fixture,
                query(fixture, "/intents/sequence_range",
                      std::tuple{beacon::schema::sequence_t{2},
                                 beacon::schema::sequence_t{3}})),
            (std::vector<intent_id_t>{2, 3}));
}

TEST(registry_query, bulk_routes_keep_their_failure_modes) {
  auto fixture = beacon::testing::registry_fixture{"beacon_query_bulk"};
  seed(fixture);

  auto intents = decode_value<std::vector<beacon::schema::intent_state_t>>(
      fixture,
      query(fixture, "/intents/bulk", std::vector<intent_id_t>{3, 1}));
  ASSERT_EQ(intents.size(), 2u);
  EXPECT_EQ(intents[0].intent_id, 3u);
  EXPECT_EQ(intents[1].intent_id, 1u);
  EXPECT_EQ(
      query(fixture, "/intents/bulk", std::vector<intent_id_t>{1, 7}).code,
      static_cast<uint32_t>(registry_error_code::not_found));

  auto records = decode_value<std::vector<beacon::schema::execution_record_t>>(
      fixture,
      query(fixture, "/executions/bulk", std::vector<intent_id_t>{1, 7}));
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].executed_amount, 750);
  EXPECT_EQ(records[1].intent_id, 0u);

  auto oversized =
      std::vector<intent_id_t>(beacon::schema::kMaxBulkQuery + 1, 1);
  EXPECT_EQ(query(fixture, "/executions/bulk", oversized).code,
            static_cast<uint32_t>(registry_error_code::bounds_invalid));
  EXPECT_EQ(query(fixture, "/intents/bulk", oversized).code,
            static_cast<uint32_t>(registry_error_code::bounds_invalid));
}

TEST(registry_query, execution_history_and_volume) {
  auto fixture = beacon::testing::registry_fixture{"beacon_query_volume"};
  seed(fixture);

  auto record = decode_value<beacon::schema::execution_record_t>(
      fixture, query(fixture, "/executions/get", intent_id_t{1}));
  EXPECT_EQ(record.executor, kKeeper);
  EXPECT_EQ(record.average_price, 2999);
  EXPECT_EQ(query(fixture, "/executions/get", intent_id_t{3}).code,
            static_cast<uint32_t>(registry_error_code::not_found));
  EXPECT_EQ(decode_value<std::vector<beacon::schema::execution_record_t>>(
                fixture, query(fixture, "/executions/last", uint64_t{5}))
                .size(),
            1u);
  EXPECT_EQ(decode_value<std::vector<beacon::schema::execution_record_t>>(
                fixture, query(fixture, "/executions/range",
                               std::tuple{uint64_t{0}, uint64_t{0}}))
                .size(),
            1u);

  auto [requested, executed] = decode_value<std::tuple<amount_t, amount_t>>(
      fixture, query(fixture, "/volume/by_side", intent_side_t::buy));
  EXPECT_EQ(requested, 1600);
  EXPECT_EQ(executed, 750);
  EXPECT_EQ(decode_value<amount_t>(fixture,
                               query(fixture, "/volume/by_symbol",
                                     beacon::schema::make_symbol_id("BTC"))),
            0);
  EXPECT_EQ(decode_value<amount_t>(
                fixture, query(fixture, "/volume/by_submitter", kController)),
            750);
}

TEST(registry_query, policy_routes_reflect_roles_and_state) {
  auto fixture = beacon::testing::registry_fixture{"beacon_query_policy"};
  seed(fixture);

  auto [owner, controller, keeper] = decode_value<std::tuple<bool, bool, bool>>(
      fixture, query(fixture, "/policy/roles", kKeeper));
  EXPECT_FALSE(owner);
  EXPECT_FALSE(controller);
  EXPECT_TRUE(keeper);

  EXPECT_TRUE(decode_value<bool>(
      fixture, query(fixture, "/policy/can_cancel",
                     std::tuple{intent_id_t{3}, kOwner})));
  EXPECT_FALSE(decode_value<bool>(
      fixture, query(fixture, "/policy/can_cancel",
                     std::tuple{intent_id_t{3}, kStranger})));
  EXPECT_FALSE(decode_value<bool>(
      fixture, query(fixture, "/policy/can_cancel",
                     std::tuple{intent_id_t{1}, kOwner})));
  EXPECT_TRUE(decode_value<bool>(
      fixture, query(fixture, "/policy/can_execute", intent_id_t{3})));
  EXPECT_FALSE(decode_value<bool>(
      fixture, query(fixture, "/policy/can_execute", intent_id_t{2})));
}

TEST(registry_query, event_log_pages_by_id) {
  auto fixture = beacon::testing::registry_fixture{"beacon_query_events"};
  seed(fixture);

  auto records = decode_value<std::vector<beacon::schema::event_record_t>>(
      fixture, query(fixture, "/events/range",
                     std::tuple{uint64_t{0}, uint64_t{100}}));
  ASSERT_EQ(records.size(), 5u);
  EXPECT_EQ(records[0].event_id, 1u);
  EXPECT_EQ(beacon::schema::event_name(records[3].event), "IntentExecuted");
  EXPECT_EQ(beacon::schema::event_name(records[4].event), "IntentCancelled");

  auto tail = decode_value<std::vector<beacon::schema::event_record_t>>(
      fixture, query(fixture, "/events/range",
                     std::tuple{uint64_t{4}, uint64_t{5}}));
  ASSERT_EQ(tail.size(), 2u);
  EXPECT_EQ(tail[0].event_id, 4u);
}

TEST(registry_query, malformed_requests_and_unknown_paths) {
  auto fixture = beacon::testing::registry_fixture{"beacon_query_errors"};
  seed(fixture);

  auto unknown = query(fixture, "/intents/everything");
  EXPECT_EQ(unknown.code,
            static_cast<uint32_t>(registry_error_code::unsupported_path));
  EXPECT_EQ(unknown.codespace, "beacon.query");

  EXPECT_EQ(query(fixture, "/intent/get").code,
            static_cast<uint32_t>(registry_error_code::invalid_query));
  EXPECT_EQ(query(fixture, "/intents/range", uint8_t{1}).code,
            static_cast<uint32_t>(registry_error_code::invalid_query));
  EXPECT_EQ(query(fixture, "/policy/roles", uint64_t{7}).code,
            static_cast<uint32_t>(registry_error_code::invalid_query));

  auto request = fixture.encoder().encode(intent_id_t{1});
  auto echoed = fixture.registry().query(
      "/intent/get",
      beacon::schema::bytes_view_t{request.data(), request.size()});
  EXPECT_EQ(echoed.key, request);
}
