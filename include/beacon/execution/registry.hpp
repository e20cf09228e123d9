#pragma once

#include <beacon/execution/access_policy.hpp>
#include <beacon/execution/backend.hpp>
#include <beacon/execution/collaborators.hpp>
#include <beacon/execution/execution_ledger.hpp>
#include <beacon/execution/intent_store.hpp>
#include <beacon/execution/logical_clock.hpp>
#include <beacon/execution/treasury_account.hpp>
#include <beacon/schema/operation.hpp>
#include <beacon/schema/operation_result.hpp>
#include <beacon/schema/primitives.hpp>
#include <beacon/schema/query_result.hpp>
#include <beacon/schema/registry_config.hpp>
#include <beacon/schema/registry_error_code.hpp>
#include <beacon/schema/registry_event.hpp>
#include <beacon/schema/registry_stats.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <string_view>
#include <vector>

namespace beacon::execution {

/// Initial settings for a registry that has no persisted config yet.
struct registry_options final {
  beacon::schema::account_id_t owner{};
  beacon::schema::account_id_t controller{};
  beacon::schema::account_id_t keeper{};
  uint32_t fee_bps{};
  beacon::schema::amount_t min_amount{1};
  beacon::schema::amount_t max_amount{
      std::numeric_limits<beacon::schema::amount_t>::max()};
};

/// Public operation surface of the intent registry.
///
/// Every mutation runs under the registry lock, stages its writes into one
/// batch and commits it only on success, so a failed call leaves no trace.
/// Committed state transitions are appended to the event log, returned in
/// the result and then handed to the event sink.
class registry final {
 public:
  /// Open the registry over `storage`. A persisted config takes precedence
  /// over `options`; invalid options on first start are fatal.
  registry(encoder_t& encoder,
           storage_t& storage,
           logical_clock& clock,
           const registry_options& options,
           transfer_function_t transfer = {},
           event_sink_t sink = {});

  /// Controller operation: create one pending intent.
  beacon::schema::operation_result_t submit_intent(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::submit_intent_t& payload);

  /// Controller operation: create every entry or none.
  beacon::schema::operation_result_t submit_intent_batch(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::submit_intent_batch_t& payload);

  /// Keeper operation: record the single execution of a pending intent.
  beacon::schema::operation_result_t execute_intent(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::execute_intent_t& payload);

  /// Cancel a pending intent. Allowed while paused.
  beacon::schema::operation_result_t cancel_intent(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::cancel_intent_t& payload);

  beacon::schema::operation_result_t set_controller(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::set_controller_t& payload);
  beacon::schema::operation_result_t set_keeper(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::set_keeper_t& payload);
  beacon::schema::operation_result_t set_execution_bounds(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::set_execution_bounds_t& payload);
  beacon::schema::operation_result_t set_fee_rate(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::set_fee_rate_t& payload);
  beacon::schema::operation_result_t set_paused(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::set_paused_t& payload);

  /// Credit the treasury. Open to any caller.
  beacon::schema::operation_result_t deposit(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::deposit_treasury_t& payload);

  /// Owner operation: debit the treasury and transfer the amount out.
  ///
  /// The debit is committed before the transfer primitive runs. When the
  /// transfer reports failure the amount is credited back and the call fails
  /// with `transfer_failed`.
  beacon::schema::operation_result_t withdraw(
      const beacon::schema::account_id_t& caller,
      const beacon::schema::withdraw_treasury_t& payload);

  /// Dispatch an operation envelope to the matching typed call.
  beacon::schema::operation_result_t apply(
      const beacon::schema::operation_t& operation);

  /// Decode and apply a SCALE-encoded operation envelope.
  beacon::schema::operation_result_t apply_encoded(
      const beacon::schema::bytes_view_t& raw_operation);

  /// Execute a read-only query by route. `data` holds the SCALE-encoded
  /// request arguments; the answer is SCALE-encoded in `value`.
  beacon::schema::query_result_t query(std::string_view path,
                                       const beacon::schema::bytes_view_t& data);

  const intent_store& intents() const;
  const execution_ledger& executions() const;
  const treasury_account& treasury() const;
  const access_policy& policy() const;

  beacon::schema::registry_config_t config() const;
  beacon::schema::registry_stats_t stats() const;

  /// Event log records with ids in [from, to].
  std::vector<beacon::schema::event_record_t> events(uint64_t from,
                                                     uint64_t to) const;

 private:
  /// Commit `batch` plus the event log rows for `events`, then publish.
  void commit(write_batch_t& batch,
              beacon::schema::operation_result_t& result);

  void append_event(beacon::schema::registry_event_t event,
                    write_batch_t& batch,
                    beacon::schema::operation_result_t& result);

  beacon::schema::operation_result_t update_config(
      const beacon::schema::account_id_t& caller,
      std::string_view codespace,
      const std::function<beacon::schema::registry_error_code(
          beacon::schema::registry_config_t&,
          beacon::schema::registry_event_t&)>& mutate);

  void load_config(const registry_options& options);

  beacon::schema::query_result_t route_query(
      std::string_view path,
      const beacon::schema::bytes_view_t& data);

  mutable std::recursive_mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  logical_clock& clock_;
  transfer_function_t transfer_;
  event_sink_t sink_;
  beacon::schema::registry_config_t config_;
  intent_store intents_;
  execution_ledger executions_;
  treasury_account treasury_;
  access_policy policy_;
  bool execute_in_progress_{false};
  bool withdraw_in_progress_{false};
};

}  // namespace beacon::execution
