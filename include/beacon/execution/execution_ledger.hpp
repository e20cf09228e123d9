#pragma once

#include <beacon/execution/backend.hpp>
#include <beacon/execution/intent_store.hpp>
#include <beacon/schema/execution_record.hpp>
#include <beacon/schema/intent_side.hpp>
#include <beacon/schema/primitives.hpp>
#include <beacon/schema/registry_error_code.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace beacon::execution {

/// At most one execution per intent, plus the execution-order history and
/// the aggregate scans. Aggregates walk every intent on each call.
class execution_ledger final {
 public:
  execution_ledger(encoder_t& encoder,
                   storage_t& storage,
                   intent_store& intents);

  /// Stage an execution of a pending intent. The intent is marked executed
  /// with `executed_amount`, and a record is appended to the history.
  beacon::schema::registry_error_code execute(
      beacon::schema::intent_id_t intent_id,
      const beacon::schema::amount_t& executed_amount,
      const beacon::schema::price_t& average_price,
      const beacon::schema::account_id_t& executor,
      beacon::schema::sequence_t sequence,
      write_batch_t& batch,
      beacon::schema::execution_record_t& record);

  std::optional<beacon::schema::execution_record_t> get(
      beacon::schema::intent_id_t intent_id) const;

  /// Number of executions ever recorded.
  uint64_t count() const;

  /// The `n` most recent records, newest first.
  std::vector<beacon::schema::execution_record_t> last(uint64_t n) const;

  /// Records at history positions [from, to], same clamping as
  /// `intent_store::range`.
  std::vector<beacon::schema::execution_record_t> range(uint64_t from,
                                                        uint64_t to) const;

  /// Records for every id, in request order. Unknown ids yield a
  /// zero-valued record rather than an error.
  beacon::schema::registry_error_code get_many(
      std::span<const beacon::schema::intent_id_t> ids,
      std::vector<beacon::schema::execution_record_t>& out) const;

  uint64_t count_pending() const;
  uint64_t count_executed() const;
  uint64_t count_cancelled() const;

  beacon::schema::amount_t requested_volume(
      beacon::schema::intent_side_t side) const;
  beacon::schema::amount_t executed_volume(
      beacon::schema::intent_side_t side) const;
  beacon::schema::amount_t executed_volume_by_symbol(
      const beacon::schema::symbol_id_t& symbol) const;
  beacon::schema::amount_t executed_volume_by_submitter(
      const beacon::schema::account_id_t& submitter) const;

  /// Executed over requested amount across executed intents, in bps.
  uint32_t fill_rate_bps() const;
  /// Cancelled intents over all intents, in bps.
  uint32_t cancellation_rate_bps() const;
  /// Executed intents over all intents, in bps.
  uint32_t execution_rate_bps() const;

 private:
  std::optional<beacon::schema::execution_record_t> at(
      uint64_t position) const;

  encoder_t& encoder_;
  storage_t& storage_;
  intent_store& intents_;
};

}  // namespace beacon::execution
