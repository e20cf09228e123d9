#pragma once

#include <beacon/execution/backend.hpp>
#include <beacon/schema/intent_entry.hpp>
#include <beacon/schema/intent_state.hpp>
#include <beacon/schema/primitives.hpp>
#include <beacon/schema/registry_config.hpp>
#include <beacon/schema/registry_error_code.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace beacon::execution {

/// Owner of intent records and their append-only indexes.
///
/// Ids are 1-based and dense: the n-th submitted intent gets id n. Mutations
/// never touch storage directly; they stage puts into the caller's write
/// batch and the registry commits the batch once the whole operation has
/// succeeded.
class intent_store final {
 public:
  intent_store(encoder_t& encoder, storage_t& storage);

  /// Fee owed for `amount` at the configured rate, rounded down.
  static beacon::schema::amount_t required_fee(
      const beacon::schema::amount_t& amount,
      const beacon::schema::registry_config_t& config);

  /// Side, zero and bounds checks for a single entry.
  static beacon::schema::registry_error_code validate(
      const beacon::schema::intent_entry_t& entry,
      const beacon::schema::registry_config_t& config);

  /// Stage a new intent. On success `created` holds the stored record.
  beacon::schema::registry_error_code submit(
      const beacon::schema::intent_entry_t& entry,
      const beacon::schema::account_id_t& submitter,
      const beacon::schema::amount_t& fee_paid,
      const beacon::schema::registry_config_t& config,
      beacon::schema::sequence_t sequence,
      write_batch_t& batch,
      beacon::schema::intent_state_t& created);

  /// Stage every entry or none. Ids are assigned in array order.
  beacon::schema::registry_error_code submit_batch(
      const std::vector<beacon::schema::intent_entry_t>& entries,
      const beacon::schema::account_id_t& submitter,
      const beacon::schema::amount_t& total_fee_paid,
      const beacon::schema::registry_config_t& config,
      beacon::schema::sequence_t sequence,
      write_batch_t& batch,
      std::vector<beacon::schema::intent_state_t>& created);

  /// Stage cancellation of a pending intent by its submitter or the owner.
  beacon::schema::registry_error_code cancel(
      beacon::schema::intent_id_t intent_id,
      const beacon::schema::account_id_t& caller,
      const beacon::schema::registry_config_t& config,
      write_batch_t& batch,
      beacon::schema::intent_state_t& cancelled);

  /// Stage an updated record for an existing intent.
  void stage(const beacon::schema::intent_state_t& intent,
             write_batch_t& batch);

  std::optional<beacon::schema::intent_state_t> get(
      beacon::schema::intent_id_t intent_id) const;
  std::optional<beacon::schema::intent_state_t> get(
      beacon::schema::intent_id_t intent_id,
      const write_batch_t& batch) const;

  /// Number of intents ever submitted.
  uint64_t count() const;

  std::vector<beacon::schema::intent_id_t> by_submitter(
      const beacon::schema::account_id_t& submitter) const;
  std::vector<beacon::schema::intent_id_t> by_symbol(
      const beacon::schema::symbol_id_t& symbol) const;

  /// Id at 0-based position `index` of the global submission order.
  std::optional<beacon::schema::intent_id_t> at(uint64_t index) const;

  /// Ids at positions [from, to]; `to` is clamped to the last position and
  /// the result is empty when `from` is out of range or past `to`.
  std::vector<beacon::schema::intent_id_t> range(uint64_t from,
                                                 uint64_t to) const;

  /// The `n` most recent ids, newest first.
  std::vector<beacon::schema::intent_id_t> last(uint64_t n) const;

  /// Ids whose creation sequence lies in [from, to]. Full scan.
  std::vector<beacon::schema::intent_id_t> in_sequence_range(
      beacon::schema::sequence_t from,
      beacon::schema::sequence_t to) const;

  /// Records for every id, in request order. Fails with `bounds_invalid`
  /// above the bulk limit and with `not_found` on the first unknown id;
  /// `out` is left empty on failure.
  beacon::schema::registry_error_code get_many(
      std::span<const beacon::schema::intent_id_t> ids,
      std::vector<beacon::schema::intent_state_t>& out) const;

  /// Visit every intent in id order. O(n) over the store.
  void for_each(
      const std::function<void(const beacon::schema::intent_state_t&)>& visit)
      const;

 private:
  beacon::schema::intent_state_t stage_new(
      const beacon::schema::intent_entry_t& entry,
      const beacon::schema::account_id_t& submitter,
      beacon::schema::sequence_t sequence,
      write_batch_t& batch);

  uint64_t read_counter(const beacon::schema::bytes_t& key,
                        const write_batch_t& batch) const;

  std::vector<beacon::schema::intent_id_t> read_index(
      const beacon::schema::bytes_t& prefix) const;

  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace beacon::execution
