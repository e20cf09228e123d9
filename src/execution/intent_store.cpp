#include <spdlog/spdlog.h>
#include <beacon/execution/intent_store.hpp>
#include <beacon/schema/constants.hpp>
#include <beacon/schema/key/registry_keys.hpp>
#include <algorithm>
#include <iterator>

using namespace beacon::schema;

namespace beacon::execution {

intent_store::intent_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

amount_t intent_store::required_fee(const amount_t& amount,
                                    const registry_config_t& config) {
  auto fee = wide_amount_t{amount} * config.fee_bps / kFeeDenominator;
  return fee.convert_to<amount_t>();
}

registry_error_code intent_store::validate(const intent_entry_t& entry,
                                           const registry_config_t& config) {
  if (!is_valid(entry.side)) {
    return registry_error_code::invalid_side;
  }
  if (entry.amount == 0) {
    return registry_error_code::zero_amount;
  }
  if (entry.amount < config.min_amount || entry.amount > config.max_amount) {
    return registry_error_code::amount_out_of_bounds;
  }
  return registry_error_code::ok;
}

registry_error_code intent_store::submit(const intent_entry_t& entry,
                                         const account_id_t& submitter,
                                         const amount_t& fee_paid,
                                         const registry_config_t& config,
                                         sequence_t sequence,
                                         write_batch_t& batch,
                                         intent_state_t& created) {
  if (auto code = validate(entry, config); code != registry_error_code::ok) {
    return code;
  }
  if (read_counter(key::make_intent_count_key(), batch) >= kMaxIntents) {
    return registry_error_code::capacity_exceeded;
  }
  if (fee_paid < required_fee(entry.amount, config)) {
    return registry_error_code::insufficient_fee;
  }
  created = stage_new(entry, submitter, sequence, batch);
  return registry_error_code::ok;
}

registry_error_code intent_store::submit_batch(
    const std::vector<intent_entry_t>& entries,
    const account_id_t& submitter,
    const amount_t& total_fee_paid,
    const registry_config_t& config,
    sequence_t sequence,
    write_batch_t& batch,
    std::vector<intent_state_t>& created) {
  if (entries.empty()) {
    return registry_error_code::bounds_invalid;
  }

  auto fee_due = wide_amount_t{};
  for (const auto& entry : entries) {
    if (auto code = validate(entry, config); code != registry_error_code::ok) {
      return code;
    }
    fee_due += wide_amount_t{required_fee(entry.amount, config)};
  }

  auto existing = read_counter(key::make_intent_count_key(), batch);
  if (existing + entries.size() > kMaxIntents) {
    return registry_error_code::capacity_exceeded;
  }
  if (wide_amount_t{total_fee_paid} < fee_due) {
    return registry_error_code::insufficient_fee;
  }

  created.clear();
  created.reserve(entries.size());
  for (const auto& entry : entries) {
    created.push_back(stage_new(entry, submitter, sequence, batch));
  }
  return registry_error_code::ok;
}

registry_error_code intent_store::cancel(intent_id_t intent_id,
                                         const account_id_t& caller,
                                         const registry_config_t& config,
                                         write_batch_t& batch,
                                         intent_state_t& cancelled) {
  auto intent = get(intent_id, batch);
  if (!intent) {
    return registry_error_code::not_found;
  }
  if (intent->executed) {
    return registry_error_code::already_executed;
  }
  if (intent->cancelled) {
    return registry_error_code::already_cancelled;
  }
  if (caller != intent->submitter && caller != config.owner) {
    return registry_error_code::unauthorized;
  }
  intent->cancelled = true;
  stage(*intent, batch);
  cancelled = *intent;
  return registry_error_code::ok;
}

void intent_store::stage(const intent_state_t& intent, write_batch_t& batch) {
  batch.put(encoder_, key::make_intent_key(intent.intent_id), intent);
}

std::optional<intent_state_t> intent_store::get(intent_id_t intent_id) const {
  if (intent_id == 0) {
    return std::nullopt;
  }
  return storage_.get<intent_state_t>(encoder_,
                                      key::make_intent_key(intent_id));
}

std::optional<intent_state_t> intent_store::get(
    intent_id_t intent_id,
    const write_batch_t& batch) const {
  if (intent_id == 0) {
    return std::nullopt;
  }
  return storage_.get<intent_state_t>(encoder_, batch,
                                      key::make_intent_key(intent_id));
}

uint64_t intent_store::count() const {
  return storage_.get<uint64_t>(encoder_, key::make_intent_count_key())
      .value_or(0);
}

std::vector<intent_id_t> intent_store::by_submitter(
    const account_id_t& submitter) const {
  return read_index(key::make_submitter_index_prefix(submitter));
}

std::vector<intent_id_t> intent_store::by_symbol(
    const symbol_id_t& symbol) const {
  return read_index(key::make_symbol_index_prefix(symbol));
}

std::optional<intent_id_t> intent_store::at(uint64_t index) const {
  if (index >= count()) {
    return std::nullopt;
  }
  return storage_.get<intent_id_t>(encoder_,
                                   key::make_intent_order_key(index));
}

std::vector<intent_id_t> intent_store::range(uint64_t from, uint64_t to) const {
  auto ids = std::vector<intent_id_t>{};
  auto total = count();
  if (total == 0 || from >= total || from > to) {
    return ids;
  }
  to = std::min(to, total - 1);
  ids.reserve(to - from + 1);
  for (auto position = from; position <= to; ++position) {
    if (auto id = storage_.get<intent_id_t>(
            encoder_, key::make_intent_order_key(position))) {
      ids.push_back(*id);
    }
  }
  return ids;
}

std::vector<intent_id_t> intent_store::last(uint64_t n) const {
  auto ids = std::vector<intent_id_t>{};
  auto total = count();
  n = std::min(n, total);
  ids.reserve(n);
  for (auto position = total; position > total - n; --position) {
    if (auto id = storage_.get<intent_id_t>(
            encoder_, key::make_intent_order_key(position - 1))) {
      ids.push_back(*id);
    }
  }
  return ids;
}

std::vector<intent_id_t> intent_store::in_sequence_range(sequence_t from,
                                                         sequence_t to) const {
  auto ids = std::vector<intent_id_t>{};
  for_each([&](const intent_state_t& intent) {
    if (intent.created_at >= from && intent.created_at <= to) {
      ids.push_back(intent.intent_id);
    }
  });
  return ids;
}

registry_error_code intent_store::get_many(
    std::span<const intent_id_t> ids,
    std::vector<intent_state_t>& out) const {
  out.clear();
  if (ids.size() > kMaxBulkQuery) {
    return registry_error_code::bounds_invalid;
  }
  auto found = std::vector<intent_state_t>{};
  found.reserve(ids.size());
  for (const auto id : ids) {
    auto intent = get(id);
    if (!intent) {
      return registry_error_code::not_found;
    }
    found.push_back(std::move(*intent));
  }
  out = std::move(found);
  return registry_error_code::ok;
}

void intent_store::for_each(
    const std::function<void(const intent_state_t&)>& visit) const {
  auto prefix = key::make_prefix_key(key::kIntentKeyPrefix);
  for (const auto& [stored_key, value] : storage_.list_by_prefix(prefix)) {
    visit(encoder_.decode<intent_state_t>(
        bytes_view_t{value.data(), value.size()}));
  }
}

intent_state_t intent_store::stage_new(const intent_entry_t& entry,
                                       const account_id_t& submitter,
                                       sequence_t sequence,
                                       write_batch_t& batch) {
  auto position = read_counter(key::make_intent_count_key(), batch);
  auto intent = intent_state_t{};
  intent.intent_id = position + 1;
  intent.submitter = submitter;
  intent.side = entry.side;
  intent.amount = entry.amount;
  intent.limit_price = entry.limit_price;
  intent.symbol = entry.symbol;
  intent.created_at = sequence;

  stage(intent, batch);
  batch.put(encoder_, key::make_intent_order_key(position), intent.intent_id);

  auto submitter_count_key = key::make_submitter_count_key(submitter);
  auto submitter_position = read_counter(submitter_count_key, batch);
  batch.put(encoder_,
            key::make_submitter_index_key(submitter, submitter_position),
            intent.intent_id);
  batch.put(encoder_, submitter_count_key, uint64_t{submitter_position + 1});

  auto symbol_count_key = key::make_symbol_count_key(entry.symbol);
  auto symbol_position = read_counter(symbol_count_key, batch);
  batch.put(encoder_, key::make_symbol_index_key(entry.symbol, symbol_position),
            intent.intent_id);
  batch.put(encoder_, symbol_count_key, uint64_t{symbol_position + 1});

  batch.put(encoder_, key::make_intent_count_key(), intent.intent_id);

  spdlog::debug("Staged intent {} at position {}", intent.intent_id, position);
  return intent;
}

uint64_t intent_store::read_counter(const bytes_t& key,
                                    const write_batch_t& batch) const {
  return storage_.get<uint64_t>(encoder_, batch, key).value_or(0);
}

std::vector<intent_id_t> intent_store::read_index(const bytes_t& prefix) const {
  auto ids = std::vector<intent_id_t>{};
  auto entries = storage_.list_by_prefix(prefix);
  ids.reserve(entries.size());
  for (const auto& [stored_key, value] : entries) {
    ids.push_back(
        encoder_.decode<intent_id_t>(bytes_view_t{value.data(), value.size()}));
  }
  return ids;
}

}  // namespace beacon::execution
