#include <spdlog/spdlog.h>
#include <beacon/execution/execution_ledger.hpp>
#include <beacon/schema/constants.hpp>
#include <beacon/schema/key/registry_keys.hpp>
#include <algorithm>

using namespace beacon::schema;

namespace {

uint32_t ratio_bps(const wide_amount_t& numerator,
                   const wide_amount_t& denominator) {
  if (denominator == 0) {
    return 0;
  }
  return (numerator * kFeeDenominator / denominator).convert_to<uint32_t>();
}

}  // namespace

namespace beacon::execution {

execution_ledger::execution_ledger(encoder_t& encoder,
                                   storage_t& storage,
                                   intent_store& intents)
    : encoder_{encoder}, storage_{storage}, intents_{intents} {}

registry_error_code execution_ledger::execute(intent_id_t intent_id,
                                              const amount_t& executed_amount,
                                              const price_t& average_price,
                                              const account_id_t& executor,
                                              sequence_t sequence,
                                              write_batch_t& batch,
                                              execution_record_t& record) {
  auto intent = intents_.get(intent_id, batch);
  if (!intent) {
    return registry_error_code::not_found;
  }
  if (intent->executed) {
    return registry_error_code::already_executed;
  }
  if (intent->cancelled) {
    return registry_error_code::already_cancelled;
  }
  if (executed_amount == 0 || executed_amount > intent->amount) {
    return registry_error_code::amount_out_of_bounds;
  }

  intent->executed = true;
  intent->executed_amount = executed_amount;
  intents_.stage(*intent, batch);

  record = execution_record_t{};
  record.intent_id = intent_id;
  record.executor = executor;
  record.executed_amount = executed_amount;
  record.average_price = average_price;
  record.created_at = sequence;

  auto position = storage_.get<uint64_t>(encoder_, batch,
                                         key::make_execution_count_key())
                      .value_or(0);
  batch.put(encoder_, key::make_execution_key(intent_id), record);
  batch.put(encoder_, key::make_execution_order_key(position), intent_id);
  batch.put(encoder_, key::make_execution_count_key(), uint64_t{position + 1});

  spdlog::debug("Staged execution of intent {} at position {}", intent_id,
                position);
  return registry_error_code::ok;
}

std::optional<execution_record_t> execution_ledger::get(
    intent_id_t intent_id) const {
  return storage_.get<execution_record_t>(encoder_,
                                          key::make_execution_key(intent_id));
}

uint64_t execution_ledger::count() const {
  return storage_.get<uint64_t>(encoder_, key::make_execution_count_key())
      .value_or(0);
}

std::vector<execution_record_t> execution_ledger::last(uint64_t n) const {
  auto records = std::vector<execution_record_t>{};
  auto total = count();
  n = std::min(n, total);
  records.reserve(n);
  for (auto position = total; position > total - n; --position) {
    if (auto record = at(position - 1)) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

std::vector<execution_record_t> execution_ledger::range(uint64_t from,
                                                        uint64_t to) const {
  auto records = std::vector<execution_record_t>{};
  auto total = count();
  if (total == 0 || from >= total || from > to) {
    return records;
  }
  to = std::min(to, total - 1);
  records.reserve(to - from + 1);
  for (auto position = from; position <= to; ++position) {
    if (auto record = at(position)) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

registry_error_code execution_ledger::get_many(
    std::span<const intent_id_t> ids,
    std::vector<execution_record_t>& out) const {
  out.clear();
  if (ids.size() > kMaxBulkQuery) {
    return registry_error_code::bounds_invalid;
  }
  out.reserve(ids.size());
  for (const auto id : ids) {
    out.push_back(get(id).value_or(execution_record_t{}));
  }
  return registry_error_code::ok;
}

uint64_t execution_ledger::count_pending() const {
  auto total = uint64_t{};
  intents_.for_each([&](const intent_state_t& intent) {
    if (status_of(intent) == intent_status_t::pending) {
      ++total;
    }
  });
  return total;
}

uint64_t execution_ledger::count_executed() const {
  auto total = uint64_t{};
  intents_.for_each([&](const intent_state_t& intent) {
    if (intent.executed) {
      ++total;
    }
  });
  return total;
}

uint64_t execution_ledger::count_cancelled() const {
  auto total = uint64_t{};
  intents_.for_each([&](const intent_state_t& intent) {
    if (intent.cancelled) {
      ++total;
    }
  });
  return total;
}

amount_t execution_ledger::requested_volume(intent_side_t side) const {
  auto volume = amount_t{};
  intents_.for_each([&](const intent_state_t& intent) {
    if (intent.side == side) {
      volume += intent.amount;
    }
  });
  return volume;
}

amount_t execution_ledger::executed_volume(intent_side_t side) const {
  auto volume = amount_t{};
  intents_.for_each([&](const intent_state_t& intent) {
    if (intent.executed && intent.side == side) {
      volume += intent.executed_amount;
    }
  });
  return volume;
}

amount_t execution_ledger::executed_volume_by_symbol(
    const symbol_id_t& symbol) const {
  auto volume = amount_t{};
  intents_.for_each([&](const intent_state_t& intent) {
    if (intent.executed && intent.symbol == symbol) {
      volume += intent.executed_amount;
    }
  });
  return volume;
}

amount_t execution_ledger::executed_volume_by_submitter(
    const account_id_t& submitter) const {
  auto volume = amount_t{};
  intents_.for_each([&](const intent_state_t& intent) {
    if (intent.executed && intent.submitter == submitter) {
      volume += intent.executed_amount;
    }
  });
  return volume;
}

uint32_t execution_ledger::fill_rate_bps() const {
  auto executed = wide_amount_t{};
  auto requested = wide_amount_t{};
  intents_.for_each([&](const intent_state_t& intent) {
    if (intent.executed) {
      executed += wide_amount_t{intent.executed_amount};
      requested += wide_amount_t{intent.amount};
    }
  });
  return ratio_bps(executed, requested);
}

uint32_t execution_ledger::cancellation_rate_bps() const {
  return ratio_bps(wide_amount_t{count_cancelled()},
                   wide_amount_t{intents_.count()});
}

uint32_t execution_ledger::execution_rate_bps() const {
  return ratio_bps(wide_amount_t{count_executed()},
                   wide_amount_t{intents_.count()});
}

std::optional<execution_record_t> execution_ledger::at(
    uint64_t position) const {
  auto intent_id = storage_.get<intent_id_t>(
      encoder_, key::make_execution_order_key(position));
  if (!intent_id) {
    return std::nullopt;
  }
  return get(*intent_id);
}

}  // namespace beacon::execution
