#include <spdlog/spdlog.h>
#include <beacon/common/critical.hpp>
#include <beacon/execution/reentrancy_guard.hpp>
#include <beacon/execution/registry.hpp>
#include <beacon/schema/constants.hpp>
#include <beacon/schema/key/registry_keys.hpp>
#include <algorithm>
#include <iterator>
#include <utility>

using namespace beacon::schema;

namespace {

operation_result_t make_result(const registry_error_code code,
                               const std::string_view codespace) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.codespace = std::string{codespace};
  if (code != registry_error_code::ok) {
    result.log = std::string{to_string(code)};
  }
  return result;
}

operation_result_t reject(const registry_error_code code,
                          const std::string_view codespace) {
  spdlog::warn("{} rejected: {}", codespace, to_string(code));
  return make_result(code, codespace);
}

bool valid_options(const beacon::execution::registry_options& options) {
  return !is_zero(options.owner) && !is_zero(options.controller) &&
         !is_zero(options.keeper) && options.fee_bps <= kFeeDenominator &&
         options.min_amount <= options.max_amount;
}

}  // namespace

namespace beacon::execution {

registry::registry(encoder_t& encoder,
                   storage_t& storage,
                   logical_clock& clock,
                   const registry_options& options,
                   transfer_function_t transfer,
                   event_sink_t sink)
    : encoder_{encoder},
      storage_{storage},
      clock_{clock},
      transfer_{std::move(transfer)},
      sink_{std::move(sink)},
      intents_{encoder, storage},
      executions_{encoder, storage, intents_},
      treasury_{encoder, storage},
      policy_{config_, intents_} {
  auto lock = std::scoped_lock{mutex_};
  load_config(options);
  spdlog::info("Registry ready: {} intent(s), {} execution(s), fee {} bps{}",
               intents_.count(), executions_.count(), config_.fee_bps,
               config_.paused ? ", paused" : "");
}

operation_result_t registry::submit_intent(const account_id_t& caller,
                                           const submit_intent_t& payload) {
  constexpr auto codespace = std::string_view{"beacon.submit_intent"};
  auto lock = std::scoped_lock{mutex_};
  if (config_.paused) {
    return reject(registry_error_code::paused, codespace);
  }
  if (!policy_.is_controller(caller)) {
    return reject(registry_error_code::not_controller, codespace);
  }

  auto sequence = clock_.now();
  auto batch = write_batch_t{};
  auto entry = intent_entry_t{};
  entry.side = payload.side;
  entry.amount = payload.amount;
  entry.limit_price = payload.limit_price;
  entry.symbol = payload.symbol;
  auto created = intent_state_t{};
  auto code = intents_.submit(entry, caller, payload.fee_paid, config_,
                              sequence, batch, created);
  if (code != registry_error_code::ok) {
    return reject(code, codespace);
  }

  auto result = make_result(code, codespace);
  result.data = encoder_.encode(created.intent_id);
  append_event(intent_submitted_t{.intent_id = created.intent_id,
                                  .submitter = created.submitter,
                                  .side = created.side,
                                  .amount = created.amount,
                                  .limit_price = created.limit_price,
                                  .symbol = created.symbol,
                                  .sequence = sequence},
               batch, result);
  if (payload.fee_paid > 0) {
    if (auto deposited = treasury_.deposit(payload.fee_paid, batch);
        deposited != registry_error_code::ok) {
      return reject(deposited, codespace);
    }
    append_event(treasury_topped_t{.amount = payload.fee_paid,
                                   .from = caller,
                                   .sequence = sequence},
                 batch, result);
  }
  commit(batch, result);
  spdlog::info("Intent {} submitted ({} {})", created.intent_id,
               to_string(created.side), created.amount.str());
  return result;
}

operation_result_t registry::submit_intent_batch(
    const account_id_t& caller,
    const submit_intent_batch_t& payload) {
  constexpr auto codespace = std::string_view{"beacon.submit_intent_batch"};
  auto lock = std::scoped_lock{mutex_};
  if (config_.paused) {
    return reject(registry_error_code::paused, codespace);
  }
  if (!policy_.is_controller(caller)) {
    return reject(registry_error_code::not_controller, codespace);
  }

  auto sequence = clock_.now();
  auto batch = write_batch_t{};
  auto created = std::vector<intent_state_t>{};
  auto code = intents_.submit_batch(payload.entries, caller,
                                    payload.total_fee_paid, config_, sequence,
                                    batch, created);
  if (code != registry_error_code::ok) {
    return reject(code, codespace);
  }

  auto result = make_result(code, codespace);
  auto ids = std::vector<intent_id_t>{};
  ids.reserve(created.size());
  for (const auto& intent : created) {
    ids.push_back(intent.intent_id);
    append_event(intent_submitted_t{.intent_id = intent.intent_id,
                                    .submitter = intent.submitter,
                                    .side = intent.side,
                                    .amount = intent.amount,
                                    .limit_price = intent.limit_price,
                                    .symbol = intent.symbol,
                                    .sequence = sequence},
                 batch, result);
  }
  result.data = encoder_.encode(ids);
  if (payload.total_fee_paid > 0) {
    if (auto deposited = treasury_.deposit(payload.total_fee_paid, batch);
        deposited != registry_error_code::ok) {
      return reject(deposited, codespace);
    }
    append_event(treasury_topped_t{.amount = payload.total_fee_paid,
                                   .from = caller,
                                   .sequence = sequence},
                 batch, result);
  }
  commit(batch, result);
  spdlog::info("Batch of {} intent(s) submitted, ids {}..{}", ids.size(),
               ids.front(), ids.back());
  return result;
}

operation_result_t registry::execute_intent(const account_id_t& caller,
                                            const execute_intent_t& payload) {
  constexpr auto codespace = std::string_view{"beacon.execute_intent"};
  auto lock = std::scoped_lock{mutex_};
  auto guard = reentrancy_guard{execute_in_progress_};
  if (!guard.acquired()) {
    return reject(registry_error_code::reentrancy, codespace);
  }
  if (config_.paused) {
    return reject(registry_error_code::paused, codespace);
  }
  if (!policy_.is_keeper(caller)) {
    return reject(registry_error_code::not_keeper, codespace);
  }

  auto sequence = clock_.now();
  auto batch = write_batch_t{};
  auto record = execution_record_t{};
  auto code = executions_.execute(payload.intent_id, payload.executed_amount,
                                  payload.average_price, caller, sequence,
                                  batch, record);
  if (code != registry_error_code::ok) {
    return reject(code, codespace);
  }

  auto result = make_result(code, codespace);
  result.data = encoder_.encode(record.intent_id);
  append_event(intent_executed_t{.intent_id = record.intent_id,
                                 .executor = record.executor,
                                 .executed_amount = record.executed_amount,
                                 .average_price = record.average_price,
                                 .sequence = sequence},
               batch, result);
  commit(batch, result);
  spdlog::info("Intent {} executed for {}", record.intent_id,
               record.executed_amount.str());
  return result;
}

operation_result_t registry::cancel_intent(const account_id_t& caller,
                                           const cancel_intent_t& payload) {
  constexpr auto codespace = std::string_view{"beacon.cancel_intent"};
  auto lock = std::scoped_lock{mutex_};
  auto sequence = clock_.now();
  auto batch = write_batch_t{};
  auto cancelled = intent_state_t{};
  auto code =
      intents_.cancel(payload.intent_id, caller, config_, batch, cancelled);
  if (code != registry_error_code::ok) {
    return reject(code, codespace);
  }

  auto result = make_result(code, codespace);
  result.data = encoder_.encode(cancelled.intent_id);
  append_event(intent_cancelled_t{.intent_id = cancelled.intent_id,
                                  .cancelled_by = caller,
                                  .sequence = sequence},
               batch, result);
  commit(batch, result);
  spdlog::info("Intent {} cancelled", cancelled.intent_id);
  return result;
}

operation_result_t registry::set_controller(const account_id_t& caller,
                                            const set_controller_t& payload) {
  return update_config(
      caller, "beacon.set_controller",
      [&](registry_config_t& config, registry_event_t& event) {
        if (is_zero(payload.controller)) {
          return registry_error_code::zero_address;
        }
        event = controller_changed_t{.previous = config.controller,
                                     .controller = payload.controller,
                                     .sequence = clock_.now()};
        config.controller = payload.controller;
        return registry_error_code::ok;
      });
}

operation_result_t registry::set_keeper(const account_id_t& caller,
                                        const set_keeper_t& payload) {
  return update_config(
      caller, "beacon.set_keeper",
      [&](registry_config_t& config, registry_event_t& event) {
        if (is_zero(payload.keeper)) {
          return registry_error_code::zero_address;
        }
        event = keeper_changed_t{.previous = config.keeper,
                                 .keeper = payload.keeper,
                                 .sequence = clock_.now()};
        config.keeper = payload.keeper;
        return registry_error_code::ok;
      });
}

operation_result_t registry::set_execution_bounds(
    const account_id_t& caller,
    const set_execution_bounds_t& payload) {
  return update_config(
      caller, "beacon.set_execution_bounds",
      [&](registry_config_t& config, registry_event_t& event) {
        if (payload.min_amount > payload.max_amount) {
          return registry_error_code::bounds_invalid;
        }
        event = bounds_changed_t{.previous_min_amount = config.min_amount,
                                 .previous_max_amount = config.max_amount,
                                 .min_amount = payload.min_amount,
                                 .max_amount = payload.max_amount,
                                 .sequence = clock_.now()};
        config.min_amount = payload.min_amount;
        config.max_amount = payload.max_amount;
        return registry_error_code::ok;
      });
}

operation_result_t registry::set_fee_rate(const account_id_t& caller,
                                          const set_fee_rate_t& payload) {
  return update_config(
      caller, "beacon.set_fee_rate",
      [&](registry_config_t& config, registry_event_t& event) {
        if (payload.fee_bps > kFeeDenominator) {
          return registry_error_code::bounds_invalid;
        }
        event = fee_changed_t{.previous_bps = config.fee_bps,
                              .fee_bps = payload.fee_bps,
                              .sequence = clock_.now()};
        config.fee_bps = payload.fee_bps;
        return registry_error_code::ok;
      });
}

operation_result_t registry::set_paused(const account_id_t& caller,
                                        const set_paused_t& payload) {
  return update_config(
      caller, "beacon.set_paused",
      [&](registry_config_t& config, registry_event_t& event) {
        event = pause_changed_t{.paused = payload.paused,
                                .sequence = clock_.now()};
        config.paused = payload.paused;
        return registry_error_code::ok;
      });
}

operation_result_t registry::deposit(const account_id_t& caller,
                                     const deposit_treasury_t& payload) {
  constexpr auto codespace = std::string_view{"beacon.deposit"};
  auto lock = std::scoped_lock{mutex_};
  auto batch = write_batch_t{};
  if (auto code = treasury_.deposit(payload.amount, batch);
      code != registry_error_code::ok) {
    return reject(code, codespace);
  }
  auto result = make_result(registry_error_code::ok, codespace);
  append_event(treasury_topped_t{.amount = payload.amount,
                                 .from = caller,
                                 .sequence = clock_.now()},
               batch, result);
  commit(batch, result);
  spdlog::info("Treasury topped up by {}", payload.amount.str());
  return result;
}

operation_result_t registry::withdraw(const account_id_t& caller,
                                      const withdraw_treasury_t& payload) {
  constexpr auto codespace = std::string_view{"beacon.withdraw"};
  auto lock = std::scoped_lock{mutex_};
  auto guard = reentrancy_guard{withdraw_in_progress_};
  if (!guard.acquired()) {
    return reject(registry_error_code::reentrancy, codespace);
  }
  if (!policy_.is_owner(caller)) {
    return reject(registry_error_code::unauthorized, codespace);
  }
  if (auto code = treasury_.check_withdraw(payload.to, payload.amount);
      code != registry_error_code::ok) {
    return reject(code, codespace);
  }

  auto debit = write_batch_t{};
  treasury_.debit(payload.amount, debit);
  storage_.commit(debit);

  auto transferred = false;
  if (transfer_) {
    transferred = transfer_(payload.to, payload.amount);
  } else {
    spdlog::warn("No transfer primitive installed");
  }
  if (!transferred) {
    auto refund = write_batch_t{};
    if (treasury_.deposit(payload.amount, refund) !=
        registry_error_code::ok) {
      beacon::common::critical("treasury refund of {} overflowed",
                               payload.amount.str());
    }
    storage_.commit(refund);
    return reject(registry_error_code::transfer_failed, codespace);
  }

  auto batch = write_batch_t{};
  auto result = make_result(registry_error_code::ok, codespace);
  append_event(treasury_withdrawn_t{.to = payload.to,
                                    .amount = payload.amount,
                                    .sequence = clock_.now()},
               batch, result);
  commit(batch, result);
  spdlog::info("Treasury withdrew {} to {}", payload.amount.str(),
               to_hex(payload.to));
  return result;
}

operation_result_t registry::apply(const operation_t& operation) {
  const auto& caller = operation.caller;
  return std::visit(
      overloaded{
          [&](const submit_intent_t& payload) {
            return submit_intent(caller, payload);
          },
          [&](const submit_intent_batch_t& payload) {
            return submit_intent_batch(caller, payload);
          },
          [&](const execute_intent_t& payload) {
            return execute_intent(caller, payload);
          },
          [&](const cancel_intent_t& payload) {
            return cancel_intent(caller, payload);
          },
          [&](const set_controller_t& payload) {
            return set_controller(caller, payload);
          },
          [&](const set_keeper_t& payload) {
            return set_keeper(caller, payload);
          },
          [&](const set_execution_bounds_t& payload) {
            return set_execution_bounds(caller, payload);
          },
          [&](const set_fee_rate_t& payload) {
            return set_fee_rate(caller, payload);
          },
          [&](const set_paused_t& payload) {
            return set_paused(caller, payload);
          },
          [&](const deposit_treasury_t& payload) {
            return deposit(caller, payload);
          },
          [&](const withdraw_treasury_t& payload) {
            return withdraw(caller, payload);
          }},
      operation.payload);
}

operation_result_t registry::apply_encoded(const bytes_view_t& raw_operation) {
  constexpr auto codespace = std::string_view{"beacon.apply"};
  if (raw_operation.empty()) {
    return reject(registry_error_code::invalid_operation, codespace);
  }
  auto operation = encoder_.try_decode<operation_t>(raw_operation);
  if (!operation || operation->version != 1) {
    return reject(registry_error_code::invalid_operation, codespace);
  }
  return apply(*operation);
}

query_result_t registry::query(std::string_view path,
                               const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = route_query(path, data);
  result.key = make_bytes(data);
  result.sequence = clock_.now();
  result.codespace = "beacon.query";
  if (result.code != 0) {
    spdlog::debug("Query {} failed: {}", path, result.log);
  }
  return result;
}

const intent_store& registry::intents() const {
  return intents_;
}

const execution_ledger& registry::executions() const {
  return executions_;
}

const treasury_account& registry::treasury() const {
  return treasury_;
}

const access_policy& registry::policy() const {
  return policy_;
}

registry_config_t registry::config() const {
  auto lock = std::scoped_lock{mutex_};
  return config_;
}

registry_stats_t registry::stats() const {
  auto lock = std::scoped_lock{mutex_};
  auto stats = registry_stats_t{};
  stats.total_intents = intents_.count();
  stats.pending = executions_.count_pending();
  stats.executed = executions_.count_executed();
  stats.cancelled = executions_.count_cancelled();
  stats.total_executions = executions_.count();
  stats.fill_rate_bps = executions_.fill_rate_bps();
  stats.cancellation_rate_bps = executions_.cancellation_rate_bps();
  stats.execution_rate_bps = executions_.execution_rate_bps();
  stats.treasury_balance = treasury_.balance();
  return stats;
}

std::vector<event_record_t> registry::events(uint64_t from, uint64_t to) const {
  auto lock = std::scoped_lock{mutex_};
  auto records = std::vector<event_record_t>{};
  auto total =
      storage_.get<uint64_t>(encoder_, key::make_event_count_key()).value_or(0);
  from = std::max<uint64_t>(from, 1);
  to = std::min(to, total);
  for (auto event_id = from; event_id <= to; ++event_id) {
    if (auto record = storage_.get<event_record_t>(
            encoder_, key::make_event_key(event_id))) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

void registry::commit(write_batch_t& batch, operation_result_t& result) {
  storage_.commit(batch);
  if (!sink_) {
    return;
  }
  for (const auto& event : result.events) {
    sink_(event);
  }
}

void registry::append_event(registry_event_t event,
                            write_batch_t& batch,
                            operation_result_t& result) {
  auto event_id =
      storage_.get<uint64_t>(encoder_, batch, key::make_event_count_key())
          .value_or(0) +
      1;
  auto record = event_record_t{};
  record.event_id = event_id;
  record.event = event;
  batch.put(encoder_, key::make_event_key(event_id), record);
  batch.put(encoder_, key::make_event_count_key(), event_id);
  spdlog::debug("Event {} #{}", event_name(event), event_id);
  result.events.push_back(std::move(event));
}

operation_result_t registry::update_config(
    const account_id_t& caller,
    std::string_view codespace,
    const std::function<registry_error_code(registry_config_t&,
                                            registry_event_t&)>& mutate) {
  auto lock = std::scoped_lock{mutex_};
  if (!policy_.is_owner(caller)) {
    return reject(registry_error_code::not_owner, codespace);
  }
  auto updated = config_;
  auto event = registry_event_t{};
  auto code = mutate(updated, event);
  if (code != registry_error_code::ok) {
    return reject(code, codespace);
  }

  auto batch = write_batch_t{};
  auto result = make_result(code, codespace);
  batch.put(encoder_, key::make_config_key(), updated);
  append_event(std::move(event), batch, result);
  config_ = updated;
  commit(batch, result);
  spdlog::info("{} applied", codespace);
  return result;
}

void registry::load_config(const registry_options& options) {
  if (auto persisted =
          storage_.get<registry_config_t>(encoder_, key::make_config_key())) {
    config_ = *persisted;
    spdlog::info("Loaded persisted registry config");
    return;
  }
  if (!valid_options(options)) {
    beacon::common::critical("invalid initial registry options");
  }
  config_ = registry_config_t{};
  config_.owner = options.owner;
  config_.controller = options.controller;
  config_.keeper = options.keeper;
  config_.fee_bps = options.fee_bps;
  config_.min_amount = options.min_amount;
  config_.max_amount = options.max_amount;
  storage_.put(encoder_, key::make_config_key(), config_);
  spdlog::info("Initialized registry config for owner {}",
               to_hex(config_.owner));
}

}  // namespace beacon::execution
