#include <beacon/execution/registry.hpp>
#include <beacon/schema/intent_side.hpp>
#include <tuple>

using namespace beacon::schema;

namespace {

query_result_t make_query_error(const registry_error_code code) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  return result;
}

template <typename T>
query_result_t make_query_value(beacon::execution::encoder_t& encoder,
                                const T& value) {
  auto result = query_result_t{};
  result.value = encoder.encode(value);
  return result;
}

}  // namespace

namespace beacon::execution {

query_result_t registry::route_query(std::string_view path,
                                     const bytes_view_t& data) {
  // Routes without arguments.
  if (path == "/registry/config") {
    return make_query_value(encoder_, config_);
  }
  if (path == "/registry/treasury") {
    return make_query_value(encoder_, treasury_.balance());
  }
  if (path == "/registry/stats") {
    return make_query_value(encoder_, stats());
  }
  if (path == "/intents/count") {
    return make_query_value(encoder_, intents_.count());
  }
  if (path == "/executions/count") {
    return make_query_value(encoder_, executions_.count());
  }

  if (path == "/intent/get") {
    auto intent_id = encoder_.try_decode<intent_id_t>(data);
    if (!intent_id) {
      return make_query_error(registry_error_code::invalid_query);
    }
    auto intent = intents_.get(*intent_id);
    if (!intent) {
      return make_query_error(registry_error_code::not_found);
    }
    return make_query_value(encoder_, *intent);
  }
  if (path == "/intents/by_submitter") {
    auto submitter = encoder_.try_decode<account_id_t>(data);
    if (!submitter) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(encoder_, intents_.by_submitter(*submitter));
  }
  if (path == "/intents/by_symbol") {
    auto symbol = encoder_.try_decode<symbol_id_t>(data);
    if (!symbol) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(encoder_, intents_.by_symbol(*symbol));
  }
  if (path == "/intents/at") {
    auto index = encoder_.try_decode<uint64_t>(data);
    if (!index) {
      return make_query_error(registry_error_code::invalid_query);
    }
    auto intent_id = intents_.at(*index);
    if (!intent_id) {
      return make_query_error(registry_error_code::bounds_invalid);
    }
    return make_query_value(encoder_, *intent_id);
  }
  if (path == "/intents/range") {
    auto bounds = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!bounds) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(
        encoder_, intents_.range(std::get<0>(*bounds), std::get<1>(*bounds)));
  }
  if (path == "/intents/last") {
    auto n = encoder_.try_decode<uint64_t>(data);
    if (!n) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(encoder_, intents_.last(*n));
  }
  if (path == "/intents/sequence_range") {
    auto bounds =
        encoder_.try_decode<std::tuple<sequence_t, sequence_t>>(data);
    if (!bounds) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(
        encoder_, intents_.in_sequence_range(std::get<0>(*bounds),
                                             std::get<1>(*bounds)));
  }
  if (path == "/intents/bulk") {
    auto ids = encoder_.try_decode<std::vector<intent_id_t>>(data);
    if (!ids) {
      return make_query_error(registry_error_code::invalid_query);
    }
    auto found = std::vector<intent_state_t>{};
    auto code = intents_.get_many(*ids, found);
    if (code != registry_error_code::ok) {
      return make_query_error(code);
    }
    return make_query_value(encoder_, found);
  }

  if (path == "/executions/get") {
    auto intent_id = encoder_.try_decode<intent_id_t>(data);
    if (!intent_id) {
      return make_query_error(registry_error_code::invalid_query);
    }
    auto record = executions_.get(*intent_id);
    if (!record) {
      return make_query_error(registry_error_code::not_found);
    }
    return make_query_value(encoder_, *record);
  }
  if (path == "/executions/last") {
    auto n = encoder_.try_decode<uint64_t>(data);
    if (!n) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(encoder_, executions_.last(*n));
  }
  if (path == "/executions/range") {
    auto bounds = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!bounds) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(encoder_, executions_.range(std::get<0>(*bounds),
                                                       std::get<1>(*bounds)));
  }
  if (path == "/executions/bulk") {
    auto ids = encoder_.try_decode<std::vector<intent_id_t>>(data);
    if (!ids) {
      return make_query_error(registry_error_code::invalid_query);
    }
    auto records = std::vector<execution_record_t>{};
    auto code = executions_.get_many(*ids, records);
    if (code != registry_error_code::ok) {
      return make_query_error(code);
    }
    return make_query_value(encoder_, records);
  }

  if (path == "/volume/by_side") {
    auto side = encoder_.try_decode<intent_side_t>(data);
    if (!side) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(
        encoder_, std::tuple{executions_.requested_volume(*side),
                             executions_.executed_volume(*side)});
  }
  if (path == "/volume/by_symbol") {
    auto symbol = encoder_.try_decode<symbol_id_t>(data);
    if (!symbol) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(encoder_,
                            executions_.executed_volume_by_symbol(*symbol));
  }
  if (path == "/volume/by_submitter") {
    auto submitter = encoder_.try_decode<account_id_t>(data);
    if (!submitter) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(
        encoder_, executions_.executed_volume_by_submitter(*submitter));
  }

  if (path == "/policy/roles") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(
        encoder_, std::tuple{policy_.is_owner(*account),
                             policy_.is_controller(*account),
                             policy_.is_keeper(*account)});
  }
  if (path == "/policy/can_cancel") {
    auto request =
        encoder_.try_decode<std::tuple<intent_id_t, account_id_t>>(data);
    if (!request) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(encoder_,
                            policy_.can_cancel(std::get<0>(*request),
                                               std::get<1>(*request)));
  }
  if (path == "/policy/can_execute") {
    auto intent_id = encoder_.try_decode<intent_id_t>(data);
    if (!intent_id) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(encoder_, policy_.can_execute(*intent_id));
  }

  if (path == "/events/range") {
    auto bounds = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!bounds) {
      return make_query_error(registry_error_code::invalid_query);
    }
    return make_query_value(
        encoder_, events(std::get<0>(*bounds), std::get<1>(*bounds)));
  }

  return make_query_error(registry_error_code::unsupported_path);
}

}  // namespace beacon::execution
