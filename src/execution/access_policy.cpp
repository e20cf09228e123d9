#include <beacon/execution/access_policy.hpp>

using namespace beacon::schema;

namespace beacon::execution {

access_policy::access_policy(const registry_config_t& config,
                             const intent_store& intents)
    : config_{config}, intents_{intents} {}

bool access_policy::is_owner(const account_id_t& account) const {
  return account == config_.owner;
}

bool access_policy::is_controller(const account_id_t& account) const {
  return account == config_.controller;
}

bool access_policy::is_keeper(const account_id_t& account) const {
  return account == config_.keeper;
}

bool access_policy::can_cancel(intent_id_t intent_id,
                               const account_id_t& caller) const {
  auto intent = intents_.get(intent_id);
  if (!intent || status_of(*intent) != intent_status_t::pending) {
    return false;
  }
  return caller == intent->submitter || is_owner(caller);
}

bool access_policy::can_execute(intent_id_t intent_id) const {
  if (config_.paused) {
    return false;
  }
  auto intent = intents_.get(intent_id);
  return intent && status_of(*intent) == intent_status_t::pending;
}

}  // namespace beacon::execution
