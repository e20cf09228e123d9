#pragma once

#include <beacon/execution/intent_store.hpp>
#include <beacon/schema/primitives.hpp>
#include <beacon/schema/registry_config.hpp>

namespace beacon::execution {

/// Role and lifecycle predicates over the current config and intent state.
/// Holds no state of its own.
class access_policy final {
 public:
  access_policy(const beacon::schema::registry_config_t& config,
                const intent_store& intents);

  bool is_owner(const beacon::schema::account_id_t& account) const;
  bool is_controller(const beacon::schema::account_id_t& account) const;
  bool is_keeper(const beacon::schema::account_id_t& account) const;

  /// Intent is pending and `caller` submitted it or owns the registry.
  bool can_cancel(beacon::schema::intent_id_t intent_id,
                  const beacon::schema::account_id_t& caller) const;

  /// Intent is pending and the registry is not paused.
  bool can_execute(beacon::schema::intent_id_t intent_id) const;

 private:
  const beacon::schema::registry_config_t& config_;
  const intent_store& intents_;
};

}  // namespace beacon::execution
