#pragma once

#include <beacon/schema/primitives.hpp>

namespace beacon::execution {

/// Monotonic logical clock standing in for block height. Values are only
/// used to order and stamp records; 0 is reserved for "absent".
class logical_clock final {
 public:
  explicit logical_clock(beacon::schema::sequence_t start = 1);

  beacon::schema::sequence_t now() const;

  /// Move forward by `ticks` and return the new value.
  beacon::schema::sequence_t advance(beacon::schema::sequence_t ticks = 1);

  /// Jump to `value`. Refuses (returns false) to move backwards.
  bool advance_to(beacon::schema::sequence_t value);

 private:
  beacon::schema::sequence_t now_;
};

}  // namespace beacon::execution
