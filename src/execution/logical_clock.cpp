#include <spdlog/spdlog.h>
#include <beacon/common/critical.hpp>
#include <beacon/execution/logical_clock.hpp>

namespace beacon::execution {

logical_clock::logical_clock(beacon::schema::sequence_t start) : now_{start} {
  if (now_ == 0) {
    beacon::common::critical("logical clock cannot start at 0");
  }
}

beacon::schema::sequence_t logical_clock::now() const {
  return now_;
}

beacon::schema::sequence_t logical_clock::advance(
    beacon::schema::sequence_t ticks) {
  now_ += ticks;
  return now_;
}

bool logical_clock::advance_to(beacon::schema::sequence_t value) {
  if (value < now_) {
    spdlog::warn("Refusing to move logical clock back from {} to {}", now_,
                 value);
    return false;
  }
  now_ = value;
  return true;
}

}  // namespace beacon::execution
