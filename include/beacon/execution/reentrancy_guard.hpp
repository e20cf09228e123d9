#pragma once

namespace beacon::execution {

/// Scoped in-progress flag. Acquires `flag` when it is clear and releases it
/// on destruction; a nested guard on the same flag does not acquire.
class reentrancy_guard final {
 public:
  explicit reentrancy_guard(bool& flag) : flag_{flag}, acquired_{!flag} {
    if (acquired_) {
      flag_ = true;
    }
  }

  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;

  ~reentrancy_guard() {
    if (acquired_) {
      flag_ = false;
    }
  }

  bool acquired() const { return acquired_; }

 private:
  bool& flag_;
  bool acquired_;
};

}  // namespace beacon::execution
