#pragma once

namespace benefactor::execution {

/// Single-entry flag shared by every state-mutating engine operation.
class reentrancy_lock final {
 public:
  bool entered() const noexcept { return entered_; }

 private:
  friend class reentrancy_guard;
  bool entered_{};
};

/// Scoped claim on a reentrancy_lock.
///
/// Construction claims the lock when it is free; `acquired()` is false when
/// another guarded operation is already in progress, in which case the caller
/// must fail without touching state. The claim is released on destruction.
class reentrancy_guard final {
 public:
  explicit reentrancy_guard(reentrancy_lock& lock) noexcept
      : lock_{lock}, acquired_{!lock.entered_} {
    if (acquired_) {
      lock_.entered_ = true;
    }
  }

  ~reentrancy_guard() {
    if (acquired_) {
      lock_.entered_ = false;
    }
  }

  reentrancy_guard(const reentrancy_guard&) = delete;
  reentrancy_guard& operator=(const reentrancy_guard&) = delete;

  bool acquired() const noexcept { return acquired_; }

 private:
  reentrancy_lock& lock_;
  bool acquired_;
};

}  // namespace benefactor::execution
