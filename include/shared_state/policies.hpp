#ifndef BGJOBS_SHARED_STATE_POLICIES_HPP
#define BGJOBS_SHARED_STATE_POLICIES_HPP

#include <atomic>
#include <mutex>

namespace bgjobs {

// =============================================================================
// Lock Policies
// =============================================================================

struct mutex_lock_policy {
  using mutex_type = std::mutex;
  using lock_type = std::unique_lock<std::mutex>;
};

struct spinlock {
  void lock() noexcept {
    while (flag_.test_and_set(std::memory_order_acquire)) {
      while (flag_.test(std::memory_order_relaxed)) {
      }
    }
  }

  bool try_lock() noexcept {
    return !flag_.test_and_set(std::memory_order_acquire);
  }

  void unlock() noexcept { flag_.clear(std::memory_order_release); }

private:
  std::atomic_flag flag_ = ATOMIC_FLAG_INIT;
};

// Only worth it for very short critical sections (slot counters)
struct spinlock_policy {
  using mutex_type = spinlock;
  using lock_type = std::unique_lock<spinlock>;
};

} // namespace bgjobs

#endif // BGJOBS_SHARED_STATE_POLICIES_HPP
