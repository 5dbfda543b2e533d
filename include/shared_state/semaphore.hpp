#ifndef BGJOBS_SHARED_STATE_SEMAPHORE_HPP
#define BGJOBS_SHARED_STATE_SEMAPHORE_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

#include "concepts.hpp"
#include "crtp_base.hpp"
#include "errors.hpp"
#include "policies.hpp"

namespace bgjobs {

// =============================================================================
// Slot Semaphore - Counting semaphore with a fixed capacity
// =============================================================================
//
// available() starts at capacity() and stays within [0, capacity()].
// acquire() blocks while no slot is free; release() hands one back.
// wait_idle() blocks until every acquired slot has been released, which is
// how a job group drains.

template <typename LockPolicy = mutex_lock_policy>
class sync_slot_semaphore
    : public sync_primitive_base<sync_slot_semaphore<LockPolicy>, LockPolicy> {
  using base_type =
      sync_primitive_base<sync_slot_semaphore<LockPolicy>, LockPolicy>;

  const std::ptrdiff_t capacity_;
  std::ptrdiff_t count_;

  static std::ptrdiff_t checked_capacity(std::ptrdiff_t capacity) {
    if (capacity <= 0) {
      throw configuration_error("slot capacity must be > 0, got " +
                                std::to_string(capacity));
    }
    return capacity;
  }

public:
  using lock_policy = LockPolicy;

  explicit sync_slot_semaphore(std::ptrdiff_t capacity)
      : capacity_(checked_capacity(capacity)), count_(capacity_) {}

  // Take one slot (blocking)
  void acquire() {
    typename base_type::lock_type lock(this->mutex_);
    this->wait_for_condition(lock, [this] { return count_ > 0; });
    --count_;
  }

  bool try_acquire() {
    typename base_type::lock_type lock(this->mutex_);
    if (count_ > 0) {
      --count_;
      return true;
    }
    return false;
  }

  // Give one slot back. Both blocked acquirers and a draining waiter share
  // the condition variable, so everyone is woken.
  void release() {
    {
      typename base_type::lock_type lock(this->mutex_);
      if (count_ >= capacity_)
        throw std::logic_error("slot released without a matching acquire");
      ++count_;
    }
    this->notify_all();
  }

  // Block until no slot is held
  void wait_idle() const {
    typename base_type::lock_type lock(this->mutex_);
    this->wait_for_condition(lock, [this] { return count_ == capacity_; });
  }

  // Snapshot only; may be stale as soon as it returns
  std::ptrdiff_t available() const {
    typename base_type::lock_type lock(this->mutex_);
    return count_;
  }

  std::ptrdiff_t capacity() const noexcept { return capacity_; }
};

// =============================================================================
// Slot Guard - Releases a held slot on scope exit
// =============================================================================

template <typename Semaphore> class slot_guard {
  Semaphore *sem_;

public:
  // Adopts a slot the caller already acquired
  explicit slot_guard(Semaphore &sem) noexcept : sem_(&sem) {}

  ~slot_guard() {
    if (sem_)
      sem_->release();
  }

  slot_guard(slot_guard &&other) noexcept : sem_(other.sem_) {
    other.sem_ = nullptr;
  }

  slot_guard(const slot_guard &) = delete;
  slot_guard &operator=(const slot_guard &) = delete;
  slot_guard &operator=(slot_guard &&) = delete;
};

// =============================================================================
// Type Aliases
// =============================================================================

using slot_semaphore = sync_slot_semaphore<>;
using fast_slot_semaphore = sync_slot_semaphore<spinlock_policy>;

static_assert(SlotSemaphore<slot_semaphore>);
static_assert(SlotSemaphore<fast_slot_semaphore>);

} // namespace bgjobs

#endif // BGJOBS_SHARED_STATE_SEMAPHORE_HPP
