#ifndef BGJOBS_SHARED_STATE_BG_RESULT_HPP
#define BGJOBS_SHARED_STATE_BG_RESULT_HPP

#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "concepts.hpp"
#include "crtp_base.hpp"
#include "policies.hpp"

namespace bgjobs {

// =============================================================================
// Sync Result State - Write-once slot with blocking reads
// =============================================================================

template <typename T, typename LockPolicy = mutex_lock_policy>
class sync_result_state
    : public sync_primitive_base<sync_result_state<T, LockPolicy>, LockPolicy> {
  using base_type =
      sync_primitive_base<sync_result_state<T, LockPolicy>, LockPolicy>;

  result_holder<T> holder_;

public:
  using value_type = T;
  using lock_policy = LockPolicy;
  using try_type =
      std::conditional_t<std::is_void_v<T>, bool, std::optional<T>>;

  sync_result_state() = default;

  // Throws std::logic_error if anything was already written
  template <typename... Args> void set_value(Args &&...args) {
    {
      typename base_type::lock_type lock(this->mutex_);
      holder_.set_value(std::forward<Args>(args)...);
    }
    this->notify_all();
  }

  void set_exception(std::exception_ptr e) {
    {
      typename base_type::lock_type lock(this->mutex_);
      holder_.set_exception(std::move(e));
    }
    this->notify_all();
  }

  // Block until written; rethrows a stored failure
  T get() const {
    typename base_type::lock_type lock(this->mutex_);
    this->wait_for_condition(lock, [this] { return holder_.is_set(); });
    return holder_.peek();
  }

  try_type try_get() const {
    typename base_type::lock_type lock(this->mutex_);
    if constexpr (std::is_void_v<T>) {
      if (!holder_.is_set())
        return false;
      holder_.peek();
      return true;
    } else {
      if (!holder_.is_set())
        return std::nullopt;
      return holder_.peek();
    }
  }

  bool is_set() const {
    typename base_type::lock_type lock(this->mutex_);
    return holder_.is_set();
  }

  bool has_exception() const {
    typename base_type::lock_type lock(this->mutex_);
    return holder_.has_exception();
  }
};

// =============================================================================
// Background Result - Shared handle to a result state
// =============================================================================
//
// Handed out by job_manager::background(). Copies refer to the same state,
// so a result stays readable after the job group that produced it is gone.

template <typename T, typename LockPolicy = mutex_lock_policy> class bg_result {
  using state_type = sync_result_state<T, LockPolicy>;

  std::shared_ptr<state_type> state_;

public:
  using value_type = T;
  using try_type = typename state_type::try_type;

  bg_result() : state_(std::make_shared<state_type>()) {}

  template <typename... Args> void write(Args &&...args) {
    state_->set_value(std::forward<Args>(args)...);
  }

  void write_failure(std::exception_ptr e) { state_->set_exception(std::move(e)); }

  // Blocks until the producing job finishes. Every call returns the same
  // value, or rethrows the job's exception if it failed.
  T read() const { return state_->get(); }

  // Non-blocking read: empty (or false for void) while the job is running
  try_type try_read() const { return state_->try_get(); }

  bool ready() const { return state_->is_set(); }

  bool has_failed() const { return state_->has_exception(); }

  bool shares_state_with(const bg_result &other) const noexcept {
    return state_ == other.state_;
  }
};

static_assert(ResultReader<bg_result<int>, int>);

} // namespace bgjobs

#endif // BGJOBS_SHARED_STATE_BG_RESULT_HPP
