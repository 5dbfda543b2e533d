#ifndef BGJOBS_SHARED_STATE_CRTP_BASE_HPP
#define BGJOBS_SHARED_STATE_CRTP_BASE_HPP

#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "concepts.hpp"
#include "policies.hpp"

namespace bgjobs {

// =============================================================================
// Sync Primitive Base - Provides mutex + condition_variable pattern
// =============================================================================

template <typename Derived, typename LockPolicy = mutex_lock_policy>
class sync_primitive_base {
protected:
  using mutex_type = typename LockPolicy::mutex_type;
  using lock_type = typename LockPolicy::lock_type;

  mutable mutex_type mutex_;
  mutable std::condition_variable_any cv_;

  template <typename Predicate>
  void wait_for_condition(lock_type &lock, Predicate pred) const {
    cv_.wait(lock, pred);
  }

  void notify_all() const { cv_.notify_all(); }

public:
  sync_primitive_base() = default;
  ~sync_primitive_base() = default;

  sync_primitive_base(const sync_primitive_base &) = delete;
  sync_primitive_base &operator=(const sync_primitive_base &) = delete;
  sync_primitive_base(sync_primitive_base &&) = delete;
  sync_primitive_base &operator=(sync_primitive_base &&) = delete;
};

// =============================================================================
// Result Holder - Write-once value or failure
// =============================================================================

template <typename T> class result_holder {
  std::optional<T> value_;
  std::exception_ptr exception_;

  void check_empty() const {
    if (value_.has_value() || exception_)
      throw std::logic_error("result already written");
  }

public:
  void set_value(T value) {
    check_empty();
    value_.emplace(std::move(value));
  }

  void set_exception(std::exception_ptr e) {
    check_empty();
    exception_ = std::move(e);
  }

  bool has_value() const { return value_.has_value(); }

  bool has_exception() const { return exception_ != nullptr; }

  bool is_set() const { return has_value() || has_exception(); }

  // Reads do not consume; every reader sees the same value
  const T &peek() const {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
    return *value_;
  }
};

template <> class result_holder<void> {
  bool completed_{false};
  std::exception_ptr exception_;

  void check_empty() const {
    if (completed_ || exception_)
      throw std::logic_error("result already written");
  }

public:
  void set_value() {
    check_empty();
    completed_ = true;
  }

  void set_exception(std::exception_ptr e) {
    check_empty();
    exception_ = std::move(e);
  }

  bool has_value() const { return completed_; }

  bool has_exception() const { return exception_ != nullptr; }

  bool is_set() const { return has_value() || has_exception(); }

  void peek() const {
    if (exception_) {
      std::rethrow_exception(exception_);
    }
  }
};

} // namespace bgjobs

#endif // BGJOBS_SHARED_STATE_CRTP_BASE_HPP
