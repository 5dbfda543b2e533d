#ifndef BGJOBS_JOBS_HPP
#define BGJOBS_JOBS_HPP

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "execution_context.hpp"
#include "log.hpp"
#include "shared_state/bg_result.hpp"
#include "shared_state/concepts.hpp"
#include "shared_state/semaphore.hpp"

/*
  A job group runs a handful of slow, independent steps next to an otherwise
  sequential program. Every background() call takes a slot on the calling
  thread before anything is spawned, so a caller that launches faster than
  jobs finish is throttled right there, and the group can never look idle
  while a launch is still in progress. The group is closed exactly once,
  either by jobs() or by the destructor, after every slot has come back.
*/

namespace bgjobs {

enum class job_group_state { open, draining, closed };

class job_manager {
public:
  // Throws configuration_error unless limit > 0
  explicit job_manager(std::ptrdiff_t limit);

  // Drains and joins if the group was never closed. Failures are logged,
  // not thrown.
  ~job_manager();

  job_manager(const job_manager &) = delete;
  job_manager &operator=(const job_manager &) = delete;
  job_manager(job_manager &&) = delete;
  job_manager &operator=(job_manager &&) = delete;

  // Run work() on a new thread. Blocks only while every slot is taken.
  // A reference result is copied into the bg_result. While the group drains
  // only its own jobs may launch; other callers get std::logic_error.
  template <typename F>
    requires UnitOfWork<F>
  auto background(F &&work)
      -> bg_result<std::remove_cvref_t<std::invoke_result_t<std::decay_t<F> &>>>;

  // Run work(ctx) on a new thread against a private copy of ctx
  template <typename C, typename F>
    requires ContextualUnitOfWork<F, C>
  auto background(const C &ctx, F &&work)
      -> bg_result<std::remove_cvref_t<
          std::invoke_result_t<std::decay_t<F> &, const C &>>>;

  // Block until every job has finished and been joined, then close the
  // group. Throws job_failure if any job failed.
  void wait();

  std::ptrdiff_t limit() const noexcept { return slots_.capacity(); }

  // Slots held right now; a snapshot
  std::ptrdiff_t in_flight() const { return slots_.capacity() - slots_.available(); }

  std::size_t launched() const noexcept {
    return launched_.load(std::memory_order_acquire);
  }

  std::size_t failure_count() const;

  job_group_state state() const noexcept {
    return state_.load(std::memory_order_acquire);
  }

private:
  template <typename R, typename Run> bg_result<R> spawn(Run run);

  void check_open() const;
  void drain();
  void record_failure(std::size_t id, std::exception_ptr failure);
  void job_started(std::size_t id);
  void job_finished(std::size_t id);

  slot_semaphore slots_;
  std::atomic<std::size_t> launched_{0};
  std::atomic<job_group_state> state_{job_group_state::open};

  std::mutex threads_mutex_;
  std::vector<std::thread> threads_;

  mutable std::mutex failures_mutex_;
  std::vector<std::exception_ptr> failures_;
};

// =============================================================================
// job_manager template members
// =============================================================================

template <typename F>
  requires UnitOfWork<F>
auto job_manager::background(F &&work)
    -> bg_result<std::remove_cvref_t<std::invoke_result_t<std::decay_t<F> &>>> {
  using result_type = std::remove_cvref_t<std::invoke_result_t<std::decay_t<F> &>>;
  return spawn<result_type>(std::decay_t<F>(std::forward<F>(work)));
}

template <typename C, typename F>
  requires ContextualUnitOfWork<F, C>
auto job_manager::background(const C &ctx, F &&work)
    -> bg_result<std::remove_cvref_t<
        std::invoke_result_t<std::decay_t<F> &, const C &>>> {
  using result_type =
      std::remove_cvref_t<std::invoke_result_t<std::decay_t<F> &, const C &>>;
  // Snapshot taken on the launching thread, before the slot is acquired
  return spawn<result_type>(
      [snapshot = C(ctx), fn = std::decay_t<F>(std::forward<F>(work))]() mutable
      -> result_type { return std::invoke(fn, std::as_const(snapshot)); });
}

template <typename R, typename Run> bg_result<R> job_manager::spawn(Run run) {
  check_open();

  slots_.acquire();
  const std::size_t id = launched_.fetch_add(1, std::memory_order_acq_rel) + 1;
  bg_result<R> result;

  try {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    // drain() marks the group closed under this lock, so a thread pushed
    // here is always joined
    if (state() == job_group_state::closed)
      throw std::logic_error("background() on a closed job group");
    threads_.emplace_back([this, id, result, run = std::move(run)]() mutable {
      slot_guard<slot_semaphore> slot(slots_);
      job_started(id);
      try {
        if constexpr (std::is_void_v<R>) {
          run();
          result.write();
        } else {
          result.write(run());
        }
      } catch (...) {
        std::exception_ptr failure = std::current_exception();
        // A failed write leaves the result empty as well
        if (!result.ready())
          result.write_failure(failure);
        record_failure(id, std::move(failure));
      }
      job_finished(id);
    });
  } catch (...) {
    // No thread took the slot; nothing else will release it
    slots_.release();
    throw;
  }

  return result;
}

// =============================================================================
// Completion Barrier
// =============================================================================

// Open a job group of at most `limit` concurrent jobs, run logic(manager),
// wait for every job it launched, then return logic's result. Throws
// configuration_error before calling logic if limit <= 0, and job_failure
// after the drain if a job failed. If logic throws, the group still drains
// before the exception propagates.
template <typename Logic>
  requires std::invocable<Logic &, job_manager &>
auto jobs(std::ptrdiff_t limit, Logic &&logic)
    -> std::invoke_result_t<Logic &, job_manager &> {
  using result_type = std::invoke_result_t<Logic &, job_manager &>;

  job_manager manager(limit);
  if constexpr (std::is_void_v<result_type>) {
    std::invoke(logic, manager);
    manager.wait();
  } else {
    result_type result = std::invoke(logic, manager);
    manager.wait();
    return result;
  }
}

template <typename Logic>
  requires std::invocable<Logic &, job_manager &>
auto jobs(const jobs_config &config, Logic &&logic)
    -> std::invoke_result_t<Logic &, job_manager &> {
  config.validate();
  return jobs(config.limit, std::forward<Logic>(logic));
}

} // namespace bgjobs

#endif // BGJOBS_JOBS_HPP
