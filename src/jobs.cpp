#include "jobs.hpp"

#include <string>

namespace bgjobs {

namespace {

// The group whose job runs on this thread, if any
thread_local const job_manager *current_group = nullptr;

std::ptrdiff_t checked_limit(std::ptrdiff_t limit) {
  if (limit <= 0) {
    throw configuration_error("expected limit to be > 0, got " +
                              std::to_string(limit));
  }
  return limit;
}

} // namespace

job_manager::job_manager(std::ptrdiff_t limit) : slots_(checked_limit(limit)) {
  default_logger().debug("job group opened", {{"limit", std::to_string(limit)}});
}

job_manager::~job_manager() {
  if (state() == job_group_state::closed)
    return;
  drain();
  std::size_t failed = failure_count();
  if (failed > 0) {
    default_logger().error("job group closed with unreported failures",
                           {{"failed", std::to_string(failed)}});
  }
}

void job_manager::wait() {
  if (state() == job_group_state::closed)
    throw std::logic_error("job group already closed");
  drain();

  std::vector<std::exception_ptr> failures;
  {
    std::lock_guard<std::mutex> lock(failures_mutex_);
    failures.swap(failures_);
  }
  if (!failures.empty())
    throw job_failure(std::move(failures));
}

std::size_t job_manager::failure_count() const {
  std::lock_guard<std::mutex> lock(failures_mutex_);
  return failures_.size();
}

void job_manager::check_open() const {
  switch (state()) {
  case job_group_state::open:
    return;
  case job_group_state::draining:
    if (current_group == this)
      return;
    throw std::logic_error("background() from outside a draining job group");
  case job_group_state::closed:
    break;
  }
  throw std::logic_error("background() on a closed job group");
}

void job_manager::drain() {
  state_.store(job_group_state::draining, std::memory_order_release);
  default_logger().debug("job group draining",
                         {{"in_flight", std::to_string(in_flight())},
                          {"launched", std::to_string(launched())}});

  slots_.wait_idle();

  // Every slot is back, so no job is left that could launch another one.
  // Threads may still be on their way out after releasing.
  for (;;) {
    std::vector<std::thread> finished;
    {
      std::lock_guard<std::mutex> lock(threads_mutex_);
      finished.swap(threads_);
      if (finished.empty()) {
        state_.store(job_group_state::closed, std::memory_order_release);
        break;
      }
    }
    for (auto &thr : finished) {
      if (thr.joinable())
        thr.join();
    }
  }

  default_logger().debug("job group closed",
                         {{"launched", std::to_string(launched())},
                          {"failed", std::to_string(failure_count())}});
}

void job_manager::record_failure(std::size_t id, std::exception_ptr failure) {
  default_logger().error("background job failed",
                         {{"id", std::to_string(id)},
                          {"what", describe_exception(failure)}});
  std::lock_guard<std::mutex> lock(failures_mutex_);
  failures_.push_back(std::move(failure));
}

void job_manager::job_started(std::size_t id) {
  current_group = this;
  if (default_logger().enabled(log_level::trace)) {
    default_logger().trace("job started",
                           {{"id", std::to_string(id)},
                            {"in_flight", std::to_string(in_flight())}});
  }
}

void job_manager::job_finished(std::size_t id) {
  current_group = nullptr;
  if (default_logger().enabled(log_level::trace))
    default_logger().trace("job finished", {{"id", std::to_string(id)}});
}

} // namespace bgjobs
