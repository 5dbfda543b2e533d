#include "errors.hpp"

#include <sstream>

namespace bgjobs {

namespace {

std::string failure_summary(const std::vector<std::exception_ptr> &failures) {
  std::ostringstream oss;
  oss << failures.size() << " background job"
      << (failures.size() == 1 ? "" : "s") << " failed";
  if (!failures.empty())
    oss << ": " << describe_exception(failures.front());
  return oss.str();
}

} // namespace

job_failure::job_failure(std::vector<std::exception_ptr> failures)
    : std::runtime_error(failure_summary(failures)),
      failures_(std::move(failures)) {}

void job_failure::rethrow_first() const {
  if (failures_.empty())
    throw std::logic_error("job_failure without failures");
  std::rethrow_exception(failures_.front());
}

std::string describe_exception(const std::exception_ptr &e) {
  if (!e)
    return "no exception";
  try {
    std::rethrow_exception(e);
  } catch (const std::exception &ex) {
    return ex.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace bgjobs
