#ifndef BGJOBS_ERRORS_HPP
#define BGJOBS_ERRORS_HPP

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace bgjobs {

// Thrown for a bad limit, before any slot or thread exists
struct configuration_error : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Raised by jobs() after the drain when background units of work failed.
// Holds one entry per failed unit, in the order the failures were recorded.
class job_failure : public std::runtime_error {
public:
  explicit job_failure(std::vector<std::exception_ptr> failures);

  const std::vector<std::exception_ptr> &failures() const noexcept {
    return failures_;
  }

  std::size_t count() const noexcept { return failures_.size(); }

  // Rethrows the first recorded failure
  [[noreturn]] void rethrow_first() const;

private:
  std::vector<std::exception_ptr> failures_;
};

// what() of a stored exception, or a placeholder for non-std exceptions
std::string describe_exception(const std::exception_ptr &e);

} // namespace bgjobs

#endif // BGJOBS_ERRORS_HPP
