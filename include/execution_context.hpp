#ifndef BGJOBS_EXECUTION_CONTEXT_HPP
#define BGJOBS_EXECUTION_CONTEXT_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace bgjobs {

// =============================================================================
// Execution Context - Immutable snapshot of the state a job runs under
// =============================================================================
//
// Passed by value into background jobs, so neither side can observe the
// other's later changes. Modifiers return a new context.

class execution_context {
public:
  using environment_type = std::map<std::string, std::string, std::less<>>;

  execution_context() = default;
  execution_context(std::filesystem::path directory, environment_type environment);

  // Current directory and environment of this process
  static execution_context capture();

  const std::filesystem::path &directory() const noexcept { return directory_; }
  const environment_type &environment() const noexcept { return environment_; }
  std::optional<std::string> env(std::string_view name) const;

  bool print_commands() const noexcept { return print_commands_; }
  bool tracing() const noexcept { return tracing_; }
  bool errexit() const noexcept { return errexit_; }

  // Relative paths are taken relative to directory()
  std::filesystem::path resolve(const std::filesystem::path &path) const;

  execution_context with_directory(const std::filesystem::path &directory) const;
  execution_context with_env(std::string name, std::string value) const;
  execution_context without_env(std::string_view name) const;
  execution_context with_print_commands(bool enabled) const;
  execution_context with_tracing(bool enabled) const;
  execution_context with_errexit(bool enabled) const;

  bool operator==(const execution_context &) const = default;

private:
  std::filesystem::path directory_;
  environment_type environment_;
  bool print_commands_{false};
  bool tracing_{true};
  bool errexit_{true};
};

} // namespace bgjobs

#endif // BGJOBS_EXECUTION_CONTEXT_HPP
