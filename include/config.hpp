#ifndef BGJOBS_CONFIG_HPP
#define BGJOBS_CONFIG_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "log.hpp"

namespace bgjobs {

// Settings for a job group. limit is the only knob the group itself reads;
// verbosity feeds the default logger.
struct jobs_config {
  std::ptrdiff_t limit = 1;
  log_level verbosity = log_level::warn;

  // Defaults overridden by BGJOBS_LIMIT and BGJOBS_LOG_LEVEL when set
  static jobs_config from_env();

  // key=value lines, '#' or ';' comments. Unknown keys are ignored.
  // Returns false if the file can't be opened.
  bool load_from_file(const std::string &path);

  // Throws configuration_error for a bad limit or log level
  void set(std::string_view key, std::string_view value);

  void validate() const;

  void apply_logging() const;
};

// Strict decimal parse; throws configuration_error unless value > 0
std::ptrdiff_t parse_limit(std::string_view text);

} // namespace bgjobs

#endif // BGJOBS_CONFIG_HPP
