#ifndef BGJOBS_LOG_HPP
#define BGJOBS_LOG_HPP

#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace bgjobs {

enum class log_level : int {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  off = 5
};

struct log_field {
  std::string key;
  std::string value;
};

// Case-insensitive; throws configuration_error for an unknown name
log_level parse_log_level(std::string_view name);
const char *log_level_name(log_level level);

// =============================================================================
// Logger - Line-oriented, mutex-serialized
// =============================================================================
//
// Lines look like:
//   [2026-10-19T12:00:00.123] DEBUG [tid=...] job finished id=3 in_flight=1

class logger {
public:
  logger();

  void set_level(log_level level);
  log_level level() const;
  bool enabled(log_level level) const;

  // nullptr restores the default sink (std::clog)
  void set_sink(std::ostream *sink);

  void write(log_level level, std::string_view message,
             const std::vector<log_field> &fields = {});

  void trace(std::string_view message, const std::vector<log_field> &fields = {}) {
    write(log_level::trace, message, fields);
  }
  void debug(std::string_view message, const std::vector<log_field> &fields = {}) {
    write(log_level::debug, message, fields);
  }
  void info(std::string_view message, const std::vector<log_field> &fields = {}) {
    write(log_level::info, message, fields);
  }
  void warn(std::string_view message, const std::vector<log_field> &fields = {}) {
    write(log_level::warn, message, fields);
  }
  void error(std::string_view message, const std::vector<log_field> &fields = {}) {
    write(log_level::error, message, fields);
  }

private:
  mutable std::mutex mutex_;
  std::ostream *sink_;
  log_level level_{log_level::warn};
};

// Process-wide instance used by the job manager
logger &default_logger();

} // namespace bgjobs

#endif // BGJOBS_LOG_HPP
