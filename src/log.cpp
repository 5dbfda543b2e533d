#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

#include "errors.hpp"

namespace bgjobs {

namespace {

std::string now_iso() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

} // namespace

log_level parse_log_level(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "trace")
    return log_level::trace;
  if (lowered == "debug")
    return log_level::debug;
  if (lowered == "info")
    return log_level::info;
  if (lowered == "warn" || lowered == "warning")
    return log_level::warn;
  if (lowered == "error")
    return log_level::error;
  if (lowered == "off" || lowered == "none")
    return log_level::off;
  throw configuration_error("unknown log level: '" + std::string(name) + "'");
}

const char *log_level_name(log_level level) {
  switch (level) {
  case log_level::trace:
    return "TRACE";
  case log_level::debug:
    return "DEBUG";
  case log_level::info:
    return "INFO";
  case log_level::warn:
    return "WARN";
  case log_level::error:
    return "ERROR";
  case log_level::off:
    return "OFF";
  }
  return "INFO";
}

logger::logger() : sink_(&std::clog) {}

void logger::set_level(log_level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

log_level logger::level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

bool logger::enabled(log_level level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level != log_level::off && level >= level_;
}

void logger::set_sink(std::ostream *sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = sink ? sink : &std::clog;
}

void logger::write(log_level level, std::string_view message,
                   const std::vector<log_field> &fields) {
  if (!enabled(level))
    return;

  // Format outside the lock, emit in one piece
  std::ostringstream line;
  line << '[' << now_iso() << "] " << std::left << std::setw(5)
       << log_level_name(level) << " [tid=" << std::this_thread::get_id()
       << "] " << message;
  for (const auto &field : fields)
    line << ' ' << field.key << '=' << field.value;
  line << '\n';

  std::lock_guard<std::mutex> lock(mutex_);
  *sink_ << line.str();
  sink_->flush();
}

logger &default_logger() {
  static logger instance;
  return instance;
}

} // namespace bgjobs
