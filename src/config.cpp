#include "config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

#include "errors.hpp"

namespace bgjobs {

namespace {

std::string_view trim(std::string_view s) {
  const auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!s.empty() && is_ws(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && is_ws(s.back()))
    s.remove_suffix(1);
  return s;
}

} // namespace

std::ptrdiff_t parse_limit(std::string_view text) {
  text = trim(text);
  std::ptrdiff_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    throw configuration_error("limit is not an integer: '" + std::string(text) +
                              "'");
  }
  if (value <= 0) {
    throw configuration_error("expected limit to be > 0, got " +
                              std::to_string(value));
  }
  return value;
}

jobs_config jobs_config::from_env() {
  jobs_config cfg;
  if (const char *limit = std::getenv("BGJOBS_LIMIT"))
    cfg.set("limit", limit);
  if (const char *level = std::getenv("BGJOBS_LOG_LEVEL"))
    cfg.set("log_level", level);
  return cfg;
}

bool jobs_config::load_from_file(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    return false;

  std::string line;
  while (std::getline(in, line)) {
    std::string_view s = trim(line);
    if (s.empty() || s.front() == '#' || s.front() == ';')
      continue;
    auto pos = s.find('=');
    if (pos == std::string_view::npos)
      continue;
    auto key = trim(s.substr(0, pos));
    if (key.empty())
      continue;
    set(key, trim(s.substr(pos + 1)));
  }
  return true;
}

void jobs_config::set(std::string_view key, std::string_view value) {
  if (key == "limit")
    limit = parse_limit(value);
  else if (key == "log_level")
    verbosity = parse_log_level(trim(value));
}

void jobs_config::validate() const {
  if (limit <= 0) {
    throw configuration_error("expected limit to be > 0, got " +
                              std::to_string(limit));
  }
}

void jobs_config::apply_logging() const { default_logger().set_level(verbosity); }

} // namespace bgjobs
