#include "execution_context.hpp"

#include <unistd.h>

#include <utility>

namespace bgjobs {

execution_context::execution_context(std::filesystem::path directory,
                                     environment_type environment)
    : directory_(std::move(directory)), environment_(std::move(environment)) {}

execution_context execution_context::capture() {
  environment_type env;
  for (char **entry = environ; entry && *entry; ++entry) {
    std::string_view kv(*entry);
    auto pos = kv.find('=');
    if (pos == std::string_view::npos || pos == 0)
      continue;
    env.emplace(std::string(kv.substr(0, pos)), std::string(kv.substr(pos + 1)));
  }
  return execution_context(std::filesystem::current_path(), std::move(env));
}

std::optional<std::string> execution_context::env(std::string_view name) const {
  auto it = environment_.find(name);
  if (it == environment_.end())
    return std::nullopt;
  return it->second;
}

std::filesystem::path
execution_context::resolve(const std::filesystem::path &path) const {
  if (path.is_absolute() || directory_.empty())
    return path.lexically_normal();
  return (directory_ / path).lexically_normal();
}

execution_context
execution_context::with_directory(const std::filesystem::path &directory) const {
  execution_context copy = *this;
  copy.directory_ = resolve(directory);
  return copy;
}

execution_context execution_context::with_env(std::string name,
                                              std::string value) const {
  execution_context copy = *this;
  copy.environment_.insert_or_assign(std::move(name), std::move(value));
  return copy;
}

execution_context execution_context::without_env(std::string_view name) const {
  execution_context copy = *this;
  auto it = copy.environment_.find(name);
  if (it != copy.environment_.end())
    copy.environment_.erase(it);
  return copy;
}

execution_context execution_context::with_print_commands(bool enabled) const {
  execution_context copy = *this;
  copy.print_commands_ = enabled;
  return copy;
}

execution_context execution_context::with_tracing(bool enabled) const {
  execution_context copy = *this;
  copy.tracing_ = enabled;
  return copy;
}

execution_context execution_context::with_errexit(bool enabled) const {
  execution_context copy = *this;
  copy.errexit_ = enabled;
  return copy;
}

} // namespace bgjobs
