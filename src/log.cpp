#include "gitstore/log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace gitstore::log {

namespace {

Level level_from_env() {
  const char *v = std::getenv("GITSTORE_TRACE");
  if (v == nullptr) {
    return Level::Warn;
  }
  const std::string s{v};
  return (s == "1" || s == "true") ? Level::Trace : Level::Warn;
}

std::atomic<int> &current() {
  static std::atomic<int> lvl{static_cast<int>(level_from_env())};
  return lvl;
}

std::mutex &sink_mutex() {
  static std::mutex m;
  return m;
}

void emit(std::string_view component, std::string_view message) noexcept {
  try {
    const std::lock_guard lock(sink_mutex());
    std::cerr << "gitstore: " << component << ": " << message << "\n";
  } catch (const std::exception &) {
    // stderr is gone; nothing left to report to
  }
}

} // namespace

Level level() { return static_cast<Level>(current().load(std::memory_order_relaxed)); }

void set_level(Level lvl) { current().store(static_cast<int>(lvl), std::memory_order_relaxed); }

void warn(std::string_view component, std::string_view message) noexcept {
  if (level() >= Level::Warn) {
    emit(component, message);
  }
}

void trace(std::string_view component, std::string_view message) noexcept {
  if (level() >= Level::Trace) {
    emit(component, message);
  }
}

} // namespace gitstore::log
