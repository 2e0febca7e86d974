#pragma once
#include <string_view>

namespace gitstore::log {

enum class Level : int { Off = 0, Warn = 1, Trace = 2 };

// Initial level: Trace if GITSTORE_TRACE is "1" or "true", Warn otherwise.
Level level();
void set_level(Level lvl);

// Write "gitstore: <component>: <message>" to stderr if enabled. Never throws.
void warn(std::string_view component, std::string_view message) noexcept;
void trace(std::string_view component, std::string_view message) noexcept;

inline bool tracing() { return level() >= Level::Trace; }

} // namespace gitstore::log
