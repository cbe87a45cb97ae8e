#pragma once

#include <string>
#include <string_view>

namespace pairlink::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_level(Level level) noexcept;
Level level() noexcept;

// "debug" | "info" | "warn" | "error"; returns false on anything else.
bool parse_level(std::string_view text, Level& out) noexcept;

void write(Level level, std::string_view tag, const std::string& message);

inline void debug(std::string_view tag, const std::string& message) { write(Level::Debug, tag, message); }
inline void info(std::string_view tag, const std::string& message)  { write(Level::Info, tag, message); }
inline void warn(std::string_view tag, const std::string& message)  { write(Level::Warn, tag, message); }
inline void error(std::string_view tag, const std::string& message) { write(Level::Error, tag, message); }

} // namespace pairlink::log
