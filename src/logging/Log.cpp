#include "logging/Log.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace pairlink::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_mu;

const char* name_of(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

std::string timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace

void set_level(Level level) noexcept { g_level.store(level); }
Level level() noexcept { return g_level.load(); }

bool parse_level(std::string_view text, Level& out) noexcept {
    if (text == "debug") { out = Level::Debug; return true; }
    if (text == "info")  { out = Level::Info;  return true; }
    if (text == "warn")  { out = Level::Warn;  return true; }
    if (text == "error") { out = Level::Error; return true; }
    return false;
}

void write(Level lvl, std::string_view tag, const std::string& message) {
    if (lvl < g_level.load()) return;

    std::ostringstream line;
    line << timestamp() << " [" << name_of(lvl) << "] [" << tag << "] " << message << "\n";

    std::lock_guard<std::mutex> lk(g_mu);
    if (lvl == Level::Error) {
        std::cerr << line.str();
    } else {
        std::cout << line.str() << std::flush;
    }
}

} // namespace pairlink::log
