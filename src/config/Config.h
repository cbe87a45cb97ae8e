#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging/Log.h"

namespace pairlink::config {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct BucketConfig {
    double capacity = 10.0;
    double refill_per_second = 1.0;
};

struct Config {
    std::string address = "127.0.0.1";
    unsigned short port = 3000;
    unsigned threads = 0;  // 0 => hardware concurrency

    std::string token_secret;
    std::int64_t token_leeway_seconds = 0;

    BucketConfig connection_rate{10.0, 1.0};
    BucketConfig message_rate{50.0, 20.0};

    unsigned idle_timeout_seconds = 60;
    std::size_t max_payload_bytes = 10 * 1024;
    std::size_t max_frame_bytes = 16 * 1024;
    std::size_t max_outbound_queue = 64;

    // Empty => no Origin check. "*" => any origin.
    std::vector<std::string> allowed_origins;

    log::Level log_level = log::Level::Info;

    bool origin_allowed(const std::string& origin) const;

    // Throws ConfigError on values the server cannot run with.
    void validate() const;
};

// Overlays keys present in the JSON document onto cfg.
void apply_json(Config& cfg, const std::string& json_text);
void apply_file(Config& cfg, const std::string& path);

// Reads PAIRLINK_* variables through getenv (injectable for tests).
using EnvLookup = const char* (*)(const char*);
void apply_env(Config& cfg, EnvLookup lookup);

struct CommandLine {
    std::string config_path;
    bool issue_token = false;
    std::string issue_subject;
    bool show_help = false;
};

// Applies --port/--address/--threads and returns the remaining switches.
CommandLine apply_args(Config& cfg, int argc, char* argv[]);

// Defaults -> --config file -> environment -> command line.
Config load(int argc, char* argv[], CommandLine& cli);

} // namespace pairlink::config
