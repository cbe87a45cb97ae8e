#include "config/Config.h"

#include <boost/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace pairlink::config {

namespace json = boost::json;

namespace {

unsigned long long to_unsigned(const std::string& what, const std::string& text) {
    std::size_t used = 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(text, &used);
    } catch (const std::exception&) {
        throw ConfigError(what + ": not a number: " + text);
    }
    if (used != text.size() || text.empty() || text[0] == '-') {
        throw ConfigError(what + ": not a number: " + text);
    }
    return v;
}

double to_double(const std::string& what, const std::string& text) {
    std::size_t used = 0;
    double v = 0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception&) {
        throw ConfigError(what + ": not a number: " + text);
    }
    if (used != text.size()) throw ConfigError(what + ": not a number: " + text);
    return v;
}

unsigned short to_port(const std::string& what, unsigned long long v) {
    if (v == 0 || v > 65535) throw ConfigError(what + ": port out of range");
    return static_cast<unsigned short>(v);
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto b = item.find_first_not_of(" \t");
        auto e = item.find_last_not_of(" \t");
        if (b == std::string::npos) continue;
        out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}

log::Level to_level(const std::string& what, const std::string& text) {
    log::Level lvl{};
    if (!log::parse_level(text, lvl)) throw ConfigError(what + ": unknown log level: " + text);
    return lvl;
}

// --- JSON helpers ---

unsigned long long json_unsigned(const json::value& v, const char* key) {
    if (auto* p = v.if_uint64()) return *p;
    if (auto* p = v.if_int64()) {
        if (*p < 0) throw ConfigError(std::string(key) + ": must not be negative");
        return static_cast<unsigned long long>(*p);
    }
    throw ConfigError(std::string(key) + ": expected an integer");
}

double json_number(const json::value& v, const char* key) {
    if (v.is_number()) return v.to_number<double>();
    throw ConfigError(std::string(key) + ": expected a number");
}

std::string json_string(const json::value& v, const char* key) {
    if (auto* s = v.if_string()) return std::string(*s);
    throw ConfigError(std::string(key) + ": expected a string");
}

void json_bucket(BucketConfig& b, const json::value& v, const char* key) {
    auto* obj = v.if_object();
    if (!obj) throw ConfigError(std::string(key) + ": expected an object");
    if (auto* c = obj->if_contains("capacity")) b.capacity = json_number(*c, "capacity");
    if (auto* r = obj->if_contains("refill_per_second")) b.refill_per_second = json_number(*r, "refill_per_second");
}

} // namespace

bool Config::origin_allowed(const std::string& origin) const {
    if (allowed_origins.empty()) return true;
    for (const auto& o : allowed_origins) {
        if (o == "*" || o == origin) return true;
    }
    return false;
}

void Config::validate() const {
    if (token_secret.empty()) throw ConfigError("token_secret must be set");
    if (port == 0) throw ConfigError("port must be non-zero");
    if (connection_rate.capacity < 1.0 || message_rate.capacity < 1.0) {
        throw ConfigError("rate limiter capacity must be at least 1");
    }
    if (connection_rate.refill_per_second < 0.0 || message_rate.refill_per_second < 0.0) {
        throw ConfigError("rate limiter refill must not be negative");
    }
    if (idle_timeout_seconds == 0) throw ConfigError("idle_timeout_seconds must be non-zero");
    if (max_payload_bytes == 0) throw ConfigError("max_payload_bytes must be non-zero");
    if (max_frame_bytes < max_payload_bytes) throw ConfigError("max_frame_bytes must be >= max_payload_bytes");
    if (max_outbound_queue == 0) throw ConfigError("max_outbound_queue must be non-zero");
    if (token_leeway_seconds < 0) throw ConfigError("token_leeway_seconds must not be negative");
}

void apply_json(Config& cfg, const std::string& json_text) {
    json::error_code ec;
    json::value root = json::parse(json_text, ec);
    if (ec) throw ConfigError("config: invalid json: " + ec.message());

    auto* obj = root.if_object();
    if (!obj) throw ConfigError("config: top level must be an object");

    if (auto* v = obj->if_contains("address")) cfg.address = json_string(*v, "address");
    if (auto* v = obj->if_contains("port")) cfg.port = to_port("port", json_unsigned(*v, "port"));
    if (auto* v = obj->if_contains("threads")) cfg.threads = static_cast<unsigned>(json_unsigned(*v, "threads"));
    if (auto* v = obj->if_contains("token_secret")) cfg.token_secret = json_string(*v, "token_secret");
    if (auto* v = obj->if_contains("token_leeway_seconds")) {
        cfg.token_leeway_seconds = static_cast<std::int64_t>(json_unsigned(*v, "token_leeway_seconds"));
    }
    if (auto* v = obj->if_contains("connection_rate")) json_bucket(cfg.connection_rate, *v, "connection_rate");
    if (auto* v = obj->if_contains("message_rate")) json_bucket(cfg.message_rate, *v, "message_rate");
    if (auto* v = obj->if_contains("idle_timeout_seconds")) {
        cfg.idle_timeout_seconds = static_cast<unsigned>(json_unsigned(*v, "idle_timeout_seconds"));
    }
    if (auto* v = obj->if_contains("max_payload_bytes")) cfg.max_payload_bytes = json_unsigned(*v, "max_payload_bytes");
    if (auto* v = obj->if_contains("max_frame_bytes")) cfg.max_frame_bytes = json_unsigned(*v, "max_frame_bytes");
    if (auto* v = obj->if_contains("max_outbound_queue")) cfg.max_outbound_queue = json_unsigned(*v, "max_outbound_queue");
    if (auto* v = obj->if_contains("allowed_origins")) {
        auto* arr = v->if_array();
        if (!arr) throw ConfigError("allowed_origins: expected an array");
        cfg.allowed_origins.clear();
        for (const auto& o : *arr) cfg.allowed_origins.push_back(json_string(o, "allowed_origins"));
    }
    if (auto* v = obj->if_contains("log_level")) cfg.log_level = to_level("log_level", json_string(*v, "log_level"));
}

void apply_file(Config& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("config: cannot open " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    apply_json(cfg, ss.str());
}

void apply_env(Config& cfg, EnvLookup lookup) {
    auto get = [&](const char* name) -> const char* {
        const char* v = lookup(name);
        return (v && *v) ? v : nullptr;
    };

    if (auto v = get("PAIRLINK_ADDRESS")) cfg.address = v;
    if (auto v = get("PAIRLINK_PORT")) cfg.port = to_port("PAIRLINK_PORT", to_unsigned("PAIRLINK_PORT", v));
    if (auto v = get("PAIRLINK_THREADS")) cfg.threads = static_cast<unsigned>(to_unsigned("PAIRLINK_THREADS", v));
    if (auto v = get("PAIRLINK_TOKEN_SECRET")) cfg.token_secret = v;
    if (auto v = get("PAIRLINK_TOKEN_LEEWAY_SECONDS")) {
        cfg.token_leeway_seconds = static_cast<std::int64_t>(to_unsigned("PAIRLINK_TOKEN_LEEWAY_SECONDS", v));
    }
    if (auto v = get("PAIRLINK_CONNECTION_RATE_CAPACITY")) {
        cfg.connection_rate.capacity = to_double("PAIRLINK_CONNECTION_RATE_CAPACITY", v);
    }
    if (auto v = get("PAIRLINK_CONNECTION_RATE_REFILL")) {
        cfg.connection_rate.refill_per_second = to_double("PAIRLINK_CONNECTION_RATE_REFILL", v);
    }
    if (auto v = get("PAIRLINK_MESSAGE_RATE_CAPACITY")) {
        cfg.message_rate.capacity = to_double("PAIRLINK_MESSAGE_RATE_CAPACITY", v);
    }
    if (auto v = get("PAIRLINK_MESSAGE_RATE_REFILL")) {
        cfg.message_rate.refill_per_second = to_double("PAIRLINK_MESSAGE_RATE_REFILL", v);
    }
    if (auto v = get("PAIRLINK_IDLE_TIMEOUT_SECONDS")) {
        cfg.idle_timeout_seconds = static_cast<unsigned>(to_unsigned("PAIRLINK_IDLE_TIMEOUT_SECONDS", v));
    }
    if (auto v = get("PAIRLINK_MAX_PAYLOAD_BYTES")) cfg.max_payload_bytes = to_unsigned("PAIRLINK_MAX_PAYLOAD_BYTES", v);
    if (auto v = get("PAIRLINK_MAX_FRAME_BYTES")) cfg.max_frame_bytes = to_unsigned("PAIRLINK_MAX_FRAME_BYTES", v);
    if (auto v = get("PAIRLINK_MAX_OUTBOUND_QUEUE")) {
        cfg.max_outbound_queue = to_unsigned("PAIRLINK_MAX_OUTBOUND_QUEUE", v);
    }
    if (auto v = get("PAIRLINK_ALLOWED_ORIGINS")) cfg.allowed_origins = split_list(v);
    if (auto v = get("PAIRLINK_LOG_LEVEL")) cfg.log_level = to_level("PAIRLINK_LOG_LEVEL", v);
}

CommandLine apply_args(Config& cfg, int argc, char* argv[]) {
    CommandLine cli;

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw ConfigError(flag + ": missing value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            cli.config_path = value_of(i, arg);
        } else if (arg == "--port") {
            cfg.port = to_port(arg, to_unsigned(arg, value_of(i, arg)));
        } else if (arg == "--address") {
            cfg.address = value_of(i, arg);
        } else if (arg == "--threads") {
            cfg.threads = static_cast<unsigned>(to_unsigned(arg, value_of(i, arg)));
        } else if (arg == "--issue-token") {
            cli.issue_token = true;
            cli.issue_subject = value_of(i, arg);
        } else if (arg == "--help" || arg == "-h") {
            cli.show_help = true;
        } else {
            throw ConfigError("unknown argument: " + arg);
        }
    }
    return cli;
}

Config load(int argc, char* argv[], CommandLine& cli) {
    Config cfg;

    // First pass only to learn --config; the later passes re-apply flags on top.
    Config scratch;
    cli = apply_args(scratch, argc, argv);

    if (!cli.config_path.empty()) apply_file(cfg, cli.config_path);
    apply_env(cfg, [](const char* name) -> const char* { return std::getenv(name); });
    apply_args(cfg, argc, argv);
    return cfg;
}

} // namespace pairlink::config
