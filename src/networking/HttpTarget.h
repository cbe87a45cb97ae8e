#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace pairlink::networking {

// Request target split into a path and decoded query parameters.
struct HttpTarget {
    std::string path;
    std::unordered_map<std::string, std::string> query;

    const std::string* param(const std::string& key) const {
        auto it = query.find(key);
        return it == query.end() ? nullptr : &it->second;
    }
};

// Returns false for targets that are not origin-form or carry bad escapes.
bool parse_target(std::string_view target, HttpTarget& out);

// "Bearer <token>" -> token; anything else -> empty.
std::string bearer_token(std::string_view authorization);

} // namespace pairlink::networking
