#include "pngstash/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace pngstash::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = ToLower(Get(name));
    if (value.empty()) {
        return default_value;
    }
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::optional<std::uint64_t> GetPositive(std::string_view name) {
    std::string raw = Get(name);
    if (raw.empty() || raw.size() > 19) {
        return std::nullopt;
    }
    std::uint64_t parsed = 0;
    for (char ch : raw) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        parsed = parsed * 10 + static_cast<std::uint64_t>(ch - '0');
    }
    if (parsed == 0) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace pngstash::env
