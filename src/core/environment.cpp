#include "stash/core/environment.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <utility>

namespace stash {

EnvironmentLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

EnvironmentLookup fixed_environment(std::map<std::string, std::string> values) {
    auto shared = std::make_shared<const std::map<std::string, std::string>>(std::move(values));
    return [shared](const std::string& name) -> std::optional<std::string> {
        auto it = shared->find(name);
        if (it == shared->end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

std::optional<std::string> first_non_blank(const EnvironmentLookup& env,
                                           std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto value = env(name);
        if (value && !is_blank(*value)) {
            return value;
        }
    }
    return std::nullopt;
}

bool is_blank(const std::string& value) noexcept {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace stash
