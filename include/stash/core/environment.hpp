#pragma once

#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>

namespace stash {

/**
 * @brief Read-only view of environment variables
 *
 * Returns std::nullopt when the variable is unset. Components take a lookup
 * instead of calling getenv so tests can supply a fixed map.
 */
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

EnvironmentLookup process_environment();

EnvironmentLookup fixed_environment(std::map<std::string, std::string> values);

/**
 * @brief First non-blank value among the given variable names
 */
std::optional<std::string> first_non_blank(const EnvironmentLookup& env,
                                           std::initializer_list<const char*> names);

bool is_blank(const std::string& value) noexcept;

} // namespace stash
