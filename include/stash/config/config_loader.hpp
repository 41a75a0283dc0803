#pragma once

#include "stash/config/config.hpp"
#include "stash/core/environment.hpp"

#include <filesystem>
#include <optional>

namespace stash::config {

/*
  Loads UploaderConfig from a YAML file, then applies STASH_* environment
  overrides. Environment always wins over the file.

  Malformed YAML or a wrongly typed value throws std::runtime_error naming
  the file.
*/
class ConfigLoader {
public:
    static UploaderConfig load_from_yaml(const std::filesystem::path& path);

    /**
     * @brief Defaults, then the file if one is given and exists, then environment
     */
    static UploaderConfig load(const std::optional<std::filesystem::path>& path,
                               const EnvironmentLookup& env);

    static void apply_environment(UploaderConfig& config, const EnvironmentLookup& env);
};

} // namespace stash::config
