#include "stash/config/config_loader.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>
#include <system_error>

namespace stash::config {
namespace fs = std::filesystem;

namespace {

template<typename T>
void read_scalar(const YAML::Node& section, const char* key, T& target) {
    const YAML::Node node = section[key];
    if (node && !node.IsNull()) {
        target = node.as<T>();
    }
}

void read_api(const YAML::Node& node, ApiConfig& api) {
    if (!node) {
        return;
    }
    read_scalar(node, "base_url", api.base_url);
    read_scalar(node, "key", api.api_key);
    read_scalar(node, "send_part_receipts", api.send_part_receipts);
}

void read_http(const YAML::Node& node, HttpConfig& http) {
    if (!node) {
        return;
    }
    read_scalar(node, "timeout_seconds", http.timeout_seconds);
    read_scalar(node, "connect_timeout_seconds", http.connect_timeout_seconds);
    read_scalar(node, "user_agent", http.user_agent);

    if (http.timeout_seconds < 0 || http.connect_timeout_seconds < 0) {
        throw std::runtime_error("http timeouts must not be negative");
    }
}

void read_logging(const YAML::Node& node, LoggingConfig& logging) {
    if (!node) {
        return;
    }
    read_scalar(node, "level", logging.level);
    read_scalar(node, "pattern", logging.pattern);
}

} // namespace

UploaderConfig ConfigLoader::load_from_yaml(const fs::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to load YAML config " + path.string() + ": " + e.what());
    }

    UploaderConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Invalid configuration " + path.string() + ": top level must be a mapping");
    }

    try {
        read_api(root["api"], config.api);
        read_http(root["http"], config.http);
        read_logging(root["logging"], config.logging);
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid configuration " + path.string() + ": " + e.what());
    }

    return config;
}

UploaderConfig ConfigLoader::load(const std::optional<fs::path>& path, const EnvironmentLookup& env) {
    UploaderConfig config;

    if (path) {
        std::error_code ec;
        if (fs::exists(*path, ec)) {
            config = load_from_yaml(*path);
        } else {
            spdlog::debug("Config file {} not found, using defaults", path->string());
        }
    }

    apply_environment(config, env);
    return config;
}

void ConfigLoader::apply_environment(UploaderConfig& config, const EnvironmentLookup& env) {
    if (auto key = first_non_blank(env, {"STASH_API_KEY"})) {
        config.api.api_key = *key;
    }
    if (auto url = first_non_blank(env, {"STASH_API_URL"})) {
        config.api.base_url = *url;
    }
    if (auto level = first_non_blank(env, {"STASH_LOG_LEVEL"})) {
        config.logging.level = *level;
    }
    if (auto pattern = first_non_blank(env, {"STASH_LOG_PATTERN"})) {
        config.logging.pattern = *pattern;
    }
}

} // namespace stash::config
