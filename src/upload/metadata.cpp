#include "stash/upload/metadata.hpp"

#include <cstdio>
#include <optional>

namespace stash::upload {
namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool is_list_separator(char c) {
    return c == ',' || c == '\r' || c == '\n';
}

void fill_if_absent(std::optional<std::string>& field, const std::optional<std::string>& value) {
    if ((!field || is_blank(*field)) && value) {
        field = value;
    }
}

} // namespace

Result<void> validate_metadata(const UploadMetadata& metadata) {
    if (is_blank(metadata.primary_file_path)) {
        return Err<void>(Error::validation("Primary file path is required"));
    }
    if (is_blank(metadata.version_major)) {
        return Err<void>(Error::validation("Major version component is required"));
    }
    if (is_blank(metadata.version_minor)) {
        return Err<void>(Error::validation("Minor version component is required"));
    }
    if (is_blank(metadata.version_patch)) {
        return Err<void>(Error::validation("Patch version component is required"));
    }
    if (is_blank(metadata.platform)) {
        return Err<void>(Error::validation("Platform is required"));
    }
    if (is_blank(metadata.stream)) {
        return Err<void>(Error::validation("Stream is required"));
    }
    if (metadata.expansion_file_path && is_blank(*metadata.expansion_file_path)) {
        return Err<void>(Error::validation("Expansion file path must not be blank when given"));
    }
    return Ok();
}

Result<void> validate_api_key(const std::string& api_key) {
    if (is_blank(api_key)) {
        return Err<void>(Error::validation("API key is required"));
    }
    return Ok();
}

std::vector<std::string> parse_list(const std::string& text) {
    std::vector<std::string> items;
    std::string current;

    auto flush = [&]() {
        auto item = trim(current);
        if (!item.empty()) {
            items.push_back(std::move(item));
        }
        current.clear();
    };

    for (char c : text) {
        if (is_list_separator(c)) {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return items;
}

std::string format_build_duration(std::int64_t duration_ms) {
    if (duration_ms < 0) {
        duration_ms = 0;
    }
    const auto total_seconds = duration_ms / 1000;
    const auto hours = total_seconds / 3600;
    const auto minutes = (total_seconds % 3600) / 60;
    const auto seconds = total_seconds % 60;

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld",
                  static_cast<long long>(hours),
                  static_cast<long long>(minutes),
                  static_cast<long long>(seconds));
    return buffer;
}

void apply_ci_environment(UploadMetadata& metadata, const EnvironmentLookup& env,
                          const std::string& fallback_source) {
    fill_if_absent(metadata.ci_pipeline, first_non_blank(env, {"JOB_NAME"}));
    fill_if_absent(metadata.ci_run_id, first_non_blank(env, {"BUILD_NUMBER"}));
    fill_if_absent(metadata.ci_run_url, first_non_blank(env, {"BUILD_URL"}));
    fill_if_absent(metadata.ci_pipeline_url, first_non_blank(env, {"JOB_URL"}));

    if (!metadata.source || is_blank(*metadata.source)) {
        metadata.source = first_non_blank(env, {"JENKINS_URL"}) ? std::string("jenkins")
                                                                 : fallback_source;
    }
}

} // namespace stash::upload
