#pragma once

#include "stash/core/environment.hpp"
#include "stash/core/result.hpp"
#include "stash/upload/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stash::upload {

/**
 * @brief Check required fields (primary file, major/minor/patch, platform, stream)
 *
 * Blank means empty or whitespace only. Runs before any network call.
 */
Result<void> validate_metadata(const UploadMetadata& metadata);

Result<void> validate_api_key(const std::string& api_key);

/**
 * @brief Split a comma- or newline-separated list, trimming entries and dropping empties
 */
std::vector<std::string> parse_list(const std::string& text);

/**
 * @brief Milliseconds to "HH:MM:SS" (hours are not wrapped at 24)
 */
std::string format_build_duration(std::int64_t duration_ms);

/**
 * @brief Fill CI attribution fields from Jenkins-style environment variables
 *
 * JOB_NAME, BUILD_NUMBER, BUILD_URL and JOB_URL map to ci_pipeline, ci_run_id,
 * ci_run_url and ci_pipeline_url. Fields already set are left alone. `source`
 * becomes "jenkins" when JENKINS_URL is present, otherwise `fallback_source`.
 */
void apply_ci_environment(UploadMetadata& metadata, const EnvironmentLookup& env,
                          const std::string& fallback_source = "cli");

} // namespace stash::upload
