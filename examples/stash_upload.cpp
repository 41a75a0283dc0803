#include "stash/config/config_loader.hpp"
#include "stash/core/environment.hpp"
#include "stash/core/logging.hpp"
#include "stash/events/components.hpp"
#include "stash/events/event_bus.hpp"
#include "stash/network/curl_transport.hpp"
#include "stash/upload/metadata.hpp"
#include "stash/upload/orchestrator.hpp"
#include "stash/upload/result_log.hpp"
#include "stash/vcs/repository_info.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* program) {
    std::cerr
        << "Usage: " << program << " --file PATH --version-major N --version-minor N\n"
        << "       --version-patch N --platform NAME --stream NAME [options]\n\n"
        << "Upload options:\n"
        << "  --expansion-file PATH      secondary artifact uploaded with the primary\n"
        << "  --structure NAME           upload structure (default: file)\n"
        << "  --version-extra TEXT       --version-meta TEXT\n"
        << "  --custom-build-number TEXT\n"
        << "  --notes TEXT\n"
        << "  --labels LIST              comma- or newline-separated\n"
        << "  --architectures LIST       comma- or newline-separated\n\n"
        << "Attribution (defaults come from the CI environment):\n"
        << "  --source NAME              --ci-pipeline NAME   --ci-run-id ID\n"
        << "  --ci-run-url URL           --ci-pipeline-url URL\n"
        << "  --build-duration-ms N      formatted as HH:MM:SS\n"
        << "  --vc-repo-url URL          --vc-branch NAME     --vc-commit-sha SHA\n"
        << "  --no-vcs-detect            do not read GIT_*/SVN_* variables\n\n"
        << "Service:\n"
        << "  --config PATH              YAML configuration file\n"
        << "  --api-key KEY              overrides STASH_API_KEY and the config file\n"
        << "  --api-url URL              overrides STASH_API_URL and the config file\n"
        << "  --json                     print the result as JSON\n"
        << "  -h, --help\n";
}

struct CliOptions {
    stash::upload::UploadMetadata metadata;
    std::optional<fs::path> config_path;
    std::optional<std::string> api_key;
    std::optional<std::string> api_url;
    std::optional<std::int64_t> build_duration_ms;
    bool detect_vcs = true;
    bool json_output = false;
    bool help = false;
};

/**
 * @brief Parse argv into CliOptions
 *
 * Throws std::invalid_argument on an unknown flag or a missing value.
 */
CliOptions parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    auto& m = options.metadata;

    using Setter = std::function<void(const std::string&)>;
    const std::map<std::string, Setter> valued = {
        {"--file", [&](const std::string& v) { m.primary_file_path = v; }},
        {"--expansion-file", [&](const std::string& v) { m.expansion_file_path = v; }},
        {"--structure", [&](const std::string& v) { m.structure = v; }},
        {"--version-major", [&](const std::string& v) { m.version_major = v; }},
        {"--version-minor", [&](const std::string& v) { m.version_minor = v; }},
        {"--version-patch", [&](const std::string& v) { m.version_patch = v; }},
        {"--version-extra", [&](const std::string& v) { m.version_extra = v; }},
        {"--version-meta", [&](const std::string& v) { m.version_meta = v; }},
        {"--custom-build-number", [&](const std::string& v) { m.custom_build_number = v; }},
        {"--platform", [&](const std::string& v) { m.platform = v; }},
        {"--stream", [&](const std::string& v) { m.stream = v; }},
        {"--notes", [&](const std::string& v) { m.notes = v; }},
        {"--labels", [&](const std::string& v) { m.labels = stash::upload::parse_list(v); }},
        {"--architectures", [&](const std::string& v) { m.architectures = stash::upload::parse_list(v); }},
        {"--source", [&](const std::string& v) { m.source = v; }},
        {"--ci-pipeline", [&](const std::string& v) { m.ci_pipeline = v; }},
        {"--ci-run-id", [&](const std::string& v) { m.ci_run_id = v; }},
        {"--ci-run-url", [&](const std::string& v) { m.ci_run_url = v; }},
        {"--ci-pipeline-url", [&](const std::string& v) { m.ci_pipeline_url = v; }},
        {"--build-duration-ms", [&](const std::string& v) { options.build_duration_ms = std::stoll(v); }},
        {"--vc-repo-url", [&](const std::string& v) { m.vc_repo_url = v; }},
        {"--vc-branch", [&](const std::string& v) { m.vc_branch = v; }},
        {"--vc-commit-sha", [&](const std::string& v) { m.vc_commit_sha = v; }},
        {"--config", [&](const std::string& v) { options.config_path = fs::path(v); }},
        {"--api-key", [&](const std::string& v) { options.api_key = v; }},
        {"--api-url", [&](const std::string& v) { options.api_url = v; }},
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--json") {
            options.json_output = true;
        } else if (arg == "--no-vcs-detect") {
            options.detect_vcs = false;
        } else if (auto it = valued.find(arg); it != valued.end()) {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            it->second(argv[++i]);
        } else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return options;
}

void print_record(const stash::upload::ArtifactRecord& record) {
    std::cout << "Upload complete: " << record.message << "\n"
              << "  Build ID:           " << record.build_id << "\n"
              << "  Build info URL:     " << record.build_info_url << "\n"
              << "  Download URL:       " << record.download_url << "\n"
              << "  Pending processing: " << (record.pending_processing ? "yes" : "no") << "\n";
    if (record.platform_short_name) {
        std::cout << "  Platform:           " << *record.platform_short_name << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CliOptions options;
    try {
        options = parse_arguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n\n";
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (options.help) {
        print_usage(argv[0]);
        return kExitSuccess;
    }

    const auto env = stash::process_environment();

    stash::config::UploaderConfig config;
    try {
        config = stash::config::ConfigLoader::load(options.config_path, env);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return kExitUsage;
    }
    if (options.api_key) {
        config.api.api_key = *options.api_key;
    }
    if (options.api_url) {
        config.api.base_url = *options.api_url;
    }

    stash::init_logging(config.logging);

    auto& metadata = options.metadata;
    stash::upload::apply_ci_environment(metadata, env);
    if (options.build_duration_ms && !metadata.ci_build_duration) {
        metadata.ci_build_duration = stash::upload::format_build_duration(*options.build_duration_ms);
    }
    if (options.detect_vcs) {
        if (auto provider = stash::vcs::detect_provider(env)) {
            stash::vcs::apply_repository_info(*provider, metadata);
        }
    }

    stash::events::EventBus event_bus;
    stash::events::LoggerComponent logger(event_bus);
    stash::events::MetricsComponent metrics(event_bus);

    stash::network::CurlTransport::Options transport_options;
    transport_options.timeout_seconds = config.http.timeout_seconds;
    transport_options.connect_timeout_seconds = config.http.connect_timeout_seconds;
    transport_options.user_agent = config.http.user_agent;
    stash::network::CurlTransport transport(transport_options);

    stash::upload::UploadOrchestrator orchestrator(transport, config.api, event_bus);
    stash::upload::UploadResultLog results;

    auto result = orchestrator.upload(metadata);
    metrics.print_stats();

    if (result.is_error()) {
        const auto& error = result.error();
        spdlog::error("{}", error.describe());
        stash::shutdown_logging();
        return error.kind == stash::ErrorKind::Validation ? kExitUsage : kExitFailure;
    }

    results.append(result.value());
    if (options.json_output) {
        std::cout << results.to_json().dump(2) << "\n";
    } else {
        print_record(result.value());
    }

    stash::shutdown_logging();
    return kExitSuccess;
}
