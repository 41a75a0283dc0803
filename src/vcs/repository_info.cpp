#include "stash/vcs/repository_info.hpp"

#include "stash/vcs/url_utils.hpp"

#include <spdlog/spdlog.h>

namespace stash::vcs {
namespace {

bool is_absent(const std::optional<std::string>& field) {
    return !field || is_blank(*field);
}

void fill_if_absent(std::optional<std::string>& field, const std::optional<std::string>& value) {
    if (is_absent(field) && value && !is_blank(*value)) {
        field = value;
    }
}

} // namespace

GitEnvironmentProvider::GitEnvironmentProvider(EnvironmentLookup env) : env_(std::move(env)) {}

std::optional<std::string> GitEnvironmentProvider::repo_url() const {
    return first_non_blank(env_, {"GIT_URL", "GIT_URL_1"});
}

std::optional<std::string> GitEnvironmentProvider::branch() const {
    auto raw = first_non_blank(env_, {"GIT_BRANCH", "GIT_LOCAL_BRANCH"});
    if (!raw) {
        return std::nullopt;
    }
    auto normalized = normalize_branch(*raw);
    if (is_blank(normalized)) {
        return std::nullopt;
    }
    return normalized;
}

std::optional<std::string> GitEnvironmentProvider::commit_id() const {
    return first_non_blank(env_, {"GIT_COMMIT"});
}

SubversionEnvironmentProvider::SubversionEnvironmentProvider(EnvironmentLookup env)
    : env_(std::move(env)) {}

std::optional<std::string> SubversionEnvironmentProvider::repo_url() const {
    return first_non_blank(env_, {"SVN_URL", "SVN_URL_1"});
}

std::optional<std::string> SubversionEnvironmentProvider::commit_id() const {
    return first_non_blank(env_, {"SVN_REVISION", "SVN_REV", "SVN_REVISION_NUMBER", "SVN_VERSION"});
}

std::unique_ptr<RepositoryInfoProvider> detect_provider(const EnvironmentLookup& env) {
    auto git = std::make_unique<GitEnvironmentProvider>(env);
    if (git->repo_url()) {
        return git;
    }
    auto svn = std::make_unique<SubversionEnvironmentProvider>(env);
    if (svn->repo_url()) {
        return svn;
    }
    return nullptr;
}

void apply_repository_info(const RepositoryInfoProvider& provider, upload::UploadMetadata& metadata) {
    const auto url = provider.repo_url();
    if (url) {
        fill_if_absent(metadata.vc_host_type, provider.host_type());
        fill_if_absent(metadata.vc_host, detect_host(*url));
        fill_if_absent(metadata.vc_repo_name, extract_repo_name(*url));
        fill_if_absent(metadata.vc_repo_url, url);
    }

    fill_if_absent(metadata.vc_branch, provider.branch());
    fill_if_absent(metadata.vc_commit_sha, provider.commit_id());

    if (is_absent(metadata.vc_commit_url) && !is_absent(metadata.vc_repo_url) &&
        !is_absent(metadata.vc_commit_sha)) {
        fill_if_absent(metadata.vc_commit_url,
                       commit_url(*metadata.vc_repo_url, *metadata.vc_commit_sha, metadata.vc_host_type));
    }

    spdlog::debug("Version control: type={} host={} repo={} branch={} commit={}",
                  metadata.vc_host_type.value_or("-"), metadata.vc_host.value_or("-"),
                  metadata.vc_repo_name.value_or("-"), metadata.vc_branch.value_or("-"),
                  metadata.vc_commit_sha.value_or("-"));
}

} // namespace stash::vcs
