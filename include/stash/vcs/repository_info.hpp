#pragma once

#include "stash/core/environment.hpp"
#include "stash/upload/types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace stash::vcs {

/**
 * @brief Source-control facts about the checkout being built
 *
 * One implementation per supported system. Every value is optional: a
 * provider reports only what its environment actually exposes.
 */
class RepositoryInfoProvider {
public:
    virtual ~RepositoryInfoProvider() = default;

    /// VCS kind sent as vc_host_type ("git", "svn")
    virtual std::string host_type() const = 0;
    virtual std::optional<std::string> repo_url() const = 0;
    virtual std::optional<std::string> branch() const = 0;
    virtual std::optional<std::string> commit_id() const = 0;
};

/**
 * @brief Git checkout described by GIT_URL, GIT_BRANCH and GIT_COMMIT
 *
 * The branch is normalized ("origin/main" -> "main").
 */
class GitEnvironmentProvider : public RepositoryInfoProvider {
public:
    explicit GitEnvironmentProvider(EnvironmentLookup env);

    std::string host_type() const override { return "git"; }
    std::optional<std::string> repo_url() const override;
    std::optional<std::string> branch() const override;
    std::optional<std::string> commit_id() const override;

private:
    EnvironmentLookup env_;
};

/**
 * @brief Subversion working copy described by SVN_URL and a revision variable
 *
 * The revision is the first non-blank of SVN_REVISION, SVN_REV,
 * SVN_REVISION_NUMBER and SVN_VERSION. Subversion exposes no branch.
 */
class SubversionEnvironmentProvider : public RepositoryInfoProvider {
public:
    explicit SubversionEnvironmentProvider(EnvironmentLookup env);

    std::string host_type() const override { return "svn"; }
    std::optional<std::string> repo_url() const override;
    std::optional<std::string> branch() const override { return std::nullopt; }
    std::optional<std::string> commit_id() const override;

private:
    EnvironmentLookup env_;
};

/**
 * @brief First provider (Git, then Subversion) whose repository URL is set
 */
std::unique_ptr<RepositoryInfoProvider> detect_provider(const EnvironmentLookup& env);

/**
 * @brief Fill the vc_* fields of `metadata` that are absent or blank
 *
 * Host, repository name and commit URL are derived from the repository URL.
 * Values the caller already set are never overwritten.
 */
void apply_repository_info(const RepositoryInfoProvider& provider, upload::UploadMetadata& metadata);

} // namespace stash::vcs
