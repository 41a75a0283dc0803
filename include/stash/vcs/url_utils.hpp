#pragma once

#include <optional>
#include <string>

namespace stash::vcs {

/**
 * @brief Hosting service named by a repository URL
 *
 * Case-insensitive substring match, first hit wins: github, gitlab,
 * gitlab-self (any other URL containing "gitlab"), bitbucket, azure-repos,
 * gitea, forgejo, gogs, codeberg, sourceforge, sourcehut, aws-codecommit,
 * perforce, gitee, riouxsvn, assembla.
 */
std::optional<std::string> detect_host(const std::string& url);

/**
 * @brief Repository name from a clone/browse URL
 *
 * "https://github.com/acme/app.git" -> "app". Azure "/_git/NAME" and
 * Bitbucket "/scm/..." or "/projects/.../repos/NAME" forms are understood.
 */
std::optional<std::string> extract_repo_name(const std::string& url);

// Strips "refs/heads/", "origin/", "*/" and "*" prefixes, in that order
std::string normalize_branch(const std::string& branch);

/**
 * @brief Web URL of a commit, when the host's URL pattern is known
 *
 * host_type is the VCS kind ("git", "svn"); it decides between revision and
 * commit forms on hosts that serve both.
 */
std::optional<std::string> commit_url(const std::string& repo_url,
                                      const std::string& commit,
                                      const std::optional<std::string>& host_type);

} // namespace stash::vcs
