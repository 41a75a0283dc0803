#include "stash/vcs/url_utils.hpp"

#include "stash/core/environment.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>
#include <vector>

namespace stash::vcs {
namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool strip_prefix(std::string& value, const std::string& prefix) {
    if (value.rfind(prefix, 0) == 0) {
        value.erase(0, prefix.size());
        return true;
    }
    return false;
}

void strip_git_suffix(std::string& value) {
    if (ends_with(value, ".git")) {
        value.erase(value.size() - 4);
    }
}

void strip_trailing_slashes(std::string& value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
}

bool is_numeric(const std::string& value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                segments.push_back(std::move(current));
            }
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    return segments;
}

// Path component of an URL; scp-style "user@host:path" is returned whole
std::string path_of(const std::string& url) {
    const auto scheme = url.find("://");
    if (scheme == std::string::npos) {
        return url;
    }
    const auto slash = url.find('/', scheme + 3);
    return slash == std::string::npos ? std::string{} : url.substr(slash + 1);
}

// Ordered: the first matching needle decides the host
const std::array<std::pair<const char*, const char*>, 19> kHostPatterns = {{
    {"github.com", "github"},
    {"gitlab.com", "gitlab"},
    {"gitlab", "gitlab-self"},
    {"bitbucket.org", "bitbucket"},
    {"azure.com", "azure-repos"},
    {"visualstudio.com", "azure-repos"},
    {"gitea", "gitea"},
    {"forgejo", "forgejo"},
    {"gogs", "gogs"},
    {"codeberg", "codeberg"},
    {"sourceforge.net", "sourceforge"},
    {"sourceforge.com", "sourceforge"},
    {"sourcehut", "sourcehut"},
    {"sr.ht", "sourcehut"},
    {"codecommit", "aws-codecommit"},
    {"perforce", "perforce"},
    {"gitee", "gitee"},
    {"riouxsvn", "riouxsvn"},
    {"assembla.com", "assembla"},
}};

} // namespace

std::optional<std::string> detect_host(const std::string& url) {
    if (is_blank(url)) {
        return std::nullopt;
    }

    const auto lower = to_lower(url);
    for (const auto& [needle, host] : kHostPatterns) {
        if (contains(lower, needle)) {
            return std::string(host);
        }
    }
    return std::nullopt;
}

std::optional<std::string> extract_repo_name(const std::string& url) {
    if (is_blank(url)) {
        return std::nullopt;
    }

    std::string trimmed = url;
    strip_git_suffix(trimmed);
    const auto query = trimmed.find_first_of("?#");
    if (query != std::string::npos) {
        trimmed.erase(query);
    }
    strip_trailing_slashes(trimmed);
    strip_git_suffix(trimmed);

    const auto segments = split_path(path_of(trimmed));
    if (segments.empty()) {
        return std::nullopt;
    }

    const auto host = detect_host(url);
    const auto lower = to_lower(url);

    if (host == "azure-repos" && contains(lower, "/_git/")) {
        for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
            if (to_lower(segments[i]) == "_git") {
                return segments[i + 1];
            }
        }
    }

    if (host == "bitbucket" && (contains(lower, "/scm/") || contains(lower, "/projects/"))) {
        for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
            const auto part = to_lower(*it);
            if (part != "scm" && part != "projects" && part != "repos") {
                return *it;
            }
        }
    }

    return segments.back();
}

std::string normalize_branch(const std::string& branch) {
    std::string name = branch;
    strip_prefix(name, "refs/heads/");
    strip_prefix(name, "origin/");
    strip_prefix(name, "*/");
    strip_prefix(name, "*");
    return name;
}

std::optional<std::string> commit_url(const std::string& repo_url,
                                      const std::string& commit,
                                      const std::optional<std::string>& host_type) {
    if (is_blank(repo_url) || is_blank(commit)) {
        return std::nullopt;
    }

    const auto host = detect_host(repo_url);
    if (!host) {
        return std::nullopt;
    }

    std::string base = repo_url;
    strip_git_suffix(base);
    strip_trailing_slashes(base);

    if (*host == "gitlab" || *host == "gitlab-self") {
        return base + "/-/commit/" + commit;
    }
    if (*host == "bitbucket") {
        return base + "/commits/" + commit;
    }
    if (*host == "github" || *host == "gitea" || *host == "forgejo" || *host == "gogs" ||
        *host == "codeberg" || *host == "sourcehut" || *host == "azure-repos" || *host == "gitee") {
        return base + "/commit/" + commit;
    }
    if (*host == "sourceforge") {
        const bool revision = is_numeric(commit) || (host_type && *host_type == "svn");
        return revision ? base + "/" + commit + "/" : base + "/ci/" + commit + "/";
    }

    // perforce, riouxsvn, assembla, aws-codecommit: no stable web pattern
    return std::nullopt;
}

} // namespace stash::vcs
