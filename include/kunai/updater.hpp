#pragma once

#include <kunai/git.hpp>
#include <kunai/result.hpp>
#include <kunai/source.hpp>
#include <kunai/url.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kunai {

// "https://github.com/owner/repo/archive/v{version}.tar.gz" -> "https://github.com/owner/repo"
// Fails with InvalidUrl, UrlNoBase or InsufficientPathSegments.
Result<Url> infer_git_url(const std::string& artifact_url_template);

// An explicit repository URL always wins over the inferred one
Result<Url> resolve_repo_url(const std::optional<Url>& explicit_url,
                             const std::string& artifact_url_template);

// Last tag (in the given, ascending order) that starts with `prefix`
// immediately followed by an ASCII digit, with the prefix stripped.
// Fails with NoTagsFitFilter.
Result<std::string> select_latest_tag(const std::vector<std::string>& tags,
                                      const std::string& prefix);

// Commit of "refs/heads/<branch>", else of the first ref whose last path
// segment equals `branch`. Fails with BranchNotFound.
Result<std::string> find_branch_commit(const std::vector<RemoteBranch>& branches,
                                       const std::string& branch);

// "<branch>-<first short_hash_length chars of commit>"
std::string branch_version(const std::string& branch, const std::string& commit,
                           int short_hash_length);

// Errors a batch update isolates to one source: the repository URL cannot be
// determined, or no tag fits the prefix filter.
bool is_recoverable_resolve_error(const KunaiError& e);

// Computes the candidate "latest version" of a source under its update scheme
class VersionResolver {
public:
    explicit VersionResolver(RefLister& refs) : refs_(refs) {}

    Result<std::string> latest_version(const Source& source);

    Result<std::string> resolve(const GitTagsScheme& scheme, const Source& source);
    Result<std::string> resolve(const GitBranchScheme& scheme, const Source& source);
    Result<std::string> resolve(const StaticScheme& scheme, const Source& source);

private:
    RefLister& refs_;
};

} // namespace kunai
