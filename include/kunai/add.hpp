#pragma once

#include <kunai/git.hpp>
#include <kunai/prefetch.hpp>
#include <kunai/result.hpp>
#include <kunai/source.hpp>

#include <optional>
#include <string>

namespace kunai {

enum class SchemeKind { GitTags, GitBranch, Static };

// "git-tags", "git-branch" or "static"
std::optional<SchemeKind> parse_scheme_kind(const std::string& name);

struct AddOptions {
    std::string artifact_url_template;
    SchemeKind scheme = SchemeKind::GitTags;

    std::optional<std::string> name;       // inferred from the repository URL
    std::optional<std::string> version;    // inferred from the remote
    std::optional<std::string> hash;       // skips prefetching when set

    std::optional<std::string> repo_url;   // git-tags, git-branch
    std::optional<std::string> tag_prefix; // git-tags
    std::optional<std::string> branch;     // git-branch (required)
    std::optional<int> short_hash_length;  // git-branch

    bool unpack = false;
    bool pinned = false;
};

// Reject options that do not belong to the requested scheme
Status validate_add_options(const AddOptions& options);

// Create a source from `options` and insert it into `map`.
// Returns the name it was added under. `map` is only modified on success.
Result<std::string> add_source(SourceMap& map, const AddOptions& options,
                               RefLister& refs, ArtifactHasher& hasher);

} // namespace kunai
