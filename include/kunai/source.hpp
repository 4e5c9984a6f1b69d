#pragma once

#include <kunai/result.hpp>
#include <kunai/url.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace kunai {

// Newest tag of a repository, optionally restricted to "<prefix><digit>..."
struct GitTagsScheme {
    std::optional<Url> repo_url;          // inferred from the artifact URL when unset
    std::optional<std::string> tag_prefix;

    bool operator==(const GitTagsScheme& o) const {
        return repo_url == o.repo_url && tag_prefix == o.tag_prefix;
    }
};

// Head commit of a branch; versions look like "<branch>-<short hash>"
struct GitBranchScheme {
    static constexpr int kDefaultShortHashLength = 6;

    std::optional<Url> repo_url;          // inferred from the artifact URL when unset
    std::string branch;
    int short_hash_length = kDefaultShortHashLength;

    bool operator==(const GitBranchScheme& o) const {
        return repo_url == o.repo_url && branch == o.branch &&
               short_hash_length == o.short_hash_length;
    }
};

// Fixed version label; only the hash is ever refreshed
struct StaticScheme {
    bool operator==(const StaticScheme&) const { return true; }
};

using UpdateScheme = std::variant<GitTagsScheme, GitBranchScheme, StaticScheme>;

// "git-tags", "git-branch" or "static"
const char* scheme_type_name(const UpdateScheme& scheme);

inline bool is_static(const UpdateScheme& scheme) {
    return std::holds_alternative<StaticScheme>(scheme);
}

struct Source {
    std::string version;
    std::string latest_checked_version;
    std::string artifact_url_template;   // "{version}" and, for git-branch, "{branch}"
    std::string hash;
    bool pinned = false;
    bool unpack = false;
    UpdateScheme update_scheme;

    Source() = default;
    Source(std::string initial_version, std::string url_template, UpdateScheme scheme);

    Source& with_pinned(bool value);
    Source& with_unpack(bool value);
    Source& with_hash(std::string value);

    // Expand the artifact URL template for `for_version` and parse the result.
    // Fails with BuildUrl when the expanded string is not a URL.
    Result<Url> full_url(const std::string& for_version) const;

    bool operator==(const Source& o) const;
    bool operator!=(const Source& o) const { return !(*this == o); }
};

// The lockfile: source name -> Source, kept in name order
struct SourceMap {
    std::map<std::string, Source> sources;

    // Parse a lockfile document. `origin` names the document in errors.
    // Syntax errors and schema mismatches carry line/column.
    static Result<SourceMap> parse(const std::string& json_text,
                                   const std::string& origin = "<input>");

    // Read and parse a lockfile from disk
    static Result<SourceMap> load(const std::string& path);

    // Deterministic pretty-printed document with a trailing newline.
    // Throws nlohmann::json::type_error if a string is not valid UTF-8.
    std::string to_json() const;

    // Serialize fully, then replace `path` in a single rename
    Status save(const std::string& path) const;

    const Source* find(const std::string& name) const;
    Source* find(const std::string& name);

    bool operator==(const SourceMap& o) const { return sources == o.sources; }
    bool operator!=(const SourceMap& o) const { return !(*this == o); }
};

} // namespace kunai
