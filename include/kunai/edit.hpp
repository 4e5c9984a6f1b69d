#pragma once

#include <kunai/result.hpp>
#include <kunai/source.hpp>

#include <optional>
#include <string>
#include <vector>

namespace kunai {

enum class EditKey {
    Pinned,
    ArtifactUrlTemplate,
    RepoUrl,
    TagPrefix,
    Unpack,
    Branch,
    ShortHashLength
};

// "pinned", "artifact_url_template", "repo_url" (alias "git_url"),
// "tag_prefix", "unpack", "branch", "short_hash_length"
std::optional<EditKey> parse_edit_key(const std::string& name);
const char* edit_key_name(EditKey key);

// Keys whose change makes the stored hash refer to a different artifact
bool affects_hash(EditKey key);

// Set one field of an existing source from its string form.
// Empty values clear optional fields (repo_url, tag_prefix).
Status edit_source(SourceMap& map, const std::string& name, EditKey key,
                   const std::string& value);

// Remove every named source, or none: if any name is absent nothing is
// removed and the error lists all missing names.
Status remove_sources(SourceMap& map, const std::vector<std::string>& names);

} // namespace kunai
