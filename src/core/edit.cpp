#include <kunai/edit.hpp>
#include <kunai/json_util.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace kunai {

// ---------------------------------------------------------------------------
// Keys
// ---------------------------------------------------------------------------

std::optional<EditKey> parse_edit_key(const std::string& name) {
    if (name == "pinned") return EditKey::Pinned;
    if (name == "artifact_url_template") return EditKey::ArtifactUrlTemplate;
    if (name == "repo_url" || name == "git_url") return EditKey::RepoUrl;
    if (name == "tag_prefix") return EditKey::TagPrefix;
    if (name == "unpack") return EditKey::Unpack;
    if (name == "branch") return EditKey::Branch;
    if (name == "short_hash_length") return EditKey::ShortHashLength;
    return std::nullopt;
}

const char* edit_key_name(EditKey key) {
    switch (key) {
        case EditKey::Pinned:              return "pinned";
        case EditKey::ArtifactUrlTemplate: return "artifact_url_template";
        case EditKey::RepoUrl:             return "repo_url";
        case EditKey::TagPrefix:           return "tag_prefix";
        case EditKey::Unpack:              return "unpack";
        case EditKey::Branch:              return "branch";
        case EditKey::ShortHashLength:     return "short_hash_length";
    }
    return "unknown";
}

bool affects_hash(EditKey key) {
    switch (key) {
        case EditKey::ArtifactUrlTemplate:
        case EditKey::RepoUrl:
        case EditKey::TagPrefix:
        case EditKey::Branch:
            return true;
        case EditKey::Pinned:
        case EditKey::Unpack:
        case EditKey::ShortHashLength:
            return false;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Value parsing
// ---------------------------------------------------------------------------

static KunaiError invalid_value(EditKey key, const std::string& value,
                                const std::string& expected) {
    return KunaiError{KunaiError::InvalidArg,
        "invalid value `" + value + "` for key " + edit_key_name(key) +
        " (must be " + expected + ")"};
}

static Result<bool> parse_bool(EditKey key, const std::string& value) {
    if (value == "true") return Result<bool>::ok(true);
    if (value == "false") return Result<bool>::ok(false);
    return invalid_value(key, value, "`true` or `false`");
}

static KunaiError wrong_scheme(EditKey key, const std::string& name,
                               const Source& source) {
    return KunaiError{KunaiError::InvalidArg,
        std::string("key ") + edit_key_name(key) + " does not apply to source '" +
        name + "' (update scheme " + scheme_type_name(source.update_scheme) + ")"};
}

// ---------------------------------------------------------------------------
// edit_source()
// ---------------------------------------------------------------------------

Status edit_source(SourceMap& map, const std::string& name, EditKey key,
                   const std::string& value) {
    Source* source = map.find(name);
    if (!source) {
        return KunaiError{KunaiError::NotFound,
            "a source named '" + name + "' does not exist"};
    }
    if (!is_valid_utf8(value)) {
        return KunaiError{KunaiError::InvalidUtf8,
            std::string("value for key ") + edit_key_name(key) + " is not valid UTF-8"};
    }

    auto* tags = std::get_if<GitTagsScheme>(&source->update_scheme);
    auto* branch = std::get_if<GitBranchScheme>(&source->update_scheme);

    switch (key) {
        case EditKey::Pinned:
        case EditKey::Unpack: {
            auto b = parse_bool(key, value);
            if (b.is_err()) return std::move(b).error();
            (key == EditKey::Pinned ? source->pinned : source->unpack) = b.value();
            break;
        }

        case EditKey::ArtifactUrlTemplate: {
            if (Url::parse(value).is_err()) {
                return invalid_value(key, value, "a valid URL");
            }
            source->artifact_url_template = value;
            break;
        }

        case EditKey::RepoUrl: {
            if (!tags && !branch) return wrong_scheme(key, name, *source);
            std::optional<Url> url;
            if (!value.empty()) {
                auto parsed = Url::parse(value);
                if (parsed.is_err()) {
                    return invalid_value(key, value, "a valid URL or empty string");
                }
                url = std::move(parsed).value();
            }
            (tags ? tags->repo_url : branch->repo_url) = std::move(url);
            break;
        }

        case EditKey::TagPrefix: {
            if (!tags) return wrong_scheme(key, name, *source);
            if (value.empty()) {
                tags->tag_prefix.reset();
            } else {
                tags->tag_prefix = value;
            }
            break;
        }

        case EditKey::Branch: {
            if (!branch) return wrong_scheme(key, name, *source);
            if (value.empty()) {
                return invalid_value(key, value, "a non-empty branch name");
            }
            branch->branch = value;
            break;
        }

        case EditKey::ShortHashLength: {
            if (!branch) return wrong_scheme(key, name, *source);
            errno = 0;
            char* end = nullptr;
            long n = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0' || errno == ERANGE || n <= 0 || n > INT_MAX) {
                return invalid_value(key, value, "a positive integer");
            }
            branch->short_hash_length = static_cast<int>(n);
            break;
        }
    }

    return ok_status();
}

// ---------------------------------------------------------------------------
// remove_sources()
// ---------------------------------------------------------------------------

Status remove_sources(SourceMap& map, const std::vector<std::string>& names) {
    if (names.empty()) {
        return KunaiError{KunaiError::InvalidArg, "no source names given"};
    }

    std::string missing;
    for (const auto& name : names) {
        if (!map.find(name)) {
            if (!missing.empty()) missing += ", ";
            missing += "'" + name + "'";
        }
    }
    if (!missing.empty()) {
        return KunaiError{KunaiError::NotFound,
            "no source named " + missing + " exists; nothing was removed"};
    }

    for (const auto& name : names) {
        map.sources.erase(name);
    }
    return ok_status();
}

} // namespace kunai
