#include <kunai/add.hpp>
#include <kunai/json_util.hpp>
#include <kunai/log.hpp>
#include <kunai/updater.hpp>

namespace kunai {

std::optional<SchemeKind> parse_scheme_kind(const std::string& name) {
    if (name == "git-tags") return SchemeKind::GitTags;
    if (name == "git-branch") return SchemeKind::GitBranch;
    if (name == "static") return SchemeKind::Static;
    return std::nullopt;
}

static const char* scheme_kind_name(SchemeKind kind) {
    switch (kind) {
        case SchemeKind::GitTags:   return "git-tags";
        case SchemeKind::GitBranch: return "git-branch";
        case SchemeKind::Static:    return "static";
    }
    return "unknown";
}

static KunaiError not_with_scheme(const char* option, SchemeKind kind) {
    return KunaiError{KunaiError::InvalidArg,
        std::string(option) + " cannot be used with the " +
        scheme_kind_name(kind) + " update scheme"};
}

Status validate_add_options(const AddOptions& options) {
    if (options.artifact_url_template.empty()) {
        return KunaiError{KunaiError::InvalidArg, "an artifact URL template is required"};
    }
    if (options.name && options.name->empty()) {
        return KunaiError{KunaiError::InvalidArg, "source name must not be empty"};
    }

    const std::optional<std::string>* stored[] = {
        &options.name, &options.version, &options.hash,
        &options.repo_url, &options.tag_prefix, &options.branch};
    bool utf8 = is_valid_utf8(options.artifact_url_template);
    for (const auto* field : stored) {
        if (*field && !is_valid_utf8(**field)) utf8 = false;
    }
    if (!utf8) {
        return KunaiError{KunaiError::InvalidUtf8,
            "source fields must be valid UTF-8"};
    }

    switch (options.scheme) {
        case SchemeKind::GitTags:
            if (options.branch) return not_with_scheme("--branch", options.scheme);
            if (options.short_hash_length)
                return not_with_scheme("--short-hash-length", options.scheme);
            break;

        case SchemeKind::GitBranch:
            if (options.tag_prefix) return not_with_scheme("--tag-prefix", options.scheme);
            if (!options.branch || options.branch->empty()) {
                return KunaiError{KunaiError::InvalidArg,
                    "the git-branch update scheme requires --branch"};
            }
            if (options.short_hash_length && *options.short_hash_length <= 0) {
                return KunaiError{KunaiError::InvalidArg,
                    "--short-hash-length must be a positive integer"};
            }
            break;

        case SchemeKind::Static:
            if (options.repo_url) return not_with_scheme("--repo-url", options.scheme);
            if (options.tag_prefix) return not_with_scheme("--tag-prefix", options.scheme);
            if (options.branch) return not_with_scheme("--branch", options.scheme);
            if (options.short_hash_length)
                return not_with_scheme("--short-hash-length", options.scheme);
            if (!options.version) {
                return KunaiError{KunaiError::InvalidArg,
                    "the static update scheme requires an explicit version"};
            }
            if (!options.name) {
                return KunaiError{KunaiError::InvalidArg,
                    "the static update scheme requires an explicit name",
                    "a name can only be inferred from a git repository URL"};
            }
            break;
    }

    return ok_status();
}

static Result<UpdateScheme> build_scheme(const AddOptions& options) {
    std::optional<Url> repo;
    if (options.repo_url) {
        auto parsed = Url::parse(*options.repo_url);
        if (parsed.is_err()) return std::move(parsed).error();
        repo = std::move(parsed).value();
    }

    switch (options.scheme) {
        case SchemeKind::GitTags: {
            GitTagsScheme s;
            s.repo_url = std::move(repo);
            s.tag_prefix = options.tag_prefix;
            return Result<UpdateScheme>::ok(std::move(s));
        }
        case SchemeKind::GitBranch: {
            GitBranchScheme s;
            s.repo_url = std::move(repo);
            s.branch = *options.branch;
            s.short_hash_length = options.short_hash_length.value_or(
                GitBranchScheme::kDefaultShortHashLength);
            return Result<UpdateScheme>::ok(std::move(s));
        }
        case SchemeKind::Static:
            return Result<UpdateScheme>::ok(StaticScheme{});
    }
    return KunaiError{KunaiError::InvalidArg, "unknown update scheme"};
}

// Last non-empty path segment of the repository URL
static Result<std::string> infer_name(const UpdateScheme& scheme,
                                      const std::string& artifact_url_template) {
    std::optional<Url> explicit_url;
    if (auto* tags = std::get_if<GitTagsScheme>(&scheme)) explicit_url = tags->repo_url;
    if (auto* branch = std::get_if<GitBranchScheme>(&scheme)) explicit_url = branch->repo_url;

    auto repo = resolve_repo_url(explicit_url, artifact_url_template);
    if (repo.is_err()) return std::move(repo).error();

    auto segments = repo.value().path_segments();
    for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
        if (!it->empty()) return Result<std::string>::ok(*it);
    }
    return KunaiError{KunaiError::InsufficientPathSegments,
        "cannot infer a source name from " + repo.value().str(),
        "pass an explicit name"};
}

Result<std::string> add_source(SourceMap& map, const AddOptions& options,
                               RefLister& refs, ArtifactHasher& hasher) {
    KUNAI_TRY(validate_add_options(options));

    auto scheme = build_scheme(options);
    if (scheme.is_err()) return std::move(scheme).error();

    std::string name;
    if (options.name) {
        name = *options.name;
    } else {
        auto inferred = infer_name(scheme.value(), options.artifact_url_template);
        if (inferred.is_err()) return std::move(inferred).error();
        name = std::move(inferred).value();
        log::debug("inferred source name '%s'", name.c_str());
    }

    if (map.find(name)) {
        return KunaiError{KunaiError::Duplicate,
            "a source named '" + name + "' already exists",
            "pick another name or remove the existing source with `kunai delete " +
            name + "`"};
    }

    log::SourceScope scope(name);
    Source source("", options.artifact_url_template, std::move(scheme).value());
    source.with_pinned(options.pinned).with_unpack(options.unpack);

    std::string version;
    if (options.version) {
        version = *options.version;
    } else {
        VersionResolver resolver(refs);
        auto latest = resolver.latest_version(source);
        if (latest.is_err()) return std::move(latest).error();
        version = std::move(latest).value();
        log::info("latest version is %s", version.c_str());
    }
    source.version = version;
    source.latest_checked_version = version;

    // A broken template is reported even when the hash is supplied
    auto url = source.full_url(version);
    if (url.is_err()) return std::move(url).error();

    if (options.hash) {
        source.with_hash(*options.hash);
    } else {
        log::debug("prefetching %s", url.value().str().c_str());
        auto hash = hasher.fetch_hash(url.value(), source.unpack);
        if (hash.is_err()) return std::move(hash).error();
        source.with_hash(std::move(hash).value());
    }

    map.sources.emplace(name, std::move(source));
    return Result<std::string>::ok(std::move(name));
}

} // namespace kunai
