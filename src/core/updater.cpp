#include <kunai/updater.hpp>
#include <kunai/log.hpp>

#include <variant>

namespace kunai {

// ---------------------------------------------------------------------------
// Repository URL inference
// ---------------------------------------------------------------------------

Result<Url> infer_git_url(const std::string& artifact_url_template) {
    auto url = Url::parse(artifact_url_template);
    if (url.is_err()) {
        return KunaiError{KunaiError::InvalidUrl,
            "could not parse URL template: " + url.error().message,
            "set an explicit repository URL"};
    }

    const Url& artifact = url.value();
    if (artifact.host().empty() && artifact.scheme() != "file") {
        return KunaiError{KunaiError::UrlNoBase,
            "artifact URL " + artifact.str() + " does not have a base",
            "set an explicit repository URL"};
    }

    auto segments = artifact.path_segments();
    if (segments.size() < 2 || segments[0].empty() || segments[1].empty()) {
        return KunaiError{KunaiError::InsufficientPathSegments,
            "insufficient path segments to infer a repository URL from " +
            artifact.str(),
            "the artifact URL must start with /<owner>/<repo>, or set an explicit "
            "repository URL"};
    }

    return artifact.with_path("/" + segments[0] + "/" + segments[1]);
}

Result<Url> resolve_repo_url(const std::optional<Url>& explicit_url,
                             const std::string& artifact_url_template) {
    if (explicit_url) return Result<Url>::ok(*explicit_url);
    return infer_git_url(artifact_url_template);
}

// ---------------------------------------------------------------------------
// Candidate selection (pure functions)
// ---------------------------------------------------------------------------

Result<std::string> select_latest_tag(const std::vector<std::string>& tags,
                                      const std::string& prefix) {
    const std::string* latest = nullptr;
    for (const auto& tag : tags) {
        if (tag.size() <= prefix.size()) continue;
        if (tag.compare(0, prefix.size(), prefix) != 0) continue;

        char boundary = tag[prefix.size()];
        if (boundary < '0' || boundary > '9') continue;

        latest = &tag;
    }

    if (!latest) {
        return KunaiError{KunaiError::NoTagsFitFilter,
            prefix.empty() ? std::string("no tag fits the provided filter")
                           : "no tag fits the provided filter '" + prefix + "'"};
    }
    return Result<std::string>::ok(latest->substr(prefix.size()));
}

Result<std::string> find_branch_commit(const std::vector<RemoteBranch>& branches,
                                       const std::string& branch) {
    const std::string full_ref = "refs/heads/" + branch;
    for (const auto& b : branches) {
        if (b.ref == full_ref) {
            return Result<std::string>::ok(b.commit);
        }
    }

    for (const auto& b : branches) {
        auto slash = b.ref.rfind('/');
        std::string last = slash == std::string::npos ? b.ref : b.ref.substr(slash + 1);
        if (last == branch) {
            return Result<std::string>::ok(b.commit);
        }
    }
    return KunaiError{KunaiError::BranchNotFound,
        "could not find branch '" + branch + "'"};
}

std::string branch_version(const std::string& branch, const std::string& commit,
                           int short_hash_length) {
    size_t len = short_hash_length > 0 ? static_cast<size_t>(short_hash_length) : 0;
    return branch + "-" + commit.substr(0, len);
}

bool is_recoverable_resolve_error(const KunaiError& e) {
    switch (e.code) {
        case KunaiError::InvalidUrl:
        case KunaiError::UrlNoBase:
        case KunaiError::InsufficientPathSegments:
        case KunaiError::NoTagsFitFilter:
            return true;
        default:
            return false;
    }
}

// ---------------------------------------------------------------------------
// VersionResolver
// ---------------------------------------------------------------------------

Result<std::string> VersionResolver::latest_version(const Source& source) {
    return std::visit(
        [&](const auto& scheme) { return resolve(scheme, source); },
        source.update_scheme);
}

Result<std::string> VersionResolver::resolve(const GitTagsScheme& scheme,
                                             const Source& source) {
    auto repo = resolve_repo_url(scheme.repo_url, source.artifact_url_template);
    if (repo.is_err()) return std::move(repo).error();

    auto tags = refs_.list_tags(repo.value());
    if (tags.is_err()) return std::move(tags).error();

    const std::string& where = repo.value().str();
    log::trace("%zu tags at %s", tags.value().size(), where.c_str());
    return select_latest_tag(tags.value(), scheme.tag_prefix.value_or(""))
        .map_err([&](KunaiError e) {
            e.message += " at " + where;
            return e;
        });
}

Result<std::string> VersionResolver::resolve(const GitBranchScheme& scheme,
                                             const Source& source) {
    auto repo = resolve_repo_url(scheme.repo_url, source.artifact_url_template);
    if (repo.is_err()) return std::move(repo).error();

    auto branches = refs_.list_branches(repo.value());
    if (branches.is_err()) return std::move(branches).error();

    const std::string& where = repo.value().str();
    auto commit = find_branch_commit(branches.value(), scheme.branch)
        .map_err([&](KunaiError e) {
            e.message += " at " + where;
            return e;
        });
    if (commit.is_err()) return std::move(commit).error();

    return Result<std::string>::ok(
        branch_version(scheme.branch, commit.value(), scheme.short_hash_length));
}

Result<std::string> VersionResolver::resolve(const StaticScheme&, const Source& source) {
    return Result<std::string>::ok(source.version);
}

} // namespace kunai
