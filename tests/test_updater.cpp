#include <catch2/catch.hpp>
#include <kunai/updater.hpp>

#include "fakes.hpp"

using namespace kunai;
using kunai::testing::FakeRefLister;

// ===== infer_git_url() =====

TEST_CASE("infer repository URL from an archive URL", "[updater]") {
    auto r = infer_git_url("https://github.com/owner/repo/archive/v{version}.tar.gz");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().str() == "https://github.com/owner/repo");
}

TEST_CASE("inferred repository URL keeps the port and drops the query", "[updater]") {
    auto r = infer_git_url("https://git.example.com:8443/o/r/-/archive.tgz?ref={version}");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().str() == "https://git.example.com:8443/o/r");
}

TEST_CASE("infer repository URL failures", "[updater]") {
    SECTION("not a URL") {
        auto r = infer_git_url("owner/repo/{version}");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == KunaiError::InvalidUrl);
    }
    SECTION("one path segment") {
        auto r = infer_git_url("https://example.com/archive.tar.gz");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == KunaiError::InsufficientPathSegments);
    }
    SECTION("empty owner segment") {
        auto r = infer_git_url("https://example.com//repo/x.tgz");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == KunaiError::InsufficientPathSegments);
    }
    SECTION("no path at all") {
        auto r = infer_git_url("https://example.com");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == KunaiError::InsufficientPathSegments);
    }
}

TEST_CASE("explicit repository URL beats inference", "[updater]") {
    auto explicit_url = Url::parse("https://mirror.example.org/x/y").value();
    auto r = resolve_repo_url(explicit_url, "https://github.com/owner/repo/v{version}.tgz");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == explicit_url);

    // The template is never consulted, so a useless one is fine
    REQUIRE(resolve_repo_url(explicit_url, "{version}").is_ok());
}

// ===== select_latest_tag() =====

TEST_CASE("tag prefix must be followed by a digit", "[updater]") {
    std::vector<std::string> tags = {"v1.0.0", "v1.2.0", "1.9.9", "v2.0.0-rc1"};
    auto r = select_latest_tag(tags, "v");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "2.0.0-rc1");
}

TEST_CASE("empty prefix accepts any tag starting with a digit", "[updater]") {
    std::vector<std::string> tags = {"v1.0.0", "1.9.9", "nightly", "2.0"};
    auto r = select_latest_tag(tags, "");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "2.0");
}

TEST_CASE("prefix must match exactly", "[updater]") {
    std::vector<std::string> tags = {"release-1.0", "release-x", "rel-2.0", "release-"};
    auto r = select_latest_tag(tags, "release-");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "1.0");
}

TEST_CASE("no tag fits the filter", "[updater]") {
    auto r = select_latest_tag({"vx", "nightly", "v"}, "v");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::NoTagsFitFilter);

    REQUIRE(select_latest_tag({}, "").is_err());
}

// ===== find_branch_commit() / branch_version() =====

TEST_CASE("find branch by its last ref segment", "[updater]") {
    std::vector<RemoteBranch> branches = {
        {"refs/heads/main", "1111111111"},
        {"refs/heads/dev", "2222222222"},
    };
    auto r = find_branch_commit(branches, "dev");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "2222222222");

    auto missing = find_branch_commit(branches, "release");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == KunaiError::BranchNotFound);
}

TEST_CASE("exact branch ref wins over a nested branch of the same name", "[updater]") {
    std::vector<RemoteBranch> branches = {
        {"refs/heads/feature/main", "1111111111"},
        {"refs/heads/main", "2222222222"},
        {"refs/heads/release/1.x", "3333333333"},
    };
    REQUIRE(find_branch_commit(branches, "main").value() == "2222222222");
    REQUIRE(find_branch_commit(branches, "release/1.x").value() == "3333333333");

    // Without an exact ref the last segment still matches
    REQUIRE(find_branch_commit(branches, "1.x").value() == "3333333333");
}

TEST_CASE("branch versions use a short commit hash", "[updater]") {
    REQUIRE(branch_version("main", "0123456789abcdef", 6) == "main-012345");
    REQUIRE(branch_version("main", "0123", 6) == "main-0123");
}

TEST_CASE("recoverable resolve errors", "[updater]") {
    REQUIRE(is_recoverable_resolve_error(KunaiError{KunaiError::NoTagsFitFilter, ""}));
    REQUIRE(is_recoverable_resolve_error(KunaiError{KunaiError::UrlNoBase, ""}));
    REQUIRE(is_recoverable_resolve_error(KunaiError{KunaiError::InsufficientPathSegments, ""}));
    REQUIRE(is_recoverable_resolve_error(KunaiError{KunaiError::InvalidUrl, ""}));
    REQUIRE_FALSE(is_recoverable_resolve_error(KunaiError{KunaiError::Spawn, ""}));
    REQUIRE_FALSE(is_recoverable_resolve_error(KunaiError{KunaiError::Command, ""}));
    REQUIRE_FALSE(is_recoverable_resolve_error(KunaiError{KunaiError::BranchNotFound, ""}));
    REQUIRE_FALSE(is_recoverable_resolve_error(KunaiError{KunaiError::InvalidUtf8, ""}));
}

// ===== VersionResolver =====

TEST_CASE("git-tags resolver queries the inferred repository", "[updater]") {
    FakeRefLister refs;
    refs.tags["https://github.com/owner/repo"] = {"v0.9", "v1.0", "latest"};

    GitTagsScheme scheme;
    scheme.tag_prefix = "v";
    Source source("0.9", "https://github.com/owner/repo/archive/v{version}.tar.gz", scheme);

    VersionResolver resolver(refs);
    auto r = resolver.latest_version(source);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "1.0");
    REQUIRE(refs.tag_calls == std::vector<std::string>{"https://github.com/owner/repo"});
}

TEST_CASE("git-tags resolver names the repository when nothing fits", "[updater]") {
    FakeRefLister refs;
    refs.tags["https://github.com/owner/repo"] = {"nightly"};

    Source source("1.0", "https://github.com/owner/repo/{version}.tgz", GitTagsScheme{});
    VersionResolver resolver(refs);
    auto r = resolver.latest_version(source);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::NoTagsFitFilter);
    REQUIRE(r.error().message.find("at https://github.com/owner/repo") != std::string::npos);
}

TEST_CASE("git-branch resolver builds branch-hash versions", "[updater]") {
    FakeRefLister refs;
    refs.branches["https://example.com/o/r"] = {
        {"refs/heads/main", "abcdef0123456789"},
    };

    GitBranchScheme scheme;
    scheme.repo_url = Url::parse("https://example.com/o/r").value();
    scheme.branch = "main";
    scheme.short_hash_length = 8;
    Source source("main-000000", "https://cdn.example.com/{version}.tgz", scheme);

    VersionResolver resolver(refs);
    auto r = resolver.latest_version(source);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "main-abcdef01");
    REQUIRE(refs.tag_calls.empty());
}

TEST_CASE("static resolver returns the stored version without remote calls", "[updater]") {
    FakeRefLister refs;
    Source source("4.2", "https://x.org/{version}.tgz", StaticScheme{});

    VersionResolver resolver(refs);
    auto r = resolver.latest_version(source);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "4.2");
    REQUIRE(refs.tag_calls.empty());
    REQUIRE(refs.branch_calls.empty());
}

TEST_CASE("ref listing errors pass through unchanged", "[updater]") {
    FakeRefLister refs;
    refs.fail_with = KunaiError{KunaiError::Spawn, "failed to execute command: git"};

    Source source("1.0", "https://github.com/owner/repo/{version}.tgz", GitTagsScheme{});
    VersionResolver resolver(refs);
    auto r = resolver.latest_version(source);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::Spawn);
}
