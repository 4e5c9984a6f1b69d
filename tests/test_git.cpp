#include <catch2/catch.hpp>
#include <kunai/git.hpp>

#include <filesystem>
#include <fstream>

using namespace kunai;

namespace fs = std::filesystem;

// ===== parse_ls_remote_tags() =====

TEST_CASE("parse empty ls-remote output", "[git]") {
    REQUIRE(parse_ls_remote_tags("").empty());
    REQUIRE(parse_ls_remote_branches("").empty());
}

TEST_CASE("parse ls-remote lightweight tags keeps git's order", "[git]") {
    std::string output =
        "aaa1111111111111111111111111111111111111\trefs/tags/v1.0.0\n"
        "bbb2222222222222222222222222222222222222\trefs/tags/v1.1.0\n"
        "ccc3333333333333333333333333333333333333\trefs/tags/v2.0.0\n";

    auto tags = parse_ls_remote_tags(output);
    REQUIRE(tags == std::vector<std::string>{"v1.0.0", "v1.1.0", "v2.0.0"});
}

TEST_CASE("parse ls-remote annotated tag deref is folded", "[git]") {
    std::string output =
        "tag_object_sha_not_commit_sha_xxxxxxxx\trefs/tags/v1.0.0\n"
        "actual_commit_sha_yyyyyyyyyyyyyyyyyyyy\trefs/tags/v1.0.0^{}\n"
        "ddd4444444444444444444444444444444444444\trefs/tags/v1.1.0\n";

    auto tags = parse_ls_remote_tags(output);
    REQUIRE(tags == std::vector<std::string>{"v1.0.0", "v1.1.0"});
}

TEST_CASE("parse ls-remote keeps slashes in tag names", "[git]") {
    std::string output =
        "aaa1111111111111111111111111111111111111\trefs/tags/release/1.0\n";
    auto tags = parse_ls_remote_tags(output);
    REQUIRE(tags.size() == 1);
    REQUIRE(tags[0] == "release/1.0");
}

TEST_CASE("parse ls-remote skips malformed and foreign lines", "[git]") {
    std::string output =
        "garbage\n"
        "\n"
        "aaa1111111111111111111111111111111111111\trefs/heads/main\n"
        "bbb2222222222222222222222222222222222222\trefs/tags/v3\r\n";
    auto tags = parse_ls_remote_tags(output);
    REQUIRE(tags == std::vector<std::string>{"v3"});
}

// ===== parse_ls_remote_branches() =====

TEST_CASE("parse ls-remote branches", "[git]") {
    std::string output =
        "0123456789abcdef0123456789abcdef01234567\trefs/heads/main\n"
        "fedcba9876543210fedcba9876543210fedcba98\trefs/heads/feature/x\n";

    auto branches = parse_ls_remote_branches(output);
    REQUIRE(branches.size() == 2);
    REQUIRE(branches[0].ref == "refs/heads/main");
    REQUIRE(branches[0].commit == "0123456789abcdef0123456789abcdef01234567");
    REQUIRE(branches[1].ref == "refs/heads/feature/x");
}

// ===== GitCli =====

TEST_CASE("GitCli reports a missing git binary as a spawn error", "[git]") {
    GitCli git("__kunai_no_such_git__");
    auto url = Url::parse("https://example.com/o/r").value();
    auto r = git.list_tags(url);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::Spawn);
}

TEST_CASE("GitCli reports a failing ls-remote as a command error", "[git]") {
    // `false` accepts any arguments and exits 1
    GitCli git("false");
    auto url = Url::parse("https://example.com/o/r").value();
    auto r = git.list_branches(url);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::Command);
    REQUIRE(r.error().message.find("https://example.com/o/r") != std::string::npos);
}

// A stand-in git that records its arguments and prints canned refs
static std::string write_fake_git(const std::string& dirname, const std::string& refs) {
    auto dir = fs::temp_directory_path() / dirname;
    fs::create_directories(dir);
    auto script = dir / "fake-git";
    {
        std::ofstream out(script);
        out << "#!/bin/sh\n"
            << "echo \"$@\" > " << (dir / "args").string() << "\n"
            << "printf '" << refs << "'\n";
    }
    fs::permissions(script, fs::perms::owner_all);
    return script.string();
}

static std::string read_fake_git_args(const std::string& dirname) {
    std::ifstream in(fs::temp_directory_path() / dirname / "args");
    std::string line;
    std::getline(in, line);
    return line;
}

TEST_CASE("GitCli lists tags with version sorting", "[git]") {
    GitCli git(write_fake_git("kunai_test_git_tags", "aaa\\trefs/tags/v1.0\\nbbb\\trefs/tags/v1.1\\n"));
    auto url = Url::parse("https://example.com/o/r").value();
    auto r = git.list_tags(url);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"v1.0", "v1.1"});
    REQUIRE(read_fake_git_args("kunai_test_git_tags") ==
            "-c versionsort.suffix=- ls-remote --tags --sort=v:refname "
            "https://example.com/o/r");
    fs::remove_all(fs::temp_directory_path() / "kunai_test_git_tags");
}

TEST_CASE("GitCli lists branches", "[git]") {
    GitCli git(write_fake_git("kunai_test_git_branches", "0123456789\\trefs/heads/main\\n"));
    auto url = Url::parse("https://example.com/o/r").value();
    auto r = git.list_branches(url);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 1);
    REQUIRE(r.value()[0].commit == "0123456789");
    REQUIRE(read_fake_git_args("kunai_test_git_branches") ==
            "ls-remote --branches https://example.com/o/r");
    fs::remove_all(fs::temp_directory_path() / "kunai_test_git_branches");
}

TEST_CASE("GitCli rejects ref names that are not UTF-8", "[git]") {
    GitCli git(write_fake_git("kunai_test_git_utf8", "aaa\\trefs/tags/v1.0\\377\\n"));
    auto url = Url::parse("https://example.com/o/r").value();
    auto r = git.list_tags(url);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::InvalidUtf8);
    REQUIRE(r.error().message.find("https://example.com/o/r") != std::string::npos);
    fs::remove_all(fs::temp_directory_path() / "kunai_test_git_utf8");
}
