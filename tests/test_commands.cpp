#include <catch2/catch.hpp>
#include <kunai/commands.hpp>
#include <kunai/log.hpp>

#include "fakes.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace kunai;
using kunai::testing::FakeHasher;
using kunai::testing::FakeRefLister;

namespace fs = std::filesystem;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// A lockfile in a fresh directory plus in-memory collaborators
struct Workspace {
    fs::path dir;
    std::string lockfile;
    FakeRefLister refs;
    FakeHasher hasher;

    explicit Workspace(const std::string& name) {
        log::set_level(log::Off);
        dir = fs::temp_directory_path() / ("kunai_test_commands_" + name);
        fs::remove_all(dir);
        fs::create_directories(dir);
        lockfile = (dir / "kunai.lock").string();
    }

    ~Workspace() {
        std::error_code ignored;
        fs::remove_all(dir, ignored);
        log::set_level(log::Info);
    }

    CommandContext ctx() { return CommandContext{lockfile, refs, hasher}; }
};

AddOptions static_foo() {
    AddOptions o;
    o.artifact_url_template = "https://x/{version}.tar.gz";
    o.scheme = SchemeKind::Static;
    o.name = "foo";
    o.version = "1.0";
    o.hash = "abc";
    return o;
}

} // namespace

TEST_CASE("init writes an empty lockfile once", "[commands]") {
    Workspace ws("init");
    REQUIRE(run_init(ws.lockfile).is_ok());
    REQUIRE(read_file(ws.lockfile) == "{}\n");

    auto again = run_init(ws.lockfile);
    REQUIRE(again.is_err());
    REQUIRE(again.error().code == KunaiError::IO);
    REQUIRE(read_file(ws.lockfile) == "{}\n");
}

TEST_CASE("add, update and delete a static source", "[commands]") {
    Workspace ws("lifecycle");
    REQUIRE(run_init(ws.lockfile).is_ok());

    auto added = run_add(ws.ctx(), static_foo());
    REQUIRE(added.is_ok());
    REQUIRE(added.value() == "foo");

    auto map = SourceMap::load(ws.lockfile);
    REQUIRE(map.is_ok());
    const Source* foo = map.value().find("foo");
    REQUIRE(foo != nullptr);
    REQUIRE(foo->version == "1.0");
    REQUIRE(foo->hash == "abc");
    REQUIRE(foo->latest_checked_version == "1.0");
    REQUIRE_FALSE(foo->pinned);

    // Same remote hash: nothing to do and nothing rewritten
    ws.hasher.hashes["https://x/1.0.tar.gz"] = "abc";
    const std::string before = read_file(ws.lockfile);
    const auto mtime = fs::last_write_time(ws.lockfile);

    auto report = run_update(ws.ctx(), UpdateOptions{});
    REQUIRE(report.is_ok());
    REQUIRE(report.value().up_to_date == 1);
    REQUIRE(report.value().updated == 0);
    REQUIRE(read_file(ws.lockfile) == before);
    REQUIRE(fs::last_write_time(ws.lockfile) == mtime);

    REQUIRE(run_delete(ws.lockfile, {"foo"}).is_ok());
    REQUIRE(read_file(ws.lockfile) == "{}\n");
}

TEST_CASE("update persists new versions", "[commands]") {
    Workspace ws("update");
    REQUIRE(run_init(ws.lockfile).is_ok());

    ws.refs.tags["https://github.com/owner/widget"] = {"v1.0"};
    ws.hasher.hashes["https://github.com/owner/widget/archive/v1.0.tar.gz"] = "sha256-a";
    AddOptions o;
    o.artifact_url_template = "https://github.com/owner/widget/archive/v{version}.tar.gz";
    o.tag_prefix = "v";
    REQUIRE(run_add(ws.ctx(), o).is_ok());

    ws.refs.tags["https://github.com/owner/widget"] = {"v1.0", "v1.1"};
    ws.hasher.hashes["https://github.com/owner/widget/archive/v1.1.tar.gz"] = "sha256-b";

    auto report = run_update(ws.ctx(), UpdateOptions{});
    REQUIRE(report.is_ok());
    REQUIRE(report.value().diffs.at("widget").new_version == "1.1");

    auto map = SourceMap::load(ws.lockfile).value();
    REQUIRE(map.find("widget")->version == "1.1");
    REQUIRE(map.find("widget")->hash == "sha256-b");
}

TEST_CASE("aborted update does not touch the lockfile", "[commands]") {
    Workspace ws("abort");
    REQUIRE(run_init(ws.lockfile).is_ok());
    REQUIRE(run_add(ws.ctx(), static_foo()).is_ok());
    const std::string before = read_file(ws.lockfile);

    ws.hasher.errors["https://x/1.0.tar.gz"] = KunaiError{KunaiError::Spawn, "no nix"};
    auto report = run_update(ws.ctx(), UpdateOptions{});
    REQUIRE(report.is_err());
    REQUIRE(read_file(ws.lockfile) == before);
}

TEST_CASE("update never writes a lockfile it cannot read back", "[commands]") {
    Workspace ws("utf8");
    REQUIRE(run_init(ws.lockfile).is_ok());

    ws.refs.tags["https://github.com/owner/widget"] = {"v1.0"};
    ws.hasher.hashes["https://github.com/owner/widget/archive/v1.0.tar.gz"] = "sha256-a";
    AddOptions o;
    o.artifact_url_template = "https://github.com/owner/widget/archive/v{version}.tar.gz";
    o.tag_prefix = "v";
    REQUIRE(run_add(ws.ctx(), o).is_ok());
    const std::string before = read_file(ws.lockfile);

    ws.refs.tags["https://github.com/owner/widget"] = {"v1.0", "v1.1\xff"};
    auto report = run_update(ws.ctx(), UpdateOptions{});
    REQUIRE(report.is_err());
    REQUIRE(read_file(ws.lockfile) == before);
    REQUIRE(SourceMap::load(ws.lockfile).is_ok());
}

TEST_CASE("failed add does not touch the lockfile", "[commands]") {
    Workspace ws("add_dup");
    REQUIRE(run_init(ws.lockfile).is_ok());
    REQUIRE(run_add(ws.ctx(), static_foo()).is_ok());
    const std::string before = read_file(ws.lockfile);

    auto dup = run_add(ws.ctx(), static_foo());
    REQUIRE(dup.is_err());
    REQUIRE(dup.error().code == KunaiError::Duplicate);
    REQUIRE(read_file(ws.lockfile) == before);
}

TEST_CASE("edit persists the changed field", "[commands]") {
    Workspace ws("edit");
    REQUIRE(run_init(ws.lockfile).is_ok());
    REQUIRE(run_add(ws.ctx(), static_foo()).is_ok());

    REQUIRE(run_edit(ws.lockfile, "foo", EditKey::Pinned, "true").is_ok());
    REQUIRE(SourceMap::load(ws.lockfile).value().find("foo")->pinned);

    auto bad = run_edit(ws.lockfile, "foo", EditKey::TagPrefix, "v");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == KunaiError::InvalidArg);
}

TEST_CASE("delete with a missing name keeps every source", "[commands]") {
    Workspace ws("delete");
    REQUIRE(run_init(ws.lockfile).is_ok());
    REQUIRE(run_add(ws.ctx(), static_foo()).is_ok());
    const std::string before = read_file(ws.lockfile);

    auto r = run_delete(ws.lockfile, {"foo", "bar"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::NotFound);
    REQUIRE(read_file(ws.lockfile) == before);
}

TEST_CASE("commands need an existing lockfile", "[commands]") {
    Workspace ws("missing");
    auto r = run_update(ws.ctx(), UpdateOptions{});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::NotFound);
    REQUIRE_FALSE(fs::exists(ws.lockfile));
}

TEST_CASE("corrupt lockfile is never rewritten", "[commands]") {
    Workspace ws("corrupt");
    {
        std::ofstream out(ws.lockfile);
        out << "{ \"foo\": ";
    }

    auto r = run_add(ws.ctx(), static_foo());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::Syntax);
    REQUIRE(read_file(ws.lockfile) == "{ \"foo\": ");
}
