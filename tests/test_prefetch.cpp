#include <catch2/catch.hpp>
#include <kunai/prefetch.hpp>

#include <filesystem>
#include <fstream>

using namespace kunai;

namespace fs = std::filesystem;

// ===== parse_prefetch_response() =====

TEST_CASE("prefetch response yields its hash", "[prefetch]") {
    auto r = parse_prefetch_response(
        R"({"hash": "sha256-AAAA", "storePath": "/nix/store/xyz-source"})");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "sha256-AAAA");
}

TEST_CASE("malformed prefetch responses", "[prefetch]") {
    SECTION("not json") {
        auto r = parse_prefetch_response("error: unable to download");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == KunaiError::MalformedResponse);
        REQUIRE(r.error().message.find("line 1") != std::string::npos);
    }
    SECTION("not an object") {
        auto r = parse_prefetch_response("[\"sha256-AAAA\"]");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == KunaiError::MalformedResponse);
    }
    SECTION("missing hash") {
        auto r = parse_prefetch_response(R"({"storePath": "/nix/store/x"})");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == KunaiError::MalformedResponse);
    }
    SECTION("hash is not a string") {
        auto r = parse_prefetch_response("{\n  \"hash\": 12\n}");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == KunaiError::MalformedResponse);
        REQUIRE(r.error().message.find("line 2, column 3") != std::string::npos);
    }
}

// ===== NixPrefetcher =====

namespace {

// A stand-in nix: records its arguments, then runs `body`
struct FakeNix {
    fs::path dir;
    std::string program;

    FakeNix(const std::string& name, const std::string& body) {
        dir = fs::temp_directory_path() / name;
        fs::create_directories(dir);
        auto script = dir / "nix";
        {
            std::ofstream out(script);
            out << "#!/bin/sh\n"
                << "echo \"$@\" > " << (dir / "args").string() << "\n"
                << body << "\n";
        }
        fs::permissions(script, fs::perms::owner_all);
        program = script.string();
    }

    ~FakeNix() {
        std::error_code ignored;
        fs::remove_all(dir, ignored);
    }

    std::string args() const {
        std::ifstream in(dir / "args");
        std::string line;
        std::getline(in, line);
        return line;
    }
};

} // namespace

TEST_CASE("NixPrefetcher invokes prefetch-file with --json", "[prefetch]") {
    FakeNix nix("kunai_test_nix_ok", "echo '{\"hash\":\"sha256-BBBB\"}'");
    NixPrefetcher prefetcher(nix.program);
    auto url = Url::parse("https://example.com/o/r/archive/1.0.tar.gz").value();

    auto r = prefetcher.fetch_hash(url, false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "sha256-BBBB");
    REQUIRE(nix.args() ==
            "store prefetch-file https://example.com/o/r/archive/1.0.tar.gz --json");
}

TEST_CASE("NixPrefetcher appends --unpack", "[prefetch]") {
    FakeNix nix("kunai_test_nix_unpack", "echo '{\"hash\":\"sha256-CCCC\"}'");
    NixPrefetcher prefetcher(nix.program);
    auto url = Url::parse("https://example.com/a.tar.gz").value();

    auto r = prefetcher.fetch_hash(url, true);
    REQUIRE(r.is_ok());
    REQUIRE(nix.args() == "store prefetch-file https://example.com/a.tar.gz --json --unpack");
}

TEST_CASE("NixPrefetcher non-zero exit is a prefetch failure", "[prefetch]") {
    FakeNix nix("kunai_test_nix_fail", "echo 'error: HTTP 404' >&2; exit 1");
    NixPrefetcher prefetcher(nix.program);
    auto url = Url::parse("https://example.com/missing.tar.gz").value();

    auto r = prefetcher.fetch_hash(url, false);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::PrefetchFailed);
    REQUIRE(r.error().message.find("https://example.com/missing.tar.gz") != std::string::npos);
    REQUIRE(r.error().hint == "error: HTTP 404");
}

TEST_CASE("NixPrefetcher garbage output is a malformed response", "[prefetch]") {
    FakeNix nix("kunai_test_nix_garbage", "echo 'not json'");
    NixPrefetcher prefetcher(nix.program);
    auto url = Url::parse("https://example.com/a.tar.gz").value();

    auto r = prefetcher.fetch_hash(url, false);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::MalformedResponse);
}

TEST_CASE("NixPrefetcher missing binary is a spawn error", "[prefetch]") {
    NixPrefetcher prefetcher("__kunai_no_such_nix__");
    auto url = Url::parse("https://example.com/a.tar.gz").value();

    auto r = prefetcher.fetch_hash(url, false);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::Spawn);
}
