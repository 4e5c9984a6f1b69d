#include <catch2/catch.hpp>
#include <kunai/process.hpp>

using namespace kunai;

TEST_CASE("run_command echo", "[process]") {
    auto r = run_command({"echo", "hello"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str == "hello\n");
}

TEST_CASE("run_command false returns nonzero", "[process]") {
    auto r = run_command({"false"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code != 0);
}

TEST_CASE("run_command captures stderr separately", "[process]") {
    auto r = run_command({"sh", "-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stdout_str == "out\n");
    REQUIRE(r.value().stderr_str == "err\n");
}

TEST_CASE("run_command empty args error", "[process]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::InvalidArg);
}

TEST_CASE("run_command with working dir", "[process]") {
    auto r = run_command({"pwd"}, "/tmp");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str.find("/tmp") != std::string::npos);
}

TEST_CASE("run_command nonexistent binary is a spawn error", "[process]") {
    auto r = run_command({"__kunai_nonexistent_binary_xyz__", "--json"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::Spawn);
    REQUIRE(r.error().message.find("__kunai_nonexistent_binary_xyz__ --json") !=
            std::string::npos);
}

TEST_CASE("run_command missing working dir is a spawn error", "[process]") {
    auto r = run_command({"true"}, "/nonexistent/kunai/dir");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::Spawn);
}

TEST_CASE("run_command handles output larger than a pipe buffer", "[process]") {
    auto r = run_command({"sh", "-c", "head -c 200000 /dev/zero | tr '\\0' a"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.size() == 200000);
}

TEST_CASE("run_command timeout kills the child", "[process]") {
    auto r = run_command({"sleep", "5"}, "", 1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KunaiError::Timeout);
}

TEST_CASE("command_line joins arguments", "[process]") {
    REQUIRE(command_line({"nix", "store", "prefetch-file"}) == "nix store prefetch-file");
    REQUIRE(command_line({}).empty());
}
