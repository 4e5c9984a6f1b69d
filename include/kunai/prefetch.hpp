#pragma once

#include <kunai/result.hpp>
#include <kunai/url.hpp>
#include <string>

namespace kunai {

// Fetches an artifact and computes its content hash.
//
// Error codes callers rely on:
//   Spawn             the fetch tool could not be started
//   PrefetchFailed    the tool ran and could not fetch the URL
//   MalformedResponse the tool's output does not match its contract
class ArtifactHasher {
public:
    virtual ~ArtifactHasher() = default;

    virtual Result<std::string> fetch_hash(const Url& url, bool unpack) = 0;
};

// Extract "hash" from a `nix store prefetch-file --json` response.
// Other members of the response object are ignored.
Result<std::string> parse_prefetch_response(const std::string& body);

// `nix store prefetch-file <url> --json [--unpack]`
class NixPrefetcher : public ArtifactHasher {
public:
    explicit NixPrefetcher(std::string program = "nix", int timeout_seconds = 0)
        : program_(std::move(program)), timeout_seconds_(timeout_seconds) {}

    Result<std::string> fetch_hash(const Url& url, bool unpack) override;

    const std::string& program() const { return program_; }

private:
    std::string program_;
    int timeout_seconds_ = 0;
};

} // namespace kunai
