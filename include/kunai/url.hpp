#pragma once

#include <kunai/result.hpp>
#include <string>
#include <vector>

namespace kunai {

// An absolute URL, validated and normalized by libcurl's URL API.
// Any scheme is accepted (https, git+ssh, file, ...). Spaces in the path are
// percent-encoded.
class Url {
public:
    static Result<Url> parse(const std::string& text);

    const std::string& str() const { return normalized_; }
    const std::string& scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    const std::string& path() const { return path_; }

    // Segments of the path between '/' separators, e.g. "/a/b/" -> {"a", "b", ""}
    std::vector<std::string> path_segments() const;

    // Same scheme, credentials, host and port with a new path; the query
    // and fragment are dropped.
    Result<Url> with_path(const std::string& new_path) const;

    bool operator==(const Url& o) const { return normalized_ == o.normalized_; }
    bool operator!=(const Url& o) const { return !(*this == o); }

private:
    Url(std::string normalized, std::string scheme, std::string host,
        std::string path)
        : normalized_(std::move(normalized)), scheme_(std::move(scheme)),
          host_(std::move(host)), path_(std::move(path)) {}

    std::string normalized_;
    std::string scheme_;
    std::string host_;
    std::string path_;
};

} // namespace kunai
