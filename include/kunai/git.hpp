#pragma once

#include <kunai/result.hpp>
#include <kunai/url.hpp>
#include <string>
#include <vector>

namespace kunai {

// A branch head from `git ls-remote --branches`
struct RemoteBranch {
    std::string ref;       // e.g., "refs/heads/main"
    std::string commit;    // full SHA
};

// Parse `git ls-remote --tags` output into tag names, keeping input order.
// "refs/tags/" is stripped and annotated-tag "^{}" lines are folded into the
// tag they dereference.
std::vector<std::string> parse_ls_remote_tags(const std::string& ls_remote_output);

// Parse `git ls-remote --branches` output, keeping input order.
std::vector<RemoteBranch> parse_ls_remote_branches(const std::string& ls_remote_output);

// Remote ref discovery used by the update schemes. Implemented by GitCli;
// tests substitute an in-memory fake.
class RefLister {
public:
    virtual ~RefLister() = default;

    // Tag names in ascending version order (the last one is the newest)
    virtual Result<std::vector<std::string>> list_tags(const Url& repo) = 0;

    virtual Result<std::vector<RemoteBranch>> list_branches(const Url& repo) = 0;
};

// Wrapper around git CLI operations
class GitCli : public RefLister {
public:
    explicit GitCli(std::string program = "git", int timeout_seconds = 0)
        : program_(std::move(program)), timeout_seconds_(timeout_seconds) {}

    // `git -c versionsort.suffix=- ls-remote --tags --sort=v:refname <url>`
    Result<std::vector<std::string>> list_tags(const Url& repo) override;

    // `git ls-remote --branches <url>`
    Result<std::vector<RemoteBranch>> list_branches(const Url& repo) override;

    const std::string& program() const { return program_; }
    void set_timeout(int seconds) { timeout_seconds_ = seconds; }

private:
    Result<std::string> ls_remote(const std::vector<std::string>& args,
                                  const Url& repo);

    std::string program_;
    int timeout_seconds_ = 0;
};

} // namespace kunai
