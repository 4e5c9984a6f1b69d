#include <kunai/git.hpp>
#include <kunai/json_util.hpp>
#include <kunai/log.hpp>
#include <kunai/process.hpp>

#include <sstream>
#include <unordered_set>

namespace kunai {

// ---------------------------------------------------------------------------
// ls-remote parsing (pure functions)
// ---------------------------------------------------------------------------

namespace {

struct RefLine {
    std::string sha;
    std::string ref;
};

// "<sha>\t<ref>" lines; anything else is skipped
std::vector<RefLine> split_ref_lines(const std::string& output) {
    std::vector<RefLine> lines;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto tab_pos = line.find_first_of("\t ");
        if (tab_pos == std::string::npos) continue;

        std::string sha = line.substr(0, tab_pos);
        auto ref_start = line.find_first_not_of("\t ", tab_pos);
        if (ref_start == std::string::npos) continue;

        lines.push_back({std::move(sha), line.substr(ref_start)});
    }
    return lines;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::vector<std::string> parse_ls_remote_tags(const std::string& ls_remote_output) {
    const std::string prefix = "refs/tags/";
    const std::string deref_suffix = "^{}";

    std::vector<std::string> tags;
    std::unordered_set<std::string> seen;

    for (const auto& rl : split_ref_lines(ls_remote_output)) {
        if (!starts_with(rl.ref, prefix)) continue;

        std::string name = rl.ref.substr(prefix.size());
        // An annotated tag is listed twice: the tag object, then "<tag>^{}"
        if (name.size() > deref_suffix.size() &&
            name.compare(name.size() - deref_suffix.size(),
                         deref_suffix.size(), deref_suffix) == 0) {
            name.resize(name.size() - deref_suffix.size());
        }
        if (name.empty()) continue;

        if (seen.insert(name).second) {
            tags.push_back(std::move(name));
        }
    }
    return tags;
}

std::vector<RemoteBranch> parse_ls_remote_branches(const std::string& ls_remote_output) {
    std::vector<RemoteBranch> branches;
    for (auto& rl : split_ref_lines(ls_remote_output)) {
        branches.push_back(RemoteBranch{std::move(rl.ref), std::move(rl.sha)});
    }
    return branches;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<std::string> GitCli::ls_remote(const std::vector<std::string>& args,
                                       const Url& repo) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(program_);
    argv.insert(argv.end(), args.begin(), args.end());
    argv.push_back(repo.str());

    log::debug("%s", command_line(argv).c_str());
    auto r = run_command(argv, "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        std::string stderr_str = cmd.stderr_str;
        while (!stderr_str.empty() &&
               (stderr_str.back() == '\n' || stderr_str.back() == '\r')) {
            stderr_str.pop_back();
        }
        return KunaiError{KunaiError::Command,
            "git ls-remote failed for " + repo.str() +
            " (exit code " + std::to_string(cmd.exit_code) + ")",
            stderr_str};
    }

    // Ref names end up in the lockfile verbatim
    if (!is_valid_utf8(cmd.stdout_str)) {
        return KunaiError{KunaiError::InvalidUtf8,
            "git ls-remote output for " + repo.str() + " is not valid UTF-8"};
    }

    return Result<std::string>::ok(std::move(cmd.stdout_str));
}

Result<std::vector<std::string>> GitCli::list_tags(const Url& repo) {
    auto out = ls_remote({"-c", "versionsort.suffix=-", "ls-remote", "--tags",
                          "--sort=v:refname"}, repo);
    if (out.is_err()) return std::move(out).error();

    return Result<std::vector<std::string>>::ok(parse_ls_remote_tags(out.value()));
}

Result<std::vector<RemoteBranch>> GitCli::list_branches(const Url& repo) {
    auto out = ls_remote({"ls-remote", "--branches"}, repo);
    if (out.is_err()) return std::move(out).error();

    return Result<std::vector<RemoteBranch>>::ok(
        parse_ls_remote_branches(out.value()));
}

} // namespace kunai
