// main.cpp - kunai command-line entry point
#include <getopt.h>

#include <kunai/commands.hpp>
#include <kunai/config.hpp>
#include <kunai/log.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace kunai;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::optional<std::string> source_file;
    std::optional<std::string> log_level;
    std::string config_file;
    bool help = false;
    std::string command;
    std::vector<std::string> args;   // argv of the command, starting with its name
};

void print_help() {
    std::cout << "Usage: kunai [OPTIONS] <command> [args...]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  init                         Create an empty lockfile\n";
    std::cout << "  add [options] <url-template> Track a new source\n";
    std::cout << "  update [names...]            Bring sources up to date\n";
    std::cout << "  delete <names...>            Stop tracking sources\n";
    std::cout << "  edit <name> <key> <value>    Change one field of a source\n\n";

    std::cout << "Global options:\n";
    std::cout << "  -s, --source-file FILE   Lockfile to operate on (default: kunai.lock)\n";
    std::cout << "  -l, --log-level LEVEL    off, trace, debug, info, warn or error\n";
    std::cout << "  -c, --config FILE        Use FILE instead of ./.kunai.toml\n";
    std::cout << "  -h, --help               Show this help\n\n";

    std::cout << "add options:\n";
    std::cout << "  --scheme TYPE            git-tags (default), git-branch or static\n";
    std::cout << "  --name NAME              Source name (default: repository name)\n";
    std::cout << "  --version VERSION        Initial version (default: latest)\n";
    std::cout << "  --repo-url URL           Repository to query instead of the inferred one\n";
    std::cout << "  --tag-prefix PREFIX      Only consider tags \"<PREFIX><digit>...\"\n";
    std::cout << "  --branch BRANCH          Branch to follow (git-branch)\n";
    std::cout << "  --short-hash-length N    Commit hash characters in versions (git-branch)\n";
    std::cout << "  --unpack                 Hash the unpacked archive\n";
    std::cout << "  --pinned                 Exclude from updates unless forced\n";
    std::cout << "  --hash HASH              Use HASH instead of prefetching\n\n";

    std::cout << "update options:\n";
    std::cout << "  --refetch                Re-hash even when the version is unchanged\n";
    std::cout << "  --force                  Update pinned sources too\n";
    std::cout << "  --pin / --unpin          Only set or clear the pinned flag\n";
    std::cout << "  --show-updated           Print \"name: old -> new\" per updated source\n";
    std::cout << "  --json                   Print updated versions as JSON\n\n";

    std::cout << "edit keys:\n";
    std::cout << "  pinned, unpack, artifact_url_template, repo_url, tag_prefix,\n";
    std::cout << "  branch, short_hash_length\n";
}

int usage_error(const std::string& msg) {
    std::cerr << "kunai: " << msg << "\n";
    std::cerr << "Try 'kunai --help' for more information.\n";
    return kExitUsage;
}

int report_error(const KunaiError& e) {
    log::error("%s", e.format().c_str());
    return kExitError;
}

// Global options stop at the first non-option, which names the command
bool parse_global(int argc, char* argv[], CliOptions& opts) {
    static struct option long_options[] = {{"source-file", required_argument, 0, 's'},
                                           {"log-level", required_argument, 0, 'l'},
                                           {"config", required_argument, 0, 'c'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, "+s:l:c:h", long_options, &option_index)) != -1) {
        switch (opt) {
        case 's':
            opts.source_file = optarg;
            break;
        case 'l':
            opts.log_level = optarg;
            break;
        case 'c':
            opts.config_file = optarg;
            break;
        case 'h':
            opts.help = true;
            break;
        default:
            return false;
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        for (int i = optind; i < argc; ++i) {
            opts.args.push_back(argv[i]);
        }
    }
    return true;
}

// getopt works on a mutable argv; rebuild one for the command's own options
struct SubArgv {
    explicit SubArgv(std::vector<std::string>& args) {
        for (auto& a : args) ptrs.push_back(a.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(ptrs.size()) - 1; }
    char** argv() { return ptrs.data(); }

    std::vector<char*> ptrs;
};

Result<Config> load_config(const CliOptions& cli) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && fs::exists(global_path, ec)) {
        auto r = Config::load(global_path);
        if (r.is_err()) return r;
        global = std::move(r).value();
    }

    std::optional<Config> local;
    if (!cli.config_file.empty()) {
        auto r = Config::load(cli.config_file);
        if (r.is_err()) return r;
        local = std::move(r).value();
    } else if (fs::exists(local_config_path(), ec)) {
        auto r = Config::load(local_config_path());
        if (r.is_err()) return r;
        local = std::move(r).value();
    }

    Config cfg = Config::effective(global, local);
    if (cli.source_file) {
        cfg.source_file = *cli.source_file;
        cfg.source_file_set = true;
    }
    if (cli.log_level) {
        auto lvl = log::parse_level(*cli.log_level);
        if (!lvl) {
            return KunaiError{KunaiError::InvalidArg,
                "unknown log level '" + *cli.log_level + "'",
                "use off, trace, debug, info, warn or error"};
        }
        cfg.log_level = *lvl;
        cfg.log_level_set = true;
    }
    return Result<Config>::ok(std::move(cfg));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_init(const Config& cfg, const std::vector<std::string>& args) {
    if (args.size() > 1) return usage_error("init takes no arguments");
    auto r = run_init(cfg.source_file);
    if (r.is_err()) return report_error(r.error());
    return kExitOk;
}

int cmd_add(const Config& cfg, std::vector<std::string> args) {
    enum {
        OPT_NAME = 256, OPT_VERSION, OPT_SCHEME, OPT_REPO_URL, OPT_TAG_PREFIX,
        OPT_BRANCH, OPT_SHORT_HASH, OPT_UNPACK, OPT_PINNED, OPT_HASH
    };
    static struct option long_options[] = {{"name", required_argument, 0, OPT_NAME},
                                           {"version", required_argument, 0, OPT_VERSION},
                                           {"scheme", required_argument, 0, OPT_SCHEME},
                                           {"repo-url", required_argument, 0, OPT_REPO_URL},
                                           {"git-url", required_argument, 0, OPT_REPO_URL},
                                           {"tag-prefix", required_argument, 0, OPT_TAG_PREFIX},
                                           {"branch", required_argument, 0, OPT_BRANCH},
                                           {"short-hash-length", required_argument, 0, OPT_SHORT_HASH},
                                           {"unpack", no_argument, 0, OPT_UNPACK},
                                           {"pinned", no_argument, 0, OPT_PINNED},
                                           {"hash", required_argument, 0, OPT_HASH},
                                           {0, 0, 0, 0}};

    AddOptions options;
    SubArgv sub(args);
    optind = 0;
    int opt;
    int option_index = 0;
    while ((opt = getopt_long(sub.argc(), sub.argv(), "", long_options, &option_index)) != -1) {
        switch (opt) {
        case OPT_NAME:
            options.name = optarg;
            break;
        case OPT_VERSION:
            options.version = optarg;
            break;
        case OPT_SCHEME: {
            auto kind = parse_scheme_kind(optarg);
            if (!kind) {
                return usage_error(std::string("unknown scheme '") + optarg +
                                   "' (expected git-tags, git-branch or static)");
            }
            options.scheme = *kind;
            break;
        }
        case OPT_REPO_URL:
            options.repo_url = optarg;
            break;
        case OPT_TAG_PREFIX:
            options.tag_prefix = optarg;
            break;
        case OPT_BRANCH:
            options.branch = optarg;
            break;
        case OPT_SHORT_HASH: {
            char* end = nullptr;
            long n = std::strtol(optarg, &end, 10);
            if (end == optarg || *end != '\0' || n <= 0 || n > 64) {
                return usage_error(std::string("invalid --short-hash-length '") + optarg + "'");
            }
            options.short_hash_length = static_cast<int>(n);
            break;
        }
        case OPT_UNPACK:
            options.unpack = true;
            break;
        case OPT_PINNED:
            options.pinned = true;
            break;
        case OPT_HASH:
            options.hash = optarg;
            break;
        default:
            return kExitUsage;
        }
    }

    if (sub.argc() - optind != 1) {
        return usage_error("add expects exactly one artifact URL template");
    }
    options.artifact_url_template = sub.argv()[optind];

    GitCli git(cfg.git_program, cfg.timeout_seconds);
    NixPrefetcher nix(cfg.nix_program, cfg.timeout_seconds);
    CommandContext ctx{cfg.source_file, git, nix};

    auto r = run_add(ctx, options);
    if (r.is_err()) return report_error(r.error());
    return kExitOk;
}

int cmd_update(const Config& cfg, std::vector<std::string> args) {
    enum { OPT_REFETCH = 256, OPT_FORCE, OPT_PIN, OPT_UNPIN, OPT_SHOW_UPDATED, OPT_JSON };
    static struct option long_options[] = {{"refetch", no_argument, 0, OPT_REFETCH},
                                           {"force", no_argument, 0, OPT_FORCE},
                                           {"pin", no_argument, 0, OPT_PIN},
                                           {"unpin", no_argument, 0, OPT_UNPIN},
                                           {"show-updated", no_argument, 0, OPT_SHOW_UPDATED},
                                           {"json", no_argument, 0, OPT_JSON},
                                           {0, 0, 0, 0}};

    UpdateOptions options;
    bool show_updated = false;
    bool json = false;

    SubArgv sub(args);
    optind = 0;
    int opt;
    int option_index = 0;
    while ((opt = getopt_long(sub.argc(), sub.argv(), "", long_options, &option_index)) != -1) {
        switch (opt) {
        case OPT_REFETCH:      options.refetch = true; break;
        case OPT_FORCE:        options.force = true; break;
        case OPT_PIN:          options.pin = true; break;
        case OPT_UNPIN:        options.unpin = true; break;
        case OPT_SHOW_UPDATED: show_updated = true; break;
        case OPT_JSON:         json = true; break;
        default:
            return kExitUsage;
        }
    }
    if (options.pin && options.unpin) {
        return usage_error("--pin and --unpin are mutually exclusive");
    }
    for (int i = optind; i < sub.argc(); ++i) {
        options.names.push_back(sub.argv()[i]);
    }

    GitCli git(cfg.git_program, cfg.timeout_seconds);
    NixPrefetcher nix(cfg.nix_program, cfg.timeout_seconds);
    CommandContext ctx{cfg.source_file, git, nix};

    auto r = run_update(ctx, options);
    if (r.is_err()) return report_error(r.error());

    const UpdateReport& report = r.value();
    if (json) {
        std::cout << report.diff_json() << "\n";
    } else if (show_updated) {
        for (const auto& [name, diff] : report.diffs) {
            std::cout << name << ": " << diff.old_version << " -> " << diff.new_version << "\n";
        }
    }
    return report.errors > 0 ? kExitError : kExitOk;
}

int cmd_delete(const Config& cfg, const std::vector<std::string>& args) {
    if (args.size() < 2) return usage_error("delete expects at least one source name");
    std::vector<std::string> names(args.begin() + 1, args.end());
    auto r = run_delete(cfg.source_file, names);
    if (r.is_err()) return report_error(r.error());
    return kExitOk;
}

int cmd_edit(const Config& cfg, const std::vector<std::string>& args) {
    if (args.size() != 4) return usage_error("edit expects <name> <key> <value>");
    auto key = parse_edit_key(args[2]);
    if (!key) {
        return usage_error("unknown key '" + args[2] +
                           "' (expected pinned, unpack, artifact_url_template, repo_url, "
                           "tag_prefix, branch or short_hash_length)");
    }
    auto r = run_edit(cfg.source_file, args[1], *key, args[3]);
    if (r.is_err()) return report_error(r.error());
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions cli;
    if (!parse_global(argc, argv, cli)) {
        return kExitUsage;
    }
    if (cli.help) {
        print_help();
        return kExitOk;
    }
    if (cli.command.empty()) {
        print_help();
        return kExitUsage;
    }

    auto cfg = load_config(cli);
    if (cfg.is_err()) return report_error(cfg.error());

    log::set_level(cfg.value().log_level);
    if (cfg.value().color.has_value()) {
        log::set_color_enabled(*cfg.value().color);
    }
    log::debug("using lockfile %s", cfg.value().source_file.c_str());

    const std::string& cmd = cli.command;
    if (cmd == "init") return cmd_init(cfg.value(), cli.args);
    if (cmd == "add") return cmd_add(cfg.value(), cli.args);
    if (cmd == "update") return cmd_update(cfg.value(), cli.args);
    if (cmd == "delete") return cmd_delete(cfg.value(), cli.args);
    if (cmd == "edit") return cmd_edit(cfg.value(), cli.args);

    return usage_error("unknown command '" + cmd + "'");
}
