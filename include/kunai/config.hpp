#pragma once

#include <kunai/log.hpp>
#include <kunai/result.hpp>

#include <optional>
#include <string>

namespace kunai {

// Layered configuration: defaults -> global -> project-local -> command line.
// Each layer overrides only the keys it sets.
struct Config {
    std::string source_file = "kunai.lock";
    log::Level log_level = log::Info;
    std::optional<bool> color;            // unset: colored when stderr is a TTY

    // [tools]
    std::string git_program = "git";
    std::string nix_program = "nix";
    int timeout_seconds = 0;              // 0: wait for collaborators forever

    // Track which fields were explicitly set (for merge)
    bool source_file_set = false;
    bool log_level_set = false;
    bool git_program_set = false;
    bool nix_program_set = false;
    bool timeout_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; `origin` names the document in errors
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& origin = "<config>");

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// $XDG_CONFIG_HOME/kunai/config.toml, else ~/.config/kunai/config.toml
std::string global_config_path();

// Project-local overrides next to the lockfile
inline const char* local_config_path() { return ".kunai.toml"; }

} // namespace kunai
