#include <kunai/config.hpp>

#include <toml++/toml.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace kunai {

static KunaiError wrong_type(const std::string& origin, const std::string& key,
                             const char* expected, const toml::node& node) {
    const auto& where = node.source().begin;
    return KunaiError{KunaiError::Config,
        "config key '" + key + "' must be " + expected,
        "", origin, static_cast<int>(where.line), static_cast<int>(where.column)};
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        const auto& where = e.source().begin;
        return KunaiError{KunaiError::Config,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(where.line), static_cast<int>(where.column)};
    }

    Config cfg;

    if (auto node = doc.get("source_file")) {
        auto v = node->value<std::string>();
        if (!v) return wrong_type(origin, "source_file", "a string", *node);
        cfg.source_file = *v;
        cfg.source_file_set = true;
    }

    if (auto node = doc.get("log_level")) {
        auto v = node->value<std::string>();
        if (!v) return wrong_type(origin, "log_level", "a string", *node);
        auto lvl = log::parse_level(*v);
        if (!lvl) {
            return wrong_type(origin, "log_level",
                              "one of off, trace, debug, info, warn, error", *node);
        }
        cfg.log_level = *lvl;
        cfg.log_level_set = true;
    }

    if (auto node = doc.get("color")) {
        auto v = node->value<bool>();
        if (!v) return wrong_type(origin, "color", "a boolean", *node);
        cfg.color = *v;
    }

    // [tools] section
    if (auto tools_node = doc.get("tools")) {
        auto tools = tools_node->as_table();
        if (!tools) return wrong_type(origin, "tools", "a table", *tools_node);

        if (auto node = tools->get("git")) {
            auto v = node->value<std::string>();
            if (!v || v->empty()) return wrong_type(origin, "tools.git", "a program name", *node);
            cfg.git_program = *v;
            cfg.git_program_set = true;
        }
        if (auto node = tools->get("nix")) {
            auto v = node->value<std::string>();
            if (!v || v->empty()) return wrong_type(origin, "tools.nix", "a program name", *node);
            cfg.nix_program = *v;
            cfg.nix_program_set = true;
        }
        if (auto node = tools->get("timeout")) {
            auto v = node->value<int64_t>();
            if (!v || *v < 0 || *v > 86400) {
                return wrong_type(origin, "tools.timeout",
                                  "a number of seconds between 0 and 86400", *node);
            }
            cfg.timeout_seconds = static_cast<int>(*v);
            cfg.timeout_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return KunaiError{KunaiError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.source_file_set) {
        source_file = other.source_file;
        source_file_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color.has_value()) {
        color = other.color;
    }
    if (other.git_program_set) {
        git_program = other.git_program;
        git_program_set = true;
    }
    if (other.nix_program_set) {
        nix_program = other.nix_program;
        nix_program_set = true;
    }
    if (other.timeout_set) {
        timeout_seconds = other.timeout_seconds;
        timeout_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/kunai/config.toml";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/kunai/config.toml";
}

} // namespace kunai
