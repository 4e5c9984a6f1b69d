#include <kunai/source.hpp>
#include <kunai/json_util.hpp>
#include <kunai/log.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <climits>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <set>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace kunai {

// ---------------------------------------------------------------------------
// Source
// ---------------------------------------------------------------------------

const char* scheme_type_name(const UpdateScheme& scheme) {
    switch (scheme.index()) {
        case 0: return "git-tags";
        case 1: return "git-branch";
        case 2: return "static";
    }
    return "unknown";
}

Source::Source(std::string initial_version, std::string url_template,
               UpdateScheme scheme)
    : version(initial_version),
      latest_checked_version(std::move(initial_version)),
      artifact_url_template(std::move(url_template)),
      update_scheme(std::move(scheme)) {}

Source& Source::with_pinned(bool value) {
    pinned = value;
    return *this;
}

Source& Source::with_unpack(bool value) {
    unpack = value;
    return *this;
}

Source& Source::with_hash(std::string value) {
    hash = std::move(value);
    return *this;
}

static void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

Result<Url> Source::full_url(const std::string& for_version) const {
    std::string expanded = artifact_url_template;
    replace_all(expanded, "{version}", for_version);

    if (auto* branch = std::get_if<GitBranchScheme>(&update_scheme)) {
        replace_all(expanded, "{branch}", branch->branch);
    }

    auto url = Url::parse(expanded);
    if (url.is_err()) {
        return KunaiError{KunaiError::BuildUrl,
            "constructed full URL " + expanded + " is invalid: " + url.error().message,
            "check artifactUrlTemplate '" + artifact_url_template + "'"};
    }
    return url;
}

bool Source::operator==(const Source& o) const {
    return version == o.version &&
           latest_checked_version == o.latest_checked_version &&
           artifact_url_template == o.artifact_url_template &&
           hash == o.hash &&
           pinned == o.pinned &&
           unpack == o.unpack &&
           update_scheme == o.update_scheme;
}

// ---------------------------------------------------------------------------
// Schema validation helpers
// ---------------------------------------------------------------------------

namespace {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

std::string escape_pointer_token(const std::string& token) {
    std::string out;
    for (char c : token) {
        if (c == '~') out += "~0";
        else if (c == '/') out += "~1";
        else out += c;
    }
    return out;
}

class SchemaReader {
public:
    SchemaReader(const std::string& text, const std::string& origin)
        : text_(text), origin_(origin) {}

    KunaiError error(const std::string& pointer, const std::string& detail) const {
        auto pos = locate_json_pointer(text_, pointer);
        return KunaiError{KunaiError::Schema,
            "source file json does not conform to the kunai schema at line " +
            std::to_string(pos.line) + ", column " + std::to_string(pos.column) +
            ": " + detail,
            "fix the entry by hand or recreate the file with `kunai init`",
            origin_, pos.line, pos.column};
    }

    Status reject_unknown(const json& obj, const std::string& pointer,
                          std::initializer_list<const char*> known) const {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            bool ok = false;
            for (const char* k : known) {
                if (it.key() == k) {
                    ok = true;
                    break;
                }
            }
            if (!ok) {
                return error(pointer + "/" + escape_pointer_token(it.key()),
                             "unknown field '" + it.key() + "'");
            }
        }
        return ok_status();
    }

    Result<std::string> string(const json& obj, const std::string& pointer,
                               const char* key) const {
        auto it = obj.find(key);
        if (it == obj.end()) {
            return error(pointer, std::string("missing field '") + key + "'");
        }
        if (!it->is_string()) {
            return error(pointer + "/" + key,
                         std::string("field '") + key + "' must be a string, got " +
                         it->type_name());
        }
        return Result<std::string>::ok(it->get<std::string>());
    }

    Result<bool> boolean(const json& obj, const std::string& pointer,
                         const char* key, std::optional<bool> fallback = std::nullopt) const {
        auto it = obj.find(key);
        if (it == obj.end()) {
            if (fallback) return Result<bool>::ok(*fallback);
            return error(pointer, std::string("missing field '") + key + "'");
        }
        if (!it->is_boolean()) {
            return error(pointer + "/" + key,
                         std::string("field '") + key + "' must be a boolean, got " +
                         it->type_name());
        }
        return Result<bool>::ok(it->get<bool>());
    }

    // Absent or null -> nullopt
    Result<std::optional<std::string>> optional_string(const json& obj,
                                                        const std::string& pointer,
                                                        const char* key) const {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return Result<std::optional<std::string>>::ok(std::nullopt);
        }
        if (!it->is_string()) {
            return error(pointer + "/" + key,
                         std::string("field '") + key + "' must be a string or null, got " +
                         it->type_name());
        }
        return Result<std::optional<std::string>>::ok(it->get<std::string>());
    }

    Result<std::optional<Url>> optional_url(const json& obj, const std::string& pointer,
                                            const char* key) const {
        auto s = optional_string(obj, pointer, key);
        if (s.is_err()) return std::move(s).error();
        if (!s.value()) return Result<std::optional<Url>>::ok(std::nullopt);

        auto url = Url::parse(*s.value());
        if (url.is_err()) {
            return error(pointer + "/" + key, url.error().message);
        }
        return Result<std::optional<Url>>::ok(std::move(url).value());
    }

    Result<int> positive_int(const json& obj, const std::string& pointer,
                             const char* key) const {
        auto it = obj.find(key);
        if (it == obj.end()) {
            return error(pointer, std::string("missing field '") + key + "'");
        }
        if (!it->is_number_integer()) {
            return error(pointer + "/" + key,
                         std::string("field '") + key + "' must be an integer, got " +
                         it->type_name());
        }
        auto v = it->get<long long>();
        if (v <= 0 || v > INT_MAX) {
            return error(pointer + "/" + key,
                         std::string("field '") + key + "' must be a positive integer");
        }
        return Result<int>::ok(static_cast<int>(v));
    }

private:
    const std::string& text_;
    const std::string& origin_;
};

Result<UpdateScheme> read_scheme(const SchemaReader& rd, const json& obj,
                                 const std::string& pointer) {
    if (!obj.is_object()) {
        return rd.error(pointer, std::string("updateScheme must be an object, got ") +
                                 obj.type_name());
    }

    auto type = rd.string(obj, pointer, "type");
    if (type.is_err()) return std::move(type).error();

    if (type.value() == "git-tags") {
        KUNAI_TRY(rd.reject_unknown(obj, pointer, {"type", "repoUrl", "tagPrefix"}));
        GitTagsScheme s;
        auto repo = rd.optional_url(obj, pointer, "repoUrl");
        if (repo.is_err()) return std::move(repo).error();
        s.repo_url = std::move(repo).value();
        auto prefix = rd.optional_string(obj, pointer, "tagPrefix");
        if (prefix.is_err()) return std::move(prefix).error();
        s.tag_prefix = std::move(prefix).value();
        return Result<UpdateScheme>::ok(std::move(s));
    }

    if (type.value() == "git-branch") {
        KUNAI_TRY(rd.reject_unknown(obj, pointer,
                                    {"type", "repoUrl", "branch", "shortHashLength"}));
        GitBranchScheme s;
        auto repo = rd.optional_url(obj, pointer, "repoUrl");
        if (repo.is_err()) return std::move(repo).error();
        s.repo_url = std::move(repo).value();
        auto branch = rd.string(obj, pointer, "branch");
        if (branch.is_err()) return std::move(branch).error();
        s.branch = std::move(branch).value();
        auto len = rd.positive_int(obj, pointer, "shortHashLength");
        if (len.is_err()) return std::move(len).error();
        s.short_hash_length = len.value();
        return Result<UpdateScheme>::ok(std::move(s));
    }

    if (type.value() == "static") {
        KUNAI_TRY(rd.reject_unknown(obj, pointer, {"type"}));
        return Result<UpdateScheme>::ok(StaticScheme{});
    }

    return rd.error(pointer + "/type",
                    "unknown update scheme type '" + type.value() +
                    "' (expected git-tags, git-branch or static)");
}

Result<Source> read_source(const SchemaReader& rd, const json& obj,
                           const std::string& pointer) {
    if (!obj.is_object()) {
        return rd.error(pointer, std::string("source must be an object, got ") +
                                 obj.type_name());
    }

    KUNAI_TRY(rd.reject_unknown(obj, pointer,
        {"version", "latestCheckedVersion", "artifactUrlTemplate", "hash",
         "pinned", "unpack", "updateScheme"}));

    Source src;

    auto version = rd.string(obj, pointer, "version");
    if (version.is_err()) return std::move(version).error();
    src.version = std::move(version).value();

    auto checked = rd.string(obj, pointer, "latestCheckedVersion");
    if (checked.is_err()) return std::move(checked).error();
    src.latest_checked_version = std::move(checked).value();

    auto tmpl = rd.string(obj, pointer, "artifactUrlTemplate");
    if (tmpl.is_err()) return std::move(tmpl).error();
    src.artifact_url_template = std::move(tmpl).value();

    auto hash = rd.string(obj, pointer, "hash");
    if (hash.is_err()) return std::move(hash).error();
    src.hash = std::move(hash).value();

    auto pinned = rd.boolean(obj, pointer, "pinned");
    if (pinned.is_err()) return std::move(pinned).error();
    src.pinned = pinned.value();

    auto unpack = rd.boolean(obj, pointer, "unpack", false);
    if (unpack.is_err()) return std::move(unpack).error();
    src.unpack = unpack.value();

    auto it = obj.find("updateScheme");
    if (it == obj.end()) {
        return rd.error(pointer, "missing field 'updateScheme'");
    }
    auto scheme = read_scheme(rd, *it, pointer + "/updateScheme");
    if (scheme.is_err()) return std::move(scheme).error();
    src.update_scheme = std::move(scheme).value();

    return Result<Source>::ok(std::move(src));
}

ordered_json optional_json(const std::optional<std::string>& v) {
    return v ? ordered_json(*v) : ordered_json(nullptr);
}

ordered_json optional_json(const std::optional<Url>& v) {
    return v ? ordered_json(v->str()) : ordered_json(nullptr);
}

ordered_json scheme_to_json(const UpdateScheme& scheme) {
    ordered_json out = ordered_json::object();
    out["type"] = scheme_type_name(scheme);

    if (auto* tags = std::get_if<GitTagsScheme>(&scheme)) {
        out["repoUrl"] = optional_json(tags->repo_url);
        out["tagPrefix"] = optional_json(tags->tag_prefix);
    } else if (auto* branch = std::get_if<GitBranchScheme>(&scheme)) {
        out["repoUrl"] = optional_json(branch->repo_url);
        out["branch"] = branch->branch;
        out["shortHashLength"] = branch->short_hash_length;
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// SourceMap
// ---------------------------------------------------------------------------

Result<SourceMap> SourceMap::parse(const std::string& json_text,
                                   const std::string& origin) {
    // One frame per open container; nlohmann keeps the last duplicate silently
    struct Frame {
        bool is_array;
        std::string pointer;
        std::set<std::string> keys;
        std::string key;          // member being read
        std::size_t index = 0;    // next array element
    };
    std::vector<Frame> frames;
    std::string duplicate;        // first repeated key
    std::string duplicate_pointer;
    bool duplicate_is_source = false;

    auto child_pointer = [&]() -> std::string {
        if (frames.empty()) return "";
        Frame& parent = frames.back();
        if (parent.is_array) return parent.pointer + "/" + std::to_string(parent.index++);
        return parent.pointer + "/" + escape_pointer_token(parent.key);
    };

    json::parser_callback_t track_keys =
        [&](int, json::parse_event_t event, json& parsed) {
            switch (event) {
                case json::parse_event_t::object_start:
                case json::parse_event_t::array_start: {
                    std::string pointer = child_pointer();
                    frames.push_back(Frame{event == json::parse_event_t::array_start,
                                           std::move(pointer), {}, {}, 0});
                    break;
                }
                case json::parse_event_t::object_end:
                case json::parse_event_t::array_end:
                    if (!frames.empty()) frames.pop_back();
                    break;
                case json::parse_event_t::key:
                    if (!frames.empty() && parsed.is_string()) {
                        Frame& f = frames.back();
                        f.key = parsed.get<std::string>();
                        if (!f.keys.insert(f.key).second && duplicate.empty()) {
                            duplicate = f.key;
                            duplicate_pointer = f.pointer + "/" + escape_pointer_token(f.key);
                            duplicate_is_source = frames.size() == 1;
                        }
                    }
                    break;
                case json::parse_event_t::value:
                    if (!frames.empty() && frames.back().is_array) ++frames.back().index;
                    break;
            }
            return true;
        };

    json doc;
    try {
        doc = json::parse(json_text, track_keys);
    } catch (const json::parse_error& e) {
        auto pos = parse_error_position(json_text, e.byte);
        return KunaiError{KunaiError::Syntax,
            "source file json is malformed at line " + std::to_string(pos.line) +
            ", column " + std::to_string(pos.column),
            "the file is not valid JSON; fix it by hand or recreate it with `kunai init`",
            origin, pos.line, pos.column};
    }

    SchemaReader rd(json_text, origin);

    if (!doc.is_object()) {
        return rd.error("", std::string("top level must be an object of sources, got ") +
                            doc.type_name());
    }
    if (!duplicate.empty()) {
        return rd.error(duplicate_pointer,
                        duplicate_is_source ? "duplicate source name '" + duplicate + "'"
                                            : "duplicate field '" + duplicate + "'");
    }

    SourceMap map;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& name = it.key();
        std::string pointer = "/" + escape_pointer_token(name);
        if (name.empty()) {
            return rd.error(pointer, "source names must not be empty");
        }

        auto src = read_source(rd, it.value(), pointer);
        if (src.is_err()) return std::move(src).error();
        map.sources.emplace(name, std::move(src).value());
    }

    return Result<SourceMap>::ok(std::move(map));
}

Result<SourceMap> SourceMap::load(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return KunaiError{KunaiError::NotFound,
            "source file " + path + " does not exist",
            "create it with `kunai init` or pass --source-file"};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        int err = errno;
        if (err == EACCES || err == EPERM) {
            return KunaiError{KunaiError::PermissionDenied,
                "could not read source file " + path + "; permission denied"};
        }
        return KunaiError{KunaiError::IO,
            "could not read source file " + path + ": " + std::strerror(err)};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return KunaiError{KunaiError::IO, "error while reading source file " + path};
    }

    log::trace("loaded %zu bytes from %s", ss.str().size(), path.c_str());
    return SourceMap::parse(ss.str(), path);
}

std::string SourceMap::to_json() const {
    ordered_json doc = ordered_json::object();
    for (const auto& [name, src] : sources) {
        ordered_json entry = ordered_json::object();
        entry["version"] = src.version;
        entry["latestCheckedVersion"] = src.latest_checked_version;
        entry["artifactUrlTemplate"] = src.artifact_url_template;
        entry["hash"] = src.hash;
        entry["pinned"] = src.pinned;
        entry["unpack"] = src.unpack;
        entry["updateScheme"] = scheme_to_json(src.update_scheme);
        doc[name] = std::move(entry);
    }
    return doc.dump(2) + "\n";
}

Status SourceMap::save(const std::string& path) const {
    std::string content;
    try {
        content = to_json();
    } catch (const json::type_error& e) {
        return KunaiError{KunaiError::InvalidUtf8,
            "could not serialize source file " + path + ": " + e.what(),
            "the file was left unchanged"};
    }
    const std::string tmp_path = path + ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            int err = errno;
            if (err == EACCES || err == EPERM) {
                return KunaiError{KunaiError::PermissionDenied,
                    "could not write to source file " + path + "; permission denied"};
            }
            return KunaiError{KunaiError::IO,
                "could not write to source file " + path + ": " + std::strerror(err)};
        }
        out << content;
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp_path, ignored);
            return KunaiError{KunaiError::IO,
                "could not write to source file " + path + ": short write"};
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        auto code = ec == std::errc::permission_denied ? KunaiError::PermissionDenied
                                                       : KunaiError::IO;
        return KunaiError{code,
            "could not replace source file " + path + ": " + ec.message()};
    }

    log::debug("wrote %zu sources to %s", sources.size(), path.c_str());
    return ok_status();
}

const Source* SourceMap::find(const std::string& name) const {
    auto it = sources.find(name);
    return it == sources.end() ? nullptr : &it->second;
}

Source* SourceMap::find(const std::string& name) {
    auto it = sources.find(name);
    return it == sources.end() ? nullptr : &it->second;
}

} // namespace kunai
