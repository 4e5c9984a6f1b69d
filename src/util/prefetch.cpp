#include <kunai/prefetch.hpp>
#include <kunai/json_util.hpp>
#include <kunai/log.hpp>
#include <kunai/process.hpp>

#include <nlohmann/json.hpp>

namespace kunai {

Result<std::string> parse_prefetch_response(const std::string& body) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        auto pos = parse_error_position(body, e.byte);
        return KunaiError{KunaiError::MalformedResponse,
            "malformed json at line " + std::to_string(pos.line) +
            ", column " + std::to_string(pos.column) + " of prefetch response",
            "response was: " + body};
    }

    if (!doc.is_object()) {
        return KunaiError{KunaiError::MalformedResponse,
            std::string("prefetch response must be a json object, got ") +
            doc.type_name(),
            "response was: " + body};
    }

    auto it = doc.find("hash");
    if (it == doc.end() || !it->is_string()) {
        auto pos = it == doc.end() ? TextPosition{}
                                   : locate_json_pointer(body, "/hash");
        return KunaiError{KunaiError::MalformedResponse,
            "incorrect json at line " + std::to_string(pos.line) +
            ", column " + std::to_string(pos.column) +
            " of prefetch response: expected string member 'hash'",
            "response was: " + body};
    }

    return Result<std::string>::ok(it->get<std::string>());
}

Result<std::string> NixPrefetcher::fetch_hash(const Url& url, bool unpack) {
    std::vector<std::string> args = {program_, "store", "prefetch-file",
                                     url.str(), "--json"};
    if (unpack) {
        args.push_back("--unpack");
    }

    log::debug("%s", command_line(args).c_str());
    auto r = run_command(args, "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        std::string detail = cmd.stderr_str;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
            detail.pop_back();
        }
        return KunaiError{KunaiError::PrefetchFailed,
            "could not fetch artifact at " + url.str(), detail};
    }

    return parse_prefetch_response(cmd.stdout_str);
}

} // namespace kunai
