#pragma once

#include <string>

namespace kunai {

struct KunaiError {
    enum Code {
        IO,
        PermissionDenied,
        NotFound,
        Syntax,
        Schema,
        Config,
        InvalidArg,
        Duplicate,
        InvalidUrl,
        UrlNoBase,
        InsufficientPathSegments,
        BuildUrl,
        Spawn,
        Command,
        Timeout,
        PrefetchFailed,
        MalformedResponse,
        InvalidUtf8,
        NoTagsFitFilter,
        BranchNotFound
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    int column = 0;

    KunaiError() = default;
    KunaiError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    KunaiError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    KunaiError(Code c, std::string msg, std::string h, std::string f,
               int l, int col = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l), column(col) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace kunai
