#include <kunai/error.hpp>

namespace kunai {

const char* KunaiError::code_name(Code c) {
    switch (c) {
        case IO:                       return "IO";
        case PermissionDenied:         return "PermissionDenied";
        case NotFound:                 return "NotFound";
        case Syntax:                   return "Syntax";
        case Schema:                   return "Schema";
        case Config:                   return "Config";
        case InvalidArg:               return "InvalidArg";
        case Duplicate:                return "Duplicate";
        case InvalidUrl:               return "InvalidUrl";
        case UrlNoBase:                return "UrlNoBase";
        case InsufficientPathSegments: return "InsufficientPathSegments";
        case BuildUrl:                 return "BuildUrl";
        case Spawn:                    return "Spawn";
        case Command:                  return "Command";
        case Timeout:                  return "Timeout";
        case PrefetchFailed:           return "PrefetchFailed";
        case MalformedResponse:        return "MalformedResponse";
        case InvalidUtf8:              return "InvalidUtf8";
        case NoTagsFitFilter:          return "NoTagsFitFilter";
        case BranchNotFound:           return "BranchNotFound";
    }
    return "Unknown";
}

std::string KunaiError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
            if (column > 0) {
                result += ":";
                result += std::to_string(column);
            }
        }
    }

    return result;
}

} // namespace kunai
