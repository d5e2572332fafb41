#include <scribe/error.hpp>

namespace scribe {

const char* ScribeError::code_name(Code c) {
    switch (c) {
        case IO:             return "IO";
        case Parse:          return "Parse";
        case Config:         return "Config";
        case NotFound:       return "NotFound";
        case Duplicate:      return "Duplicate";
        case InvalidArg:     return "InvalidArg";
        case Unimplemented:  return "Unimplemented";
        case Undocumentable: return "Undocumentable";
    }
    return "Unknown";
}

std::string ScribeError::format() const {
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
        }
    }

    return result;
}

} // namespace scribe
