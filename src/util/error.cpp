#include <pinion/error.hpp>

namespace pinion {

const char* PinionError::code_name(Code c) {
    switch (c) {
        case IO:            return "IO";
        case Parse:         return "Parse";
        case Version:       return "Version";
        case Unparsable:    return "Unparsable";
        case MissingEgg:    return "MissingEgg";
        case Conflict:      return "Conflict";
        case NoConvergence: return "NoConvergence";
        case Unreachable:   return "Unreachable";
        case InvalidRef:    return "InvalidRef";
        case Corrupt:       return "Corrupt";
        case Manifest:      return "Manifest";
        case Config:        return "Config";
        case Network:       return "Network";
        case NotFound:      return "NotFound";
        case InvalidArg:    return "InvalidArg";
    }
    return "Unknown";
}

bool PinionError::is_vcs_error() const {
    return code == Unreachable || code == InvalidRef || code == Corrupt;
}

std::string PinionError::format() const {
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

} // namespace pinion
