#include <pinch/error.hpp>

namespace pinch {

const char* PinchError::code_name(Code c) {
    switch (c) {
        case IO:                 return "IO";
        case Parse:              return "Parse";
        case Version:            return "Version";
        case Config:             return "Config";
        case InvalidArg:         return "InvalidArg";
        case InvalidFormat:      return "InvalidFormat";
        case InvalidRequirement: return "InvalidRequirement";
    }
    return "Unknown";
}

std::string PinchError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: " + hint;
    }

    if (!file.empty()) {
        result += "\n  --> " + file;
        if (line > 0) {
            result += ":" + std::to_string(line);
        }
    }

    return result;
}

} // namespace pinch
