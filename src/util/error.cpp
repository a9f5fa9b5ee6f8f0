#include <sqlid/error.hpp>

namespace sqlid {

const char* SqlidError::code_name(Code c) {
    switch (c) {
        case Empty:       return "Empty";
        case LeadingChar: return "LeadingChar";
        case InvalidChar: return "InvalidChar";
        case Duplicate:   return "Duplicate";
        case IO:          return "IO";
        case Parse:       return "Parse";
        case Config:      return "Config";
    }
    return "Unknown";
}

std::string SqlidError::format() const {
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

} // namespace sqlid
