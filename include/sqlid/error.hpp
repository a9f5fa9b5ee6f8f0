#pragma once

#include <string>

namespace sqlid {

struct SqlidError {
    enum Code {
        Empty,
        LeadingChar,
        InvalidChar,
        Duplicate,
        IO,
        Parse,
        Config
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    int column = 0;

    SqlidError() = default;
    SqlidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SqlidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SqlidError(Code c, std::string msg, std::string h, std::string f,
               int l, int col = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l), column(col) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace sqlid
