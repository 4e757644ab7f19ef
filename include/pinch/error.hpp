#pragma once

#include <string>

namespace pinch {

struct PinchError {
    enum Code {
        IO,
        Parse,
        Version,
        Config,
        InvalidArg,
        InvalidFormat,       // specifier has no leading package name
        InvalidRequirement   // constraint text is not a valid requirement
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    PinchError() = default;
    PinchError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PinchError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PinchError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pinch
