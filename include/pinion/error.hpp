#pragma once

#include <string>

namespace pinion {

struct PinionError {
    enum Code {
        IO,
        Parse,
        Version,
        Unparsable,
        MissingEgg,
        Conflict,
        NoConvergence,
        Unreachable,
        InvalidRef,
        Corrupt,
        Manifest,
        Config,
        Network,
        NotFound,
        InvalidArg
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    PinionError() = default;
    PinionError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PinionError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PinionError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // "where: message"; the code and hint are kept
    PinionError& prefix(const std::string& where) {
        message = where + ": " + message;
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);

    // Unreachable, InvalidRef and Corrupt: the caller may retry these
    bool is_vcs_error() const;
};

} // namespace pinion
