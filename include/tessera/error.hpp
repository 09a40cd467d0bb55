#pragma once

#include <string>

namespace tessera {

struct TesseraError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        NotFound,
        GlobMatch,
        ContentUnavailable,
        Corrupt,
        Cancelled
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;   // path the error refers to (root, filespec source, db)
    int line = 0;

    TesseraError() = default;
    TesseraError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TesseraError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    TesseraError(Code c, std::string msg, std::string h, std::string f, int l = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace tessera
