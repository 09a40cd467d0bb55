#include <tessera/error.hpp>
#include <sstream>

namespace tessera {

namespace {

struct CodeInfo {
    TesseraError::Code code;
    const char* name;
};

constexpr CodeInfo kCodes[] = {
    {TesseraError::IO,                 "IO"},
    {TesseraError::Parse,              "Parse"},
    {TesseraError::Config,             "Config"},
    {TesseraError::InvalidArg,         "InvalidArg"},
    {TesseraError::NotFound,           "NotFound"},
    {TesseraError::GlobMatch,          "GlobMatch"},
    {TesseraError::ContentUnavailable, "ContentUnavailable"},
    {TesseraError::Corrupt,            "Corrupt"},
    {TesseraError::Cancelled,          "Cancelled"},
};

} // namespace

const char* TesseraError::code_name(Code c) {
    for (const auto& info : kCodes) {
        if (info.code == c) return info.name;
    }
    return "Unknown";
}

// error[GlobMatch]: filespecs matched no paths: 'x/*'
//   hint: check the filespec
//   --> /src/root
std::string TesseraError::format() const {
    std::ostringstream out;
    out << "error[" << code_name(code) << "]: " << message;
    if (!hint.empty()) out << "\n  hint: " << hint;
    if (!file.empty()) {
        out << "\n  --> " << file;
        if (line > 0) out << ":" << line;
    }
    return out.str();
}

} // namespace tessera
