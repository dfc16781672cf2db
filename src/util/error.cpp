#include <folio/error.hpp>

namespace folio {

namespace {

struct CodeInfo {
    FolioError::Code code;
    const char* name;
    bool expected;
};

// Expected codes are conditions a caller can act on; the rest are
// infrastructure failures (git missing, disk errors, database down)
constexpr CodeInfo CODES[] = {
    {FolioError::NotFound,          "NotFound",          true},
    {FolioError::PermissionDenied,  "PermissionDenied",  true},
    {FolioError::Conflict,          "Conflict",          true},
    {FolioError::ExternalTool,      "ExternalTool",      false},
    {FolioError::Validation,        "Validation",        true},
    {FolioError::InconsistentState, "InconsistentState", false},
    {FolioError::IO,                "IO",                false},
    {FolioError::Database,          "Database",          false},
    {FolioError::Parse,             "Parse",             false},
    {FolioError::Config,            "Config",            false},
    {FolioError::InvalidArg,        "InvalidArg",        true},
};

const CodeInfo* find_code(FolioError::Code c) {
    for (const auto& info : CODES) {
        if (info.code == c) return &info;
    }
    return nullptr;
}

} // namespace

const char* FolioError::code_name(Code c) {
    const CodeInfo* info = find_code(c);
    return info ? info->name : "Unknown";
}

bool FolioError::is_expected() const {
    const CodeInfo* info = find_code(code);
    return info && info->expected;
}

FolioError FolioError::with_context(const std::string& where) const {
    FolioError out = *this;
    out.message = where + ": " + message;
    return out;
}

std::string FolioError::format() const {
    std::string out = std::string("error[") + code_name(code) + "]: " + message;
    if (!hint.empty()) out += "\n  hint: " + hint;
    return out;
}

} // namespace folio
