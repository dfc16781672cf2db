#pragma once

#include <string>

namespace folio {

// Error value carried by Result<T>. The code decides how callers react;
// message and hint are for people.
struct FolioError {
    enum Code {
        NotFound,
        PermissionDenied,
        Conflict,
        ExternalTool,
        Validation,
        InconsistentState,
        IO,
        Database,
        Parse,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;

    FolioError() = default;
    FolioError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    FolioError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    // "error[Code]: message" plus an indented hint line when there is one
    std::string format() const;
    static const char* code_name(Code c);

    // Same error with "where: " in front of the message
    FolioError with_context(const std::string& where) const;

    // Expected conditions the caller can act on, as opposed to
    // infrastructure failures (git missing, disk errors, database down)
    bool is_expected() const;
};

} // namespace folio
