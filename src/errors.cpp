#include <toolguard/errors.hpp>

namespace toolguard
{

const char* error_code_name(ErrorCode code)
{
    switch (code)
    {
    case ErrorCode::EmptyInput:
        return "EMPTY_INPUT";
    case ErrorCode::CommandTooLong:
        return "COMMAND_TOO_LONG";
    case ErrorCode::ForbiddenCommand:
        return "FORBIDDEN_COMMAND";
    case ErrorCode::ShellInjectionDetected:
        return "SHELL_INJECTION_DETECTED";
    case ErrorCode::PathTraversal:
        return "PATH_TRAVERSAL";
    case ErrorCode::PathOutsideWorkspace:
        return "PATH_OUTSIDE_WORKSPACE";
    case ErrorCode::ForbiddenPath:
        return "FORBIDDEN_PATH";
    case ErrorCode::SymlinkEscape:
        return "SYMLINK_ESCAPE";
    case ErrorCode::InvalidTargetType:
        return "INVALID_TARGET_TYPE";
    case ErrorCode::MissingParameter:
        return "MISSING_PARAMETER";
    }
    return "UNKNOWN";
}

nlohmann::json SecurityError::to_json() const
{
    return nlohmann::json{{"code", code_name()}, {"message", what()}};
}

} // namespace toolguard
