#include "core/error_codes.h"

#include "core/wrapper_constants.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace v2v_wrapper {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Validation
    {ErrorCode::VALIDATION_MALFORMED_JSON, "VALIDATION_MALFORMED_JSON"},
    {ErrorCode::VALIDATION_MISSING_KEY, "VALIDATION_MISSING_KEY"},
    {ErrorCode::VALIDATION_INVALID_TYPE, "VALIDATION_INVALID_TYPE"},
    {ErrorCode::VALIDATION_INVALID_VALUE, "VALIDATION_INVALID_VALUE"},
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},

    // Privilege
    {ErrorCode::PRIVILEGE_ACCOUNT_NOT_FOUND, "PRIVILEGE_ACCOUNT_NOT_FOUND"},
    {ErrorCode::PRIVILEGE_DROP_FAILED, "PRIVILEGE_DROP_FAILED"},
    {ErrorCode::PRIVILEGE_REGAIN_POSSIBLE, "PRIVILEGE_REGAIN_POSSIBLE"},

    // Spawn
    {ErrorCode::SPAWN_EXEC_FAILED, "SPAWN_EXEC_FAILED"},
    {ErrorCode::SPAWN_PIPE_FAILED, "SPAWN_PIPE_FAILED"},
    {ErrorCode::SPAWN_LOG_OPEN_FAILED, "SPAWN_LOG_OPEN_FAILED"},
    {ErrorCode::SPAWN_SECRET_FILE_FAILED, "SPAWN_SECRET_FILE_FAILED"},
    {ErrorCode::SPAWN_DETACH_FAILED, "SPAWN_DETACH_FAILED"},

    // Backend
    {ErrorCode::BACKEND_NONZERO_EXIT, "BACKEND_NONZERO_EXIT"},
    {ErrorCode::BACKEND_KILLED, "BACKEND_KILLED"},
    {ErrorCode::BACKEND_ERROR_REPORTED, "BACKEND_ERROR_REPORTED"},
    {ErrorCode::BACKEND_MONITOR_FAILED, "BACKEND_MONITOR_FAILED"},

    // Persistence
    {ErrorCode::PERSISTENCE_WRITE_FAILED, "PERSISTENCE_WRITE_FAILED"},
    {ErrorCode::PERSISTENCE_TERMINAL_WRITE_FAILED, "PERSISTENCE_TERMINAL_WRITE_FAILED"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// String to error code mapping (reverse lookup)
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = [] {
    std::unordered_map<std::string, ErrorCode> reverse;
    for (const auto& entry : kErrorCodeStrings) {
        reverse.emplace(entry.second, entry.first);
    }
    return reverse;
}();

WrapperError::WrapperError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

ValidationError::ValidationError(const std::string& message, ErrorCode code)
    : WrapperError(code, message) {}

PrivilegeError::PrivilegeError(const std::string& message, ErrorCode code)
    : WrapperError(code, message) {}

SpawnError::SpawnError(const std::string& message, ErrorCode code)
    : WrapperError(code, message) {}

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    if (isPrivilegeError(code)) {
        return "privilege";
    }
    if (isSpawnError(code)) {
        return "spawn";
    }
    if (isBackendError(code)) {
        return "backend";
    }
    if (isPersistenceError(code)) {
        return "persistence";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

int toExitStatus(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return 0;
    }
    if (isBackendError(code)) {
        return WrapperConstants::FOREGROUND_FAILURE_EXIT;
    }
    return 1;
}

}  // namespace v2v_wrapper
