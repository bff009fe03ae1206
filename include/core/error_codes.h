#ifndef V2V_WRAPPER_ERROR_CODES_H
#define V2V_WRAPPER_ERROR_CODES_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace v2v_wrapper {

/**
 * @brief Error codes for the conversion wrapper.
 *
 * Categories use upper 4 bits of the 16-bit code (0xF000 mask):
 * - 0x1xxx: Validation (job request, configuration)
 * - 0x2xxx: Privilege
 * - 0x3xxx: Spawn / daemonization
 * - 0x4xxx: Backend (conversion subprocess outcome)
 * - 0x5xxx: Persistence (state file)
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Validation (0x1000)
    VALIDATION_MALFORMED_JSON = 0x1001,
    VALIDATION_MISSING_KEY = 0x1002,
    VALIDATION_INVALID_TYPE = 0x1003,
    VALIDATION_INVALID_VALUE = 0x1004,
    VALIDATION_INVALID_CONFIG = 0x1005,

    // Privilege (0x2000)
    PRIVILEGE_ACCOUNT_NOT_FOUND = 0x2001,
    PRIVILEGE_DROP_FAILED = 0x2002,
    PRIVILEGE_REGAIN_POSSIBLE = 0x2003,

    // Spawn / daemonization (0x3000)
    SPAWN_EXEC_FAILED = 0x3001,
    SPAWN_PIPE_FAILED = 0x3002,
    SPAWN_LOG_OPEN_FAILED = 0x3003,
    SPAWN_SECRET_FILE_FAILED = 0x3004,
    SPAWN_DETACH_FAILED = 0x3005,

    // Backend (0x4000)
    BACKEND_NONZERO_EXIT = 0x4001,
    BACKEND_KILLED = 0x4002,
    BACKEND_ERROR_REPORTED = 0x4003,
    BACKEND_MONITOR_FAILED = 0x4004,

    // Persistence (0x5000)
    PERSISTENCE_WRITE_FAILED = 0x5001,
    PERSISTENCE_TERMINAL_WRITE_FAILED = 0x5002,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "SPAWN_EXEC_FAILED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "privilege"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @return Hex string (e.g., "0x3001")
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

/**
 * @brief Process exit status used when the error ends the wrapper before detaching.
 */
int toExitStatus(ErrorCode code);

// Category check helpers
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isPrivilegeError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isSpawnError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isBackendError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isPersistenceError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Base exception for errors that abort a wrapper phase.
 *
 * Backend failures and persistence failures are not thrown; they are recorded
 * in the state file and the wrapper log.
 */
class WrapperError : public std::runtime_error {
   public:
    WrapperError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept {
        return code_;
    }

   private:
    ErrorCode code_;
};

// Bad or missing job input. Raised before daemonization only.
class ValidationError : public WrapperError {
   public:
    explicit ValidationError(const std::string& message,
                             ErrorCode code = ErrorCode::VALIDATION_INVALID_VALUE);
};

// The wrapper cannot assume the identity the subprocess must run under.
class PrivilegeError : public WrapperError {
   public:
    explicit PrivilegeError(const std::string& message,
                            ErrorCode code = ErrorCode::PRIVILEGE_DROP_FAILED);
};

// The conversion subprocess could not be started.
class SpawnError : public WrapperError {
   public:
    explicit SpawnError(const std::string& message,
                        ErrorCode code = ErrorCode::SPAWN_EXEC_FAILED);
};

}  // namespace v2v_wrapper

#endif  // V2V_WRAPPER_ERROR_CODES_H
