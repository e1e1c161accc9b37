#ifndef MP3SANITIZE_ERROR_CODES_H
#define MP3SANITIZE_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace mp3sanitize {

/**
 * @brief Error codes for the sanitizer.
 *
 * Categories use upper 4 bits of the 16-bit value (0xF000 mask):
 * - 0x1xxx: Input file
 * - 0x2xxx: Output file
 * - 0x3xxx: Rotation (replace-original)
 * - 0x4xxx: Run control
 * - 0x5xxx: Validation
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Input (0x1000)
    INPUT_UNSUPPORTED_FORMAT = 0x1001,
    INPUT_OPEN_FAILED = 0x1002,
    INPUT_READ_FAILED = 0x1003,

    // Output (0x2000)
    OUTPUT_ALREADY_PROCESSED = 0x2001,
    OUTPUT_OPEN_FAILED = 0x2002,
    OUTPUT_WRITE_FAILED = 0x2003,
    OUTPUT_METADATA_COPY_FAILED = 0x2004,

    // Rotation (0x3000)
    ROTATION_BACKUP_FAILED = 0x3001,
    ROTATION_REPLACE_FAILED = 0x3002,
    ROTATION_PARTIAL = 0x3003,

    // Run control (0x4000)
    RUN_CANCELLED_MID_FILE = 0x4001,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_LIBRARY_UNREADABLE = 0x5002,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "OUTPUT_OPEN_FAILED"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @param code The error code
 * @return Category name (e.g., "output"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @param code The error code
 * @return Hex string (e.g., "0x2002")
 */
std::string errorCodeToHex(ErrorCode code);

// Category check helpers
constexpr bool isInputError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isOutputError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isRotationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isRunControlError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}

/**
 * @brief Check if an error prevents a batch from starting at all.
 * @param code Error code
 * @return true for validation errors; per-file errors never stop a batch
 */
constexpr bool isFatalForBatch(ErrorCode code) {
    return isValidationError(code);
}

}  // namespace mp3sanitize

#endif  // MP3SANITIZE_ERROR_CODES_H
