#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace mp3sanitize {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Input
    {ErrorCode::INPUT_UNSUPPORTED_FORMAT, "INPUT_UNSUPPORTED_FORMAT"},
    {ErrorCode::INPUT_OPEN_FAILED, "INPUT_OPEN_FAILED"},
    {ErrorCode::INPUT_READ_FAILED, "INPUT_READ_FAILED"},

    // Output
    {ErrorCode::OUTPUT_ALREADY_PROCESSED, "OUTPUT_ALREADY_PROCESSED"},
    {ErrorCode::OUTPUT_OPEN_FAILED, "OUTPUT_OPEN_FAILED"},
    {ErrorCode::OUTPUT_WRITE_FAILED, "OUTPUT_WRITE_FAILED"},
    {ErrorCode::OUTPUT_METADATA_COPY_FAILED, "OUTPUT_METADATA_COPY_FAILED"},

    // Rotation
    {ErrorCode::ROTATION_BACKUP_FAILED, "ROTATION_BACKUP_FAILED"},
    {ErrorCode::ROTATION_REPLACE_FAILED, "ROTATION_REPLACE_FAILED"},
    {ErrorCode::ROTATION_PARTIAL, "ROTATION_PARTIAL"},

    // Run control
    {ErrorCode::RUN_CANCELLED_MID_FILE, "RUN_CANCELLED_MID_FILE"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_LIBRARY_UNREADABLE, "VALIDATION_LIBRARY_UNREADABLE"},
};

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
    if (isInputError(code)) {
        return "input";
    }
    if (isOutputError(code)) {
        return "output";
    }
    if (isRotationError(code)) {
        return "rotation";
    }
    if (isRunControlError(code)) {
        return "run_control";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

}  // namespace mp3sanitize
