#pragma once

#include <filesystem>
#include <string>

namespace mp3sanitize {

enum class XattrSupport {
    Unavailable,
    Available,
};

const char* xattrSupportToString(XattrSupport support);

/**
 * @brief Decide once per process whether extended attributes can be copied.
 *
 * Checks `dir` (current directory by default) with listxattr(); a platform without
 * the facility or a filesystem answering ENOTSUP yields Unavailable.
 */
XattrSupport detectXattrSupport(const std::filesystem::path& dir = ".");

/**
 * @brief Copy permissions, access/modification times and (if supported) extended attributes.
 *
 * @param error Receives a description of the first failure
 * @return true if everything applicable was copied
 */
bool copyFileMetadata(const std::filesystem::path& from, const std::filesystem::path& to,
                      XattrSupport xattrs, std::string& error);

}  // namespace mp3sanitize
