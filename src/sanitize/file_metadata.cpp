#include "sanitize/file_metadata.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <vector>

#if defined(__linux__)
#include <sys/xattr.h>
#endif

namespace mp3sanitize {

namespace {

std::string describeErrno(const char* what, const std::filesystem::path& path) {
    return std::string(what) + " " + path.string() + ": " + std::strerror(errno);
}

#if defined(__linux__)
bool copyXattrs(const std::filesystem::path& from, const std::filesystem::path& to,
                std::string& error) {
    ssize_t listSize = listxattr(from.c_str(), nullptr, 0);
    if (listSize < 0) {
        if (errno == ENOTSUP) {
            return true;
        }
        error = describeErrno("listxattr", from);
        return false;
    }
    if (listSize == 0) {
        return true;
    }

    std::vector<char> names(static_cast<std::size_t>(listSize));
    listSize = listxattr(from.c_str(), names.data(), names.size());
    if (listSize < 0) {
        error = describeErrno("listxattr", from);
        return false;
    }

    std::vector<char> value;
    for (ssize_t offset = 0; offset < listSize;) {
        const char* name = names.data() + offset;
        offset += static_cast<ssize_t>(std::strlen(name)) + 1;

        ssize_t valueSize = getxattr(from.c_str(), name, nullptr, 0);
        if (valueSize < 0) {
            error = describeErrno("getxattr", from);
            return false;
        }
        value.resize(static_cast<std::size_t>(valueSize));
        valueSize = getxattr(from.c_str(), name, value.data(), value.size());
        if (valueSize < 0) {
            error = describeErrno("getxattr", from);
            return false;
        }
        if (setxattr(to.c_str(), name, value.data(), static_cast<std::size_t>(valueSize), 0) !=
            0) {
            // security.* / trusted.* need privileges the user may not have
            if (errno == EPERM || errno == ENOTSUP) {
                LOG_DEBUG("Skipping xattr {} on {}: {}", name, to.string(), std::strerror(errno));
                continue;
            }
            error = describeErrno("setxattr", to);
            return false;
        }
    }
    return true;
}
#endif

}  // namespace

const char* xattrSupportToString(XattrSupport support) {
    return support == XattrSupport::Available ? "available" : "unavailable";
}

XattrSupport detectXattrSupport(const std::filesystem::path& dir) {
#if defined(__linux__)
    if (listxattr(dir.c_str(), nullptr, 0) >= 0) {
        return XattrSupport::Available;
    }
    LOG_DEBUG("Extended attributes unavailable on {}: {}", dir.string(),
              std::strerror(errno));
    return XattrSupport::Unavailable;
#else
    (void)dir;
    return XattrSupport::Unavailable;
#endif
}

bool copyFileMetadata(const std::filesystem::path& from, const std::filesystem::path& to,
                      XattrSupport xattrs, std::string& error) {
    struct stat st {};
    if (stat(from.c_str(), &st) != 0) {
        error = describeErrno("stat", from);
        return false;
    }

    // Extended attributes first: some filesystems refuse xattr changes on read-only modes
    if (xattrs == XattrSupport::Available) {
#if defined(__linux__)
        if (!copyXattrs(from, to, error)) {
            return false;
        }
#endif
    }

    if (chmod(to.c_str(), st.st_mode & 07777) != 0) {
        error = describeErrno("chmod", to);
        return false;
    }

    const struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (utimensat(AT_FDCWD, to.c_str(), times, 0) != 0) {
        error = describeErrno("utimensat", to);
        return false;
    }
    return true;
}

}  // namespace mp3sanitize
