#pragma once

#include "core/cancellation.h"
#include "mpeg/frame.h"
#include "sanitize/bit_source.h"
#include "sanitize/file_metadata.h"

#include <cstddef>
#include <functional>

namespace mp3sanitize {

/**
 * @brief Process-level state handed to every pipeline invocation of a run.
 *
 * Owned by main() (or a test); the pipeline only borrows it.
 */
struct RunContext {
    CancellationFlag& cancel;
    BitSource& bits;
    XattrSupport xattrs = XattrSupport::Unavailable;

    // Called after each frame is fully written, before the cancellation check.
    std::function<void(const mpeg::Frame& frame, std::size_t framesWritten)> onFrameWritten;

    RunContext(CancellationFlag& cancelFlag, BitSource& bitSource,
               XattrSupport xattrSupport = XattrSupport::Unavailable)
        : cancel(cancelFlag), bits(bitSource), xattrs(xattrSupport) {}
};

}  // namespace mp3sanitize
