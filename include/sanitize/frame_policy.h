#pragma once

#include "mpeg/frame.h"
#include "sanitize/sanitize_options.h"

namespace mp3sanitize {

enum class FrameDecision {
    Keep,
    Drop,
    KeepMutated,
};

const char* frameDecisionToString(FrameDecision decision);

/**
 * @brief Per-frame keep/drop/mutate decision. Pure: depends only on frame type and options.
 *
 * Audio frames are kept (mutated when mangling), metadata frames are kept only if their
 * category is kept. Invalid spans are not subject to policy: whatever the classifier emits
 * is passed through.
 */
FrameDecision decideFrame(mpeg::FrameType type, mpeg::MetadataKind kind,
                          const SanitizeOptions& options);

inline FrameDecision decideFrame(const mpeg::Frame& frame, const SanitizeOptions& options) {
    return decideFrame(frame.type, frame.kind, options);
}

}  // namespace mp3sanitize
