#include "sanitize/frame_policy.h"

namespace mp3sanitize {

const char* frameDecisionToString(FrameDecision decision) {
    switch (decision) {
    case FrameDecision::Keep:
        return "keep";
    case FrameDecision::Drop:
        return "drop";
    case FrameDecision::KeepMutated:
        return "keep_mutated";
    default:
        return "unknown";
    }
}

FrameDecision decideFrame(mpeg::FrameType type, mpeg::MetadataKind kind,
                          const SanitizeOptions& options) {
    switch (type) {
    case mpeg::FrameType::Audio:
        return options.mangle ? FrameDecision::KeepMutated : FrameDecision::Keep;
    case mpeg::FrameType::Metadata:
        return options.keeps(kind) ? FrameDecision::Keep : FrameDecision::Drop;
    case mpeg::FrameType::Invalid:
    default:
        return FrameDecision::Keep;
    }
}

}  // namespace mp3sanitize
