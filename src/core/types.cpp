#include "core/types.h"

namespace voxpipe {

const char* skip_reason_name(SkipReason reason) {
    switch (reason) {
        case SkipReason::AbsentSentence:     return "absent sentence";
        case SkipReason::EmptySentence:      return "empty sentence";
        case SkipReason::InputBuildFailed:   return "input build failed";
        case SkipReason::MissingInput:       return "missing input";
        case SkipReason::InferenceFailed:    return "inference failed";
        case SkipReason::EmptyOutput:        return "empty output";
        case SkipReason::OutputTypeMismatch: return "output type mismatch";
    }
    return "unknown";
}

const char* synthesis_status_name(SynthesisStatus status) {
    switch (status) {
        case SynthesisStatus::Ok:                 return "ok";
        case SynthesisStatus::NoPhonemes:         return "no phonemes";
        case SynthesisStatus::MalformedInputSpec: return "malformed input spec";
        case SynthesisStatus::NoAudio:            return "no audio";
        case SynthesisStatus::Cancelled:          return "cancelled";
    }
    return "unknown";
}

} // namespace voxpipe
