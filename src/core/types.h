// Pipeline data model

#ifndef VOXPIPE_CORE_TYPES_H
#define VOXPIPE_CORE_TYPES_H

#include "config.h"
#include "core/errors.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voxpipe {

// One phonemized unit of input text
struct Sentence {
    size_t index = 0;
    std::vector<int64_t> phoneme_ids;
};

// Phonemizer output for one request, in synthesis order.
// An absent entry is a sentence the phonemizer could not produce.
struct PhonemeResult {
    std::vector<std::optional<Sentence>> sentences;

    bool empty() const { return sentences.empty(); }
    size_t size() const { return sentences.size(); }
};

// Constant for every sentence of one request
struct SynthesisControls {
    float speed = config::DEFAULT_SPEED;
    float pitch = config::DEFAULT_PITCH;
    float glottal = config::DEFAULT_GLOTTAL;
};

using SampleRun = std::vector<float>;
using Waveform = std::vector<float>;

enum class SynthesisStatus {
    Ok,
    NoPhonemes,          // absent or empty PhonemeResult
    MalformedInputSpec,  // model declares fewer than 3 inputs
    NoAudio,             // every sentence was skipped
    Cancelled,           // torn down mid-request
};

const char* synthesis_status_name(SynthesisStatus status);

struct SkipRecord {
    size_t sentence_index = 0;
    SkipReason reason = SkipReason::EmptySentence;
    std::string message;
};

struct SynthesisReport {
    size_t sentences_total = 0;
    size_t sentences_synthesized = 0;
    size_t inference_steps = 0;
    std::vector<SkipRecord> skipped;
};

struct SynthesisResult {
    SynthesisStatus status = SynthesisStatus::NoAudio;
    Waveform waveform;  // empty unless status == Ok
    SynthesisReport report;

    bool ok() const { return status == SynthesisStatus::Ok; }
};

} // namespace voxpipe

#endif // VOXPIPE_CORE_TYPES_H
