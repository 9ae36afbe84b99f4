// Concatenates per-sentence sample runs into one waveform

#ifndef VOXPIPE_CORE_WAVEFORM_ASSEMBLER_H
#define VOXPIPE_CORE_WAVEFORM_ASSEMBLER_H

#include "core/types.h"

#include <cstddef>
#include <vector>

namespace voxpipe {

/**
 * Appends runs in sentence order. No cross-fading, normalization or
 * resampling: the waveform is exactly the runs laid end to end.
 *
 * Sentence indices must be strictly increasing; an out-of-order append throws
 * std::logic_error and leaves the accumulated samples untouched.
 */
class WaveformAssembler {
public:
    void append(size_t sentence_index, SampleRun run);

    size_t run_count() const { return run_lengths_.size(); }
    size_t sample_count() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    // Length of each appended run, in append order
    const std::vector<size_t>& run_lengths() const { return run_lengths_; }
    const Waveform& samples() const { return samples_; }

    // Hand the waveform to the caller and reset
    Waveform take();

    void reset();

private:
    Waveform samples_;
    std::vector<size_t> run_lengths_;
    bool has_last_ = false;
    size_t last_index_ = 0;
};

} // namespace voxpipe

#endif // VOXPIPE_CORE_WAVEFORM_ASSEMBLER_H
