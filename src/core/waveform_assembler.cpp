#include "core/waveform_assembler.h"

#include <stdexcept>
#include <string>

namespace voxpipe {

void WaveformAssembler::append(size_t sentence_index, SampleRun run) {
    if (has_last_ && sentence_index <= last_index_) {
        throw std::logic_error("sample run for sentence " + std::to_string(sentence_index) +
                               " appended after sentence " + std::to_string(last_index_));
    }

    samples_.reserve(samples_.size() + run.size());
    samples_.insert(samples_.end(), run.begin(), run.end());
    run_lengths_.push_back(run.size());
    has_last_ = true;
    last_index_ = sentence_index;
}

Waveform WaveformAssembler::take() {
    Waveform out = std::move(samples_);
    reset();
    return out;
}

void WaveformAssembler::reset() {
    samples_.clear();
    run_lengths_.clear();
    has_last_ = false;
    last_index_ = 0;
}

} // namespace voxpipe
