// WAV output for synthesized audio
#ifndef VOXPIPE_IO_WAV_WRITER_H
#define VOXPIPE_IO_WAV_WRITER_H

#include "core/types.h"

#include <cstddef>
#include <string>

namespace voxpipe {
namespace io {

// Audio handed to the host's sink
struct AudioClip {
    std::string name;
    Waveform samples;
    int channels = 1;
    int sample_rate = 0;
    bool streaming = false;

    size_t frames() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }
    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(frames()) / sample_rate : 0.0;
    }
};

/**
 * Wrap a waveform as a non-streaming clip
 * @throws std::invalid_argument on a non-positive channel count or sample
 *         rate, or a sample count that is not a whole number of frames
 */
AudioClip create_clip(const std::string& name, Waveform samples, int channels, int sample_rate);

/**
 * Write mono float samples as 16-bit PCM, clamped to [-1, 1]
 * @return 0 on success, -1 if the file cannot be written
 */
int write_wav(const char* path, const float* audio, size_t n_samples, int sample_rate);

// Same, for a clip of any channel count
int write_wav(const std::string& path, const AudioClip& clip);

} // namespace io
} // namespace voxpipe

#endif // VOXPIPE_IO_WAV_WRITER_H
