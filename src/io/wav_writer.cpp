// WAV File Writer
// Writes float32 audio to 16-bit PCM WAV file

#include "io/wav_writer.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace voxpipe {
namespace io {

// WAV header structure
#pragma pack(push, 1)
struct wav_header {
    char     riff[4];        // "RIFF"
    uint32_t file_size;      // File size - 8
    char     wave[4];        // "WAVE"
    char     fmt[4];         // "fmt "
    uint32_t fmt_size;       // 16 for PCM
    uint16_t audio_format;   // 1 for PCM
    uint16_t num_channels;
    uint32_t sample_rate;
    uint32_t byte_rate;      // sample_rate * block_align
    uint16_t block_align;    // num_channels * bytes_per_sample
    uint16_t bits_per_sample;// 16
    char     data[4];        // "data"
    uint32_t data_size;      // n_samples * bytes_per_sample
};
#pragma pack(pop)

AudioClip create_clip(const std::string& name, Waveform samples, int channels, int sample_rate) {
    if (channels <= 0) {
        throw std::invalid_argument("clip channel count must be positive");
    }
    if (sample_rate <= 0) {
        throw std::invalid_argument("clip sample rate must be positive");
    }
    if (samples.size() % static_cast<size_t>(channels) != 0) {
        throw std::invalid_argument("clip sample count is not a whole number of frames");
    }

    AudioClip clip;
    clip.name = name;
    clip.samples = std::move(samples);
    clip.channels = channels;
    clip.sample_rate = sample_rate;
    clip.streaming = false;
    return clip;
}

static int write_pcm16(const char* path, const float* audio, size_t n_samples,
                       int channels, int sample_rate) {
    FILE* f = fopen(path, "wb");
    if (!f) {
        return -1;
    }

    wav_header header;
    std::memcpy(header.riff, "RIFF", 4);
    std::memcpy(header.wave, "WAVE", 4);
    std::memcpy(header.fmt, "fmt ", 4);
    std::memcpy(header.data, "data", 4);

    header.fmt_size = 16;
    header.audio_format = 1;  // PCM
    header.num_channels = static_cast<uint16_t>(channels);
    header.sample_rate = static_cast<uint32_t>(sample_rate);
    header.bits_per_sample = 16;
    header.block_align = header.num_channels * (header.bits_per_sample / 8);
    header.byte_rate = header.sample_rate * header.block_align;
    header.data_size = static_cast<uint32_t>(n_samples * (header.bits_per_sample / 8));
    header.file_size = sizeof(wav_header) - 8 + header.data_size;

    bool ok = fwrite(&header, sizeof(wav_header), 1, f) == 1;

    std::vector<int16_t> pcm(n_samples);
    for (size_t i = 0; i < n_samples; i++) {
        float sample = std::max(-1.0f, std::min(1.0f, audio[i]));
        pcm[i] = static_cast<int16_t>(sample * 32767.0f);
    }
    if (ok && n_samples > 0) {
        ok = fwrite(pcm.data(), sizeof(int16_t), n_samples, f) == n_samples;
    }

    if (fclose(f) != 0) {
        ok = false;
    }
    return ok ? 0 : -1;
}

int write_wav(const char* path, const float* audio, size_t n_samples, int sample_rate) {
    return write_pcm16(path, audio, n_samples, 1, sample_rate);
}

int write_wav(const std::string& path, const AudioClip& clip) {
    if (clip.channels <= 0 || clip.sample_rate <= 0) {
        return -1;
    }
    return write_pcm16(path.c_str(), clip.samples.data(), clip.samples.size(),
                       clip.channels, clip.sample_rate);
}

} // namespace io
} // namespace voxpipe
