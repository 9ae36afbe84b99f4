// WAV writer: header, clamping, clips

#include "test_utils.h"
#include "io/wav_writer.h"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>

using namespace voxpipe;

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static uint32_t u32(const std::vector<uint8_t>& b, size_t off) {
    return b[off] | (b[off + 1] << 8) | (b[off + 2] << 16) | (static_cast<uint32_t>(b[off + 3]) << 24);
}

static uint16_t u16(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<uint16_t>(b[off] | (b[off + 1] << 8));
}

static int16_t s16(const std::vector<uint8_t>& b, size_t off) {
    return static_cast<int16_t>(u16(b, off));
}

bool test_sine_header() {
    const int sample_rate = 22050;
    const int n_samples = sample_rate;
    std::vector<float> audio(n_samples);
    for (int i = 0; i < n_samples; i++) {
        audio[i] = 0.5f * sinf(2.0f * static_cast<float>(M_PI) * 440.0f * i / sample_rate);
    }

    std::string path = test::temp_path("voxpipe_sine.wav");
    TEST_ASSERT(io::write_wav(path.c_str(), audio.data(), audio.size(), sample_rate) == 0, "write succeeds");

    auto bytes = read_file(path);
    TEST_ASSERT(bytes.size() == 44 + 2 * static_cast<size_t>(n_samples), "header + 16-bit samples");
    TEST_ASSERT(std::memcmp(bytes.data(), "RIFF", 4) == 0 && std::memcmp(bytes.data() + 8, "WAVE", 4) == 0,
                "RIFF/WAVE tags");
    TEST_ASSERT(u32(bytes, 4) == bytes.size() - 8, "RIFF size");
    TEST_ASSERT(u16(bytes, 20) == 1, "PCM format");
    TEST_ASSERT(u16(bytes, 22) == 1, "mono");
    TEST_ASSERT(u32(bytes, 24) == static_cast<uint32_t>(sample_rate), "sample rate");
    TEST_ASSERT(u32(bytes, 28) == static_cast<uint32_t>(sample_rate * 2), "byte rate");
    TEST_ASSERT(u16(bytes, 34) == 16, "16 bits");
    TEST_ASSERT(u32(bytes, 40) == 2 * static_cast<uint32_t>(n_samples), "data size");

    std::remove(path.c_str());
    TEST_PASS("sine header");
    return true;
}

bool test_clamping_without_normalization() {
    std::vector<float> audio = {2.0f, -3.0f, 0.25f, 0.0f};
    std::string path = test::temp_path("voxpipe_clamp.wav");
    TEST_ASSERT(io::write_wav(path.c_str(), audio.data(), audio.size(), 16000) == 0, "write succeeds");

    auto bytes = read_file(path);
    TEST_ASSERT(s16(bytes, 44) == 32767, "over-range clamped to +1");
    TEST_ASSERT(s16(bytes, 46) == -32767, "under-range clamped to -1");
    TEST_ASSERT(s16(bytes, 48) == static_cast<int16_t>(0.25f * 32767.0f), "in-range sample not rescaled");
    TEST_ASSERT(s16(bytes, 50) == 0, "silence stays silent");

    std::remove(path.c_str());
    TEST_PASS("clamped, not normalized");
    return true;
}

bool test_clip() {
    io::AudioClip clip = io::create_clip("voxpipe", {0.1f, 0.2f, 0.3f, 0.4f}, 2, 8000);
    TEST_ASSERT(clip.frames() == 2, "stereo frames");
    TEST_ASSERT(std::fabs(clip.duration_seconds() - 2.0 / 8000.0) < 1e-9, "duration");
    TEST_ASSERT(!clip.streaming, "not streaming");

    std::string path = test::temp_path("voxpipe_clip.wav");
    TEST_ASSERT(io::write_wav(path, clip) == 0, "clip written");
    auto bytes = read_file(path);
    TEST_ASSERT(u16(bytes, 22) == 2, "two channels");
    TEST_ASSERT(u16(bytes, 32) == 4, "block align");
    TEST_ASSERT(u32(bytes, 40) == 8, "data size");
    std::remove(path.c_str());

    TEST_ASSERT_THROWS(io::create_clip("x", {0.0f}, 0, 8000), std::invalid_argument, "zero channels");
    TEST_ASSERT_THROWS(io::create_clip("x", {0.0f}, 1, 0), std::invalid_argument, "zero sample rate");
    TEST_ASSERT_THROWS(io::create_clip("x", {0.0f, 0.1f, 0.2f}, 2, 8000), std::invalid_argument, "partial frame");
    TEST_PASS("audio clips");
    return true;
}

bool test_unwritable_path() {
    float sample = 0.0f;
    TEST_ASSERT(io::write_wav("/nonexistent-dir/voxpipe.wav", &sample, 1, 22050) == -1, "bad path fails");
    TEST_PASS("write failure reported");
    return true;
}

int main() {
    printf("voxpipe WAV writer test\n");
    printf("========================\n\n");

    test_sine_header();
    test_clamping_without_normalization();
    test_clip();
    test_unwritable_path();

    return voxpipe::test::print_summary();
}
