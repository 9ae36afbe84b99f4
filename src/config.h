// Synthesis configuration
// Defaults for the component plus the backend selector

#ifndef VOXPIPE_CONFIG_H
#define VOXPIPE_CONFIG_H

#include "log.h"

#include <cstddef>
#include <string>

namespace voxpipe {

// Configuration constants
namespace config {
    // Audio
    constexpr int DEFAULT_SAMPLE_RATE = 22050;
    constexpr int CLIP_CHANNELS = 1;

    // Piper input scales: [speed, pitch, glottal]
    constexpr float DEFAULT_SPEED = 1.0f;
    constexpr float DEFAULT_PITCH = 1.0f;
    constexpr float DEFAULT_GLOTTAL = 0.8f;

    // Phonemizer
    constexpr const char* DEFAULT_VOICE = "en-us";
    constexpr const char* DEFAULT_DATA_PATH = "espeak-ng-data";

    // Model contract: ids, lengths, scales bound by position
    constexpr size_t REQUIRED_INPUTS = 3;
    constexpr size_t CONTROL_COUNT = 3;

    constexpr const char* CLIP_NAME = "voxpipe";
}

// Inference backends (ONNX Runtime execution providers)
enum class Backend {
    Cpu,
    Cuda,
    Rocm,
    CoreMl,
    DirectMl,
};

const char* backend_name(Backend backend);

// Parse "cpu", "cuda", "rocm", "coreml", "directml" (case-insensitive)
// Returns false and leaves out untouched on unknown names
bool parse_backend(const std::string& name, Backend& out);

struct SynthConfig {
    int sample_rate = config::DEFAULT_SAMPLE_RATE;

    float speed = config::DEFAULT_SPEED;
    float pitch = config::DEFAULT_PITCH;
    float glottal = config::DEFAULT_GLOTTAL;

    std::string voice = config::DEFAULT_VOICE;

    // Phonemizer data directory, resolved against resource_dir when relative
    std::string phonemizer_data_path = config::DEFAULT_DATA_PATH;
    std::string resource_dir = ".";

    Backend backend = Backend::Cpu;
    int num_threads = 0;  // 0 = let ORT decide

    LogLevel log_level = LogLevel::Info;
};

// Absolute or resource-relative location of the phonemizer data
std::string resolve_data_path(const SynthConfig& cfg);

} // namespace voxpipe

#endif // VOXPIPE_CONFIG_H
