#include "config.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace voxpipe {

namespace fs = std::filesystem;

const char* backend_name(Backend backend) {
    switch (backend) {
        case Backend::Cpu:      return "cpu";
        case Backend::Cuda:     return "cuda";
        case Backend::Rocm:     return "rocm";
        case Backend::CoreMl:   return "coreml";
        case Backend::DirectMl: return "directml";
    }
    return "unknown";
}

bool parse_backend(const std::string& name, Backend& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "cpu") { out = Backend::Cpu; return true; }
    if (lower == "cuda" || lower == "gpu") { out = Backend::Cuda; return true; }
    if (lower == "rocm") { out = Backend::Rocm; return true; }
    if (lower == "coreml") { out = Backend::CoreMl; return true; }
    if (lower == "directml" || lower == "dml") { out = Backend::DirectMl; return true; }
    return false;
}

std::string resolve_data_path(const SynthConfig& cfg) {
    if (cfg.phonemizer_data_path.empty()) return {};

    fs::path data(cfg.phonemizer_data_path);
    if (data.is_absolute() || cfg.resource_dir.empty()) {
        return data.string();
    }
    return (fs::path(cfg.resource_dir) / data).lexically_normal().string();
}

} // namespace voxpipe
