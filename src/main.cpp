// voxpipe CLI
// Usage: voxpipe-cli -m <model.onnx> -p "ids" [-o output.wav] [--speed 1.0]
//
// Drives the synthesizer from a simulated host frame loop: one cooperative
// step per frame, sleeping between frames.

#include "voxpipe.h"
#include "config.h"
#include "io/wav_writer.h"
#include "log.h"
#include "synthesizer.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <thread>

namespace fs = std::filesystem;

static void print_usage(const char* prog) {
    printf("Usage: %s [options]\n\n", prog);
    printf("Piper-style ONNX speech synthesis\n\n");
    printf("Options:\n");
    printf("  -m, --model PATH      ONNX model file (required)\n");
    printf("  -p, --prompt TEXT     Phoneme ids to synthesize (required)\n");
    printf("                        sentences split by '|' or newline, ids by space or ','\n");
    printf("  -o, --output PATH     Output WAV file (default: output.wav)\n");
    printf("  --voice NAME          Phonemizer voice (default: %s)\n", voxpipe::config::DEFAULT_VOICE);
    printf("  --speed FLOAT         Length scale (default: %.2f)\n", voxpipe::config::DEFAULT_SPEED);
    printf("  --pitch FLOAT         Noise scale (default: %.2f)\n", voxpipe::config::DEFAULT_PITCH);
    printf("  --glottal FLOAT       Noise width (default: %.2f)\n", voxpipe::config::DEFAULT_GLOTTAL);
    printf("  --sample-rate N       Output sample rate (default: %d)\n", voxpipe::config::DEFAULT_SAMPLE_RATE);
    printf("  --backend NAME        cpu, cuda, rocm, coreml, directml (default: cpu)\n");
    printf("  --threads N           Intra-op threads, 0 = runtime default (default: 0)\n");
    printf("  --data DIR            Phonemizer data directory (default: %s)\n", voxpipe::config::DEFAULT_DATA_PATH);
    printf("  --verbose             Debug logging\n");
    printf("  --quiet               Errors only\n");
    printf("  -v, --version         Print version and exit\n");
    printf("  -h, --help            Show this help\n");
    printf("\nExample:\n");
    printf("  %s -m en_US-lessac-medium.onnx -p \"1 20 35 3 | 1 41 12 3\" -o hello.wav\n", prog);
}

int main(int argc, char** argv) {
    const char* model_path = nullptr;
    const char* prompt = nullptr;
    const char* output_path = "output.wav";
    voxpipe::SynthConfig cfg;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            printf("voxpipe version %s\n", voxpipe_version());
            voxpipe_print_system_info();
            return 0;
        }
        if ((arg == "-m" || arg == "--model") && i + 1 < argc) {
            model_path = argv[++i];
        } else if ((arg == "-p" || arg == "--prompt") && i + 1 < argc) {
            prompt = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--voice" && i + 1 < argc) {
            cfg.voice = argv[++i];
        } else if (arg == "--speed" && i + 1 < argc) {
            cfg.speed = std::atof(argv[++i]);
        } else if (arg == "--pitch" && i + 1 < argc) {
            cfg.pitch = std::atof(argv[++i]);
        } else if (arg == "--glottal" && i + 1 < argc) {
            cfg.glottal = std::atof(argv[++i]);
        } else if (arg == "--sample-rate" && i + 1 < argc) {
            cfg.sample_rate = std::atoi(argv[++i]);
        } else if (arg == "--backend" && i + 1 < argc) {
            const char* name = argv[++i];
            if (!voxpipe::parse_backend(name, cfg.backend)) {
                fprintf(stderr, "Error: unknown backend: %s\n", name);
                return 1;
            }
        } else if (arg == "--threads" && i + 1 < argc) {
            cfg.num_threads = std::atoi(argv[++i]);
        } else if (arg == "--data" && i + 1 < argc) {
            cfg.phonemizer_data_path = argv[++i];
        } else if (arg == "--verbose") {
            cfg.log_level = voxpipe::LogLevel::Debug;
        } else if (arg == "--quiet") {
            cfg.log_level = voxpipe::LogLevel::Error;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!model_path || !prompt) {
        fprintf(stderr, "Error: --model and --prompt are required\n");
        print_usage(argv[0]);
        return 1;
    }
    if (cfg.sample_rate <= 0) {
        fprintf(stderr, "Error: --sample-rate must be positive\n");
        return 1;
    }
    if (!fs::exists(model_path)) {
        fprintf(stderr, "Error: model not found: %s\n", model_path);
        return 1;
    }

    const bool chatty = cfg.log_level != voxpipe::LogLevel::Error;
    if (chatty) {
        printf("Model: %s\n", model_path);
        printf("Prompt: %s\n", prompt);
        printf("Backend: %s\n", voxpipe::backend_name(cfg.backend));
        printf("Output: %s\n\n", output_path);
    }

    fs::path out(output_path);
    if (out.has_parent_path()) fs::create_directories(out.parent_path());

    voxpipe::StderrLogger logger(cfg.log_level);
    voxpipe::Synthesizer synth(cfg, model_path, logger);
    if (!synth.is_ready()) {
        fprintf(stderr, "Error: %s\n", synth.get_error().c_str());
        return 1;
    }

    if (!synth.begin(prompt)) {
        fprintf(stderr, "Error: %s\n", synth.get_error().c_str());
        return 1;
    }

    // Host frame loop
    size_t frames = 0;
    auto t0 = std::chrono::steady_clock::now();
    while (synth.advance() == voxpipe::Progress::Pending) {
        ++frames;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    auto t1 = std::chrono::steady_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    voxpipe::SynthesisResult result = synth.take_result();
    for (const auto& skip : result.report.skipped) {
        fprintf(stderr, "Skipped sentence %zu (%s): %s\n", skip.sentence_index,
                voxpipe::skip_reason_name(skip.reason), skip.message.c_str());
    }

    if (!result.ok()) {
        fprintf(stderr, "Error: synthesis failed: %s\n", voxpipe::synthesis_status_name(result.status));
        return 1;
    }

    voxpipe::io::AudioClip clip = synth.make_clip(result);
    if (chatty) {
        printf("Generated %.2f seconds of audio in %zu frames (%.0f ms)\n",
               clip.duration_seconds(), frames, ms);
    }

    if (voxpipe::io::write_wav(output_path, clip) != 0) {
        fprintf(stderr, "Error: failed to write WAV\n");
        return 1;
    }

    if (chatty) {
        printf("Saved to: %s\n", output_path);
    }
    return 0;
}
