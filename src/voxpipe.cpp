// C API over the Synthesizer

#include "voxpipe.h"
#include "config.h"
#include "io/wav_writer.h"
#include "log.h"
#include "synthesizer.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

struct voxpipe_context {
    voxpipe::SynthConfig config;
    std::unique_ptr<voxpipe::StderrLogger> logger;
    std::unique_ptr<voxpipe::Synthesizer> synth;

    voxpipe::SynthesisResult result;
    bool has_result = false;
    std::string last_error;
};

namespace {

std::string g_init_error;

voxpipe::LogLevel level_from_verbosity(int32_t verbosity) {
    if (verbosity >= 2) return voxpipe::LogLevel::Debug;
    if (verbosity == 1) return voxpipe::LogLevel::Info;
    return voxpipe::LogLevel::Error;
}

voxpipe_status to_c_status(voxpipe::SynthesisStatus status) {
    switch (status) {
        case voxpipe::SynthesisStatus::Ok:                 return VOXPIPE_STATUS_OK;
        case voxpipe::SynthesisStatus::NoPhonemes:         return VOXPIPE_STATUS_NO_PHONEMES;
        case voxpipe::SynthesisStatus::MalformedInputSpec: return VOXPIPE_STATUS_MALFORMED_INPUT_SPEC;
        case voxpipe::SynthesisStatus::NoAudio:            return VOXPIPE_STATUS_NO_AUDIO;
        case voxpipe::SynthesisStatus::Cancelled:          return VOXPIPE_STATUS_CANCELLED;
    }
    return VOXPIPE_STATUS_ERROR;
}

} // namespace

struct voxpipe_params voxpipe_default_params(void) {
    voxpipe_params params;
    params.sample_rate = voxpipe::config::DEFAULT_SAMPLE_RATE;
    params.speed = voxpipe::config::DEFAULT_SPEED;
    params.pitch = voxpipe::config::DEFAULT_PITCH;
    params.glottal = voxpipe::config::DEFAULT_GLOTTAL;
    params.voice = voxpipe::config::DEFAULT_VOICE;
    params.data_path = voxpipe::config::DEFAULT_DATA_PATH;
    params.backend = "cpu";
    params.n_threads = 0;
    params.verbosity = 1;
    return params;
}

struct voxpipe_context * voxpipe_init_from_file(const char * model_path, struct voxpipe_params params) {
    g_init_error.clear();
    if (!model_path) {
        g_init_error = "model path is NULL";
        return nullptr;
    }
    if (params.sample_rate <= 0) {
        g_init_error = "sample rate must be positive";
        return nullptr;
    }

    auto ctx = std::make_unique<voxpipe_context>();
    voxpipe::SynthConfig& cfg = ctx->config;
    cfg.sample_rate = params.sample_rate;
    cfg.speed = params.speed;
    cfg.pitch = params.pitch;
    cfg.glottal = params.glottal;
    if (params.voice) cfg.voice = params.voice;
    if (params.data_path) cfg.phonemizer_data_path = params.data_path;
    if (params.backend && !voxpipe::parse_backend(params.backend, cfg.backend)) {
        g_init_error = std::string("unknown backend: ") + params.backend;
        return nullptr;
    }
    cfg.num_threads = params.n_threads;
    cfg.log_level = level_from_verbosity(params.verbosity);

    ctx->logger = std::make_unique<voxpipe::StderrLogger>(cfg.log_level);
    try {
        ctx->synth = std::make_unique<voxpipe::Synthesizer>(cfg, model_path, *ctx->logger);
    } catch (const std::exception& e) {
        g_init_error = e.what();
        return nullptr;
    }

    if (!ctx->synth->is_ready()) {
        g_init_error = ctx->synth->get_error();
        return nullptr;
    }
    return ctx.release();
}

void voxpipe_free(struct voxpipe_context * ctx) {
    if (!ctx) return;
    if (ctx->synth) {
        ctx->synth->shutdown();
    }
    delete ctx;
}

int voxpipe_begin(struct voxpipe_context * ctx, const char * text) {
    if (!ctx || !text) return -1;
    ctx->has_result = false;
    ctx->result = voxpipe::SynthesisResult{};
    ctx->last_error.clear();

    try {
        if (!ctx->synth->begin(text)) {
            ctx->last_error = ctx->synth->busy() ? "a request is already running" : ctx->synth->get_error();
            return -1;
        }
    } catch (const std::exception& e) {
        ctx->last_error = e.what();
        return -1;
    }
    return 0;
}

enum voxpipe_status voxpipe_step(struct voxpipe_context * ctx) {
    if (!ctx) return VOXPIPE_STATUS_ERROR;
    if (ctx->has_result) return to_c_status(ctx->result.status);
    if (!ctx->synth->busy() && !ctx->synth->has_result()) {
        ctx->last_error = "no request has been started";
        return VOXPIPE_STATUS_ERROR;
    }

    try {
        if (ctx->synth->advance() == voxpipe::Progress::Pending) {
            return VOXPIPE_STATUS_PENDING;
        }
        ctx->result = ctx->synth->take_result();
        ctx->has_result = true;
    } catch (const std::exception& e) {
        ctx->last_error = e.what();
        return VOXPIPE_STATUS_ERROR;
    }
    return to_c_status(ctx->result.status);
}

void voxpipe_cancel(struct voxpipe_context * ctx) {
    if (!ctx) return;
    ctx->synth->cancel();
}

float * voxpipe_take_audio(struct voxpipe_context * ctx, size_t * n_samples) {
    if (n_samples) *n_samples = 0;
    if (!ctx || !ctx->has_result || !ctx->result.ok() || ctx->result.waveform.empty()) {
        return nullptr;
    }

    const size_t n = ctx->result.waveform.size();
    float * audio = static_cast<float *>(std::malloc(n * sizeof(float)));
    if (!audio) {
        ctx->last_error = "out of memory";
        return nullptr;
    }
    std::memcpy(audio, ctx->result.waveform.data(), n * sizeof(float));
    ctx->result.waveform.clear();
    if (n_samples) *n_samples = n;
    return audio;
}

void voxpipe_free_audio(float * audio) {
    std::free(audio);
}

int32_t voxpipe_sample_rate(const struct voxpipe_context * ctx) {
    return ctx ? ctx->config.sample_rate : 0;
}

int voxpipe_write_wav(const char * path, const float * audio, size_t n_samples, int sample_rate) {
    if (!path || (!audio && n_samples > 0) || sample_rate <= 0) return -1;
    return voxpipe::io::write_wav(path, audio, n_samples, sample_rate);
}

const char * voxpipe_version(void) {
    return VOXPIPE_VERSION;
}

const char * voxpipe_status_string(enum voxpipe_status status) {
    switch (status) {
        case VOXPIPE_STATUS_ERROR:                return "error";
        case VOXPIPE_STATUS_OK:                   return "ok";
        case VOXPIPE_STATUS_PENDING:              return "pending";
        case VOXPIPE_STATUS_NO_PHONEMES:          return "no phonemes";
        case VOXPIPE_STATUS_MALFORMED_INPUT_SPEC: return "malformed input spec";
        case VOXPIPE_STATUS_NO_AUDIO:             return "no audio";
        case VOXPIPE_STATUS_CANCELLED:            return "cancelled";
    }
    return "unknown";
}

const char * voxpipe_last_error(const struct voxpipe_context * ctx) {
    return ctx ? ctx->last_error.c_str() : g_init_error.c_str();
}

void voxpipe_print_system_info(void) {
    printf("\nSystem Information:\n");
    printf("  Version: %s\n", VOXPIPE_VERSION);

    printf("  Execution providers: CPU");
#if defined(VOXPIPE_USE_CUDA)
    printf(", CUDA");
#endif
#if defined(VOXPIPE_USE_ROCM)
    printf(", ROCm");
#endif
#if defined(VOXPIPE_USE_COREML) && defined(__APPLE__)
    printf(", CoreML");
#endif
#if defined(VOXPIPE_USE_DIRECTML)
    printf(", DirectML");
#endif
    printf("\n");

    printf("  Hardware threads: %u\n", std::thread::hardware_concurrency());
    printf("  Default sample rate: %d Hz\n", voxpipe::config::DEFAULT_SAMPLE_RATE);
}
