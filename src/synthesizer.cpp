#include "synthesizer.h"
#include "core/errors.h"
#include "onnx/onnx_session.h"

#include <stdexcept>

namespace voxpipe {

namespace {
const char* TAG = "Synthesizer";
}

Synthesizer::Synthesizer(const SynthConfig& config,
                         std::unique_ptr<io::Phonemizer> phonemizer,
                         std::unique_ptr<InferenceSession> session,
                         Logger& logger)
    : config_(config)
    , logger_(logger)
    , phonemizer_(std::move(phonemizer))
    , session_(std::move(session))
{
    if (!phonemizer_ || !session_) {
        error_msg_ = "Synthesizer needs both a phonemizer and an inference session";
        logger_.error(TAG, error_msg_);
        return;
    }
    scheduler_ = std::make_unique<SentenceScheduler>(*session_, logger_);
    init_phonemizer();
}

Synthesizer::Synthesizer(const SynthConfig& config, const std::string& model_path, Logger& logger)
    : config_(config)
    , logger_(logger)
    , phonemizer_(std::make_unique<io::IdListPhonemizer>())
{
    try {
        OnnxSessionOptions options;
        options.backend = config_.backend;
        options.num_threads = config_.num_threads;
        auto session = std::make_unique<OnnxSession>(model_path, options, logger_);
        if (config_.log_level == LogLevel::Debug) {
            session->printModelInfo();
        }
        session_ = std::move(session);
    } catch (const std::exception& e) {
        error_msg_ = e.what();
        logger_.error(TAG, error_msg_);
        return;
    }

    scheduler_ = std::make_unique<SentenceScheduler>(*session_, logger_);
    init_phonemizer();
}

Synthesizer::~Synthesizer() {
    shutdown();
}

void Synthesizer::init_phonemizer() {
    const std::string data_path = resolve_data_path(config_);
    if (!phonemizer_->init(data_path)) {
        error_msg_ = "Failed to initialize phonemizer: " + phonemizer_->last_error();
        logger_.error(TAG, error_msg_);
        return;
    }
    logger_.info(TAG, "Phonemizer ready, data path: " + data_path);
    ready_ = true;
}

SynthesisControls Synthesizer::controls() const {
    SynthesisControls controls;
    controls.speed = config_.speed;
    controls.pitch = config_.pitch;
    controls.glottal = config_.glottal;
    return controls;
}

bool Synthesizer::begin(const std::string& text) {
    if (!ready_) {
        if (error_msg_.empty()) {
            error_msg_ = "Synthesizer is not ready";
        }
        return false;
    }
    if (scheduler_->active()) {
        logger_.warn(TAG, "A synthesis request is already running");
        return false;
    }
    if (scheduler_->finished()) {
        scheduler_->take_result();
    }

    std::optional<PhonemeResult> phonemes = phonemizer_->process(text, config_.voice);
    if (!phonemes && !phonemizer_->last_error().empty()) {
        logger_.warn(TAG, phonemizer_->last_error());
    }

    scheduler_->begin(std::move(phonemes), controls());
    return true;
}

Progress Synthesizer::advance() {
    if (!scheduler_) {
        return Progress::Finished;
    }
    return scheduler_->advance();
}

void Synthesizer::cancel() {
    if (scheduler_) {
        scheduler_->cancel();
    }
}

SynthesisResult Synthesizer::take_result() {
    if (!scheduler_) {
        throw std::logic_error("Synthesizer has no active request");
    }
    return scheduler_->take_result();
}

io::AudioClip Synthesizer::make_clip(const SynthesisResult& result) const {
    return io::create_clip(config::CLIP_NAME, result.waveform, config::CLIP_CHANNELS, config_.sample_rate);
}

SynthesisResult Synthesizer::synthesize(const std::string& text, const std::function<void()>& yield) {
    if (busy()) {
        throw Error("Synthesizer is busy");
    }
    if (!begin(text)) {
        throw Error(error_msg_);
    }
    while (advance() == Progress::Pending) {
        if (yield) yield();
    }
    return take_result();
}

void Synthesizer::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    ready_ = false;

    // Scheduler first: it still references the session
    if (scheduler_) {
        scheduler_->cancel();
        scheduler_.reset();
    }
    session_.reset();

    if (phonemizer_) {
        phonemizer_->release();
        phonemizer_.reset();
    }
    logger_.debug(TAG, "Shut down");
}

} // namespace voxpipe
