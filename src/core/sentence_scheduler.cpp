#include "core/sentence_scheduler.h"

#include "core/cooperative_executor.h"
#include "core/output_extractor.h"
#include "core/tensor_builder.h"

#include <sstream>
#include <stdexcept>

namespace voxpipe {

namespace {
const char* TAG = "Scheduler";
}

// Everything that lives for exactly one sentence's inference pass.
// Destroying it abandons an unfinished run and releases the bound buffers.
struct SentenceScheduler::SentencePass {
    SentencePass(InferenceSession& s, size_t i)
        : session(s)
        , index(i)
        , executor(s)
    {
    }

    ~SentencePass() {
        executor.cancel();
        session.clear_bindings();
    }

    InferenceSession& session;
    size_t index;
    CooperativeExecutor executor;
};

SentenceScheduler::SentenceScheduler(InferenceSession& session, Logger& logger)
    : session_(session)
    , logger_(logger)
{
}

SentenceScheduler::~SentenceScheduler() {
    cancel();
}

void SentenceScheduler::begin(std::optional<PhonemeResult> phonemes, const SynthesisControls& controls) {
    if (state_ == State::Running) {
        throw std::logic_error("a synthesis request is already active");
    }

    pass_.reset();
    assembler_.reset();
    result_ = SynthesisResult{};
    phonemes_ = PhonemeResult{};
    controls_ = controls;
    cursor_ = 0;
    state_ = State::Running;

    if (!phonemes || phonemes->empty()) {
        abort_request(SynthesisStatus::NoPhonemes, "Phoneme result or sentences are absent/empty. Aborting TTS.");
        return;
    }
    phonemes_ = std::move(*phonemes);
    result_.report.sentences_total = phonemes_.size();

    const ModelInputSpec& spec = session_.input_spec();
    log_input_spec(spec);

    try {
        tensor_builder::require_input_slots(spec);
    } catch (const RequestAbortError& e) {
        abort_request(SynthesisStatus::MalformedInputSpec,
                      std::string("Model does not have enough inputs defined: ") + e.what() + ". Aborting.");
        return;
    }

    std::ostringstream msg;
    msg << "Synthesizing " << phonemes_.size() << " sentence(s), scales=["
        << controls_.speed << ", " << controls_.pitch << ", " << controls_.glottal << "]";
    logger_.info(TAG, msg.str());
}

Progress SentenceScheduler::advance() {
    if (state_ != State::Running) {
        return Progress::Finished;
    }

    const size_t index = cursor_;
    try {
        if (!pass_) {
            start_sentence();
        } else {
            ++result_.report.inference_steps;
            StepResult step = pass_->executor.advance();
            if (step.done) {
                finish_sentence();
            }
        }
    } catch (const RequestAbortError& e) {
        abort_request(SynthesisStatus::MalformedInputSpec, e.what());
    } catch (const SentenceSkipError& e) {
        skip_sentence(index, e.reason(), e.what());
    } catch (const std::exception& e) {
        skip_sentence(index, SkipReason::InferenceFailed, e.what());
    }

    return state_ == State::Running ? Progress::Pending : Progress::Finished;
}

void SentenceScheduler::start_sentence() {
    const std::optional<Sentence>& sentence = phonemes_.sentences[cursor_];
    if (!sentence) {
        skip_sentence(cursor_, SkipReason::AbsentSentence, "sentence is absent");
        return;
    }
    if (sentence->phoneme_ids.empty()) {
        skip_sentence(cursor_, SkipReason::EmptySentence, "sentence has no phoneme ids");
        return;
    }

    InputTensorSet inputs = tensor_builder::build(sentence->phoneme_ids, controls_, session_.input_spec());

    logger_.debug(TAG, "Setting input: " + inputs.ids.name + " = " + describe(inputs.ids.tensor));
    logger_.debug(TAG, "Setting input: " + inputs.lengths.name + " = " + describe(inputs.lengths.tensor));
    logger_.debug(TAG, "Setting input: " + inputs.scales.name + " = " + describe(inputs.scales.tensor));

    pass_ = std::make_unique<SentencePass>(session_, cursor_);
    tensor_builder::bind_all(inputs, session_);
    pass_->executor.start();
}

void SentenceScheduler::finish_sentence() {
    SampleRun run = output_extractor::extract(session_.peek_output());

    const size_t index = pass_->index;
    const size_t steps = pass_->executor.steps();
    pass_.reset();

    std::ostringstream msg;
    msg << "Sentence " << index << ": " << run.size() << " samples in " << steps << " step(s)";
    logger_.debug(TAG, msg.str());

    assembler_.append(index, std::move(run));
    ++result_.report.sentences_synthesized;
    next_sentence();
}

void SentenceScheduler::skip_sentence(size_t index, SkipReason reason, const std::string& message) {
    pass_.reset();

    std::ostringstream msg;
    msg << "Sentence " << index << " skipped (" << skip_reason_name(reason) << "): " << message;
    logger_.warn(TAG, msg.str());

    result_.report.skipped.push_back({index, reason, message});
    next_sentence();
}

void SentenceScheduler::next_sentence() {
    ++cursor_;
    if (cursor_ >= phonemes_.size()) {
        complete_request();
    }
}

void SentenceScheduler::abort_request(SynthesisStatus status, const std::string& message) {
    logger_.error(TAG, message);
    pass_.reset();
    assembler_.reset();
    result_.status = status;
    result_.waveform.clear();
    state_ = State::Finished;
}

void SentenceScheduler::complete_request() {
    pass_.reset();
    state_ = State::Finished;

    if (assembler_.empty()) {
        logger_.warn(TAG, "No audio samples generated.");
        result_.status = SynthesisStatus::NoAudio;
        result_.waveform.clear();
        return;
    }

    result_.status = SynthesisStatus::Ok;
    result_.waveform = assembler_.take();

    std::ostringstream msg;
    msg << "Generated " << result_.waveform.size() << " samples from "
        << result_.report.sentences_synthesized << "/" << result_.report.sentences_total
        << " sentence(s), " << result_.report.skipped.size() << " skipped";
    logger_.info(TAG, msg.str());
}

void SentenceScheduler::cancel() {
    if (state_ != State::Running) {
        return;
    }
    pass_.reset();
    assembler_.reset();
    result_.status = SynthesisStatus::Cancelled;
    result_.waveform.clear();
    state_ = State::Finished;
    logger_.warn(TAG, "Synthesis cancelled at sentence " + std::to_string(cursor_));
}

SynthesisResult SentenceScheduler::take_result() {
    if (state_ != State::Finished) {
        throw std::logic_error("take_result() before the request finished");
    }
    state_ = State::Idle;
    SynthesisResult out = std::move(result_);
    result_ = SynthesisResult{};
    return out;
}

SynthesisResult SentenceScheduler::run(std::optional<PhonemeResult> phonemes,
                                       const SynthesisControls& controls,
                                       const std::function<void()>& yield) {
    begin(std::move(phonemes), controls);
    while (advance() == Progress::Pending) {
        if (yield) yield();
    }
    return take_result();
}

void SentenceScheduler::log_input_spec(const ModelInputSpec& spec) {
    logger_.info(TAG, "Model expects " + std::to_string(spec.size()) + " inputs:");
    for (size_t i = 0; i < spec.size(); ++i) {
        std::ostringstream msg;
        msg << "Input " << i << ": name=" << spec[i].name
            << ", shape=" << format_shape(spec[i].shape)
            << ", type=" << element_type_name(spec[i].type);
        logger_.info(TAG, msg.str());
    }
}

} // namespace voxpipe
