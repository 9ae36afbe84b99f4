// Sentence-by-sentence synthesis driver
//
// begin() sets up a request; every advance() performs one bounded stage
// (start a sentence, or one inference step, or finishing a sentence) and
// returns. The host yields to its own scheduler between calls:
//
//   scheduler.begin(phonemes, controls);
//   while (scheduler.advance() == Progress::Pending) {
//       host_yield();
//   }
//   SynthesisResult result = scheduler.take_result();

#ifndef VOXPIPE_CORE_SENTENCE_SCHEDULER_H
#define VOXPIPE_CORE_SENTENCE_SCHEDULER_H

#include "core/inference_session.h"
#include "core/types.h"
#include "core/waveform_assembler.h"
#include "log.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace voxpipe {

enum class Progress {
    Pending,
    Finished,
};

class SentenceScheduler {
public:
    SentenceScheduler(InferenceSession& session, Logger& logger);
    ~SentenceScheduler();

    SentenceScheduler(const SentenceScheduler&) = delete;
    SentenceScheduler& operator=(const SentenceScheduler&) = delete;

    // Start a request. Request-level aborts (absent phonemes, fewer than 3
    // model inputs) finish the request here, before any inference call.
    // Throws std::logic_error if a request is already active.
    void begin(std::optional<PhonemeResult> phonemes, const SynthesisControls& controls);

    Progress advance();

    // Tear down the active request: the in-flight run is abandoned, bound
    // buffers are released and the result becomes Cancelled.
    void cancel();

    bool active() const { return state_ == State::Running; }
    bool finished() const { return state_ == State::Finished; }

    // Valid once finished(); throws std::logic_error otherwise
    SynthesisResult take_result();

    // begin() + advance() until finished, calling yield between steps
    SynthesisResult run(std::optional<PhonemeResult> phonemes,
                        const SynthesisControls& controls,
                        const std::function<void()>& yield);

private:
    struct SentencePass;

    enum class State {
        Idle,
        Running,
        Finished,
    };

    void start_sentence();
    void finish_sentence();
    void skip_sentence(size_t index, SkipReason reason, const std::string& message);
    void next_sentence();
    void abort_request(SynthesisStatus status, const std::string& message);
    void complete_request();
    void log_input_spec(const ModelInputSpec& spec);

    InferenceSession& session_;
    Logger& logger_;

    State state_ = State::Idle;
    PhonemeResult phonemes_;
    SynthesisControls controls_;
    size_t cursor_ = 0;

    std::unique_ptr<SentencePass> pass_;
    WaveformAssembler assembler_;
    SynthesisResult result_;
};

} // namespace voxpipe

#endif // VOXPIPE_CORE_SENTENCE_SCHEDULER_H
