// Synthesizer: host component for one loaded voice
// Owns the phonemizer and the inference session and drives requests through
// the sentence scheduler, one cooperative step per host tick.

#ifndef VOXPIPE_SYNTHESIZER_H
#define VOXPIPE_SYNTHESIZER_H

#include "config.h"
#include "core/inference_session.h"
#include "core/sentence_scheduler.h"
#include "core/types.h"
#include "io/phonemizer.h"
#include "io/wav_writer.h"
#include "log.h"

#include <functional>
#include <memory>
#include <string>

namespace voxpipe {

class Synthesizer {
public:
    // Takes ownership of both collaborators and initializes the phonemizer
    // with the resolved data path. Construction failures leave the
    // synthesizer not ready; see get_error().
    Synthesizer(const SynthConfig& config,
                std::unique_ptr<io::Phonemizer> phonemizer,
                std::unique_ptr<InferenceSession> session,
                Logger& logger);

    // Loads an ONNX model and uses the id-list phonemizer
    Synthesizer(const SynthConfig& config, const std::string& model_path, Logger& logger);

    // Calls shutdown()
    ~Synthesizer();

    Synthesizer(const Synthesizer&) = delete;
    Synthesizer& operator=(const Synthesizer&) = delete;

    bool is_ready() const { return ready_; }
    const std::string& get_error() const { return error_msg_; }

    // Phonemize text and start a request. Returns false if the synthesizer
    // is not ready or a request is still running. A result that was never
    // taken is discarded.
    bool begin(const std::string& text);

    // One cooperative step of the active request
    Progress advance();

    bool busy() const { return scheduler_ && scheduler_->active(); }
    bool has_result() const { return scheduler_ && scheduler_->finished(); }

    // Valid once the request has finished; throws std::logic_error otherwise
    SynthesisResult take_result();

    // Package a successful result for the audio sink
    io::AudioClip make_clip(const SynthesisResult& result) const;

    // Abandon the active request; its result becomes Cancelled
    void cancel();

    // begin() + advance() until finished, yielding between steps
    SynthesisResult synthesize(const std::string& text, const std::function<void()>& yield = {});

    // Cancel any active request and release the session and phonemizer.
    // Safe to call more than once; only the first call releases anything.
    void shutdown();

    const SynthConfig& config() const { return config_; }
    SynthesisControls controls() const;

private:
    void init_phonemizer();

    SynthConfig config_;
    Logger& logger_;

    std::unique_ptr<io::Phonemizer> phonemizer_;
    std::unique_ptr<InferenceSession> session_;
    std::unique_ptr<SentenceScheduler> scheduler_;

    bool ready_ = false;
    bool shut_down_ = false;
    std::string error_msg_;
};

} // namespace voxpipe

#endif // VOXPIPE_SYNTHESIZER_H
