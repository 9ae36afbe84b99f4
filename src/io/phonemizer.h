// Text -> phoneme id sentences
#ifndef VOXPIPE_IO_PHONEMIZER_H
#define VOXPIPE_IO_PHONEMIZER_H

#include "core/types.h"

#include <optional>
#include <string>

namespace voxpipe {
namespace io {

/**
 * Phonemizer collaborator.
 *
 * init() once with the data directory before the first process() call and
 * release() at shutdown. process() returns sentences in synthesis order;
 * nullopt or an empty result means there is nothing to synthesize.
 */
class Phonemizer {
public:
    virtual ~Phonemizer() = default;

    virtual bool init(const std::string& data_path) = 0;
    virtual void release() = 0;
    virtual bool is_ready() const = 0;

    virtual std::optional<PhonemeResult> process(const std::string& text, const std::string& voice) = 0;

    virtual const std::string& last_error() const = 0;
};

/**
 * Phonemizer for text that is already phoneme ids.
 *
 * Sentences are separated by newlines or '|', ids by whitespace or commas:
 *   "1 2 3 | 4, 5, 6"  ->  [[1, 2, 3], [4, 5, 6]]
 * Blank sentences are dropped. A sentence with a token that is not a
 * non-negative integer comes back as an absent entry so the scheduler skips
 * it while keeping its position. The voice only labels the request.
 */
class IdListPhonemizer : public Phonemizer {
public:
    IdListPhonemizer() = default;
    ~IdListPhonemizer() override;

    // The data directory is optional for id input; a path that exists but is
    // not a directory is rejected
    bool init(const std::string& data_path) override;
    void release() override;
    bool is_ready() const override { return ready_; }

    std::optional<PhonemeResult> process(const std::string& text, const std::string& voice) override;

    const std::string& last_error() const override { return last_error_; }
    const std::string& data_path() const { return data_path_; }
    const std::string& last_voice() const { return last_voice_; }

private:
    bool ready_ = false;
    std::string data_path_;
    std::string last_voice_;
    std::string last_error_;
};

// Parse one sentence of ids; nullopt on a malformed or negative token
std::optional<std::vector<int64_t>> parse_id_list(const std::string& sentence);

} // namespace io
} // namespace voxpipe

#endif // VOXPIPE_IO_PHONEMIZER_H
