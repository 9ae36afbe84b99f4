// Error taxonomy for the synthesis pipeline
//
// RequestAbortError ends the whole request. SentenceSkipError and its
// subclasses are caught at the sentence boundary; the sentence contributes no
// samples and the scheduler moves on.

#ifndef VOXPIPE_CORE_ERRORS_H
#define VOXPIPE_CORE_ERRORS_H

#include <stdexcept>
#include <string>

namespace voxpipe {

enum class SkipReason {
    AbsentSentence,
    EmptySentence,
    InputBuildFailed,
    MissingInput,
    InferenceFailed,
    EmptyOutput,
    OutputTypeMismatch,
};

const char* skip_reason_name(SkipReason reason);

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RequestAbortError : public Error {
public:
    using Error::Error;
};

class SentenceSkipError : public Error {
public:
    SentenceSkipError(SkipReason reason, const std::string& message)
        : Error(message), reason_(reason) {}

    SkipReason reason() const { return reason_; }

private:
    SkipReason reason_;
};

class InputBuildError : public SentenceSkipError {
public:
    explicit InputBuildError(const std::string& message)
        : SentenceSkipError(SkipReason::InputBuildFailed, message) {}
};

class MissingInputError : public SentenceSkipError {
public:
    explicit MissingInputError(const std::string& input_name)
        : SentenceSkipError(SkipReason::MissingInput, "input '" + input_name + "' was never bound")
        , input_name_(input_name) {}

    const std::string& input_name() const { return input_name_; }

private:
    std::string input_name_;
};

class InferenceError : public SentenceSkipError {
public:
    explicit InferenceError(const std::string& message)
        : SentenceSkipError(SkipReason::InferenceFailed, message) {}
};

class EmptyOutputError : public SentenceSkipError {
public:
    explicit EmptyOutputError(const std::string& message)
        : SentenceSkipError(SkipReason::EmptyOutput, message) {}
};

class OutputTypeMismatchError : public SentenceSkipError {
public:
    explicit OutputTypeMismatchError(const std::string& message)
        : SentenceSkipError(SkipReason::OutputTypeMismatch, message) {}
};

// run() while a run is already in flight on the same session
class SessionBusyError : public Error {
public:
    using Error::Error;
};

} // namespace voxpipe

#endif // VOXPIPE_CORE_ERRORS_H
