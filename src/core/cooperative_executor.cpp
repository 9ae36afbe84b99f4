#include "core/cooperative_executor.h"

#include <stdexcept>

namespace voxpipe {

CooperativeExecutor::CooperativeExecutor(InferenceSession& session)
    : session_(session)
{
}

CooperativeExecutor::~CooperativeExecutor() {
    cancel();
}

void CooperativeExecutor::start() {
    if (started_) {
        throw std::logic_error("CooperativeExecutor::start() called twice");
    }
    started_ = true;
    session_.run();
}

StepResult CooperativeExecutor::advance() {
    if (!started_) {
        throw std::logic_error("CooperativeExecutor::advance() before start()");
    }
    if (finished_ || cancelled_) {
        return {true};
    }

    ++steps_;
    try {
        if (!session_.advance()) {
            finished_ = true;
        }
    } catch (const std::exception&) {
        // A failed run is over; nothing is left to cancel
        finished_ = true;
        throw;
    }
    return {finished_};
}

void CooperativeExecutor::cancel() {
    if (!started_ || finished_ || cancelled_) {
        return;
    }
    cancelled_ = true;
    if (session_.is_running()) {
        session_.cancel();
    }
}

} // namespace voxpipe
