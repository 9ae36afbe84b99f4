// One inference run as a resumable unit of work
//
// The executor never waits. The driver calls advance() once per host
// scheduling turn and yields between calls.

#ifndef VOXPIPE_CORE_COOPERATIVE_EXECUTOR_H
#define VOXPIPE_CORE_COOPERATIVE_EXECUTOR_H

#include "core/inference_session.h"

#include <cstddef>

namespace voxpipe {

struct StepResult {
    bool done = false;
};

class CooperativeExecutor {
public:
    explicit CooperativeExecutor(InferenceSession& session);

    // Cancels the run if it is still in flight
    ~CooperativeExecutor();

    CooperativeExecutor(const CooperativeExecutor&) = delete;
    CooperativeExecutor& operator=(const CooperativeExecutor&) = delete;

    // Begin the run (session.run()); errors propagate to the caller
    void start();

    // One step; done once the run completed or was cancelled
    StepResult advance();

    // Abandon the remaining steps. Safe to call more than once.
    void cancel();

    bool started() const { return started_; }
    bool finished() const { return finished_; }
    bool cancelled() const { return cancelled_; }
    size_t steps() const { return steps_; }

private:
    InferenceSession& session_;
    bool started_ = false;
    bool finished_ = false;
    bool cancelled_ = false;
    size_t steps_ = 0;
};

} // namespace voxpipe

#endif // VOXPIPE_CORE_COOPERATIVE_EXECUTOR_H
