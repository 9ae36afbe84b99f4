// Inference session interface
// Bind named inputs, start a run, advance it step by step, read the output.

#ifndef VOXPIPE_CORE_INFERENCE_SESSION_H
#define VOXPIPE_CORE_INFERENCE_SESSION_H

#include "core/tensor.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voxpipe {

// One declared model input (dynamic dims shown as -1)
struct InputSlot {
    std::string name;
    std::vector<int64_t> shape;
    ElementType type = ElementType::Unknown;
};

using ModelInputSpec = std::vector<InputSlot>;

/**
 * A loaded, runnable model.
 *
 * At most one run is in flight per session. A run is started with run() and
 * then driven by repeated advance() calls; each call does a bounded amount of
 * work and returns true while more steps remain. Errors are reported as the
 * exceptions in core/errors.h.
 */
class InferenceSession {
public:
    virtual ~InferenceSession() = default;

    // Inputs as declared by the model, in declaration order
    virtual const ModelInputSpec& input_spec() const = 0;

    // Associate a buffer with a declared input; last bind wins.
    // The session owns the buffer until clear_bindings().
    virtual void bind(const std::string& name, Tensor tensor) = 0;

    // Begin execution. Throws MissingInputError if a declared input is
    // unbound, SessionBusyError if a run is already in flight.
    virtual void run() = 0;

    // One step of the in-flight run; false once the run has completed
    virtual bool advance() = 0;

    virtual bool is_running() const = 0;

    // Primary output of the last completed run; nullopt before completion
    virtual std::optional<Tensor> peek_output() const = 0;

    // Release every bound input buffer and the last output
    virtual void clear_bindings() = 0;

    // Abandon the in-flight run, if any; no further steps are taken
    virtual void cancel() = 0;
};

} // namespace voxpipe

#endif // VOXPIPE_CORE_INFERENCE_SESSION_H
