// Inference output -> flat sample run
// Validation and linear copy only; no resampling or filtering.

#ifndef VOXPIPE_CORE_OUTPUT_EXTRACTOR_H
#define VOXPIPE_CORE_OUTPUT_EXTRACTOR_H

#include "core/tensor.h"
#include "core/types.h"

#include <optional>

namespace voxpipe {
namespace output_extractor {

// Throws EmptyOutputError when the output is absent or has no elements,
// OutputTypeMismatchError when it is not a float32 tensor.
SampleRun extract(const std::optional<Tensor>& output);

} // namespace output_extractor
} // namespace voxpipe

#endif // VOXPIPE_CORE_OUTPUT_EXTRACTOR_H
