// Phoneme ids + synthesis controls -> the three model input tensors
//
// Inputs are matched to the model purely by position:
//   slot 0: phoneme ids      int64 [1, N]
//   slot 1: input lengths    int64 [1]      = {N}
//   slot 2: scales           float32 [3]    = {speed, pitch, glottal}

#ifndef VOXPIPE_CORE_TENSOR_BUILDER_H
#define VOXPIPE_CORE_TENSOR_BUILDER_H

#include "core/inference_session.h"
#include "core/tensor.h"
#include "core/types.h"

#include <string>
#include <vector>

namespace voxpipe {

struct NamedTensor {
    std::string name;
    Tensor tensor;
};

struct InputTensorSet {
    NamedTensor ids;
    NamedTensor lengths;
    NamedTensor scales;
};

namespace tensor_builder {

// Throws RequestAbortError when spec declares fewer than 3 inputs
void require_input_slots(const ModelInputSpec& spec);

// Throws RequestAbortError (spec) or InputBuildError (ids)
InputTensorSet build(const std::vector<int64_t>& phoneme_ids,
                     const SynthesisControls& controls,
                     const ModelInputSpec& spec);

// Bind the three tensors to the session, moving ownership into it
void bind_all(InputTensorSet& inputs, InferenceSession& session);

} // namespace tensor_builder
} // namespace voxpipe

#endif // VOXPIPE_CORE_TENSOR_BUILDER_H
