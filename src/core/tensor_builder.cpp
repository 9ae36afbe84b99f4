#include "core/tensor_builder.h"

#include "config.h"

#include <stdexcept>

namespace voxpipe {
namespace tensor_builder {

void require_input_slots(const ModelInputSpec& spec) {
    if (spec.size() < config::REQUIRED_INPUTS) {
        throw RequestAbortError("model declares " + std::to_string(spec.size()) +
                                " inputs, at least " + std::to_string(config::REQUIRED_INPUTS) +
                                " are required");
    }
}

InputTensorSet build(const std::vector<int64_t>& phoneme_ids,
                     const SynthesisControls& controls,
                     const ModelInputSpec& spec) {
    require_input_slots(spec);

    if (phoneme_ids.empty()) {
        throw InputBuildError("phoneme id sequence is empty");
    }
    for (size_t i = 0; i < phoneme_ids.size(); ++i) {
        if (phoneme_ids[i] < 0) {
            throw InputBuildError("negative phoneme id " + std::to_string(phoneme_ids[i]) +
                                  " at position " + std::to_string(i));
        }
    }

    const int64_t n = static_cast<int64_t>(phoneme_ids.size());

    InputTensorSet inputs;
    try {
        inputs.ids = {spec[0].name, Tensor::from_int64(phoneme_ids, {1, n})};
        inputs.lengths = {spec[1].name, Tensor::from_int64({n}, {1})};
        inputs.scales = {spec[2].name,
                         Tensor::from_float({controls.speed, controls.pitch, controls.glottal},
                                            {static_cast<int64_t>(config::CONTROL_COUNT)})};
    } catch (const std::invalid_argument& e) {
        throw InputBuildError(e.what());
    } catch (const std::bad_alloc&) {
        throw InputBuildError("out of memory allocating input tensors");
    }
    return inputs;
}

void bind_all(InputTensorSet& inputs, InferenceSession& session) {
    session.bind(inputs.ids.name, std::move(inputs.ids.tensor));
    session.bind(inputs.lengths.name, std::move(inputs.lengths.tensor));
    session.bind(inputs.scales.name, std::move(inputs.scales.tensor));
}

} // namespace tensor_builder
} // namespace voxpipe
