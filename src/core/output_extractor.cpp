#include "core/output_extractor.h"

#include <string>

namespace voxpipe {
namespace output_extractor {

SampleRun extract(const std::optional<Tensor>& output) {
    if (!output) {
        throw EmptyOutputError("output tensor is absent");
    }
    if (output->type() != ElementType::Float32) {
        throw OutputTypeMismatchError(std::string("output is ") + element_type_name(output->type()) +
                                      format_shape(output->shape()) + ", expected float32");
    }

    size_t n = output->element_count();
    if (n == 0) {
        throw EmptyOutputError("output tensor " + format_shape(output->shape()) + " has no samples");
    }

    const float* data = output->float_data();
    return SampleRun(data, data + n);
}

} // namespace output_extractor
} // namespace voxpipe
