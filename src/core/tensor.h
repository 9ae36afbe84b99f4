// Owned tensor buffers exchanged between the pipeline and inference sessions

#ifndef VOXPIPE_CORE_TENSOR_H
#define VOXPIPE_CORE_TENSOR_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voxpipe {

enum class ElementType {
    Unknown,
    Float32,
    Float16,
    Float64,
    Int32,
    Int64,
};

const char* element_type_name(ElementType type);

// Bytes per element, 0 for Unknown
size_t element_size(ElementType type);

bool is_floating_point(ElementType type);

// Product of dims; dynamic (-1) dims are not valid here
size_t shape_element_count(const std::vector<int64_t>& shape);

/**
 * Typed, shaped, owned buffer.
 *
 * Storage is released with the object, so a Tensor held in a scope is freed
 * on every exit path of that scope.
 */
class Tensor {
public:
    Tensor() = default;

    // Zero-filled tensor
    Tensor(ElementType type, std::vector<int64_t> shape);

    // Copies element_count(shape) elements from data
    Tensor(ElementType type, std::vector<int64_t> shape, const void* data);

    static Tensor from_int64(const std::vector<int64_t>& values, std::vector<int64_t> shape);
    static Tensor from_int32(const std::vector<int32_t>& values, std::vector<int64_t> shape);
    static Tensor from_float(const std::vector<float>& values, std::vector<int64_t> shape);

    ElementType type() const { return type_; }
    const std::vector<int64_t>& shape() const { return shape_; }
    size_t element_count() const;
    size_t byte_size() const { return bytes_.size(); }
    bool empty() const { return element_count() == 0; }

    const void* raw_data() const { return bytes_.data(); }
    void* raw_data() { return bytes_.data(); }

    // Typed views; throw std::logic_error on element type mismatch
    const float* float_data() const;
    const int64_t* int64_data() const;
    const int32_t* int32_data() const;

private:
    ElementType type_ = ElementType::Unknown;
    std::vector<int64_t> shape_;
    std::vector<uint8_t> bytes_;
};

// "[1, 3]"
std::string format_shape(const std::vector<int64_t>& shape);

// "int64[1, 3] {1, 2, 3}" for debug logs; values are truncated to max_values
std::string describe(const Tensor& tensor, size_t max_values = 16);

} // namespace voxpipe

#endif // VOXPIPE_CORE_TENSOR_H
