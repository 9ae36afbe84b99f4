#include "core/tensor.h"

#include <cstring>
#include <sstream>
#include <stdexcept>

namespace voxpipe {

const char* element_type_name(ElementType type) {
    switch (type) {
        case ElementType::Float32: return "float32";
        case ElementType::Float16: return "float16";
        case ElementType::Float64: return "float64";
        case ElementType::Int32:   return "int32";
        case ElementType::Int64:   return "int64";
        case ElementType::Unknown: break;
    }
    return "unknown";
}

size_t element_size(ElementType type) {
    switch (type) {
        case ElementType::Float32: return 4;
        case ElementType::Float16: return 2;
        case ElementType::Float64: return 8;
        case ElementType::Int32:   return 4;
        case ElementType::Int64:   return 8;
        case ElementType::Unknown: break;
    }
    return 0;
}

bool is_floating_point(ElementType type) {
    return type == ElementType::Float32 ||
           type == ElementType::Float16 ||
           type == ElementType::Float64;
}

size_t shape_element_count(const std::vector<int64_t>& shape) {
    size_t total = 1;
    for (auto dim : shape) {
        if (dim < 0) {
            throw std::invalid_argument("Tensor shape has dynamic dimension " + format_shape(shape));
        }
        total *= static_cast<size_t>(dim);
    }
    return total;
}

Tensor::Tensor(ElementType type, std::vector<int64_t> shape)
    : type_(type)
    , shape_(std::move(shape))
{
    bytes_.resize(shape_element_count(shape_) * element_size(type_), 0);
}

Tensor::Tensor(ElementType type, std::vector<int64_t> shape, const void* data)
    : Tensor(type, std::move(shape))
{
    if (!bytes_.empty()) {
        if (!data) {
            throw std::invalid_argument("Tensor data is null");
        }
        std::memcpy(bytes_.data(), data, bytes_.size());
    }
}

Tensor Tensor::from_int64(const std::vector<int64_t>& values, std::vector<int64_t> shape) {
    if (shape_element_count(shape) != values.size()) {
        throw std::invalid_argument("int64 tensor: " + std::to_string(values.size()) +
                                    " values do not fill shape " + format_shape(shape));
    }
    return Tensor(ElementType::Int64, std::move(shape), values.data());
}

Tensor Tensor::from_int32(const std::vector<int32_t>& values, std::vector<int64_t> shape) {
    if (shape_element_count(shape) != values.size()) {
        throw std::invalid_argument("int32 tensor: " + std::to_string(values.size()) +
                                    " values do not fill shape " + format_shape(shape));
    }
    return Tensor(ElementType::Int32, std::move(shape), values.data());
}

Tensor Tensor::from_float(const std::vector<float>& values, std::vector<int64_t> shape) {
    if (shape_element_count(shape) != values.size()) {
        throw std::invalid_argument("float tensor: " + std::to_string(values.size()) +
                                    " values do not fill shape " + format_shape(shape));
    }
    return Tensor(ElementType::Float32, std::move(shape), values.data());
}

size_t Tensor::element_count() const {
    size_t size = element_size(type_);
    return size == 0 ? 0 : bytes_.size() / size;
}

const float* Tensor::float_data() const {
    if (type_ != ElementType::Float32) {
        throw std::logic_error(std::string("float_data() on ") + element_type_name(type_) + " tensor");
    }
    return reinterpret_cast<const float*>(bytes_.data());
}

const int64_t* Tensor::int64_data() const {
    if (type_ != ElementType::Int64) {
        throw std::logic_error(std::string("int64_data() on ") + element_type_name(type_) + " tensor");
    }
    return reinterpret_cast<const int64_t*>(bytes_.data());
}

const int32_t* Tensor::int32_data() const {
    if (type_ != ElementType::Int32) {
        throw std::logic_error(std::string("int32_data() on ") + element_type_name(type_) + " tensor");
    }
    return reinterpret_cast<const int32_t*>(bytes_.data());
}

std::string format_shape(const std::vector<int64_t>& shape) {
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) out << ", ";
        if (shape[i] < 0) {
            out << "?";
        } else {
            out << shape[i];
        }
    }
    out << "]";
    return out.str();
}

std::string describe(const Tensor& tensor, size_t max_values) {
    std::ostringstream out;
    out << element_type_name(tensor.type()) << format_shape(tensor.shape()) << " {";

    size_t n = tensor.element_count();
    size_t shown = n < max_values ? n : max_values;
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) out << ", ";
        switch (tensor.type()) {
            case ElementType::Float32: out << tensor.float_data()[i]; break;
            case ElementType::Int64:   out << tensor.int64_data()[i]; break;
            case ElementType::Int32:   out << tensor.int32_data()[i]; break;
            default:                   out << "?"; break;
        }
    }
    if (shown < n) out << ", ...";
    out << "}";
    return out.str();
}

} // namespace voxpipe
