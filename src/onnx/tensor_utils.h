#pragma once

#include "core/tensor.h"

#include <cstdint>
#include <optional>
#include <vector>
#include <onnxruntime/onnxruntime_cxx_api.h>

namespace voxpipe {

/**
 * Conversions between pipeline tensors and ONNX Runtime values.
 */
namespace tensor {

inline ONNXTensorElementDataType toOnnxType(ElementType type) {
    switch (type) {
        case ElementType::Float32: return ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT;
        case ElementType::Float16: return ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16;
        case ElementType::Float64: return ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE;
        case ElementType::Int32:   return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32;
        case ElementType::Int64:   return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64;
        case ElementType::Unknown: break;
    }
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED;
}

inline ElementType fromOnnxType(ONNXTensorElementDataType type) {
    switch (type) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:   return ElementType::Float32;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16: return ElementType::Float16;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_DOUBLE:  return ElementType::Float64;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:   return ElementType::Int32;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:   return ElementType::Int64;
        default: break;
    }
    return ElementType::Unknown;
}

/**
 * Wrap a tensor as an Ort::Value without copying
 * WARNING: The value borrows the tensor's storage; the tensor must outlive it
 * @param t Tensor with a known element type
 * @param memory_info CPU memory info
 */
inline Ort::Value borrow(Tensor& t, const Ort::MemoryInfo& memory_info) {
    const auto& shape = t.shape();
    return Ort::Value::CreateTensor(
        memory_info,
        t.raw_data(),
        t.byte_size(),
        shape.data(),
        shape.size(),
        toOnnxType(t.type())
    );
}

/**
 * Copy an Ort::Value into an owned tensor
 * @param value Output value from a run
 * @return nullopt for empty or non-tensor values; element types the pipeline
 *         does not know come back as ElementType::Unknown with no data
 */
inline std::optional<Tensor> copyOut(const Ort::Value& value) {
    if (!value || !value.IsTensor()) {
        return std::nullopt;
    }

    auto info = value.GetTensorTypeAndShapeInfo();
    ElementType type = fromOnnxType(info.GetElementType());
    std::vector<int64_t> shape = info.GetShape();

    if (type == ElementType::Unknown) {
        return Tensor(ElementType::Unknown, shape);
    }
    return Tensor(type, shape, value.GetTensorRawData());
}

/**
 * Get tensor shape from Ort::Value
 */
inline std::vector<int64_t> getShape(const Ort::Value& value) {
    auto type_info = value.GetTensorTypeAndShapeInfo();
    return type_info.GetShape();
}

} // namespace tensor
} // namespace voxpipe
