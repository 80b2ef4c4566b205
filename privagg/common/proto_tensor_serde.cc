#include "privagg/common/proto_tensor_serde.h"

#include <cstdint>

namespace privagg {
namespace proto {

privagg::Model TensorOps::ToModel(const WeightMap &weights, bool masked) {
  privagg::Model model;
  model.set_masked(masked);
  for (const auto &[name, values] : weights) {
    auto *tensor = model.add_tensors();
    tensor->set_name(name);
    tensor->set_length(values.size());
    tensor->mutable_type()->set_type(DType_Type_FLOAT32);
    tensor->mutable_type()->set_byte_order(DType_ByteOrder_LITTLE_ENDIAN_ORDER);
    tensor->set_value(SerializeTensor<float>(values));
    tensor->set_scale(1.0f);
  }
  return model;
}

absl::StatusOr<WeightMap> TensorOps::ToWeightMap(const privagg::Model &model) {
  WeightMap weights;
  for (const auto &tensor : model.tensors()) {
    if (tensor.type().type() != DType_Type_FLOAT32) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Tensor \"", tensor.name(), "\" is not a FLOAT32 tensor."));
    }
    ASSIGN_OR_RETURN(auto values, DeserializeTensor<float>(tensor));
    if (!weights.emplace(tensor.name(), std::move(values)).second) {
      return absl::DataLossError(
          absl::StrCat("Duplicate tensor \"", tensor.name(), "\"."));
    }
  }
  return weights;
}

privagg::Model TensorOps::ToModel(const QuantizedWeightMap &quantized) {
  privagg::Model model;
  for (const auto &[name, q] : quantized) {
    auto *tensor = model.add_tensors();
    tensor->set_name(name);
    tensor->set_length(q.data.size());
    tensor->mutable_type()->set_byte_order(DType_ByteOrder_LITTLE_ENDIAN_ORDER);
    if (q.bits == 8) {
      tensor->mutable_type()->set_type(DType_Type_INT8);
      std::vector<int8_t> packed(q.data.begin(), q.data.end());
      tensor->set_value(SerializeTensor<int8_t>(packed));
    } else {
      tensor->mutable_type()->set_type(DType_Type_INT16);
      tensor->set_value(SerializeTensor<int16_t>(q.data));
    }
    tensor->set_scale(q.scale);
    tensor->set_zero_point(q.zero_point);
  }
  return model;
}

absl::StatusOr<QuantizedWeightMap> TensorOps::ToQuantizedWeightMap(
    const privagg::Model &model) {
  QuantizedWeightMap quantized;
  for (const auto &tensor : model.tensors()) {
    QuantizedTensor q;
    q.scale = tensor.scale();
    q.zero_point = tensor.zero_point();
    if (tensor.type().type() == DType_Type_INT8) {
      ASSIGN_OR_RETURN(auto packed, DeserializeTensor<int8_t>(tensor));
      q.bits = 8;
      q.data.assign(packed.begin(), packed.end());
    } else if (tensor.type().type() == DType_Type_INT16) {
      ASSIGN_OR_RETURN(q.data, DeserializeTensor<int16_t>(tensor));
      q.bits = 16;
    } else {
      return absl::InvalidArgumentError(absl::StrCat(
          "Tensor \"", tensor.name(), "\" is not a quantized tensor."));
    }
    if (!quantized.emplace(tensor.name(), std::move(q)).second) {
      return absl::DataLossError(
          absl::StrCat("Duplicate tensor \"", tensor.name(), "\"."));
    }
  }
  return quantized;
}

}  // namespace proto
}  // namespace privagg
