#ifndef PRIVAGG_PRIVAGG_COMMON_PROTO_TENSOR_SERDE_H_
#define PRIVAGG_PRIVAGG_COMMON_PROTO_TENSOR_SERDE_H_

#include <google/protobuf/text_format.h>

#include <cstring>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "privagg/common/macros.h"
#include "privagg/common/weight_map.h"
#include "privagg/proto/model.pb.h"

namespace privagg {
namespace proto {

class TensorOps {
 public:
  template <typename T>
  static absl::StatusOr<std::vector<T>> DeserializeTensor(
      const privagg::Tensor &tensor) {
    const auto tensor_elements_num = tensor.length();
    if (tensor.value().size() != tensor_elements_num * sizeof(T)) {
      return absl::DataLossError(absl::StrCat(
          "Tensor \"", tensor.name(), "\" declares ", tensor_elements_num,
          " elements but carries ", tensor.value().size(), " bytes."));
    }
    std::vector<T> deserialized_tensor(tensor_elements_num);
    if (tensor_elements_num > 0) {
      std::memcpy(&deserialized_tensor[0], tensor.value().data(),
                  tensor_elements_num * sizeof(T));
    }
    return deserialized_tensor;
  }

  template <typename T>
  static std::string SerializeTensor(const std::vector<T> &v) {
    auto num_elements = v.size();
    std::string serialized_tensor(num_elements * sizeof(T), '\0');
    if (num_elements > 0) {
      std::memcpy(&serialized_tensor[0], &v[0], num_elements * sizeof(T));
    }
    return serialized_tensor;
  }

  // FLOAT32 tensors, one per WeightMap entry, in name order.
  static privagg::Model ToModel(const WeightMap &weights, bool masked);

  // Inverse of ToModel(). Quantized tensors are rejected; decode them with
  // ToQuantizedWeightMap() and dequantize instead.
  static absl::StatusOr<WeightMap> ToWeightMap(const privagg::Model &model);

  static privagg::Model ToModel(const QuantizedWeightMap &quantized);

  static absl::StatusOr<QuantizedWeightMap> ToQuantizedWeightMap(
      const privagg::Model &model);

  template <typename T>
  static T ParseTextOrDie(const std::string &input) {
    T result;
    VALIDATE(google::protobuf::TextFormat::ParseFromString(input, &result));
    return result;
  }
};

}  // namespace proto
}  // namespace privagg

#endif  // PRIVAGG_PRIVAGG_COMMON_PROTO_TENSOR_SERDE_H_
