#ifndef PRIVAGG_PRIVAGG_COMMON_WEIGHT_MAP_H_
#define PRIVAGG_PRIVAGG_COMMON_WEIGHT_MAP_H_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace privagg {

// Named tensors of a model, flattened. Ordered by name so that every
// traversal (norms, serialization) is deterministic.
typedef std::map<std::string, std::vector<float>> WeightMap;

// A WeightMap holding `after - before`. Produced once per local training step
// and never mutated afterwards.
typedef WeightMap WeightDelta;

// Symmetric fixed-point representation of one tensor. Values are kept in a
// 16-bit container whatever the bit width; with `bits == 8` every value lies
// in [-127, 127] and is packed as int8 on the wire.
struct QuantizedTensor {
  uint32_t bits = 8;
  std::vector<int16_t> data;
  float scale = 1.0f;
  int32_t zero_point = 0;
};

typedef std::map<std::string, QuantizedTensor> QuantizedWeightMap;

// Element-wise `after - before` over every tensor of `before`. Fails with
// InvalidArgument naming the tensor when `after` lacks it or the lengths
// differ.
absl::StatusOr<WeightDelta> ComputeDelta(const WeightMap &before,
                                         const WeightMap &after);

// `weights + delta`. Tensors without a counterpart in `delta` are copied
// as-is; a counterpart of different length is an error.
absl::StatusOr<WeightMap> ApplyDelta(const WeightMap &weights,
                                     const WeightDelta &delta);

// L2 norm of all tensors flattened into one vector. Accumulates in double.
double L2Norm(const WeightMap &weights);

// Total number of elements across all tensors.
size_t NumElements(const WeightMap &weights);

}  // namespace privagg

#endif  // PRIVAGG_PRIVAGG_COMMON_WEIGHT_MAP_H_
