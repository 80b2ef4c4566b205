#include "privagg/common/weight_map.h"

#include <cmath>

#include "absl/strings/str_cat.h"

namespace privagg {

absl::StatusOr<WeightDelta> ComputeDelta(const WeightMap &before,
                                         const WeightMap &after) {
  WeightDelta delta;
  for (const auto &[name, before_values] : before) {
    auto after_itr = after.find(name);
    if (after_itr == after.end() ||
        after_itr->second.size() != before_values.size()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Weight dimension mismatch for \"", name, "\"."));
    }
    const auto &after_values = after_itr->second;
    std::vector<float> d(before_values.size());
    for (size_t i = 0; i < d.size(); ++i) {
      d[i] = after_values[i] - before_values[i];
    }
    delta.emplace(name, std::move(d));
  }
  return delta;
}

absl::StatusOr<WeightMap> ApplyDelta(const WeightMap &weights,
                                     const WeightDelta &delta) {
  WeightMap result;
  for (const auto &[name, values] : weights) {
    auto delta_itr = delta.find(name);
    if (delta_itr == delta.end()) {
      result.emplace(name, values);
      continue;
    }
    const auto &d = delta_itr->second;
    if (d.size() != values.size()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Weight dimension mismatch for \"", name, "\"."));
    }
    std::vector<float> r(values.size());
    for (size_t i = 0; i < r.size(); ++i) {
      r[i] = values[i] + d[i];
    }
    result.emplace(name, std::move(r));
  }
  return result;
}

double L2Norm(const WeightMap &weights) {
  double sum_sq = 0;
  for (const auto &[name, values] : weights) {
    for (auto v : values) {
      sum_sq += static_cast<double>(v) * static_cast<double>(v);
    }
  }
  return std::sqrt(sum_sq);
}

size_t NumElements(const WeightMap &weights) {
  size_t total = 0;
  for (const auto &[name, values] : weights) total += values.size();
  return total;
}

}  // namespace privagg
