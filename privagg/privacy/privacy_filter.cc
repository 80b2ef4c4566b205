#include "privagg/privacy/privacy_filter.h"

#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "absl/random/random.h"
#include "absl/strings/str_cat.h"
#include "privagg/common/macros.h"

namespace privagg::privacy {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Box-Muller transform over two uniform draws in [0, 1). A zero first draw
// is rejected to keep the logarithm finite.
double GaussianSample(absl::BitGenRef gen) {
  double u1;
  double u2;
  do {
    u1 = absl::Uniform<double>(gen, 0.0, 1.0);
    u2 = absl::Uniform<double>(gen, 0.0, 1.0);
  } while (u1 == 0.0);
  return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * kPi * u2);
}

int32_t MaxRepresentable(uint32_t bits) { return bits == 8 ? 127 : 32767; }

}  // namespace

absl::Status ValidatePrivacyBudget(const PrivacyBudget &budget) {
  if (!(budget.epsilon > 0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Privacy epsilon must be positive, got ", budget.epsilon));
  }
  if (!(budget.delta_dp > 0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Privacy delta must be positive, got ", budget.delta_dp));
  }
  if (!(budget.sensitivity >= 0)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Sensitivity must be non-negative, got ", budget.sensitivity));
  }
  return absl::OkStatus();
}

double GaussianNoiseSigma(const PrivacyBudget &budget) {
  return budget.sensitivity * std::sqrt(2.0 * std::log(1.25 / budget.delta_dp)) /
         budget.epsilon;
}

WeightDelta ClipGradients(const WeightDelta &delta, double max_norm) {
  const double norm = L2Norm(delta);
  if (norm <= max_norm) {
    return delta;
  }

  const double scale = max_norm / norm;
  VLOG(1) << "Clipping delta with norm " << norm << " to " << max_norm;
  WeightDelta clipped;
  for (const auto &[name, values] : delta) {
    std::vector<float> c(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
      c[i] = static_cast<float>(values[i] * scale);
    }
    clipped.emplace(name, std::move(c));
  }
  return clipped;
}

absl::StatusOr<WeightDelta> AddGaussianNoise(const WeightDelta &delta,
                                             double epsilon,
                                             double sensitivity,
                                             double delta_dp) {
  absl::BitGen gen;
  return AddGaussianNoise(delta, PrivacyBudget{epsilon, sensitivity, delta_dp},
                          gen);
}

absl::StatusOr<WeightDelta> AddGaussianNoise(const WeightDelta &delta,
                                             const PrivacyBudget &budget,
                                             absl::BitGenRef gen) {
  RETURN_IF_ERROR(ValidatePrivacyBudget(budget));

  const double sigma = GaussianNoiseSigma(budget);
  VLOG(1) << "Adding Gaussian noise with sigma " << sigma << " to "
          << NumElements(delta) << " elements.";

  WeightDelta noisy;
  for (const auto &[name, values] : delta) {
    std::vector<float> n(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
      n[i] = static_cast<float>(values[i] + GaussianSample(gen) * sigma);
    }
    noisy.emplace(name, std::move(n));
  }
  return noisy;
}

absl::StatusOr<QuantizedWeightMap> Quantize(const WeightDelta &delta,
                                            uint32_t bits) {
  if (bits != 8 && bits != 16) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unsupported quantization bit width: ", bits));
  }
  const auto max_val = MaxRepresentable(bits);

  QuantizedWeightMap result;
  for (const auto &[name, values] : delta) {
    float abs_max = 0;
    for (auto v : values) {
      abs_max = std::max(abs_max, std::fabs(v));
    }

    QuantizedTensor q;
    q.bits = bits;
    q.scale = abs_max / static_cast<float>(max_val);
    if (!(q.scale > 0)) {
      // All zero, or so close to zero that the division underflowed.
      q.scale = abs_max > 0 ? std::numeric_limits<float>::denorm_min() : 1.0f;
    }
    q.zero_point = 0;
    q.data.resize(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
      auto r = std::lround(values[i] / q.scale);
      // Division rounding can land one step past the range at |x| == max.
      if (r > max_val) r = max_val;
      if (r < -max_val) r = -max_val;
      q.data[i] = static_cast<int16_t>(r);
    }
    result.emplace(name, std::move(q));
  }
  return result;
}

WeightMap Dequantize(const QuantizedWeightMap &quantized) {
  WeightMap result;
  for (const auto &[name, q] : quantized) {
    std::vector<float> values(q.data.size());
    for (size_t i = 0; i < q.data.size(); ++i) {
      values[i] = static_cast<float>(q.data[i] - q.zero_point) * q.scale;
    }
    result.emplace(name, std::move(values));
  }
  return result;
}

}  // namespace privagg::privacy
