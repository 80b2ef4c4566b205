#ifndef PRIVAGG_PRIVAGG_PRIVACY_PRIVACY_FILTER_H_
#define PRIVAGG_PRIVAGG_PRIVACY_PRIVACY_FILTER_H_

#include <cstdint>

#include "absl/random/bit_gen_ref.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "privagg/common/weight_map.h"

namespace privagg::privacy {

// Calibration parameters of the Gaussian mechanism.
struct PrivacyBudget {
  double epsilon;
  double sensitivity;
  double delta_dp;
};

// Epsilon and delta must be strictly positive, sensitivity non-negative.
absl::Status ValidatePrivacyBudget(const PrivacyBudget &budget);

// Noise standard deviation of the (epsilon, delta)-Gaussian mechanism:
//   sigma = sensitivity * sqrt(2 * ln(1.25 / delta)) / epsilon
double GaussianNoiseSigma(const PrivacyBudget &budget);

// Scales the delta down to `max_norm` when its L2 norm exceeds it. A delta
// already within the bound is returned unchanged.
WeightDelta ClipGradients(const WeightDelta &delta, double max_norm);

// Adds one independent N(0, sigma^2) sample per element. Every call draws
// from a freshly seeded generator, so outputs are not reproducible.
absl::StatusOr<WeightDelta> AddGaussianNoise(const WeightDelta &delta,
                                             double epsilon,
                                             double sensitivity,
                                             double delta_dp);

// Same as above but draws from `gen`, which lets tests pin the noise.
absl::StatusOr<WeightDelta> AddGaussianNoise(const WeightDelta &delta,
                                             const PrivacyBudget &budget,
                                             absl::BitGenRef gen);

// Per-tensor symmetric quantization to 8 or 16 bits (zero point is always 0).
absl::StatusOr<QuantizedWeightMap> Quantize(const WeightDelta &delta,
                                            uint32_t bits = 8);

WeightMap Dequantize(const QuantizedWeightMap &quantized);

}  // namespace privagg::privacy

#endif  // PRIVAGG_PRIVAGG_PRIVACY_PRIVACY_FILTER_H_
