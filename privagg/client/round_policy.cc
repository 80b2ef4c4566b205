#include "privagg/client/round_policy.h"

#include <google/protobuf/text_format.h>

#include <fstream>
#include <sstream>

#include "absl/strings/str_cat.h"
#include "privagg/common/macros.h"

namespace privagg::client {

absl::Status ValidateRoundPolicy(const RoundPolicy &policy) {
  if (policy.has_differential_privacy()) {
    const auto &dp = policy.differential_privacy();
    if (dp.clipping_norm() < 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("Clipping norm must be non-negative, got ",
                       dp.clipping_norm(), "."));
    }
    if (dp.has_budget()) {
      RETURN_IF_ERROR(
          privacy::ValidatePrivacyBudget(ToPrivacyBudget(dp.budget())));
    }
  }

  if (policy.has_quantization()) {
    const auto bits = policy.quantization().bits();
    if (bits != 0 && bits != 8 && bits != 16) {
      return absl::InvalidArgumentError(
          absl::StrCat("Quantization supports 8 or 16 bits, got ", bits, "."));
    }
  }

  if (policy.has_secure_aggregation() &&
      policy.secure_aggregation().threshold() < 1) {
    return absl::InvalidArgumentError(
        "Secure aggregation threshold must be at least 1.");
  }
  return absl::OkStatus();
}

absl::StatusOr<RoundPolicy> ParseRoundPolicy(const std::string &text) {
  RoundPolicy policy;
  if (!google::protobuf::TextFormat::ParseFromString(text, &policy)) {
    return absl::InvalidArgumentError("Unable to parse round policy.");
  }
  RETURN_IF_ERROR(ValidateRoundPolicy(policy));
  return policy;
}

absl::StatusOr<RoundPolicy> LoadRoundPolicy(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return absl::NotFoundError(
        absl::StrCat("Cannot open round policy file ", path, "."));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ParseRoundPolicy(buffer.str());
}

}  // namespace privagg::client
