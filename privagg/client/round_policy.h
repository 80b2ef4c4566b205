#ifndef PRIVAGG_PRIVAGG_CLIENT_ROUND_POLICY_H_
#define PRIVAGG_PRIVAGG_CLIENT_ROUND_POLICY_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "privagg/privacy/privacy_filter.h"
#include "privagg/proto/policy.pb.h"

namespace privagg::client {

// Checks every configured stage of the policy. Missing sections are valid and
// simply disable their stage.
absl::Status ValidateRoundPolicy(const RoundPolicy &policy);

// Parses a text-format RoundPolicy and validates it.
absl::StatusOr<RoundPolicy> ParseRoundPolicy(const std::string &text);

// Reads a text-format RoundPolicy from disk and validates it.
absl::StatusOr<RoundPolicy> LoadRoundPolicy(const std::string &path);

inline privacy::PrivacyBudget ToPrivacyBudget(const PrivacyBudget &budget) {
  return privacy::PrivacyBudget{budget.epsilon(), budget.sensitivity(),
                                budget.delta()};
}

}  // namespace privagg::client

#endif  // PRIVAGG_PRIVAGG_CLIENT_ROUND_POLICY_H_
