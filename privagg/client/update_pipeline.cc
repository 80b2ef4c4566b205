#include "privagg/client/update_pipeline.h"

#include <glog/logging.h>

#include <stdexcept>
#include <utility>

#include "absl/random/random.h"
#include "absl/strings/str_cat.h"
#include "privagg/client/round_policy.h"
#include "privagg/common/macros.h"
#include "privagg/common/proto_tensor_serde.h"
#include "privagg/privacy/privacy_filter.h"

namespace privagg::client {

using privagg::proto::TensorOps;

UpdatePipeline::UpdatePipeline(std::string party_id, RoundPolicy policy)
    : party_id_(std::move(party_id)), policy_(std::move(policy)) {
  auto status = ValidateRoundPolicy(policy_);
  if (!status.ok()) {
    throw std::invalid_argument(std::string(status.message()));
  }
  if (party_id_.empty()) {
    throw std::invalid_argument("Party id cannot be empty.");
  }
}

absl::StatusOr<WeightDelta> UpdatePipeline::ApplyPrivacyFilters(
    const WeightDelta &delta, absl::BitGenRef gen) const {
  WeightDelta filtered = delta;
  if (policy_.has_differential_privacy()) {
    const auto &dp = policy_.differential_privacy();
    if (dp.clipping_norm() > 0) {
      filtered = privacy::ClipGradients(filtered, dp.clipping_norm());
    }
    if (dp.has_budget()) {
      ASSIGN_OR_RETURN(filtered,
                       privacy::AddGaussianNoise(
                           filtered, ToPrivacyBudget(dp.budget()), gen));
    }
  }

  if (quantization_bits() > 0 && masking_enabled()) {
    ASSIGN_OR_RETURN(auto quantized,
                     privacy::Quantize(filtered, quantization_bits()));
    filtered = privacy::Dequantize(quantized);
  }
  return filtered;
}

absl::StatusOr<PartyUpdate> UpdatePipeline::Encode(
    const WeightDelta &filtered, const secagg::PeerSecrets &peer_secrets,
    uint32_t num_epochs) const {
  PartyUpdate update;
  update.set_party_id(party_id_);
  update.set_round_id(policy_.round_id());
  update.set_num_epochs(num_epochs);

  if (masking_enabled()) {
    if (peer_secrets.empty()) {
      return absl::FailedPreconditionError(absl::StrCat(
          "Party ", party_id_, " has no peer secrets to mask with."));
    }
    ASSIGN_OR_RETURN(auto masks, secagg::SignedPeerMasks(
                                     party_id_, filtered, peer_secrets));
    auto masked = secagg::PairwiseMasking::MaskUpdate(filtered, masks);
    *update.mutable_model() = TensorOps::ToModel(masked, /*masked=*/true);
    LOG(INFO) << "Party " << party_id_ << " masked its update against "
              << peer_secrets.size() << " peers for round "
              << policy_.round_id();
  } else if (quantization_bits() > 0) {
    ASSIGN_OR_RETURN(auto quantized,
                     privacy::Quantize(filtered, quantization_bits()));
    *update.mutable_model() = TensorOps::ToModel(quantized);
  } else {
    *update.mutable_model() = TensorOps::ToModel(filtered, /*masked=*/false);
  }
  return update;
}

absl::StatusOr<PartyUpdate> UpdatePipeline::Process(
    const WeightDelta &delta, const secagg::PeerSecrets &peer_secrets,
    uint32_t num_epochs) const {
  absl::BitGen gen;
  ASSIGN_OR_RETURN(auto filtered, ApplyPrivacyFilters(delta, gen));
  return Encode(filtered, peer_secrets, num_epochs);
}

}  // namespace privagg::client
