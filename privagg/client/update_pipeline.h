#ifndef PRIVAGG_PRIVAGG_CLIENT_UPDATE_PIPELINE_H_
#define PRIVAGG_PRIVAGG_CLIENT_UPDATE_PIPELINE_H_

#include <string>

#include "absl/random/bit_gen_ref.h"
#include "absl/status/statusor.h"
#include "privagg/common/weight_map.h"
#include "privagg/proto/model.pb.h"
#include "privagg/proto/policy.pb.h"
#include "privagg/secagg/pairwise_masking.h"

namespace privagg::client {

// Turns a party's raw delta into the update it sends for one round:
//   clip -> noise -> quantize -> mask
// Each stage runs only when the round policy configures it.
class UpdatePipeline {
 public:
  // Throws std::invalid_argument when the policy fails ValidateRoundPolicy().
  UpdatePipeline(std::string party_id, RoundPolicy policy);

  const std::string &party_id() const { return party_id_; }

  bool masking_enabled() const { return policy_.has_secure_aggregation(); }
  uint32_t quantization_bits() const {
    return policy_.has_quantization() ? policy_.quantization().bits() : 0;
  }

  // Clipping and noise. When masking follows quantization, the delta also
  // goes through a quantize/dequantize round trip here, so the returned
  // values are exactly what the masked update will carry.
  absl::StatusOr<WeightDelta> ApplyPrivacyFilters(const WeightDelta &delta,
                                                  absl::BitGenRef gen) const;

  // Masks (or quantizes) an already filtered delta and wraps it.
  absl::StatusOr<PartyUpdate> Encode(const WeightDelta &filtered,
                                     const secagg::PeerSecrets &peer_secrets,
                                     uint32_t num_epochs = 0) const;

  absl::StatusOr<PartyUpdate> Process(const WeightDelta &delta,
                                      const secagg::PeerSecrets &peer_secrets,
                                      uint32_t num_epochs = 0) const;

 private:
  const std::string party_id_;
  const RoundPolicy policy_;
};

}  // namespace privagg::client

#endif  // PRIVAGG_PRIVAGG_CLIENT_UPDATE_PIPELINE_H_
