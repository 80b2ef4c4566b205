#ifndef PRIVAGG_PRIVAGG_AGGREGATION_SECURE_AGGREGATOR_H_
#define PRIVAGG_PRIVAGG_AGGREGATION_SECURE_AGGREGATOR_H_

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "privagg/common/weight_map.h"
#include "privagg/proto/model.pb.h"
#include "privagg/secagg/sec_agg_plus.h"

namespace privagg::aggregation {

// Server side of one round. Sums the updates of the parties that reported
// and removes the masks they still hold against parties that dropped out.
class SecureAggregator {
 public:
  // Throws std::invalid_argument when threshold is zero or `party_ids` is
  // empty or has duplicates.
  SecureAggregator(std::string round_id, std::vector<std::string> party_ids,
                   uint32_t threshold);

  // Accepts one update per expected party. Quantized updates are
  // dequantized on arrival.
  absl::Status InsertUpdate(const PartyUpdate &update);

  // Bundles held by the survivors of the secret between `survivor_id` and
  // `dropped_id`. Bundles for the same pair accumulate across calls.
  absl::Status InsertDroppedSecretShares(
      const std::string &survivor_id, const std::string &dropped_id,
      const std::vector<secagg::ShareBundle> &bundles);

  // Parties registered for the round that have not sent an update.
  std::vector<std::string> DroppedParties() const;

  // Unmasked sum of every received update.
  absl::StatusOr<WeightMap> Aggregate() const;

  size_t num_updates() const { return updates_.size(); }

  void Reset();

 private:
  // Per-tensor sum of the received updates, accumulated in double.
  std::map<std::string, std::vector<double>> SumUpdates() const;

  const std::string round_id_;
  const std::set<std::string> party_ids_;
  secagg::SecAggPlus secagg_;
  bool masked_ = false;
  std::map<std::string, WeightMap> updates_;
  std::map<std::pair<std::string, std::string>,
           std::vector<secagg::ShareBundle>>
      dropped_shares_;
};

}  // namespace privagg::aggregation

#endif  // PRIVAGG_PRIVAGG_AGGREGATION_SECURE_AGGREGATOR_H_
