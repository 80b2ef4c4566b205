#ifndef PRIVAGG_PRIVAGG_SCENARIOS_ROUND_SIMULATION_H_
#define PRIVAGG_PRIVAGG_SCENARIOS_ROUND_SIMULATION_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "privagg/client/local_training.h"
#include "privagg/common/weight_map.h"
#include "privagg/proto/policy.pb.h"
#include "privagg/secagg/sec_agg_plus.h"

namespace privagg::scenarios {

struct RoundReport {
  // What the server recovered.
  WeightMap aggregate;
  // Plain sum of the survivors' filtered deltas.
  WeightMap expected;
  double max_abs_error = 0;
  std::vector<std::string> dropped;
  absl::Duration duration;
};

// Runs every party of a round in process: key agreement, local training,
// privacy filtering, masking, dropouts and server side recovery.
class RoundSimulation {
 public:
  // Throws std::invalid_argument for fewer than 2 parties, for an invalid
  // policy, or when the policy's threshold exceeds the number of parties.
  RoundSimulation(RoundPolicy policy, int num_parties);

  // Model with `num_tensors` tensors of `values_per_tensor` values each,
  // holding index + padding.
  static WeightMap GenerateWeights(int num_tensors, int values_per_tensor,
                                   int padding);

  // Pairwise key agreement between all parties. Required before Run() when
  // the policy enables secure aggregation.
  absl::Status Setup();

  // The last `num_dropped` parties train but never send their update.
  absl::StatusOr<RoundReport> Run(const WeightMap &global_weights,
                                  const client::TrainingConfig &config,
                                  const client::TrainStepFn &step,
                                  int num_dropped);

  const std::vector<std::string> &party_ids() const { return party_ids_; }

 private:
  uint32_t threshold() const;

  const RoundPolicy policy_;
  std::vector<std::string> party_ids_;
  std::map<std::string, std::unique_ptr<secagg::SecAggPlus>> parties_;
  std::map<std::string, secagg::PeerSecrets> secrets_;
};

}  // namespace privagg::scenarios

#endif  // PRIVAGG_PRIVAGG_SCENARIOS_ROUND_SIMULATION_H_
