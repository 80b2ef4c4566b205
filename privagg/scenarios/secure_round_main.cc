#include <sys/resource.h>

#include <glog/logging.h>

#include <stdexcept>
#include <string>

#include "absl/random/random.h"
#include "privagg/client/round_policy.h"
#include "privagg/scenarios/round_simulation.h"

using namespace privagg;

namespace {

long GetTotalMemory() {
  struct rusage usage;
  getrusage(RUSAGE_SELF, &usage);
  return usage.ru_maxrss;
}

RoundPolicy CreateDefaultPolicy(int num_of_parties) {
  RoundPolicy policy;
  policy.set_round_id("round_1");
  auto *dp = policy.mutable_differential_privacy();
  dp->set_clipping_norm(1.0);
  dp->mutable_budget()->set_epsilon(1.0);
  dp->mutable_budget()->set_sensitivity(0.01);
  dp->mutable_budget()->set_delta(1e-5);
  policy.mutable_quantization()->set_bits(16);
  policy.mutable_secure_aggregation()->set_threshold(num_of_parties / 2 + 1);
  return policy;
}

}  // namespace

int main(int argc, char *argv[]) {

  // Verify Input Parameters
  if (argc < 5) {
    throw std::runtime_error(
        "Insufficient input arguments. Need to provide values for:\n"
        "Num-of-Parties, Number-of-Tensors, Values-Per-Tensor, "
        "Num-of-Dropouts [, Policy-File]");
  }

  // Set flags picked up by glog before initialization.
  FLAGS_log_dir = "/tmp";
  FLAGS_alsologtostderr = true;
  google::InitGoogleLogging(argv[0]);

  int num_of_parties = std::stoi(argv[1], nullptr, 10);
  int num_of_tensors = std::stoi(argv[2], nullptr, 10);
  int values_per_tensor = std::stoi(argv[3], nullptr, 10);
  int num_of_dropouts = std::stoi(argv[4], nullptr, 10);

  LOG(INFO) << "Number of parties: " << num_of_parties;
  LOG(INFO) << "Number of dropouts: " << num_of_dropouts;

  RoundPolicy policy = CreateDefaultPolicy(num_of_parties);
  if (argc > 5) {
    auto loaded = client::LoadRoundPolicy(argv[5]);
    if (!loaded.ok()) {
      LOG(ERROR) << loaded.status();
      return 1;
    }
    policy = *std::move(loaded);
  }
  LOG(INFO) << "Round policy: " << policy.ShortDebugString();

  scenarios::RoundSimulation simulation(policy, num_of_parties);
  auto status = simulation.Setup();
  if (!status.ok()) {
    LOG(ERROR) << status;
    return 1;
  }

  // Step 1: Generate the model. We can define the size of the model here.
  WeightMap global_weights =
      scenarios::RoundSimulation::GenerateWeights(num_of_tensors,
                                                  values_per_tensor, 1);

  // Every epoch pulls the weights towards zero with a noisy gradient.
  client::TrainingConfig config{"scenario_model", 2, 32, 0.01};
  auto step = [](const WeightMap &weights, const client::TrainStepParams &p)
      -> absl::StatusOr<WeightMap> {
    absl::BitGen gen;
    WeightMap next = weights;
    for (auto &[name, values] : next) {
      for (auto &v : values) {
        v -= static_cast<float>(p.learning_rate) *
             (v + absl::Gaussian<float>(gen, 0.0f, 0.1f));
      }
    }
    return next;
  };

  LOG(INFO) << "Start! Running secure round.";
  auto report = simulation.Run(global_weights, config, step, num_of_dropouts);
  if (!report.ok()) {
    LOG(ERROR) << report.status();
    return 1;
  }

  LOG(INFO) << "End! Round took " << absl::FormatDuration(report->duration);
  LOG(INFO) << "Dropped parties: " << report->dropped.size();
  LOG(INFO) << "Max abs error against the plain sum: "
            << report->max_abs_error;
  LOG(INFO) << "Memory usage: " << GetTotalMemory();

  if (report->max_abs_error > 1e-3) {
    LOG(ERROR) << "Recovered aggregate does not match the plain sum.";
    return 1;
  }
  LOG(INFO) << "Recovered aggregate matches the plain sum.";
  return 0;
}
