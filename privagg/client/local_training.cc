#include "privagg/client/local_training.h"

#include <glog/logging.h>

#include <utility>

#include "absl/strings/str_cat.h"
#include "privagg/common/macros.h"

namespace privagg::client {

absl::StatusOr<LocalTrainingResult> RunLocalTraining(
    const WeightMap &initial_weights, const TrainingConfig &config,
    const TrainStepFn &step) {
  if (config.epochs == 0) {
    return absl::InvalidArgumentError("Local training needs at least 1 epoch.");
  }
  if (!step) {
    return absl::InvalidArgumentError("No training step given.");
  }

  const auto started_at = absl::Now();
  WeightMap weights = initial_weights;
  for (uint32_t epoch = 1; epoch <= config.epochs; ++epoch) {
    TrainStepParams params{epoch, config.batch_size, config.learning_rate};
    auto stepped = step(weights, params);
    if (!stepped.ok()) {
      return absl::Status(
          stepped.status().code(),
          absl::StrCat("Epoch ", epoch, " of ", config.model_id,
                       " failed: ", stepped.status().message()));
    }
    weights = std::move(stepped).value();
    VLOG(1) << "Model " << config.model_id << " finished epoch " << epoch;
  }

  LocalTrainingResult result;
  ASSIGN_OR_RETURN(result.delta, ComputeDelta(initial_weights, weights));
  result.final_weights = std::move(weights);
  result.duration = absl::Now() - started_at;

  LOG(INFO) << "Local training of " << config.model_id << " ran "
            << config.epochs << " epochs in "
            << absl::FormatDuration(result.duration)
            << ", delta norm: " << L2Norm(result.delta);
  return result;
}

}  // namespace privagg::client
