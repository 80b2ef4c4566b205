#ifndef PRIVAGG_PRIVAGG_CLIENT_LOCAL_TRAINING_H_
#define PRIVAGG_PRIVAGG_CLIENT_LOCAL_TRAINING_H_

#include <cstdint>
#include <functional>
#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "privagg/common/weight_map.h"

namespace privagg::client {

struct TrainingConfig {
  std::string model_id;
  uint32_t epochs = 1;
  uint32_t batch_size = 32;
  double learning_rate = 0.01;
};

// What a single step sees about its position in the run.
struct TrainStepParams {
  uint32_t epoch;
  uint32_t batch_size;
  double learning_rate;
};

// One epoch of training. Receives the current weights and returns the
// updated ones; must keep every tensor name and length.
typedef std::function<absl::StatusOr<WeightMap>(const WeightMap &,
                                                const TrainStepParams &)>
    TrainStepFn;

struct LocalTrainingResult {
  WeightMap final_weights;
  WeightDelta delta;
  absl::Duration duration;
};

// Runs `config.epochs` steps starting from a copy of `initial_weights` and
// returns the trained weights together with their delta from the start.
absl::StatusOr<LocalTrainingResult> RunLocalTraining(
    const WeightMap &initial_weights, const TrainingConfig &config,
    const TrainStepFn &step);

}  // namespace privagg::client

#endif  // PRIVAGG_PRIVAGG_CLIENT_LOCAL_TRAINING_H_
