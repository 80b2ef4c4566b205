#include "privagg/scenarios/round_simulation.h"

#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "absl/random/random.h"
#include "absl/strings/str_cat.h"
#include "privagg/aggregation/secure_aggregator.h"
#include "privagg/client/round_policy.h"
#include "privagg/client/update_pipeline.h"
#include "privagg/common/macros.h"

namespace privagg::scenarios {

namespace {

void AddInto(WeightMap &sum, const WeightMap &weights) {
  for (const auto &[name, values] : weights) {
    auto &acc = sum[name];
    acc.resize(values.size(), 0.0f);
    for (size_t i = 0; i < values.size(); ++i) acc[i] += values[i];
  }
}

double MaxAbsError(const WeightMap &expected, const WeightMap &actual) {
  double max_error = 0;
  for (const auto &[name, values] : expected) {
    auto itr = actual.find(name);
    if (itr == actual.end() || itr->second.size() != values.size()) {
      return INFINITY;
    }
    for (size_t i = 0; i < values.size(); ++i) {
      max_error = std::max(
          max_error, std::fabs(static_cast<double>(values[i]) - itr->second[i]));
    }
  }
  return max_error;
}

}  // namespace

RoundSimulation::RoundSimulation(RoundPolicy policy, int num_parties)
    : policy_(std::move(policy)) {
  if (num_parties < 2) {
    throw std::invalid_argument("A round needs at least 2 parties.");
  }
  auto status = client::ValidateRoundPolicy(policy_);
  if (!status.ok()) {
    throw std::invalid_argument(std::string(status.message()));
  }
  if (threshold() > static_cast<uint32_t>(num_parties)) {
    throw std::invalid_argument(
        absl::StrCat("Threshold ", threshold(), " exceeds ", num_parties,
                     " parties."));
  }
  for (int index = 1; index <= num_parties; ++index) {
    party_ids_.push_back(absl::StrCat("party_", index));
  }
}

uint32_t RoundSimulation::threshold() const {
  return policy_.has_secure_aggregation()
             ? policy_.secure_aggregation().threshold()
             : 1;
}

WeightMap RoundSimulation::GenerateWeights(int num_tensors,
                                           int values_per_tensor,
                                           int padding) {
  LOG(INFO) << "Generating model...";
  LOG(INFO) << "Tensors: " << num_tensors;
  LOG(INFO) << "Values per tensor: " << values_per_tensor;
  WeightMap weights;
  for (int t = 0; t < num_tensors; ++t) {
    std::vector<float> values(values_per_tensor);
    for (int index = 0; index < values_per_tensor; ++index) {
      values[index] = static_cast<float>(index + padding);
    }
    weights.emplace(absl::StrCat("layer_", t, "/kernel"), std::move(values));
  }
  return weights;
}

absl::Status RoundSimulation::Setup() {
  std::map<std::string, std::string> public_keys;
  for (const auto &party_id : party_ids_) {
    auto party = std::make_unique<secagg::SecAggPlus>(threshold());
    ASSIGN_OR_RETURN(public_keys[party_id], party->GenerateKeyPair());
    parties_[party_id] = std::move(party);
  }
  for (const auto &self : party_ids_) {
    auto &secrets = secrets_[self];
    for (const auto &peer : party_ids_) {
      if (self == peer) continue;
      ASSIGN_OR_RETURN(secrets[peer],
                       parties_[self]->DeriveSharedSecret(public_keys[peer]));
    }
  }
  LOG(INFO) << "Key agreement done for " << party_ids_.size() << " parties.";
  return absl::OkStatus();
}

absl::StatusOr<RoundReport> RoundSimulation::Run(
    const WeightMap &global_weights, const client::TrainingConfig &config,
    const client::TrainStepFn &step, int num_dropped) {
  const bool masking = policy_.has_secure_aggregation();
  if (masking && secrets_.empty()) {
    return absl::FailedPreconditionError(
        "Setup() must run before a masked round.");
  }
  if (num_dropped < 0 ||
      num_dropped >= static_cast<int>(party_ids_.size())) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot drop ", num_dropped, " of ", party_ids_.size(),
                     " parties."));
  }

  const auto started_at = absl::Now();
  const size_t num_survivors = party_ids_.size() - num_dropped;
  std::vector<std::string> survivors(party_ids_.begin(),
                                     party_ids_.begin() + num_survivors);
  RoundReport report;
  report.dropped.assign(party_ids_.begin() + num_survivors, party_ids_.end());

  aggregation::SecureAggregator aggregator(policy_.round_id(), party_ids_,
                                           threshold());
  absl::BitGen gen;
  for (size_t index = 0; index < party_ids_.size(); ++index) {
    const auto &party_id = party_ids_[index];
    ASSIGN_OR_RETURN(auto trained,
                     client::RunLocalTraining(global_weights, config, step));
    client::UpdatePipeline pipeline(party_id, policy_);
    ASSIGN_OR_RETURN(auto filtered,
                     pipeline.ApplyPrivacyFilters(trained.delta, gen));
    ASSIGN_OR_RETURN(auto update,
                     pipeline.Encode(filtered, secrets_[party_id],
                                     config.epochs));
    if (index >= num_survivors) {
      LOG(INFO) << party_id << " dropped out before sending its update.";
      continue;
    }
    AddInto(report.expected, filtered);
    RETURN_IF_ERROR(aggregator.InsertUpdate(update));
  }

  if (masking) {
    // Bundle k of every split is held by party_ids_[k]; the first
    // threshold() survivors hand theirs to the server.
    for (const auto &dropped_id : report.dropped) {
      for (const auto &survivor_id : survivors) {
        ASSIGN_OR_RETURN(auto bundles,
                         parties_[survivor_id]->SplitSharedSecret(
                             secrets_[survivor_id][dropped_id],
                             party_ids_.size()));
        std::vector<secagg::ShareBundle> held;
        for (size_t k = 0; k < survivors.size() && held.size() < threshold();
             ++k) {
          auto holder =
              std::find(party_ids_.begin(), party_ids_.end(), survivors[k]);
          held.push_back(bundles[holder - party_ids_.begin()]);
        }
        RETURN_IF_ERROR(aggregator.InsertDroppedSecretShares(
            survivor_id, dropped_id, held));
      }
    }
  }

  ASSIGN_OR_RETURN(report.aggregate, aggregator.Aggregate());
  report.max_abs_error = MaxAbsError(report.expected, report.aggregate);
  report.duration = absl::Now() - started_at;
  return report;
}

}  // namespace privagg::scenarios
