#include "privagg/aggregation/secure_aggregator.h"

#include <glog/logging.h>

#include <algorithm>
#include <functional>
#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "privagg/common/macros.h"
#include "privagg/common/proto_tensor_serde.h"
#include "privagg/privacy/privacy_filter.h"

namespace privagg::aggregation {

using privagg::proto::TensorOps;

namespace {

absl::StatusOr<WeightMap> DecodeModel(const Model &model) {
  if (model.tensors_size() > 0 &&
      model.tensors(0).type().type() != DType_Type_FLOAT32) {
    ASSIGN_OR_RETURN(auto quantized, TensorOps::ToQuantizedWeightMap(model));
    return privacy::Dequantize(quantized);
  }
  return TensorOps::ToWeightMap(model);
}

absl::Status CheckSameShape(const WeightMap &expected, const WeightMap &actual,
                            const std::string &party_id) {
  if (expected.size() != actual.size()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Party ", party_id, " sent ", actual.size(),
                     " tensors, expected ", expected.size(), "."));
  }
  for (const auto &[name, values] : expected) {
    auto itr = actual.find(name);
    if (itr == actual.end() || itr->second.size() != values.size()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Party ", party_id, " sent a mismatching tensor \"", name, "\"."));
    }
  }
  return absl::OkStatus();
}

std::set<std::string> ToPartySet(const std::vector<std::string> &party_ids) {
  std::set<std::string> parties(party_ids.begin(), party_ids.end());
  if (parties.empty()) {
    throw std::invalid_argument("A round needs at least one party.");
  }
  if (parties.size() != party_ids.size()) {
    throw std::invalid_argument("Party ids must be unique.");
  }
  return parties;
}

}  // namespace

SecureAggregator::SecureAggregator(std::string round_id,
                                   std::vector<std::string> party_ids,
                                   uint32_t threshold)
    : round_id_(std::move(round_id)),
      party_ids_(ToPartySet(party_ids)),
      secagg_(threshold) {}

absl::Status SecureAggregator::InsertUpdate(const PartyUpdate &update) {
  const auto &party_id = update.party_id();
  if (update.round_id() != round_id_) {
    return absl::InvalidArgumentError(
        absl::StrCat("Update from ", party_id, " is for round ",
                     update.round_id(), ", not ", round_id_, "."));
  }
  if (party_ids_.count(party_id) == 0) {
    return absl::NotFoundError(
        absl::StrCat("Party ", party_id, " is not part of round ", round_id_,
                     "."));
  }
  if (updates_.count(party_id) > 0) {
    return absl::AlreadyExistsError(
        absl::StrCat("Party ", party_id, " already sent its update."));
  }

  ASSIGN_OR_RETURN(auto weights, DecodeModel(update.model()));
  if (!updates_.empty()) {
    RETURN_IF_ERROR(
        CheckSameShape(updates_.begin()->second, weights, party_id));
    if (update.model().masked() != masked_) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Party ", party_id, " mixes masked and unmasked updates."));
    }
  } else {
    masked_ = update.model().masked();
  }

  updates_.emplace(party_id, std::move(weights));
  VLOG(1) << "Round " << round_id_ << " received update from " << party_id;
  return absl::OkStatus();
}

absl::Status SecureAggregator::InsertDroppedSecretShares(
    const std::string &survivor_id, const std::string &dropped_id,
    const std::vector<secagg::ShareBundle> &bundles) {
  if (party_ids_.count(survivor_id) == 0 ||
      party_ids_.count(dropped_id) == 0) {
    return absl::NotFoundError(absl::StrCat(
        "Unknown party in pair (", survivor_id, ", ", dropped_id, ")."));
  }
  if (survivor_id == dropped_id) {
    return absl::InvalidArgumentError("A party shares no secret with itself.");
  }
  auto &held = dropped_shares_[std::make_pair(survivor_id, dropped_id)];
  held.insert(held.end(), bundles.begin(), bundles.end());
  return absl::OkStatus();
}

std::vector<std::string> SecureAggregator::DroppedParties() const {
  std::vector<std::string> dropped;
  for (const auto &party_id : party_ids_) {
    if (updates_.count(party_id) == 0) dropped.push_back(party_id);
  }
  return dropped;
}

absl::StatusOr<WeightMap> SecureAggregator::Aggregate() const {
  if (updates_.empty()) {
    return absl::FailedPreconditionError(
        absl::StrCat("Round ", round_id_, " has no updates."));
  }
  if (masked_ && updates_.size() < secagg_.threshold()) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Round ", round_id_, " has ", updates_.size(),
        " updates, below the threshold of ", secagg_.threshold(), "."));
  }

  auto aggregated = SumUpdates();
  const auto dropped = DroppedParties();
  if (masked_ && !dropped.empty()) {
    LOG(INFO) << "Round " << round_id_ << " recovering masks of "
              << absl::StrJoin(dropped, ", ");
    const auto &shape = updates_.begin()->second;
    for (const auto &dropped_id : dropped) {
      for (const auto &entry : updates_) {
        const auto &survivor_id = entry.first;
        auto itr = dropped_shares_.find(std::make_pair(survivor_id, dropped_id));
        if (itr == dropped_shares_.end()) {
          return absl::FailedPreconditionError(
              absl::StrCat("No shares of the secret between ", survivor_id,
                           " and ", dropped_id, "."));
        }
        ASSIGN_OR_RETURN(auto secret,
                         secagg_.ReconstructSharedSecret(itr->second));
        secagg::PeerSecrets residual{{dropped_id, secret}};
        ASSIGN_OR_RETURN(auto masks, secagg::SignedPeerMasks(
                                         survivor_id, shape, residual));
        for (auto &[name, values] : aggregated) {
          const auto &mask = masks.at(name);
          std::transform(values.begin(), values.end(), mask.begin(),
                         values.begin(), std::minus<double>());
        }
      }
    }
  }

  WeightMap result;
  for (const auto &[name, values] : aggregated) {
    result.emplace(name, std::vector<float>(values.begin(), values.end()));
  }
  LOG(INFO) << "Round " << round_id_ << " aggregated " << updates_.size()
            << " of " << party_ids_.size() << " updates.";
  return result;
}

void SecureAggregator::Reset() {
  updates_.clear();
  dropped_shares_.clear();
  masked_ = false;
}

std::map<std::string, std::vector<double>> SecureAggregator::SumUpdates()
    const {
  const auto &sample = updates_.begin()->second;
  std::vector<std::string> names;
  for (const auto &[name, values] : sample) names.push_back(name);

  std::vector<std::vector<double>> summed(names.size());
  const int total_tensors = static_cast<int>(names.size());

#pragma omp parallel for
  for (int var_idx = 0; var_idx < total_tensors; ++var_idx) {
    const auto &name = names[var_idx];
    auto aggregated_tensor = std::vector<double>(sample.at(name).size());
    for (const auto &entry : updates_) {
      const auto &local_tensor = entry.second.at(name);
      std::transform(aggregated_tensor.begin(), aggregated_tensor.end(),
                     local_tensor.begin(), aggregated_tensor.begin(),
                     std::plus<double>());
    }
    summed[var_idx] = std::move(aggregated_tensor);
  }

  std::map<std::string, std::vector<double>> result;
  for (size_t i = 0; i < names.size(); ++i) {
    result.emplace(names[i], std::move(summed[i]));
  }
  return result;
}

}  // namespace privagg::aggregation
