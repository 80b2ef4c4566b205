#include "privagg/secagg/sec_agg_plus.h"

#include <glog/logging.h>

#include <stdexcept>

#include "absl/strings/str_cat.h"
#include "privagg/common/macros.h"

namespace privagg::secagg {

SecAggPlus::SecAggPlus(uint32_t threshold) : threshold_(threshold) {
  if (threshold_ < 1) {
    throw std::invalid_argument("SecAggPlus threshold must be at least 1.");
  }
}

absl::StatusOr<std::vector<SecretShare>> SecAggPlus::SplitSecret(
    uint64_t secret, uint32_t num_peers) const {
  return ShamirSplit(secret, threshold_, num_peers);
}

absl::StatusOr<uint32_t> SecAggPlus::ReconstructSecret(
    const std::vector<SecretShare> &shares) const {
  if (shares.size() < threshold_) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Need at least ", threshold_, " shares, got ", shares.size(), "."));
  }
  return ShamirReconstruct(std::vector<SecretShare>(
      shares.begin(), shares.begin() + threshold_));
}

absl::StatusOr<std::vector<ShareBundle>> SecAggPlus::SplitSharedSecret(
    const SharedSecret &secret, uint32_t num_peers) const {
  std::vector<ShareBundle> bundles(num_peers);
  for (size_t c = 0; c < kSharedSecretChunks; ++c) {
    const uint64_t chunk = static_cast<uint64_t>(secret[2 * c]) |
                           (static_cast<uint64_t>(secret[2 * c + 1]) << 8);
    ASSIGN_OR_RETURN(auto shares, SplitSecret(chunk, num_peers));
    for (uint32_t k = 0; k < num_peers; ++k) {
      bundles[k].push_back(shares[k]);
    }
  }
  VLOG(1) << "Split shared secret into " << num_peers << " bundles with "
          << "threshold " << threshold_;
  return bundles;
}

absl::StatusOr<SharedSecret> SecAggPlus::ReconstructSharedSecret(
    const std::vector<ShareBundle> &bundles) const {
  if (bundles.size() < threshold_) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Need at least ", threshold_, " shares, got ", bundles.size(), "."));
  }
  for (const auto &bundle : bundles) {
    if (bundle.size() != kSharedSecretChunks) {
      return absl::InvalidArgumentError(
          absl::StrCat("Share bundle holds ", bundle.size(),
                       " chunks, expected ", kSharedSecretChunks, "."));
    }
    for (const auto &share : bundle) {
      if (share.x != bundle.front().x) {
        return absl::InvalidArgumentError(
            "Share bundle mixes evaluation points.");
      }
    }
  }

  SharedSecret secret;
  for (size_t c = 0; c < kSharedSecretChunks; ++c) {
    std::vector<SecretShare> chunk_shares;
    chunk_shares.reserve(bundles.size());
    for (const auto &bundle : bundles) chunk_shares.push_back(bundle[c]);

    ASSIGN_OR_RETURN(auto chunk, ReconstructSecret(chunk_shares));
    if (chunk > 0xFFFF) {
      return absl::DataLossError(absl::StrCat(
          "Reconstructed chunk ", c, " is out of range; the shares do not "
          "come from one split."));
    }
    secret[2 * c] = static_cast<uint8_t>(chunk & 0xFF);
    secret[2 * c + 1] = static_cast<uint8_t>(chunk >> 8);
  }
  return secret;
}

}  // namespace privagg::secagg
