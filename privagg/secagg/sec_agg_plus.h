#ifndef PRIVAGG_PRIVAGG_SECAGG_SEC_AGG_PLUS_H_
#define PRIVAGG_PRIVAGG_SECAGG_SEC_AGG_PLUS_H_

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "privagg/secagg/pairwise_masking.h"
#include "privagg/secagg/shamir.h"

namespace privagg::secagg {

// The shares one peer holds of one SharedSecret: one share per 16-bit chunk
// of the secret, all evaluated at the same x.
typedef std::vector<SecretShare> ShareBundle;

constexpr size_t kSharedSecretChunks = sizeof(SharedSecret) / 2;

// Pairwise masking plus threshold sharing of mask seeds, so that any
// `threshold` surviving peers can recover the seed of a peer that dropped out.
class SecAggPlus : public PairwiseMasking {
 public:
  // Throws std::invalid_argument when threshold is zero.
  explicit SecAggPlus(uint32_t threshold);

  uint32_t threshold() const { return threshold_; }

  absl::StatusOr<std::vector<SecretShare>> SplitSecret(
      uint64_t secret, uint32_t num_peers) const;

  // Fails with FailedPrecondition when fewer than threshold() shares are
  // given; otherwise interpolates over the first threshold() of them.
  absl::StatusOr<uint32_t> ReconstructSecret(
      const std::vector<SecretShare> &shares) const;

  // Shares a 32-byte secret among `num_peers` peers. Element k of the result
  // is the bundle for the peer holding x = k + 1.
  absl::StatusOr<std::vector<ShareBundle>> SplitSharedSecret(
      const SharedSecret &secret, uint32_t num_peers) const;

  // Inverse of SplitSharedSecret() from at least threshold() bundles.
  absl::StatusOr<SharedSecret> ReconstructSharedSecret(
      const std::vector<ShareBundle> &bundles) const;

 private:
  const uint32_t threshold_;
};

}  // namespace privagg::secagg

#endif  // PRIVAGG_PRIVAGG_SECAGG_SEC_AGG_PLUS_H_
