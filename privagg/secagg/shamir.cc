#include "privagg/secagg/shamir.h"

#include <glog/logging.h>
#include <openssl/rand.h>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "privagg/secagg/openssl_status.h"

namespace privagg::secagg {

namespace {

// Uniform element of GF(p). Draws 31 random bits and rejects the single
// value equal to p, so no residue is favoured.
absl::StatusOr<uint64_t> RandomFieldElement() {
  while (true) {
    uint32_t draw;
    if (RAND_bytes(reinterpret_cast<unsigned char *>(&draw), sizeof(draw)) !=
        1) {
      return OpenSslError("RAND_bytes");
    }
    uint64_t candidate = draw & 0x7FFFFFFFu;
    if (candidate < kFieldPrime) return candidate;
  }
}

}  // namespace

uint64_t ModPow(uint64_t base, uint64_t exp, uint64_t mod) {
  uint64_t result = 1;
  base %= mod;
  while (exp > 0) {
    if (exp & 1) result = (result * base) % mod;
    exp >>= 1;
    base = (base * base) % mod;
  }
  return result;
}

uint64_t ModInverse(uint64_t a, uint64_t mod) { return ModPow(a, mod - 2, mod); }

absl::StatusOr<std::vector<SecretShare>> ShamirSplit(uint64_t secret,
                                                     uint32_t threshold,
                                                     uint32_t num_shares) {
  if (threshold < 1 || threshold > num_shares) {
    return absl::InvalidArgumentError(
        absl::StrCat("Threshold must lie in [1, ", num_shares, "], got ",
                     threshold, "."));
  }
  if (num_shares >= kFieldPrime) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot issue ", num_shares, " distinct shares in GF(p)."));
  }

  std::vector<uint64_t> coeffs;
  coeffs.reserve(threshold);
  coeffs.push_back(secret % kFieldPrime);
  for (uint32_t i = 1; i < threshold; ++i) {
    auto coeff = RandomFieldElement();
    if (!coeff.ok()) return coeff.status();
    coeffs.push_back(*coeff);
  }

  std::vector<SecretShare> shares;
  shares.reserve(num_shares);
  for (uint32_t x = 1; x <= num_shares; ++x) {
    // Horner's rule, highest degree first.
    uint64_t y = 0;
    for (auto it = coeffs.rbegin(); it != coeffs.rend(); ++it) {
      y = (y * x + *it) % kFieldPrime;
    }
    shares.push_back(SecretShare{x, static_cast<uint32_t>(y)});
  }
  return shares;
}

absl::StatusOr<uint32_t> ShamirReconstruct(
    const std::vector<SecretShare> &shares) {
  if (shares.empty()) {
    return absl::InvalidArgumentError("Cannot reconstruct from zero shares.");
  }
  absl::flat_hash_set<uint32_t> seen;
  for (const auto &share : shares) {
    if (share.x == 0 || share.x >= kFieldPrime) {
      return absl::InvalidArgumentError(
          absl::StrCat("Share index ", share.x, " is outside [1, p)."));
    }
    if (!seen.insert(share.x).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate share index ", share.x, "."));
    }
  }

  uint64_t secret = 0;
  const auto n = shares.size();
  for (size_t i = 0; i < n; ++i) {
    uint64_t num = 1;
    uint64_t den = 1;
    for (size_t j = 0; j < n; ++j) {
      if (i == j) continue;
      const uint64_t xi = shares[i].x;
      const uint64_t xj = shares[j].x;
      // (0 - x_j) and (x_i - x_j), both normalised into [0, p).
      num = (num * ((kFieldPrime - xj) % kFieldPrime)) % kFieldPrime;
      den = (den * ((xi + kFieldPrime - xj) % kFieldPrime)) % kFieldPrime;
    }
    const uint64_t lagrange = (num * ModInverse(den)) % kFieldPrime;
    secret = (secret + (shares[i].y % kFieldPrime) * lagrange) % kFieldPrime;
  }
  VLOG(1) << "Reconstructed secret from " << n << " shares.";
  return static_cast<uint32_t>(secret);
}

}  // namespace privagg::secagg
