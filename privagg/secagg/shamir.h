#ifndef PRIVAGG_PRIVAGG_SECAGG_SHAMIR_H_
#define PRIVAGG_PRIVAGG_SECAGG_SHAMIR_H_

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"

namespace privagg::secagg {

// Shamir's threshold scheme over GF(p) with the Mersenne prime p = 2^31 - 1.
// Field elements fit in 32 bits; every product is taken in 64 bits before
// reduction.
constexpr uint64_t kFieldPrime = 2147483647;

struct SecretShare {
  uint32_t x;  // Evaluation point in [1, N].
  uint32_t y;  // Polynomial value at x, in [0, p).

  bool operator==(const SecretShare &other) const {
    return x == other.x && y == other.y;
  }
};

uint64_t ModPow(uint64_t base, uint64_t exp, uint64_t mod = kFieldPrime);

// Multiplicative inverse by Fermat's little theorem, a^(p-2) mod p.
uint64_t ModInverse(uint64_t a, uint64_t mod = kFieldPrime);

// Splits `secret mod p` into `num_shares` shares, any `threshold` of which
// reconstruct it. The non-constant coefficients come from OpenSSL's CSPRNG.
// Fails with InvalidArgument unless 1 <= threshold <= num_shares.
absl::StatusOr<std::vector<SecretShare>> ShamirSplit(uint64_t secret,
                                                     uint32_t threshold,
                                                     uint32_t num_shares);

// Lagrange interpolation at x = 0 over all given shares. The caller decides
// how many shares to pass; with at least `threshold` shares of one split the
// result is that split's secret.
absl::StatusOr<uint32_t> ShamirReconstruct(
    const std::vector<SecretShare> &shares);

}  // namespace privagg::secagg

#endif  // PRIVAGG_PRIVAGG_SECAGG_SHAMIR_H_
