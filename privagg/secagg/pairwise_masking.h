#ifndef PRIVAGG_PRIVAGG_SECAGG_PAIRWISE_MASKING_H_
#define PRIVAGG_PRIVAGG_SECAGG_PAIRWISE_MASKING_H_

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "privagg/common/weight_map.h"
#include "privagg/secagg/openssl_status.h"

namespace privagg::secagg {

// ECDH output for one pair of parties. Only ever used as seed material for
// CreateMask(), never as a mask itself.
typedef std::array<uint8_t, 32> SharedSecret;

// Tensor name -> mask to add or remove.
typedef absl::flat_hash_map<std::string, std::vector<float>> MaskMap;

// Peer id -> secret shared with that peer.
typedef absl::flat_hash_map<std::string, SharedSecret> PeerSecrets;

// HKDF parameters for mask expansion.
constexpr char kMaskInfo[] = "privagg-secagg-mask";
// Bytes produced by a single expansion call (8160 bits). Longer masks tile
// this output.
constexpr size_t kMaxMaskBytes = 1020;

// One party's view of pairwise masking for a single aggregation round. The
// key pair is generated once per round and is only read afterwards, so a
// single instance may serve concurrent derivations.
class PairwiseMasking {
 public:
  PairwiseMasking() = default;
  virtual ~PairwiseMasking() = default;

  PairwiseMasking(const PairwiseMasking &) = delete;
  PairwiseMasking &operator=(const PairwiseMasking &) = delete;

  // Creates a fresh P-256 key pair, replacing any previous one, and returns
  // the public key as DER SubjectPublicKeyInfo.
  absl::StatusOr<std::string> GenerateKeyPair();

  bool HasKeyPair() const { return key_pair_ != nullptr; }

  absl::StatusOr<std::string> PublicKey() const;

  // ECDH with the peer's DER-encoded P-256 public key. Fails with
  // FailedPrecondition before GenerateKeyPair() and with InvalidArgument for
  // a key that does not parse or lives on another curve.
  absl::StatusOr<SharedSecret> DeriveSharedSecret(
      const std::string &peer_public_key) const;

  // Deterministic mask of `length` floats in [-1, 1] expanded from `secret`
  // via HKDF-SHA256. At most kMaxMaskBytes are derived; element i of a longer
  // mask repeats element i mod (kMaxMaskBytes / 4).
  static absl::StatusOr<std::vector<float>> CreateMask(
      const SharedSecret &secret, size_t length);

  // delta + mask for every tensor with a registered mask. Other tensors are
  // copied through. Elements past the end of a shorter mask are unchanged.
  static WeightMap MaskUpdate(const WeightDelta &delta, const MaskMap &masks);

  // masked_sum - mask, the exact inverse of MaskUpdate() for the same masks.
  static WeightMap Unmask(const WeightMap &masked_sum, const MaskMap &masks);

 private:
  EvpPkeyPtr key_pair_;
};

// Sign under which `self_id` applies the mask shared with `peer_id`: +1 when
// self_id orders before peer_id, -1 otherwise. The two parties of a pair
// therefore apply opposite signs and their masks cancel in the sum.
int MaskSign(const std::string &self_id, const std::string &peer_id);

// For every tensor of `shape`, the sum over peers of
//   MaskSign(self_id, peer) * CreateMask(secret_with_peer, tensor_length).
// Adding these masks on every party makes all pairwise masks cancel in the
// sum of the parties' updates.
absl::StatusOr<MaskMap> SignedPeerMasks(const std::string &self_id,
                                        const WeightMap &shape,
                                        const PeerSecrets &peer_secrets);

}  // namespace privagg::secagg

#endif  // PRIVAGG_PRIVAGG_SECAGG_PAIRWISE_MASKING_H_
