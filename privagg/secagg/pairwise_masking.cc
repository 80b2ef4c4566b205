#include "privagg/secagg/pairwise_masking.h"

#include <glog/logging.h>
#include <openssl/kdf.h>
#include <openssl/ec.h>
#include <openssl/x509.h>

#include <algorithm>
#include <cstring>

#include "absl/strings/str_cat.h"

namespace privagg::secagg {

namespace {

constexpr char kCurveName[] = "prime256v1";

template <typename Fn>
WeightMap CombineWithMasks(const WeightMap &weights, const MaskMap &masks,
                           Fn combine) {
  WeightMap result;
  for (const auto &[name, values] : weights) {
    std::vector<float> r(values);
    auto mask_itr = masks.find(name);
    if (mask_itr != masks.end()) {
      const auto &mask = mask_itr->second;
      const auto n = std::min(r.size(), mask.size());
      for (size_t i = 0; i < n; ++i) {
        r[i] = combine(r[i], mask[i]);
      }
    }
    result.emplace(name, std::move(r));
  }
  return result;
}

absl::StatusOr<EvpPkeyPtr> ParsePublicKey(const std::string &der) {
  const auto *begin = reinterpret_cast<const unsigned char *>(der.data());
  const auto *cursor = begin;
  EvpPkeyPtr peer(d2i_PUBKEY(nullptr, &cursor, static_cast<long>(der.size())));
  if (peer == nullptr) {
    return absl::InvalidArgumentError(
        OpenSslError("Parsing peer public key").message());
  }
  if (cursor != begin + der.size()) {
    return absl::InvalidArgumentError(
        "Peer public key has trailing bytes after the DER structure.");
  }
  if (EVP_PKEY_get_base_id(peer.get()) != EVP_PKEY_EC) {
    return absl::InvalidArgumentError("Peer public key is not an EC key.");
  }
  char group[64];
  size_t group_len = 0;
  if (EVP_PKEY_get_group_name(peer.get(), group, sizeof(group), &group_len) !=
          1 ||
      std::strcmp(group, kCurveName) != 0) {
    return absl::InvalidArgumentError("Peer public key is not on P-256.");
  }
  return peer;
}

}  // namespace

absl::StatusOr<std::string> PairwiseMasking::GenerateKeyPair() {
  EvpPkeyPtr key_pair(EVP_EC_gen(kCurveName));
  if (key_pair == nullptr) return OpenSslError("EC key generation");
  key_pair_ = std::move(key_pair);
  LOG(INFO) << "Generated P-256 key pair for this round.";
  return PublicKey();
}

absl::StatusOr<std::string> PairwiseMasking::PublicKey() const {
  if (key_pair_ == nullptr) {
    return absl::FailedPreconditionError(
        "No key pair. Call GenerateKeyPair() first.");
  }
  int der_len = i2d_PUBKEY(key_pair_.get(), nullptr);
  if (der_len <= 0) return OpenSslError("Public key export");
  std::string der(der_len, '\0');
  auto *cursor = reinterpret_cast<unsigned char *>(&der[0]);
  if (i2d_PUBKEY(key_pair_.get(), &cursor) != der_len) {
    return OpenSslError("Public key export");
  }
  return der;
}

absl::StatusOr<SharedSecret> PairwiseMasking::DeriveSharedSecret(
    const std::string &peer_public_key) const {
  if (key_pair_ == nullptr) {
    return absl::FailedPreconditionError(
        "No key pair. Call GenerateKeyPair() first.");
  }
  auto peer = ParsePublicKey(peer_public_key);
  if (!peer.ok()) return peer.status();

  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(key_pair_.get(), nullptr));
  if (ctx == nullptr) return OpenSslError("ECDH context creation");
  if (EVP_PKEY_derive_init(ctx.get()) <= 0) {
    return OpenSslError("ECDH init");
  }
  if (EVP_PKEY_derive_set_peer(ctx.get(), peer->get()) <= 0) {
    return absl::InvalidArgumentError(
        OpenSslError("Setting ECDH peer").message());
  }

  SharedSecret secret;
  size_t secret_len = 0;
  if (EVP_PKEY_derive(ctx.get(), nullptr, &secret_len) <= 0) {
    return OpenSslError("ECDH output sizing");
  }
  if (secret_len != secret.size()) {
    return absl::InternalError(
        absl::StrCat("Unexpected ECDH output length ", secret_len));
  }
  if (EVP_PKEY_derive(ctx.get(), secret.data(), &secret_len) <= 0) {
    return OpenSslError("ECDH derivation");
  }
  return secret;
}

absl::StatusOr<std::vector<float>> PairwiseMasking::CreateMask(
    const SharedSecret &secret, size_t length) {
  std::vector<float> mask(length);
  if (length == 0) return mask;

  const size_t num_bytes = std::min(length * sizeof(float), kMaxMaskBytes);
  const unsigned char salt[32] = {0};

  EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  if (ctx == nullptr) return OpenSslError("HKDF context creation");
  if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt, sizeof(salt)) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), secret.data(), secret.size()) <=
          0 ||
      EVP_PKEY_CTX_add1_hkdf_info(
          ctx.get(), reinterpret_cast<const unsigned char *>(kMaskInfo),
          sizeof(kMaskInfo) - 1) <= 0) {
    return OpenSslError("HKDF setup");
  }

  std::vector<unsigned char> bytes(num_bytes);
  size_t out_len = bytes.size();
  if (EVP_PKEY_derive(ctx.get(), bytes.data(), &out_len) <= 0 ||
      out_len != bytes.size()) {
    return OpenSslError("HKDF expansion");
  }

  // Each little-endian 32-bit word maps linearly onto [-1, 1].
  const size_t num_words = num_bytes / sizeof(uint32_t);
  std::vector<float> source(num_words);
  for (size_t w = 0; w < num_words; ++w) {
    const unsigned char *b = &bytes[w * 4];
    uint32_t word = static_cast<uint32_t>(b[0]) |
                    (static_cast<uint32_t>(b[1]) << 8) |
                    (static_cast<uint32_t>(b[2]) << 16) |
                    (static_cast<uint32_t>(b[3]) << 24);
    source[w] = static_cast<float>(static_cast<double>(word) / 2147483648.0 -
                                   1.0);
  }
  for (size_t i = 0; i < length; ++i) {
    mask[i] = source[i % num_words];
  }
  return mask;
}

WeightMap PairwiseMasking::MaskUpdate(const WeightDelta &delta,
                                      const MaskMap &masks) {
  return CombineWithMasks(delta, masks,
                          [](float value, float mask) { return value + mask; });
}

WeightMap PairwiseMasking::Unmask(const WeightMap &masked_sum,
                                  const MaskMap &masks) {
  return CombineWithMasks(masked_sum, masks,
                          [](float value, float mask) { return value - mask; });
}

int MaskSign(const std::string &self_id, const std::string &peer_id) {
  return self_id < peer_id ? 1 : -1;
}

absl::StatusOr<MaskMap> SignedPeerMasks(const std::string &self_id,
                                        const WeightMap &shape,
                                        const PeerSecrets &peer_secrets) {
  size_t max_length = 0;
  MaskMap masks;
  for (const auto &[name, values] : shape) {
    max_length = std::max(max_length, values.size());
    masks[name] = std::vector<float>(values.size(), 0.0f);
  }

  for (const auto &[peer_id, secret] : peer_secrets) {
    if (peer_id == self_id) {
      return absl::InvalidArgumentError(
          absl::StrCat("Party ", self_id, " cannot mask against itself."));
    }
    // A shorter mask is a prefix of a longer one, so one expansion per peer
    // serves every tensor.
    auto peer_mask = PairwiseMasking::CreateMask(secret, max_length);
    if (!peer_mask.ok()) return peer_mask.status();
    const float sign = static_cast<float>(MaskSign(self_id, peer_id));
    for (auto &[name, mask] : masks) {
      for (size_t i = 0; i < mask.size(); ++i) {
        mask[i] += sign * (*peer_mask)[i];
      }
    }
  }
  return masks;
}

}  // namespace privagg::secagg
