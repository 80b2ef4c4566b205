#include "privagg/secagg/pairwise_masking.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>

#include "privagg/common/matchers.h"

namespace privagg::secagg {
namespace {

using ::testing::Each;
using ::testing::AllOf;
using ::testing::Ge;
using ::testing::Le;
using ::testing::SizeIs;
using ::testing::weights::WeightMapNear;

SharedSecret MakeSecret(uint8_t seed) {
  SharedSecret secret;
  for (size_t i = 0; i < secret.size(); ++i) {
    secret[i] = static_cast<uint8_t>(seed + 7 * i);
  }
  return secret;
}

class PairwiseMaskingTest : public ::testing::Test {};

TEST_F(PairwiseMaskingTest, ExportsPublicKeyAfterGeneration) /* NOLINT */ {
  PairwiseMasking party;
  EXPECT_FALSE(party.HasKeyPair());
  EXPECT_EQ(party.PublicKey().status().code(),
            absl::StatusCode::kFailedPrecondition);

  auto public_key = party.GenerateKeyPair();
  ASSERT_TRUE(public_key.ok()) << public_key.status();
  EXPECT_TRUE(party.HasKeyPair());
  // DER SubjectPublicKeyInfo of an uncompressed P-256 point.
  EXPECT_EQ(public_key->size(), 91);
  EXPECT_EQ(*party.PublicKey(), *public_key);
}

TEST_F(PairwiseMaskingTest, BothPartiesDeriveTheSameSecret) /* NOLINT */ {
  PairwiseMasking alice;
  PairwiseMasking bob;
  auto alice_key = alice.GenerateKeyPair();
  auto bob_key = bob.GenerateKeyPair();
  ASSERT_TRUE(alice_key.ok());
  ASSERT_TRUE(bob_key.ok());

  auto secret_alice = alice.DeriveSharedSecret(*bob_key);
  auto secret_bob = bob.DeriveSharedSecret(*alice_key);
  ASSERT_TRUE(secret_alice.ok()) << secret_alice.status();
  ASSERT_TRUE(secret_bob.ok()) << secret_bob.status();
  EXPECT_EQ(*secret_alice, *secret_bob);
}

TEST_F(PairwiseMaskingTest, DistinctPeersGiveDistinctSecrets) /* NOLINT */ {
  PairwiseMasking alice, bob, carol;
  auto alice_key = alice.GenerateKeyPair();
  auto bob_key = bob.GenerateKeyPair();
  auto carol_key = carol.GenerateKeyPair();
  ASSERT_TRUE(alice_key.ok() && bob_key.ok() && carol_key.ok());

  auto with_bob = alice.DeriveSharedSecret(*bob_key);
  auto with_carol = alice.DeriveSharedSecret(*carol_key);
  ASSERT_TRUE(with_bob.ok() && with_carol.ok());
  EXPECT_NE(*with_bob, *with_carol);
}

TEST_F(PairwiseMaskingTest, DeriveBeforeKeyGenerationFails) /* NOLINT */ {
  PairwiseMasking peer;
  auto peer_key = peer.GenerateKeyPair();
  ASSERT_TRUE(peer_key.ok());

  PairwiseMasking fresh;
  auto secret = fresh.DeriveSharedSecret(*peer_key);
  ASSERT_FALSE(secret.ok());
  EXPECT_EQ(secret.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST_F(PairwiseMaskingTest, RejectsMalformedPeerKey) /* NOLINT */ {
  PairwiseMasking party;
  auto own_key = party.GenerateKeyPair();
  ASSERT_TRUE(own_key.ok());

  EXPECT_EQ(party.DeriveSharedSecret("not a key").status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(party.DeriveSharedSecret("").status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(party.DeriveSharedSecret(*own_key + "x").status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST_F(PairwiseMaskingTest, MaskIsDeterministicAndBounded) /* NOLINT */ {
  auto first = PairwiseMasking::CreateMask(MakeSecret(1), 100);
  auto second = PairwiseMasking::CreateMask(MakeSecret(1), 100);
  auto other = PairwiseMasking::CreateMask(MakeSecret(2), 100);
  ASSERT_TRUE(first.ok()) << first.status();
  ASSERT_TRUE(second.ok());
  ASSERT_TRUE(other.ok());

  EXPECT_THAT(*first, SizeIs(100));
  EXPECT_EQ(*first, *second);
  EXPECT_NE(*first, *other);
  EXPECT_THAT(*first, Each(AllOf(Ge(-1.0f), Le(1.0f))));
}

// HKDF-SHA256 with a 32-byte zero salt and info "privagg-secagg-mask" over
// MakeSecret(1) gives 2743bc17 4e9798d9 0e9b4382 578b827b. Read as
// little-endian words w, the mask values are w / 2^31 - 1.
TEST_F(PairwiseMaskingTest, MaskMatchesKnownExpansion) /* NOLINT */ {
  auto mask = PairwiseMasking::CreateMask(MakeSecret(1), 4);
  ASSERT_TRUE(mask.ok()) << mask.status();
  ASSERT_THAT(*mask, SizeIs(4));
  EXPECT_FLOAT_EQ((*mask)[0], -0.814567208f);  // w = 398213927
  EXPECT_FLOAT_EQ((*mask)[1], 0.699969232f);   // w = 3650656078
  EXPECT_FLOAT_EQ((*mask)[2], 0.0176881626f);  // w = 2185468686
  EXPECT_FLOAT_EQ((*mask)[3], -0.0350786038f);  // w = 2072152919
}

TEST_F(PairwiseMaskingTest, ShorterMaskIsPrefixOfLongerOne) /* NOLINT */ {
  auto short_mask = PairwiseMasking::CreateMask(MakeSecret(3), 10);
  auto long_mask = PairwiseMasking::CreateMask(MakeSecret(3), 200);
  ASSERT_TRUE(short_mask.ok() && long_mask.ok());
  for (size_t i = 0; i < 10; ++i) {
    EXPECT_EQ((*short_mask)[i], (*long_mask)[i]) << i;
  }
}

TEST_F(PairwiseMaskingTest, LongMasksTileOneDerivation) /* NOLINT */ {
  constexpr size_t kWords = kMaxMaskBytes / sizeof(float);
  auto mask = PairwiseMasking::CreateMask(MakeSecret(4), 3 * kWords + 17);
  ASSERT_TRUE(mask.ok());
  ASSERT_THAT(*mask, SizeIs(3 * kWords + 17));
  for (size_t i = kWords; i < mask->size(); ++i) {
    ASSERT_EQ((*mask)[i], (*mask)[i % kWords]) << i;
  }
  // Inside one derivation the words are not repeating.
  EXPECT_NE((*mask)[0], (*mask)[1]);
}

TEST_F(PairwiseMaskingTest, EmptyMask) /* NOLINT */ {
  auto mask = PairwiseMasking::CreateMask(MakeSecret(5), 0);
  ASSERT_TRUE(mask.ok());
  EXPECT_TRUE(mask->empty());
}

TEST_F(PairwiseMaskingTest, MaskAndUnmaskAreInverse) /* NOLINT */ {
  WeightDelta delta{{"w", {1, 2, 3}}, {"b", {-0.5f, 0.25f}}};
  MaskMap masks{{"w", {0.1f, 0.2f, 0.3f}}, {"b", {0.9f, -0.9f}}};

  auto masked = PairwiseMasking::MaskUpdate(delta, masks);
  EXPECT_NEAR(masked["w"][0], 1.1f, 1e-6);
  EXPECT_NEAR(masked["b"][1], -0.65f, 1e-6);

  auto unmasked = PairwiseMasking::Unmask(masked, masks);
  EXPECT_THAT(unmasked, WeightMapNear(delta, 1e-6f));
}

TEST_F(PairwiseMaskingTest, UnmaskedDerivedMasksRecoverDelta) /* NOLINT */ {
  WeightDelta delta{{"dense/kernel", std::vector<float>(1000, 0.01f)},
                    {"dense/bias", {0.5f, -0.5f}}};
  MaskMap masks;
  for (const auto &[name, values] : delta) {
    auto mask = PairwiseMasking::CreateMask(MakeSecret(9), values.size());
    ASSERT_TRUE(mask.ok());
    masks[name] = *mask;
  }

  auto masked = PairwiseMasking::MaskUpdate(delta, masks);
  EXPECT_NE(masked, delta);
  EXPECT_THAT(PairwiseMasking::Unmask(masked, masks),
              WeightMapNear(delta, 1e-6f));
}

TEST_F(PairwiseMaskingTest, TensorsWithoutMaskPassThrough) /* NOLINT */ {
  WeightDelta delta{{"masked", {1, 1}}, {"plain", {4, 5, 6}}};
  MaskMap masks{{"masked", {0.5f, 0.5f}}, {"unknown", {1, 2}}};

  auto masked = PairwiseMasking::MaskUpdate(delta, masks);
  ASSERT_EQ(masked.size(), 2);
  EXPECT_EQ(masked["plain"], delta.at("plain"));
  EXPECT_EQ(PairwiseMasking::Unmask(masked, masks)["plain"], delta.at("plain"));
}

TEST_F(PairwiseMaskingTest, ShortMaskLeavesTailUntouched) /* NOLINT */ {
  WeightDelta delta{{"w", {1, 2, 3, 4}}};
  MaskMap masks{{"w", {10, 10}}};

  auto masked = PairwiseMasking::MaskUpdate(delta, masks);
  EXPECT_EQ(masked["w"], (std::vector<float>{11, 12, 3, 4}));
}

TEST_F(PairwiseMaskingTest, OppositeSignsCancel) /* NOLINT */ {
  EXPECT_EQ(MaskSign("party-a", "party-b"), 1);
  EXPECT_EQ(MaskSign("party-b", "party-a"), -1);
  EXPECT_EQ(MaskSign("a", "b") + MaskSign("b", "a"), 0);
}

}  // namespace
}  // namespace privagg::secagg
