#include "privagg/client/update_pipeline.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

#include "privagg/common/matchers.h"
#include "privagg/common/proto_tensor_serde.h"
#include "privagg/privacy/privacy_filter.h"

namespace privagg::client {
namespace {

using ::privagg::proto::TensorOps;
using ::testing::weights::WeightMapNear;

const char kPlainPolicy[] = R"pb(round_id: "r1")pb";

const char kClipOnlyPolicy[] = R"pb(
  round_id: "r1"
  differential_privacy { clipping_norm: 1.0 }
)pb";

const char kQuantizeOnlyPolicy[] = R"pb(
  round_id: "r1"
  quantization { bits: 8 }
)pb";

const char kNoisePolicy[] = R"pb(
  round_id: "r1"
  differential_privacy {
    clipping_norm: 1.0
    budget { epsilon: 1.0 sensitivity: 0.1 delta: 1e-5 }
  }
)pb";

const char kSecurePolicy[] = R"pb(
  round_id: "r2"
  quantization { bits: 16 }
  secure_aggregation { threshold: 2 }
)pb";

// Sum of every update's decoded tensors.
WeightMap SumUpdates(const std::vector<PartyUpdate> &updates) {
  WeightMap sum;
  for (const auto &update : updates) {
    auto weights = TensorOps::ToWeightMap(update.model());
    EXPECT_TRUE(weights.ok()) << weights.status();
    for (const auto &[name, values] : *weights) {
      auto &acc = sum[name];
      acc.resize(values.size(), 0.0f);
      for (size_t i = 0; i < values.size(); ++i) acc[i] += values[i];
    }
  }
  return sum;
}

class UpdatePipelineTest : public ::testing::Test {
 protected:
  // Runs pairwise key agreement between all `ids` and returns, per party,
  // its secrets with every other party.
  static std::map<std::string, secagg::PeerSecrets> AgreeSecrets(
      const std::vector<std::string> &ids) {
    std::map<std::string, std::unique_ptr<secagg::PairwiseMasking>> parties;
    std::map<std::string, std::string> public_keys;
    for (const auto &id : ids) {
      parties[id] = std::make_unique<secagg::PairwiseMasking>();
      auto public_key = parties[id]->GenerateKeyPair();
      EXPECT_TRUE(public_key.ok()) << public_key.status();
      public_keys[id] = *public_key;
    }
    std::map<std::string, secagg::PeerSecrets> secrets;
    for (const auto &self : ids) {
      for (const auto &peer : ids) {
        if (self == peer) continue;
        auto secret = parties[self]->DeriveSharedSecret(public_keys[peer]);
        EXPECT_TRUE(secret.ok()) << secret.status();
        secrets[self][peer] = *secret;
      }
    }
    return secrets;
  }

  WeightDelta delta_{{"dense/kernel", {0.3f, -0.4f, 0.2f, 0.1f}},
                     {"dense/bias", {0.05f, -0.05f}}};
};

TEST_F(UpdatePipelineTest, PlainPolicyForwardsDelta) /* NOLINT */ {
  UpdatePipeline pipeline(
      "alice", TensorOps::ParseTextOrDie<RoundPolicy>(kPlainPolicy));
  auto update = pipeline.Process(delta_, {}, /*num_epochs=*/3);
  ASSERT_TRUE(update.ok()) << update.status();

  EXPECT_EQ(update->party_id(), "alice");
  EXPECT_EQ(update->round_id(), "r1");
  EXPECT_EQ(update->num_epochs(), 3u);
  EXPECT_FALSE(update->model().masked());
  auto weights = TensorOps::ToWeightMap(update->model());
  ASSERT_TRUE(weights.ok());
  EXPECT_EQ(*weights, delta_);
}

TEST_F(UpdatePipelineTest, ClipsToPolicyNorm) /* NOLINT */ {
  WeightDelta large{{"w", {3.0f, 4.0f}}};
  UpdatePipeline pipeline(
      "alice", TensorOps::ParseTextOrDie<RoundPolicy>(kClipOnlyPolicy));
  auto update = pipeline.Process(large, {});
  ASSERT_TRUE(update.ok());
  auto weights = TensorOps::ToWeightMap(update->model());
  ASSERT_TRUE(weights.ok());
  EXPECT_THAT(*weights, WeightMapNear(WeightMap{{"w", {0.6f, 0.8f}}}, 1e-6));
}

TEST_F(UpdatePipelineTest, NoiseIsReproducibleWithSeededGenerator)
/* NOLINT */ {
  UpdatePipeline pipeline(
      "alice", TensorOps::ParseTextOrDie<RoundPolicy>(kNoisePolicy));
  std::mt19937_64 gen1(42);
  std::mt19937_64 gen2(42);
  auto first = pipeline.ApplyPrivacyFilters(delta_, gen1);
  auto second = pipeline.ApplyPrivacyFilters(delta_, gen2);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(*first, *second);
  EXPECT_NE(*first, delta_);
}

TEST_F(UpdatePipelineTest, QuantizeOnlyCarriesInt8Tensors) /* NOLINT */ {
  UpdatePipeline pipeline(
      "alice", TensorOps::ParseTextOrDie<RoundPolicy>(kQuantizeOnlyPolicy));
  auto update = pipeline.Process(delta_, {});
  ASSERT_TRUE(update.ok());
  for (const auto &tensor : update->model().tensors()) {
    EXPECT_EQ(tensor.type().type(), DType::INT8);
    EXPECT_EQ(tensor.value().size(), tensor.length());
  }
  auto quantized = TensorOps::ToQuantizedWeightMap(update->model());
  ASSERT_TRUE(quantized.ok());
  EXPECT_THAT(privacy::Dequantize(*quantized),
              WeightMapNear(delta_, 0.4 / 127));
}

TEST_F(UpdatePipelineTest, MasksCancelInTheSum) /* NOLINT */ {
  const std::vector<std::string> ids{"alice", "bob", "carol"};
  auto secrets = AgreeSecrets(ids);
  auto policy = TensorOps::ParseTextOrDie<RoundPolicy>(kSecurePolicy);

  std::vector<PartyUpdate> updates;
  WeightMap expected;
  for (const auto &id : ids) {
    UpdatePipeline pipeline(id, policy);
    std::mt19937_64 gen(7);
    auto filtered = pipeline.ApplyPrivacyFilters(delta_, gen);
    ASSERT_TRUE(filtered.ok());
    auto update = pipeline.Encode(*filtered, secrets[id]);
    ASSERT_TRUE(update.ok()) << update.status();
    EXPECT_TRUE(update->model().masked());

    auto masked = TensorOps::ToWeightMap(update->model());
    ASSERT_TRUE(masked.ok());
    EXPECT_THAT(*masked, ::testing::Not(WeightMapNear(*filtered, 1e-3)));

    for (const auto &[name, values] : *filtered) {
      auto &acc = expected[name];
      acc.resize(values.size(), 0.0f);
      for (size_t i = 0; i < values.size(); ++i) acc[i] += values[i];
    }
    updates.push_back(*update);
  }
  EXPECT_THAT(SumUpdates(updates), WeightMapNear(expected, 1e-5));
}

TEST_F(UpdatePipelineTest, QuantizationBeforeMaskingIsLossy) /* NOLINT */ {
  UpdatePipeline pipeline(
      "alice", TensorOps::ParseTextOrDie<RoundPolicy>(R"pb(
        quantization { bits: 8 }
        secure_aggregation { threshold: 1 }
      )pb"));
  std::mt19937_64 gen(1);
  auto filtered = pipeline.ApplyPrivacyFilters(delta_, gen);
  ASSERT_TRUE(filtered.ok());
  EXPECT_THAT(*filtered, WeightMapNear(delta_, 0.4 / 127));
  auto quantized = privacy::Quantize(delta_, 8);
  ASSERT_TRUE(quantized.ok());
  EXPECT_EQ(*filtered, privacy::Dequantize(*quantized));
}

TEST_F(UpdatePipelineTest, MaskingWithoutPeersFails) /* NOLINT */ {
  UpdatePipeline pipeline(
      "alice", TensorOps::ParseTextOrDie<RoundPolicy>(kSecurePolicy));
  EXPECT_EQ(pipeline.Process(delta_, {}).status().code(),
            absl::StatusCode::kFailedPrecondition);
}

TEST_F(UpdatePipelineTest, MaskingAgainstSelfFails) /* NOLINT */ {
  UpdatePipeline pipeline(
      "alice", TensorOps::ParseTextOrDie<RoundPolicy>(kSecurePolicy));
  secagg::PeerSecrets secrets;
  secrets["alice"].fill(1);
  EXPECT_EQ(pipeline.Process(delta_, secrets).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST_F(UpdatePipelineTest, InvalidPolicyThrows) /* NOLINT */ {
  auto policy = TensorOps::ParseTextOrDie<RoundPolicy>(
      R"pb(quantization { bits: 12 })pb");
  EXPECT_THROW(UpdatePipeline("alice", policy), std::invalid_argument);
}

}  // namespace
}  // namespace privagg::client
