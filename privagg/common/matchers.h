#ifndef PRIVAGG_PRIVAGG_COMMON_MATCHERS_H_
#define PRIVAGG_PRIVAGG_COMMON_MATCHERS_H_

#include <gmock/gmock.h>
#include <google/protobuf/util/message_differencer.h>
#include <gtest/gtest.h>

#include <cmath>

#include "privagg/common/weight_map.h"

namespace testing::proto {
using ::google::protobuf::util::MessageDifferencer;

MATCHER_P(EqualsProto, expected, "EqualsProto") {
  return MessageDifferencer::Equals(arg, expected);
}

}  // namespace testing::proto

namespace testing::weights {

// Same tensor names, same lengths, and every element within `tolerance`.
MATCHER_P2(WeightMapNear, expected, tolerance, "WeightMapNear") {
  const privagg::WeightMap &actual = arg;
  if (actual.size() != expected.size()) {
    *result_listener << "has " << actual.size() << " tensors, expected "
                     << expected.size();
    return false;
  }
  for (const auto &[name, values] : expected) {
    auto itr = actual.find(name);
    if (itr == actual.end()) {
      *result_listener << "is missing tensor " << name;
      return false;
    }
    if (itr->second.size() != values.size()) {
      *result_listener << "tensor " << name << " has length "
                       << itr->second.size() << ", expected " << values.size();
      return false;
    }
    for (size_t i = 0; i < values.size(); ++i) {
      if (std::fabs(itr->second[i] - values[i]) > tolerance) {
        *result_listener << "tensor " << name << "[" << i << "] is "
                         << itr->second[i] << ", expected " << values[i];
        return false;
      }
    }
  }
  return true;
}

}  // namespace testing::weights

#endif  // PRIVAGG_PRIVAGG_COMMON_MATCHERS_H_
