// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include <unordered_set>

#include "gcap/graphs/fingerprint.h"
#include "gcap/ops/tensor_ops.h"
#include "gcap_test_helpers.h"

using gcap::core::Device;
using gcap::core::Dict;
using gcap::core::List;
using gcap::core::Opaque;
using gcap::core::ScalarType;
using gcap::core::Value;
using gcap::graphs::Args;
using gcap::graphs::Fingerprint;
using gcap::graphs::FingerprintHash;
using gcap::graphs::Kwargs;
namespace ops = gcap::ops;

namespace {

Fingerprint fp(const Args& args, const Kwargs& kwargs = Kwargs{}) {
  return Fingerprint::of_call(args, kwargs);
}

} // namespace

TEST(FingerprintTest, SameShapeDifferentDataIsEqual) {
  auto a = ops::from_vector<float>({1.f, 2.f, 3.f, 4.f}, {4});
  auto b = ops::from_vector<float>({5.f, 6.f, 7.f, 8.f}, {4});
  EXPECT_EQ(fp(Args{Value(a)}), fp(Args{Value(b)}));
  EXPECT_EQ(fp(Args{Value(a)}).hash(), fp(Args{Value(b)}).hash());
}

TEST(FingerprintTest, ShapeDtypeAndDeviceDistinguish) {
  auto f4 = gcap_test::meta_tensor({4}, ScalarType::Float32, Device::cuda(0));
  auto f3 = gcap_test::meta_tensor({3}, ScalarType::Float32, Device::cuda(0));
  auto d4 = gcap_test::meta_tensor({4}, ScalarType::Float64, Device::cuda(0));
  auto f4_dev1 = gcap_test::meta_tensor({4}, ScalarType::Float32, Device::cuda(1));
  auto f22 = gcap_test::meta_tensor({2, 2}, ScalarType::Float32, Device::cuda(0));
  EXPECT_NE(fp(Args{Value(f4)}), fp(Args{Value(f3)}));
  EXPECT_NE(fp(Args{Value(f4)}), fp(Args{Value(d4)}));
  EXPECT_NE(fp(Args{Value(f4)}), fp(Args{Value(f4_dev1)}));
  EXPECT_NE(fp(Args{Value(f4)}), fp(Args{Value(f22)}));
}

TEST(FingerprintTest, ScalarsAreTyped) {
  EXPECT_NE(fp(Args{Value(1)}), fp(Args{Value(1.0)}));
  EXPECT_NE(fp(Args{Value(true)}), fp(Args{Value(1)}));
  EXPECT_NE(fp(Args{Value("1")}), fp(Args{Value(1)}));
  EXPECT_NE(fp(Args{Value(2)}), fp(Args{Value(3)}));
  EXPECT_EQ(fp(Args{Value(2)}), fp(Args{Value(2)}));
}

TEST(FingerprintTest, DoublesCompareByBitPattern) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(fp(Args{Value(nan)}), fp(Args{Value(nan)}));
  EXPECT_NE(fp(Args{Value(0.0)}), fp(Args{Value(-0.0)}));
}

TEST(FingerprintTest, KwargsOrderIsIgnoredListOrderIsNot) {
  Kwargs k1{{"alpha", Value(1)}, {"beta", Value(2.5)}};
  Kwargs k2{{"beta", Value(2.5)}, {"alpha", Value(1)}};
  EXPECT_EQ(fp(Args{}, k1), fp(Args{}, k2));
  EXPECT_NE(fp(Args{Value(1), Value(2)}), fp(Args{Value(2), Value(1)}));
  EXPECT_NE(fp(Args{Value(List{Value(1)})}), fp(Args{Value(List{Value(1), Value(1)})}));
}

TEST(FingerprintTest, ArgsAndKwargsAreSeparated) {
  EXPECT_NE(fp(Args{Value(1)}), fp(Args{}, Kwargs{{"x", Value(1)}}));
}

TEST(FingerprintTest, NoneAndOpaqueAreWildcards) {
  Opaque o1{std::make_shared<int>(1), "module"};
  Opaque o2{std::make_shared<int>(2), "module"};
  EXPECT_EQ(fp(Args{Value(o1)}), fp(Args{Value(o2)}));
  EXPECT_EQ(fp(Args{Value(o1)}), fp(Args{Value()}));
  EXPECT_EQ(Fingerprint::of(Value()).kind(), Fingerprint::Kind::Wildcard);
  EXPECT_NE(fp(Args{Value()}), fp(Args{Value(0)}));
}

TEST(FingerprintTest, CpuScalarTensorValueIsPartOfKey) {
  auto s1 = ops::from_vector<std::int64_t>({1}, {1});
  auto s1b = ops::from_vector<std::int64_t>({1}, {1});
  auto s2 = ops::from_vector<std::int64_t>({2}, {1});
  EXPECT_EQ(fp(Args{Value(s1)}), fp(Args{Value(s1b)}));
  EXPECT_NE(fp(Args{Value(s1)}), fp(Args{Value(s2)}));

  auto v1 = ops::from_vector<float>({1.f, 2.f}, {2});
  auto v2 = ops::from_vector<float>({3.f, 4.f}, {2});
  EXPECT_EQ(fp(Args{Value(v1)}), fp(Args{Value(v2)}));
}

TEST(FingerprintTest, UsableAsHashKey) {
  std::unordered_set<Fingerprint, FingerprintHash> keys;
  keys.insert(fp(Args{Value(1)}));
  keys.insert(fp(Args{Value(1)}));
  keys.insert(fp(Args{Value(2)}));
  EXPECT_EQ(keys.size(), 2u);
}

TEST(FingerprintTest, ToStringDescribesTree) {
  auto x = ops::from_vector<float>({1.f, 2.f, 3.f, 4.f}, {4});
  auto s = ops::from_vector<std::int64_t>({7}, {1});
  Fingerprint f = fp(Args{Value(x), Value(3), Value()},
                     Kwargs{{"scale", Value(2.5)}, {"mode", Value("fast")}, {"k", Value(s)}});
  EXPECT_EQ(f.to_string(),
            "((Tensor(cpu:0, float32, [4]), 3, *), "
            "{k: Tensor(cpu:0, int64, [1], value=7), mode: \"fast\", scale: double(2.5)})");
}
