// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "gcap/core/error.h"
#include "gcap/cuda/device.h"
#include "gcap/cuda/graphs.h"
#include "gcap/cuda/guard.h"
#include "gcap/cuda/stream.h"
#include "gcap/ops/tensor_ops.h"
#include "gcap_test_helpers.h"

using namespace gcap::cuda;
using gcap::core::Device;
using gcap::core::TensorImpl;
namespace ops = gcap::ops;

TEST(CUDAGraphBasicTest, UnavailableWithoutCuda) {
#if GCAP_WITH_CUDA
  GTEST_SKIP() << "CPU-only build required";
#else
  CUDAGraph g;
  try {
    g.capture_begin(Stream(Stream::UNCHECKED, 1u, 0));
    FAIL() << "expected ResourceError";
  } catch (const gcap::ResourceError& e) {
    EXPECT_EQ(std::string(e.what()), kErrCudaGraphsUnavailable);
  }
  EXPECT_THROW(g.replay(), gcap::ResourceError);
  g.capture_abort();
  EXPECT_FALSE(g.is_capturing());
  EXPECT_EQ(streamCaptureStatus(getDefaultStream()), CaptureStatus::None);
#endif
}

TEST(CUDAGraphBasicTest, DefaultStreamCaptureIsDenied) {
  if (!gcap_test::cuda_available()) {
    GTEST_SKIP() << "CUDA required";
  }
  const auto before = cuda_graphs_counters();
  CUDAGraph g;
  try {
    g.capture_begin(getDefaultStream(0));
    FAIL() << "expected UsageError";
  } catch (const gcap::UsageError& e) {
    EXPECT_NE(std::string(e.what()).find(kErrDefaultStreamCaptureBan), std::string::npos);
  }
  EXPECT_FALSE(g.is_capturing());
  EXPECT_EQ(cuda_graphs_counters().denied_default_stream, before.denied_default_stream + 1);
}

TEST(CUDAGraphBasicTest, StateMachineRejectsOutOfOrderCalls) {
  if (!gcap_test::cuda_available()) {
    GTEST_SKIP() << "CUDA required";
  }
  CUDAGraph g;
  EXPECT_THROW(g.capture_end(), gcap::UsageError);
  EXPECT_THROW(g.instantiate(), gcap::UsageError);
  EXPECT_THROW(g.replay(), gcap::UsageError);
  EXPECT_THROW(g.reset(), gcap::UsageError);
}

TEST(CUDAGraphBasicTest, NestedCaptureIsDeniedAndAbortCleansUp) {
  if (!gcap_test::cuda_available()) {
    GTEST_SKIP() << "CUDA required";
  }
  DeviceGuard dg(0);
  Stream s = makeDedicatedStream(0);
  const auto before = cuda_graphs_counters();

  CUDAGraph outer;
  outer.capture_begin(s);
  ASSERT_TRUE(outer.is_capturing());
  EXPECT_EQ(streamCaptureStatus(s), CaptureStatus::Active);
  EXPECT_THROW(outer.capture_begin(s), gcap::UsageError);

  CUDAGraph inner;
  EXPECT_THROW(inner.capture_begin(s), gcap::UsageError);
  EXPECT_FALSE(inner.is_capturing());

  outer.capture_abort();
  EXPECT_FALSE(outer.is_capturing());
  EXPECT_EQ(streamCaptureStatus(s), CaptureStatus::None);

  const auto after = cuda_graphs_counters();
  EXPECT_EQ(after.nested_capture_denied, before.nested_capture_denied + 1);
  EXPECT_EQ(after.captures_aborted, before.captures_aborted + 1);
}

TEST(CUDAGraphBasicTest, CaptureInstantiateReplay) {
  if (!gcap_test::cuda_available()) {
    GTEST_SKIP() << "CUDA required";
  }
  DeviceGuard dg(0);
  Stream s = makeDedicatedStream(0);
  TensorImpl x = ops::from_vector<float>({1.f, 2.f, 3.f, 4.f}, {4}, Device::cuda(0));
  device_synchronize(0);
  const auto before = cuda_graphs_counters();

  CUDAGraph g;
  TensorImpl out;
  {
    CUDAStreamGuard sg(s);
    g.capture_begin(s);
    out = ops::mul(x, 2.0);
    g.capture_end();
  }
  EXPECT_TRUE(g.pool().is_valid());
  EXPECT_EQ(g.device(), 0);
  EXPECT_EQ(g.capture_stream(), s);
  EXPECT_EQ(Allocator::get(0).pool_refcount(g.pool()), 1u);
  g.instantiate();
  ASSERT_TRUE(g.is_instantiated());

  g.replay();
  s.synchronize();
  EXPECT_EQ(ops::to_vector<float>(out), (std::vector<float>{2.f, 4.f, 6.f, 8.f}));

  ops::copy_(x, ops::from_vector<float>({5.f, 6.f, 7.f, 8.f}, {4}));
  device_synchronize(0);
  g.replay();
  s.synchronize();
  EXPECT_EQ(ops::to_vector<float>(out), (std::vector<float>{10.f, 12.f, 14.f, 16.f}));

  const auto after = cuda_graphs_counters();
  EXPECT_EQ(after.captures_started, before.captures_started + 1);
  EXPECT_EQ(after.captures_ended, before.captures_ended + 1);
  EXPECT_EQ(after.graphs_instantiated, before.graphs_instantiated + 1);
  EXPECT_EQ(after.graphs_replayed, before.graphs_replayed + 2);

  g.reset();
  EXPECT_FALSE(g.is_instantiated());
  EXPECT_THROW(g.replay(), gcap::UsageError);
}
