// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "gcap/cuda/device.h"
#include "gcap/cuda/guard.h"
#include "gcap/cuda/stream.h"
#include "gcap_test_helpers.h"

using namespace gcap::cuda;

TEST(CUDAGuardTest, StreamGuardSetsAndRestoresCurrentStream) {
  if (!gcap_test::cuda_available()) {
    GTEST_SKIP() << "CUDA required";
  }
  DeviceGuard dg(0);
  const Stream before = getCurrentStream(0);
  const Stream s = getStreamFromPool(0);
  {
    CUDAStreamGuard sg(s);
    EXPECT_EQ(getCurrentStream(0), s);
    EXPECT_EQ(current_device(), 0);
  }
  EXPECT_EQ(getCurrentStream(0), before);
}

TEST(CUDAGuardTest, StreamGuardSwitchesToStreamDevice) {
  if (!gcap_test::cuda_available() || device_count() < 2) {
    GTEST_SKIP() << "two CUDA devices required";
  }
  DeviceGuard dg(0);
  const Stream s = getStreamFromPool(1);
  const Stream before = getCurrentStream(1);
  {
    CUDAStreamGuard sg(s);
    EXPECT_EQ(current_device(), 1);
    EXPECT_EQ(getCurrentStream(1), s);
  }
  EXPECT_EQ(current_device(), 0);
  EXPECT_EQ(getCurrentStream(1), before);
}

TEST(CUDAGuardTest, DeviceGuardRestoresOnlyWhatItChanged) {
  if (!gcap_test::cuda_available()) {
    GTEST_SKIP() << "CUDA required";
  }
  DeviceGuard outer(0);
  {
    DeviceGuard keep(-1);
    EXPECT_EQ(keep.original_device(), 0);
    EXPECT_EQ(current_device(), 0);
  }
  EXPECT_EQ(current_device(), 0);
  if (device_count() >= 2) {
    {
      DeviceGuard g(1);
      EXPECT_EQ(g.original_device(), 0);
      EXPECT_EQ(current_device(), 1);
    }
    EXPECT_EQ(current_device(), 0);
  }
}
