// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

#include "gcap/core/error.h"
#include "gcap/cuda/allocator.h"
#include "gcap/graphs/execution_env.h"
#include "gcap_test_helpers.h"

using gcap::graphs::ExecutionEnvironment;
using gcap::graphs::get_execution_environment;

namespace {

bool env_supported() {
  return gcap_test::cuda_available();
}

} // namespace

TEST(ExecutionEnvTest, UnavailableWithoutCuda) {
#if GCAP_WITH_CUDA
  GTEST_SKIP() << "CPU-only build behavior";
#else
  EXPECT_THROW(get_execution_environment(0), gcap::ResourceError);
  EXPECT_THROW(get_execution_environment(), gcap::ResourceError);
  EXPECT_EQ(gcap::graphs::execution_environment_count(), 0u);
#endif
}

TEST(ExecutionEnvTest, SameDeviceSameEnvironment) {
  if (!env_supported()) {
    GTEST_SKIP() << "CUDA device required";
  }
  ExecutionEnvironment& a = get_execution_environment(0);
  ExecutionEnvironment& b = get_execution_environment(0);
  EXPECT_EQ(&a, &b);
  EXPECT_EQ(a.device, 0);
  EXPECT_EQ(a.stream.device_index(), 0);
  EXPECT_TRUE(a.pool.is_valid());
  EXPECT_EQ(a.pool.dev, 0);
  EXPECT_GE(gcap::cuda::Allocator::get(0).pool_refcount(a.pool), 1u);
  EXPECT_GE(gcap::graphs::execution_environment_count(), 1u);
}

TEST(ExecutionEnvTest, CurrentDeviceDefault) {
  if (!env_supported()) {
    GTEST_SKIP() << "CUDA device required";
  }
  ExecutionEnvironment& cur = get_execution_environment();
  EXPECT_EQ(&cur, &get_execution_environment(cur.device));
}

TEST(ExecutionEnvTest, ConcurrentFirstUseCreatesOne) {
  if (!env_supported()) {
    GTEST_SKIP() << "CUDA device required";
  }
  constexpr int kThreads = 8;
  std::vector<ExecutionEnvironment*> seen(kThreads, nullptr);
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      seen[i] = &get_execution_environment(0);
    });
  }
  go.store(true);
  for (auto& t : threads) t.join();
  for (int i = 1; i < kThreads; ++i) {
    EXPECT_EQ(seen[i], seen[0]);
  }
  const auto n = gcap::graphs::execution_environment_count();
  get_execution_environment(0);
  EXPECT_EQ(gcap::graphs::execution_environment_count(), n);
}

TEST(ExecutionEnvTest, EnvironmentStreamIsNotDefault) {
  if (!gcap_test::cuda_available()) {
    GTEST_SKIP() << "CUDA required";
  }
  ExecutionEnvironment& env = get_execution_environment(0);
  EXPECT_NE(env.stream.id(), gcap::cuda::getDefaultStream(0).id());
}
