// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/graphs/execution_env.h"

#include <map>
#include <memory>
#include <string>

#include "gcap/core/error.h"
#include "gcap/cuda/device.h"
#include "gcap/cuda/graphs.h"
#include "gcap/cuda/guard.h"
#include "gcap/logging/logging.h"

namespace gcap {
namespace graphs {

namespace {

struct Registry {
  std::mutex mu;
  std::map<gcap::cuda::DeviceIndex, std::unique_ptr<ExecutionEnvironment>> envs;
};

// Leaked so environments stay valid during static destruction.
Registry& registry() {
  static Registry* r = new Registry();
  return *r;
}

} // anonymous

ExecutionEnvironment& get_execution_environment(std::optional<gcap::cuda::DeviceIndex> device) {
#if !GCAP_WITH_CUDA
  (void)device;
  throw ResourceError(gcap::cuda::kErrCudaGraphsUnavailable);
#else
  const gcap::cuda::DeviceIndex dev = device ? *device : gcap::cuda::current_device();
  if (dev < 0) {
    throw UsageError("get_execution_environment: invalid device index " + std::to_string(dev));
  }
  Registry& r = registry();
  std::lock_guard<std::mutex> lk(r.mu);
  auto it = r.envs.find(dev);
  if (it != r.envs.end()) {
    return *it->second;
  }
  gcap::cuda::DeviceGuard dg(dev);
  gcap::cuda::Stream stream = gcap::cuda::makeDedicatedStream(dev);
  gcap::cuda::MempoolId pool = gcap::cuda::Allocator::create_pool_id(dev);
  gcap::cuda::Allocator::retain_pool(dev, pool);
  auto env = std::make_unique<ExecutionEnvironment>(dev, stream, pool);
  GCAP_LOG(INFO) << "Created graph execution environment for cuda:" << dev << " ("
                 << gcap::cuda::to_string(stream) << ", " << pool.to_string() << ")";
  auto [pos, inserted] = r.envs.emplace(dev, std::move(env));
  GCAP_CHECK(inserted);
  return *pos->second;
#endif
}

std::size_t execution_environment_count() {
  Registry& r = registry();
  std::lock_guard<std::mutex> lk(r.mu);
  return r.envs.size();
}

} // namespace graphs
} // namespace gcap
