// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>

#include "gcap/cuda/allocator.h"
#include "gcap/cuda/stream.h"

namespace gcap {
namespace graphs {

// Per-device state shared by every captured graph on that device. Created
// on first use and kept until process exit; fields never change after
// construction. Any capture or replay on the device holds mutex while it
// touches stream or pool.
struct ExecutionEnvironment {
  ExecutionEnvironment(gcap::cuda::DeviceIndex dev, gcap::cuda::Stream s, gcap::cuda::MempoolId p)
      : device(dev), stream(s), pool(p) {}
  ExecutionEnvironment(const ExecutionEnvironment&) = delete;
  ExecutionEnvironment& operator=(const ExecutionEnvironment&) = delete;

  const gcap::cuda::DeviceIndex device;
  const gcap::cuda::Stream stream;    // dedicated, never the default stream
  const gcap::cuda::MempoolId pool;   // retained for the process lifetime
  std::mutex mutex;
};

// Environment of device (the calling thread's current device when nullopt).
// The returned reference stays valid for the rest of the process.
// Throws ResourceError when built without CUDA.
ExecutionEnvironment& get_execution_environment(
    std::optional<gcap::cuda::DeviceIndex> device = std::nullopt);

// Number of environments created so far.
std::size_t execution_environment_count();

} // namespace graphs
} // namespace gcap
