// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/cuda/device.h"
#include "gcap/cuda/guard.h"
#include "gcap/core/error.h"

#include <string>

#ifndef GCAP_WITH_CUDA
#  error "GCAP_WITH_CUDA must be defined (0/1)"
#endif
static_assert(GCAP_WITH_CUDA == 0 || GCAP_WITH_CUDA == 1, "GCAP_WITH_CUDA must be 0 or 1");

#if GCAP_WITH_CUDA
#  include <cuda.h>
#  include <cuda_runtime_api.h>
#endif

namespace gcap {
namespace cuda {

namespace {
#if GCAP_WITH_CUDA
static inline void cudaCheck(cudaError_t st, const char* what) {
  if (st != cudaSuccess) {
    const char* msg = cudaGetErrorString(st);
    throw ResourceError(std::string(what) + ": " + (msg ? msg : ""));
  }
}
#endif
} // anonymous

int device_count() noexcept {
#if GCAP_WITH_CUDA
  // Driver API avoids a runtime context on machines without a device.
  CUresult r = cuInit(0);
  if (r != CUDA_SUCCESS) {
    return 0;
  }
  int count = 0;
  r = cuDeviceGetCount(&count);
  if (r != CUDA_SUCCESS) return 0;
  return count < 0 ? 0 : count;
#else
  return 0;
#endif
}

DeviceIndex current_device() {
#if GCAP_WITH_CUDA
  int dev = 0;
  cudaCheck(cudaGetDevice(&dev), "cudaGetDevice");
  return static_cast<DeviceIndex>(dev);
#else
  return 0;
#endif
}

void device_synchronize(DeviceIndex dev) {
#if GCAP_WITH_CUDA
  DeviceGuard g(dev);
  cudaCheck(cudaDeviceSynchronize(), "cudaDeviceSynchronize");
#else
  (void)dev;
#endif
}

} // namespace cuda
} // namespace gcap
