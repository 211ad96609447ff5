// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/cuda/guard.h"
#include "gcap/cuda/stream.h"

#ifndef GCAP_WITH_CUDA
#  error "GCAP_WITH_CUDA must be defined (0/1)"
#endif
static_assert(GCAP_WITH_CUDA == 0 || GCAP_WITH_CUDA == 1, "GCAP_WITH_CUDA must be 0 or 1");

#if GCAP_WITH_CUDA
#  include <cuda_runtime_api.h>
#endif

namespace gcap { namespace cuda {

DeviceGuard::DeviceGuard(DeviceIndex d) noexcept {
#if GCAP_WITH_CUDA
  int cur = -1;
  if (cudaGetDevice(&cur) != cudaSuccess) {
    (void)cudaGetLastError();
    return;
  }
  original_ = static_cast<DeviceIndex>(cur);
  if (d >= 0 && d != original_ && cudaSetDevice(static_cast<int>(d)) == cudaSuccess) {
    switched_ = true;
  }
#else
  (void)d;
#endif
}

DeviceGuard::~DeviceGuard() noexcept {
#if GCAP_WITH_CUDA
  if (switched_) {
    (void)cudaSetDevice(static_cast<int>(original_));
  }
#endif
}

CUDAStreamGuard::CUDAStreamGuard(Stream s) noexcept
    : device_(s.device_index()), restore_(getCurrentStream(s.device_index())) {
  setCurrentStream(s);
}

CUDAStreamGuard::~CUDAStreamGuard() noexcept {
  // Runs before device_ restores the previous device.
  setCurrentStream(restore_);
}

}} // namespace gcap::cuda
