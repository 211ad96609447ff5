// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include "gcap/cuda/stream.h"

#ifndef GCAP_WITH_CUDA
#  error "GCAP_WITH_CUDA must be defined (0/1)"
#endif
static_assert(GCAP_WITH_CUDA == 0 || GCAP_WITH_CUDA == 1, "GCAP_WITH_CUDA must be 0 or 1");

namespace gcap { namespace cuda {

using DeviceIndex = int16_t;

// Makes d the calling thread's current device for the guard's scope. Only a
// device it actually switched away from is restored; d < 0 is a no-op.
class DeviceGuard final {
 public:
  explicit DeviceGuard(DeviceIndex d) noexcept;
  ~DeviceGuard() noexcept;

  DeviceGuard(const DeviceGuard&) = delete;
  DeviceGuard& operator=(const DeviceGuard&) = delete;

  DeviceIndex original_device() const noexcept { return original_; }

 private:
  DeviceIndex original_{-1};
  bool switched_{false};
};

// Makes s the current stream of its device, and that device current, for the
// guard's scope. Work issued by code that only consults getCurrentStream()
// (callables under warmup or capture) lands on s.
class CUDAStreamGuard final {
 public:
  explicit CUDAStreamGuard(Stream s) noexcept;
  ~CUDAStreamGuard() noexcept;

  CUDAStreamGuard(const CUDAStreamGuard&) = delete;
  CUDAStreamGuard& operator=(const CUDAStreamGuard&) = delete;

 private:
  DeviceGuard device_;
  Stream      restore_;
};

}} // namespace gcap::cuda
