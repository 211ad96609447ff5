// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/cuda/stream.h"
#include "gcap/cuda/device.h"
#include "gcap/cuda/guard.h"
#include "gcap/core/error.h"

#include <mutex>
#include <sstream>
#include <vector>

#ifndef GCAP_WITH_CUDA
#  error "GCAP_WITH_CUDA must be defined (0/1)"
#endif
static_assert(GCAP_WITH_CUDA == 0 || GCAP_WITH_CUDA == 1, "GCAP_WITH_CUDA must be 0 or 1");

#if GCAP_WITH_CUDA
#  include <cuda_runtime_api.h>
#endif

namespace gcap { namespace cuda {

namespace {
#if GCAP_WITH_CUDA
static inline void cudaCheck(cudaError_t st, const char* what) {
  if (st != cudaSuccess) {
    const char* msg = cudaGetErrorString(st);
    throw ResourceError(std::string(what) + ": " + (msg ? msg : ""));
  }
}

static inline DeviceIndex resolve(DeviceIndex dev) {
  return dev < 0 ? current_device() : dev;
}

static thread_local std::vector<uintptr_t> tls_current_handles; // per-device current stream handle (0 == default)

static void ensure_tls_capacity() {
  int n = device_count();
  if (static_cast<int>(tls_current_handles.size()) < n) {
    tls_current_handles.resize(static_cast<size_t>(n), 0);
  }
}

static std::mutex pool_mu;
static constexpr int kStreamsPerPool = 8;
static std::vector<std::vector<uintptr_t>> pool_handles;
static std::vector<uint32_t> pool_indices;

static uintptr_t create_stream(DeviceIndex dev) {
  DeviceGuard g(dev);
  // Ensure the primary context exists before creating streams
  (void)cudaFree(0);
  cudaStream_t st = nullptr;
  cudaCheck(cudaStreamCreateWithFlags(&st, cudaStreamNonBlocking), "cudaStreamCreateWithFlags");
  if (st == nullptr) {
    throw ResourceError("cudaStreamCreateWithFlags: returned null stream");
  }
  return reinterpret_cast<uintptr_t>(st);
}
#endif
} // anonymous

Stream::Stream(Unchecked, uint64_t packed_id, DeviceIndex device) noexcept
    : id_(packed_id), device_index_(device), handle_(static_cast<uintptr_t>(packed_id)) {}

Stream getStreamFromPool(DeviceIndex device) {
#if GCAP_WITH_CUDA
  DeviceIndex dev = resolve(device);
  std::lock_guard<std::mutex> lock(pool_mu);
  if (static_cast<size_t>(dev) >= pool_handles.size()) {
    pool_handles.resize(static_cast<size_t>(dev) + 1);
    pool_indices.resize(static_cast<size_t>(dev) + 1, 0u);
  }
  uint32_t target = pool_indices[static_cast<size_t>(dev)]++ % kStreamsPerPool;
  auto& vec = pool_handles[static_cast<size_t>(dev)];
  while (vec.size() <= target) {
    vec.push_back(create_stream(dev));
  }
  return Stream(Stream::UNCHECKED, static_cast<uint64_t>(vec[target]), dev);
#else
  (void)device; return Stream(Stream::UNCHECKED, 0u, 0);
#endif
}

Stream makeDedicatedStream(DeviceIndex device) {
#if GCAP_WITH_CUDA
  DeviceIndex dev = resolve(device);
  return Stream(Stream::UNCHECKED, static_cast<uint64_t>(create_stream(dev)), dev);
#else
  return Stream(Stream::UNCHECKED, 0u, device < 0 ? DeviceIndex{0} : device);
#endif
}

Stream getDefaultStream(DeviceIndex device) {
#if GCAP_WITH_CUDA
  return Stream(Stream::UNCHECKED, 0u, resolve(device));
#else
  (void)device; return Stream(Stream::UNCHECKED, 0u, 0);
#endif
}

Stream getCurrentStream(DeviceIndex device) {
#if GCAP_WITH_CUDA
  DeviceIndex dev = resolve(device);
  ensure_tls_capacity();
  uintptr_t h = 0;
  if (dev >= 0 && dev < static_cast<DeviceIndex>(tls_current_handles.size())) {
    h = tls_current_handles[static_cast<size_t>(dev)];
  }
  return Stream(Stream::UNCHECKED, static_cast<uint64_t>(h), dev);
#else
  (void)device; return Stream(Stream::UNCHECKED, 0u, 0);
#endif
}

void setCurrentStream(Stream s) {
#if GCAP_WITH_CUDA
  ensure_tls_capacity();
  if (s.device_index_ >= 0 && s.device_index_ < static_cast<DeviceIndex>(tls_current_handles.size())) {
    tls_current_handles[static_cast<size_t>(s.device_index_)] = s.handle_;
  }
#else
  (void)s;
#endif
}

void Stream::synchronize() const {
#if GCAP_WITH_CUDA
  DeviceGuard g(device_index_);
  cudaCheck(cudaStreamSynchronize(reinterpret_cast<cudaStream_t>(handle_)), "cudaStreamSynchronize");
#endif
}

std::string to_string(const Stream& s) {
  std::ostringstream oss;
  oss << "Stream(device=cuda:" << static_cast<int>(s.device_index())
      << ", id=" << s.id() << ", handle=0x" << std::hex << s.handle() << ")";
  return oss.str();
}

}} // namespace gcap::cuda
