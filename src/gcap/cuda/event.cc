// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/cuda/event.h"
#include "gcap/cuda/stream.h"
#include "gcap/cuda/guard.h"
#include "gcap/core/error.h"

#include <string>

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
#endif
}

Event::Event(Event&& other) noexcept
    : is_created_(other.is_created_),
      device_index_(other.device_index_),
      event_(other.event_) {
  other.is_created_ = false;
  other.device_index_ = -1;
  other.event_ = nullptr;
}

Event& Event::operator=(Event&& other) noexcept {
  if (this == &other) return *this;
  destroy();
  is_created_ = other.is_created_;
  device_index_ = other.device_index_;
  event_ = other.event_;
  other.is_created_ = false;
  other.device_index_ = -1;
  other.event_ = nullptr;
  return *this;
}

Event::~Event() noexcept { destroy(); }

void Event::destroy() noexcept {
#if GCAP_WITH_CUDA
  if (is_created_ && event_) {
    DeviceGuard g(device_index_);
    (void)cudaEventDestroy(reinterpret_cast<cudaEvent_t>(event_));
  }
#endif
  is_created_ = false;
  event_ = nullptr;
}

void Event::record(const Stream& stream) {
#if GCAP_WITH_CUDA
  if (!is_created_) {
    device_index_ = stream.device_index();
    DeviceGuard g(device_index_);
    cudaEvent_t ev = nullptr;
    cudaCheck(cudaEventCreateWithFlags(&ev, cudaEventDisableTiming), "cudaEventCreateWithFlags");
    event_ = ev;
    is_created_ = true;
  } else if (device_index_ != stream.device_index()) {
    throw UsageError("CUDA event recorded on a different device than it was created");
  }
  DeviceGuard g(device_index_);
  cudaCheck(cudaEventRecord(reinterpret_cast<cudaEvent_t>(event_),
                            reinterpret_cast<cudaStream_t>(stream.handle())),
            "cudaEventRecord");
#else
  (void)stream;
#endif
}

void Event::wait(const Stream& stream) const {
#if GCAP_WITH_CUDA
  if (!is_created_) return;
  DeviceGuard g(stream.device_index());
  cudaCheck(cudaStreamWaitEvent(reinterpret_cast<cudaStream_t>(stream.handle()),
                                reinterpret_cast<cudaEvent_t>(event_), 0),
            "cudaStreamWaitEvent");
#else
  (void)stream;
#endif
}

void Event::synchronize() const {
#if GCAP_WITH_CUDA
  if (!is_created_) return;
  DeviceGuard g(device_index_);
  cudaCheck(cudaEventSynchronize(reinterpret_cast<cudaEvent_t>(event_)), "cudaEventSynchronize");
#endif
}

}} // namespace gcap::cuda
