// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/cuda/graphs.h"
#include "gcap/cuda/guard.h"
#include "gcap/core/error.h"
#include "gcap/logging/logging.h"

#include <atomic>
#include <utility>

#ifndef GCAP_WITH_CUDA
#  error "GCAP_WITH_CUDA must be defined (0/1)"
#endif
static_assert(GCAP_WITH_CUDA == 0 || GCAP_WITH_CUDA == 1, "GCAP_WITH_CUDA must be 0 or 1");

#if GCAP_WITH_CUDA
#  include <cuda_runtime_api.h>
#endif

namespace gcap { namespace cuda {

namespace {
std::atomic<std::uint64_t> g_captures_started{0};
std::atomic<std::uint64_t> g_captures_ended{0};
std::atomic<std::uint64_t> g_captures_aborted{0};
std::atomic<std::uint64_t> g_denied_default_stream{0};
std::atomic<std::uint64_t> g_nested_capture_denied{0};
std::atomic<std::uint64_t> g_end_in_dtor{0};
std::atomic<std::uint64_t> g_graphs_instantiated{0};
std::atomic<std::uint64_t> g_graphs_replayed{0};
std::atomic<std::uint64_t> g_replay_errors{0};

inline void bump(std::atomic<std::uint64_t>& c) noexcept { c.fetch_add(1, std::memory_order_relaxed); }

#if GCAP_WITH_CUDA
static_assert(int(cudaStreamCaptureStatusNone) == 0, "unexpected int(cudaStreamCaptureStatusNone)");
static_assert(int(cudaStreamCaptureStatusActive) == 1, "unexpected int(cudaStreamCaptureStatusActive)");
static_assert(int(cudaStreamCaptureStatusInvalidated) == 2, "unexpected int(cudaStreamCaptureStatusInvalidated)");

[[noreturn]] void throw_cuda(const char* what, cudaError_t rc) {
  (void)cudaGetLastError();
  throw ResourceError(std::string(what) + " failed: " + cudaGetErrorString(rc));
}
#endif
} // anonymous

// Owns the allocator routing of an open capture. If the owning graph goes
// away while still capturing, the destructor ends the capture and drops the
// partial graph so the stream is usable again.
struct CUDAGraph::GraphCaptureSession {
  GraphCaptureSession(Stream s, Allocator::AllocateToPoolGuard&& g) noexcept
      : stream(s), routing(std::move(g)) {}

  ~GraphCaptureSession() {
#if GCAP_WITH_CUDA
    if (begun && !finished) {
      DeviceGuard dg(stream.device_index());
      cudaGraph_t tmp = nullptr;
      cudaError_t rc = cudaStreamEndCapture(reinterpret_cast<cudaStream_t>(stream.handle()), &tmp);
      if (tmp != nullptr) {
        (void)cudaGraphDestroy(tmp);
      }
      if (rc != cudaSuccess) {
        (void)cudaGetLastError();
      }
      bump(g_end_in_dtor);
    }
#endif
  }

  Stream stream;
  Allocator::AllocateToPoolGuard routing;
  bool begun{false};
  bool finished{false};
};

CaptureStatus streamCaptureStatus(Stream s) {
#if GCAP_WITH_CUDA
  DeviceGuard dg(s.device_index());
  cudaStreamCaptureStatus st = cudaStreamCaptureStatusNone;
  cudaError_t rc = cudaStreamIsCapturing(reinterpret_cast<cudaStream_t>(s.handle()), &st);
  if (rc != cudaSuccess) {
    throw_cuda("cudaStreamIsCapturing", rc);
  }
  return static_cast<CaptureStatus>(static_cast<int>(st));
#else
  (void)s;
  return CaptureStatus::None;
#endif
}

GraphCounters cuda_graphs_counters() noexcept {
  GraphCounters c;
  c.captures_started = g_captures_started.load(std::memory_order_relaxed);
  c.captures_ended = g_captures_ended.load(std::memory_order_relaxed);
  c.captures_aborted = g_captures_aborted.load(std::memory_order_relaxed);
  c.denied_default_stream = g_denied_default_stream.load(std::memory_order_relaxed);
  c.nested_capture_denied = g_nested_capture_denied.load(std::memory_order_relaxed);
  c.end_in_dtor = g_end_in_dtor.load(std::memory_order_relaxed);
  c.graphs_instantiated = g_graphs_instantiated.load(std::memory_order_relaxed);
  c.graphs_replayed = g_graphs_replayed.load(std::memory_order_relaxed);
  c.replay_errors = g_replay_errors.load(std::memory_order_relaxed);
  return c;
}

CUDAGraph::CUDAGraph() = default;

CUDAGraph::~CUDAGraph() noexcept {
  capture_abort();
  reset_impl();
}

void CUDAGraph::capture_begin(Stream s, std::optional<MempoolId> pool) {
#if !GCAP_WITH_CUDA
  (void)s; (void)pool;
  throw ResourceError(kErrCudaGraphsUnavailable);
#else
  if (state_ != State::None) {
    throw UsageError(kErrGraphBeginInvalidState);
  }
  // Nested capture is checked first so it wins over the default-stream ban.
  if (streamCaptureStatus(s) == CaptureStatus::Active) {
    bump(g_nested_capture_denied);
    throw UsageError(kErrNestedCaptureBan);
  }
  if (s.id() == 0) {
    bump(g_denied_default_stream);
    throw UsageError(kErrDefaultStreamCaptureBan);
  }

  const DeviceIndex dev = s.device_index();
  MempoolId id;
  if (pool && pool->is_valid()) {
    if (pool->dev != dev) {
      throw UsageError(std::string(kErrGraphDeviceMismatchPrefix) +
                       ": graph_device=cuda:" + std::to_string(static_cast<int>(dev)) +
                       " pool_device=cuda:" + std::to_string(static_cast<int>(pool->dev)));
    }
    id = *pool;
  } else {
    id = Allocator::create_pool_id(dev);
  }

  Allocator::retain_pool(dev, id);
  try {
    sess_ = std::make_unique<GraphCaptureSession>(s, Allocator::begin_allocate_to_pool(dev, id));
    DeviceGuard dg(dev);
    cudaError_t rc = cudaStreamBeginCapture(reinterpret_cast<cudaStream_t>(s.handle()),
                                            cudaStreamCaptureModeThreadLocal);
    if (rc != cudaSuccess) {
      throw_cuda("cudaStreamBeginCapture", rc);
    }
    sess_->begun = true;
  } catch (...) {
    sess_.reset();
    Allocator::release_pool(dev, id);
    throw;
  }

  device_ = dev;
  capture_stream_ = s;
  pool_ = id;
  state_ = State::Capturing;
  bump(g_captures_started);
#endif
}

void CUDAGraph::capture_end() {
#if !GCAP_WITH_CUDA
  throw ResourceError(kErrCudaGraphsUnavailable);
#else
  if (state_ != State::Capturing || !sess_) {
    throw UsageError(kErrGraphEndInvalidState);
  }

  cudaGraph_t tmp = nullptr;
  cudaError_t rc;
  {
    DeviceGuard dg(device_);
    rc = cudaStreamEndCapture(reinterpret_cast<cudaStream_t>(capture_stream_.handle()), &tmp);
  }
  // The capture is closed either way; routing ends with the session.
  sess_->finished = true;
  sess_.reset();

  if (rc != cudaSuccess || tmp == nullptr) {
    if (tmp != nullptr) {
      DeviceGuard dg(device_);
      (void)cudaGraphDestroy(tmp);
    }
    bump(g_captures_aborted);
    reset_impl();
    if (rc != cudaSuccess) {
      throw_cuda("cudaStreamEndCapture", rc);
    }
    throw ResourceError("Invalid capture.");
  }

  graph_ = tmp;
  state_ = State::Captured;
  bump(g_captures_ended);
#endif
}

void CUDAGraph::capture_abort() noexcept {
  if (state_ != State::Capturing) return;
  // Session destructor ends the capture and tears down routing.
  sess_.reset();
  bump(g_captures_aborted);
  reset_impl();
}

void CUDAGraph::instantiate() {
#if !GCAP_WITH_CUDA
  throw ResourceError(kErrCudaGraphsUnavailable);
#else
  if (state_ != State::Captured || graph_ == nullptr || exec_ != nullptr) {
    throw UsageError(kErrGraphInstantiateInvalidState);
  }
  DeviceGuard dg(device_);
  cudaGraphExec_t exec_raw = nullptr;
  cudaError_t rc = cudaGraphInstantiate(&exec_raw, reinterpret_cast<cudaGraph_t>(graph_), 0);
  if (rc != cudaSuccess) {
    throw_cuda("cudaGraphInstantiate", rc);
  }
  exec_ = exec_raw;
  state_ = State::Instantiated;
  bump(g_graphs_instantiated);
#endif
}

void CUDAGraph::replay(std::optional<Stream> s) {
#if !GCAP_WITH_CUDA
  (void)s;
  throw ResourceError(kErrCudaGraphsUnavailable);
#else
  if (state_ != State::Instantiated || exec_ == nullptr) {
    throw UsageError(kErrGraphReplayInvalidState);
  }
  Stream target = s.has_value() ? *s : capture_stream_;
  if (target.device_index() != device_) {
    throw UsageError(std::string(kErrGraphDeviceMismatchPrefix) +
                     ": graph_device=cuda:" + std::to_string(static_cast<int>(device_)) +
                     " stream_device=cuda:" + std::to_string(static_cast<int>(target.device_index())));
  }
  DeviceGuard dg(device_);
  cudaError_t rc = cudaGraphLaunch(reinterpret_cast<cudaGraphExec_t>(exec_),
                                   reinterpret_cast<cudaStream_t>(target.handle()));
  if (rc != cudaSuccess) {
    bump(g_replay_errors);
    throw_cuda("cudaGraphLaunch", rc);
  }
  bump(g_graphs_replayed);
#endif
}

void CUDAGraph::reset() {
  if (state_ != State::Captured && state_ != State::Instantiated) {
    throw UsageError("reset called in invalid state");
  }
  reset_impl();
}

void CUDAGraph::reset_impl() noexcept {
#if GCAP_WITH_CUDA
  if (device_ >= 0) {
    DeviceGuard dg(device_);
    // Destroying an executable graph with launches still queued is allowed;
    // the driver defers the release until they finish.
    if (exec_ != nullptr) {
      (void)cudaGraphExecDestroy(reinterpret_cast<cudaGraphExec_t>(exec_));
    }
    if (graph_ != nullptr) {
      (void)cudaGraphDestroy(reinterpret_cast<cudaGraph_t>(graph_));
    }
  }
#endif
  exec_ = nullptr;
  graph_ = nullptr;
  if (pool_.is_valid()) {
    Allocator::release_pool(device_, pool_);
  }
  pool_ = MempoolId{};
  device_ = -1;
  capture_stream_ = Stream{Stream::UNCHECKED, 0u, 0};
  state_ = State::None;
}

}} // namespace gcap::cuda
