// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "gcap/cuda/allocator.h"
#include "gcap/cuda/stream.h"

namespace gcap { namespace cuda {

using DeviceIndex = int16_t;

enum class CaptureStatus : std::uint8_t { None = 0, Active = 1, Invalidated = 2 };

// Capture status of s; None when built without CUDA.
CaptureStatus streamCaptureStatus(Stream s);

// Pinned error substrings (single source of truth)
inline constexpr const char* kErrDefaultStreamCaptureBan =
  "CUDA Graph capture on the default stream is not allowed; capture on a non-default stream";
inline constexpr const char* kErrNestedCaptureBan =
  "nested CUDA graph capture is not allowed";
inline constexpr const char* kErrGraphBeginInvalidState =
  "capture_begin called in invalid state";
inline constexpr const char* kErrGraphEndInvalidState =
  "capture_end called in invalid state";
inline constexpr const char* kErrGraphInstantiateInvalidState =
  "instantiate called in invalid state";
inline constexpr const char* kErrGraphReplayInvalidState =
  "replay called in invalid state";
inline constexpr const char* kErrGraphDeviceMismatchPrefix =
  "CUDA Graph device mismatch"; // prefix; device labels follow
inline constexpr const char* kErrCudaGraphsUnavailable =
  "CUDA Graphs are only available when CUDA is enabled";

struct GraphCounters {
  std::uint64_t captures_started{0};
  std::uint64_t captures_ended{0};
  std::uint64_t captures_aborted{0};
  std::uint64_t denied_default_stream{0};
  std::uint64_t nested_capture_denied{0};
  std::uint64_t end_in_dtor{0};
  std::uint64_t graphs_instantiated{0};
  std::uint64_t graphs_replayed{0};
  std::uint64_t replay_errors{0};
};

// Snapshot current CUDA graph counters.
GraphCounters cuda_graphs_counters() noexcept;

// CUDA Graph wrapper (capture lifecycle).
//
// States: None -> Capturing -> Captured -> Instantiated. reset() returns to
// None from Captured or Instantiated. Capture always uses the thread-local
// capture mode, so other threads keep launching work while a capture is open.
class CUDAGraph final {
 public:
  CUDAGraph();
  ~CUDAGraph() noexcept;

  CUDAGraph(const CUDAGraph&) = delete;
  CUDAGraph& operator=(const CUDAGraph&) = delete;

  // Begin capturing work issued on stream. Allocations made by this thread on
  // the stream's device are routed into pool (a fresh private pool when pool
  // is nullopt or invalid) until capture_end.
  void capture_begin(Stream stream, std::optional<MempoolId> pool = std::nullopt);

  // End an in-progress capture. Valid only when is_capturing()==true.
  void capture_end();

  // Abandon an in-progress capture; no-op in any other state.
  void capture_abort() noexcept;

  void instantiate();
  // Launch on stream (the capture stream when nullopt). Returns without
  // waiting for completion.
  void replay(std::optional<Stream> stream = std::nullopt);

  // Destroy captured/instantiated graphs and release the pool.
  void reset();

  [[nodiscard]] DeviceIndex device() const noexcept { return device_; }
  [[nodiscard]] Stream capture_stream() const noexcept { return capture_stream_; }
  [[nodiscard]] MempoolId pool() const noexcept { return pool_; }
  [[nodiscard]] bool is_capturing() const noexcept { return state_ == State::Capturing; }
  [[nodiscard]] bool is_instantiated() const noexcept { return state_ == State::Instantiated; }

 private:
  enum class State : std::uint8_t { None, Capturing, Captured, Instantiated };

  struct GraphCaptureSession;

  DeviceIndex device_{-1};
  State       state_{State::None};
  Stream      capture_stream_{Stream::UNCHECKED, 0u, 0};
  MempoolId   pool_{};
  void*       graph_{nullptr};  // cudaGraph_t
  void*       exec_{nullptr};   // cudaGraphExec_t

  std::unique_ptr<GraphCaptureSession> sess_;

  void reset_impl() noexcept;
};

}} // namespace gcap::cuda
