// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace gcap { namespace cuda {

class Stream;  // forward decl
using DeviceIndex = int16_t;

// Lazily created CUDA event with timing disabled. The underlying event is
// created on the first record() and bound to that stream's device.
class Event final {
 public:
  Event() noexcept = default;
  Event(Event&&) noexcept;
  Event& operator=(Event&&) noexcept;
  Event(const Event&) = delete;
  Event& operator=(const Event&) = delete;
  ~Event() noexcept;


  void record(const Stream& stream);
  void wait(const Stream& stream) const;
  void synchronize() const;

 private:
  void destroy() noexcept;

  bool         is_created_{false};
  DeviceIndex  device_index_{-1};
  void*        event_{nullptr}; // cudaEvent_t
};

}} // namespace gcap::cuda
