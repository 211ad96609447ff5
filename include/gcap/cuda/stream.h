// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

namespace gcap { namespace cuda {

// Signed small type for device indices; -1 means "current device".
using DeviceIndex = int16_t;

class Stream final {
 public:
  enum Unchecked { UNCHECKED };
  Stream(Unchecked, uint64_t packed_id, DeviceIndex device) noexcept;

  [[nodiscard]] DeviceIndex device_index() const noexcept { return device_index_; }
  [[nodiscard]] uint64_t id() const noexcept { return id_; }
  [[nodiscard]] uintptr_t handle() const noexcept { return handle_; }

  void synchronize() const;

  bool operator==(const Stream& other) const noexcept {
    return device_index_ == other.device_index_ && id_ == other.id_;
  }
  bool operator!=(const Stream& other) const noexcept { return !(*this == other); }

 private:
  uint64_t    id_{0};       // 0 == default stream
  DeviceIndex device_index_{0};
  uintptr_t   handle_{0};   // cudaStream_t value as integer; 0 for default (nullptr)

  friend Stream getDefaultStream(DeviceIndex);
  friend Stream getCurrentStream(DeviceIndex);
  friend void   setCurrentStream(Stream);
};

Stream getDefaultStream(DeviceIndex device = -1);
Stream getCurrentStream(DeviceIndex device = -1);
void   setCurrentStream(Stream s);

// Round-robin over a small per-device pool of non-blocking streams.
Stream getStreamFromPool(DeviceIndex device = -1);

// Create a non-blocking stream that no other caller receives. The stream is
// never destroyed; use it for process-lifetime owners only. Without CUDA
// this returns the id 0 placeholder like every other stream factory.
Stream makeDedicatedStream(DeviceIndex device = -1);

std::string to_string(const Stream& s);

}} // namespace gcap::cuda
