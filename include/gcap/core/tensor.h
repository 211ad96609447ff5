// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "gcap/core/storage.h"
#include "gcap/core/dtype.h"
#include "gcap/core/device.h"
#include "gcap/core/checked_math.h"

namespace gcap {
namespace core {

// Handle to a strided view over a Storage. Copies share the storage; use
// clone() from gcap/ops/tensor_ops.h for an independent buffer.
class TensorImpl {
 public:
  TensorImpl() = default;
  explicit TensorImpl(StoragePtr storage,
                      std::vector<int64_t> sizes,
                      std::vector<int64_t> strides,
                      int64_t storage_offset,
                      ScalarType dtype,
                      Device device)
      : storage_(std::move(storage)),
        sizes_(std::move(sizes)),
        strides_(std::move(strides)),
        storage_offset_(storage_offset),
        dtype_(dtype),
        device_(device) {}

  const std::vector<int64_t>& sizes() const noexcept { return sizes_; }
  const std::vector<int64_t>& strides() const noexcept { return strides_; }
  int64_t storage_offset() const noexcept { return storage_offset_; }
  ScalarType dtype() const noexcept { return dtype_; }
  Device device() const noexcept { return device_; }
  const StoragePtr& storage() const noexcept { return storage_; }
  bool defined() const noexcept { return static_cast<bool>(storage_); }

  std::size_t itemsize() const noexcept { return gcap::core::itemsize(dtype_); }

  int64_t numel() const noexcept {
    int64_t n = 0;
    if (!checked_numel(sizes_.data(), sizes_.size(), n)) return 0;
    return n;
  }

  std::size_t nbytes() const noexcept {
    return static_cast<std::size_t>(numel()) * itemsize();
  }

  void* data() const noexcept {
    if (!storage_ || numel() == 0) return nullptr;
    auto* base = static_cast<std::uint8_t*>(storage_->data());
    if (!base) return nullptr;
    return static_cast<void*>(base + itemsize() * static_cast<std::size_t>(storage_offset_));
  }

  bool is_contiguous() const noexcept {
    const auto rank = sizes_.size();
    if (rank == 0) return true;
    for (auto s : sizes_) if (s == 0) return true;
    int64_t expected = 1;
    for (std::size_t i = rank; i-- > 0;) {
      const auto sz = sizes_[i];
      if (sz == 1) continue; // stride doesn't matter for size-1 dims
      if (strides_[i] != expected) return false;
      expected *= sz;
    }
    return true;
  }

  // Two handles alias when they view the same bytes of the same storage.
  bool is_same(const TensorImpl& other) const noexcept {
    return storage_.get() == other.storage_.get() &&
           storage_offset_ == other.storage_offset_ &&
           sizes_ == other.sizes_ && strides_ == other.strides_ &&
           dtype_ == other.dtype_;
  }

 private:
  StoragePtr storage_{};
  std::vector<int64_t> sizes_{};
  std::vector<int64_t> strides_{};
  int64_t storage_offset_{0};
  ScalarType dtype_{ScalarType::Float32};
  Device device_{};
};

// Row-major strides for sizes.
inline std::vector<int64_t> contiguous_strides(const std::vector<int64_t>& sizes) {
  std::vector<int64_t> strides(sizes.size(), 1);
  int64_t acc = 1;
  for (std::size_t i = sizes.size(); i-- > 0;) {
    strides[i] = acc;
    acc *= (sizes[i] > 0 ? sizes[i] : 1);
  }
  return strides;
}

std::string shape_to_string(const std::vector<int64_t>& sizes);

} // namespace core
} // namespace gcap
