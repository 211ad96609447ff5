// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <utility>

namespace gcap {
namespace core {

// Owning pointer with custom deleter that can capture context.
class DataPtr {
 public:
  using Deleter = std::function<void(void*)>;

  DataPtr() noexcept = default;
  DataPtr(void* data, Deleter d) noexcept : data_(data), deleter_(std::move(d)) {}
  DataPtr(const DataPtr&) = delete;
  DataPtr& operator=(const DataPtr&) = delete;
  DataPtr(DataPtr&& other) noexcept { swap(other); }
  DataPtr& operator=(DataPtr&& other) noexcept { if (this != &other) swap(other); return *this; }
  ~DataPtr() { reset(); }

  void* get() const noexcept { return data_; }
  explicit operator bool() const noexcept { return data_ != nullptr; }

  // Deleters are noexcept by contract (allocator raw_delete paths).
  void reset(void* p = nullptr, Deleter d = nullptr) noexcept {
    if (data_ && deleter_) deleter_(data_);
    data_ = p; deleter_ = std::move(d);
  }

  void swap(DataPtr& other) noexcept {
    std::swap(data_, other.data_);
    deleter_.swap(other.deleter_);
  }

 private:
  void* data_{nullptr};
  Deleter deleter_{};
};

} // namespace core
} // namespace gcap
