// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <utility>

#include "gcap/core/data_ptr.h"

namespace gcap {
namespace core {

class StoragePtr;

// Byte buffer shared by every tensor view of it. The allocation goes back to
// its allocator (and, for graph outputs, to the graph's pool) when the last
// StoragePtr to it is dropped.
class Storage {
 public:
  Storage(DataPtr data, std::size_t nbytes) : data_(std::move(data)), nbytes_(nbytes) {}
  Storage(const Storage&) = delete;
  Storage& operator=(const Storage&) = delete;

  std::size_t nbytes() const noexcept { return nbytes_; }
  void* data() const noexcept { return data_.get(); }

 private:
  friend class StoragePtr;
  mutable std::atomic<std::size_t> refs_{0};
  DataPtr data_;
  std::size_t nbytes_;
};

// Thread-safe counted handle to a Storage; null when default constructed.
class StoragePtr {
 public:
  StoragePtr() noexcept = default;
  StoragePtr(const StoragePtr& other) noexcept : p_(other.p_) { retain(); }
  StoragePtr(StoragePtr&& other) noexcept : p_(std::exchange(other.p_, nullptr)) {}
  StoragePtr& operator=(StoragePtr other) noexcept {
    std::swap(p_, other.p_);
    return *this;
  }
  ~StoragePtr() { release(); }

  Storage* get() const noexcept { return p_; }
  Storage* operator->() const noexcept { return p_; }
  explicit operator bool() const noexcept { return p_ != nullptr; }

  // Takes ownership of a freshly allocated storage.
  static StoragePtr adopt(Storage* s) noexcept {
    StoragePtr out;
    out.p_ = s;
    out.retain();
    return out;
  }

 private:
  void retain() const noexcept {
    if (p_) p_->refs_.fetch_add(1, std::memory_order_relaxed);
  }
  void release() noexcept {
    if (p_ && p_->refs_.fetch_sub(1, std::memory_order_acq_rel) == 1) delete p_;
    p_ = nullptr;
  }

  Storage* p_{nullptr};
};

inline StoragePtr make_storage(DataPtr data, std::size_t nbytes) {
  return StoragePtr::adopt(new Storage(std::move(data), nbytes));
}

} // namespace core
} // namespace gcap
