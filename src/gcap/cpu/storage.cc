// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/cpu/storage.h"

#include <new>
#include <utility>

namespace gcap { namespace cpu {

namespace {
constexpr std::size_t kAlignment = 64;
} // anonymous

gcap::core::StoragePtr new_cpu_storage(std::size_t nbytes) {
  using gcap::core::DataPtr;
  if (nbytes == 0) {
    return gcap::core::make_storage(DataPtr(nullptr, nullptr), 0);
  }
  void* p = ::operator new(nbytes, std::align_val_t{kAlignment});
  DataPtr dp(p, [](void* q) noexcept {
    ::operator delete(q, std::align_val_t{kAlignment});
  });
  return gcap::core::make_storage(std::move(dp), nbytes);
}

}} // namespace gcap::cpu
