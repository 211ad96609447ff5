// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/cuda/storage.h"
#include "gcap/cuda/allocator.h"

#include <utility>

namespace gcap { namespace cuda {

gcap::core::StoragePtr new_cuda_storage(std::size_t nbytes, int device_index) {
  using gcap::core::DataPtr;
  if (nbytes == 0) {
    return gcap::core::make_storage(DataPtr(nullptr, nullptr), 0);
  }
  // Resolve the allocator now so the deleter does not depend on the current device.
  Allocator* alloc = &Allocator::get(static_cast<DeviceIndex>(device_index));
  void* p = alloc->raw_alloc(nbytes);
  DataPtr dp(p, [alloc](void* q) noexcept { alloc->raw_delete(q); });
  return gcap::core::make_storage(std::move(dp), nbytes);
}

}} // namespace gcap::cuda
