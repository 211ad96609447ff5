// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>

#include "gcap/core/storage.h"

namespace gcap { namespace cuda {

// Allocate device memory from the caching allocator of device_index on the
// current stream. The deleter returns the block to the same allocator.
gcap::core::StoragePtr new_cuda_storage(std::size_t nbytes, int device_index);

}} // namespace gcap::cuda
