// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace gcap {
namespace cuda {

using DeviceIndex = int16_t;

// Return number of CUDA devices detected.
// Semantics: when built without CUDA support or on error, returns 0.
int device_count() noexcept;

// Current CUDA device of the calling thread; 0 when built without CUDA.
DeviceIndex current_device();

// Block until all work on dev (or the current device when dev < 0) is done.
// Throws ResourceError on driver failure; no-op without CUDA.
void device_synchronize(DeviceIndex dev = -1);

} // namespace cuda
} // namespace gcap
