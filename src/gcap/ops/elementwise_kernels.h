// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace gcap {
namespace ops {
namespace detail {

// Launchers for contiguous float/double buffers on a raw cudaStream_t handle.
// Return the launch status as an int (cudaError_t) so this header stays free
// of CUDA includes.
int launch_mul_scalar_f32(const float* in, float* out, std::int64_t n, float s, void* stream);
int launch_mul_scalar_f64(const double* in, double* out, std::int64_t n, double s, void* stream);
int launch_add_f32(const float* a, const float* b, float* out, std::int64_t n, void* stream);
int launch_add_f64(const double* a, const double* b, double* out, std::int64_t n, void* stream);

} // namespace detail
} // namespace ops
} // namespace gcap
