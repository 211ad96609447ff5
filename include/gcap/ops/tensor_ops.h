// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include "gcap/core/error.h"
#include "gcap/core/tensor.h"
#include "gcap/core/value.h"

namespace gcap {
namespace ops {

using gcap::core::Device;
using gcap::core::ScalarType;
using gcap::core::TensorImpl;

template <typename T> struct scalar_type_of;
template <> struct scalar_type_of<bool> { static constexpr ScalarType value = ScalarType::Bool; };
template <> struct scalar_type_of<std::int32_t> { static constexpr ScalarType value = ScalarType::Int32; };
template <> struct scalar_type_of<std::int64_t> { static constexpr ScalarType value = ScalarType::Int64; };
template <> struct scalar_type_of<float> { static constexpr ScalarType value = ScalarType::Float32; };
template <> struct scalar_type_of<double> { static constexpr ScalarType value = ScalarType::Float64; };

// Contiguous uninitialized tensor. CUDA memory comes from the caching
// allocator on the current stream of device.index.
TensorImpl empty(const std::vector<int64_t>& sizes, ScalarType dtype, Device device);

// Contiguous tensor initialized from nbytes of host memory.
TensorImpl from_host_bytes(const void* src, std::size_t nbytes,
                           const std::vector<int64_t>& sizes, ScalarType dtype,
                           Device device);
// Copy a contiguous tensor's elements to host memory; waits for the copy.
void to_host_bytes(const TensorImpl& t, void* dst, std::size_t nbytes);

template <typename T>
TensorImpl from_vector(const std::vector<T>& values, const std::vector<int64_t>& sizes,
                       Device device = Device::cpu()) {
  static_assert(!std::is_same<T, bool>::value, "use std::vector<uint8_t> storage for bool");
  return from_host_bytes(values.data(), values.size() * sizeof(T), sizes,
                         scalar_type_of<T>::value, device);
}

template <typename T>
std::vector<T> to_vector(const TensorImpl& t) {
  std::vector<T> out(static_cast<std::size_t>(t.numel()));
  if (t.dtype() != scalar_type_of<T>::value) {
    throw gcap::UsageError(std::string("to_vector: dtype mismatch, tensor is ") +
                           gcap::core::dtype_name(t.dtype()));
  }
  to_host_bytes(t, out.data(), out.size() * sizeof(T));
  return out;
}

// Copy src into dst in place. Shapes must match element count and dtypes
// must be equal; both must be contiguous. Device copies are issued on the
// current stream of the CUDA device involved; copies into host memory wait
// for completion.
void copy_(const TensorImpl& dst, const TensorImpl& src);

// Fresh contiguous tensor on the same device with the same contents.
TensorImpl clone(const TensorImpl& t);

// Single-element CPU tensor to a Bool, Int or Double value.
gcap::core::Value item(const TensorImpl& t);

// Elementwise float32/float64 arithmetic; result on the input's device.
TensorImpl mul(const TensorImpl& a, double scalar);
TensorImpl add(const TensorImpl& a, const TensorImpl& b);

} // namespace ops
} // namespace gcap
