// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/ops/tensor_ops.h"

#include <cstring>
#include <string>

#include "gcap/core/error.h"
#include "gcap/cpu/storage.h"
#include "gcap/cuda/guard.h"
#include "gcap/cuda/storage.h"
#include "gcap/cuda/stream.h"

#ifndef GCAP_WITH_CUDA
#  error "GCAP_WITH_CUDA must be defined (0/1)"
#endif
static_assert(GCAP_WITH_CUDA == 0 || GCAP_WITH_CUDA == 1, "GCAP_WITH_CUDA must be 0 or 1");

#if GCAP_WITH_CUDA
#  include <cuda_runtime_api.h>
#  include "elementwise_kernels.h"
#endif

namespace gcap {
namespace ops {

using gcap::core::Value;

namespace {

#if GCAP_WITH_CUDA
static inline void cudaCheck(cudaError_t st, const char* what) {
  if (st != cudaSuccess) {
    const char* msg = cudaGetErrorString(st);
    throw ResourceError(std::string(what) + ": " + (msg ? msg : ""));
  }
}
#endif

void require_contiguous(const TensorImpl& t, const char* op) {
  if (!t.defined()) {
    throw UsageError(std::string(op) + ": undefined tensor");
  }
  if (!t.is_contiguous()) {
    throw UsageError(std::string(op) + ": expected a contiguous tensor");
  }
}

void require_floating(const TensorImpl& t, const char* op) {
  if (t.dtype() != ScalarType::Float32 && t.dtype() != ScalarType::Float64) {
    throw UsageError(std::string(op) + ": unsupported dtype " +
                     gcap::core::dtype_name(t.dtype()));
  }
}

float half_to_float(std::uint16_t h) {
  const std::uint32_t sign = static_cast<std::uint32_t>(h & 0x8000u) << 16;
  std::uint32_t exp = (h >> 10) & 0x1fu;
  std::uint32_t mant = h & 0x3ffu;
  std::uint32_t bits;
  if (exp == 0) {
    if (mant == 0) {
      bits = sign;
    } else {
      // Subnormal: renormalize.
      exp = 127 - 15 + 1;
      while ((mant & 0x400u) == 0) {
        mant <<= 1;
        --exp;
      }
      mant &= 0x3ffu;
      bits = sign | (exp << 23) | (mant << 13);
    }
  } else if (exp == 0x1fu) {
    bits = sign | 0x7f800000u | (mant << 13);
  } else {
    bits = sign | ((exp + 127 - 15) << 23) | (mant << 13);
  }
  float f;
  std::memcpy(&f, &bits, sizeof(f));
  return f;
}

float bfloat16_to_float(std::uint16_t b) {
  const std::uint32_t bits = static_cast<std::uint32_t>(b) << 16;
  float f;
  std::memcpy(&f, &bits, sizeof(f));
  return f;
}

#if GCAP_WITH_CUDA
void* current_stream_handle(const Device& d) {
  return reinterpret_cast<void*>(
      gcap::cuda::getCurrentStream(static_cast<gcap::cuda::DeviceIndex>(d.index)).handle());
}
#endif

} // anonymous

TensorImpl empty(const std::vector<int64_t>& sizes, ScalarType dtype, Device device) {
  int64_t n = 0;
  if (!gcap::core::checked_numel(sizes.data(), sizes.size(), n)) {
    throw UsageError("empty: invalid sizes " + gcap::core::shape_to_string(sizes));
  }
  const std::size_t nbytes = static_cast<std::size_t>(n) * gcap::core::itemsize(dtype);
  gcap::core::StoragePtr storage;
  if (device.is_cpu()) {
    storage = gcap::cpu::new_cpu_storage(nbytes);
  } else if (device.is_cuda()) {
    storage = gcap::cuda::new_cuda_storage(nbytes, device.index);
  } else {
    throw UsageError("empty: unsupported device " + device.to_string());
  }
  return TensorImpl(std::move(storage), sizes, gcap::core::contiguous_strides(sizes), 0,
                    dtype, device);
}

TensorImpl from_host_bytes(const void* src, std::size_t nbytes,
                           const std::vector<int64_t>& sizes, ScalarType dtype,
                           Device device) {
  TensorImpl host = empty(sizes, dtype, Device::cpu());
  if (host.nbytes() != nbytes) {
    throw UsageError("from_vector: " + std::to_string(nbytes) + " bytes do not fill shape " +
                     gcap::core::shape_to_string(sizes));
  }
  if (nbytes > 0) {
    std::memcpy(host.data(), src, nbytes);
  }
  if (device.is_cpu()) {
    return host;
  }
  TensorImpl out = empty(sizes, dtype, device);
  copy_(out, host);
  return out;
}

void to_host_bytes(const TensorImpl& t, void* dst, std::size_t nbytes) {
  require_contiguous(t, "to_vector");
  if (t.nbytes() != nbytes) {
    throw UsageError("to_vector: buffer size mismatch");
  }
  if (nbytes == 0) return;
  if (t.device().is_cpu()) {
    std::memcpy(dst, t.data(), nbytes);
    return;
  }
  TensorImpl host = empty(t.sizes(), t.dtype(), Device::cpu());
  copy_(host, t);
  std::memcpy(dst, host.data(), nbytes);
}

void copy_(const TensorImpl& dst, const TensorImpl& src) {
  require_contiguous(dst, "copy_");
  require_contiguous(src, "copy_");
  if (dst.dtype() != src.dtype()) {
    throw UsageError(std::string("copy_: dtype mismatch (") + gcap::core::dtype_name(dst.dtype()) +
                     " vs " + gcap::core::dtype_name(src.dtype()) + ")");
  }
  if (dst.numel() != src.numel()) {
    throw UsageError("copy_: shape mismatch " + gcap::core::shape_to_string(dst.sizes()) +
                     " vs " + gcap::core::shape_to_string(src.sizes()));
  }
  const std::size_t nbytes = dst.nbytes();
  if (nbytes == 0 || dst.is_same(src)) return;

  if (dst.device().is_cpu() && src.device().is_cpu()) {
    std::memmove(dst.data(), src.data(), nbytes);
    return;
  }
#if GCAP_WITH_CUDA
  if (dst.device().is_cuda() && src.device().is_cuda() && dst.device() != src.device()) {
    throw UsageError("copy_: cross-device copy " + src.device().to_string() + " -> " +
                     dst.device().to_string() + " is not supported");
  }
  const Device cuda_dev = dst.device().is_cuda() ? dst.device() : src.device();
  gcap::cuda::DeviceGuard dg(static_cast<gcap::cuda::DeviceIndex>(cuda_dev.index));
  auto stream = static_cast<cudaStream_t>(current_stream_handle(cuda_dev));
  cudaCheck(cudaMemcpyAsync(dst.data(), src.data(), nbytes, cudaMemcpyDefault, stream),
            "cudaMemcpyAsync");
  if (dst.device().is_cpu()) {
    cudaCheck(cudaStreamSynchronize(stream), "cudaStreamSynchronize");
  }
#else
  throw UsageError("copy_: CUDA tensors require a CUDA build");
#endif
}

TensorImpl clone(const TensorImpl& t) {
  TensorImpl out = empty(t.sizes(), t.dtype(), t.device());
  copy_(out, t);
  return out;
}

Value item(const TensorImpl& t) {
  if (!t.defined() || !t.device().is_cpu() || t.numel() != 1) {
    throw UsageError("item: expected a single-element CPU tensor, got shape " +
                     gcap::core::shape_to_string(t.sizes()));
  }
  const void* p = t.data();
  switch (t.dtype()) {
    case ScalarType::Bool:
      return Value(*static_cast<const std::uint8_t*>(p) != 0);
    case ScalarType::Int32:
      return Value(static_cast<std::int64_t>(*static_cast<const std::int32_t*>(p)));
    case ScalarType::Int64:
      return Value(*static_cast<const std::int64_t*>(p));
    case ScalarType::Float32:
      return Value(static_cast<double>(*static_cast<const float*>(p)));
    case ScalarType::Float64:
      return Value(*static_cast<const double*>(p));
    case ScalarType::Float16:
      return Value(static_cast<double>(half_to_float(*static_cast<const std::uint16_t*>(p))));
    case ScalarType::BFloat16:
      return Value(static_cast<double>(bfloat16_to_float(*static_cast<const std::uint16_t*>(p))));
    case ScalarType::Undefined:
      break;
  }
  throw UsageError("item: undefined dtype");
}

TensorImpl mul(const TensorImpl& a, double scalar) {
  require_contiguous(a, "mul");
  require_floating(a, "mul");
  TensorImpl out = empty(a.sizes(), a.dtype(), a.device());
  const int64_t n = a.numel();
  if (n == 0) return out;
  if (a.device().is_cpu()) {
    if (a.dtype() == ScalarType::Float32) {
      const float* in = static_cast<const float*>(a.data());
      float* o = static_cast<float*>(out.data());
      const float s = static_cast<float>(scalar);
      for (int64_t i = 0; i < n; ++i) o[i] = in[i] * s;
    } else {
      const double* in = static_cast<const double*>(a.data());
      double* o = static_cast<double*>(out.data());
      for (int64_t i = 0; i < n; ++i) o[i] = in[i] * scalar;
    }
    return out;
  }
#if GCAP_WITH_CUDA
  gcap::cuda::DeviceGuard dg(static_cast<gcap::cuda::DeviceIndex>(a.device().index));
  void* stream = current_stream_handle(a.device());
  int rc = a.dtype() == ScalarType::Float32
      ? detail::launch_mul_scalar_f32(static_cast<const float*>(a.data()),
                                      static_cast<float*>(out.data()), n,
                                      static_cast<float>(scalar), stream)
      : detail::launch_mul_scalar_f64(static_cast<const double*>(a.data()),
                                      static_cast<double*>(out.data()), n, scalar, stream);
  cudaCheck(static_cast<cudaError_t>(rc), "mul kernel launch");
#endif
  return out;
}

TensorImpl add(const TensorImpl& a, const TensorImpl& b) {
  require_contiguous(a, "add");
  require_contiguous(b, "add");
  require_floating(a, "add");
  if (a.dtype() != b.dtype() || a.sizes() != b.sizes() || a.device() != b.device()) {
    throw UsageError("add: operands must share dtype, shape and device");
  }
  TensorImpl out = empty(a.sizes(), a.dtype(), a.device());
  const int64_t n = a.numel();
  if (n == 0) return out;
  if (a.device().is_cpu()) {
    if (a.dtype() == ScalarType::Float32) {
      const float* x = static_cast<const float*>(a.data());
      const float* y = static_cast<const float*>(b.data());
      float* o = static_cast<float*>(out.data());
      for (int64_t i = 0; i < n; ++i) o[i] = x[i] + y[i];
    } else {
      const double* x = static_cast<const double*>(a.data());
      const double* y = static_cast<const double*>(b.data());
      double* o = static_cast<double*>(out.data());
      for (int64_t i = 0; i < n; ++i) o[i] = x[i] + y[i];
    }
    return out;
  }
#if GCAP_WITH_CUDA
  gcap::cuda::DeviceGuard dg(static_cast<gcap::cuda::DeviceIndex>(a.device().index));
  void* stream = current_stream_handle(a.device());
  int rc = a.dtype() == ScalarType::Float32
      ? detail::launch_add_f32(static_cast<const float*>(a.data()),
                               static_cast<const float*>(b.data()),
                               static_cast<float*>(out.data()), n, stream)
      : detail::launch_add_f64(static_cast<const double*>(a.data()),
                               static_cast<const double*>(b.data()),
                               static_cast<double*>(out.data()), n, stream);
  cudaCheck(static_cast<cudaError_t>(rc), "add kernel launch");
#endif
  return out;
}

} // namespace ops
} // namespace gcap
