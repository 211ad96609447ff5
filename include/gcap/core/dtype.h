// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>


namespace gcap {
namespace core {

// Scalar type tag (append-only)
enum class ScalarType : uint8_t {
  Bool,
  Int32,
  Int64,
  Float32,
  Float16,
  BFloat16,
  Float64,
  Undefined = 255
};

static_assert(static_cast<uint8_t>(ScalarType::Bool) == 0);
static_assert(static_cast<uint8_t>(ScalarType::Float64) == 6);

inline constexpr std::size_t itemsize(ScalarType t) {
  switch (t) {
    case ScalarType::Bool: return 1;
    case ScalarType::Int32: return 4;
    case ScalarType::Int64: return 8;
    case ScalarType::Float32: return 4;
    case ScalarType::Float16: return 2;
    case ScalarType::BFloat16: return 2;
    case ScalarType::Float64: return 8;
    case ScalarType::Undefined: return 0;
  }
  return 0;
}

inline constexpr bool is_floating(ScalarType t) {
  return t == ScalarType::Float32 || t == ScalarType::Float16 ||
         t == ScalarType::BFloat16 || t == ScalarType::Float64;
}

inline constexpr const char* dtype_name(ScalarType t) {
  switch (t) {
    case ScalarType::Bool: return "bool";
    case ScalarType::Int32: return "int32";
    case ScalarType::Int64: return "int64";
    case ScalarType::Float32: return "float32";
    case ScalarType::Float16: return "float16";
    case ScalarType::BFloat16: return "bfloat16";
    case ScalarType::Float64: return "float64";
    case ScalarType::Undefined: return "undefined";
  }
  return "unknown";
}

} // namespace core
} // namespace gcap
