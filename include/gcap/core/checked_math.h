// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <limits>

namespace gcap {
namespace core {

[[nodiscard]] inline bool checked_mul_i64(int64_t a, int64_t b, int64_t& out) noexcept {
  // Shapes are non-negative; only the positive overflow bound matters here
  if (a == 0 || b == 0) { out = 0; return true; }
  if (a < 0 || b < 0) return false;
  if (a > std::numeric_limits<int64_t>::max() / b) return false;
  out = static_cast<int64_t>(a * b);
  return true;
}

// Product of sizes; false on a negative size or overflow.
[[nodiscard]] inline bool checked_numel(const int64_t* sizes, std::size_t rank, int64_t& out) noexcept {
  int64_t n = 1;
  for (std::size_t i = 0; i < rank; ++i) {
    int64_t tmp = 0;
    if (!checked_mul_i64(n, sizes[i], tmp)) return false;
    n = tmp;
  }
  out = n;
  return true;
}

} // namespace core
} // namespace gcap
