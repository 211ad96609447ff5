// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace gcap {

// Contract violation by the caller: wrong structure, shape or dtype at a
// boundary that was fixed by an earlier capture, or a capture request that
// cannot target any GPU. Never retried.
class UsageError : public std::invalid_argument {
 public:
  explicit UsageError(const std::string& what) : std::invalid_argument(what) {}
};

// Driver or allocator failure (stream creation, allocation, capture,
// instantiate, replay). Partial capture state may exist, so callers must not
// retry the same operation blindly.
class ResourceError : public std::runtime_error {
 public:
  explicit ResourceError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace gcap
