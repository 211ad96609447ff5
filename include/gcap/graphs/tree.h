// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include "gcap/core/value.h"
#include "gcap/cuda/stream.h"

namespace gcap {
namespace graphs {

inline constexpr const char* kErrTreeCopyMismatch = "tree_copy: structure mismatch";

// Copy src into the buffers of dst, which must have the same structure:
// tensors need identical shape and dtype, lists identical length, dicts
// every key of dst; any other dst value must equal src. Tensor copies run on
// the current stream. Throws UsageError naming the offending path.
void tree_copy(const gcap::core::Value& dst, const gcap::core::Value& src);
void tree_copy(const gcap::core::List& dst, const gcap::core::List& src);
void tree_copy(const gcap::core::Dict& dst, const gcap::core::Dict& src);

// Recursive copy with fresh tensor storage on the same devices. Opaque
// values keep sharing their handle.
gcap::core::Value deep_copy(const gcap::core::Value& v);
gcap::core::List deep_copy(const gcap::core::List& l);
gcap::core::Dict deep_copy(const gcap::core::Dict& d);

// Device index of the first CUDA tensor in depth-first order (lists by
// position, dicts in insertion order).
std::optional<gcap::cuda::DeviceIndex> find_cuda_device(const gcap::core::Value& v);
std::optional<gcap::cuda::DeviceIndex> find_cuda_device(const gcap::core::List& args,
                                                        const gcap::core::Dict& kwargs);

} // namespace graphs
} // namespace gcap
