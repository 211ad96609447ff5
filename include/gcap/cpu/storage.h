// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>

#include "gcap/core/storage.h"

namespace gcap { namespace cpu {

// Allocate 64-byte aligned host memory and wrap it in a Storage.
// nbytes==0 returns an empty Storage.
gcap::core::StoragePtr new_cpu_storage(std::size_t nbytes);

}} // namespace gcap::cpu
