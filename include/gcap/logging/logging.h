// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <optional>
#include <absl/log/check.h>
#include <absl/log/log.h>

namespace gcap {
// Initialize Abseil logging once. min_level (0 INFO .. 3 FATAL, clamped) sets
// both the minimum level and the stderr threshold; nullopt leaves them as is.
void InitLogging(std::optional<int> min_level);
}

#define GCAP_LOG(level) LOG(level)
#define GCAP_CHECK(cond) CHECK(cond)
