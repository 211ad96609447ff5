// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/logging/logging.h"

#include <mutex>

#include <absl/base/log_severity.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>

namespace gcap {

void InitLogging(std::optional<int> min_level) {
  static std::once_flag once;
  std::call_once(once, [] { absl::InitializeLog(); });
  if (!min_level) return;
  // Capture and eviction notices are INFO; once initialized, Abseil only
  // echoes ERROR and above to stderr, so the threshold follows the level.
  const auto level = static_cast<absl::LogSeverityAtLeast>(absl::NormalizeLogSeverity(*min_level));
  absl::SetMinLogLevel(level);
  absl::SetStderrThreshold(level);
}

}  // namespace gcap
