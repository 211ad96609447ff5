// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/logging/logging.h"
#include <absl/base/log_severity.h>
#include <absl/log/globals.h>
#include <gtest/gtest.h>

TEST(Logging, InitOnce) {
  gcap::InitLogging(std::nullopt);
  gcap::InitLogging(2);
  gcap::InitLogging(0);
  GCAP_LOG(INFO) << "ok";
  GCAP_CHECK(true) << "never fires";
}

TEST(Logging, LevelAlsoSetsStderrThreshold) {
  gcap::InitLogging(1);
  EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kWarning);
  EXPECT_EQ(absl::StderrThreshold(), absl::LogSeverityAtLeast::kWarning);

  gcap::InitLogging(std::nullopt);
  EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kWarning);

  gcap::InitLogging(0);
  EXPECT_EQ(absl::MinLogLevel(), absl::LogSeverityAtLeast::kInfo);
  EXPECT_EQ(absl::StderrThreshold(), absl::LogSeverityAtLeast::kInfo);
}
