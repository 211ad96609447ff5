// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>

namespace gcap {
namespace graphs {

inline constexpr const char* kGraphConfEnv = "GCAP_GRAPH_CONF";

// Tunables of the capture protocol and the dynamic cache.
struct GraphConfig {
  std::size_t warmup_iters{3};
  std::size_t cache_capacity{0};  // 0 == unbounded
  std::size_t warn_entries{64};   // 0 == never warn
  bool        log_captures{true};
};

// Parse a comma-separated key=value list, e.g.
// "warmup_iters=1,cache_capacity=16". Unknown keys and invalid values are
// reported once per key on stderr and leave the default in place.
GraphConfig parse_graph_conf(const char* text);

// GCAP_GRAPH_CONF parsed on first call; later changes to the environment
// are not observed.
const GraphConfig& graph_config_from_env();

} // namespace graphs
} // namespace gcap
