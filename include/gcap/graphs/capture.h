// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "gcap/core/value.h"
#include "gcap/cuda/event.h"
#include "gcap/cuda/graphs.h"
#include "gcap/graphs/callable.h"
#include "gcap/graphs/execution_env.h"

namespace gcap {
namespace graphs {

inline constexpr const char* kErrNoCudaTensor =
  "graph capture needs at least one CUDA tensor among the example arguments";

struct CaptureOptions {
  // Eager calls before capture; GCAP_GRAPH_CONF warmup_iters when unset.
  std::optional<std::size_t> warmup_iters;
};

class GraphedCallable;

// Warm up callable on a side stream, then capture one call on static copies
// of (args, kwargs) into env's stream and memory pool.
std::shared_ptr<GraphedCallable> make_graphed_callable(CallablePtr callable,
                                                       const Args& args,
                                                       const Kwargs& kwargs,
                                                       ExecutionEnvironment& env,
                                                       const CaptureOptions& options = {});

// A callable recorded once into a CUDA graph and replayed on every call.
//
// Each call copies its arguments into the static input buffers, replays the
// graph on the environment stream and returns a deep copy of the static
// outputs, ordered on the caller's current stream. Arguments must match the
// captured structure (shapes, dtypes, list lengths, dict keys and constant
// scalars); mismatches throw UsageError. Calls on the same device serialize
// on the environment mutex.
class GraphedCallable final : public Callable {
 public:
  ~GraphedCallable() override;

  GraphedCallable(const GraphedCallable&) = delete;
  GraphedCallable& operator=(const GraphedCallable&) = delete;

  gcap::core::Value operator()(const Args& args, const Kwargs& kwargs) override;
  std::optional<bool> training() const override { return training_; }
  std::string name() const override;

  ExecutionEnvironment& environment() const noexcept { return *env_; }
  std::size_t replay_count() const noexcept { return replays_; }

 private:
  friend std::shared_ptr<GraphedCallable> make_graphed_callable(
      CallablePtr, const Args&, const Kwargs&, ExecutionEnvironment&, const CaptureOptions&);

  GraphedCallable(CallablePtr callable, ExecutionEnvironment& env, bool training);

  CallablePtr callable_;        // kept alive for the graph's lifetime
  ExecutionEnvironment* env_;   // non-owning; environments are never destroyed
  bool training_;
  std::unique_ptr<gcap::cuda::CUDAGraph> graph_;
  Args static_args_;
  Kwargs static_kwargs_;
  gcap::core::Value static_outputs_;
  gcap::cuda::Event inputs_ready_;
  gcap::cuda::Event replay_done_;
  gcap::cuda::Event outputs_copied_;
  std::size_t replays_{0};
};

// make_graphed_callable on the environment of the first CUDA tensor in
// (args, kwargs). Throws UsageError when there is none.
std::shared_ptr<GraphedCallable> capture_once(CallablePtr callable,
                                              const Args& args,
                                              const Kwargs& kwargs,
                                              const CaptureOptions& options = {});

} // namespace graphs
} // namespace gcap
