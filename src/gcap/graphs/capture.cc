// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/graphs/capture.h"

#include <exception>
#include <mutex>
#include <utility>

#include "gcap/core/error.h"
#include "gcap/cuda/device.h"
#include "gcap/cuda/guard.h"
#include "gcap/graphs/config.h"
#include "gcap/graphs/tree.h"
#include "gcap/logging/logging.h"

#ifndef GCAP_WITH_CUDA
#  error "GCAP_WITH_CUDA must be defined (0/1)"
#endif
static_assert(GCAP_WITH_CUDA == 0 || GCAP_WITH_CUDA == 1, "GCAP_WITH_CUDA must be 0 or 1");

namespace gcap {
namespace graphs {

using gcap::core::Value;
namespace gc = gcap::cuda;

GraphedCallable::GraphedCallable(CallablePtr callable, ExecutionEnvironment& env, bool training)
    : callable_(std::move(callable)),
      env_(&env),
      training_(training),
      graph_(std::make_unique<gc::CUDAGraph>()) {}

GraphedCallable::~GraphedCallable() {
  // Static buffers go back to the environment pool, which another thread may
  // be capturing into. Drain and free them under the environment lock so the
  // synchronize never lands on a capturing stream and the blocks never move
  // mid-capture.
  std::lock_guard<std::mutex> lk(env_->mutex);
  try {
    outputs_copied_.synchronize();
    env_->stream.synchronize();
  } catch (const std::exception& e) {
    GCAP_LOG(WARNING) << "GraphedCallable(" << name() << "): synchronize on release failed: "
                      << e.what();
  }
  graph_.reset();
  static_outputs_ = gcap::core::Value();
  static_kwargs_ = Kwargs();
  static_args_.clear();
}

std::string GraphedCallable::name() const {
  return "graphed(" + callable_->name() + ")";
}

Value GraphedCallable::operator()(const Args& args, const Kwargs& kwargs) {
  std::lock_guard<std::mutex> lk(env_->mutex);
  gc::DeviceGuard dg(env_->device);
  const gc::Stream caller = gc::getCurrentStream(env_->device);

  // Environment stream starts after work already queued by the caller.
  inputs_ready_.record(caller);
  inputs_ready_.wait(env_->stream);
  {
    gc::CUDAStreamGuard sg(env_->stream);
    tree_copy(static_args_, args);
    tree_copy(static_kwargs_, kwargs);
    graph_->replay(env_->stream);
  }
  replay_done_.record(env_->stream);
  replay_done_.wait(caller);

  Value out = deep_copy(static_outputs_);

  // The next replay overwrites static outputs only after this copy.
  outputs_copied_.record(caller);
  outputs_copied_.wait(env_->stream);
  ++replays_;
  return out;
}

std::shared_ptr<GraphedCallable> make_graphed_callable(CallablePtr callable,
                                                       const Args& args,
                                                       const Kwargs& kwargs,
                                                       ExecutionEnvironment& env,
                                                       const CaptureOptions& options) {
  if (!callable) {
    throw UsageError("make_graphed_callable: callable is null");
  }
#if !GCAP_WITH_CUDA
  (void)args; (void)kwargs; (void)env; (void)options;
  throw ResourceError(gc::kErrCudaGraphsUnavailable);
#else
  const bool training = callable->training().value_or(false);
  const std::size_t warmup_iters =
      options.warmup_iters.value_or(graph_config_from_env().warmup_iters);
  std::shared_ptr<GraphedCallable> g(new GraphedCallable(callable, env, training));

  // Keep lazy initialization and autotuning out of the recording.
  gc::device_synchronize(env.device);
  {
    gc::CUDAStreamGuard sg(gc::getStreamFromPool(env.device));
    for (std::size_t i = 0; i < warmup_iters; ++i) {
      Args a = deep_copy(args);
      Kwargs k = deep_copy(kwargs);
      (void)(*callable)(a, k);
    }
  }

  g->static_args_ = deep_copy(args);
  g->static_kwargs_ = deep_copy(kwargs);
  gc::device_synchronize(env.device);

  {
    std::lock_guard<std::mutex> lk(env.mutex);
    gc::CUDAStreamGuard sg(env.stream);
    g->graph_->capture_begin(env.stream, env.pool);
    try {
      g->static_outputs_ = (*callable)(g->static_args_, g->static_kwargs_);
      g->graph_->capture_end();
    } catch (...) {
      g->graph_->capture_abort();
      throw;
    }
    g->graph_->instantiate();
  }
  return g;
#endif
}

std::shared_ptr<GraphedCallable> capture_once(CallablePtr callable,
                                              const Args& args,
                                              const Kwargs& kwargs,
                                              const CaptureOptions& options) {
  const auto dev = find_cuda_device(args, kwargs);
  if (!dev) {
    throw UsageError(kErrNoCudaTensor);
  }
  return make_graphed_callable(std::move(callable), args, kwargs,
                               get_execution_environment(*dev), options);
}

} // namespace graphs
} // namespace gcap
