// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "gcap/graphs/callable.h"
#include "gcap/graphs/capture.h"
#include "gcap/graphs/fingerprint.h"

namespace gcap {
namespace graphs {

// Produces the replayable callable for one argument fingerprint. The default
// builder is capture_once.
using GraphBuilder =
    std::function<CallablePtr(const CallablePtr& callable, const Args& args, const Kwargs& kwargs)>;

struct DynamicCacheOptions {
  // Unset fields fall back to GCAP_GRAPH_CONF.
  std::optional<std::size_t> capacity;      // 0 == unbounded
  std::optional<std::size_t> warn_entries;  // 0 == never warn
  std::optional<bool> log_captures;
  CaptureOptions capture;
  GraphBuilder builder;
};

struct DynamicCacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};      // calls that built a new entry
  std::uint64_t evictions{0};
  std::size_t   entries{0};
};

// Drop-in replacement for a callable that captures one graph per distinct
// argument fingerprint and replays it on later calls with the same one.
//
// Lookups read an immutable snapshot of the entry map without locking. A
// miss takes the wrapper mutex, looks again, builds, and publishes a new
// snapshot, so concurrent first calls with the same fingerprint build once.
class DynamicGraphedCallable final : public Callable {
 public:
  DynamicGraphedCallable(CallablePtr callable, DynamicCacheOptions options);
  ~DynamicGraphedCallable() override;

  DynamicGraphedCallable(const DynamicGraphedCallable&) = delete;
  DynamicGraphedCallable& operator=(const DynamicGraphedCallable&) = delete;

  gcap::core::Value operator()(const Args& args, const Kwargs& kwargs) override;
  std::optional<bool> training() const override { return callable_->training(); }
  std::string name() const override { return callable_->name(); }

  // Cached callable for fingerprint, or nullptr.
  CallablePtr lookup(const Fingerprint& fp) const;

  DynamicCacheStats stats() const;
  std::size_t size() const;
  std::size_t capacity() const noexcept { return capacity_; }

  // Drop every entry. Calls in flight keep their entry alive until they return.
  void clear();

 private:
  struct Entry {
    Entry(CallablePtr c, std::uint64_t tick) : graphed(std::move(c)), last_used(tick) {}
    CallablePtr graphed;
    std::atomic<std::uint64_t> last_used;
  };
  using Map = std::unordered_map<Fingerprint, std::shared_ptr<Entry>, FingerprintHash>;

  std::shared_ptr<Entry> find(const Fingerprint& fp) const;
  std::shared_ptr<Entry> build_locked(const Fingerprint& fp, const Args& args, const Kwargs& kwargs);
  void publish_locked(std::shared_ptr<const Map> next);

  CallablePtr callable_;
  GraphBuilder builder_;
  std::size_t capacity_;
  std::size_t warn_entries_;
  bool log_captures_;
  bool warned_{false};

  mutable std::mutex mu_;                        // serializes misses and clear()
  std::atomic<std::shared_ptr<const Map>> snapshot_;
  std::atomic<std::uint64_t> tick_{0};
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> evictions_{0};
};

std::shared_ptr<DynamicGraphedCallable> wrap_dynamic(CallablePtr callable,
                                                     DynamicCacheOptions options = {});

} // namespace graphs
} // namespace gcap
