// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/graphs/dynamic_cache.h"

#include <limits>
#include <utility>

#include "gcap/core/error.h"
#include "gcap/graphs/config.h"
#include "gcap/logging/logging.h"

namespace gcap {
namespace graphs {

using gcap::core::Value;

DynamicGraphedCallable::DynamicGraphedCallable(CallablePtr callable, DynamicCacheOptions options)
    : callable_(std::move(callable)),
      builder_(std::move(options.builder)),
      capacity_(options.capacity.value_or(graph_config_from_env().cache_capacity)),
      warn_entries_(options.warn_entries.value_or(graph_config_from_env().warn_entries)),
      log_captures_(options.log_captures.value_or(graph_config_from_env().log_captures)),
      snapshot_(std::make_shared<const Map>()) {
  if (!callable_) {
    throw UsageError("wrap_dynamic: callable is null");
  }
  if (!builder_) {
    CaptureOptions capture = options.capture;
    builder_ = [capture](const CallablePtr& c, const Args& a, const Kwargs& k) -> CallablePtr {
      return capture_once(c, a, k, capture);
    };
  }
}

DynamicGraphedCallable::~DynamicGraphedCallable() = default;

std::shared_ptr<DynamicGraphedCallable::Entry>
DynamicGraphedCallable::find(const Fingerprint& fp) const {
  // Acquire pairs with the release store in publish_locked: a visible entry
  // is fully built.
  std::shared_ptr<const Map> snap = snapshot_.load(std::memory_order_acquire);
  auto it = snap->find(fp);
  return it == snap->end() ? nullptr : it->second;
}

void DynamicGraphedCallable::publish_locked(std::shared_ptr<const Map> next) {
  snapshot_.store(std::move(next), std::memory_order_release);
}

std::shared_ptr<DynamicGraphedCallable::Entry>
DynamicGraphedCallable::build_locked(const Fingerprint& fp, const Args& args, const Kwargs& kwargs) {
  if (log_captures_) {
    GCAP_LOG(INFO) << "Dynamically graphing " << callable_->name() << " for " << fp.to_string();
  }
  CallablePtr graphed = builder_(callable_, args, kwargs);
  GCAP_CHECK(graphed != nullptr);

  const Map& cur = *snapshot_.load(std::memory_order_relaxed);
  auto next = std::make_shared<Map>(cur);
  if (capacity_ > 0 && next->size() >= capacity_) {
    auto victim = next->end();
    std::uint64_t oldest = std::numeric_limits<std::uint64_t>::max();
    for (auto it = next->begin(); it != next->end(); ++it) {
      const std::uint64_t t = it->second->last_used.load(std::memory_order_relaxed);
      if (t < oldest) {
        oldest = t;
        victim = it;
      }
    }
    if (victim != next->end()) {
      if (log_captures_) {
        GCAP_LOG(INFO) << "Evicting graph of " << callable_->name() << " for "
                       << victim->first.to_string();
      }
      next->erase(victim);
      evictions_.fetch_add(1, std::memory_order_relaxed);
    }
  }
  auto entry = std::make_shared<Entry>(std::move(graphed),
                                       tick_.fetch_add(1, std::memory_order_relaxed));
  next->emplace(fp, entry);
  const std::size_t n = next->size();
  publish_locked(std::move(next));
  misses_.fetch_add(1, std::memory_order_relaxed);

  if (!warned_ && warn_entries_ > 0 && n > warn_entries_) {
    warned_ = true;
    GCAP_LOG(WARNING) << callable_->name() << " has been graphed for " << n
                      << " distinct argument shapes; each one holds its own static buffers";
  }
  return entry;
}

Value DynamicGraphedCallable::operator()(const Args& args, const Kwargs& kwargs) {
  const Fingerprint fp = Fingerprint::of_call(args, kwargs);
  std::shared_ptr<Entry> entry = find(fp);
  if (entry) {
    hits_.fetch_add(1, std::memory_order_relaxed);
  } else {
    std::lock_guard<std::mutex> lk(mu_);
    entry = find(fp);
    if (entry) {
      hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
      entry = build_locked(fp, args, kwargs);
    }
  }
  if (capacity_ > 0) {
    entry->last_used.store(tick_.fetch_add(1, std::memory_order_relaxed),
                           std::memory_order_relaxed);
  }
  // The entry is held by this call, so eviction cannot destroy it mid-replay.
  return (*entry->graphed)(args, kwargs);
}

CallablePtr DynamicGraphedCallable::lookup(const Fingerprint& fp) const {
  auto entry = find(fp);
  return entry ? entry->graphed : nullptr;
}

DynamicCacheStats DynamicGraphedCallable::stats() const {
  DynamicCacheStats s;
  s.hits = hits_.load(std::memory_order_relaxed);
  s.misses = misses_.load(std::memory_order_relaxed);
  s.evictions = evictions_.load(std::memory_order_relaxed);
  s.entries = size();
  return s;
}

std::size_t DynamicGraphedCallable::size() const {
  return snapshot_.load(std::memory_order_acquire)->size();
}

void DynamicGraphedCallable::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  publish_locked(std::make_shared<const Map>());
}

std::shared_ptr<DynamicGraphedCallable> wrap_dynamic(CallablePtr callable,
                                                     DynamicCacheOptions options) {
  return std::make_shared<DynamicGraphedCallable>(std::move(callable), std::move(options));
}

} // namespace graphs
} // namespace gcap
