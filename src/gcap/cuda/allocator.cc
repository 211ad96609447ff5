// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/cuda/allocator.h"
#include "gcap/cuda/device.h"
#include "gcap/cuda/guard.h"
#include "gcap/core/error.h"
#include "gcap/logging/logging.h"

#include <memory>

#ifndef GCAP_WITH_CUDA
#  error "GCAP_WITH_CUDA must be defined (0/1)"
#endif
static_assert(GCAP_WITH_CUDA == 0 || GCAP_WITH_CUDA == 1, "GCAP_WITH_CUDA must be 0 or 1");

#if GCAP_WITH_CUDA
#  include <cuda_runtime_api.h>
#endif

namespace gcap { namespace cuda {

namespace {

constexpr std::size_t kMinBlockSize = 512;
constexpr std::size_t kSmallSize = 1u << 20;   // 1 MiB
constexpr std::size_t kLargeRound = 2u << 20;  // 2 MiB

struct CaptureTLS {
  bool        active{false};
  DeviceIndex dev{-1};
  MempoolId   id{};
};
static thread_local CaptureTLS s_capture_tls{};

static std::mutex registry_mu;
static std::vector<std::unique_ptr<Allocator>>& registry() {
  static std::vector<std::unique_ptr<Allocator>> r;
  return r;
}

#if GCAP_WITH_CUDA
static bool is_stream_capturing(DeviceIndex dev, const Stream& s) {
  DeviceGuard dg(dev);
  cudaStreamCaptureStatus st = cudaStreamCaptureStatusNone;
  cudaError_t rc = cudaStreamIsCapturing(reinterpret_cast<cudaStream_t>(s.handle()), &st);
  if (rc != cudaSuccess) {
    (void)cudaGetLastError();
    return false;
  }
  return st != cudaStreamCaptureStatusNone;
}
#endif

} // anonymous

std::size_t Allocator::round_size(std::size_t nbytes) noexcept {
  if (nbytes < kSmallSize) {
    std::size_t n = (nbytes + kMinBlockSize - 1) / kMinBlockSize;
    return (n == 0 ? 1 : n) * kMinBlockSize;
  }
  return ((nbytes + kLargeRound - 1) / kLargeRound) * kLargeRound;
}

Allocator& Allocator::get(DeviceIndex dev) {
  if (dev < 0) dev = current_device();
#if GCAP_WITH_CUDA
  const int n = device_count();
  if (n > 0 && dev >= n) {
    throw UsageError("cuda allocator: invalid device index " + std::to_string(dev));
  }
#endif
  std::lock_guard<std::mutex> lg(registry_mu);
  auto& r = registry();
  if (static_cast<std::size_t>(dev) >= r.size()) {
    r.resize(static_cast<std::size_t>(dev) + 1);
  }
  auto& slot = r[static_cast<std::size_t>(dev)];
  if (!slot) {
    slot.reset(new Allocator(dev));
  }
  return *slot;
}

// ---- Graph pools ----

MempoolId Allocator::create_pool_id(DeviceIndex dev) {
  Allocator& a = get(dev);
  std::lock_guard<std::mutex> lg(a.mu_);
  const std::uint64_t id = a.next_graph_pool_id_++;
  (void)a.graph_pools_.emplace(id, GraphPrivatePool{});
  a.stats_.graphs_pools_created += 1;
  return MempoolId{a.dev_, id};
}

void Allocator::retain_pool(DeviceIndex dev, MempoolId id) {
  Allocator& a = get(dev);
  if (id.dev != a.dev_ || id.id == 0) {
    throw UsageError(kErrUnknownMempool);
  }
  std::lock_guard<std::mutex> lg(a.mu_);
  auto it = a.graph_pools_.find(id.id);
  if (it == a.graph_pools_.end()) {
    throw UsageError(kErrUnknownMempool);
  }
  if (it->second.refcnt++ == 0) {
    a.stats_.graphs_pools_active += 1;
  }
}

void Allocator::release_pool(DeviceIndex dev, MempoolId id) noexcept {
  if (id.id == 0) return;
  Allocator* a = nullptr;
  try {
    a = &get(dev);
  } catch (const std::exception& e) {
    GCAP_LOG(WARNING) << "release_pool: " << e.what();
    return;
  }
  if (id.dev != a->dev_) return;
  std::lock_guard<std::mutex> lg(a->mu_);
  auto it = a->graph_pools_.find(id.id);
  if (it == a->graph_pools_.end()) return;
  auto& gp = it->second;
  if (gp.refcnt > 0) {
    --gp.refcnt;
    if (gp.refcnt == 0 && a->stats_.graphs_pools_active > 0) {
      a->stats_.graphs_pools_active -= 1;
    }
  }
  a->gc_pool_locked(id.id);
}

Allocator::AllocateToPoolGuard Allocator::begin_allocate_to_pool(DeviceIndex dev, MempoolId id) {
  Allocator& a = get(dev);
  if (id.dev != a.dev_ || id.id == 0) {
    throw UsageError(kErrUnknownMempool);
  }
  if (s_capture_tls.active) {
    throw UsageError("cuda allocator: allocation routing to a graph pool is already active on this thread");
  }
  {
    std::lock_guard<std::mutex> lg(a.mu_);
    auto it = a.graph_pools_.find(id.id);
    if (it == a.graph_pools_.end()) {
      throw UsageError(kErrUnknownMempool);
    }
    auto& gp = it->second;
    if (gp.active_capture_count > 0) {
      throw ResourceError("pool is busy with active capture (refcnt=" +
                          std::to_string(gp.refcnt) + ")");
    }
    gp.active_capture_count = 1u;
  }
  s_capture_tls.active = true;
  s_capture_tls.dev = a.dev_;
  s_capture_tls.id = id;
  a.routing_active_flag_.store(true, std::memory_order_relaxed);
  return AllocateToPoolGuard(&a, id);
}

void Allocator::end_allocate_to_pool_(MempoolId id) noexcept {
  if (s_capture_tls.active && s_capture_tls.dev == dev_ && s_capture_tls.id == id) {
    s_capture_tls = CaptureTLS{};
  }
  routing_active_flag_.store(false, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lg(mu_);
  auto it = graph_pools_.find(id.id);
  if (it == graph_pools_.end()) return;
  it->second.active_capture_count = 0u;
  gc_pool_locked(id.id);
}

void Allocator::gc_pool_locked(std::uint64_t pool_id) noexcept {
  auto it = graph_pools_.find(pool_id);
  if (it == graph_pools_.end()) return;
  auto& gp = it->second;
  if (gp.refcnt > 0 || gp.active_capture_count > 0) return;
  for (auto& kv : gp.free_blocks) {
    auto bit = blocks_.find(kv.second);
    if (bit == blocks_.end()) continue;
    bit->second.pool_id = 0;
    global_free_.emplace(FreeKey{bit->second.size, bit->second.stream_id}, kv.second);
  }
  gp.free_blocks.clear();
  if (gp.live_blocks == 0) {
    graph_pools_.erase(it);
  }
}

Allocator::AllocateToPoolGuard::AllocateToPoolGuard(Allocator* a, MempoolId id) noexcept
    : alloc_(a), id_(id), engaged_(true) {}

Allocator::AllocateToPoolGuard::~AllocateToPoolGuard() noexcept { end(); }

Allocator::AllocateToPoolGuard::AllocateToPoolGuard(AllocateToPoolGuard&& o) noexcept
    : alloc_(o.alloc_), id_(o.id_), engaged_(o.engaged_) {
  o.alloc_ = nullptr;
  o.engaged_ = false;
}

Allocator::AllocateToPoolGuard&
Allocator::AllocateToPoolGuard::operator=(AllocateToPoolGuard&& o) noexcept {
  if (this != &o) {
    end();
    alloc_ = o.alloc_;
    id_ = o.id_;
    engaged_ = o.engaged_;
    o.alloc_ = nullptr;
    o.engaged_ = false;
  }
  return *this;
}

void Allocator::AllocateToPoolGuard::end() noexcept {
  if (engaged_ && alloc_) {
    alloc_->end_allocate_to_pool_(id_);
  }
  engaged_ = false;
  alloc_ = nullptr;
}

// ---- Block management ----

void* Allocator::take_free_block_locked(std::size_t size, std::uint64_t stream_id,
                                        std::uint64_t pool_id) {
  void* p = nullptr;
  if (pool_id != 0) {
    auto& gp = graph_pools_.at(pool_id);
    auto it = gp.free_blocks.find(size);
    if (it == gp.free_blocks.end()) return nullptr;
    p = it->second;
    gp.free_blocks.erase(it);
  } else {
    auto it = global_free_.find(FreeKey{size, stream_id});
    if (it == global_free_.end()) return nullptr;
    p = it->second;
    global_free_.erase(it);
  }
  Block& b = blocks_.at(p);
  b.in_use = true;
  b.stream_id = stream_id;
  stats_.cached_bytes -= size;
  return p;
}

void* Allocator::raw_alloc(std::size_t nbytes) {
  return raw_alloc(nbytes, getCurrentStream(dev_));
}

void* Allocator::raw_alloc(std::size_t nbytes, Stream s) {
  if (nbytes == 0) return nullptr;
#if GCAP_WITH_CUDA
  const std::size_t size = round_size(nbytes);
  const bool routed = s_capture_tls.active && s_capture_tls.dev == dev_;
  if (!routed && is_stream_capturing(dev_, s)) {
    {
      std::lock_guard<std::mutex> lg(mu_);
      stats_.capture_denied += 1;
    }
    throw ResourceError(std::string(kErrAllocatorCaptureDenied) +
                        " device=" + std::to_string(dev_) +
                        " stream=" + std::to_string(s.id()));
  }
  std::lock_guard<std::mutex> lg(mu_);
  const std::uint64_t pool_id = routed ? s_capture_tls.id.id : 0;
  if (routed && graph_pools_.find(pool_id) == graph_pools_.end()) {
    throw UsageError(kErrUnknownMempool);
  }
  void* p = take_free_block_locked(size, s.id(), pool_id);
  if (p == nullptr) {
    DeviceGuard g(dev_);
    cudaError_t rc = cudaMalloc(&p, size);
    if (rc != cudaSuccess) {
      (void)cudaGetLastError();
      throw ResourceError("CUDA out of memory: tried to allocate " + std::to_string(size) +
                          " bytes on device " + std::to_string(dev_) + ": " +
                          cudaGetErrorString(rc));
    }
    blocks_.emplace(p, Block{size, s.id(), pool_id, true});
    stats_.reserved_bytes += size;
    stats_.num_device_allocs += 1;
  }
  if (pool_id != 0) {
    graph_pools_.at(pool_id).live_blocks += 1;
  }
  stats_.allocated_bytes += size;
  return p;
#else
  (void)s;
  throw ResourceError(kErrAllocatorCudaUnavailable);
#endif
}

void Allocator::raw_delete(void* ptr) noexcept {
  if (ptr == nullptr) return;
  std::lock_guard<std::mutex> lg(mu_);
  auto bit = blocks_.find(ptr);
  if (bit == blocks_.end() || !bit->second.in_use) {
    GCAP_LOG(ERROR) << "cuda allocator: raw_delete of unknown pointer on device " << dev_;
    return;
  }
  Block& b = bit->second;
  b.in_use = false;
  stats_.allocated_bytes -= b.size;
  stats_.cached_bytes += b.size;
  if (b.pool_id != 0) {
    auto pit = graph_pools_.find(b.pool_id);
    if (pit != graph_pools_.end()) {
      auto& gp = pit->second;
      if (gp.live_blocks > 0) gp.live_blocks -= 1;
      gp.free_blocks.emplace(b.size, ptr);
      gc_pool_locked(b.pool_id);
      return;
    }
    b.pool_id = 0;
  }
  global_free_.emplace(FreeKey{b.size, b.stream_id}, ptr);
}

void Allocator::emptyCache() noexcept {
  if (routing_active_flag_.load(std::memory_order_relaxed)) return;
  std::lock_guard<std::mutex> lg(mu_);
#if GCAP_WITH_CUDA
  DeviceGuard g(dev_);
  for (auto& kv : global_free_) {
    auto bit = blocks_.find(kv.second);
    if (bit == blocks_.end()) continue;
    const std::size_t size = bit->second.size;
    cudaError_t rc = cudaFree(kv.second);
    if (rc != cudaSuccess) {
      (void)cudaGetLastError();
      GCAP_LOG(WARNING) << "cuda allocator: cudaFree failed: " << cudaGetErrorString(rc);
    }
    blocks_.erase(bit);
    stats_.reserved_bytes -= size;
    stats_.cached_bytes -= size;
    stats_.num_device_frees += 1;
  }
#endif
  global_free_.clear();
}

DeviceStats Allocator::getDeviceStats() const {
  std::lock_guard<std::mutex> lg(mu_);
  return stats_;
}

std::size_t Allocator::pool_cached_blocks(MempoolId id) const {
  std::lock_guard<std::mutex> lg(mu_);
  auto it = graph_pools_.find(id.id);
  return (id.dev != dev_ || it == graph_pools_.end()) ? 0 : it->second.free_blocks.size();
}

std::uint32_t Allocator::pool_refcount(MempoolId id) const {
  std::lock_guard<std::mutex> lg(mu_);
  auto it = graph_pools_.find(id.id);
  return (id.dev != dev_ || it == graph_pools_.end()) ? 0 : it->second.refcnt;
}

}} // namespace gcap::cuda
