// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gcap/cuda/stream.h"

namespace gcap { namespace cuda {

using DeviceIndex = int16_t;

// Handle to a graph-private memory pool. id == 0 is the invalid handle.
struct MempoolId {
  DeviceIndex   dev{-1};
  std::uint64_t id{0};
  [[nodiscard]] bool is_valid() const noexcept { return dev >= 0 && id != 0; }
  [[nodiscard]] bool operator==(const MempoolId& o) const noexcept { return dev == o.dev && id == o.id; }
  [[nodiscard]] std::string to_string() const {
    return std::string("GraphPoolHandle(device=cuda:") +
           std::to_string(static_cast<int>(dev)) + ", id=" +
           std::to_string(id) + ")";
  }
};

inline constexpr const char* kErrAllocatorCaptureDenied =
  "cuda allocator: allocations are forbidden during CUDA graph capture";
inline constexpr const char* kErrAllocatorCudaUnavailable =
  "cuda allocator: CUDA support was not built";
inline constexpr const char* kErrUnknownMempool = "unknown mempool id";

struct DeviceStats {
  std::uint64_t allocated_bytes{0};      // handed out to callers
  std::uint64_t reserved_bytes{0};       // obtained from cudaMalloc
  std::uint64_t cached_bytes{0};         // reserved but idle in a free list
  std::uint64_t num_device_allocs{0};    // cudaMalloc calls
  std::uint64_t num_device_frees{0};     // cudaFree calls
  std::uint64_t graphs_pools_created{0};
  std::uint64_t graphs_pools_active{0};  // pools with refcnt > 0
  std::uint64_t capture_denied{0};
};

// Per-device caching allocator.
//
// Idle blocks are cached by exact rounded size. Global blocks are reused only
// on the stream they were last freed on. Blocks allocated while a capture
// routes to a graph pool carry that pool's id and go back to the pool's free
// list when freed; once the pool's refcount drops to zero and no capture is
// active, its idle blocks are demoted to the global cache.
class Allocator final {
 public:
  // dev < 0 selects the current device.
  static Allocator& get(DeviceIndex dev);

  class AllocateToPoolGuard final {
   public:
    AllocateToPoolGuard() noexcept = default;
    ~AllocateToPoolGuard() noexcept;
    AllocateToPoolGuard(AllocateToPoolGuard&&) noexcept;
    AllocateToPoolGuard& operator=(AllocateToPoolGuard&&) noexcept;
    AllocateToPoolGuard(const AllocateToPoolGuard&) = delete;
    AllocateToPoolGuard& operator=(const AllocateToPoolGuard&) = delete;

    void end() noexcept;
    [[nodiscard]] bool active() const noexcept { return engaged_; }

   private:
    friend class Allocator;
    AllocateToPoolGuard(Allocator* a, MempoolId id) noexcept;

    Allocator* alloc_{nullptr};
    MempoolId  id_{};
    bool       engaged_{false};
  };

  // Pool lifecycle. A new pool starts with refcnt 0; owners retain it.
  static MempoolId           create_pool_id(DeviceIndex dev);
  static void                retain_pool(DeviceIndex dev, MempoolId id);
  static void                release_pool(DeviceIndex dev, MempoolId id) noexcept;
  // Route this thread's allocations on dev into id until the guard ends.
  // Throws if the pool is unknown or already routing a capture.
  static AllocateToPoolGuard begin_allocate_to_pool(DeviceIndex dev, MempoolId id);

  // Allocate on the current stream (or s). nbytes == 0 returns nullptr.
  void* raw_alloc(std::size_t nbytes);
  void* raw_alloc(std::size_t nbytes, Stream s);
  void  raw_delete(void* ptr) noexcept;

  // Release idle global blocks back to the driver. No-op while a capture
  // routes to any pool of this device.
  void  emptyCache() noexcept;

  DeviceIndex device() const noexcept { return dev_; }
  DeviceStats getDeviceStats() const;

  // Idle blocks currently parked in a pool's free list; 0 for unknown pools.
  std::size_t pool_cached_blocks(MempoolId id) const;
  std::uint32_t pool_refcount(MempoolId id) const;
  [[nodiscard]] bool routing_active() const noexcept {
    return routing_active_flag_.load(std::memory_order_relaxed);
  }

  static std::size_t round_size(std::size_t nbytes) noexcept;

 private:
  explicit Allocator(DeviceIndex dev) noexcept : dev_(dev) {}

  struct Block {
    std::size_t   size{0};
    std::uint64_t stream_id{0};
    std::uint64_t pool_id{0};     // 0 == global
    bool          in_use{false};
  };
  struct GraphPrivatePool {
    std::uint32_t refcnt{0};
    std::uint32_t active_capture_count{0};
    std::size_t   live_blocks{0};  // tagged blocks currently handed out
    std::multimap<std::size_t, void*> free_blocks;
  };
  using FreeKey = std::pair<std::size_t, std::uint64_t>;  // (size, stream id)

  void  end_allocate_to_pool_(MempoolId id) noexcept;
  void* take_free_block_locked(std::size_t size, std::uint64_t stream_id, std::uint64_t pool_id);
  void  gc_pool_locked(std::uint64_t pool_id) noexcept;

  DeviceIndex dev_;
  mutable std::mutex mu_;
  std::unordered_map<void*, Block> blocks_;
  std::multimap<FreeKey, void*> global_free_;
  std::map<std::uint64_t, GraphPrivatePool> graph_pools_;
  std::uint64_t next_graph_pool_id_{1};
  DeviceStats stats_{};
  std::atomic<bool> routing_active_flag_{false};
};

}} // namespace gcap::cuda
