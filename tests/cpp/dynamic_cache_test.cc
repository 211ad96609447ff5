// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gcap/core/error.h"
#include "gcap/cuda/graphs.h"
#include "gcap/cuda/stream.h"
#include "gcap/graphs/dynamic_cache.h"
#include "gcap/ops/tensor_ops.h"
#include "gcap_test_helpers.h"

using gcap::core::Device;
using gcap::core::Opaque;
using gcap::core::TensorImpl;
using gcap::core::Value;
using namespace gcap::graphs;
namespace ops = gcap::ops;

namespace {

// Stands in for graph capture: counts builds and returns a callable that
// forwards to the wrapped one.
struct CountingBuilder {
  std::shared_ptr<std::atomic<int>> builds = std::make_shared<std::atomic<int>>(0);
  std::chrono::milliseconds delay{0};

  GraphBuilder fn() const {
    auto counter = builds;
    auto d = delay;
    return [counter, d](const CallablePtr& c, const Args&, const Kwargs&) -> CallablePtr {
      if (d.count() > 0) std::this_thread::sleep_for(d);
      counter->fetch_add(1);
      return make_function([c](const Args& a, const Kwargs& k) { return (*c)(a, k); },
                           "built");
    };
  }
};

CallablePtr sum_of_first(std::atomic<int>* calls = nullptr) {
  return make_function(
      [calls](const Args& a, const Kwargs&) {
        if (calls) calls->fetch_add(1);
        std::vector<float> v = ops::to_vector<float>(a[0].to_tensor());
        double s = 0;
        for (float f : v) s += f;
        return Value(s);
      },
      "sum_of_first");
}

TensorImpl vec(const std::vector<float>& v) {
  return ops::from_vector<float>(v, {static_cast<int64_t>(v.size())});
}

DynamicCacheOptions quiet(const CountingBuilder& b, std::size_t capacity = 0) {
  DynamicCacheOptions o;
  o.capacity = capacity;
  o.warn_entries = 0;
  o.log_captures = false;
  o.builder = b.fn();
  return o;
}

} // namespace

TEST(DynamicCacheTest, SameShapeBuildsOnce) {
  CountingBuilder b;
  auto dyn = wrap_dynamic(sum_of_first(), quiet(b));
  EXPECT_DOUBLE_EQ(((*dyn)(Args{Value(vec({1.f, 2.f, 3.f, 4.f}))}, Kwargs{})).to_double(), 10.0);
  EXPECT_DOUBLE_EQ(((*dyn)(Args{Value(vec({5.f, 6.f, 7.f, 8.f}))}, Kwargs{})).to_double(), 26.0);
  EXPECT_EQ(b.builds->load(), 1);
  const auto s = dyn->stats();
  EXPECT_EQ(s.misses, 1u);
  EXPECT_EQ(s.hits, 1u);
  EXPECT_EQ(s.entries, 1u);
  EXPECT_EQ(dyn->name(), "sum_of_first");
}

TEST(DynamicCacheTest, NewShapeAddsEntry) {
  CountingBuilder b;
  auto dyn = wrap_dynamic(sum_of_first(), quiet(b));
  (*dyn)(Args{Value(vec({1.f, 2.f, 3.f, 4.f}))}, Kwargs{});
  (*dyn)(Args{Value(vec({1.f, 2.f, 3.f}))}, Kwargs{});
  (*dyn)(Args{Value(vec({9.f, 9.f, 9.f}))}, Kwargs{});
  EXPECT_EQ(b.builds->load(), 2);
  EXPECT_EQ(dyn->size(), 2u);

  const Args same_shape{Value(vec({0.f, 0.f, 0.f}))};
  EXPECT_NE(dyn->lookup(Fingerprint::of_call(same_shape, Kwargs{})), nullptr);
  EXPECT_EQ(dyn->lookup(Fingerprint::of_call(Args{Value(vec({0.f}))}, Kwargs{})), nullptr);
}

TEST(DynamicCacheTest, KeyFollowsFingerprintRules) {
  CountingBuilder b;
  auto dyn = wrap_dynamic(sum_of_first(), quiet(b));
  const Value x(vec({1.f, 2.f}));

  // Kwarg order does not matter.
  (*dyn)(Args{x}, Kwargs{{"a", Value(1)}, {"b", Value(2)}});
  (*dyn)(Args{x}, Kwargs{{"b", Value(2)}, {"a", Value(1)}});
  EXPECT_EQ(b.builds->load(), 1);

  // Opaque arguments never split the cache.
  (*dyn)(Args{x, Value(Opaque{std::make_shared<int>(1), "int"})}, Kwargs{});
  (*dyn)(Args{x, Value(Opaque{std::make_shared<int>(2), "int"})}, Kwargs{});
  EXPECT_EQ(b.builds->load(), 2);

  // Scalar values and single-element CPU tensors do.
  (*dyn)(Args{x, Value(1)}, Kwargs{});
  (*dyn)(Args{x, Value(2)}, Kwargs{});
  (*dyn)(Args{x, Value(ops::from_vector<std::int64_t>({1}, {1}))}, Kwargs{});
  (*dyn)(Args{x, Value(ops::from_vector<std::int64_t>({2}, {1}))}, Kwargs{});
  (*dyn)(Args{x, Value(ops::from_vector<std::int64_t>({2}, {1}))}, Kwargs{});
  EXPECT_EQ(b.builds->load(), 6);
}

TEST(DynamicCacheTest, ConcurrentFirstCallsBuildOnce) {
  CountingBuilder b;
  b.delay = std::chrono::milliseconds(50);
  auto dyn = wrap_dynamic(sum_of_first(), quiet(b));

  constexpr int kThreads = 8;
  std::vector<double> results(kThreads, 0.0);
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      const float v = static_cast<float>(i);
      results[i] = (*dyn)(Args{Value(vec({v, v}))}, Kwargs{}).to_double();
    });
  }
  go.store(true);
  for (auto& t : threads) t.join();

  EXPECT_EQ(b.builds->load(), 1);
  for (int i = 0; i < kThreads; ++i) {
    EXPECT_DOUBLE_EQ(results[i], 2.0 * i);
  }
  const auto s = dyn->stats();
  EXPECT_EQ(s.misses, 1u);
  EXPECT_EQ(s.hits, static_cast<std::uint64_t>(kThreads - 1));
}

TEST(DynamicCacheTest, CapacityEvictsLeastRecentlyUsed) {
  CountingBuilder b;
  auto dyn = wrap_dynamic(sum_of_first(), quiet(b, 2));
  EXPECT_EQ(dyn->capacity(), 2u);
  const Args a{Value(vec({1.f}))};
  const Args bb{Value(vec({1.f, 1.f}))};
  const Args c{Value(vec({1.f, 1.f, 1.f}))};

  (*dyn)(a, Kwargs{});
  (*dyn)(bb, Kwargs{});
  (*dyn)(a, Kwargs{});
  (*dyn)(c, Kwargs{});

  EXPECT_EQ(dyn->size(), 2u);
  EXPECT_NE(dyn->lookup(Fingerprint::of_call(a, Kwargs{})), nullptr);
  EXPECT_EQ(dyn->lookup(Fingerprint::of_call(bb, Kwargs{})), nullptr);
  EXPECT_NE(dyn->lookup(Fingerprint::of_call(c, Kwargs{})), nullptr);
  EXPECT_EQ(dyn->stats().evictions, 1u);

  // Evicted shapes are rebuilt on demand.
  (*dyn)(bb, Kwargs{});
  EXPECT_EQ(b.builds->load(), 4);
  EXPECT_EQ(dyn->size(), 2u);
}

TEST(DynamicCacheTest, FailedBuildIsNotCached) {
  auto attempts = std::make_shared<std::atomic<int>>(0);
  DynamicCacheOptions o;
  o.log_captures = false;
  o.builder = [attempts](const CallablePtr& c, const Args&, const Kwargs&) -> CallablePtr {
    if (attempts->fetch_add(1) == 0) throw gcap::ResourceError("capture failed");
    return c;
  };
  auto dyn = wrap_dynamic(sum_of_first(), o);
  const Args args{Value(vec({2.f, 3.f}))};
  EXPECT_THROW((*dyn)(args, Kwargs{}), gcap::ResourceError);
  EXPECT_EQ(dyn->size(), 0u);
  EXPECT_DOUBLE_EQ((*dyn)(args, Kwargs{}).to_double(), 5.0);
  EXPECT_EQ(attempts->load(), 2);
  EXPECT_EQ(dyn->size(), 1u);
}

TEST(DynamicCacheTest, ClearDropsEntries) {
  CountingBuilder b;
  auto dyn = wrap_dynamic(sum_of_first(), quiet(b));
  const Args args{Value(vec({1.f}))};
  (*dyn)(args, Kwargs{});
  dyn->clear();
  EXPECT_EQ(dyn->size(), 0u);
  (*dyn)(args, Kwargs{});
  EXPECT_EQ(b.builds->load(), 2);
}

TEST(DynamicCacheTest, WarnThresholdDoesNotLimitEntries) {
  CountingBuilder b;
  DynamicCacheOptions o = quiet(b);
  o.warn_entries = 1;
  auto dyn = wrap_dynamic(sum_of_first(), o);
  for (int n = 1; n <= 4; ++n) {
    (*dyn)(Args{Value(vec(std::vector<float>(static_cast<std::size_t>(n), 1.f)))}, Kwargs{});
  }
  EXPECT_EQ(dyn->size(), 4u);
  EXPECT_EQ(dyn->stats().evictions, 0u);
}

TEST(DynamicCacheTest, NullCallableIsRejected) {
  EXPECT_THROW(wrap_dynamic(nullptr), gcap::UsageError);
}

TEST(DynamicCacheTest, DefaultBuilderRejectsCpuOnlyArguments) {
  DynamicCacheOptions o;
  o.log_captures = false;
  auto dyn = wrap_dynamic(sum_of_first(), o);
  EXPECT_THROW((*dyn)(Args{Value(vec({1.f}))}, Kwargs{}), gcap::UsageError);
  EXPECT_EQ(dyn->size(), 0u);
}

TEST(DynamicCacheTest, CapturesRealGraphsPerShape) {
  if (!gcap_test::cuda_available()) {
    GTEST_SKIP() << "CUDA required";
  }
  std::atomic<int> calls{0};
  auto fn = make_function(
      [&calls](const Args& a, const Kwargs&) {
        calls.fetch_add(1);
        return Value(ops::mul(a[0].to_tensor(), 2.0));
      },
      "doubler");
  DynamicCacheOptions o;
  o.capture.warmup_iters = 1;
  auto dyn = wrap_dynamic(fn, o);
  auto cuda = [](const std::vector<float>& v) {
    return Value(ops::from_vector<float>(v, {static_cast<int64_t>(v.size())}, Device::cuda(0)));
  };

  Value o1 = (*dyn)(Args{cuda({1.f, 2.f, 3.f, 4.f})}, Kwargs{});
  Value o2 = (*dyn)(Args{cuda({5.f, 6.f, 7.f, 8.f})}, Kwargs{});
  Value o3 = (*dyn)(Args{cuda({1.f, 2.f, 3.f})}, Kwargs{});
  EXPECT_EQ(ops::to_vector<float>(o1.to_tensor()), (std::vector<float>{2.f, 4.f, 6.f, 8.f}));
  EXPECT_EQ(ops::to_vector<float>(o2.to_tensor()), (std::vector<float>{10.f, 12.f, 14.f, 16.f}));
  EXPECT_EQ(ops::to_vector<float>(o3.to_tensor()), (std::vector<float>{2.f, 4.f, 6.f}));
  // One warmup plus one recording per shape.
  EXPECT_EQ(calls.load(), 4);
  EXPECT_EQ(dyn->size(), 2u);
}

TEST(DynamicCacheTest, EvictionWaitsForCaptureOnSameDevice) {
  if (!gcap_test::cuda_available()) {
    GTEST_SKIP() << "CUDA required";
  }
  namespace gc = gcap::cuda;
  CaptureOptions no_warmup;
  no_warmup.warmup_iters = 0;
  auto cuda = [](const std::vector<float>& v) {
    return Value(ops::from_vector<float>(v, {static_cast<int64_t>(v.size())}, Device::cuda(0)));
  };
  auto doubler = make_function(
      [](const Args& a, const Kwargs&) { return Value(ops::mul(a[0].to_tensor(), 2.0)); },
      "doubler");

  // Entries handed out in order; the cache ends up holding the only reference.
  auto pending = std::make_shared<std::vector<CallablePtr>>();
  pending->push_back(capture_once(doubler, Args{cuda({0.f, 0.f})}, Kwargs{}, no_warmup));
  pending->push_back(capture_once(doubler, Args{cuda({0.f, 0.f, 0.f})}, Kwargs{}, no_warmup));
  std::weak_ptr<Callable> first = pending->at(0);
  auto next = std::make_shared<std::size_t>(0);

  DynamicCacheOptions o;
  o.capacity = 1;
  o.warn_entries = 0;
  o.log_captures = false;
  o.builder = [pending, next](const CallablePtr&, const Args&, const Kwargs&) -> CallablePtr {
    CallablePtr c = std::move(pending->at(*next));
    ++*next;
    return c;
  };
  auto dyn = wrap_dynamic(doubler, o);

  Value two = cuda({1.f, 2.f});
  Value three = cuda({1.f, 2.f, 3.f});
  Value four = cuda({1.f, 2.f, 3.f, 4.f});
  Value out2 = (*dyn)(Args{two}, Kwargs{});
  EXPECT_EQ(ops::to_vector<float>(out2.to_tensor()), (std::vector<float>{2.f, 4.f}));

  // Holds its recording open long enough for the other wrapper to evict.
  std::atomic<bool> recording{false};
  auto slow = make_function(
      [&recording](const Args& a, const Kwargs&) {
        if (gc::streamCaptureStatus(gc::getCurrentStream(0)) == gc::CaptureStatus::Active) {
          recording.store(true);
          std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        return Value(ops::mul(a[0].to_tensor(), 2.0));
      },
      "slow_doubler");

  std::shared_ptr<GraphedCallable> captured;
  std::string capture_error;
  std::thread t([&] {
    try {
      captured = capture_once(slow, Args{four}, Kwargs{}, no_warmup);
    } catch (const std::exception& e) {
      capture_error = e.what();
    }
  });
  while (!recording.load()) {
    std::this_thread::yield();
  }
  Value out3 = (*dyn)(Args{three}, Kwargs{});
  t.join();

  ASSERT_TRUE(capture_error.empty()) << capture_error;
  EXPECT_TRUE(first.expired());
  EXPECT_EQ(dyn->stats().evictions, 1u);
  EXPECT_EQ(ops::to_vector<float>(out3.to_tensor()), (std::vector<float>{2.f, 4.f, 6.f}));
  Value out4 = (*captured)(Args{four}, Kwargs{});
  EXPECT_EQ(ops::to_vector<float>(out4.to_tensor()), (std::vector<float>{2.f, 4.f, 6.f, 8.f}));
}
