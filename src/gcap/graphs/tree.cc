// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/graphs/tree.h"

#include <string>

#include "gcap/core/error.h"
#include "gcap/ops/tensor_ops.h"

namespace gcap {
namespace graphs {

using gcap::core::Dict;
using gcap::core::List;
using gcap::core::Value;

namespace {

[[noreturn]] void mismatch(const std::string& path, const std::string& detail) {
  throw UsageError(std::string(kErrTreeCopyMismatch) + " at " + path + ": " + detail);
}

void copy_value(const Value& dst, const Value& src, const std::string& path);

void copy_list(const List& dst, const List& src, const std::string& path) {
  if (dst.size() != src.size()) {
    mismatch(path, "expected " + std::to_string(dst.size()) + " elements, got " +
                       std::to_string(src.size()));
  }
  for (std::size_t i = 0; i < dst.size(); ++i) {
    copy_value(dst[i], src[i], path + "[" + std::to_string(i) + "]");
  }
}

void copy_dict(const Dict& dst, const Dict& src, const std::string& path) {
  for (const auto& [key, d] : dst) {
    const Value* s = src.find(key);
    if (s == nullptr) {
      mismatch(path, "missing key '" + key + "'");
    }
    copy_value(d, *s, path + "['" + key + "']");
  }
}

void copy_value(const Value& dst, const Value& src, const std::string& path) {
  switch (dst.kind()) {
    case Value::Kind::Tensor: {
      if (!src.is_tensor()) {
        mismatch(path, std::string("expected tensor, got ") + gcap::core::kind_name(src.kind()));
      }
      const auto& d = dst.to_tensor();
      const auto& s = src.to_tensor();
      if (d.sizes() != s.sizes()) {
        mismatch(path, "expected shape " + gcap::core::shape_to_string(d.sizes()) + ", got " +
                           gcap::core::shape_to_string(s.sizes()));
      }
      if (d.dtype() != s.dtype()) {
        mismatch(path, std::string("expected dtype ") + gcap::core::dtype_name(d.dtype()) +
                           ", got " + gcap::core::dtype_name(s.dtype()));
      }
      gcap::ops::copy_(d, s);
      return;
    }
    case Value::Kind::List:
      if (!src.is_list()) {
        mismatch(path, std::string("expected list, got ") + gcap::core::kind_name(src.kind()));
      }
      copy_list(dst.to_list(), src.to_list(), path);
      return;
    case Value::Kind::Dict:
      if (!src.is_dict()) {
        mismatch(path, std::string("expected dict, got ") + gcap::core::kind_name(src.kind()));
      }
      copy_dict(dst.to_dict(), src.to_dict(), path);
      return;
    default:
      // Recorded as a constant; a different value cannot be replayed.
      if (dst != src) {
        mismatch(path, std::string("constant ") + gcap::core::kind_name(dst.kind()) +
                           " differs from the captured value");
      }
      return;
  }
}

std::optional<gcap::cuda::DeviceIndex> find_in_list(const List& l);
std::optional<gcap::cuda::DeviceIndex> find_in_dict(const Dict& d);

std::optional<gcap::cuda::DeviceIndex> find_in_value(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Tensor: {
      const auto& t = v.to_tensor();
      if (t.device().is_cuda()) {
        return static_cast<gcap::cuda::DeviceIndex>(t.device().index);
      }
      return std::nullopt;
    }
    case Value::Kind::List:
      return find_in_list(v.to_list());
    case Value::Kind::Dict:
      return find_in_dict(v.to_dict());
    default:
      return std::nullopt;
  }
}

std::optional<gcap::cuda::DeviceIndex> find_in_list(const List& l) {
  for (const auto& e : l) {
    if (auto d = find_in_value(e)) return d;
  }
  return std::nullopt;
}

std::optional<gcap::cuda::DeviceIndex> find_in_dict(const Dict& d) {
  for (const auto& item : d) {
    if (auto dev = find_in_value(item.second)) return dev;
  }
  return std::nullopt;
}

} // anonymous

void tree_copy(const Value& dst, const Value& src) { copy_value(dst, src, "value"); }
void tree_copy(const List& dst, const List& src) { copy_list(dst, src, "args"); }
void tree_copy(const Dict& dst, const Dict& src) { copy_dict(dst, src, "kwargs"); }

Value deep_copy(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Tensor: {
      const auto& t = v.to_tensor();
      if (!t.defined()) return v;
      return Value(gcap::ops::clone(t));
    }
    case Value::Kind::List:
      return Value(deep_copy(v.to_list()));
    case Value::Kind::Dict:
      return Value(deep_copy(v.to_dict()));
    default:
      return v;
  }
}

List deep_copy(const List& l) {
  List out;
  out.reserve(l.size());
  for (const auto& e : l) out.push_back(deep_copy(e));
  return out;
}

Dict deep_copy(const Dict& d) {
  Dict out;
  for (const auto& [key, v] : d) out.insert_or_assign(key, deep_copy(v));
  return out;
}

std::optional<gcap::cuda::DeviceIndex> find_cuda_device(const Value& v) {
  return find_in_value(v);
}

std::optional<gcap::cuda::DeviceIndex> find_cuda_device(const List& args, const Dict& kwargs) {
  if (auto d = find_in_list(args)) return d;
  return find_in_dict(kwargs);
}

} // namespace graphs
} // namespace gcap
