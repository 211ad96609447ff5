// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/graphs/fingerprint.h"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <utility>
#include <vector>

#include "gcap/core/dtype.h"
#include "gcap/ops/tensor_ops.h"

namespace gcap {
namespace graphs {

using gcap::core::Value;

struct Fingerprint::Node {
  Kind kind{Kind::Wildcard};
  std::uint64_t bits{0};            // Bool, Int, Double payload
  std::string text;                 // String, Bytes payload
  std::int32_t device_type{0};
  std::int32_t device_index{0};
  gcap::core::ScalarType dtype{gcap::core::ScalarType::Undefined};
  std::vector<std::int64_t> sizes;
  std::vector<std::string> keys;    // Mapping keys, sorted
  std::vector<Fingerprint> children;  // Sequence/Mapping elements; Tensor scalar value
};

namespace {

inline std::size_t mix(std::size_t seed, std::size_t v) noexcept {
  return seed ^ (v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

std::size_t hash_node(const Fingerprint::Node& n, const std::vector<std::size_t>& child_hashes) {
  std::size_t h = mix(0, static_cast<std::size_t>(n.kind));
  h = mix(h, std::hash<std::uint64_t>{}(n.bits));
  if (!n.text.empty()) h = mix(h, std::hash<std::string>{}(n.text));
  if (n.kind == Fingerprint::Kind::Tensor) {
    h = mix(h, static_cast<std::size_t>(n.device_type));
    h = mix(h, static_cast<std::size_t>(n.device_index));
    h = mix(h, static_cast<std::size_t>(n.dtype));
    h = mix(h, n.sizes.size());
    for (auto s : n.sizes) h = mix(h, static_cast<std::size_t>(s));
  }
  for (const auto& k : n.keys) h = mix(h, std::hash<std::string>{}(k));
  h = mix(h, child_hashes.size());
  for (auto c : child_hashes) h = mix(h, c);
  return h;
}

std::string quote(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

} // anonymous

Fingerprint::Fingerprint(std::shared_ptr<const Node> node) : node_(std::move(node)) {
  std::vector<std::size_t> child_hashes;
  child_hashes.reserve(node_->children.size());
  for (const auto& c : node_->children) child_hashes.push_back(c.hash());
  hash_ = hash_node(*node_, child_hashes);
}

Fingerprint::Kind Fingerprint::kind() const noexcept { return node_->kind; }

Fingerprint Fingerprint::of(const Value& v) {
  auto n = std::make_shared<Node>();
  switch (v.kind()) {
    case Value::Kind::None:
    case Value::Kind::Opaque:
      n->kind = Kind::Wildcard;
      break;
    case Value::Kind::Bool:
      n->kind = Kind::Bool;
      n->bits = v.to_bool() ? 1u : 0u;
      break;
    case Value::Kind::Int:
      n->kind = Kind::Int;
      n->bits = static_cast<std::uint64_t>(v.to_int());
      break;
    case Value::Kind::Double: {
      n->kind = Kind::Double;
      const double d = v.to_double();
      static_assert(sizeof(d) == sizeof(n->bits), "double must be 64-bit");
      std::memcpy(&n->bits, &d, sizeof(d));
      break;
    }
    case Value::Kind::String:
      n->kind = Kind::String;
      n->text = v.to_str();
      break;
    case Value::Kind::Bytes:
      n->kind = Kind::Bytes;
      n->text = v.to_bytes().data;
      break;
    case Value::Kind::Tensor: {
      const auto& t = v.to_tensor();
      n->kind = Kind::Tensor;
      n->device_type = static_cast<std::int32_t>(t.device().type);
      n->device_index = t.device().index;
      n->dtype = t.dtype();
      n->sizes = t.sizes();
      // Single-element CPU tensors are keyed by value as well.
      if (t.defined() && t.device().is_cpu() && t.numel() == 1) {
        n->children.push_back(of(gcap::ops::item(t)));
      }
      break;
    }
    case Value::Kind::List:
      return of_list(v.to_list());
    case Value::Kind::Dict:
      return of_dict(v.to_dict());
  }
  return Fingerprint(std::move(n));
}

Fingerprint Fingerprint::of_list(const gcap::core::List& l) {
  auto n = std::make_shared<Node>();
  n->kind = Kind::Sequence;
  n->children.reserve(l.size());
  for (const auto& e : l) n->children.push_back(of(e));
  return Fingerprint(std::move(n));
}

Fingerprint Fingerprint::of_dict(const gcap::core::Dict& d) {
  auto n = std::make_shared<Node>();
  n->kind = Kind::Mapping;
  std::vector<const gcap::core::Dict::Item*> items;
  items.reserve(d.size());
  for (const auto& it : d) items.push_back(&it);
  std::sort(items.begin(), items.end(),
            [](const auto* a, const auto* b) { return a->first < b->first; });
  n->keys.reserve(items.size());
  n->children.reserve(items.size());
  for (const auto* it : items) {
    n->keys.push_back(it->first);
    n->children.push_back(of(it->second));
  }
  return Fingerprint(std::move(n));
}

Fingerprint Fingerprint::of_call(const Args& args, const Kwargs& kwargs) {
  auto n = std::make_shared<Node>();
  n->kind = Kind::Sequence;
  n->children.push_back(of_list(args));
  n->children.push_back(of_dict(kwargs));
  return Fingerprint(std::move(n));
}

bool operator==(const Fingerprint& a, const Fingerprint& b) noexcept {
  if (a.node_ == b.node_) return true;
  if (a.hash_ != b.hash_) return false;
  const auto& x = *a.node_;
  const auto& y = *b.node_;
  if (x.kind != y.kind || x.bits != y.bits || x.text != y.text) return false;
  if (x.kind == Fingerprint::Kind::Tensor &&
      (x.device_type != y.device_type || x.device_index != y.device_index ||
       x.dtype != y.dtype || x.sizes != y.sizes)) {
    return false;
  }
  if (x.keys != y.keys || x.children.size() != y.children.size()) return false;
  for (std::size_t i = 0; i < x.children.size(); ++i) {
    if (x.children[i] != y.children[i]) return false;
  }
  return true;
}

std::string Fingerprint::to_string() const {
  const Node& n = *node_;
  std::ostringstream os;
  switch (n.kind) {
    case Kind::Wildcard:
      os << "*";
      break;
    case Kind::Bool:
      os << (n.bits ? "true" : "false");
      break;
    case Kind::Int:
      os << static_cast<std::int64_t>(n.bits);
      break;
    case Kind::Double: {
      double d;
      std::memcpy(&d, &n.bits, sizeof(d));
      os << "double(" << d << ")";
      break;
    }
    case Kind::String:
      os << quote(n.text);
      break;
    case Kind::Bytes:
      os << "bytes(" << n.text.size() << ")";
      break;
    case Kind::Tensor: {
      gcap::core::Device dev{static_cast<DLDeviceType>(n.device_type), n.device_index};
      os << "Tensor(" << dev.to_string() << ", " << gcap::core::dtype_name(n.dtype) << ", "
         << gcap::core::shape_to_string(n.sizes);
      if (!n.children.empty()) os << ", value=" << n.children.front().to_string();
      os << ")";
      break;
    }
    case Kind::Sequence:
      os << "(";
      for (std::size_t i = 0; i < n.children.size(); ++i) {
        if (i) os << ", ";
        os << n.children[i].to_string();
      }
      os << ")";
      break;
    case Kind::Mapping:
      os << "{";
      for (std::size_t i = 0; i < n.children.size(); ++i) {
        if (i) os << ", ";
        os << n.keys[i] << ": " << n.children[i].to_string();
      }
      os << "}";
      break;
  }
  return os.str();
}

} // namespace graphs
} // namespace gcap
