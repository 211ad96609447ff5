// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "gcap/graphs/callable.h"

namespace gcap {
namespace graphs {

// Structural identity of call arguments, used as the dynamic cache key.
//
// Tensors contribute device, dtype and shape, plus the value of single-element
// CPU tensors. Scalars contribute themselves (typed, doubles by bit pattern).
// Lists keep order; dicts are sorted by key. None and opaque objects collapse
// to a wildcard that matches any other wildcard.
//
// Immutable; copies share the underlying tree.
class Fingerprint {
 public:
  enum class Kind : std::uint8_t {
    Wildcard, Bool, Int, Double, String, Bytes, Tensor, Sequence, Mapping
  };

  static Fingerprint of(const gcap::core::Value& v);
  static Fingerprint of_call(const Args& args, const Kwargs& kwargs);

  Kind kind() const noexcept;
  std::size_t hash() const noexcept { return hash_; }
  std::string to_string() const;

  friend bool operator==(const Fingerprint& a, const Fingerprint& b) noexcept;
  friend bool operator!=(const Fingerprint& a, const Fingerprint& b) noexcept { return !(a == b); }

  struct Node;

 private:
  explicit Fingerprint(std::shared_ptr<const Node> node);
  static Fingerprint of_list(const gcap::core::List& l);
  static Fingerprint of_dict(const gcap::core::Dict& d);

  std::shared_ptr<const Node> node_;
  std::size_t hash_{0};
};

struct FingerprintHash {
  std::size_t operator()(const Fingerprint& f) const noexcept { return f.hash(); }
};

} // namespace graphs
} // namespace gcap
