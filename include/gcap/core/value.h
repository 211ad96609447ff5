// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "gcap/core/tensor.h"

namespace gcap {
namespace core {

class Value;

struct Bytes {
  std::string data;
  friend bool operator==(const Bytes& a, const Bytes& b) { return a.data == b.data; }
  friend bool operator!=(const Bytes& a, const Bytes& b) { return !(a == b); }
};

// Any object the argument tree does not model. Held by shared handle and
// compared by identity.
struct Opaque {
  std::shared_ptr<const void> handle;
  std::string type_name;
};

using List = std::vector<Value>;

// String-keyed mapping that keeps insertion order. Member definitions follow
// Value below since the element type must be complete.
class Dict {
 public:
  using Item = std::pair<std::string, Value>;
  using const_iterator = std::vector<Item>::const_iterator;

  Dict() = default;
  Dict(std::initializer_list<Item> items);

  const Value* find(const std::string& key) const noexcept;
  Value* find(const std::string& key) noexcept;
  bool contains(const std::string& key) const noexcept { return find(key) != nullptr; }
  void insert_or_assign(std::string key, Value v);

  std::size_t size() const noexcept;
  bool empty() const noexcept;
  const std::vector<Item>& items() const noexcept { return items_; }
  const_iterator begin() const noexcept;
  const_iterator end() const noexcept;

 private:
  std::vector<Item> items_;
};

// Closed tagged variant carrying call arguments and results. Tensors are
// handles (copies alias); containers hold their elements by value.
class Value {
 public:
  // Order matches the payload alternatives.
  enum class Kind : std::uint8_t {
    None, Bool, Int, Double, String, Bytes, Tensor, List, Dict, Opaque
  };

  Value() noexcept = default;
  Value(std::nullptr_t) noexcept {}
  Value(bool v) : payload_(std::in_place_type<bool>, v) {}
  Value(int v) : payload_(std::in_place_type<std::int64_t>, v) {}
  Value(std::int64_t v) : payload_(std::in_place_type<std::int64_t>, v) {}
  Value(double v) : payload_(std::in_place_type<double>, v) {}
  Value(const char* v) : payload_(std::in_place_type<std::string>, v) {}
  Value(std::string v) : payload_(std::in_place_type<std::string>, std::move(v)) {}
  Value(Bytes v) : payload_(std::in_place_type<Bytes>, std::move(v)) {}
  Value(TensorImpl v) : payload_(std::in_place_type<TensorImpl>, std::move(v)) {}
  Value(List v) : payload_(std::in_place_type<List>, std::move(v)) {}
  Value(Dict v) : payload_(std::in_place_type<Dict>, std::move(v)) {}
  Value(Opaque v) : payload_(std::in_place_type<Opaque>, std::move(v)) {}

  Kind kind() const noexcept { return static_cast<Kind>(payload_.index()); }

  bool is_none() const noexcept { return kind() == Kind::None; }
  bool is_bool() const noexcept { return kind() == Kind::Bool; }
  bool is_int() const noexcept { return kind() == Kind::Int; }
  bool is_double() const noexcept { return kind() == Kind::Double; }
  bool is_string() const noexcept { return kind() == Kind::String; }
  bool is_bytes() const noexcept { return kind() == Kind::Bytes; }
  bool is_tensor() const noexcept { return kind() == Kind::Tensor; }
  bool is_list() const noexcept { return kind() == Kind::List; }
  bool is_dict() const noexcept { return kind() == Kind::Dict; }
  bool is_opaque() const noexcept { return kind() == Kind::Opaque; }

  // Accessors throw UsageError on a kind mismatch.
  bool to_bool() const;
  std::int64_t to_int() const;
  double to_double() const;
  const std::string& to_str() const;
  const Bytes& to_bytes() const;
  const TensorImpl& to_tensor() const;
  const List& to_list() const;
  List& to_list();
  const Dict& to_dict() const;
  Dict& to_dict();
  const Opaque& to_opaque() const;

  // Structural equality. Tensors and opaque objects compare by identity,
  // doubles by bit pattern, dicts ignore insertion order.
  friend bool operator==(const Value& a, const Value& b);
  friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

 private:
  using Payload = std::variant<std::monostate, bool, std::int64_t, double,
                               std::string, Bytes, TensorImpl, List, Dict,
                               Opaque>;
  Payload payload_{};
};

const char* kind_name(Value::Kind k) noexcept;

inline Dict::Dict(std::initializer_list<Item> items) {
  for (const auto& it : items) insert_or_assign(it.first, it.second);
}

inline const Value* Dict::find(const std::string& key) const noexcept {
  for (const auto& it : items_) {
    if (it.first == key) return &it.second;
  }
  return nullptr;
}

inline Value* Dict::find(const std::string& key) noexcept {
  for (auto& it : items_) {
    if (it.first == key) return &it.second;
  }
  return nullptr;
}

inline void Dict::insert_or_assign(std::string key, Value v) {
  if (Value* slot = find(key)) {
    *slot = std::move(v);
    return;
  }
  items_.emplace_back(std::move(key), std::move(v));
}

inline std::size_t Dict::size() const noexcept { return items_.size(); }
inline bool Dict::empty() const noexcept { return items_.empty(); }
inline Dict::const_iterator Dict::begin() const noexcept { return items_.begin(); }
inline Dict::const_iterator Dict::end() const noexcept { return items_.end(); }

} // namespace core
} // namespace gcap
