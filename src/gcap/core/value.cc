// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "gcap/core/value.h"

#include <cstdint>
#include <cstring>
#include <string>

#include "gcap/core/error.h"

namespace gcap {
namespace core {

namespace {

[[noreturn]] void throw_kind_mismatch(Value::Kind expected, Value::Kind actual) {
  throw UsageError(std::string("Value: expected ") + kind_name(expected) +
                   ", got " + kind_name(actual));
}

template <typename T, typename P>
const T& get_or_throw(const P& payload, Value::Kind expected) {
  if (const T* p = std::get_if<T>(&payload)) return *p;
  throw_kind_mismatch(expected, static_cast<Value::Kind>(payload.index()));
}

template <typename T, typename P>
T& get_or_throw(P& payload, Value::Kind expected) {
  if (T* p = std::get_if<T>(&payload)) return *p;
  throw_kind_mismatch(expected, static_cast<Value::Kind>(payload.index()));
}

bool dict_equal(const Dict& a, const Dict& b) {
  if (a.size() != b.size()) return false;
  for (const auto& item : a) {
    const Value* other = b.find(item.first);
    if (!other || !(item.second == *other)) return false;
  }
  return true;
}

bool same_bits(double x, double y) noexcept {
  std::uint64_t bx = 0;
  std::uint64_t by = 0;
  std::memcpy(&bx, &x, sizeof(x));
  std::memcpy(&by, &y, sizeof(y));
  return bx == by;
}

} // anonymous

const char* kind_name(Value::Kind k) noexcept {
  switch (k) {
    case Value::Kind::None:   return "None";
    case Value::Kind::Bool:   return "Bool";
    case Value::Kind::Int:    return "Int";
    case Value::Kind::Double: return "Double";
    case Value::Kind::String: return "String";
    case Value::Kind::Bytes:  return "Bytes";
    case Value::Kind::Tensor: return "Tensor";
    case Value::Kind::List:   return "List";
    case Value::Kind::Dict:   return "Dict";
    case Value::Kind::Opaque: return "Opaque";
  }
  return "Unknown";
}

bool Value::to_bool() const { return get_or_throw<bool>(payload_, Kind::Bool); }
std::int64_t Value::to_int() const { return get_or_throw<std::int64_t>(payload_, Kind::Int); }
double Value::to_double() const { return get_or_throw<double>(payload_, Kind::Double); }
const std::string& Value::to_str() const { return get_or_throw<std::string>(payload_, Kind::String); }
const Bytes& Value::to_bytes() const { return get_or_throw<Bytes>(payload_, Kind::Bytes); }
const TensorImpl& Value::to_tensor() const { return get_or_throw<TensorImpl>(payload_, Kind::Tensor); }
const List& Value::to_list() const { return get_or_throw<List>(payload_, Kind::List); }
List& Value::to_list() { return get_or_throw<List>(payload_, Kind::List); }
const Dict& Value::to_dict() const { return get_or_throw<Dict>(payload_, Kind::Dict); }
Dict& Value::to_dict() { return get_or_throw<Dict>(payload_, Kind::Dict); }
const Opaque& Value::to_opaque() const { return get_or_throw<Opaque>(payload_, Kind::Opaque); }

bool operator==(const Value& a, const Value& b) {
  if (a.kind() != b.kind()) return false;
  switch (a.kind()) {
    case Value::Kind::None:   return true;
    case Value::Kind::Bool:   return a.to_bool() == b.to_bool();
    case Value::Kind::Int:    return a.to_int() == b.to_int();
    case Value::Kind::Double: return same_bits(a.to_double(), b.to_double());
    case Value::Kind::String: return a.to_str() == b.to_str();
    case Value::Kind::Bytes:  return a.to_bytes() == b.to_bytes();
    case Value::Kind::Tensor: return a.to_tensor().is_same(b.to_tensor());
    case Value::Kind::List:   return a.to_list() == b.to_list();
    case Value::Kind::Dict:   return dict_equal(a.to_dict(), b.to_dict());
    case Value::Kind::Opaque: return a.to_opaque().handle.get() == b.to_opaque().handle.get();
  }
  return false;
}

} // namespace core
} // namespace gcap
