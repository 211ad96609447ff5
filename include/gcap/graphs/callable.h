// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "gcap/core/value.h"

namespace gcap {
namespace graphs {

using Args = gcap::core::List;
using Kwargs = gcap::core::Dict;

// A computation invoked with positional and keyword arguments.
class Callable {
 public:
  virtual ~Callable() = default;

  virtual gcap::core::Value operator()(const Args& args, const Kwargs& kwargs) = 0;

  // Training/inference mode for model-like callables; nullopt when the
  // callable has no such notion.
  virtual std::optional<bool> training() const { return std::nullopt; }

  // Used in log lines.
  virtual std::string name() const { return "callable"; }
};

using CallablePtr = std::shared_ptr<Callable>;
using Function = std::function<gcap::core::Value(const Args&, const Kwargs&)>;

namespace detail {
class FunctionCallable final : public Callable {
 public:
  FunctionCallable(Function fn, std::string name, std::optional<bool> training)
      : fn_(std::move(fn)), name_(std::move(name)), training_(training) {}

  gcap::core::Value operator()(const Args& args, const Kwargs& kwargs) override {
    return fn_(args, kwargs);
  }
  std::optional<bool> training() const override { return training_; }
  std::string name() const override { return name_; }

 private:
  Function fn_;
  std::string name_;
  std::optional<bool> training_;
};
} // namespace detail

inline CallablePtr make_function(Function fn, std::string name = "function",
                                 std::optional<bool> training = std::nullopt) {
  return std::make_shared<detail::FunctionCallable>(std::move(fn), std::move(name), training);
}

} // namespace graphs
} // namespace gcap
