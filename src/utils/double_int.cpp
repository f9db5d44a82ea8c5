// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "utils/double_int.hpp"

#include <cmath>
#include <ostream>

#include <nlohmann/json.hpp>

namespace doubleint::utils {

namespace {
constexpr int kJsonNumberOverflowId = 406;
constexpr int kJsonIncompatibleTypeId = 302;

// Every double above 2^53 in magnitude holds an integral value, the parser
// also produces one for integer literals beyond UINT64_MAX.
bool IsIntegralBeyondBound(double value) {
  return std::isfinite(value) && std::fabs(value) > static_cast<double>(DoubleInt::kBound);
}
}  // namespace

std::string FormatOutOfRange(std::int64_t value) {
  return fmt::format("Value {} is out of the double-int range [{}, {}] (|value| <= 2^53)", value, DoubleInt::kMin,
                     DoubleInt::kMax);
}

std::string FormatOutOfRange(std::uint64_t value) {
  return fmt::format("Value {} is out of the double-int range [{}, {}] (|value| <= 2^53)", value, DoubleInt::kMin,
                     DoubleInt::kMax);
}

std::string OutOfRangeError::Message() const { return FormatOutOfRange(value); }

std::ostream &operator<<(std::ostream &os, const OutOfRangeError &error) { return os << error.Message(); }

std::ostream &operator<<(std::ostream &os, const DoubleInt &value) { return os << value.value(); }

void to_json(nlohmann::json &data, const DoubleInt &value) { data = value.value_; }

void from_json(const nlohmann::json &data, DoubleInt &value) {
  // Non-negative literals are stored as unsigned by the parser, which is also
  // the only way to see values above INT64_MAX.
  if (data.is_number_unsigned()) {
    const auto raw = data.get<std::uint64_t>();
    if (!DoubleInt::IsInRange(raw)) {
      throw nlohmann::json::out_of_range::create(kJsonNumberOverflowId, FormatOutOfRange(raw), &data);
    }
    value = DoubleInt::NewUnchecked(static_cast<std::int64_t>(raw));
    return;
  }

  if (data.is_number_integer()) {
    auto maybe_value = DoubleInt::TryNew(data.get<std::int64_t>());
    if (!maybe_value) {
      throw nlohmann::json::out_of_range::create(kJsonNumberOverflowId, maybe_value.error().Message(), &data);
    }
    value = *maybe_value;
    return;
  }

  if (data.is_number_float()) {
    const auto raw = data.get<double>();
    if (IsIntegralBeyondBound(raw)) {
      throw nlohmann::json::out_of_range::create(
          kJsonNumberOverflowId,
          fmt::format("Value {} is out of the double-int range [{}, {}] (|value| <= 2^53)", raw, DoubleInt::kMin,
                      DoubleInt::kMax),
          &data);
    }
  }

  // Other floats are rejected even when integral (42.0), get<int64_t>() would
  // truncate them silently.
  throw nlohmann::json::type_error::create(
      kJsonIncompatibleTypeId, fmt::format("type must be an integer number, but is {}", data.type_name()), &data);
}

}  // namespace doubleint::utils
