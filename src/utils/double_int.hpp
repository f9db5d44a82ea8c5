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

/// @file
/// Integer type restricted to the values an IEEE 754 double can hold exactly.
///
/// This is the `format: double-int` of the OpenAPI format registry. Use it as
/// a field type wherever an integer has to survive a trip through a
/// double-only representation (JSON consumers, JavaScript, ...). In JSON the
/// type is indistinguishable from a plain integer:
///
/// @code
/// struct Config {
///   utils::DoubleInt count;
/// };
/// NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Config, count);
///
/// auto config = nlohmann::json::parse(R"({"count": 42})").get<Config>();
/// // config.count == 42
///
/// // 2^55, accepted by an int64_t but not by a DoubleInt
/// nlohmann::json::parse(R"({"count": 36028797018963968})").get<Config>();  // throws
/// @endcode
#pragma once

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/format.h>
#include <fmt/ostream.h>
// NOLINTNEXTLINE
#include <nlohmann/json_fwd.hpp>

#include "utils/exceptions.hpp"

namespace doubleint::utils {

/// Character types are integral too, but 'a' is not a number.
template <typename T>
concept CharacterType =
    std::same_as<std::remove_cv_t<T>, char> || std::same_as<std::remove_cv_t<T>, wchar_t> ||
    std::same_as<std::remove_cv_t<T>, char8_t> || std::same_as<std::remove_cv_t<T>, char16_t> ||
    std::same_as<std::remove_cv_t<T>, char32_t>;

template <typename T>
concept ComparableInteger = std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool> && !CharacterType<T>;

/// Integral types whose whole range fits into a DoubleInt.
template <typename T>
concept NarrowInteger = ComparableInteger<T> && sizeof(T) <= sizeof(std::int32_t);

/// Integral types which need a range check before becoming a DoubleInt.
template <typename T>
concept WideInteger = ComparableInteger<T> && sizeof(T) == sizeof(std::int64_t);

/// Describes a value which is not representable as a DoubleInt.
struct OutOfRangeError {
  /// The rejected value.
  std::int64_t value;
  /// Magnitude limit, the allowed range is [-bound, bound].
  std::int64_t bound;

  std::string Message() const;

  friend bool operator==(const OutOfRangeError &, const OutOfRangeError &) = default;
};

std::ostream &operator<<(std::ostream &os, const OutOfRangeError &error);

std::string FormatOutOfRange(std::int64_t value);
std::string FormatOutOfRange(std::uint64_t value);

class DoubleInt {
 public:
  /// 2^53, the largest magnitude for which every integer is a distinct double.
  static constexpr std::int64_t kBound = std::int64_t{1} << 53;
  static constexpr std::int64_t kMin = -kBound;
  static constexpr std::int64_t kMax = kBound;

  constexpr DoubleInt() = default;

  /// Every 8, 16 and 32 bit integer is in range, so no check is needed.
  template <NarrowInteger T>
  constexpr DoubleInt(T value) noexcept : value_(value) {}  // NOLINT(google-explicit-constructor)

  /// Checked conversion from a 64 bit integer.
  ///
  /// @throw DoubleIntOutOfRangeException if the value is outside [kMin, kMax].
  template <WideInteger T>
  explicit DoubleInt(T value);

  /// Returns true if `value` lies in [kMin, kMax].
  template <ComparableInteger T>
  static constexpr bool IsInRange(T value) noexcept {
    return std::cmp_greater_equal(value, kMin) && std::cmp_less_equal(value, kMax);
  }

  /// Validating constructor, the non-throwing counterpart of the explicit
  /// constructor.
  static constexpr std::expected<DoubleInt, OutOfRangeError> TryNew(std::int64_t value) noexcept {
    if (!IsInRange(value)) [[unlikely]] {
      return std::unexpected{OutOfRangeError{.value = value, .bound = kBound}};
    }
    return NewUnchecked(value);
  }

  /// Wraps `value` without checking it. Only for call sites which already
  /// know the value is in range. An out of range `value` produces an instance
  /// breaking the DoubleInt invariant; nothing will catch that later on.
  static constexpr DoubleInt NewUnchecked(std::int64_t value) noexcept {
    DoubleInt result;
    result.value_ = value;
    return result;
  }

  constexpr std::int64_t value() const noexcept { return value_; }

  /// Exact for every valid instance.
  constexpr double ToDouble() const noexcept { return static_cast<double>(value_); }

  explicit constexpr operator double() const noexcept { return ToDouble(); }

  friend constexpr bool operator==(const DoubleInt &, const DoubleInt &) = default;
  friend constexpr auto operator<=>(const DoubleInt &, const DoubleInt &) = default;

  // Comparisons against plain integers follow the mathematical values, so a
  // negative DoubleInt is always smaller than any unsigned number.
  template <ComparableInteger T>
  friend constexpr bool operator==(const DoubleInt &lhs, T rhs) noexcept {
    return std::cmp_equal(lhs.value_, rhs);
  }

  template <ComparableInteger T>
  friend constexpr std::strong_ordering operator<=>(const DoubleInt &lhs, T rhs) noexcept {
    if (std::cmp_less(lhs.value_, rhs)) return std::strong_ordering::less;
    if (std::cmp_greater(lhs.value_, rhs)) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
  }

  friend void to_json(nlohmann::json &data, const DoubleInt &value);
  friend void from_json(const nlohmann::json &data, DoubleInt &value);

 private:
  std::int64_t value_{0};
};

static_assert(sizeof(DoubleInt) == sizeof(std::int64_t));
static_assert(std::is_trivially_copyable_v<DoubleInt>);
static_assert(static_cast<std::int64_t>(static_cast<double>(DoubleInt::kMax)) == DoubleInt::kMax);
static_assert(static_cast<std::int64_t>(static_cast<double>(DoubleInt::kMin)) == DoubleInt::kMin);

std::ostream &operator<<(std::ostream &os, const DoubleInt &value);

/// Thrown by the checked DoubleInt constructor.
class DoubleIntOutOfRangeException final : public BasicException {
 public:
  using BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(DoubleIntOutOfRangeException)
};

template <WideInteger T>
DoubleInt::DoubleInt(T value) {
  if (!IsInRange(value)) [[unlikely]] {
    if constexpr (std::is_signed_v<T>) {
      throw DoubleIntOutOfRangeException(FormatOutOfRange(static_cast<std::int64_t>(value)));
    } else {
      throw DoubleIntOutOfRangeException(FormatOutOfRange(static_cast<std::uint64_t>(value)));
    }
  }
  value_ = static_cast<std::int64_t>(value);
}

}  // namespace doubleint::utils

template <>
class fmt::formatter<doubleint::utils::DoubleInt> : public fmt::ostream_formatter {};

template <>
class fmt::formatter<doubleint::utils::OutOfRangeError> : public fmt::ostream_formatter {};

namespace std {

template <>
struct hash<doubleint::utils::DoubleInt> {
  size_t operator()(const doubleint::utils::DoubleInt &value) const noexcept {
    return std::hash<std::int64_t>{}(value.value());
  }
};

}  // namespace std
