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
///
/// Macros for defining command line flags together with a validation
/// function. They can only be used in tandem with gflags.
///
/// gflags has no notion of a DoubleInt, so such flags are stored as int64 and
/// rejected by gflags whenever the new value falls outside the double-int
/// range:
///
/// @code
/// DEFINE_VALIDATED_double_int(batch_size, 1000, "Items per batch, exported to JSON clients");
///
/// auto const batch_size = doubleint::utils::GetDoubleIntFlag(FLAGS_batch_size);
/// @endcode
///
/// Other int64 flags can carry an arbitrary validation body. The `value` is
/// implicitly bound to the new value of the flag and the name of the flag is
/// bound to `flagname`:
///
/// @code
/// DEFINE_VALIDATED_int64(my_flag, 2, "My flag, which needs to be in [1, 10]",
///                        FLAG_IN_RANGE(1, 10));
/// @endcode

#pragma once

#include <cstdint>
#include <string>

#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

#include "utils/double_int.hpp"

/// Macro which defines a flag of given type and registers a validator function.
/// The function is generated from the `validation_body` and `cpp_type` is used
/// as the type of the implicitly bound `value`.
#define DEFINE_VALIDATED_FLAG(flag_type, flag_name, default_value, description, cpp_type, validation_body) \
  DEFINE_##flag_type(flag_name, default_value, description);                                               \
  namespace {                                                                                              \
  bool validate_##flag_name(const char *flagname, cpp_type value) validation_body                          \
  }                                                                                                        \
  DEFINE_validator(flag_name, &validate_##flag_name)

/// Define an integer command line flag with validation.
#define DEFINE_VALIDATED_int64(flag_name, default_value, description, validation_body) \
  DEFINE_VALIDATED_FLAG(int64, flag_name, default_value, description, std::int64_t, validation_body)

/// General flag validator for numeric flag values inside a range (inclusive).
///
/// This should only be used with DEFINE_VALIDATED_* macros.
#define FLAG_IN_RANGE(lower_bound, upper_bound)                                                            \
  {                                                                                                        \
    if (value >= lower_bound && value <= upper_bound) return true;                                         \
    spdlog::error("Expected --{} to be in range [{}, {}], got {}", flagname, lower_bound, upper_bound, value); \
    return false;                                                                                          \
  }

/// Define an int64 command line flag which only accepts double-int values.
///
/// @sa GetDoubleIntFlag
#define DEFINE_VALIDATED_double_int(flag_name, default_value, description) \
  DEFINE_VALIDATED_int64(flag_name, default_value, description,            \
                         { return ::doubleint::utils::ValidateDoubleIntFlag(flagname, value); })

namespace doubleint::utils {

/// Validator for flags defined with DEFINE_VALIDATED_double_int. Logs the
/// reason and returns false when `value` is out of range.
bool ValidateDoubleIntFlag(const char *flagname, std::int64_t value);

/// Converts the value of a flag defined with DEFINE_VALIDATED_double_int.
/// The validator only guards values set through gflags. A default value or a
/// direct assignment to `FLAGS_<name>` skips it, so the range is checked
/// again here.
///
/// @throw DoubleIntOutOfRangeException if the value is outside the range.
DoubleInt GetDoubleIntFlag(std::int64_t value);

}  // namespace doubleint::utils
