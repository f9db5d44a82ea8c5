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

#include "utils/flag_validation.hpp"

namespace doubleint::utils {

bool ValidateDoubleIntFlag(const char *flagname, std::int64_t value) {
  auto const maybe_value = DoubleInt::TryNew(value);
  if (!maybe_value) {
    spdlog::error("Invalid value for --{}: {}", flagname, maybe_value.error());
    return false;
  }
  return true;
}

DoubleInt GetDoubleIntFlag(std::int64_t value) { return DoubleInt{value}; }

}  // namespace doubleint::utils
