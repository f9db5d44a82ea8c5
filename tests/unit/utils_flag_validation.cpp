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

#include <cstdint>
#include <limits>
#include <string>

#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "utils/flag_validation.hpp"

// NOLINTNEXTLINE
DEFINE_VALIDATED_double_int(test_double_int_flag, 42, "Double-int flag used by the unit tests.");
// NOLINTNEXTLINE
DEFINE_VALIDATED_int64(test_ranged_flag, 5, "Flag in [1, 10] used by the unit tests.", FLAG_IN_RANGE(1, 10));

using doubleint::utils::DoubleInt;

class DoubleIntFlagTest : public ::testing::Test {
 protected:
  void TearDown() override {
    FLAGS_test_double_int_flag = 42;
    FLAGS_test_ranged_flag = 5;
  }
};

TEST_F(DoubleIntFlagTest, DefaultValue) {
  EXPECT_EQ(doubleint::utils::GetDoubleIntFlag(FLAGS_test_double_int_flag), 42);
}

TEST_F(DoubleIntFlagTest, AcceptsBounds) {
  EXPECT_FALSE(gflags::SetCommandLineOption("test_double_int_flag", "9007199254740992").empty());
  EXPECT_EQ(doubleint::utils::GetDoubleIntFlag(FLAGS_test_double_int_flag), DoubleInt::kMax);

  EXPECT_FALSE(gflags::SetCommandLineOption("test_double_int_flag", "-9007199254740992").empty());
  EXPECT_EQ(doubleint::utils::GetDoubleIntFlag(FLAGS_test_double_int_flag), DoubleInt::kMin);
}

TEST_F(DoubleIntFlagTest, RejectsOutOfRange) {
  // gflags returns an empty string when the validator refuses the value.
  EXPECT_TRUE(gflags::SetCommandLineOption("test_double_int_flag", "9007199254740993").empty());
  EXPECT_EQ(FLAGS_test_double_int_flag, 42);

  EXPECT_TRUE(gflags::SetCommandLineOption("test_double_int_flag", "-36028797018963968").empty());
  EXPECT_EQ(FLAGS_test_double_int_flag, 42);
}

TEST_F(DoubleIntFlagTest, Validator) {
  EXPECT_TRUE(doubleint::utils::ValidateDoubleIntFlag("flag", 0));
  EXPECT_TRUE(doubleint::utils::ValidateDoubleIntFlag("flag", DoubleInt::kMax));
  EXPECT_FALSE(doubleint::utils::ValidateDoubleIntFlag("flag", DoubleInt::kMax + 1));
  EXPECT_FALSE(doubleint::utils::ValidateDoubleIntFlag("flag", DoubleInt::kMin - 1));
}

TEST_F(DoubleIntFlagTest, RangedFlag) {
  EXPECT_FALSE(gflags::SetCommandLineOption("test_ranged_flag", "10").empty());
  EXPECT_EQ(FLAGS_test_ranged_flag, 10);
  EXPECT_TRUE(gflags::SetCommandLineOption("test_ranged_flag", "11").empty());
  EXPECT_EQ(FLAGS_test_ranged_flag, 10);
}

TEST_F(DoubleIntFlagTest, AssignmentBypassingValidatorThrows) {
  // Direct assignments never reach the gflags validator.
  FLAGS_test_double_int_flag = DoubleInt::kMax + 1;
  EXPECT_THROW(doubleint::utils::GetDoubleIntFlag(FLAGS_test_double_int_flag),
               doubleint::utils::DoubleIntOutOfRangeException);

  FLAGS_test_double_int_flag = std::numeric_limits<std::int64_t>::min();
  EXPECT_THROW(doubleint::utils::GetDoubleIntFlag(FLAGS_test_double_int_flag),
               doubleint::utils::DoubleIntOutOfRangeException);
}
