/* This file is part of ValueCore.
 * Copyright (C) 2008-2022 Volt Active Data Inc.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with ValueCore.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <limits>

#include "harness.h"

#include "common/NumericGuard.h"

using namespace valuecore;

class NumericGuardTest : public Test {
};

TEST_F(NumericGuardTest, NarrowWithinRange) {
    EXPECT_EQ(127, narrowTo<int8_t>(127));
    EXPECT_EQ(-128, narrowTo<int8_t>(-128));
    EXPECT_EQ(32767, narrowTo<int16_t>(32767));
    EXPECT_EQ(-2147483648LL, narrowTo<int32_t>(-2147483648LL));
}

TEST_F(NumericGuardTest, NarrowOutOfRange) {
    ASSERT_SQL_EXCEPTION(NumericOverflowException, SQLException::data_exception_numeric_value_out_of_range,
                         narrowTo<int8_t>(128));
    ASSERT_SQL_EXCEPTION(NumericOverflowException, SQLException::data_exception_numeric_value_out_of_range,
                         narrowTo<int16_t>(-32769));
    ASSERT_SQL_EXCEPTION(NumericOverflowException, SQLException::data_exception_numeric_value_out_of_range,
                         narrowTo<int32_t>(2147483648LL));
}

TEST_F(NumericGuardTest, FailureNamesValueAndColumn) {
    try {
        narrowTo<int8_t>(128, "AGE");
        FAIL("expected NumericOverflowException");
    } catch (NumericOverflowException& e) {
        EXPECT_EQ("128", e.valueText());
        EXPECT_EQ(SQLException::TYPE_OVERFLOW, e.getInternalFlags());
        EXPECT_NE(std::string::npos, e.message().find("\"128\""));
        EXPECT_NE(std::string::npos, e.message().find("AGE"));
    }
    try {
        narrowTo<int8_t>(-129);
        FAIL("expected NumericOverflowException");
    } catch (NumericOverflowException& e) {
        EXPECT_EQ(SQLException::TYPE_UNDERFLOW, e.getInternalFlags());
    }
}

TEST_F(NumericGuardTest, RoundDoubleToLong) {
    EXPECT_EQ(3, roundToLong(2.5));
    EXPECT_EQ(-3, roundToLong(-2.5));
    EXPECT_EQ(2, roundToLong(2.4999));
    EXPECT_EQ(0, roundToLong(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_EQ(-9223372036854775807LL - 1, roundToLong(-9223372036854775808.0));
    ASSERT_THROWS(NumericOverflowException, roundToLong(9223372036854775808.0));
    ASSERT_THROWS(NumericOverflowException, roundToLong(std::numeric_limits<double>::infinity()));
    ASSERT_THROWS(NumericOverflowException, roundToLong(-1e19));
}

TEST_F(NumericGuardTest, RoundDecimalToLong) {
    EXPECT_EQ(3, roundToLong(Decimal::parse("2.5")));
    EXPECT_EQ(-3, roundToLong(Decimal::parse("-2.5")));
    EXPECT_EQ(9223372036854775807LL, roundToLong(Decimal::parse("9223372036854775807")));
    ASSERT_THROWS(NumericOverflowException, roundToLong(Decimal::parse("9223372036854775807.4")));
    ASSERT_THROWS(NumericOverflowException, roundToLong(Decimal::parse("-9223372036854775809")));
}

int main() {
    return TestSuite::globalInstance()->runAll();
}
