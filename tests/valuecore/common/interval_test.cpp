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
#include <string>
#include <vector>

#include "harness.h"

#include "common/DateTimeUtils.h"
#include "common/IntervalUtils.h"
#include "common/Value.hpp"
#include "common/ValueExceptions.h"
#include "common/ValueFactory.hpp"

using namespace valuecore;

static const char* const BAD_DATETIME = SQLException::data_exception_invalid_datetime_format;

class IntervalTest : public Test {
};

TEST_F(IntervalTest, IntegerToSingleField) {
    Value months = ValueFactory::getIntegerValue(25).convertTo(ValueType::tINTERVAL_MONTH);
    EXPECT_TRUE(months.getValueType() == ValueType::tINTERVAL_MONTH);
    EXPECT_FALSE(months.isIntervalNegative());
    EXPECT_EQ(25, months.getIntervalLeading());
    EXPECT_EQ("INTERVAL '25' MONTH", months.getString());

    Value negative = ValueFactory::getIntegerValue(-25).convertTo(ValueType::tINTERVAL_MONTH);
    EXPECT_TRUE(negative.isIntervalNegative());
    EXPECT_EQ(25, negative.getIntervalLeading());
    EXPECT_EQ("INTERVAL '-25' MONTH", negative.getString());
    EXPECT_EQ("INTERVAL '-25' MONTH", negative.getTraceSQL());
    EXPECT_EQ(-1, negative.getSignum());
    EXPECT_EQ(-25, negative.asInt());
}

TEST_F(IntervalTest, FractionalNumbers) {
    Value yearToMonth = ValueFactory::getDecimalValueFromString("1.5").convertTo(ValueType::tINTERVAL_YEAR_TO_MONTH);
    EXPECT_EQ(1, yearToMonth.getIntervalLeading());
    EXPECT_EQ(6, yearToMonth.getIntervalRemaining());
    EXPECT_EQ("INTERVAL '1-6' YEAR TO MONTH", yearToMonth.getString());

    Value seconds = ValueFactory::getDecimalValueFromString("1.5").convertTo(ValueType::tINTERVAL_SECOND);
    EXPECT_EQ(1, seconds.getIntervalLeading());
    EXPECT_EQ(500000000, seconds.getIntervalRemaining());
    EXPECT_EQ("INTERVAL '1.5' SECOND", seconds.getString());

    Value dayToHour = ValueFactory::getDoubleValue(-1.5).convertTo(ValueType::tINTERVAL_DAY_TO_HOUR);
    EXPECT_EQ("INTERVAL '-1 12' DAY TO HOUR", dayToHour.getString());

    // a single field qualifier rounds to whole units
    Value years = ValueFactory::getDoubleValue(2.5).convertTo(ValueType::tINTERVAL_YEAR);
    EXPECT_EQ("INTERVAL '3' YEAR", years.getString());

    Value nanos = ValueFactory::getDoubleValue(1.5e-9).convertTo(ValueType::tINTERVAL_SECOND);
    EXPECT_EQ(0, nanos.getIntervalLeading());
    EXPECT_EQ(2, nanos.getIntervalRemaining());
    Value tiny = ValueFactory::getDoubleValue(1.5e-300).convertTo(ValueType::tINTERVAL_SECOND);
    EXPECT_EQ(0, tiny.getSignum());
    EXPECT_EQ(0, ValueFactory::getRealValue(1e-30f).convertTo(ValueType::tINTERVAL_MINUTE_TO_SECOND).getSignum());
}

TEST_F(IntervalTest, IntervalToNumbers) {
    Value yearToMonth = ValueFactory::getIntervalValue(ValueType::tINTERVAL_YEAR_TO_MONTH, false, 1, 6);
    EXPECT_EQ("1.5", yearToMonth.asDecimal().toString());
    EXPECT_EQ(1.5, yearToMonth.asDouble());
    EXPECT_EQ(1, yearToMonth.asLong());

    Value dayToHour = ValueFactory::getIntervalValue(ValueType::tINTERVAL_DAY_TO_HOUR, true, 2, 6);
    EXPECT_EQ("-2.25", dayToHour.asDecimal().toString());
    EXPECT_EQ(-2, dayToHour.asInt());

    Value seconds = ValueFactory::getIntervalValue(ValueType::tINTERVAL_SECOND, false, 3, 250000000);
    EXPECT_EQ("3.25", seconds.asDecimal().toString());
    EXPECT_EQ(3.25f, seconds.asFloat());
}

TEST_F(IntervalTest, CharacterToInterval) {
    Value daySecond = ValueFactory::getStringValue("1 02:03:04.5").convertTo(ValueType::tINTERVAL_DAY_TO_SECOND);
    EXPECT_EQ(1, daySecond.getIntervalLeading());
    EXPECT_EQ(2 * NANOS_PER_HOUR + 3 * NANOS_PER_MINUTE + 4 * NANOS_PER_SECOND + 500000000,
              daySecond.getIntervalRemaining());
    EXPECT_EQ("INTERVAL '1 02:03:04.5' DAY TO SECOND", daySecond.getString());

    Value negative = ValueFactory::getStringValue("-1-6").convertTo(ValueType::tINTERVAL_YEAR_TO_MONTH);
    EXPECT_EQ("INTERVAL '-1-6' YEAR TO MONTH", negative.getString());

    // a complete literal of the same family is rescaled to the target
    Value minutes = ValueFactory::getStringValue("interval '2' hour").convertTo(ValueType::tINTERVAL_MINUTE);
    EXPECT_EQ("INTERVAL '120' MINUTE", minutes.getString());
    Value negated = ValueFactory::getStringValue("INTERVAL -'3' DAY").convertTo(ValueType::tINTERVAL_HOUR);
    EXPECT_EQ("INTERVAL '-72' HOUR", negated.getString());

    // text of an interval reads back as the same interval
    EXPECT_TRUE(daySecond.convertTo(ValueType::tVARCHAR).convertTo(ValueType::tINTERVAL_DAY_TO_SECOND) == daySecond);
}

TEST_F(IntervalTest, MalformedIntervalText) {
    ASSERT_SQL_EXCEPTION(InvalidIntervalLiteralException, BAD_DATETIME,
                         ValueFactory::getStringValue("abc").convertTo(ValueType::tINTERVAL_DAY));
    ASSERT_SQL_EXCEPTION(InvalidIntervalLiteralException, BAD_DATETIME,
                         ValueFactory::getStringValue("1-12").convertTo(ValueType::tINTERVAL_YEAR_TO_MONTH));
    ASSERT_SQL_EXCEPTION(InvalidIntervalLiteralException, BAD_DATETIME,
                         ValueFactory::getStringValue("1 25").convertTo(ValueType::tINTERVAL_DAY_TO_HOUR));
    ASSERT_SQL_EXCEPTION(InvalidIntervalLiteralException, BAD_DATETIME,
                         ValueFactory::getStringValue("INTERVAL '2' YEAR").convertTo(ValueType::tINTERVAL_DAY));
    try {
        ValueFactory::getStringValue("abc").convertTo(ValueType::tINTERVAL_DAY_TO_MINUTE);
        FAIL("expected InvalidIntervalLiteralException");
    } catch (InvalidIntervalLiteralException& e) {
        EXPECT_NE(std::string::npos, e.message().find("INTERVAL DAY TO MINUTE"));
        EXPECT_NE(std::string::npos, e.message().find("abc"));
    }
}

TEST_F(IntervalTest, BetweenQualifiers) {
    Value years = ValueFactory::getIntervalValue(ValueType::tINTERVAL_YEAR, false, 2, 0);
    EXPECT_EQ("INTERVAL '24' MONTH", years.convertTo(ValueType::tINTERVAL_MONTH).getString());

    Value months = ValueFactory::getIntervalValue(ValueType::tINTERVAL_MONTH, false, 25, 0);
    EXPECT_EQ("INTERVAL '2' YEAR", months.convertTo(ValueType::tINTERVAL_YEAR).getString());
    EXPECT_EQ("INTERVAL '2-1' YEAR TO MONTH", months.convertTo(ValueType::tINTERVAL_YEAR_TO_MONTH).getString());

    Value hours = ValueFactory::getIntervalValue(ValueType::tINTERVAL_HOUR, true, 30, 0);
    EXPECT_EQ("INTERVAL '-1 06' DAY TO HOUR", hours.convertTo(ValueType::tINTERVAL_DAY_TO_HOUR).getString());
    EXPECT_EQ("INTERVAL '-30:00:00' HOUR TO SECOND",
              hours.convertTo(ValueType::tINTERVAL_HOUR_TO_SECOND).getString());

    ASSERT_THROWS(DataConversionException, years.convertTo(ValueType::tINTERVAL_DAY));
    ASSERT_THROWS(DataConversionException, hours.convertTo(ValueType::tINTERVAL_MONTH));
    ASSERT_THROWS(InvalidDatetimeLiteralException, years.convertTo(ValueType::tDATE));
}

TEST_F(IntervalTest, FieldLimits) {
    ASSERT_SQL_EXCEPTION(NumericOverflowException, SQLException::data_exception_numeric_value_out_of_range,
                         ValueFactory::getBigIntValue(std::numeric_limits<int64_t>::min())
                         .convertTo(ValueType::tINTERVAL_SECOND));
    ASSERT_SQL_EXCEPTION(NumericOverflowException, SQLException::data_exception_numeric_value_out_of_range,
                         ValueFactory::getBigIntValue(interval::MAX_LEADING_FIELD + 1)
                         .convertTo(ValueType::tINTERVAL_DAY));
    EXPECT_EQ(interval::MAX_LEADING_FIELD, ValueFactory::getBigIntValue(interval::MAX_LEADING_FIELD)
              .convertTo(ValueType::tINTERVAL_DAY).getIntervalLeading());
    ASSERT_THROWS(DataConversionException,
                  ValueFactory::getIntervalValue(ValueType::tINTERVAL_YEAR_TO_MONTH, false, 1, 12));
    ASSERT_THROWS(DataConversionException,
                  ValueFactory::getIntervalValue(ValueType::tINTERVAL_MONTH, false, 1, 1));

    std::vector<Value> tooLarge;
    tooLarge.push_back(ValueFactory::getDoubleValue(1e19));
    tooLarge.push_back(ValueFactory::getDecimalValueFromString("-1E19"));
    tooLarge.push_back(ValueFactory::getBigIntValue(interval::MAX_LEADING_FIELD + 1));
    for (size_t i = 0; i < tooLarge.size(); i++) {
        try {
            tooLarge[i].convertTo(ValueType::tINTERVAL_DAY, NULL, NULL, "DURATION");
            FAIL("expected NumericOverflowException");
        } catch (NumericOverflowException& e) {
            EXPECT_EQ("DURATION", e.column());
        }
    }
    try {
        ValueFactory::getDecimalValueFromString("1E20").convertTo(ValueType::tINTERVAL_SECOND, NULL, NULL, "DURATION");
        FAIL("expected NumericOverflowException");
    } catch (NumericOverflowException& e) {
        EXPECT_EQ("DURATION", e.column());
    }
    try {
        ValueFactory::getIntervalValue(ValueType::tINTERVAL_DAY, false, interval::MAX_LEADING_FIELD, 0)
                .convertTo(ValueType::tINTERVAL_HOUR, NULL, NULL, "DURATION");
        FAIL("expected NumericOverflowException");
    } catch (NumericOverflowException& e) {
        EXPECT_EQ("DURATION", e.column());
    }

    Value zero = ValueFactory::getIntervalValue(ValueType::tINTERVAL_MONTH, true, 0, 0);
    EXPECT_FALSE(zero.isIntervalNegative());
    EXPECT_EQ(0, zero.getSignum());
    EXPECT_EQ("INTERVAL '0' MONTH", zero.getString());
}

int main() {
    return TestSuite::globalInstance()->runAll();
}
