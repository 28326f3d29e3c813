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
#include "common/ExtTypeInfo.h"
#include "common/Value.hpp"
#include "common/ValueExceptions.h"
#include "common/ValueFactory.hpp"

using namespace valuecore;

static std::vector<std::string> labels(const char* a, const char* b, const char* c = NULL) {
    std::vector<std::string> result;
    result.push_back(a);
    result.push_back(b);
    if (c != NULL) {
        result.push_back(c);
    }
    return result;
}

class ValueCompareTest : public Test {
};

TEST_F(ValueCompareTest, NullSortsFirst) {
    Value null = ValueFactory::getNullValue();
    Value one = ValueFactory::getIntegerValue(1);
    EXPECT_EQ(-1, null.compareTo(one));
    EXPECT_EQ(1, one.compareTo(null));
    EXPECT_EQ(0, null.compareTo(ValueFactory::getNullValue()));
    EXPECT_EQ(Value::VALUE_COMPARE_NO_ORDER, null.compareWithNull(one, true));
    EXPECT_EQ(Value::VALUE_COMPARE_NO_ORDER, one.compareWithNull(null, false));
    EXPECT_EQ(Value::VALUE_COMPARE_NO_ORDER, null.compareWithNull(null, true));
    EXPECT_TRUE(null == ValueFactory::getNullValue());
}

TEST_F(ValueCompareTest, NumericScale) {
    Value a = ValueFactory::getDecimalValueFromString("0.0");
    Value b = ValueFactory::getDecimalValueFromString("0.00");
    EXPECT_EQ(0, a.compareTo(b));
    EXPECT_EQ(0, a.compareWithNull(b, true));
    EXPECT_FALSE(a.equals(b));
    EXPECT_TRUE(a.equals(ValueFactory::getDecimalValueFromString("0.0")));
    EXPECT_EQ(a.hashCode(), ValueFactory::getDecimalValueFromString("0.0").hashCode());
}

TEST_F(ValueCompareTest, MixedTypesUseHigherType) {
    // compared as integers, not as text
    EXPECT_EQ(-1, ValueFactory::getIntegerValue(5).compareTo(ValueFactory::getStringValue("10")));
    EXPECT_EQ(1, ValueFactory::getStringValue("10").compareTo(ValueFactory::getIntegerValue(5)));
    EXPECT_EQ(-1, ValueFactory::getIntegerValue(1).compareTo(ValueFactory::getDoubleValue(1.5)));
    EXPECT_EQ(0, ValueFactory::getBigIntValue(2).compareTo(ValueFactory::getDecimalValueFromString("2.00")));
    EXPECT_EQ(0, ValueFactory::getTinyIntValue(7).compareWithCoercion(ValueFactory::getSmallIntValue(7)));
    EXPECT_FALSE(ValueFactory::getTinyIntValue(7).equals(ValueFactory::getSmallIntValue(7)));
    ASSERT_THROWS(MalformedLiteralException,
                  ValueFactory::getIntegerValue(5).compareTo(ValueFactory::getStringValue("five")));
}

TEST_F(ValueCompareTest, Doubles) {
    Value negativeZero = ValueFactory::getDoubleValue(-0.0);
    Value zero = ValueFactory::getDoubleValue(0.0);
    Value nan = ValueFactory::getDoubleValue(std::numeric_limits<double>::quiet_NaN());
    Value infinity = ValueFactory::getDoubleValue(std::numeric_limits<double>::infinity());
    EXPECT_EQ(-1, negativeZero.compareTo(zero));
    EXPECT_FALSE(negativeZero.equals(zero));
    EXPECT_EQ(1, nan.compareTo(infinity));
    EXPECT_EQ(0, nan.compareTo(ValueFactory::getDoubleValue(std::numeric_limits<double>::quiet_NaN())));
    EXPECT_TRUE(nan.equals(ValueFactory::getDoubleValue(-std::numeric_limits<double>::quiet_NaN())));
    EXPECT_EQ(nan.hashCode(), ValueFactory::getDoubleValue(-std::numeric_limits<double>::quiet_NaN()).hashCode());
    EXPECT_EQ(-1, ValueFactory::getRealValue(1.5f).compareTo(ValueFactory::getRealValue(2.5f)));
}

TEST_F(ValueCompareTest, Strings) {
    EXPECT_EQ(-1, ValueFactory::getStringValue("a").compareTo(ValueFactory::getStringValue("b")));
    EXPECT_EQ(1, ValueFactory::getStringValue("ab").compareTo(ValueFactory::getStringValue("a")));
    // code point order, not signed char order
    EXPECT_EQ(1, ValueFactory::getStringValue("\xc3\xa9").compareTo(ValueFactory::getStringValue("z")));
    EXPECT_EQ(-1, ValueFactory::getStringValue("B").compareTo(ValueFactory::getStringValue("a")));

    Value lower = ValueFactory::getIgnoreCaseStringValue("abc");
    Value upper = ValueFactory::getIgnoreCaseStringValue("ABC");
    EXPECT_EQ(0, lower.compareTo(upper));
    EXPECT_TRUE(lower.equals(upper));
    EXPECT_EQ(lower.hashCode(), upper.hashCode());
    EXPECT_FALSE(ValueFactory::getStringValue("abc").equals(ValueFactory::getStringValue("ABC")));

    EXPECT_EQ(-1, ValueFactory::getBinaryValue(std::string("\x01", 1))
              .compareTo(ValueFactory::getBinaryValue(std::string("\xff", 1))));
}

TEST_F(ValueCompareTest, TimeWithTimeZoneOrdersByInstantThenOffset) {
    Value plusOne = ValueFactory::getTimeTzValue(10 * NANOS_PER_HOUR, 3600);
    Value utc = ValueFactory::getTimeTzValue(9 * NANOS_PER_HOUR, 0);
    EXPECT_EQ(1, plusOne.compareTo(utc));
    EXPECT_FALSE(plusOne.equals(utc));
    Value later = ValueFactory::getTimeTzValue(11 * NANOS_PER_HOUR, 3600);
    EXPECT_EQ(1, later.compareTo(utc));
}

TEST_F(ValueCompareTest, TimestampWithTimeZoneOrdersByInstant) {
    const int64_t day = datetime::dateValue(2021, 5, 1);
    Value utc = ValueFactory::getTimestampTzValue(day, 10 * NANOS_PER_HOUR, 0);
    Value plusTwo = ValueFactory::getTimestampTzValue(day, 12 * NANOS_PER_HOUR, 7200);
    EXPECT_EQ(0, utc.compareTo(plusTwo));
    EXPECT_FALSE(utc.equals(plusTwo));
    Value earlier = ValueFactory::getTimestampTzValue(day, 11 * NANOS_PER_HOUR + 5, 7200);
    EXPECT_EQ(-1, earlier.compareTo(utc));

    Value ts = ValueFactory::getTimestampValue(day, 0);
    Value date = ValueFactory::getDateValue(day);
    EXPECT_EQ(0, date.compareTo(ts));
    EXPECT_EQ(-1, date.compareTo(ValueFactory::getTimestampValue(day, 1)));
}

TEST_F(ValueCompareTest, Intervals) {
    Value minusTwo = ValueFactory::getIntervalValue(ValueType::tINTERVAL_MONTH, true, 2, 0);
    Value minusThree = ValueFactory::getIntervalValue(ValueType::tINTERVAL_MONTH, true, 3, 0);
    Value one = ValueFactory::getIntervalValue(ValueType::tINTERVAL_MONTH, false, 1, 0);
    EXPECT_EQ(-1, minusTwo.compareTo(one));
    EXPECT_EQ(-1, minusThree.compareTo(minusTwo));
    EXPECT_EQ(1, one.compareTo(minusThree));

    Value dayHour = ValueFactory::getIntervalValue(ValueType::tINTERVAL_DAY_TO_HOUR, false, 1, 5);
    Value dayHourMore = ValueFactory::getIntervalValue(ValueType::tINTERVAL_DAY_TO_HOUR, false, 1, 6);
    EXPECT_EQ(-1, dayHour.compareTo(dayHourMore));
}

TEST_F(ValueCompareTest, UuidIsUnsigned) {
    Value high = ValueFactory::getUuidValue(-1, 0);
    Value low = ValueFactory::getUuidValue(1, 0);
    EXPECT_EQ(1, high.compareTo(low));
    EXPECT_EQ(-1, ValueFactory::getUuidValue(1, 1).compareTo(ValueFactory::getUuidValue(1, -1)));
}

TEST_F(ValueCompareTest, EnumAgainstOtherTypes) {
    std::shared_ptr<const ExtTypeInfoEnum> domain = ExtTypeInfoEnum::create(labels("low", "medium", "high"));
    Value medium = domain->getValue("medium");
    EXPECT_EQ(1, medium.getEnumOrdinal());
    EXPECT_EQ(-1, medium.compareTo(ValueFactory::getStringValue("high")));
    EXPECT_EQ(0, medium.compareTo(ValueFactory::getStringValue(" MEDIUM ")));
    EXPECT_EQ(1, medium.compareTo(ValueFactory::getIntegerValue(0)));
    EXPECT_EQ(1, ValueFactory::getStringValue("high").compareTo(medium));
    ASSERT_SQL_EXCEPTION(EnumValueNotPermittedException, SQLException::data_exception_value_not_permitted,
                         medium.compareTo(ValueFactory::getStringValue("missing")));
    ASSERT_SQL_EXCEPTION(EnumValueNotPermittedException, SQLException::data_exception_value_not_permitted,
                         medium.compareTo(ValueFactory::getIntegerValue(3)));
}

TEST_F(ValueCompareTest, EnumDomainsAreUnified) {
    std::shared_ptr<const ExtTypeInfoEnum> left = ExtTypeInfoEnum::create(labels("a", "b"));
    std::shared_ptr<const ExtTypeInfoEnum> right = ExtTypeInfoEnum::create(labels("B", "c"));

    std::shared_ptr<const ExtTypeInfoEnum> unified =
            ExtTypeInfoEnum::getEnumeratorsForBinaryOperation(left->getValue(0), right->getValue(0));
    EXPECT_EQ("ENUM('a', 'b', 'c')", unified->getCreateSQL());

    EXPECT_EQ(0, left->getValue("b").compareTo(right->getValue("B")));
    EXPECT_EQ(-1, left->getValue("b").compareTo(right->getValue("c")));
    EXPECT_EQ(1, right->getValue("c").compareTo(left->getValue("a")));

    // equal domains share the left one
    std::shared_ptr<const ExtTypeInfoEnum> copy = ExtTypeInfoEnum::create(labels("a", "b"));
    EXPECT_TRUE(ExtTypeInfoEnum::getEnumeratorsForBinaryOperation(left->getValue(1), copy->getValue(0)) == left);
    ASSERT_THROWS(DataConversionException,
                  ExtTypeInfoEnum::getEnumeratorsForBinaryOperation(ValueFactory::getIntegerValue(1),
                                                                   ValueFactory::getIntegerValue(2)));
}

TEST_F(ValueCompareTest, EnumInsideCollections) {
    std::shared_ptr<const ExtTypeInfoEnum> domain = ExtTypeInfoEnum::create(labels("low", "medium", "high"));
    Value medium = domain->getValue("medium");

    EXPECT_EQ(0, medium.compareTo(ValueFactory::getArrayValue(std::vector<Value>(1, medium))));
    EXPECT_EQ(-1, medium.compareTo(ValueFactory::getArrayValue(std::vector<Value>(1, domain->getValue("high")))));
    EXPECT_EQ(0, medium.compareTo(ValueFactory::getRowValue(std::vector<Value>(1, medium))));
    EXPECT_EQ(1, medium.compareTo(ValueFactory::getRowValue(std::vector<Value>(1, domain->getValue("low")))));
    EXPECT_EQ(1, ValueFactory::getArrayValue(std::vector<Value>(1, medium)).compareTo(domain->getValue("low")));

    std::vector<Value> longer;
    longer.push_back(medium);
    longer.push_back(domain->getValue("low"));
    EXPECT_EQ(-1, medium.compareTo(ValueFactory::getArrayValue(longer)));
}

TEST_F(ValueCompareTest, CharacterTextReadsBack) {
    std::vector<Value> values;
    values.push_back(ValueFactory::getTrue());
    values.push_back(ValueFactory::getFalse());
    values.push_back(ValueFactory::getTinyIntValue(-128));
    values.push_back(ValueFactory::getSmallIntValue(32767));
    values.push_back(ValueFactory::getBigIntValue(std::numeric_limits<int64_t>::min()));
    values.push_back(ValueFactory::getDoubleValue(std::numeric_limits<double>::quiet_NaN()));
    values.push_back(ValueFactory::getDoubleValue(std::numeric_limits<double>::infinity()));
    values.push_back(ValueFactory::getDoubleValue(-std::numeric_limits<double>::infinity()));
    values.push_back(ValueFactory::getDoubleValue(1e7));
    values.push_back(ValueFactory::getDoubleValue(9999999.0));
    values.push_back(ValueFactory::getDoubleValue(1e-3));
    values.push_back(ValueFactory::getDoubleValue(9.99e-4));
    values.push_back(ValueFactory::getDoubleValue(0.1));
    values.push_back(ValueFactory::getRealValue(0.1f));
    values.push_back(ValueFactory::getRealValue(std::numeric_limits<float>::quiet_NaN()));
    values.push_back(ValueFactory::getRealValue(-3.4e38f));
    values.push_back(ValueFactory::getDateValue(datetime::dateValue(2024, 2, 29)));
    values.push_back(ValueFactory::getDateValue(datetime::dateValue(1600, 1, 1)));
    values.push_back(ValueFactory::getTimeValue(13 * NANOS_PER_HOUR + 5 * NANOS_PER_MINUTE + 123456789));
    values.push_back(ValueFactory::getTimestampValue(datetime::dateValue(1999, 12, 31), NANOS_PER_DAY - 1));
    values.push_back(ValueFactory::getTimestampTzValue(datetime::dateValue(2021, 3, 4), NANOS_PER_HOUR, 3600));
    values.push_back(ValueFactory::getTimestampTzValue(datetime::dateValue(2021, 3, 4), 0, -5400));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_YEAR, false, 3, 0));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_MONTH, true, 14, 0));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_DAY, false, 10, 0));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_HOUR, true, 25, 0));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_MINUTE, false, 90, 0));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_SECOND, true, 2, 500000000));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_YEAR_TO_MONTH, false, 1, 6));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_DAY_TO_HOUR, true, 2, 5));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_DAY_TO_MINUTE, false, 1, 125));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_DAY_TO_SECOND, false, 1, 500000000));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_HOUR_TO_MINUTE, true, 4, 7));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_HOUR_TO_SECOND, false, 4, 500000000));
    values.push_back(ValueFactory::getIntervalValue(ValueType::tINTERVAL_MINUTE_TO_SECOND, true, 61, 500000000));
    values.push_back(ValueFactory::getCharValue("ab"));
    values.push_back(ValueFactory::getIgnoreCaseStringValue("MiXed"));
    for (size_t ii = 0; ii < values.size(); ii++) {
        const Value text = values[ii].convertTo(ValueType::tVARCHAR);
        const Value copy = text.convertTo(values[ii].getValueType());
        EXPECT_TRUE(copy.getValueType() == values[ii].getValueType());
        if (copy.compareTypeSafe(values[ii]) != 0) {
            FAIL(("did not read back: " + text.getString()).c_str());
        }
    }

    // character text becomes a JSON string; bytes are parsed
    Value json = ValueFactory::getJsonValue("{\"a\":[1,2]}");
    Value text = json.convertTo(ValueType::tVARCHAR);
    EXPECT_EQ("{\"a\":[1,2]}", text.getString());
    EXPECT_TRUE(text.convertTo(ValueType::tJSON) == ValueFactory::getJsonStringValue(text.getString()));
    EXPECT_TRUE(json.convertTo(ValueType::tVARBINARY).convertTo(ValueType::tJSON) == json);
}

TEST_F(ValueCompareTest, HashCodeFollowsEquals) {
    std::vector<Value> values;
    values.push_back(ValueFactory::getIntegerValue(42));
    values.push_back(ValueFactory::getStringValue("42"));
    values.push_back(ValueFactory::getDecimalValueFromString("4.20"));
    values.push_back(ValueFactory::getTimeTzValue(NANOS_PER_HOUR, 3600));
    values.push_back(ValueFactory::getUuidValue(3, 4));
    for (size_t ii = 0; ii < values.size(); ii++) {
        Value copy = values[ii].convertTo(ValueType::tVARCHAR).convertTo(values[ii].getValueType());
        EXPECT_TRUE(copy.equals(values[ii]));
        EXPECT_EQ(values[ii].hashCode(), copy.hashCode());
        EXPECT_EQ(values[ii].hashCode(), std::hash<Value>()(values[ii]));
    }
    EXPECT_FALSE(values[0].equals(values[1]));
}

int main() {
    return TestSuite::globalInstance()->runAll();
}
