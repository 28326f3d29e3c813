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

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/Decimal.h"
#include "common/Value.hpp"
#include "common/types.h"

namespace valuecore {

struct ValueBody;

/**
 * Builds Values. Every constructor checks its input and throws rather
 * than store something out of range. Small scalar values are passed
 * through the calling thread's ValueCache when one is bound, so equal
 * inputs may come back as the same instance.
 */
class ValueFactory {
public:
    static Value getNullValue() {
        return Value();
    }

    static Value getTrue() {
        return getBooleanValue(true);
    }

    static Value getFalse() {
        return getBooleanValue(false);
    }

    static Value getBooleanValue(bool value);
    static Value getTinyIntValue(int8_t value);
    static Value getSmallIntValue(int16_t value);
    static Value getIntegerValue(int32_t value);
    static Value getBigIntValue(int64_t value);
    static Value getDecimalValue(Decimal const& value);
    /* Parses the text; throws MalformedLiteralException or NumericOverflowException */
    static Value getDecimalValueFromString(std::string const& text);
    static Value getDoubleValue(double value);
    static Value getRealValue(float value);

    /* A packed date value (see DateTimeUtils.h); the date must exist */
    static Value getDateValue(int64_t dateValue);
    /* Nanoseconds since midnight, [0, NANOS_PER_DAY) */
    static Value getTimeValue(int64_t nanos);
    static Value getTimeTzValue(int64_t nanos, int32_t offsetSeconds);
    static Value getTimestampValue(int64_t dateValue, int64_t nanos);
    static Value getTimestampTzValue(int64_t dateValue, int64_t nanos, int32_t offsetSeconds);

    /* Throws for fields outside the qualifier's ranges */
    static Value getIntervalValue(ValueType qualifier, bool negative, int64_t leading, int64_t remaining);

    static Value getStringValue(std::string const& text);
    static Value getIgnoreCaseStringValue(std::string const& text);
    /* Trailing spaces are removed */
    static Value getCharValue(std::string const& text);
    static Value getBinaryValue(std::string const& bytes);
    static Value getJavaObjectValue(std::string const& bytes);

    /*
     * JSON text, validated and stored without insignificant whitespace.
     * Throws DataConversionException when the text is not JSON.
     */
    static Value getJsonValue(std::string const& jsonText);
    /* A JSON string literal holding 'text' */
    static Value getJsonStringValue(std::string const& text);

    static Value getUuidValue(int64_t high, int64_t low);
    /* 32 hex digits; '-' and whitespace are ignored. Throws MalformedLiteralException */
    static Value getUuidValueFromString(std::string const& text);

    /* 'ordinal' must be valid for the domain; see ExtTypeInfoEnum::getValue */
    static Value getEnumValue(std::shared_ptr<const ExtTypeInfoEnum> const& enumerators, int ordinal);

    /* 'ewkb' is expected to be checked by the codec already */
    static Value getGeometryValue(std::string const& ewkb, std::shared_ptr<const GeometryCodec> const& codec);

    static Value getArrayValue(std::vector<Value> const& elements);
    static Value getRowValue(std::vector<Value> const& elements);
    static Value getResultSetValue(std::shared_ptr<const ResultInterface> const& result);

    /* A BLOB or CLOB held entirely in memory */
    static Value createSmallLob(ValueType type, std::string const& data);

private:
    static std::shared_ptr<ValueBody> newBody(ValueType type);
    /* Wraps the body, interning it when a thread cache is bound */
    static Value publish(std::shared_ptr<ValueBody> const& body, bool cacheable);
};

}
