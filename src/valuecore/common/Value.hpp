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

#include <climits>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "common/Decimal.h"
#include "common/TypeInfo.h"
#include "common/types.h"

namespace valuecore {

class CastDataProvider;
class ExtTypeInfo;
class ExtTypeInfoEnum;
class GeometryCodec;
class ResultInterface;
struct ValueBody;

/**
 * A SQL value of any type. A Value is a handle on an immutable body, so
 * copies are cheap and a Value may be shared between threads. Every
 * operation that changes a value (conversion, rescaling, truncation)
 * returns a new Value, or this same instance when nothing needs to change.
 *
 * Values are built by ValueFactory. A default constructed Value is SQL
 * NULL; all NULLs share one body.
 *
 * Comparison comes in three flavours:
 *  - compareTypeSafe: both sides already of the same type;
 *  - compareTo: total order with NULL first, coercing mismatched types;
 *  - compareWithNull: SQL semantics, VALUE_COMPARE_NO_ORDER when either
 *    side is NULL.
 * equals() never coerces and is sensitive to NUMERIC scale.
 */
class Value {
    friend class ValuePeeker;
    friend class ValueFactory;
    friend class ValueCache;

  public:
    // compareWithNull result when either operand is NULL
    static const int VALUE_COMPARE_NO_ORDER = INT_MIN;

    /* Create a NULL Value */
    Value();

    bool operator==(Value const& rhs) const {
        return equals(rhs);
    }
    bool operator!=(Value const& rhs) const {
        return ! equals(rhs);
    }

    ValueType getValueType() const;

    /* The data type of this particular value, e.g. NUMERIC(5, 2) for 123.45 */
    TypeInfo getType() const;

    bool isNull() const {
        return getValueType() == ValueType::tNULL;
    }

    /* Identity, not equality: true when both handles share one body. */
    bool isSameInstance(Value const& other) const {
        return m_body == other.m_body;
    }

    /* Approximate number of bytes this value keeps alive. */
    int getMemory() const;

    /* NULL, or an ARRAY/ROW with a NULL anywhere inside. */
    bool containsNull() const;

    /* -1, 0 or 1 for numeric and interval values. */
    int getSignum() const;

    // ------------------------------------------------------------------
    // Typed accessors. Each converts to the named type first, so they
    // throw whatever that conversion throws; on NULL they throw
    // DataConversionException.
    // ------------------------------------------------------------------
    bool asBoolean() const;
    int8_t asByte() const;
    int16_t asShort() const;
    int32_t asInt() const;
    int64_t asLong() const;
    double asDouble() const;
    float asFloat() const;
    Decimal asDecimal() const;
    /* VARBINARY bytes of the value */
    std::string asBytes() const;
    /* VARCHAR text of the value */
    std::string asString() const;

    // ------------------------------------------------------------------
    // Payload getters. Only valid on the value types named; they do not
    // convert.
    // ------------------------------------------------------------------

    /* DATE, TIMESTAMP, TIMESTAMP_TZ */
    int64_t getDateValue() const;
    /* TIME, TIME_TZ, TIMESTAMP, TIMESTAMP_TZ */
    int64_t getTimeNanos() const;
    /* TIME_TZ, TIMESTAMP_TZ */
    int32_t getTimeZoneOffsetSeconds() const;
    /* INTERVAL_* */
    bool isIntervalNegative() const;
    int64_t getIntervalLeading() const;
    int64_t getIntervalRemaining() const;
    /* UUID */
    int64_t getUuidHigh() const;
    int64_t getUuidLow() const;
    /* ENUM */
    int getEnumOrdinal() const;
    const std::shared_ptr<const ExtTypeInfoEnum>& getEnumerators() const;
    /* ARRAY, ROW */
    const std::vector<Value>& getElements() const;
    /* RESULT_SET */
    const std::shared_ptr<const ResultInterface>& getResult() const;
    /* GEOMETRY; may be empty */
    const std::shared_ptr<const GeometryCodec>& getGeometryCodec() const;

    // ------------------------------------------------------------------
    // Text
    // ------------------------------------------------------------------

    /* The value as a character string, e.g. "TRUE", "1.5E10", "ARRAY [1, 2]" */
    std::string getString() const;

    /* The value as a SQL literal, e.g. 'it''s', X'00ff', DATE '2020-01-01' */
    std::string getTraceSQL() const;

    /* Type name and literal, for logging and test failures. */
    std::string debug() const;

    // ------------------------------------------------------------------
    // Conversion
    // ------------------------------------------------------------------

    /*
     * Converts to 'targetType'. NULL stays NULL; a value already of the
     * target type is returned as is unless 'extTypeInfo' is given, in
     * which case extTypeInfo->cast() decides. 'column' only appears in
     * error messages. A NULL provider means CastDataProvider::getDefault().
     */
    Value convertTo(ValueType targetType, const ExtTypeInfo* extTypeInfo,
                    const CastDataProvider* provider, std::string const& column) const;

    Value convertTo(ValueType targetType) const;
    Value convertTo(ValueType targetType, const CastDataProvider* provider) const;
    Value convertTo(TypeInfo const& targetType, const CastDataProvider* provider,
                    std::string const& column = std::string()) const;

    /*
     * NUMERIC only: rescale to 'targetScale' with HALF_UP rounding. With
     * 'onlyToSmallerScale', a value whose scale is already at or below the
     * target is left alone. Other types are returned unchanged.
     */
    Value convertScale(bool onlyToSmallerScale, int targetScale) const;

    /*
     * Character and binary types are truncated to 'precision' characters
     * or bytes. Other types are returned unchanged.
     */
    Value convertPrecision(int64_t precision) const;

    bool checkPrecision(int64_t precision) const {
        return getType().getPrecision() <= precision;
    }

    // ------------------------------------------------------------------
    // Comparison
    // ------------------------------------------------------------------

    /* Both sides must be of one value type. Returns -1, 0 or 1. */
    int compareTypeSafe(Value const& rhs) const;

    /* Total order, NULL lowest. Returns -1, 0 or 1. */
    int compareTo(Value const& rhs, const CastDataProvider* provider = NULL) const;

    /* VALUE_COMPARE_NO_ORDER if either side is NULL, else as compareTo */
    int compareWithNull(Value const& rhs, bool forEquality, const CastDataProvider* provider = NULL) const;

    /* Converts both sides to their common type, then compareTypeSafe */
    int compareWithCoercion(Value const& rhs, const CastDataProvider* provider = NULL) const;

    /* Same type and same payload; no conversion */
    bool equals(Value const& rhs) const;

    /* Consistent with equals() */
    std::size_t hashCode() const;

  private:
    explicit Value(std::shared_ptr<const ValueBody> const& body) : m_body(body) {}

    const ValueBody& body() const {
        return *m_body;
    }

    // ConversionEngine, one function per target (ValueConversion.cpp)
    Value convertToBoolean() const;
    Value convertToIntegral(ValueType targetType, std::string const& column) const;
    Value convertToNumeric(std::string const& column) const;
    Value convertToDouble() const;
    Value convertToReal() const;
    Value convertToDate(const CastDataProvider& provider) const;
    Value convertToTime(const CastDataProvider& provider) const;
    Value convertToTimeTimeZone(const CastDataProvider& provider) const;
    Value convertToTimestamp(const CastDataProvider& provider) const;
    Value convertToTimestampTimeZone(const CastDataProvider& provider) const;
    Value convertToVarbinary() const;
    Value convertToCharacter(ValueType targetType) const;
    Value convertToJavaObject() const;
    Value convertToEnum(const ExtTypeInfo* extTypeInfo) const;
    Value convertToBlob() const;
    Value convertToClob() const;
    Value convertToUuid() const;
    Value convertToGeometry(const ExtTypeInfo* extTypeInfo, const CastDataProvider& provider) const;
    Value convertToInterval(ValueType targetType, std::string const& column) const;
    Value convertToJson() const;
    Value convertToArray() const;
    Value convertToRow() const;
    Value convertToResultSet() const;

    [[noreturn]] void throwDataConversion(ValueType targetType) const;

    std::shared_ptr<const ValueBody> m_body;
};

}

namespace std {
template<>
struct hash<valuecore::Value> {
    std::size_t operator()(valuecore::Value const& value) const {
        return value.hashCode();
    }
};
}
