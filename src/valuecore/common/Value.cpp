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

#include <cstdio>
#include <sstream>

#include <boost/algorithm/string.hpp>

#include "common/CastDataProvider.h"
#include "common/DateTimeUtils.h"
#include "common/ExtTypeInfo.h"
#include "common/FatalException.hpp"
#include "common/FloatFormat.h"
#include "common/GeometryCodec.h"
#include "common/IntervalUtils.h"
#include "common/ResultInterface.h"
#include "common/ValueBody.hpp"
#include "common/ValueExceptions.h"
#include "logging/LogManager.h"

namespace valuecore {

int warn_if(int condition, const char* message) {
    if (condition) {
        LogManager::getThreadLogger(LOGGERID_HOST)->log(LOGLEVEL_WARN, message);
    }
    return condition;
}

static const std::shared_ptr<const ValueBody>& nullBody() {
    static const std::shared_ptr<const ValueBody> body = std::make_shared<ValueBody>(ValueType::tNULL);
    return body;
}

Value::Value() : m_body(nullBody()) {
}

ValueType Value::getValueType() const {
    return m_body->m_type;
}

TypeInfo Value::getType() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tNUMERIC:
        return TypeInfo(b.m_type, b.m_decimal.precision(), b.m_decimal.scale());
    case ValueType::tVARCHAR:
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR:
    case ValueType::tCLOB:
        return TypeInfo(b.m_type, getCharLength(b.m_bytes), 0);
    case ValueType::tVARBINARY:
    case ValueType::tBLOB:
    case ValueType::tJAVA_OBJECT:
    case ValueType::tJSON:
    case ValueType::tGEOMETRY:
        return TypeInfo(b.m_type, static_cast<int64_t>(b.m_bytes.size()), 0);
    case ValueType::tENUM:
        return TypeInfo(b.m_type, getCharLength(b.m_bytes), 0, b.m_enumerators);
    case ValueType::tARRAY:
    case ValueType::tROW:
        return TypeInfo(b.m_type, static_cast<int64_t>(b.m_elements.size()), 0);
    default:
        return TypeInfo::getTypeInfo(b.m_type);
    }
}

int Value::getMemory() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tNULL:
        // one shared instance
        return 0;
    case ValueType::tBOOLEAN:
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
    case ValueType::tDOUBLE:
    case ValueType::tREAL:
    case ValueType::tUUID:
        return 24;
    case ValueType::tNUMERIC:
        return 120 + b.m_decimal.precision();
    case ValueType::tDATE:
    case ValueType::tTIME:
    case ValueType::tTIME_TZ:
    case ValueType::tTIMESTAMP:
    case ValueType::tTIMESTAMP_TZ:
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
    case ValueType::tINTERVAL_SECOND:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
    case ValueType::tINTERVAL_DAY_TO_HOUR:
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        return 32;
    case ValueType::tVARCHAR:
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR:
    case ValueType::tCLOB:
    case ValueType::tENUM:
        return 48 + 2 * static_cast<int>(b.m_bytes.size());
    case ValueType::tVARBINARY:
    case ValueType::tBLOB:
    case ValueType::tJAVA_OBJECT:
    case ValueType::tJSON:
    case ValueType::tGEOMETRY:
        return 24 + static_cast<int>(b.m_bytes.size());
    case ValueType::tARRAY:
    case ValueType::tROW: {
        int memory = 24 + 8 * static_cast<int>(b.m_elements.size());
        for (size_t ii = 0; ii < b.m_elements.size(); ii++) {
            memory += b.m_elements[ii].getMemory();
        }
        return memory;
    }
    case ValueType::tRESULT_SET:
        return 400;
    case ValueType::tUNKNOWN:
        break;
    }
    throwFatalException("Value has corrupt type code %d", static_cast<int>(b.m_type));
}

bool Value::containsNull() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tNULL:
        return true;
    case ValueType::tARRAY:
    case ValueType::tROW:
        for (size_t ii = 0; ii < b.m_elements.size(); ii++) {
            if (b.m_elements[ii].containsNull()) {
                return true;
            }
        }
        return false;
    default:
        return false;
    }
}

int Value::getSignum() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
        return b.m_long > 0 ? 1 : (b.m_long < 0 ? -1 : 0);
    case ValueType::tNUMERIC:
        return b.m_decimal.signum();
    case ValueType::tDOUBLE:
        return b.m_double > 0 ? 1 : (b.m_double < 0 ? -1 : 0);
    case ValueType::tREAL:
        return b.m_float > 0 ? 1 : (b.m_float < 0 ? -1 : 0);
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
    case ValueType::tINTERVAL_SECOND:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
    case ValueType::tINTERVAL_DAY_TO_HOUR:
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        if (b.m_negative) {
            return -1;
        }
        return (b.m_long != 0 || b.m_long2 != 0) ? 1 : 0;
    default:
        throwSQLException(SQLException::feature_not_supported,
                          "Feature not supported: \"getSignum(%s)\"", getTypeName(b.m_type).c_str());
    }
}

// ------------------------------------------------------------------
// Typed accessors
// ------------------------------------------------------------------

// The value converted to 'type'; NULL has no value to extract.
static Value convertForAccess(Value const& value, ValueType type) {
    if (value.isNull()) {
        throw DataConversionException("NULL", getTypeName(type));
    }
    return value.convertTo(type);
}

bool Value::asBoolean() const {
    return convertForAccess(*this, ValueType::tBOOLEAN).body().m_long != 0;
}

int8_t Value::asByte() const {
    return static_cast<int8_t>(convertForAccess(*this, ValueType::tTINYINT).body().m_long);
}

int16_t Value::asShort() const {
    return static_cast<int16_t>(convertForAccess(*this, ValueType::tSMALLINT).body().m_long);
}

int32_t Value::asInt() const {
    return static_cast<int32_t>(convertForAccess(*this, ValueType::tINTEGER).body().m_long);
}

int64_t Value::asLong() const {
    return convertForAccess(*this, ValueType::tBIGINT).body().m_long;
}

double Value::asDouble() const {
    return convertForAccess(*this, ValueType::tDOUBLE).body().m_double;
}

float Value::asFloat() const {
    return convertForAccess(*this, ValueType::tREAL).body().m_float;
}

Decimal Value::asDecimal() const {
    return convertForAccess(*this, ValueType::tNUMERIC).body().m_decimal;
}

std::string Value::asBytes() const {
    return convertForAccess(*this, ValueType::tVARBINARY).body().m_bytes;
}

std::string Value::asString() const {
    return convertForAccess(*this, ValueType::tVARCHAR).body().m_bytes;
}

// ------------------------------------------------------------------
// Payload getters
// ------------------------------------------------------------------

int64_t Value::getDateValue() const {
    vcassert(getValueType() == ValueType::tDATE || getValueType() == ValueType::tTIMESTAMP
             || getValueType() == ValueType::tTIMESTAMP_TZ);
    return body().m_long;
}

int64_t Value::getTimeNanos() const {
    vcassert(getValueType() == ValueType::tTIME || getValueType() == ValueType::tTIME_TZ
             || getValueType() == ValueType::tTIMESTAMP || getValueType() == ValueType::tTIMESTAMP_TZ);
    return body().m_long2;
}

int32_t Value::getTimeZoneOffsetSeconds() const {
    vcassert(getValueType() == ValueType::tTIME_TZ || getValueType() == ValueType::tTIMESTAMP_TZ);
    return body().m_offsetSeconds;
}

bool Value::isIntervalNegative() const {
    vcassert(isIntervalType(getValueType()));
    return body().m_negative;
}

int64_t Value::getIntervalLeading() const {
    vcassert(isIntervalType(getValueType()));
    return body().m_long;
}

int64_t Value::getIntervalRemaining() const {
    vcassert(isIntervalType(getValueType()));
    return body().m_long2;
}

int64_t Value::getUuidHigh() const {
    vcassert(getValueType() == ValueType::tUUID);
    return body().m_long;
}

int64_t Value::getUuidLow() const {
    vcassert(getValueType() == ValueType::tUUID);
    return body().m_long2;
}

int Value::getEnumOrdinal() const {
    vcassert(getValueType() == ValueType::tENUM);
    return static_cast<int>(body().m_long);
}

const std::shared_ptr<const ExtTypeInfoEnum>& Value::getEnumerators() const {
    vcassert(getValueType() == ValueType::tENUM);
    return body().m_enumerators;
}

const std::vector<Value>& Value::getElements() const {
    vcassert(getValueType() == ValueType::tARRAY || getValueType() == ValueType::tROW);
    return body().m_elements;
}

const std::shared_ptr<const ResultInterface>& Value::getResult() const {
    vcassert(getValueType() == ValueType::tRESULT_SET);
    return body().m_result;
}

const std::shared_ptr<const GeometryCodec>& Value::getGeometryCodec() const {
    vcassert(getValueType() == ValueType::tGEOMETRY);
    return body().m_codec;
}

// ------------------------------------------------------------------
// Text
// ------------------------------------------------------------------

static std::string formatUuid(int64_t high, int64_t low) {
    char buffer[40];
    const uint64_t h = static_cast<uint64_t>(high);
    const uint64_t l = static_cast<uint64_t>(low);
    snprintf(buffer, sizeof buffer, "%08x-%04x-%04x-%04x-%012llx",
             static_cast<unsigned>(h >> 32), static_cast<unsigned>((h >> 16) & 0xffff),
             static_cast<unsigned>(h & 0xffff), static_cast<unsigned>(l >> 48),
             static_cast<unsigned long long>(l & 0xffffffffffffULL));
    return buffer;
}

// 'text' with embedded quotes doubled, between single quotes
static std::string quoteSQL(std::string const& text) {
    return "'" + boost::algorithm::replace_all_copy(text, "'", "''") + "'";
}

// Text of every row of a result, "((a, b), (c, d))"
static std::string resultSetString(ResultInterface const& result, bool traceSQL) {
    std::shared_ptr<ResultInterface> cursor = result.createShallowCopy();
    const int columns = cursor->getVisibleColumnCount();
    std::string out = "(";
    bool firstRow = true;
    while (cursor->next()) {
        if (! firstRow) {
            out.append(", ");
        }
        firstRow = false;
        const std::vector<Value>& row = cursor->currentRow();
        out.append("(");
        for (int ii = 0; ii < columns; ii++) {
            if (ii > 0) {
                out.append(", ");
            }
            out.append(traceSQL ? row[ii].getTraceSQL() : row[ii].getString());
        }
        out.append(")");
    }
    return out.append(")");
}

static std::string elementsString(std::vector<Value> const& elements, bool traceSQL) {
    std::string out;
    for (size_t ii = 0; ii < elements.size(); ii++) {
        if (ii > 0) {
            out.append(", ");
        }
        out.append(traceSQL ? elements[ii].getTraceSQL() : elements[ii].getString());
    }
    return out;
}

std::string Value::getString() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tNULL:
        return "NULL";
    case ValueType::tBOOLEAN:
        return b.m_long != 0 ? "TRUE" : "FALSE";
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
        return std::to_string(b.m_long);
    case ValueType::tNUMERIC:
        return b.m_decimal.toString();
    case ValueType::tDOUBLE:
        return formatDouble(b.m_double);
    case ValueType::tREAL:
        return formatFloat(b.m_float);
    case ValueType::tDATE:
        return datetime::formatDate(b.m_long);
    case ValueType::tTIME:
        return datetime::formatTime(b.m_long2);
    case ValueType::tTIME_TZ:
        return datetime::formatTime(b.m_long2) + datetime::formatTimeZoneOffset(b.m_offsetSeconds);
    case ValueType::tTIMESTAMP:
        return datetime::formatTimestamp(b.m_long, b.m_long2);
    case ValueType::tTIMESTAMP_TZ:
        return datetime::formatTimestamp(b.m_long, b.m_long2)
            + datetime::formatTimeZoneOffset(b.m_offsetSeconds);
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
    case ValueType::tINTERVAL_SECOND:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
    case ValueType::tINTERVAL_DAY_TO_HOUR:
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        return interval::formatLiteral(b.m_type, b.m_negative, b.m_long, b.m_long2);
    case ValueType::tVARCHAR:
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR:
    case ValueType::tCLOB:
    case ValueType::tJSON:
    case ValueType::tENUM:
        return b.m_bytes;
    case ValueType::tVARBINARY:
    case ValueType::tBLOB:
    case ValueType::tJAVA_OBJECT:
        return hexEncode(b.m_bytes);
    case ValueType::tGEOMETRY:
        if (b.m_codec == NULL) {
            return hexEncode(b.m_bytes);
        }
        return b.m_codec->toWkt(b.m_bytes);
    case ValueType::tUUID:
        return formatUuid(b.m_long, b.m_long2);
    case ValueType::tARRAY:
        return "ARRAY [" + elementsString(b.m_elements, false) + "]";
    case ValueType::tROW:
        return "ROW (" + elementsString(b.m_elements, false) + ")";
    case ValueType::tRESULT_SET:
        return resultSetString(*b.m_result, false);
    case ValueType::tUNKNOWN:
        break;
    }
    throwFatalException("Value has corrupt type code %d", static_cast<int>(b.m_type));
}

std::string Value::getTraceSQL() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tNULL:
    case ValueType::tBOOLEAN:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
    case ValueType::tNUMERIC:
        return getString();
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tDOUBLE:
    case ValueType::tREAL:
        return "CAST(" + getString() + " AS " + getTypeName(b.m_type) + ")";
    case ValueType::tDATE:
    case ValueType::tTIME:
    case ValueType::tTIME_TZ:
    case ValueType::tTIMESTAMP:
    case ValueType::tTIMESTAMP_TZ:
    case ValueType::tUUID:
    case ValueType::tJSON:
        return getTypeName(b.m_type) + " " + quoteSQL(getString());
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
    case ValueType::tINTERVAL_SECOND:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
    case ValueType::tINTERVAL_DAY_TO_HOUR:
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        return getString();
    case ValueType::tVARCHAR:
    case ValueType::tCLOB:
    case ValueType::tENUM:
        return quoteSQL(b.m_bytes);
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR:
        return "CAST(" + quoteSQL(b.m_bytes) + " AS " + getTypeName(b.m_type) + ")";
    case ValueType::tVARBINARY:
    case ValueType::tBLOB:
        return "X'" + hexEncode(b.m_bytes) + "'";
    case ValueType::tJAVA_OBJECT:
        return "CAST(X'" + hexEncode(b.m_bytes) + "' AS JAVA_OBJECT)";
    case ValueType::tGEOMETRY:
        if (b.m_codec == NULL) {
            return "CAST(X'" + hexEncode(b.m_bytes) + "' AS GEOMETRY)";
        }
        return "GEOMETRY " + quoteSQL(b.m_codec->toWkt(b.m_bytes));
    case ValueType::tARRAY:
        return "ARRAY [" + elementsString(b.m_elements, true) + "]";
    case ValueType::tROW:
        return "ROW (" + elementsString(b.m_elements, true) + ")";
    case ValueType::tRESULT_SET:
        return resultSetString(*b.m_result, true);
    case ValueType::tUNKNOWN:
        break;
    }
    throwFatalException("Value has corrupt type code %d", static_cast<int>(b.m_type));
}

std::string Value::debug() const {
    std::ostringstream buffer;
    buffer << "type:" << getTypeName(getValueType()) << ",value:" << getTraceSQL();
    return buffer.str();
}

void Value::throwDataConversion(ValueType targetType) const {
    throw DataConversionException(getTypeName(getValueType()), getTypeName(targetType));
}

}
