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

#include <memory>

#include <boost/algorithm/string.hpp>

#include "json/json.h"

#include "common/DateTimeUtils.h"
#include "common/ExtTypeInfo.h"
#include "common/FatalException.hpp"
#include "common/IntervalUtils.h"
#include "common/ValueBody.hpp"
#include "common/ValueCache.h"
#include "common/ValueExceptions.h"
#include "common/ValueFactory.hpp"

namespace valuecore {

// VARCHAR values shorter than this are interned.
static const size_t MAX_CACHED_STRING_LENGTH = 16;

std::shared_ptr<ValueBody> ValueFactory::newBody(ValueType type) {
    return std::make_shared<ValueBody>(type);
}

Value ValueFactory::publish(std::shared_ptr<ValueBody> const& body, bool cacheable) {
    Value value(std::shared_ptr<const ValueBody>(body));
    if (cacheable) {
        ValueCache* cache = ValueCache::getThreadCache();
        if (cache != NULL) {
            return cache->intern(value);
        }
    }
    return value;
}

Value ValueFactory::getBooleanValue(bool value) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tBOOLEAN);
    body->m_long = value ? 1 : 0;
    return publish(body, true);
}

Value ValueFactory::getTinyIntValue(int8_t value) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tTINYINT);
    body->m_long = value;
    return publish(body, true);
}

Value ValueFactory::getSmallIntValue(int16_t value) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tSMALLINT);
    body->m_long = value;
    return publish(body, true);
}

Value ValueFactory::getIntegerValue(int32_t value) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tINTEGER);
    body->m_long = value;
    return publish(body, true);
}

Value ValueFactory::getBigIntValue(int64_t value) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tBIGINT);
    body->m_long = value;
    return publish(body, true);
}

Value ValueFactory::getDecimalValue(Decimal const& value) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tNUMERIC);
    body->m_decimal = value;
    return publish(body, true);
}

Value ValueFactory::getDecimalValueFromString(std::string const& text) {
    return getDecimalValue(Decimal::parse(text));
}

Value ValueFactory::getDoubleValue(double value) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tDOUBLE);
    body->m_double = value;
    return publish(body, true);
}

Value ValueFactory::getRealValue(float value) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tREAL);
    body->m_float = value;
    return publish(body, true);
}

static void checkDate(int64_t dateValue, const char* typeName) {
    if (! datetime::isValidDate(datetime::yearFromDateValue(dateValue),
                                datetime::monthFromDateValue(dateValue),
                                datetime::dayFromDateValue(dateValue))) {
        throw InvalidDatetimeLiteralException(typeName, datetime::formatDate(dateValue));
    }
}

static void checkTime(int64_t nanos, const char* typeName) {
    if (nanos < 0 || nanos >= NANOS_PER_DAY) {
        throw InvalidDatetimeLiteralException(typeName, std::to_string(nanos) + " nanoseconds");
    }
}

static void checkOffset(int32_t offsetSeconds, const char* typeName) {
    if (offsetSeconds < -MAX_TIME_ZONE_OFFSET_SECONDS || offsetSeconds > MAX_TIME_ZONE_OFFSET_SECONDS) {
        throw InvalidDatetimeLiteralException(typeName, "time zone offset " + std::to_string(offsetSeconds));
    }
}

Value ValueFactory::getDateValue(int64_t dateValue) {
    checkDate(dateValue, "DATE");
    std::shared_ptr<ValueBody> body = newBody(ValueType::tDATE);
    body->m_long = dateValue;
    return publish(body, true);
}

Value ValueFactory::getTimeValue(int64_t nanos) {
    checkTime(nanos, "TIME");
    std::shared_ptr<ValueBody> body = newBody(ValueType::tTIME);
    body->m_long2 = nanos;
    return publish(body, true);
}

Value ValueFactory::getTimeTzValue(int64_t nanos, int32_t offsetSeconds) {
    checkTime(nanos, "TIME WITH TIME ZONE");
    checkOffset(offsetSeconds, "TIME WITH TIME ZONE");
    std::shared_ptr<ValueBody> body = newBody(ValueType::tTIME_TZ);
    body->m_long2 = nanos;
    body->m_offsetSeconds = offsetSeconds;
    return publish(body, false);
}

Value ValueFactory::getTimestampValue(int64_t dateValue, int64_t nanos) {
    checkDate(dateValue, "TIMESTAMP");
    checkTime(nanos, "TIMESTAMP");
    std::shared_ptr<ValueBody> body = newBody(ValueType::tTIMESTAMP);
    body->m_long = dateValue;
    body->m_long2 = nanos;
    return publish(body, false);
}

Value ValueFactory::getTimestampTzValue(int64_t dateValue, int64_t nanos, int32_t offsetSeconds) {
    checkDate(dateValue, "TIMESTAMP WITH TIME ZONE");
    checkTime(nanos, "TIMESTAMP WITH TIME ZONE");
    checkOffset(offsetSeconds, "TIMESTAMP WITH TIME ZONE");
    std::shared_ptr<ValueBody> body = newBody(ValueType::tTIMESTAMP_TZ);
    body->m_long = dateValue;
    body->m_long2 = nanos;
    body->m_offsetSeconds = offsetSeconds;
    return publish(body, false);
}

Value ValueFactory::getIntervalValue(ValueType qualifier, bool negative, int64_t leading, int64_t remaining) {
    const interval::IntervalFields fields = interval::validate(qualifier, negative, leading, remaining);
    std::shared_ptr<ValueBody> body = newBody(qualifier);
    body->m_negative = fields.negative;
    body->m_long = fields.leading;
    body->m_long2 = fields.remaining;
    return publish(body, false);
}

Value ValueFactory::getStringValue(std::string const& text) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tVARCHAR);
    body->m_bytes = text;
    return publish(body, text.size() < MAX_CACHED_STRING_LENGTH);
}

Value ValueFactory::getIgnoreCaseStringValue(std::string const& text) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tVARCHAR_IGNORECASE);
    body->m_bytes = text;
    return publish(body, false);
}

Value ValueFactory::getCharValue(std::string const& text) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tCHAR);
    body->m_bytes = boost::algorithm::trim_right_copy_if(text, boost::algorithm::is_any_of(" "));
    return publish(body, false);
}

Value ValueFactory::getBinaryValue(std::string const& bytes) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tVARBINARY);
    body->m_bytes = bytes;
    return publish(body, false);
}

Value ValueFactory::getJavaObjectValue(std::string const& bytes) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tJAVA_OBJECT);
    body->m_bytes = bytes;
    return publish(body, false);
}

// Removes whitespace between JSON tokens; strings are copied untouched.
// Member order and number spelling stay as written, which re-serialising
// the parsed Json::Value would not preserve.
static std::string compactJson(std::string const& text) {
    std::string out;
    out.reserve(text.size());
    bool inString = false;
    bool escaped = false;
    for (size_t ii = 0; ii < text.size(); ii++) {
        const char c = text[ii];
        if (inString) {
            out.push_back(c);
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
        } else if (c == '"') {
            inString = true;
            out.push_back(c);
        } else if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            out.push_back(c);
        }
    }
    return out;
}

Value ValueFactory::getJsonValue(std::string const& jsonText) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["allowComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (! reader->parse(jsonText.data(), jsonText.data() + jsonText.size(), &root, &errors)) {
        throw DataConversionException(jsonText);
    }
    std::shared_ptr<ValueBody> body = newBody(ValueType::tJSON);
    body->m_bytes = compactJson(jsonText);
    return publish(body, false);
}

Value ValueFactory::getJsonStringValue(std::string const& text) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tJSON);
    body->m_bytes = Json::valueToQuotedString(text.c_str());
    return publish(body, false);
}

Value ValueFactory::getUuidValue(int64_t high, int64_t low) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tUUID);
    body->m_long = high;
    body->m_long2 = low;
    return publish(body, true);
}

Value ValueFactory::getUuidValueFromString(std::string const& text) {
    uint64_t high = 0;
    uint64_t low = 0;
    int digits = 0;
    for (size_t ii = 0; ii < text.size(); ii++) {
        const char c = text[ii];
        if (c == '-' || static_cast<unsigned char>(c) <= ' ') {
            continue;
        }
        const int32_t nibble = hexCharToInt(c);
        if (nibble < 0 || digits == 32) {
            throw MalformedLiteralException(text);
        }
        if (digits < 16) {
            high = (high << 4) | static_cast<uint64_t>(nibble);
        } else {
            low = (low << 4) | static_cast<uint64_t>(nibble);
        }
        digits++;
    }
    if (digits != 32) {
        throw MalformedLiteralException(text);
    }
    return getUuidValue(static_cast<int64_t>(high), static_cast<int64_t>(low));
}

Value ValueFactory::getEnumValue(std::shared_ptr<const ExtTypeInfoEnum> const& enumerators, int ordinal) {
    vcassert(enumerators != NULL);
    std::shared_ptr<ValueBody> body = newBody(ValueType::tENUM);
    body->m_long = ordinal;
    body->m_bytes = enumerators->getEnumerator(ordinal);
    body->m_enumerators = enumerators;
    return publish(body, false);
}

Value ValueFactory::getGeometryValue(std::string const& ewkb, std::shared_ptr<const GeometryCodec> const& codec) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tGEOMETRY);
    body->m_bytes = ewkb;
    body->m_codec = codec;
    return publish(body, false);
}

Value ValueFactory::getArrayValue(std::vector<Value> const& elements) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tARRAY);
    body->m_elements = elements;
    return publish(body, false);
}

Value ValueFactory::getRowValue(std::vector<Value> const& elements) {
    std::shared_ptr<ValueBody> body = newBody(ValueType::tROW);
    body->m_elements = elements;
    return publish(body, false);
}

Value ValueFactory::getResultSetValue(std::shared_ptr<const ResultInterface> const& result) {
    vcassert(result != NULL);
    std::shared_ptr<ValueBody> body = newBody(ValueType::tRESULT_SET);
    body->m_result = result;
    return publish(body, false);
}

Value ValueFactory::createSmallLob(ValueType type, std::string const& data) {
    if (type != ValueType::tBLOB && type != ValueType::tCLOB) {
        throwFatalException("Cannot create a large object of type %s", getTypeName(type).c_str());
    }
    std::shared_ptr<ValueBody> body = newBody(type);
    body->m_bytes = data;
    return publish(body, false);
}

}
