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

#include <cerrno>
#include <cstdlib>
#include <limits>

#include <boost/algorithm/string.hpp>

#include "common/CastDataProvider.h"
#include "common/DateTimeUtils.h"
#include "common/ExtTypeInfo.h"
#include "common/FloatFormat.h"
#include "common/GeometryCodec.h"
#include "common/IntervalUtils.h"
#include "common/NumericGuard.h"
#include "common/ResultInterface.h"
#include "common/SimpleResult.h"
#include "common/ValueBody.hpp"
#include "common/ValueExceptions.h"
#include "common/ValueFactory.hpp"

namespace valuecore {

static std::string trimmed(std::string const& text) {
    return boost::algorithm::trim_copy(text);
}

// Width in bytes of the integer types.
static int integralWidth(ValueType type) {
    switch (type) {
    case ValueType::tTINYINT:
        return 1;
    case ValueType::tSMALLINT:
        return 2;
    case ValueType::tINTEGER:
        return 4;
    default:
        return 8;
    }
}

static std::string toBigEndian(int64_t value, int width) {
    std::string out(width, '\0');
    uint64_t bits = static_cast<uint64_t>(value);
    for (int ii = width - 1; ii >= 0; ii--) {
        out[ii] = static_cast<char>(bits & 0xff);
        bits >>= 8;
    }
    return out;
}

// Reads 'width' bytes at 'offset' as a signed big-endian integer.
static int64_t fromBigEndian(std::string const& bytes, size_t offset, int width) {
    uint64_t bits = 0;
    for (int ii = 0; ii < width; ii++) {
        bits = (bits << 8) | static_cast<uint8_t>(bytes[offset + ii]);
    }
    if (width < 8 && (bits & (1ULL << (width * 8 - 1))) != 0) {
        bits |= ~0ULL << (width * 8);
    }
    return static_cast<int64_t>(bits);
}

static Value integralValue(ValueType targetType, int64_t value, std::string const& column) {
    switch (targetType) {
    case ValueType::tTINYINT:
        return ValueFactory::getTinyIntValue(narrowTo<int8_t>(value, column));
    case ValueType::tSMALLINT:
        return ValueFactory::getSmallIntValue(narrowTo<int16_t>(value, column));
    case ValueType::tINTEGER:
        return ValueFactory::getIntegerValue(narrowTo<int32_t>(value, column));
    default:
        return ValueFactory::getBigIntValue(value);
    }
}

/*
 * Decimal digits of an integer literal of the target width. Syntax errors
 * and values the width cannot hold are both malformed literals.
 */
static int64_t parseIntegral(ValueType targetType, std::string const& text) {
    const std::string digits = trimmed(text);
    if (digits.empty()) {
        throw MalformedLiteralException(text);
    }
    errno = 0;
    char* end = NULL;
    const long long parsed = strtoll(digits.c_str(), &end, 10);
    if (errno == ERANGE || end == digits.c_str() || *end != '\0') {
        throw MalformedLiteralException(text);
    }
    const int bits = integralWidth(targetType) * 8;
    if (bits < 64) {
        const int64_t limit = static_cast<int64_t>(1) << (bits - 1);
        if (parsed < -limit || parsed >= limit) {
            throw MalformedLiteralException(text);
        }
    }
    return static_cast<int64_t>(parsed);
}

static double parseFloating(std::string const& text) {
    double result = 0.0;
    if (! parseDouble(trimmed(text), &result)) {
        throw MalformedLiteralException(text);
    }
    return result;
}

// Signed leading field of a single field interval.
static int64_t signedLeading(const ValueBody& b) {
    return b.m_negative ? -b.m_long : b.m_long;
}

// YEAR TO MONTH, SECOND and the compound day-time qualifiers keep fractions.
static bool takesFractionalValue(ValueType qualifier) {
    switch (qualifier) {
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
        return false;
    default:
        return true;
    }
}

// Seconds of the local date/time an instant falls on in 'zone'.
static int64_t localSecondsOf(int64_t dateValue, int64_t nanos, int32_t offsetSeconds,
                              const TimeZoneProvider& zone) {
    const int64_t epochSeconds = datetime::getEpochSeconds(dateValue, nanos, offsetSeconds);
    return epochSeconds + zone.getTimeZoneOffsetUTC(epochSeconds);
}

// ------------------------------------------------------------------
// Entry points
// ------------------------------------------------------------------

Value Value::convertTo(ValueType targetType) const {
    return convertTo(targetType, NULL, NULL, std::string());
}

Value Value::convertTo(ValueType targetType, const CastDataProvider* provider) const {
    return convertTo(targetType, NULL, provider, std::string());
}

Value Value::convertTo(TypeInfo const& targetType, const CastDataProvider* provider,
                       std::string const& column) const {
    Value result = convertTo(targetType.getValueType(), targetType.getExtTypeInfo().get(), provider, column);
    const ValueType type = result.getValueType();
    if (type == ValueType::tNUMERIC) {
        result = result.convertScale(false, targetType.getScale());
        if (! result.checkPrecision(targetType.getPrecision())) {
            const Decimal& value = result.body().m_decimal;
            throw NumericOverflowException(value.toString(), column,
                    value.signum() < 0 ? SQLException::TYPE_UNDERFLOW : SQLException::TYPE_OVERFLOW);
        }
    } else if (isCharacterType(type) || type == ValueType::tVARBINARY || type == ValueType::tJAVA_OBJECT
               || type == ValueType::tBLOB) {
        result = result.convertPrecision(targetType.getPrecision());
    }
    return result;
}

Value Value::convertTo(ValueType targetType, const ExtTypeInfo* extTypeInfo,
                       const CastDataProvider* provider, std::string const& column) const {
    const ValueType sourceType = getValueType();
    if (sourceType == ValueType::tNULL) {
        return *this;
    }
    if (targetType == ValueType::tNULL) {
        return Value();
    }
    const CastDataProvider& castProvider = provider != NULL ? *provider : CastDataProvider::getDefault();
    if (sourceType == targetType) {
        if (extTypeInfo != NULL) {
            return extTypeInfo->cast(*this, &castProvider);
        }
        return *this;
    }
    switch (targetType) {
    case ValueType::tBOOLEAN:
        return convertToBoolean();
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
        return convertToIntegral(targetType, column);
    case ValueType::tNUMERIC:
        return convertToNumeric(column);
    case ValueType::tDOUBLE:
        return convertToDouble();
    case ValueType::tREAL:
        return convertToReal();
    case ValueType::tDATE:
        return convertToDate(castProvider);
    case ValueType::tTIME:
        return convertToTime(castProvider);
    case ValueType::tTIME_TZ:
        return convertToTimeTimeZone(castProvider);
    case ValueType::tTIMESTAMP:
        return convertToTimestamp(castProvider);
    case ValueType::tTIMESTAMP_TZ:
        return convertToTimestampTimeZone(castProvider);
    case ValueType::tVARBINARY:
        return convertToVarbinary();
    case ValueType::tVARCHAR:
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR:
        return convertToCharacter(targetType);
    case ValueType::tJAVA_OBJECT:
        return convertToJavaObject();
    case ValueType::tENUM:
        return convertToEnum(extTypeInfo);
    case ValueType::tBLOB:
        return convertToBlob();
    case ValueType::tCLOB:
        return convertToClob();
    case ValueType::tUUID:
        return convertToUuid();
    case ValueType::tGEOMETRY:
        return convertToGeometry(extTypeInfo, castProvider);
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
        return convertToInterval(targetType, column);
    case ValueType::tJSON:
        return convertToJson();
    case ValueType::tARRAY:
        return convertToArray();
    case ValueType::tROW:
        return convertToRow();
    case ValueType::tRESULT_SET:
        return convertToResultSet();
    default:
        throwDataConversion(targetType);
    }
}

// ------------------------------------------------------------------
// Scale and precision
// ------------------------------------------------------------------

Value Value::convertScale(bool onlyToSmallerScale, int targetScale) const {
    if (getValueType() != ValueType::tNUMERIC) {
        return *this;
    }
    const Decimal& value = body().m_decimal;
    if (value.scale() == targetScale || (onlyToSmallerScale && value.scale() <= targetScale)) {
        return *this;
    }
    return ValueFactory::getDecimalValue(value.setScale(targetScale, RoundingMode::HALF_UP));
}

Value Value::convertPrecision(int64_t precision) const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tVARCHAR:
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR:
    case ValueType::tCLOB: {
        if (getCharLength(b.m_bytes) <= precision) {
            return *this;
        }
        const std::string prefix = getCharPrefix(b.m_bytes, precision);
        if (b.m_type == ValueType::tVARCHAR) {
            return ValueFactory::getStringValue(prefix);
        } else if (b.m_type == ValueType::tVARCHAR_IGNORECASE) {
            return ValueFactory::getIgnoreCaseStringValue(prefix);
        } else if (b.m_type == ValueType::tCHAR) {
            return ValueFactory::getCharValue(prefix);
        }
        return ValueFactory::createSmallLob(ValueType::tCLOB, prefix);
    }
    case ValueType::tVARBINARY:
    case ValueType::tJAVA_OBJECT:
    case ValueType::tBLOB: {
        if (static_cast<int64_t>(b.m_bytes.size()) <= precision) {
            return *this;
        }
        const std::string prefix = b.m_bytes.substr(0, static_cast<size_t>(precision));
        if (b.m_type == ValueType::tVARBINARY) {
            return ValueFactory::getBinaryValue(prefix);
        } else if (b.m_type == ValueType::tJAVA_OBJECT) {
            return ValueFactory::getJavaObjectValue(prefix);
        }
        return ValueFactory::createSmallLob(ValueType::tBLOB, prefix);
    }
    default:
        return *this;
    }
}

// ------------------------------------------------------------------
// Per-target rules
// ------------------------------------------------------------------

Value Value::convertToBoolean() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
    case ValueType::tNUMERIC:
    case ValueType::tDOUBLE:
    case ValueType::tREAL:
        return ValueFactory::getBooleanValue(getSignum() != 0);
    case ValueType::tTIME:
    case ValueType::tDATE:
    case ValueType::tTIMESTAMP:
    case ValueType::tTIMESTAMP_TZ:
    case ValueType::tVARBINARY:
    case ValueType::tJAVA_OBJECT:
    case ValueType::tUUID:
    case ValueType::tENUM:
        throwDataConversion(ValueType::tBOOLEAN);
    default:
        break;
    }
    const std::string text = getString();
    const std::string word = boost::algorithm::to_lower_copy(trimmed(text));
    if (word == "true" || word == "t" || word == "yes" || word == "y") {
        return ValueFactory::getTrue();
    }
    if (word == "false" || word == "f" || word == "no" || word == "n") {
        return ValueFactory::getFalse();
    }
    Decimal number;
    try {
        number = Decimal::parse(word);
    } catch (const MalformedLiteralException&) {
        throw MalformedLiteralException(text);
    }
    if (number.signum() == 0) {
        // a mantissa rounded away at the maximum scale is still non-zero
        const std::string mantissa = word.substr(0, word.find('e'));
        return ValueFactory::getBooleanValue(mantissa.find_first_of("123456789") != std::string::npos);
    }
    return ValueFactory::getTrue();
}

Value Value::convertToIntegral(ValueType targetType, std::string const& column) const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tBOOLEAN:
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
    case ValueType::tENUM:
        return integralValue(targetType, b.m_long, column);
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
        return integralValue(targetType, signedLeading(b), column);
    case ValueType::tNUMERIC:
        return integralValue(targetType, roundToLong(b.m_decimal, column), column);
    case ValueType::tDOUBLE:
        return integralValue(targetType, roundToLong(b.m_double, column), column);
    case ValueType::tREAL:
        return integralValue(targetType, roundToLong(static_cast<double>(b.m_float), column), column);
    case ValueType::tVARBINARY: {
        const int width = integralWidth(targetType);
        // bytes of another width are rejected, not read as digit text
        if (b.m_bytes.size() != static_cast<size_t>(width)) {
            throwDataConversion(targetType);
        }
        return integralValue(targetType, fromBigEndian(b.m_bytes, 0, width), column);
    }
    case ValueType::tTIMESTAMP_TZ:
        throwDataConversion(targetType);
    default:
        return integralValue(targetType, parseIntegral(targetType, getString()), column);
    }
}

Value Value::convertToNumeric(std::string const& column) const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tBOOLEAN:
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
    case ValueType::tENUM:
        return ValueFactory::getDecimalValue(Decimal::fromInt64(b.m_long));
    case ValueType::tDOUBLE:
        if (! isFiniteDouble(b.m_double)) {
            throwDataConversion(ValueType::tNUMERIC);
        }
        return ValueFactory::getDecimalValue(Decimal::fromDouble(b.m_double));
    case ValueType::tREAL:
        if (! isFiniteDouble(b.m_float)) {
            throwDataConversion(ValueType::tNUMERIC);
        }
        // the text of a REAL has fewer digits than that of the same number as a DOUBLE
        return ValueFactory::getDecimalValue(Decimal::parse(formatFloat(b.m_float)));
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
        return ValueFactory::getDecimalValue(interval::getDecimal(b.m_type, b.m_negative, b.m_long, b.m_long2));
    case ValueType::tTIMESTAMP_TZ:
        throwDataConversion(ValueType::tNUMERIC);
    default: {
        const std::string text = getString();
        try {
            return ValueFactory::getDecimalValue(Decimal::parse(trimmed(text)));
        } catch (const MalformedLiteralException&) {
            throw MalformedLiteralException(text);
        } catch (const NumericOverflowException& e) {
            throw NumericOverflowException(e.valueText(), column, e.getInternalFlags());
        }
    }
    }
}

Value Value::convertToDouble() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tBOOLEAN:
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
        return ValueFactory::getDoubleValue(static_cast<double>(b.m_long));
    case ValueType::tNUMERIC:
        return ValueFactory::getDoubleValue(b.m_decimal.toDouble());
    case ValueType::tREAL:
        return ValueFactory::getDoubleValue(static_cast<double>(b.m_float));
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
        return ValueFactory::getDoubleValue(static_cast<double>(signedLeading(b)));
    case ValueType::tINTERVAL_SECOND:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
    case ValueType::tINTERVAL_DAY_TO_HOUR:
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        return ValueFactory::getDoubleValue(
                interval::getDecimal(b.m_type, b.m_negative, b.m_long, b.m_long2).toDouble());
    case ValueType::tENUM:
    case ValueType::tTIMESTAMP_TZ:
        throwDataConversion(ValueType::tDOUBLE);
    default:
        return ValueFactory::getDoubleValue(parseFloating(getString()));
    }
}

Value Value::convertToReal() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tBOOLEAN:
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
        return ValueFactory::getRealValue(static_cast<float>(b.m_long));
    case ValueType::tNUMERIC:
        return ValueFactory::getRealValue(static_cast<float>(b.m_decimal.toDouble()));
    case ValueType::tDOUBLE:
        return ValueFactory::getRealValue(static_cast<float>(b.m_double));
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
        return ValueFactory::getRealValue(static_cast<float>(signedLeading(b)));
    case ValueType::tINTERVAL_SECOND:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
    case ValueType::tINTERVAL_DAY_TO_HOUR:
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        return ValueFactory::getRealValue(static_cast<float>(
                interval::getDecimal(b.m_type, b.m_negative, b.m_long, b.m_long2).toDouble()));
    case ValueType::tENUM:
    case ValueType::tTIMESTAMP_TZ:
        throwDataConversion(ValueType::tREAL);
    default:
        return ValueFactory::getRealValue(static_cast<float>(parseFloating(getString())));
    }
}

Value Value::convertToDate(const CastDataProvider& provider) const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tTIMESTAMP:
        return ValueFactory::getDateValue(b.m_long);
    case ValueType::tTIMESTAMP_TZ: {
        const int64_t localSeconds = localSecondsOf(b.m_long, b.m_long2, b.m_offsetSeconds,
                                                    provider.currentTimeZone());
        return ValueFactory::getDateValue(datetime::dateValueFromLocalSeconds(localSeconds));
    }
    case ValueType::tTIME:
    case ValueType::tTIME_TZ:
    case ValueType::tENUM:
        throwDataConversion(ValueType::tDATE);
    default:
        return ValueFactory::getDateValue(datetime::parseDateValue(trimmed(getString()), "DATE"));
    }
}

// Nanos of day of a TIME WITH TIME ZONE moved to the session's offset.
static int64_t localTimeNanos(const ValueBody& b, const CastDataProvider& provider) {
    const int32_t localOffset = provider.currentTimestamp().getTimeZoneOffsetSeconds();
    return datetime::normalizeNanosOfDay(
            b.m_long2 + static_cast<int64_t>(localOffset - b.m_offsetSeconds) * NANOS_PER_SECOND);
}

Value Value::convertToTime(const CastDataProvider& provider) const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tTIME_TZ:
        return ValueFactory::getTimeValue(localTimeNanos(b, provider));
    case ValueType::tTIMESTAMP:
        return ValueFactory::getTimeValue(b.m_long2);
    case ValueType::tTIMESTAMP_TZ: {
        const int64_t localSeconds = localSecondsOf(b.m_long, b.m_long2, b.m_offsetSeconds,
                                                    provider.currentTimeZone());
        return ValueFactory::getTimeValue(datetime::nanosFromLocalSeconds(localSeconds)
                                          + b.m_long2 % NANOS_PER_SECOND);
    }
    case ValueType::tDATE:
    case ValueType::tENUM:
        throwDataConversion(ValueType::tTIME);
    default: {
        const datetime::ParsedTime parsed = datetime::parseTime(trimmed(getString()), "TIME");
        if (! parsed.hasOffset) {
            return ValueFactory::getTimeValue(parsed.nanos);
        }
        const int32_t localOffset = provider.currentTimestamp().getTimeZoneOffsetSeconds();
        return ValueFactory::getTimeValue(datetime::normalizeNanosOfDay(
                parsed.nanos + static_cast<int64_t>(localOffset - parsed.offsetSeconds) * NANOS_PER_SECOND));
    }
    }
}

Value Value::convertToTimeTimeZone(const CastDataProvider& provider) const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tTIME:
        return ValueFactory::getTimeTzValue(b.m_long2, provider.currentTimestamp().getTimeZoneOffsetSeconds());
    case ValueType::tTIMESTAMP:
        return ValueFactory::getTimeTzValue(b.m_long2,
                provider.currentTimeZone().getTimeZoneOffsetLocal(b.m_long, b.m_long2));
    case ValueType::tTIMESTAMP_TZ:
        return ValueFactory::getTimeTzValue(b.m_long2, b.m_offsetSeconds);
    case ValueType::tDATE:
    case ValueType::tENUM:
        throwDataConversion(ValueType::tTIME_TZ);
    default: {
        const datetime::ParsedTime parsed = datetime::parseTime(trimmed(getString()), "TIME WITH TIME ZONE");
        return ValueFactory::getTimeTzValue(parsed.nanos, parsed.hasOffset ? parsed.offsetSeconds
                : provider.currentTimestamp().getTimeZoneOffsetSeconds());
    }
    }
}

Value Value::convertToTimestamp(const CastDataProvider& provider) const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tTIME:
        return ValueFactory::getTimestampValue(provider.currentTimestamp().getDateValue(), b.m_long2);
    case ValueType::tTIME_TZ:
        return ValueFactory::getTimestampValue(provider.currentTimestamp().getDateValue(),
                                               localTimeNanos(b, provider));
    case ValueType::tDATE:
        return ValueFactory::getTimestampValue(b.m_long, 0);
    case ValueType::tTIMESTAMP_TZ: {
        const int64_t localSeconds = localSecondsOf(b.m_long, b.m_long2, b.m_offsetSeconds,
                                                    provider.currentTimeZone());
        return ValueFactory::getTimestampValue(datetime::dateValueFromLocalSeconds(localSeconds),
                datetime::nanosFromLocalSeconds(localSeconds) + b.m_long2 % NANOS_PER_SECOND);
    }
    case ValueType::tENUM:
        throwDataConversion(ValueType::tTIMESTAMP);
    default: {
        const datetime::ParsedTimestamp parsed = datetime::parseTimestamp(trimmed(getString()), "TIMESTAMP");
        if (! parsed.hasOffset) {
            return ValueFactory::getTimestampValue(parsed.dateValue, parsed.nanos);
        }
        const int64_t localSeconds = localSecondsOf(parsed.dateValue, parsed.nanos, parsed.offsetSeconds,
                                                    provider.currentTimeZone());
        return ValueFactory::getTimestampValue(datetime::dateValueFromLocalSeconds(localSeconds),
                datetime::nanosFromLocalSeconds(localSeconds) + parsed.nanos % NANOS_PER_SECOND);
    }
    }
}

Value Value::convertToTimestampTimeZone(const CastDataProvider& provider) const {
    const ValueBody& b = body();
    const TimeZoneProvider& zone = provider.currentTimeZone();
    switch (b.m_type) {
    case ValueType::tTIME: {
        const int64_t dateValue = provider.currentTimestamp().getDateValue();
        return ValueFactory::getTimestampTzValue(dateValue, b.m_long2,
                                                 zone.getTimeZoneOffsetLocal(dateValue, b.m_long2));
    }
    case ValueType::tTIME_TZ:
        return ValueFactory::getTimestampTzValue(provider.currentTimestamp().getDateValue(),
                                                 b.m_long2, b.m_offsetSeconds);
    case ValueType::tDATE:
        return ValueFactory::getTimestampTzValue(b.m_long, 0, zone.getTimeZoneOffsetLocal(b.m_long, 0));
    case ValueType::tTIMESTAMP:
        return ValueFactory::getTimestampTzValue(b.m_long, b.m_long2,
                                                 zone.getTimeZoneOffsetLocal(b.m_long, b.m_long2));
    case ValueType::tENUM:
        throwDataConversion(ValueType::tTIMESTAMP_TZ);
    default: {
        const datetime::ParsedTimestamp parsed =
                datetime::parseTimestamp(trimmed(getString()), "TIMESTAMP WITH TIME ZONE");
        return ValueFactory::getTimestampTzValue(parsed.dateValue, parsed.nanos, parsed.hasOffset
                ? parsed.offsetSeconds : zone.getTimeZoneOffsetLocal(parsed.dateValue, parsed.nanos));
    }
    }
}

Value Value::convertToVarbinary() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tJAVA_OBJECT:
    case ValueType::tBLOB:
    case ValueType::tGEOMETRY:
    case ValueType::tJSON:
        return ValueFactory::getBinaryValue(b.m_bytes);
    case ValueType::tUUID:
        return ValueFactory::getBinaryValue(toBigEndian(b.m_long, 8) + toBigEndian(b.m_long2, 8));
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
        return ValueFactory::getBinaryValue(toBigEndian(b.m_long, integralWidth(b.m_type)));
    case ValueType::tENUM:
    case ValueType::tTIMESTAMP_TZ:
        throwDataConversion(ValueType::tVARBINARY);
    default:
        return ValueFactory::getBinaryValue(getString());
    }
}

Value Value::convertToCharacter(ValueType targetType) const {
    const std::string text = getString();
    switch (targetType) {
    case ValueType::tVARCHAR_IGNORECASE:
        return ValueFactory::getIgnoreCaseStringValue(text);
    case ValueType::tCHAR:
        return ValueFactory::getCharValue(text);
    default:
        return ValueFactory::getStringValue(text);
    }
}

Value Value::convertToJavaObject() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tVARBINARY:
    case ValueType::tBLOB:
    case ValueType::tGEOMETRY:
        return ValueFactory::getJavaObjectValue(b.m_bytes);
    case ValueType::tENUM:
    case ValueType::tTIMESTAMP_TZ:
        throwDataConversion(ValueType::tJAVA_OBJECT);
    default: {
        const std::string text = getString();
        std::string bytes;
        if (! hexDecodeToBinary(trimmed(text), &bytes)) {
            throw MalformedLiteralException(text);
        }
        return ValueFactory::getJavaObjectValue(bytes);
    }
    }
}

Value Value::convertToEnum(const ExtTypeInfo* extTypeInfo) const {
    const ExtTypeInfoEnum* enumerators = dynamic_cast<const ExtTypeInfoEnum*>(extTypeInfo);
    if (enumerators == NULL) {
        throwDataConversion(ValueType::tENUM);
    }
    switch (getValueType()) {
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
    case ValueType::tNUMERIC:
        return enumerators->getValue(asInt());
    case ValueType::tVARCHAR:
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR:
        return enumerators->getValue(getString());
    default:
        throwDataConversion(ValueType::tENUM);
    }
}

Value Value::convertToBlob() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tVARBINARY:
    case ValueType::tGEOMETRY:
    case ValueType::tJSON:
        return ValueFactory::createSmallLob(ValueType::tBLOB, b.m_bytes);
    case ValueType::tUUID:
        return ValueFactory::createSmallLob(ValueType::tBLOB,
                                            toBigEndian(b.m_long, 8) + toBigEndian(b.m_long2, 8));
    case ValueType::tTIMESTAMP_TZ:
        throwDataConversion(ValueType::tBLOB);
    default:
        return ValueFactory::createSmallLob(ValueType::tBLOB, getString());
    }
}

Value Value::convertToClob() const {
    return ValueFactory::createSmallLob(ValueType::tCLOB, getString());
}

Value Value::convertToUuid() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tVARBINARY:
        if (b.m_bytes.size() >= 16) {
            return ValueFactory::getUuidValue(fromBigEndian(b.m_bytes, 0, 8), fromBigEndian(b.m_bytes, 8, 8));
        }
        return ValueFactory::getUuidValueFromString(hexEncode(b.m_bytes));
    case ValueType::tJAVA_OBJECT:
    case ValueType::tTIMESTAMP_TZ:
        throwDataConversion(ValueType::tUUID);
    default:
        return ValueFactory::getUuidValueFromString(getString());
    }
}

Value Value::convertToGeometry(const ExtTypeInfo* extTypeInfo, const CastDataProvider& provider) const {
    const std::shared_ptr<const GeometryCodec> codec = provider.getGeometryCodec();
    if (codec == NULL) {
        throwDataConversion(ValueType::tGEOMETRY);
    }
    const ValueBody& b = body();
    Value result;
    try {
        switch (b.m_type) {
        case ValueType::tVARBINARY:
            result = ValueFactory::getGeometryValue(codec->parseEwkb(b.m_bytes), codec);
            break;
        case ValueType::tJSON: {
            const ExtTypeInfoGeometry* geometry = dynamic_cast<const ExtTypeInfoGeometry*>(extTypeInfo);
            const int32_t srid = (geometry != NULL && geometry->hasSrid()) ? geometry->getSrid() : 0;
            result = ValueFactory::getGeometryValue(codec->geoJsonToEwkb(b.m_bytes, srid), codec);
            break;
        }
        case ValueType::tJAVA_OBJECT:
        case ValueType::tTIMESTAMP_TZ:
            throwDataConversion(ValueType::tGEOMETRY);
        default:
            result = ValueFactory::getGeometryValue(codec->parseWkt(getString()), codec);
            break;
        }
    } catch (const GeometryCodecException& e) {
        throw DataConversionException(getTraceSQL() + ": " + e.message());
    }
    if (extTypeInfo != NULL) {
        return extTypeInfo->cast(result, &provider);
    }
    return result;
}

// Nanoseconds in one unit of the leading field of a fractional day-time interval.
static int64_t dayTimeMultiplier(ValueType qualifier) {
    switch (qualifier) {
    case ValueType::tINTERVAL_SECOND:
        return NANOS_PER_SECOND;
    case ValueType::tINTERVAL_DAY_TO_HOUR:
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
        return NANOS_PER_DAY;
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
        return NANOS_PER_HOUR;
    default:
        return NANOS_PER_MINUTE;
    }
}

static Value intervalValue(ValueType qualifier, interval::IntervalFields const& fields) {
    return ValueFactory::getIntervalValue(qualifier, fields.negative, fields.leading, fields.remaining);
}

// The interval field checks know nothing about the target column.
static Value intervalFromAbsolute(ValueType qualifier, TTInt const& absolute, std::string const& column) {
    try {
        return intervalValue(qualifier, interval::intervalFromAbsolute(qualifier, absolute));
    } catch (const NumericOverflowException& e) {
        if (column.empty() || !e.column().empty()) {
            throw;
        }
        throw NumericOverflowException(e.valueText(), column, e.getInternalFlags());
    }
}

Value Value::convertToInterval(ValueType targetType, std::string const& column) const {
    const ValueBody& b = body();
    const bool yearMonth = isYearMonthIntervalType(targetType);
    int64_t leading = 0;
    switch (b.m_type) {
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
        leading = b.m_long;
        break;
    case ValueType::tREAL:
    case ValueType::tDOUBLE:
    case ValueType::tNUMERIC: {
        if (takesFractionalValue(targetType)) {
            const int64_t multiplier = yearMonth ? 12 : dayTimeMultiplier(targetType);
            const Decimal absolute = asDecimal().multiply(Decimal::fromInt64(multiplier))
                    .setScale(0, RoundingMode::HALF_UP);
            return intervalFromAbsolute(targetType, absolute.unscaled(), column);
        }
        if (b.m_type == ValueType::tNUMERIC) {
            leading = roundToLong(b.m_decimal, column);
        } else {
            leading = roundToLong(b.m_type == ValueType::tDOUBLE ? b.m_double : static_cast<double>(b.m_float),
                                  column);
        }
        break;
    }
    case ValueType::tVARCHAR:
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR: {
        const std::string text = getString();
        try {
            return intervalValue(targetType, interval::parseFormattedInterval(targetType, text));
        } catch (const InvalidIntervalLiteralException&) {
            throw;
        } catch (const SQLException&) {
            throw InvalidIntervalLiteralException(getIntervalQualifierName(targetType), text);
        }
    }
    default:
        if (isIntervalType(b.m_type) && isYearMonthIntervalType(b.m_type) == yearMonth) {
            return intervalFromAbsolute(targetType,
                    interval::intervalToAbsolute(b.m_type, b.m_negative, b.m_long, b.m_long2), column);
        }
        throwDataConversion(targetType);
    }
    if (leading < -interval::MAX_LEADING_FIELD || leading > interval::MAX_LEADING_FIELD) {
        throwNumericValueOutOfRange<int64_t>(leading, column);
    }
    const bool negative = leading < 0;
    return ValueFactory::getIntervalValue(targetType, negative, negative ? -leading : leading, 0);
}

Value Value::convertToJson() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tBOOLEAN:
        return ValueFactory::getJsonValue(b.m_long != 0 ? "true" : "false");
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
        return ValueFactory::getJsonValue(std::to_string(b.m_long));
    case ValueType::tREAL:
    case ValueType::tDOUBLE:
        if (! isFiniteDouble(b.m_type == ValueType::tDOUBLE ? b.m_double : static_cast<double>(b.m_float))) {
            throwDataConversion(ValueType::tJSON);
        }
        return ValueFactory::getJsonValue(b.m_type == ValueType::tDOUBLE ? formatDouble(b.m_double)
                                                                        : formatFloat(b.m_float));
    case ValueType::tNUMERIC:
        return ValueFactory::getJsonValue(b.m_decimal.toString());
    case ValueType::tVARBINARY:
    case ValueType::tBLOB:
        return ValueFactory::getJsonValue(b.m_bytes);
    case ValueType::tVARCHAR:
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR:
    case ValueType::tCLOB:
        return ValueFactory::getJsonStringValue(b.m_bytes);
    case ValueType::tGEOMETRY:
        if (b.m_codec == NULL) {
            throwDataConversion(ValueType::tJSON);
        }
        try {
            return ValueFactory::getJsonValue(b.m_codec->ewkbToGeoJson(b.m_bytes));
        } catch (const GeometryCodecException& e) {
            throw DataConversionException(getTraceSQL() + ": " + e.message());
        }
    default:
        throwDataConversion(ValueType::tJSON);
    }
}

Value Value::convertToArray() const {
    const ValueBody& b = body();
    switch (b.m_type) {
    case ValueType::tROW:
        return ValueFactory::getArrayValue(b.m_elements);
    case ValueType::tBLOB:
    case ValueType::tCLOB:
    case ValueType::tRESULT_SET:
        return ValueFactory::getArrayValue(std::vector<Value>(1, ValueFactory::getStringValue(getString())));
    default:
        return ValueFactory::getArrayValue(std::vector<Value>(1, *this));
    }
}

Value Value::convertToRow() const {
    if (getValueType() != ValueType::tRESULT_SET) {
        return ValueFactory::getRowValue(std::vector<Value>(1, *this));
    }
    std::shared_ptr<ResultInterface> cursor = body().m_result->createShallowCopy();
    if (! cursor->next()) {
        return Value();
    }
    const std::vector<Value> row = cursor->currentRow();
    if (cursor->hasNext()) {
        throw ScalarSubqueryCardinalityException();
    }
    return ValueFactory::getRowValue(row);
}

Value Value::convertToResultSet() const {
    std::shared_ptr<SimpleResult> result = std::make_shared<SimpleResult>();
    if (getValueType() == ValueType::tROW) {
        const std::vector<Value>& values = body().m_elements;
        for (size_t ii = 0; ii < values.size(); ii++) {
            result->addColumn("C" + std::to_string(ii + 1), values[ii].getType());
        }
        result->addRow(values);
    } else {
        result->addColumn("X", getType());
        result->addRow(std::vector<Value>(1, *this));
    }
    return ValueFactory::getResultSetValue(result);
}

}
