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

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "common/Decimal.h"
#include "common/FloatFormat.h"
#include "common/ValueExceptions.h"

namespace valuecore {

/**
 * Range checks applied whenever a numeric value is narrowed. Every failure
 * is a NumericOverflowException naming the offending value and, when
 * known, the column it was headed for.
 */

template<typename T>
[[noreturn]] void throwNumericValueOutOfRange(const T value, std::string const& column);

template<>
[[noreturn]] inline void throwNumericValueOutOfRange<int64_t>(const int64_t value, std::string const& column) {
    // record underflow or overflow for callers that clamp instead of failing
    int internalFlags = 0;
    if (value > 0) {
        internalFlags |= SQLException::TYPE_OVERFLOW;
    } else if (value < 0) {
        internalFlags |= SQLException::TYPE_UNDERFLOW;
    }
    throw NumericOverflowException(std::to_string(value), column, internalFlags);
}

template<>
[[noreturn]] inline void throwNumericValueOutOfRange<double>(const double value, std::string const& column) {
    throw NumericOverflowException(formatDouble(value), column,
            value < 0 ? SQLException::TYPE_UNDERFLOW : SQLException::TYPE_OVERFLOW);
}

template<>
[[noreturn]] inline void throwNumericValueOutOfRange<Decimal>(const Decimal value, std::string const& column) {
    throw NumericOverflowException(value.toString(), column,
            value.signum() < 0 ? SQLException::TYPE_UNDERFLOW : SQLException::TYPE_OVERFLOW);
}

/**
 * Narrows a 64-bit integer to T (int8_t, int16_t or int32_t).
 */
template<typename T>
inline T narrowTo(const int64_t value, std::string const& column = std::string()) {
    if (value < static_cast<int64_t>(std::numeric_limits<T>::min())
            || value > static_cast<int64_t>(std::numeric_limits<T>::max())) {
        throwNumericValueOutOfRange<int64_t>(value, column);
    }
    return static_cast<T>(value);
}

/**
 * Rounds to the nearest integer, ties away from zero. NaN becomes 0;
 * anything beyond the BIGINT range is out of range.
 */
inline int64_t roundToLong(const double value, std::string const& column = std::string()) {
    // 2^63 is exactly representable; every double below it converts safely
    static const double LONG_RANGE_LIMIT = 9223372036854775808.0;
    if (value >= LONG_RANGE_LIMIT || value < -LONG_RANGE_LIMIT) {
        throwNumericValueOutOfRange<double>(value, column);
    }
    if (std::isnan(value)) {
        return 0;
    }
    const double rounded = std::round(value);
    if (rounded >= LONG_RANGE_LIMIT) {
        throwNumericValueOutOfRange<double>(value, column);
    }
    return static_cast<int64_t>(rounded);
}

/**
 * Rounds HALF_UP to an integer after an exact check against the BIGINT
 * bounds, so 9223372036854775807.4 is rejected although it would round
 * into range.
 */
inline int64_t roundToLong(const Decimal& value, std::string const& column = std::string()) {
    static const Decimal LONG_MAX_DECIMAL = Decimal::fromInt64(std::numeric_limits<int64_t>::max());
    static const Decimal LONG_MIN_DECIMAL = Decimal::fromInt64(std::numeric_limits<int64_t>::min());
    if (value.compareTo(LONG_MAX_DECIMAL) > 0 || value.compareTo(LONG_MIN_DECIMAL) < 0) {
        throwNumericValueOutOfRange<Decimal>(value, column);
    }
    return value.setScale(0, RoundingMode::HALF_UP).unscaled().ToInt();
}

}
