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
#include <string>

#include "ttmath/ttmathint.h"

namespace valuecore {

// 128-bit signed integer holding a decimal's unscaled value.
using TTInt = ttmath::Int<2>;
// Double width, for intermediate results that may overflow TTInt.
using TTLInt = ttmath::Int<4>;

enum class RoundingMode {
    HALF_UP,
    HALF_DOWN,
    DOWN
};

/**
 * Exact decimal number: unscaled * 10^-scale. At most kMaxPrecision
 * significant digits and a scale in [0, kMaxScale]. Operations that
 * would exceed either bound throw NumericOverflowException rather than
 * lose digits.
 */
class Decimal {
public:
    static constexpr int kMaxPrecision = 38;
    static constexpr int kMaxScale = 38;

    Decimal() : m_scale(0) {
        m_unscaled.SetZero();
    }

    /** Throws NumericOverflowException outside the precision/scale limits. */
    Decimal(TTInt const& unscaled, int scale);

    static Decimal fromInt64(int64_t value);

    /**
     * Exact value of the shortest decimal text that reads back as
     * 'value', e.g. 0.1 -> 0.1 rather than 0.1000000000000000055.
     * Throws DataConversionException for NaN and infinities.
     */
    static Decimal fromDouble(double value);

    /**
     * [+-]digits[.digits][E[+-]digits]. Throws MalformedLiteralException on
     * bad syntax and NumericOverflowException when too many digits remain.
     * A negative resulting scale is normalised to zero; a scale above
     * kMaxScale is rounded HALF_UP to kMaxScale.
     */
    static Decimal parse(std::string const& text);

    /** numerator / denominator at 'scale' digits after the point. */
    static Decimal fromQuotient(TTInt const& numerator, TTInt const& denominator,
                                int scale, RoundingMode mode);

    const TTInt& unscaled() const { return m_unscaled; }
    int scale() const { return m_scale; }
    /** Significant digits of the unscaled value; 1 for zero. */
    int precision() const;
    int signum() const;

    Decimal setScale(int newScale, RoundingMode mode) const;
    Decimal stripTrailingZeros() const;
    Decimal negate() const;
    Decimal add(Decimal const& other) const;
    Decimal multiply(Decimal const& other) const;

    /** Numeric comparison, ignoring scale: 1.0 == 1.00. */
    int compareTo(Decimal const& other) const;
    /** Same unscaled value and same scale. */
    bool equals(Decimal const& other) const {
        return m_scale == other.m_scale && m_unscaled == other.m_unscaled;
    }

    /** Nearest double, correctly rounded. */
    double toDouble() const;
    /** Plain notation, never an exponent: "-12.340". */
    std::string toString() const;

    std::size_t hash() const;

    /** 10^exp as TTLInt, exp in [0, 76]. */
    static TTLInt powerOfTen(int exp);

private:
    TTInt m_unscaled;
    int m_scale;
};

}
