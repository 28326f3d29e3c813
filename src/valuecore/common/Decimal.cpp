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

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

#include <boost/functional/hash.hpp>

#include "common/Decimal.h"
#include "common/FatalException.hpp"
#include "common/FloatFormat.h"
#include "common/ValueExceptions.h"

namespace valuecore {

namespace {

std::string plainString(TTInt const& unscaled, int scale) {
    std::ostringstream buffer;
    TTInt magnitude(unscaled);
    if (magnitude.IsSign()) {
        buffer << '-';
        magnitude.ChangeSign();
    }
    std::string digits = magnitude.ToString(10);
    if (scale <= 0) {
        buffer << digits;
        return buffer.str();
    }
    if (static_cast<int>(digits.size()) <= scale) {
        digits.insert(0, static_cast<size_t>(scale) + 1 - digits.size(), '0');
    }
    buffer << digits.substr(0, digits.size() - scale) << '.' << digits.substr(digits.size() - scale);
    return buffer.str();
}

int digitCount(TTLInt const& value) {
    std::string digits = value.ToString(10);
    return static_cast<int>(digits.size()) - (digits[0] == '-' ? 1 : 0);
}

void throwOutOfRange(std::string const& text, bool negative) {
    throw NumericOverflowException(text, "",
            negative ? SQLException::TYPE_UNDERFLOW : SQLException::TYPE_OVERFLOW);
}

// Narrows a wide intermediate result, reporting the scaled text on overflow.
TTInt narrow(TTLInt const& wide, int scale) {
    TTInt result;
    if (result.FromInt(wide) || digitCount(wide) > Decimal::kMaxPrecision) {
        std::string text = wide.ToString(10);
        const bool negative = wide.IsSign();
        if (negative) {
            text.erase(0, 1);
        }
        if (scale > 0) {
            if (static_cast<int>(text.size()) <= scale) {
                text.insert(0, static_cast<size_t>(scale) + 1 - text.size(), '0');
            }
            text.insert(text.size() - scale, ".");
        }
        throwOutOfRange(negative ? "-" + text : text, negative);
    }
    return result;
}

// Integer division with the requested rounding of the discarded remainder.
TTLInt roundDivide(TTLInt const& numerator, TTLInt const& denominator, RoundingMode mode) {
    TTLInt quotient(numerator);
    TTLInt remainder;
    if (quotient.Div(denominator, &remainder)) {
        throwFatalException("Decimal division by zero");
    }
    if (remainder.IsZero() || mode == RoundingMode::DOWN) {
        return quotient;
    }
    TTLInt twiceRemainder(remainder);
    if (twiceRemainder.IsSign()) {
        twiceRemainder.ChangeSign();
    }
    twiceRemainder *= TTLInt(static_cast<int64_t>(2));
    TTLInt absDenominator(denominator);
    if (absDenominator.IsSign()) {
        absDenominator.ChangeSign();
    }
    const bool roundAway = mode == RoundingMode::HALF_UP ? !(twiceRemainder < absDenominator)
                                                         : twiceRemainder > absDenominator;
    if (roundAway) {
        const bool negative = numerator.IsSign() != denominator.IsSign();
        quotient += negative ? TTLInt(static_cast<int64_t>(-1)) : TTLInt(static_cast<int64_t>(1));
    }
    return quotient;
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

}

TTLInt Decimal::powerOfTen(int exp) {
    static const std::vector<TTLInt> powers = [] {
        std::vector<TTLInt> result;
        TTLInt value(static_cast<int64_t>(1));
        for (int ii = 0; ii <= 76; ii++) {
            result.push_back(value);
            value *= TTLInt(static_cast<int64_t>(10));
        }
        return result;
    }();
    if (exp < 0 || exp >= static_cast<int>(powers.size())) {
        throwFatalException("Decimal::powerOfTen exponent %d out of range", exp);
    }
    return powers[exp];
}

Decimal::Decimal(TTInt const& unscaled, int scale) : m_unscaled(unscaled), m_scale(scale) {
    if (scale < 0 || scale > kMaxScale) {
        throwOutOfRange(plainString(unscaled, scale), unscaled.IsSign());
    }
    if (precision() > kMaxPrecision) {
        throwOutOfRange(plainString(unscaled, scale), unscaled.IsSign());
    }
}

Decimal Decimal::fromInt64(int64_t value) {
    return Decimal(TTInt(value), 0);
}

Decimal Decimal::fromDouble(double value) {
    if (std::isnan(value) || std::isinf(value)) {
        throw DataConversionException(formatDouble(value));
    }
    return parse(formatDouble(value));
}

Decimal Decimal::parse(std::string const& text) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        pos++;
    }
    std::string digits;
    size_t fractionDigits = 0;
    while (pos < text.size() && isDigit(text[pos])) {
        digits.push_back(text[pos++]);
    }
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        while (pos < text.size() && isDigit(text[pos])) {
            digits.push_back(text[pos++]);
            fractionDigits++;
        }
    }
    if (digits.empty()) {
        throw MalformedLiteralException(text);
    }
    long exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        pos++;
        bool negativeExponent = false;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            negativeExponent = text[pos] == '-';
            pos++;
        }
        const size_t exponentStart = pos;
        while (pos < text.size() && isDigit(text[pos])) {
            if (pos - exponentStart > 6) {
                throwOutOfRange(text, negative);
            }
            exponent = exponent * 10 + (text[pos++] - '0');
        }
        if (pos == exponentStart) {
            throw MalformedLiteralException(text);
        }
        if (negativeExponent) {
            exponent = -exponent;
        }
    }
    if (pos != text.size()) {
        throw MalformedLiteralException(text);
    }

    long scale = static_cast<long>(fractionDigits) - exponent;
    size_t firstSignificant = digits.find_first_not_of('0');
    if (firstSignificant == std::string::npos) {
        // zero keeps its scale where representable
        return Decimal(TTInt(static_cast<int64_t>(0)), static_cast<int>(std::max(0L, std::min<long>(scale, kMaxScale))));
    }
    digits.erase(0, firstSignificant);
    // trailing fractional zeros carry no value; drop them only when needed to fit
    while (scale > kMaxScale && digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
        scale--;
    }
    if (scale < 0) {
        if (static_cast<long>(digits.size()) - scale > kMaxPrecision) {
            throwOutOfRange(text, negative);
        }
        digits.append(static_cast<size_t>(-scale), '0');
        scale = 0;
    }
    if (scale > kMaxScale) {
        // digits below the smallest representable unit are rounded away
        const size_t dropped = static_cast<size_t>(scale - kMaxScale);
        scale = kMaxScale;
        if (dropped > digits.size()) {
            return Decimal(TTInt(static_cast<int64_t>(0)), kMaxScale);
        }
        const bool roundUp = dropped > 0 && digits[digits.size() - dropped] >= '5';
        digits.resize(digits.size() - dropped);
        if (roundUp) {
            size_t i = digits.size();
            while (i > 0 && digits[i - 1] == '9') {
                digits[--i] = '0';
            }
            if (i == 0) {
                digits.insert(digits.begin(), '1');
            } else {
                digits[i - 1]++;
            }
        }
        if (digits.empty() || digits.find_first_not_of('0') == std::string::npos) {
            return Decimal(TTInt(static_cast<int64_t>(0)), kMaxScale);
        }
    }
    if (static_cast<int>(digits.size()) > kMaxPrecision) {
        throwOutOfRange(text, negative);
    }
    TTInt unscaled(digits);
    if (negative) {
        unscaled.ChangeSign();
    }
    return Decimal(unscaled, static_cast<int>(scale));
}

Decimal Decimal::fromQuotient(TTInt const& numerator, TTInt const& denominator, int scale, RoundingMode mode) {
    TTLInt wide;
    wide.FromInt(numerator);
    wide *= powerOfTen(scale);
    TTLInt divisor;
    divisor.FromInt(denominator);
    TTLInt quotient = roundDivide(wide, divisor, mode);
    return Decimal(narrow(quotient, scale), scale);
}

int Decimal::precision() const {
    TTLInt wide;
    wide.FromInt(m_unscaled);
    return digitCount(wide);
}

int Decimal::signum() const {
    if (m_unscaled.IsZero()) {
        return 0;
    }
    return m_unscaled.IsSign() ? -1 : 1;
}

Decimal Decimal::setScale(int newScale, RoundingMode mode) const {
    if (newScale == m_scale) {
        return *this;
    }
    if (newScale < 0 || newScale > kMaxScale) {
        throwOutOfRange(toString(), m_unscaled.IsSign());
    }
    TTLInt wide;
    wide.FromInt(m_unscaled);
    if (newScale > m_scale) {
        wide *= powerOfTen(newScale - m_scale);
        return Decimal(narrow(wide, newScale), newScale);
    }
    TTLInt rounded = roundDivide(wide, powerOfTen(m_scale - newScale), mode);
    return Decimal(narrow(rounded, newScale), newScale);
}

Decimal Decimal::stripTrailingZeros() const {
    if (m_unscaled.IsZero()) {
        return Decimal();
    }
    TTInt unscaled(m_unscaled);
    int scale = m_scale;
    const TTInt ten(static_cast<int64_t>(10));
    while (scale > 0) {
        TTInt quotient(unscaled);
        TTInt remainder;
        quotient.Div(ten, &remainder);
        if (!remainder.IsZero()) {
            break;
        }
        unscaled = quotient;
        scale--;
    }
    return Decimal(unscaled, scale);
}

Decimal Decimal::negate() const {
    TTInt unscaled(m_unscaled);
    unscaled.ChangeSign();
    return Decimal(unscaled, m_scale);
}

Decimal Decimal::add(Decimal const& other) const {
    const int scale = std::max(m_scale, other.m_scale);
    TTLInt lhs, rhs;
    lhs.FromInt(m_unscaled);
    rhs.FromInt(other.m_unscaled);
    lhs *= powerOfTen(scale - m_scale);
    rhs *= powerOfTen(scale - other.m_scale);
    lhs += rhs;
    return Decimal(narrow(lhs, scale), scale);
}

Decimal Decimal::multiply(Decimal const& other) const {
    TTLInt product;
    product.FromInt(m_unscaled);
    TTLInt rhs;
    rhs.FromInt(other.m_unscaled);
    product *= rhs;
    int scale = m_scale + other.m_scale;
    if (scale > kMaxScale) {
        product = roundDivide(product, powerOfTen(scale - kMaxScale), RoundingMode::HALF_UP);
        scale = kMaxScale;
    }
    return Decimal(narrow(product, scale), scale);
}

int Decimal::compareTo(Decimal const& other) const {
    if (m_scale == other.m_scale) {
        return m_unscaled < other.m_unscaled ? -1 : (m_unscaled == other.m_unscaled ? 0 : 1);
    }
    const int scale = std::max(m_scale, other.m_scale);
    TTLInt lhs, rhs;
    lhs.FromInt(m_unscaled);
    rhs.FromInt(other.m_unscaled);
    lhs *= powerOfTen(scale - m_scale);
    rhs *= powerOfTen(scale - other.m_scale);
    return lhs < rhs ? -1 : (lhs == rhs ? 0 : 1);
}

double Decimal::toDouble() const {
    return std::strtod(toString().c_str(), NULL);
}

std::string Decimal::toString() const {
    return plainString(m_unscaled, m_scale);
}

std::size_t Decimal::hash() const {
    std::size_t seed = 0;
    boost::hash_combine(seed, m_unscaled.ToString(10));
    boost::hash_combine(seed, m_scale);
    return seed;
}

}
