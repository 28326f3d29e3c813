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
#include <vector>

#include <boost/algorithm/string.hpp>

#include "common/DateTimeUtils.h"
#include "common/FatalException.hpp"
#include "common/IntervalUtils.h"
#include "common/NumericGuard.h"
#include "common/ValueExceptions.h"

namespace valuecore {
namespace interval {

namespace {

TTInt toTTInt(int64_t value) {
    return TTInt(static_cast<int64_t>(value));
}

// Digits 10^n needed to show remaining / multiplier exactly enough.
int digitsOf(int64_t value) {
    int digits = 1;
    while (value >= 10) {
        value /= 10;
        digits++;
    }
    return digits;
}

// Divisor of the remaining field when an interval is read as a number of leading units.
int64_t remainingMultiplier(ValueType qualifier) {
    switch (qualifier) {
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
        return 12;
    case ValueType::tINTERVAL_DAY_TO_HOUR:
        return 24;
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
        return 24 * 60;
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
        return 60;
    case ValueType::tINTERVAL_SECOND:
        return NANOS_PER_SECOND;
    case ValueType::tINTERVAL_DAY_TO_SECOND:
        return NANOS_PER_DAY;
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
        return NANOS_PER_HOUR;
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        return NANOS_PER_MINUTE;
    default:
        return 1;
    }
}

// Exclusive upper bound of the remaining field; 1 when it must be zero.
int64_t remainingLimit(ValueType qualifier) {
    switch (qualifier) {
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
        return 1;
    default:
        return remainingMultiplier(qualifier);
    }
}

int64_t leadingExact(TTInt const& quotient) {
    static const TTInt MAX_LEADING = toTTInt(MAX_LEADING_FIELD);
    TTInt magnitude = quotient;
    if (magnitude.IsSign()) {
        magnitude.ChangeSign();
    }
    if (magnitude > MAX_LEADING) {
        throw NumericOverflowException(quotient.ToString(10), "",
                quotient.IsSign() ? SQLException::TYPE_UNDERFLOW : SQLException::TYPE_OVERFLOW);
    }
    return magnitude.ToInt();
}

void appendTwoDigits(std::string& out, int64_t value) {
    char buffer[8];
    snprintf(buffer, sizeof buffer, "%02d", static_cast<int>(value));
    out.append(buffer);
}

void appendSecondsAndNanos(std::string& out, int64_t seconds, int64_t nanos) {
    appendTwoDigits(out, seconds);
    if (nanos != 0) {
        char buffer[16];
        snprintf(buffer, sizeof buffer, "%09d", static_cast<int>(nanos));
        std::string digits(buffer);
        digits.erase(digits.find_last_not_of('0') + 1);
        out.append(".").append(digits);
    }
}

/*
 * Reads the bare field text of one qualifier. Every failure throws an
 * InvalidIntervalLiteralException naming the requested qualifier and the
 * complete original text.
 */
class FieldScanner {
public:
    FieldScanner(std::string const& text, std::string const& qualifierName, std::string const& original)
        : m_text(text), m_pos(0), m_qualifierName(qualifierName), m_original(original) {}

    [[noreturn]] void fail() const {
        throw InvalidIntervalLiteralException(m_qualifierName, m_original);
    }

    bool readSign() {
        if (m_pos < m_text.size() && (m_text[m_pos] == '-' || m_text[m_pos] == '+')) {
            return m_text[m_pos++] == '-';
        }
        return false;
    }

    int64_t readLeading() {
        const size_t start = m_pos;
        int64_t value = 0;
        while (m_pos < m_text.size() && isDigit(m_text[m_pos])) {
            if (m_pos - start >= 18) {
                fail();
            }
            value = value * 10 + (m_text[m_pos++] - '0');
        }
        if (m_pos == start) {
            fail();
        }
        return value;
    }

    int64_t readField(int64_t maxValue) {
        const size_t start = m_pos;
        int64_t value = 0;
        while (m_pos < m_text.size() && isDigit(m_text[m_pos]) && m_pos - start < 2) {
            value = value * 10 + (m_text[m_pos++] - '0');
        }
        if (m_pos == start || value > maxValue) {
            fail();
        }
        return value;
    }

    int64_t readNanos() {
        if (m_pos >= m_text.size() || m_text[m_pos] != '.') {
            return 0;
        }
        m_pos++;
        const size_t start = m_pos;
        int64_t value = 0;
        while (m_pos < m_text.size() && isDigit(m_text[m_pos])) {
            if (m_pos - start >= 9) {
                fail();
            }
            value = value * 10 + (m_text[m_pos++] - '0');
        }
        if (m_pos == start) {
            fail();
        }
        for (size_t digits = m_pos - start; digits < 9; digits++) {
            value *= 10;
        }
        return value;
    }

    void expect(char c) {
        if (m_pos >= m_text.size() || m_text[m_pos] != c) {
            fail();
        }
        m_pos++;
    }

    void expectEnd() const {
        if (m_pos != m_text.size()) {
            fail();
        }
    }

private:
    static bool isDigit(char c) {
        return c >= '0' && c <= '9';
    }

    const std::string m_text;
    size_t m_pos;
    const std::string m_qualifierName;
    const std::string m_original;
};

IntervalFields parseBareFields(ValueType qualifier, std::string const& fields, bool negative,
                               std::string const& targetName, std::string const& original) {
    FieldScanner scanner(boost::algorithm::trim_copy(fields), targetName, original);
    if (scanner.readSign()) {
        negative = !negative;
    }
    const int64_t leading = scanner.readLeading();
    int64_t remaining = 0;
    switch (qualifier) {
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
        break;
    case ValueType::tINTERVAL_SECOND:
        remaining = scanner.readNanos();
        break;
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
        scanner.expect('-');
        remaining = scanner.readField(11);
        break;
    case ValueType::tINTERVAL_DAY_TO_HOUR:
        scanner.expect(' ');
        remaining = scanner.readField(23);
        break;
    case ValueType::tINTERVAL_DAY_TO_MINUTE: {
        scanner.expect(' ');
        const int64_t hours = scanner.readField(23);
        scanner.expect(':');
        remaining = hours * 60 + scanner.readField(59);
        break;
    }
    case ValueType::tINTERVAL_DAY_TO_SECOND: {
        scanner.expect(' ');
        const int64_t hours = scanner.readField(23);
        scanner.expect(':');
        const int64_t minutes = scanner.readField(59);
        scanner.expect(':');
        const int64_t seconds = scanner.readField(59);
        remaining = hours * NANOS_PER_HOUR + minutes * NANOS_PER_MINUTE
            + seconds * NANOS_PER_SECOND + scanner.readNanos();
        break;
    }
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
        scanner.expect(':');
        remaining = scanner.readField(59);
        break;
    case ValueType::tINTERVAL_HOUR_TO_SECOND: {
        scanner.expect(':');
        const int64_t minutes = scanner.readField(59);
        scanner.expect(':');
        const int64_t seconds = scanner.readField(59);
        remaining = minutes * NANOS_PER_MINUTE + seconds * NANOS_PER_SECOND + scanner.readNanos();
        break;
    }
    case ValueType::tINTERVAL_MINUTE_TO_SECOND: {
        scanner.expect(':');
        const int64_t seconds = scanner.readField(59);
        remaining = seconds * NANOS_PER_SECOND + scanner.readNanos();
        break;
    }
    default:
        throwFatalException("Type %s is not an interval qualifier", getTypeName(qualifier).c_str());
    }
    scanner.expectEnd();
    return validate(qualifier, negative, leading, remaining);
}

}

int64_t leadingUnit(ValueType qualifier) {
    switch (qualifier) {
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
        return 12;
    case ValueType::tINTERVAL_MONTH:
        return 1;
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_DAY_TO_HOUR:
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
        return NANOS_PER_DAY;
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
        return NANOS_PER_HOUR;
    case ValueType::tINTERVAL_MINUTE:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        return NANOS_PER_MINUTE;
    case ValueType::tINTERVAL_SECOND:
        return NANOS_PER_SECOND;
    default:
        throwFatalException("Type %s is not an interval qualifier", getTypeName(qualifier).c_str());
    }
}

IntervalFields validate(ValueType qualifier, bool negative, int64_t leading, int64_t remaining) {
    if (!isIntervalType(qualifier)) {
        throwFatalException("Type %s is not an interval qualifier", getTypeName(qualifier).c_str());
    }
    if (leading < 0 || leading > MAX_LEADING_FIELD) {
        throwNumericValueOutOfRange<int64_t>(leading, "");
    }
    if (remaining < 0 || remaining >= remainingLimit(qualifier)) {
        throw DataConversionException("INTERVAL " + getIntervalQualifierName(qualifier)
                                      + " remaining field " + std::to_string(remaining));
    }
    IntervalFields fields;
    fields.negative = negative && (leading != 0 || remaining != 0);
    fields.leading = leading;
    fields.remaining = remaining;
    return fields;
}

TTInt intervalToAbsolute(ValueType qualifier, bool negative, int64_t leading, int64_t remaining) {
    TTInt absolute;
    switch (qualifier) {
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
        absolute = toTTInt(leading) * toTTInt(leadingUnit(qualifier));
        break;
    case ValueType::tINTERVAL_SECOND:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        absolute = toTTInt(leading) * toTTInt(leadingUnit(qualifier)) + toTTInt(remaining);
        break;
    case ValueType::tINTERVAL_DAY_TO_HOUR:
        absolute = (toTTInt(leading) * toTTInt(24) + toTTInt(remaining)) * toTTInt(NANOS_PER_HOUR);
        break;
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
        absolute = (toTTInt(leading) * toTTInt(24 * 60) + toTTInt(remaining)) * toTTInt(NANOS_PER_MINUTE);
        break;
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
        absolute = (toTTInt(leading) * toTTInt(60) + toTTInt(remaining)) * toTTInt(NANOS_PER_MINUTE);
        break;
    default:
        throwFatalException("Type %s is not an interval qualifier", getTypeName(qualifier).c_str());
    }
    if (negative) {
        absolute.ChangeSign();
    }
    return absolute;
}

IntervalFields intervalFromAbsolute(ValueType qualifier, TTInt const& absolute) {
    const bool negative = absolute.IsSign();
    TTInt magnitude = absolute;
    if (negative) {
        magnitude.ChangeSign();
    }
    TTInt remainder;
    TTInt quotient;
    switch (qualifier) {
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
        quotient = magnitude;
        quotient.Div(toTTInt(leadingUnit(qualifier)));
        return validate(qualifier, negative, leadingExact(quotient), 0);
    case ValueType::tINTERVAL_DAY_TO_HOUR:
        quotient = magnitude;
        quotient.Div(toTTInt(NANOS_PER_HOUR));
        quotient.Div(toTTInt(24), &remainder);
        break;
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
        quotient = magnitude;
        quotient.Div(toTTInt(NANOS_PER_MINUTE));
        quotient.Div(toTTInt(24 * 60), &remainder);
        break;
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
        quotient = magnitude;
        quotient.Div(toTTInt(NANOS_PER_MINUTE));
        quotient.Div(toTTInt(60), &remainder);
        break;
    case ValueType::tINTERVAL_SECOND:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        quotient = magnitude;
        quotient.Div(toTTInt(leadingUnit(qualifier)), &remainder);
        break;
    default:
        throwFatalException("Type %s is not an interval qualifier", getTypeName(qualifier).c_str());
    }
    return validate(qualifier, negative, leadingExact(quotient), remainder.ToInt());
}

Decimal getDecimal(ValueType qualifier, bool negative, int64_t leading, int64_t remaining) {
    if (qualifier < ValueType::tINTERVAL_SECOND || remaining == 0) {
        return Decimal::fromInt64(negative ? -leading : leading);
    }
    const int64_t multiplier = remainingMultiplier(qualifier);
    const Decimal fraction = Decimal::fromQuotient(toTTInt(remaining), toTTInt(multiplier),
                                                   digitsOf(multiplier), RoundingMode::HALF_DOWN);
    const Decimal result = Decimal::fromInt64(leading).add(fraction).stripTrailingZeros();
    return negative ? result.negate() : result;
}

std::string formatFields(ValueType qualifier, bool negative, int64_t leading, int64_t remaining) {
    std::string out = negative ? "-" : "";
    out.append(std::to_string(leading));
    switch (qualifier) {
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
        break;
    case ValueType::tINTERVAL_SECOND:
        if (remaining != 0) {
            // reuse the two-digit seconds formatter and drop its padding
            std::string fraction;
            appendSecondsAndNanos(fraction, 0, remaining);
            out.append(fraction.substr(2));
        }
        break;
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
        out.append("-").append(std::to_string(remaining));
        break;
    case ValueType::tINTERVAL_DAY_TO_HOUR:
        out.append(" ");
        appendTwoDigits(out, remaining);
        break;
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
        out.append(" ");
        appendTwoDigits(out, remaining / 60);
        out.append(":");
        appendTwoDigits(out, remaining % 60);
        break;
    case ValueType::tINTERVAL_DAY_TO_SECOND:
        out.append(" ");
        appendTwoDigits(out, remaining / NANOS_PER_HOUR);
        out.append(":");
        appendTwoDigits(out, remaining / NANOS_PER_MINUTE % 60);
        out.append(":");
        appendSecondsAndNanos(out, remaining / NANOS_PER_SECOND % 60, remaining % NANOS_PER_SECOND);
        break;
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
        out.append(":");
        appendTwoDigits(out, remaining);
        break;
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
        out.append(":");
        appendTwoDigits(out, remaining / NANOS_PER_MINUTE);
        out.append(":");
        appendSecondsAndNanos(out, remaining / NANOS_PER_SECOND % 60, remaining % NANOS_PER_SECOND);
        break;
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        out.append(":");
        appendSecondsAndNanos(out, remaining / NANOS_PER_SECOND, remaining % NANOS_PER_SECOND);
        break;
    default:
        throwFatalException("Type %s is not an interval qualifier", getTypeName(qualifier).c_str());
    }
    return out;
}

std::string formatLiteral(ValueType qualifier, bool negative, int64_t leading, int64_t remaining) {
    return "INTERVAL '" + formatFields(qualifier, negative, leading, remaining) + "' "
        + getIntervalQualifierName(qualifier);
}

IntervalFields parseFormattedInterval(ValueType qualifier, std::string const& text) {
    const std::string targetName = getIntervalQualifierName(qualifier);
    const std::string trimmed = boost::algorithm::trim_copy(text);
    if (!boost::algorithm::istarts_with(trimmed, "INTERVAL")) {
        return parseBareFields(qualifier, trimmed, false, targetName, text);
    }

    std::string rest = boost::algorithm::trim_left_copy(trimmed.substr(8));
    bool negative = false;
    if (!rest.empty() && (rest[0] == '-' || rest[0] == '+')) {
        negative = rest[0] == '-';
        rest = boost::algorithm::trim_left_copy(rest.substr(1));
    }
    if (rest.empty() || rest[0] != '\'') {
        throw InvalidIntervalLiteralException(targetName, text);
    }
    const size_t closingQuote = rest.find('\'', 1);
    if (closingQuote == std::string::npos) {
        throw InvalidIntervalLiteralException(targetName, text);
    }
    const std::string fields = rest.substr(1, closingQuote - 1);

    // normalise "day  to   second" to "DAY TO SECOND"
    std::string qualifierText = boost::algorithm::to_upper_copy(
            boost::algorithm::trim_copy(rest.substr(closingQuote + 1)));
    std::vector<std::string> words;
    boost::algorithm::split(words, qualifierText, boost::algorithm::is_space(),
                            boost::algorithm::token_compress_on);
    qualifierText = boost::algorithm::join(words, " ");
    const ValueType literalQualifier = stringToValueType("INTERVAL " + qualifierText);
    if (!isIntervalType(literalQualifier)
            || isYearMonthIntervalType(literalQualifier) != isYearMonthIntervalType(qualifier)) {
        throw InvalidIntervalLiteralException(targetName, text);
    }

    const IntervalFields parsed = parseBareFields(literalQualifier, fields, negative, targetName, text);
    if (literalQualifier == qualifier) {
        return parsed;
    }
    return intervalFromAbsolute(qualifier,
            intervalToAbsolute(literalQualifier, parsed.negative, parsed.leading, parsed.remaining));
}

}
}
