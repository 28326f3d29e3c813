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

#include "common/Decimal.h"
#include "common/types.h"

namespace valuecore {

/*
 * Interval helpers. An interval is stored as its qualifier (one of the
 * tINTERVAL_* types), a sign and two non-negative fields: the leading
 * field and, for SECOND and the compound qualifiers, the remaining field.
 * Remaining holds months (YEAR TO MONTH), hours (DAY TO HOUR), minutes of
 * the day or hour (DAY/HOUR TO MINUTE) or nanoseconds (every qualifier
 * ending in SECOND).
 *
 * The absolute value of an interval is a count of months for the
 * year-month family and of nanoseconds for the day-time family.
 */
namespace interval {

// Largest permitted leading field.
static const int64_t MAX_LEADING_FIELD = 999999999999999999LL;

struct IntervalFields {
    bool negative;
    int64_t leading;
    int64_t remaining;
};

/** Months or nanoseconds represented by one unit of the leading field. */
int64_t leadingUnit(ValueType qualifier);

/**
 * Checks the field bounds for the qualifier and clears the sign of a zero
 * interval. Throws NumericOverflowException for an oversized leading field
 * and DataConversionException for a remaining field out of its range.
 */
IntervalFields validate(ValueType qualifier, bool negative, int64_t leading, int64_t remaining);

/** Signed months or nanoseconds. */
TTInt intervalToAbsolute(ValueType qualifier, bool negative, int64_t leading, int64_t remaining);

/**
 * Splits a signed absolute value into the fields of 'qualifier'. Division
 * truncates toward zero; units finer than the qualifier are dropped.
 */
IntervalFields intervalFromAbsolute(ValueType qualifier, TTInt const& absolute);

/**
 * The interval as a number of leading units, e.g. INTERVAL '1-6' YEAR TO
 * MONTH is 1.5.
 */
Decimal getDecimal(ValueType qualifier, bool negative, int64_t leading, int64_t remaining);

/** Field text without quotes or qualifier: "-3 04:05:06.5". */
std::string formatFields(ValueType qualifier, bool negative, int64_t leading, int64_t remaining);

/** INTERVAL '<fields>' <QUALIFIER> */
std::string formatLiteral(ValueType qualifier, bool negative, int64_t leading, int64_t remaining);

/**
 * Parses either a complete INTERVAL literal, whose own qualifier must be of
 * the same family as 'qualifier', or the bare field text of 'qualifier'.
 * Throws InvalidIntervalLiteralException.
 */
IntervalFields parseFormattedInterval(ValueType qualifier, std::string const& text);

}
}
