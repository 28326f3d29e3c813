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

namespace valuecore {

static const int64_t NANOS_PER_SECOND = 1000000000LL;
static const int64_t NANOS_PER_MINUTE = 60 * NANOS_PER_SECOND;
static const int64_t NANOS_PER_HOUR = 60 * NANOS_PER_MINUTE;
static const int64_t NANOS_PER_DAY = 24 * NANOS_PER_HOUR;
static const int64_t SECONDS_PER_DAY = 24 * 60 * 60;

// Time zone offsets are limited to +/- 18 hours.
static const int32_t MAX_TIME_ZONE_OFFSET_SECONDS = 18 * 60 * 60;

/*
 * Date values pack a proleptic Gregorian date into one integer:
 * (year << 9) | (month << 5) | day. Ordering the packed values orders
 * the dates. Calendar arithmetic goes through boost::gregorian and is
 * therefore limited to its years 1400..9999.
 */
namespace datetime {

inline int64_t dateValue(int64_t year, int month, int day) {
    return (year << 9) | (month << 5) | day;
}

inline int64_t yearFromDateValue(int64_t dateValue) {
    return dateValue >> 9;
}

inline int monthFromDateValue(int64_t dateValue) {
    return static_cast<int>((dateValue >> 5) & 15);
}

inline int dayFromDateValue(int64_t dateValue) {
    return static_cast<int>(dateValue & 31);
}

inline int64_t floorDiv(int64_t x, int64_t y) {
    int64_t r = x / y;
    if ((x % y != 0) && ((x < 0) != (y < 0))) {
        r--;
    }
    return r;
}

inline int64_t floorMod(int64_t x, int64_t y) {
    return x - floorDiv(x, y) * y;
}

/** Folds any nanosecond count into [0, NANOS_PER_DAY). */
inline int64_t normalizeNanosOfDay(int64_t nanos) {
    return floorMod(nanos, NANOS_PER_DAY);
}

bool isValidDate(int64_t year, int month, int day);

/** Days since 1970-01-01. Throws InvalidDatetimeLiteralException outside the supported years. */
int64_t absoluteDayFromDateValue(int64_t dateValue);
int64_t dateValueFromAbsoluteDay(int64_t absoluteDay);

/** Seconds since the epoch of the local date/time shifted by offsetSeconds. */
int64_t getEpochSeconds(int64_t dateValue, int64_t timeNanos, int32_t offsetSeconds);
int64_t dateValueFromLocalSeconds(int64_t localSeconds);
int64_t nanosFromLocalSeconds(int64_t localSeconds);

struct ParsedTime {
    int64_t nanos;
    bool hasOffset;
    int32_t offsetSeconds;
};

struct ParsedTimestamp {
    int64_t dateValue;
    int64_t nanos;
    bool hasOffset;
    int32_t offsetSeconds;
};

/*
 * Literal parsers. Input is expected to be trimmed. 'typeName' appears in
 * the InvalidDatetimeLiteralException raised on malformed input.
 */

/** [-]YYYY-MM-DD */
int64_t parseDateValue(std::string const& text, std::string const& typeName);
/** HH:MM[:SS[.fffffffff]] optionally followed by a zone offset. */
ParsedTime parseTime(std::string const& text, std::string const& typeName);
/** date[( |T)time][zone], zone being Z, UTC, GMT or +/-hh[:mm[:ss]]. */
ParsedTimestamp parseTimestamp(std::string const& text, std::string const& typeName);
/** Z, UTC, GMT, or +/-h[h][:mm[:ss]], optionally prefixed by UTC/GMT. */
int32_t parseTimeZoneOffset(std::string const& text, std::string const& typeName);

std::string formatDate(int64_t dateValue);
/** HH:MM:SS with any fraction, trailing zeros removed. */
std::string formatTime(int64_t nanos);
/** +hh, +hh:mm or +hh:mm:ss. */
std::string formatTimeZoneOffset(int32_t offsetSeconds);
std::string formatTimestamp(int64_t dateValue, int64_t nanos);

}
}
