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
#include <stdexcept>

#include <boost/algorithm/string.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>

#include "common/DateTimeUtils.h"
#include "common/ValueExceptions.h"

namespace valuecore {
namespace datetime {

namespace {

const int64_t MIN_SUPPORTED_YEAR = 1400;
const int64_t MAX_SUPPORTED_YEAR = 9999;

const boost::gregorian::date EPOCH_DATE(1970, 1, 1);

int64_t absoluteDayOf(boost::gregorian::date const& date) {
    return (date - EPOCH_DATE).days();
}

const int64_t MIN_ABSOLUTE_DAY = absoluteDayOf(boost::gregorian::date(MIN_SUPPORTED_YEAR, 1, 1));
const int64_t MAX_ABSOLUTE_DAY = absoluteDayOf(boost::gregorian::date(MAX_SUPPORTED_YEAR, 12, 31));

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

// Reads between minDigits and maxDigits decimal digits at *pos.
bool readNumber(std::string const& text, size_t* pos, size_t end,
                size_t minDigits, size_t maxDigits, int64_t* result) {
    const size_t start = *pos;
    int64_t value = 0;
    while (*pos < end && isDigit(text[*pos]) && *pos - start < maxDigits) {
        value = value * 10 + (text[*pos] - '0');
        (*pos)++;
    }
    if (*pos - start < minDigits) {
        return false;
    }
    *result = value;
    return true;
}

// HH:MM[:SS[.fffffffff]] within [start, end); -1 when malformed.
int64_t parseTimeOfDay(std::string const& text, size_t start, size_t end) {
    size_t pos = start;
    int64_t hour, minute, second = 0, fraction = 0;
    if (!readNumber(text, &pos, end, 1, 2, &hour) || pos >= end || text[pos] != ':') {
        return -1;
    }
    pos++;
    if (!readNumber(text, &pos, end, 2, 2, &minute)) {
        return -1;
    }
    if (pos < end && text[pos] == ':') {
        pos++;
        if (!readNumber(text, &pos, end, 2, 2, &second)) {
            return -1;
        }
        if (pos < end && text[pos] == '.') {
            pos++;
            const size_t fractionStart = pos;
            if (!readNumber(text, &pos, end, 1, 9, &fraction)) {
                return -1;
            }
            for (size_t digits = pos - fractionStart; digits < 9; digits++) {
                fraction *= 10;
            }
        }
    }
    if (pos != end || hour > 23 || minute > 59 || second > 59) {
        return -1;
    }
    return hour * NANOS_PER_HOUR + minute * NANOS_PER_MINUTE + second * NANOS_PER_SECOND + fraction;
}

// Start of a trailing zone designator in a time string, or npos.
size_t findZoneStart(std::string const& text) {
    for (size_t ii = 1; ii < text.size(); ii++) {
        const char c = text[ii];
        if (c == '+' || c == '-' || c == 'Z' || c == 'z') {
            return ii;
        }
        if ((c == 'U' || c == 'G') && (text.compare(ii, 3, "UTC") == 0 || text.compare(ii, 3, "GMT") == 0)) {
            return ii;
        }
    }
    return std::string::npos;
}

}

bool isValidDate(int64_t year, int month, int day) {
    if (year < MIN_SUPPORTED_YEAR || year > MAX_SUPPORTED_YEAR || month < 1 || month > 12 || day < 1) {
        return false;
    }
    const int lastDay = boost::gregorian::gregorian_calendar::end_of_month_day(
            static_cast<unsigned short>(year), static_cast<unsigned short>(month));
    return day <= lastDay;
}

int64_t absoluteDayFromDateValue(int64_t dateValue) {
    try {
        boost::gregorian::date date(static_cast<unsigned short>(yearFromDateValue(dateValue)),
                                    static_cast<unsigned short>(monthFromDateValue(dateValue)),
                                    static_cast<unsigned short>(dayFromDateValue(dateValue)));
        return absoluteDayOf(date);
    } catch (std::out_of_range const&) {
        throw InvalidDatetimeLiteralException("DATE", formatDate(dateValue));
    }
}

int64_t dateValueFromAbsoluteDay(int64_t absoluteDay) {
    if (absoluteDay < MIN_ABSOLUTE_DAY || absoluteDay > MAX_ABSOLUTE_DAY) {
        throw InvalidDatetimeLiteralException("DATE", std::to_string(absoluteDay) + " days from 1970-01-01");
    }
    const boost::gregorian::date date = EPOCH_DATE + boost::gregorian::days(static_cast<long>(absoluteDay));
    return datetime::dateValue(date.year(), date.month(), date.day());
}

int64_t getEpochSeconds(int64_t dateValue, int64_t timeNanos, int32_t offsetSeconds) {
    return absoluteDayFromDateValue(dateValue) * SECONDS_PER_DAY + timeNanos / NANOS_PER_SECOND - offsetSeconds;
}

int64_t dateValueFromLocalSeconds(int64_t localSeconds) {
    return dateValueFromAbsoluteDay(floorDiv(localSeconds, SECONDS_PER_DAY));
}

int64_t nanosFromLocalSeconds(int64_t localSeconds) {
    return floorMod(localSeconds, SECONDS_PER_DAY) * NANOS_PER_SECOND;
}

int64_t parseDateValue(std::string const& text, std::string const& typeName) {
    size_t pos = 0;
    const size_t end = text.size();
    if (pos < end && text[pos] == '+') {
        pos++;
    }
    int64_t year, month, day;
    if (!readNumber(text, &pos, end, 1, 9, &year) || pos >= end || text[pos] != '-') {
        throw InvalidDatetimeLiteralException(typeName, text);
    }
    pos++;
    if (!readNumber(text, &pos, end, 1, 2, &month) || pos >= end || text[pos] != '-') {
        throw InvalidDatetimeLiteralException(typeName, text);
    }
    pos++;
    if (!readNumber(text, &pos, end, 1, 2, &day) || pos != end) {
        throw InvalidDatetimeLiteralException(typeName, text);
    }
    if (!isValidDate(year, static_cast<int>(month), static_cast<int>(day))) {
        throw InvalidDatetimeLiteralException(typeName, text);
    }
    return dateValue(year, static_cast<int>(month), static_cast<int>(day));
}

ParsedTime parseTime(std::string const& text, std::string const& typeName) {
    ParsedTime result;
    result.hasOffset = false;
    result.offsetSeconds = 0;
    size_t timeEnd = findZoneStart(text);
    if (timeEnd != std::string::npos) {
        result.hasOffset = true;
        result.offsetSeconds = parseTimeZoneOffset(text.substr(timeEnd), typeName);
        // allow a single separating space before the zone
        while (timeEnd > 0 && text[timeEnd - 1] == ' ') {
            timeEnd--;
        }
    } else {
        timeEnd = text.size();
    }
    result.nanos = parseTimeOfDay(text, 0, timeEnd);
    if (result.nanos < 0) {
        throw InvalidDatetimeLiteralException(typeName, text);
    }
    return result;
}

ParsedTimestamp parseTimestamp(std::string const& text, std::string const& typeName) {
    ParsedTimestamp result;
    result.nanos = 0;
    result.hasOffset = false;
    result.offsetSeconds = 0;
    size_t dateEnd = text.find_first_of(" T");
    if (dateEnd == std::string::npos) {
        result.dateValue = parseDateValue(text, typeName);
        return result;
    }
    result.dateValue = parseDateValue(text.substr(0, dateEnd), typeName);
    const std::string timePart = boost::algorithm::trim_copy(text.substr(dateEnd + 1));
    if (timePart.empty()) {
        throw InvalidDatetimeLiteralException(typeName, text);
    }
    try {
        ParsedTime time = parseTime(timePart, typeName);
        result.nanos = time.nanos;
        result.hasOffset = time.hasOffset;
        result.offsetSeconds = time.offsetSeconds;
    } catch (InvalidDatetimeLiteralException const&) {
        // report the whole literal, not just its time part
        throw InvalidDatetimeLiteralException(typeName, text);
    }
    return result;
}

int32_t parseTimeZoneOffset(std::string const& rawText, std::string const& typeName) {
    std::string text = boost::algorithm::trim_copy(rawText);
    if (text == "Z" || text == "z") {
        return 0;
    }
    if (boost::algorithm::starts_with(text, "UTC") || boost::algorithm::starts_with(text, "GMT")) {
        text = boost::algorithm::trim_copy(text.substr(3));
        if (text.empty()) {
            return 0;
        }
    }
    if (text.empty() || (text[0] != '+' && text[0] != '-')) {
        throw InvalidDatetimeLiteralException(typeName, rawText);
    }
    const bool negative = text[0] == '-';
    size_t pos = 1;
    const size_t end = text.size();
    int64_t hours, minutes = 0, seconds = 0;
    if (!readNumber(text, &pos, end, 1, 2, &hours)) {
        throw InvalidDatetimeLiteralException(typeName, rawText);
    }
    if (pos < end) {
        if (text[pos] == ':') {
            pos++;
        }
        if (!readNumber(text, &pos, end, 2, 2, &minutes)) {
            throw InvalidDatetimeLiteralException(typeName, rawText);
        }
        if (pos < end) {
            if (text[pos] == ':') {
                pos++;
            }
            if (!readNumber(text, &pos, end, 2, 2, &seconds) || pos != end) {
                throw InvalidDatetimeLiteralException(typeName, rawText);
            }
        }
    }
    if (minutes > 59 || seconds > 59) {
        throw InvalidDatetimeLiteralException(typeName, rawText);
    }
    const int64_t offset = hours * 3600 + minutes * 60 + seconds;
    if (offset > MAX_TIME_ZONE_OFFSET_SECONDS) {
        throw InvalidDatetimeLiteralException(typeName, rawText);
    }
    return static_cast<int32_t>(negative ? -offset : offset);
}

std::string formatDate(int64_t dateValue) {
    char buffer[32];
    snprintf(buffer, sizeof buffer, "%04jd-%02d-%02d", (intmax_t) yearFromDateValue(dateValue),
             monthFromDateValue(dateValue), dayFromDateValue(dateValue));
    return buffer;
}

std::string formatTime(int64_t nanos) {
    const int64_t seconds = nanos / NANOS_PER_SECOND;
    const int64_t fraction = nanos % NANOS_PER_SECOND;
    char buffer[32];
    snprintf(buffer, sizeof buffer, "%02d:%02d:%02d", static_cast<int>(seconds / 3600),
             static_cast<int>(seconds / 60 % 60), static_cast<int>(seconds % 60));
    std::string result(buffer);
    if (fraction != 0) {
        snprintf(buffer, sizeof buffer, "%09d", static_cast<int>(fraction));
        std::string digits(buffer);
        digits.erase(digits.find_last_not_of('0') + 1);
        result.append(".").append(digits);
    }
    return result;
}

std::string formatTimeZoneOffset(int32_t offsetSeconds) {
    const char sign = offsetSeconds < 0 ? '-' : '+';
    const int32_t magnitude = offsetSeconds < 0 ? -offsetSeconds : offsetSeconds;
    const int hours = magnitude / 3600;
    const int minutes = magnitude / 60 % 60;
    const int seconds = magnitude % 60;
    char buffer[16];
    if (seconds != 0) {
        snprintf(buffer, sizeof buffer, "%c%02d:%02d:%02d", sign, hours, minutes, seconds);
    } else if (minutes != 0) {
        snprintf(buffer, sizeof buffer, "%c%02d:%02d", sign, hours, minutes);
    } else {
        snprintf(buffer, sizeof buffer, "%c%02d", sign, hours);
    }
    return buffer;
}

std::string formatTimestamp(int64_t dateValue, int64_t nanos) {
    return formatDate(dateValue) + " " + formatTime(nanos);
}

}
}
