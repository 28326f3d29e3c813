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

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "common/FloatFormat.h"

namespace valuecore {

namespace {

/*
 * Finds the shortest "%.*e" rendering that round-trips, then splits it into
 * its significant digits (no trailing zeros) and decimal exponent, so that
 * |value| == 0.d1d2d3... * 10^(exponent + 1).
 */
void shortestDigits(double value, bool asFloat, std::string* digits, int* exponent) {
    char buffer[40];
    const int maxPrecision = asFloat ? 9 : 17;
    for (int precision = 1; precision <= maxPrecision; precision++) {
        snprintf(buffer, sizeof buffer, "%.*e", precision - 1, value);
        const bool roundTrips = asFloat
                ? std::strtof(buffer, NULL) == static_cast<float>(value)
                : std::strtod(buffer, NULL) == value;
        if (roundTrips) {
            break;
        }
    }
    digits->clear();
    const char* cursor = buffer;
    if (*cursor == '-') {
        cursor++;
    }
    for (; *cursor != 'e'; cursor++) {
        if (*cursor != '.') {
            digits->push_back(*cursor);
        }
    }
    *exponent = atoi(cursor + 1);
    while (digits->size() > 1 && (*digits)[digits->size() - 1] == '0') {
        digits->erase(digits->size() - 1);
    }
}

std::string javaStyle(double value, bool asFloat) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    std::string result = std::signbit(value) ? "-" : "";
    if (value == 0) {
        return result + "0.0";
    }
    std::string digits;
    int exponent;
    shortestDigits(value, asFloat, &digits, &exponent);
    const double magnitude = std::fabs(value);
    if (magnitude >= 1e-3 && magnitude < 1e7) {
        if (exponent >= 0) {
            const size_t integerDigits = static_cast<size_t>(exponent) + 1;
            if (digits.size() <= integerDigits) {
                result += digits + std::string(integerDigits - digits.size(), '0') + ".0";
            } else {
                result += digits.substr(0, integerDigits) + "." + digits.substr(integerDigits);
            }
        } else {
            result += "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
        }
        return result;
    }
    result += digits.substr(0, 1);
    result += ".";
    result += digits.size() > 1 ? digits.substr(1) : "0";
    result += "E" + std::to_string(exponent);
    return result;
}

}

std::string formatDouble(double value) {
    return javaStyle(value, false);
}

std::string formatFloat(float value) {
    return javaStyle(static_cast<double>(value), true);
}

bool parseDouble(std::string const& text, double* result) {
    if (text.empty()) {
        return false;
    }
    if (text == "NaN") {
        *result = NAN;
        return true;
    }
    const char* start = text.c_str();
    const char* body = (*start == '+' || *start == '-') ? start + 1 : start;
    if (strcmp(body, "Infinity") == 0) {
        *result = *start == '-' ? -INFINITY : INFINITY;
        return true;
    }
    // strtod also accepts hex floats, "inf" and "nan"; only decimal digits are SQL literals
    for (const char* c = body; *c; c++) {
        if (!((*c >= '0' && *c <= '9') || *c == '.' || *c == 'e' || *c == 'E' || *c == '+' || *c == '-')) {
            return false;
        }
    }
    char* end = NULL;
    const double parsed = std::strtod(start, &end);
    if (end != start + text.size()) {
        return false;
    }
    *result = parsed;
    return true;
}

}
