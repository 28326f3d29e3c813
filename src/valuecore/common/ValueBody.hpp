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
#include <cfloat>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/Decimal.h"
#include "common/Value.hpp"
#include "common/types.h"

namespace valuecore {

/*
 * The payload behind a Value handle. Private to the value core: only the
 * Value, ValueFactory and ValueCache sources include this header. A body
 * is fully built before it is wrapped in a Value and never changes after.
 *
 * Which members are meaningful depends on m_type:
 *   m_long    BOOLEAN (0/1), TINYINT..BIGINT, DATE and the date of the
 *             TIMESTAMP types, interval leading field, UUID high bits,
 *             ENUM ordinal
 *   m_long2   nanos of day of TIME/TIMESTAMP types, interval remaining
 *             field, UUID low bits
 *   m_offsetSeconds  TIME_TZ, TIMESTAMP_TZ
 *   m_negative       INTERVAL_*
 *   m_double / m_float  DOUBLE / REAL
 *   m_decimal        NUMERIC
 *   m_bytes   character text, binary bytes, JSON text, EWKB, ENUM label
 *   m_elements       ARRAY, ROW
 */
struct ValueBody {
    explicit ValueBody(ValueType type)
        : m_type(type), m_long(0), m_long2(0), m_offsetSeconds(0),
          m_negative(false), m_double(0.0), m_float(0.0f) {}

    const ValueType m_type;
    int64_t m_long;
    int64_t m_long2;
    int32_t m_offsetSeconds;
    bool m_negative;
    double m_double;
    float m_float;
    Decimal m_decimal;
    std::string m_bytes;
    std::vector<Value> m_elements;
    std::shared_ptr<const ExtTypeInfoEnum> m_enumerators;
    std::shared_ptr<const GeometryCodec> m_codec;
    std::shared_ptr<const ResultInterface> m_result;
};

int warn_if(int condition, const char* message);

// This has been demonstrated to be more reliable than std::isinf
// -- less sensitive on LINUX to the "g++ -ffast-math" option.
inline int non_std_isinf(double x) {
    return x > DBL_MAX || x < -DBL_MAX;
}

/*
 * False for NaN and the infinities. When the build cannot represent them
 * (e.g. "g++ -ffast-math") a warning is logged once and every value is
 * treated as finite.
 */
inline bool isFiniteDouble(double value) {
   static int warned_once_no_nan = warn_if(! std::isnan(std::sqrt(-1.0)),
         "The C++ configuration (e.g. \"g++ --fast-math\") does not support SQL standard handling of NaN.");
   static int warned_once_no_inf = warn_if(! non_std_isinf(std::pow(0.0, -1.0)),
         "The C++ configuration (e.g. \"g++ --fast-math\") does not support SQL standard handling of numeric infinity.");
   return (warned_once_no_nan || ! std::isnan(value)) && (warned_once_no_inf || ! non_std_isinf(value));
}

}
