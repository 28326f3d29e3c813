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

#include <time.h>

#include <cstdio>
#include <cstdlib>

#include "common/CastDataProvider.h"
#include "common/DateTimeUtils.h"
#include "common/SQLException.h"
#include "common/ValueFactory.hpp"

namespace valuecore {

FixedOffsetTimeZone::FixedOffsetTimeZone(int32_t offsetSeconds) : m_offsetSeconds(offsetSeconds) {
    if (offsetSeconds < -MAX_TIME_ZONE_OFFSET_SECONDS || offsetSeconds > MAX_TIME_ZONE_OFFSET_SECONDS) {
        throwSQLException(SQLException::data_exception_invalid_parameter,
                          "Invalid time zone offset %d seconds", offsetSeconds);
    }
}

std::string FixedOffsetTimeZone::getId() const {
    if (m_offsetSeconds == 0) {
        return "UTC";
    }
    const int32_t magnitude = std::abs(m_offsetSeconds);
    char buffer[16];
    if (magnitude % 60 == 0) {
        snprintf(buffer, sizeof buffer, "%c%02d:%02d", m_offsetSeconds < 0 ? '-' : '+',
                 magnitude / 3600, magnitude / 60 % 60);
    } else {
        snprintf(buffer, sizeof buffer, "%c%02d:%02d:%02d", m_offsetSeconds < 0 ? '-' : '+',
                 magnitude / 3600, magnitude / 60 % 60, magnitude % 60);
    }
    return buffer;
}

const CastDataProvider& CastDataProvider::getDefault() {
    static const SystemCastDataProvider provider(0);
    return provider;
}

static int32_t offsetOf(Value const& currentTimestamp) {
    if (currentTimestamp.getValueType() != ValueType::tTIMESTAMP_TZ) {
        throwSQLException(SQLException::data_exception_invalid_parameter,
                          "Current timestamp must be a TIMESTAMP WITH TIME ZONE, not %s",
                          currentTimestamp.debug().c_str());
    }
    return currentTimestamp.getTimeZoneOffsetSeconds();
}

SimpleCastDataProvider::SimpleCastDataProvider(Value const& currentTimestamp,
                                               std::shared_ptr<const GeometryCodec> const& codec)
    : m_currentTimestamp(currentTimestamp), m_timeZone(offsetOf(currentTimestamp)), m_codec(codec) {
}

SimpleCastDataProvider::SimpleCastDataProvider(Value const& currentTimestamp, int32_t zoneOffsetSeconds,
                                               std::shared_ptr<const GeometryCodec> const& codec)
    : m_currentTimestamp(currentTimestamp), m_timeZone(zoneOffsetSeconds), m_codec(codec) {
    offsetOf(currentTimestamp);
}

SystemCastDataProvider::SystemCastDataProvider(int32_t zoneOffsetSeconds,
                                               std::shared_ptr<const GeometryCodec> const& codec)
    : m_timeZone(zoneOffsetSeconds), m_codec(codec) {
}

Value SystemCastDataProvider::currentTimestamp() const {
    struct timespec now;
    if (clock_gettime(CLOCK_REALTIME, &now) != 0) {
        throwSQLException(SQLException::general_error, "Cannot read the system clock");
    }
    const int64_t epochSeconds = static_cast<int64_t>(now.tv_sec);
    const int32_t offset = m_timeZone.getTimeZoneOffsetUTC(epochSeconds);
    const int64_t localSeconds = epochSeconds + offset;
    return ValueFactory::getTimestampTzValue(datetime::dateValueFromLocalSeconds(localSeconds),
                                             datetime::nanosFromLocalSeconds(localSeconds) + now.tv_nsec,
                                             offset);
}

}
