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
#include <memory>
#include <string>

#include "common/GeometryCodec.h"
#include "common/Value.hpp"

namespace valuecore {

/**
 * Time zone rules used to move between local date/times and instants.
 */
class TimeZoneProvider {
public:
    virtual ~TimeZoneProvider() {}

    /** Offset in seconds in effect at the given instant. */
    virtual int32_t getTimeZoneOffsetUTC(int64_t epochSeconds) const = 0;

    /** Offset in seconds in effect at the given local date and time. */
    virtual int32_t getTimeZoneOffsetLocal(int64_t dateValue, int64_t timeNanos) const = 0;

    virtual std::string getId() const = 0;
};

/**
 * A zone with one offset for all time.
 */
class FixedOffsetTimeZone : public TimeZoneProvider {
public:
    /** Throws SQLException (22023) beyond +/- 18 hours. */
    explicit FixedOffsetTimeZone(int32_t offsetSeconds);

    int32_t getTimeZoneOffsetUTC(int64_t) const {
        return m_offsetSeconds;
    }

    int32_t getTimeZoneOffsetLocal(int64_t, int64_t) const {
        return m_offsetSeconds;
    }

    /** "UTC" for offset zero, else the offset, e.g. "+05:30". */
    std::string getId() const;

private:
    const int32_t m_offsetSeconds;
};

/**
 * Session context needed by conversions between temporal types and by
 * GEOMETRY conversions. One snapshot should serve a whole statement so
 * that every conversion sees the same current timestamp.
 */
class CastDataProvider {
public:
    virtual ~CastDataProvider() {}

    /** The statement's current timestamp, a TIMESTAMP_TZ value. */
    virtual Value currentTimestamp() const = 0;

    virtual const TimeZoneProvider& currentTimeZone() const = 0;

    /** Codec for GEOMETRY conversions; empty when geometry is unsupported. */
    virtual std::shared_ptr<const GeometryCodec> getGeometryCodec() const = 0;

    /**
     * Provider used when a conversion is requested without one: the
     * system clock in UTC, without geometry support.
     */
    static const CastDataProvider& getDefault();
};

/**
 * A provider with a fixed current timestamp and a fixed offset zone.
 */
class SimpleCastDataProvider : public CastDataProvider {
public:
    /**
     * 'currentTimestamp' must be a TIMESTAMP_TZ value; the zone offset
     * defaults to the offset it carries.
     */
    explicit SimpleCastDataProvider(Value const& currentTimestamp,
            std::shared_ptr<const GeometryCodec> const& codec = std::shared_ptr<const GeometryCodec>());
    SimpleCastDataProvider(Value const& currentTimestamp, int32_t zoneOffsetSeconds,
            std::shared_ptr<const GeometryCodec> const& codec = std::shared_ptr<const GeometryCodec>());

    Value currentTimestamp() const {
        return m_currentTimestamp;
    }

    const TimeZoneProvider& currentTimeZone() const {
        return m_timeZone;
    }

    std::shared_ptr<const GeometryCodec> getGeometryCodec() const {
        return m_codec;
    }

private:
    const Value m_currentTimestamp;
    const FixedOffsetTimeZone m_timeZone;
    const std::shared_ptr<const GeometryCodec> m_codec;
};

/**
 * A provider reading the system clock on every currentTimestamp() call,
 * in a fixed offset zone.
 */
class SystemCastDataProvider : public CastDataProvider {
public:
    explicit SystemCastDataProvider(int32_t zoneOffsetSeconds,
            std::shared_ptr<const GeometryCodec> const& codec = std::shared_ptr<const GeometryCodec>());

    Value currentTimestamp() const;

    const TimeZoneProvider& currentTimeZone() const {
        return m_timeZone;
    }

    std::shared_ptr<const GeometryCodec> getGeometryCodec() const {
        return m_codec;
    }

private:
    const FixedOffsetTimeZone m_timeZone;
    const std::shared_ptr<const GeometryCodec> m_codec;
};

}
