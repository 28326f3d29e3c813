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

#include "common/ValueCoreException.h"

namespace valuecore {

/**
 * Raised by a GeometryCodec for text or bytes it cannot read.
 */
class GeometryCodecException : public ValueCoreException {
public:
    explicit GeometryCodecException(std::string const& message)
        : ValueCoreException(ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_GEOMETRY_CODEC, message) {}
    virtual ~GeometryCodecException() throw() {}
};

/**
 * Translates geometries between EWKB, the form GEOMETRY values hold, and
 * their textual forms. Supplied by the embedding engine; the value core
 * never interprets geometry bytes itself. Implementations must be safe to
 * call from several threads.
 */
class GeometryCodec {
public:
    virtual ~GeometryCodec() {}

    /** Checks that 'ewkb' is well formed and returns it in canonical form. */
    virtual std::string parseEwkb(std::string const& ewkb) const = 0;
    /** EWKT or WKT to EWKB. */
    virtual std::string parseWkt(std::string const& text) const = 0;
    /** EWKT, e.g. "SRID=4326;POINT (1 2)". */
    virtual std::string toWkt(std::string const& ewkb) const = 0;
    virtual std::string ewkbToGeoJson(std::string const& ewkb) const = 0;
    virtual std::string geoJsonToEwkb(std::string const& json, int32_t srid) const = 0;
    virtual int32_t getSrid(std::string const& ewkb) const = 0;
    /** One of the ExtTypeInfoGeometry type codes. */
    virtual int getGeometryType(std::string const& ewkb) const = 0;
};

}
