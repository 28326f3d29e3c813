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

#include "common/types.h"

namespace valuecore {

class ExtTypeInfo;

// Declared length of an unbounded character or binary type.
static const int64_t MAX_STRING_LENGTH = 1000000000LL;

/**
 * A data type: a ValueType with precision, scale and optional extended
 * information (enum domain, geometry constraints). Immutable.
 */
class TypeInfo {
public:
    TypeInfo(ValueType type, int64_t precision, int scale,
             std::shared_ptr<const ExtTypeInfo> const& extTypeInfo = std::shared_ptr<const ExtTypeInfo>());

    /** The type with its default precision and scale and no extended info. */
    static TypeInfo getTypeInfo(ValueType type);

    /**
     * The common type of two operands: the higher value type, the larger
     * precision and scale, and the extended info of whichever side owns
     * the winning value type.
     */
    static TypeInfo getHigherType(TypeInfo const& type1, TypeInfo const& type2);

    ValueType getValueType() const { return m_valueType; }
    int64_t getPrecision() const { return m_precision; }
    int getScale() const { return m_scale; }
    const std::shared_ptr<const ExtTypeInfo>& getExtTypeInfo() const { return m_extTypeInfo; }

    /** SQL form, e.g. "NUMERIC(10, 2)" or "ENUM('a', 'b')". */
    std::string toString() const;

    bool operator==(TypeInfo const& other) const;
    bool operator!=(TypeInfo const& other) const {
        return ! operator==(other);
    }

private:
    ValueType m_valueType;
    int64_t m_precision;
    int m_scale;
    std::shared_ptr<const ExtTypeInfo> m_extTypeInfo;
};

}
