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
#include <vector>

namespace valuecore {

class CastDataProvider;
class Value;

/**
 * Extended type information: metadata beyond precision and scale that a
 * value must satisfy to belong to a data type.
 */
class ExtTypeInfo {
public:
    virtual ~ExtTypeInfo() {}

    /**
     * Re-validates 'value', already of the owning value type (or, for
     * ENUM, of any type an enum accepts), under this metadata. Returns
     * the value itself when it already conforms.
     */
    virtual Value cast(Value const& value, const CastDataProvider* provider) const = 0;

    /** The type suffix as it would appear in a CREATE statement. */
    virtual std::string getCreateSQL() const = 0;

    virtual bool equals(ExtTypeInfo const& other) const = 0;
};

/**
 * The domain of an ENUM type: an ordered list of distinct labels. Values
 * of the type refer to their domain, so domains are only created through
 * create() and always owned by a shared_ptr.
 */
class ExtTypeInfoEnum : public ExtTypeInfo, public std::enable_shared_from_this<ExtTypeInfoEnum> {
public:
    /**
     * Builds a domain from raw labels. Labels are trimmed; an empty list,
     * an empty label or two labels equal ignoring case are rejected with
     * EnumValueNotPermittedException.
     */
    static std::shared_ptr<const ExtTypeInfoEnum> create(std::vector<std::string> const& labels);

    /**
     * The domain both operands of a comparison are converted to. With one
     * ENUM operand that is its domain. With two, their domain when they
     * agree, otherwise the left labels followed by those right labels not
     * already present.
     */
    static std::shared_ptr<const ExtTypeInfoEnum> getEnumeratorsForBinaryOperation(Value const& left,
                                                                                   Value const& right);

    int getCount() const { return static_cast<int>(m_enumerators.size()); }
    const std::vector<std::string>& getEnumerators() const { return m_enumerators; }
    const std::string& getEnumerator(int ordinal) const;

    /** ENUM value for a 0-based ordinal. */
    Value getValue(int ordinal) const;
    /** ENUM value for a label; exact match first, then ignoring case and spaces. */
    Value getValue(std::string const& label) const;

    Value cast(Value const& value, const CastDataProvider* provider) const;
    std::string getCreateSQL() const;
    bool equals(ExtTypeInfo const& other) const;

private:
    explicit ExtTypeInfoEnum(std::vector<std::string> const& enumerators);

    static std::string sanitize(std::string const& label);

    const std::vector<std::string> m_enumerators;
    // sanitize()d labels, same order as m_enumerators
    const std::vector<std::string> m_cleaned;
};

/**
 * Restricts a GEOMETRY type to one geometry type code and/or SRID.
 */
class ExtTypeInfoGeometry : public ExtTypeInfo {
public:
    // Geometry type codes as stored in EWKB.
    static const int POINT = 1;
    static const int LINE_STRING = 2;
    static const int POLYGON = 3;
    static const int MULTI_POINT = 4;
    static const int MULTI_LINE_STRING = 5;
    static const int MULTI_POLYGON = 6;
    static const int GEOMETRY_COLLECTION = 7;

    /** A zero type code accepts any geometry type. */
    ExtTypeInfoGeometry(int typeCode, bool hasSrid, int32_t srid)
        : m_typeCode(typeCode), m_hasSrid(hasSrid), m_srid(srid) {}

    int getTypeCode() const { return m_typeCode; }
    bool hasSrid() const { return m_hasSrid; }
    int32_t getSrid() const { return m_srid; }

    /**
     * Converts to GEOMETRY, then rejects a geometry of another type or
     * SRID with an integrity constraint violation.
     */
    Value cast(Value const& value, const CastDataProvider* provider) const;
    std::string getCreateSQL() const;
    bool equals(ExtTypeInfo const& other) const;

    static const char* typeCodeToString(int typeCode);

private:
    const int m_typeCode;
    const bool m_hasSrid;
    const int32_t m_srid;
};

}
