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

#include <algorithm>

#include <boost/algorithm/string.hpp>

#include "common/CastDataProvider.h"
#include "common/ExtTypeInfo.h"
#include "common/GeometryCodec.h"
#include "common/SQLException.h"
#include "common/Value.hpp"
#include "common/ValueExceptions.h"
#include "common/ValueFactory.hpp"

namespace valuecore {

static std::string quoteLabel(std::string const& label) {
    return "'" + boost::algorithm::replace_all_copy(label, "'", "''") + "'";
}

// ------------------------------------------------------------------
// ExtTypeInfoEnum
// ------------------------------------------------------------------

// Key used for case-insensitive label lookup.
static std::string cleanLabel(std::string const& label) {
    return boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(label));
}

static std::vector<std::string> sanitizeAll(std::vector<std::string> const& labels) {
    std::vector<std::string> cleaned;
    cleaned.reserve(labels.size());
    for (size_t ii = 0; ii < labels.size(); ii++) {
        cleaned.push_back(cleanLabel(labels[ii]));
    }
    return cleaned;
}

std::string ExtTypeInfoEnum::sanitize(std::string const& label) {
    return cleanLabel(label);
}

ExtTypeInfoEnum::ExtTypeInfoEnum(std::vector<std::string> const& enumerators)
    : m_enumerators(enumerators), m_cleaned(sanitizeAll(enumerators)) {
}

std::shared_ptr<const ExtTypeInfoEnum> ExtTypeInfoEnum::create(std::vector<std::string> const& labels) {
    if (labels.empty()) {
        throw EnumValueNotPermittedException("Empty enums are not allowed");
    }
    std::vector<std::string> enumerators;
    std::vector<std::string> cleaned;
    for (size_t ii = 0; ii < labels.size(); ii++) {
        const std::string label = boost::algorithm::trim_copy(labels[ii]);
        if (label.empty()) {
            throw EnumValueNotPermittedException("Empty enum label");
        }
        const std::string key = sanitize(label);
        if (std::find(cleaned.begin(), cleaned.end(), key) != cleaned.end()) {
            throw EnumValueNotPermittedException("Duplicate enum label " + quoteLabel(label));
        }
        enumerators.push_back(label);
        cleaned.push_back(key);
    }
    return std::shared_ptr<const ExtTypeInfoEnum>(new ExtTypeInfoEnum(enumerators));
}

std::shared_ptr<const ExtTypeInfoEnum> ExtTypeInfoEnum::getEnumeratorsForBinaryOperation(Value const& left,
                                                                                         Value const& right) {
    if (left.getValueType() != ValueType::tENUM) {
        if (right.getValueType() != ValueType::tENUM) {
            throw DataConversionException(getTypeName(left.getValueType()), "ENUM");
        }
        return right.getEnumerators();
    }
    const std::shared_ptr<const ExtTypeInfoEnum>& leftEnumerators = left.getEnumerators();
    if (right.getValueType() != ValueType::tENUM) {
        return leftEnumerators;
    }
    const std::shared_ptr<const ExtTypeInfoEnum>& rightEnumerators = right.getEnumerators();
    if (leftEnumerators == rightEnumerators || leftEnumerators->equals(*rightEnumerators)) {
        return leftEnumerators;
    }
    std::vector<std::string> labels(leftEnumerators->m_enumerators);
    for (size_t ii = 0; ii < rightEnumerators->m_enumerators.size(); ii++) {
        const std::string& key = rightEnumerators->m_cleaned[ii];
        if (std::find(leftEnumerators->m_cleaned.begin(), leftEnumerators->m_cleaned.end(), key)
                == leftEnumerators->m_cleaned.end()) {
            labels.push_back(rightEnumerators->m_enumerators[ii]);
        }
    }
    return create(labels);
}

const std::string& ExtTypeInfoEnum::getEnumerator(int ordinal) const {
    if (ordinal < 0 || ordinal >= getCount()) {
        throw EnumValueNotPermittedException(getCreateSQL() + " ordinal " + std::to_string(ordinal));
    }
    return m_enumerators[ordinal];
}

Value ExtTypeInfoEnum::getValue(int ordinal) const {
    // validates the ordinal
    getEnumerator(ordinal);
    return ValueFactory::getEnumValue(shared_from_this(), ordinal);
}

Value ExtTypeInfoEnum::getValue(std::string const& label) const {
    for (size_t ii = 0; ii < m_enumerators.size(); ii++) {
        if (m_enumerators[ii] == label) {
            return ValueFactory::getEnumValue(shared_from_this(), static_cast<int>(ii));
        }
    }
    const std::string key = sanitize(label);
    for (size_t ii = 0; ii < m_cleaned.size(); ii++) {
        if (m_cleaned[ii] == key) {
            return ValueFactory::getEnumValue(shared_from_this(), static_cast<int>(ii));
        }
    }
    throw EnumValueNotPermittedException(getCreateSQL() + " " + quoteLabel(label));
}

Value ExtTypeInfoEnum::cast(Value const& value, const CastDataProvider* provider) const {
    if (value.getValueType() != ValueType::tENUM) {
        return value.convertTo(ValueType::tENUM, this, provider, std::string());
    }
    const std::shared_ptr<const ExtTypeInfoEnum>& current = value.getEnumerators();
    if (current.get() == this || equals(*current)) {
        return value;
    }
    return getValue(value.getString());
}

std::string ExtTypeInfoEnum::getCreateSQL() const {
    std::string sql = "ENUM(";
    for (size_t ii = 0; ii < m_enumerators.size(); ii++) {
        if (ii > 0) {
            sql.append(", ");
        }
        sql.append(quoteLabel(m_enumerators[ii]));
    }
    return sql.append(")");
}

bool ExtTypeInfoEnum::equals(ExtTypeInfo const& other) const {
    const ExtTypeInfoEnum* enumerators = dynamic_cast<const ExtTypeInfoEnum*>(&other);
    return enumerators != NULL && m_enumerators == enumerators->m_enumerators;
}

// ------------------------------------------------------------------
// ExtTypeInfoGeometry
// ------------------------------------------------------------------

const char* ExtTypeInfoGeometry::typeCodeToString(int typeCode) {
    switch (typeCode) {
    case POINT:
        return "POINT";
    case LINE_STRING:
        return "LINESTRING";
    case POLYGON:
        return "POLYGON";
    case MULTI_POINT:
        return "MULTIPOINT";
    case MULTI_LINE_STRING:
        return "MULTILINESTRING";
    case MULTI_POLYGON:
        return "MULTIPOLYGON";
    case GEOMETRY_COLLECTION:
        return "GEOMETRYCOLLECTION";
    default:
        return "GEOMETRY";
    }
}

Value ExtTypeInfoGeometry::cast(Value const& value, const CastDataProvider* provider) const {
    const Value geometry = value.convertTo(ValueType::tGEOMETRY, NULL, provider, std::string());
    if (geometry.isNull() || (m_typeCode == 0 && ! m_hasSrid)) {
        return geometry;
    }
    const std::shared_ptr<const GeometryCodec>& codec = geometry.getGeometryCodec();
    if (codec == NULL) {
        throw DataConversionException(geometry.getTraceSQL() + " to " + getCreateSQL());
    }
    const std::string ewkb = geometry.asBytes();
    const int typeCode = codec->getGeometryType(ewkb);
    if (m_typeCode != 0 && typeCode != m_typeCode) {
        throwSQLException(SQLException::integrity_constraint_violation,
                          "Check constraint violation: %s is a %s, not a %s",
                          geometry.getTraceSQL().c_str(), typeCodeToString(typeCode),
                          typeCodeToString(m_typeCode));
    }
    if (m_hasSrid) {
        const int32_t srid = codec->getSrid(ewkb);
        if (srid != m_srid) {
            throwSQLException(SQLException::integrity_constraint_violation,
                              "Check constraint violation: %s has SRID %d, not %d",
                              geometry.getTraceSQL().c_str(), srid, m_srid);
        }
    }
    return geometry;
}

std::string ExtTypeInfoGeometry::getCreateSQL() const {
    std::string sql = "GEOMETRY";
    if (m_typeCode != 0 || m_hasSrid) {
        sql.append("(").append(typeCodeToString(m_typeCode));
        if (m_hasSrid) {
            sql.append(", ").append(std::to_string(m_srid));
        }
        sql.append(")");
    }
    return sql;
}

bool ExtTypeInfoGeometry::equals(ExtTypeInfo const& other) const {
    const ExtTypeInfoGeometry* geometry = dynamic_cast<const ExtTypeInfoGeometry*>(&other);
    return geometry != NULL && m_typeCode == geometry->m_typeCode && m_hasSrid == geometry->m_hasSrid
        && (! m_hasSrid || m_srid == geometry->m_srid);
}

}
