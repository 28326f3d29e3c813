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
#include <limits>

#include "common/Decimal.h"
#include "common/ExtTypeInfo.h"
#include "common/FatalException.hpp"
#include "common/TypeInfo.h"

namespace valuecore {

TypeInfo::TypeInfo(ValueType type, int64_t precision, int scale,
                   std::shared_ptr<const ExtTypeInfo> const& extTypeInfo)
    : m_valueType(type), m_precision(precision), m_scale(scale), m_extTypeInfo(extTypeInfo) {
}

TypeInfo TypeInfo::getTypeInfo(ValueType type) {
    switch (type) {
    case ValueType::tUNKNOWN:
        return TypeInfo(type, -1, -1);
    case ValueType::tNULL:
    case ValueType::tBOOLEAN:
        return TypeInfo(type, 1, 0);
    case ValueType::tTINYINT:
        return TypeInfo(type, 3, 0);
    case ValueType::tSMALLINT:
        return TypeInfo(type, 5, 0);
    case ValueType::tINTEGER:
        return TypeInfo(type, 10, 0);
    case ValueType::tBIGINT:
        return TypeInfo(type, 19, 0);
    case ValueType::tNUMERIC:
        return TypeInfo(type, Decimal::kMaxPrecision, 0);
    case ValueType::tDOUBLE:
        return TypeInfo(type, 17, 0);
    case ValueType::tREAL:
        return TypeInfo(type, 7, 0);
    case ValueType::tDATE:
        return TypeInfo(type, 10, 0);
    case ValueType::tTIME:
    case ValueType::tTIME_TZ:
        return TypeInfo(type, 18, 9);
    case ValueType::tTIMESTAMP:
        return TypeInfo(type, 29, 9);
    case ValueType::tTIMESTAMP_TZ:
        return TypeInfo(type, 35, 9);
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
    case ValueType::tINTERVAL_DAY_TO_HOUR:
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
        return TypeInfo(type, 18, 0);
    case ValueType::tINTERVAL_SECOND:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        return TypeInfo(type, 18, 9);
    case ValueType::tUUID:
        return TypeInfo(type, 16, 0);
    case ValueType::tVARCHAR:
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR:
    case ValueType::tCLOB:
    case ValueType::tVARBINARY:
    case ValueType::tBLOB:
    case ValueType::tJAVA_OBJECT:
    case ValueType::tJSON:
    case ValueType::tGEOMETRY:
    case ValueType::tENUM:
    case ValueType::tARRAY:
    case ValueType::tROW:
        return TypeInfo(type, MAX_STRING_LENGTH, 0);
    case ValueType::tRESULT_SET:
        return TypeInfo(type, std::numeric_limits<int32_t>::max(), 0);
    }
    throwFatalException("Unknown value type code %d", static_cast<int>(type));
}

TypeInfo TypeInfo::getHigherType(TypeInfo const& type1, TypeInfo const& type2) {
    const ValueType higher = getHigherOrder(type1.m_valueType, type2.m_valueType);
    std::shared_ptr<const ExtTypeInfo> ext;
    if (higher == type1.m_valueType && type1.m_extTypeInfo != NULL) {
        ext = type1.m_extTypeInfo;
    } else if (higher == type2.m_valueType) {
        ext = type2.m_extTypeInfo;
    }
    return TypeInfo(higher,
                    std::max(type1.m_precision, type2.m_precision),
                    std::max(type1.m_scale, type2.m_scale),
                    ext);
}

std::string TypeInfo::toString() const {
    if (m_extTypeInfo != NULL) {
        return m_extTypeInfo->getCreateSQL();
    }
    std::string result = getTypeName(m_valueType);
    switch (m_valueType) {
    case ValueType::tNUMERIC:
        result.append("(").append(std::to_string(m_precision))
              .append(", ").append(std::to_string(m_scale)).append(")");
        break;
    case ValueType::tVARCHAR:
    case ValueType::tVARCHAR_IGNORECASE:
    case ValueType::tCHAR:
    case ValueType::tVARBINARY:
        if (m_precision < MAX_STRING_LENGTH) {
            result.append("(").append(std::to_string(m_precision)).append(")");
        }
        break;
    default:
        break;
    }
    return result;
}

bool TypeInfo::operator==(TypeInfo const& other) const {
    if (m_valueType != other.m_valueType || m_precision != other.m_precision || m_scale != other.m_scale) {
        return false;
    }
    if (m_extTypeInfo == NULL || other.m_extTypeInfo == NULL) {
        return m_extTypeInfo == other.m_extTypeInfo;
    }
    return m_extTypeInfo->equals(*other.m_extTypeInfo);
}

}
