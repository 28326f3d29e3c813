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

#include "common/debuglog.h"
#include "common/ValueCoreException.h"

namespace valuecore {

const char* exceptionTypeToString(ValueCoreExceptionType exceptionType) {
    switch (exceptionType) {
        case ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_NONE:
            return "VALUECORE_EXCEPTION_TYPE_NONE";
        case ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_GENERIC:
            return "VALUECORE_EXCEPTION_TYPE_GENERIC";
        case ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_SQL:
            return "VALUECORE_EXCEPTION_TYPE_SQL";
        case ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_CONFIGURATION:
            return "VALUECORE_EXCEPTION_TYPE_CONFIGURATION";
        case ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_GEOMETRY_CODEC:
            return "VALUECORE_EXCEPTION_TYPE_GEOMETRY_CODEC";
        default:
            return "UNKNOWN";
    }
}

ValueCoreException::ValueCoreException(ValueCoreExceptionType exceptionType, std::string const& message) :
    std::runtime_error(message), m_exceptionType(exceptionType), m_message(message) {
    VC_DEBUG("Created ValueCoreException: type: %s message: %s",
             exceptionTypeToString(exceptionType), message.c_str());
}

ValueCoreException::ValueCoreException(std::string const& message) :
    std::runtime_error(message),
    m_exceptionType(ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_GENERIC),
    m_message(message) {
    VC_DEBUG("Created ValueCoreException: default type, %s", message.c_str());
}

}
