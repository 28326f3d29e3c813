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

#include <cstdio>
#include <stdexcept>
#include <string>

#define throwValueCoreException(...) do {                       \
   char msg[8192];                                              \
   snprintf(msg, sizeof msg, __VA_ARGS__);                      \
   msg[sizeof msg - 1] = '\0';                                  \
   throw valuecore::ValueCoreException(msg);                    \
} while (false)

namespace valuecore {

/*
 * The category of a raised exception. Callers that only need to know
 * whether an error is a user-facing SQL error or a configuration problem
 * can switch on this without a dynamic_cast.
 */
enum class ValueCoreExceptionType {
    VALUECORE_EXCEPTION_TYPE_NONE = 0,
    VALUECORE_EXCEPTION_TYPE_GENERIC = 1,
    VALUECORE_EXCEPTION_TYPE_SQL = 2,
    VALUECORE_EXCEPTION_TYPE_CONFIGURATION = 3,
    VALUECORE_EXCEPTION_TYPE_GEOMETRY_CODEC = 4
};

const char* exceptionTypeToString(ValueCoreExceptionType exceptionType);

/**
 * Base class for every recoverable error the value core raises.
 */
class ValueCoreException : public std::runtime_error {
public:
    ValueCoreException(ValueCoreExceptionType exceptionType, std::string const& message);
    ValueCoreException(std::string const& message);
    virtual ~ValueCoreException() throw() {}

    ValueCoreExceptionType getType() const { return m_exceptionType; }
    const std::string& message() const { return m_message; }

private:
    const ValueCoreExceptionType m_exceptionType;
    const std::string m_message;
};

}
