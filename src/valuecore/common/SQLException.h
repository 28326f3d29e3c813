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

#include "common/ValueCoreException.h"

#define throwSQLException(type, ...) do {                       \
   char msg[8192];                                              \
   snprintf(msg, sizeof msg, __VA_ARGS__);                      \
   msg[sizeof msg - 1] = '\0';                                  \
   throw valuecore::SQLException(type, msg);                    \
} while (false)

namespace valuecore {

class SQLException : public ValueCoreException {
public:

    // Please keep these ordered alphabetically.
    // Names and codes are standardized.
    static const char* cardinality_violation;
    static const char* column_count_does_not_match;
    static const char* data_exception_invalid_character_value_for_cast;
    static const char* data_exception_invalid_datetime_format;
    static const char* data_exception_invalid_parameter;
    static const char* data_exception_numeric_value_out_of_range;
    static const char* data_exception_value_not_permitted;
    static const char* feature_not_supported;
    static const char* integrity_constraint_violation;

    // These are non-standard -- keep them unique.
    static const char* unknown_data_type;
    static const char* general_error;

    SQLException(std::string const& sqlState, std::string const& message);
    SQLException(std::string const& sqlState, std::string const& message, int internalFlags);
    virtual ~SQLException() throw() {}

    const std::string& getSqlState() const { return m_sqlState; }

    // internal flags describing the direction of a range failure
    static const int TYPE_UNDERFLOW             = 1;
    static const int TYPE_OVERFLOW              = 2;
    int getInternalFlags() const { return m_internalFlags; }

private:
    std::string const m_sqlState;
    const int m_internalFlags;
};
}
