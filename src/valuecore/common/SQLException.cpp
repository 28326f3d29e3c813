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
#include "common/SQLException.h"
#include "common/debuglog.h"

using namespace valuecore;

// Please keep these ordered alphabetically.
// Names and codes are standardized.
const char* SQLException::cardinality_violation = "21000";
const char* SQLException::column_count_does_not_match = "21S02";
const char* SQLException::data_exception_invalid_character_value_for_cast = "22018";
const char* SQLException::data_exception_invalid_datetime_format = "22007";
const char* SQLException::data_exception_invalid_parameter = "22023";
const char* SQLException::data_exception_numeric_value_out_of_range = "22003";
const char* SQLException::data_exception_value_not_permitted = "22030";
const char* SQLException::feature_not_supported = "0A000";
const char* SQLException::integrity_constraint_violation = "23000";

// These are non-standard -- keep them unique.
const char* SQLException::unknown_data_type = "50004";
const char* SQLException::general_error = "50000";

SQLException::SQLException(std::string const& sqlState, std::string const& message) :
    ValueCoreException(ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_SQL, message),
    m_sqlState(sqlState), m_internalFlags(0) {
    vcassert(m_sqlState.length() == 5);
}

SQLException::SQLException(std::string const& sqlState, std::string const& message, int internalFlags) :
    ValueCoreException(ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_SQL, message),
    m_sqlState(sqlState), m_internalFlags(internalFlags) {
    vcassert(m_sqlState.length() == 5);
}
