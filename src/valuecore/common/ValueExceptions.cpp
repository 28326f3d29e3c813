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

#include "common/ValueExceptions.h"

namespace valuecore {

static std::string conversionMessage(std::string const& detail) {
    return "Data conversion error converting \"" + detail + "\"";
}

DataConversionException::DataConversionException(std::string const& fromType, std::string const& toType) :
    SQLException(SQLException::data_exception_invalid_character_value_for_cast,
                 conversionMessage(fromType + " to " + toType)),
    m_detail(fromType + " to " + toType) {
}

DataConversionException::DataConversionException(std::string const& detail) :
    SQLException(SQLException::data_exception_invalid_character_value_for_cast, conversionMessage(detail)),
    m_detail(detail) {
}

DataConversionException::DataConversionException(std::string const& sqlState, std::string const& message,
                                                 std::string const& detail) :
    SQLException(sqlState, message), m_detail(detail) {
}

MalformedLiteralException::MalformedLiteralException(std::string const& text) :
    DataConversionException(text) {
}

EnumValueNotPermittedException::EnumValueNotPermittedException(std::string const& detail) :
    DataConversionException(SQLException::data_exception_value_not_permitted,
                            "Value not permitted for column: " + detail, detail) {
}

static std::string outOfRangeMessage(std::string const& valueText, std::string const& column) {
    std::string msg = "Value out of range: \"" + valueText + "\"";
    if (!column.empty()) {
        msg.append(" (column \"").append(column).append("\")");
    }
    return msg;
}

NumericOverflowException::NumericOverflowException(std::string const& valueText, std::string const& column,
                                                   int internalFlags) :
    SQLException(SQLException::data_exception_numeric_value_out_of_range,
                 outOfRangeMessage(valueText, column), internalFlags),
    m_valueText(valueText), m_column(column) {
}

InvalidDatetimeLiteralException::InvalidDatetimeLiteralException(std::string const& typeName,
                                                                 std::string const& text) :
    SQLException(SQLException::data_exception_invalid_datetime_format,
                 "Cannot parse \"" + typeName + "\" constant \"" + text + "\""),
    m_typeName(typeName), m_text(text) {
}

InvalidIntervalLiteralException::InvalidIntervalLiteralException(std::string const& qualifier,
                                                                 std::string const& text) :
    InvalidDatetimeLiteralException("INTERVAL " + qualifier, text) {
}

ScalarSubqueryCardinalityException::ScalarSubqueryCardinalityException() :
    SQLException(SQLException::cardinality_violation, "Scalar subquery contains more than one row") {
}

UnknownTypeException::UnknownTypeException(std::string const& detail) :
    SQLException(SQLException::unknown_data_type, "Unknown data type: \"" + detail + "\"") {
}

}
