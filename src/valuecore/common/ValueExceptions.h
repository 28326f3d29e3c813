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

#include "common/SQLException.h"

namespace valuecore {

/**
 * A value of one kind has no representation in another kind, or its
 * payload is not acceptable there. Message: Data conversion error
 * converting "FROM to TO".
 */
class DataConversionException : public SQLException {
public:
    DataConversionException(std::string const& fromType, std::string const& toType);
    explicit DataConversionException(std::string const& detail);
    virtual ~DataConversionException() throw() {}

    const std::string& detail() const { return m_detail; }

protected:
    DataConversionException(std::string const& sqlState, std::string const& message,
                            std::string const& detail);

private:
    const std::string m_detail;
};

/**
 * Text that was expected to hold a number, boolean, UUID or hex string
 * and did not parse.
 */
class MalformedLiteralException : public DataConversionException {
public:
    explicit MalformedLiteralException(std::string const& text);
    virtual ~MalformedLiteralException() throw() {}
};

/**
 * An enum label or ordinal outside its domain, or an ill-formed domain.
 */
class EnumValueNotPermittedException : public DataConversionException {
public:
    explicit EnumValueNotPermittedException(std::string const& detail);
    virtual ~EnumValueNotPermittedException() throw() {}
};

/**
 * A numeric value does not fit the target width. TYPE_OVERFLOW or
 * TYPE_UNDERFLOW is set in the internal flags.
 */
class NumericOverflowException : public SQLException {
public:
    NumericOverflowException(std::string const& valueText, std::string const& column, int internalFlags);
    virtual ~NumericOverflowException() throw() {}

    const std::string& valueText() const { return m_valueText; }
    const std::string& column() const { return m_column; }

private:
    const std::string m_valueText;
    const std::string m_column;
};

class InvalidDatetimeLiteralException : public SQLException {
public:
    InvalidDatetimeLiteralException(std::string const& typeName, std::string const& text);
    virtual ~InvalidDatetimeLiteralException() throw() {}

    const std::string& typeName() const { return m_typeName; }
    const std::string& text() const { return m_text; }

private:
    const std::string m_typeName;
    const std::string m_text;
};

class InvalidIntervalLiteralException : public InvalidDatetimeLiteralException {
public:
    InvalidIntervalLiteralException(std::string const& qualifier, std::string const& text);
    virtual ~InvalidIntervalLiteralException() throw() {}
};

class ScalarSubqueryCardinalityException : public SQLException {
public:
    ScalarSubqueryCardinalityException();
    virtual ~ScalarSubqueryCardinalityException() throw() {}
};

class UnknownTypeException : public SQLException {
public:
    explicit UnknownTypeException(std::string const& detail);
    virtual ~UnknownTypeException() throw() {}
};

}
