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
#include <cmath>
#include <cstring>

#include <boost/algorithm/string.hpp>
#include <boost/functional/hash.hpp>

#include "common/DateTimeUtils.h"
#include "common/ExtTypeInfo.h"
#include "common/FatalException.hpp"
#include "common/ResultInterface.h"
#include "common/SQLException.h"
#include "common/ValueBody.hpp"
#include "common/debuglog.h"

namespace valuecore {

template<typename T>
static inline int compareNumbers(T left, T right) {
    return left < right ? -1 : (left > right ? 1 : 0);
}

// Unsigned byte order, which for UTF-8 text is code point order.
static int compareBytes(std::string const& left, std::string const& right) {
    const size_t common = std::min(left.size(), right.size());
    const int comp = ::memcmp(left.data(), right.data(), common);
    if (comp != 0) {
        return comp < 0 ? -1 : 1;
    }
    return compareNumbers(left.size(), right.size());
}

/*
 * Total order over doubles: -0.0 sorts before 0.0, and NaN after every
 * other value and equal to itself.
 */
static int compareDoubles(double left, double right) {
    if (left < right) {
        return -1;
    }
    if (left > right) {
        return 1;
    }
    const bool leftNaN = std::isnan(left);
    const bool rightNaN = std::isnan(right);
    if (leftNaN || rightNaN) {
        return leftNaN == rightNaN ? 0 : (leftNaN ? 1 : -1);
    }
    const bool leftNegative = std::signbit(left);
    const bool rightNegative = std::signbit(right);
    return leftNegative == rightNegative ? 0 : (leftNegative ? -1 : 1);
}

static std::string upperCase(std::string const& text) {
    return boost::algorithm::to_upper_copy(text);
}

static void checkColumnCount(size_t left, size_t right) {
    if (left != right) {
        throwSQLException(SQLException::column_count_does_not_match,
                          "Column count does not match: %d and %d",
                          static_cast<int>(left), static_cast<int>(right));
    }
}

int Value::compareTypeSafe(Value const& rhs) const {
    const ValueBody& l = body();
    const ValueBody& r = rhs.body();
    vcassert(l.m_type == r.m_type);
    switch (l.m_type) {
    case ValueType::tNULL:
        return 0;
    case ValueType::tBOOLEAN:
    case ValueType::tTINYINT:
    case ValueType::tSMALLINT:
    case ValueType::tINTEGER:
    case ValueType::tBIGINT:
    case ValueType::tDATE:
    case ValueType::tENUM:
        return compareNumbers(l.m_long, r.m_long);
    case ValueType::tNUMERIC: {
        const int comp = l.m_decimal.compareTo(r.m_decimal);
        return comp < 0 ? -1 : (comp > 0 ? 1 : 0);
    }
    case ValueType::tDOUBLE:
        return compareDoubles(l.m_double, r.m_double);
    case ValueType::tREAL:
        return compareDoubles(l.m_float, r.m_float);
    case ValueType::tVARCHAR:
    case ValueType::tCHAR:
    case ValueType::tCLOB:
    case ValueType::tVARBINARY:
    case ValueType::tBLOB:
    case ValueType::tJAVA_OBJECT:
    case ValueType::tJSON:
    case ValueType::tGEOMETRY:
        return compareBytes(l.m_bytes, r.m_bytes);
    case ValueType::tVARCHAR_IGNORECASE:
        return compareBytes(upperCase(l.m_bytes), upperCase(r.m_bytes));
    case ValueType::tTIME:
    case ValueType::tTIMESTAMP: {
        const int comp = compareNumbers(l.m_long, r.m_long);
        return comp != 0 ? comp : compareNumbers(l.m_long2, r.m_long2);
    }
    case ValueType::tTIME_TZ: {
        const int comp = compareNumbers(l.m_long2 - l.m_offsetSeconds * NANOS_PER_SECOND,
                                        r.m_long2 - r.m_offsetSeconds * NANOS_PER_SECOND);
        return comp != 0 ? comp : compareNumbers(l.m_offsetSeconds, r.m_offsetSeconds);
    }
    case ValueType::tTIMESTAMP_TZ: {
        const int comp = compareNumbers(datetime::getEpochSeconds(l.m_long, l.m_long2, l.m_offsetSeconds),
                                        datetime::getEpochSeconds(r.m_long, r.m_long2, r.m_offsetSeconds));
        return comp != 0 ? comp : compareNumbers(l.m_long2 % NANOS_PER_SECOND, r.m_long2 % NANOS_PER_SECOND);
    }
    case ValueType::tINTERVAL_YEAR:
    case ValueType::tINTERVAL_MONTH:
    case ValueType::tINTERVAL_DAY:
    case ValueType::tINTERVAL_HOUR:
    case ValueType::tINTERVAL_MINUTE:
    case ValueType::tINTERVAL_SECOND:
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
    case ValueType::tINTERVAL_DAY_TO_HOUR:
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
    case ValueType::tINTERVAL_DAY_TO_SECOND:
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
    case ValueType::tINTERVAL_MINUTE_TO_SECOND: {
        if (l.m_negative != r.m_negative) {
            return l.m_negative ? -1 : 1;
        }
        int comp = compareNumbers(l.m_long, r.m_long);
        if (comp == 0) {
            comp = compareNumbers(l.m_long2, r.m_long2);
        }
        return l.m_negative ? -comp : comp;
    }
    case ValueType::tUUID: {
        const int comp = compareNumbers(static_cast<uint64_t>(l.m_long), static_cast<uint64_t>(r.m_long));
        return comp != 0 ? comp
            : compareNumbers(static_cast<uint64_t>(l.m_long2), static_cast<uint64_t>(r.m_long2));
    }
    case ValueType::tARRAY: {
        const size_t common = std::min(l.m_elements.size(), r.m_elements.size());
        for (size_t ii = 0; ii < common; ii++) {
            const int comp = l.m_elements[ii].compareTo(r.m_elements[ii]);
            if (comp != 0) {
                return comp;
            }
        }
        return compareNumbers(l.m_elements.size(), r.m_elements.size());
    }
    case ValueType::tROW: {
        checkColumnCount(l.m_elements.size(), r.m_elements.size());
        for (size_t ii = 0; ii < l.m_elements.size(); ii++) {
            const int comp = l.m_elements[ii].compareTo(r.m_elements[ii]);
            if (comp != 0) {
                return comp;
            }
        }
        return 0;
    }
    case ValueType::tRESULT_SET:
        return compareBytes(getString(), rhs.getString());
    case ValueType::tUNKNOWN:
        break;
    }
    throwFatalException("Value has corrupt type code %d", static_cast<int>(l.m_type));
}

int Value::compareTo(Value const& rhs, const CastDataProvider* provider) const {
    if (isSameInstance(rhs)) {
        return 0;
    }
    if (isNull()) {
        return rhs.isNull() ? 0 : -1;
    }
    if (rhs.isNull()) {
        return 1;
    }
    return compareWithCoercion(rhs, provider);
}

/*
 * ARRAY and ROW operands compare element by element. For equality a NULL
 * element leaves the outcome unknown only if no other element differs.
 */
static int compareCollectionsWithNull(Value const& left, Value const& right, bool forEquality,
                                      const CastDataProvider* provider) {
    const std::vector<Value>& leftElements = left.getElements();
    const std::vector<Value>& rightElements = right.getElements();
    if (leftElements.size() != rightElements.size()) {
        if (left.getValueType() == ValueType::tROW) {
            checkColumnCount(leftElements.size(), rightElements.size());
        }
        if (forEquality) {
            return 1;
        }
    }
    if (forEquality) {
        bool hasNull = false;
        for (size_t ii = 0; ii < leftElements.size(); ii++) {
            const int comp = leftElements[ii].compareWithNull(rightElements[ii], true, provider);
            if (comp != 0) {
                if (comp != Value::VALUE_COMPARE_NO_ORDER) {
                    return comp;
                }
                hasNull = true;
            }
        }
        return hasNull ? Value::VALUE_COMPARE_NO_ORDER : 0;
    }
    const size_t common = std::min(leftElements.size(), rightElements.size());
    for (size_t ii = 0; ii < common; ii++) {
        const int comp = leftElements[ii].compareWithNull(rightElements[ii], false, provider);
        if (comp != 0) {
            return comp;
        }
    }
    return compareNumbers(leftElements.size(), rightElements.size());
}

int Value::compareWithNull(Value const& rhs, bool forEquality, const CastDataProvider* provider) const {
    if (isNull() || rhs.isNull()) {
        return VALUE_COMPARE_NO_ORDER;
    }
    const ValueType type = getValueType();
    if (type == rhs.getValueType() && (type == ValueType::tARRAY || type == ValueType::tROW)) {
        return compareCollectionsWithNull(*this, rhs, forEquality, provider);
    }
    return compareWithCoercion(rhs, provider);
}

int Value::compareWithCoercion(Value const& rhs, const CastDataProvider* provider) const {
    if (isNull() || rhs.isNull()) {
        return isNull() == rhs.isNull() ? 0 : (isNull() ? -1 : 1);
    }
    const ValueType leftType = getValueType();
    const ValueType rightType = rhs.getValueType();
    if (leftType == rightType && leftType != ValueType::tENUM) {
        return compareTypeSafe(rhs);
    }
    const ValueType higherType = getHigherOrder(leftType, rightType);
    if (higherType == ValueType::tENUM) {
        // both sides are mapped into the union of the enum domains
        const std::shared_ptr<const ExtTypeInfoEnum> enumerators =
                ExtTypeInfoEnum::getEnumeratorsForBinaryOperation(*this, rhs);
        const Value left = convertTo(ValueType::tENUM, enumerators.get(), provider, std::string());
        const Value right = rhs.convertTo(ValueType::tENUM, enumerators.get(), provider, std::string());
        return left.compareTypeSafe(right);
    }
    const Value left = convertTo(higherType, provider);
    const Value right = rhs.convertTo(higherType, provider);
    return left.compareTypeSafe(right);
}

bool Value::equals(Value const& rhs) const {
    if (isSameInstance(rhs)) {
        return true;
    }
    const ValueBody& l = body();
    const ValueBody& r = rhs.body();
    if (l.m_type != r.m_type) {
        return false;
    }
    switch (l.m_type) {
    case ValueType::tNULL:
        return true;
    case ValueType::tNUMERIC:
        return l.m_decimal.equals(r.m_decimal);
    case ValueType::tDOUBLE:
        return compareDoubles(l.m_double, r.m_double) == 0;
    case ValueType::tREAL:
        return compareDoubles(l.m_float, r.m_float) == 0;
    case ValueType::tVARCHAR_IGNORECASE:
        return boost::algorithm::iequals(l.m_bytes, r.m_bytes);
    case ValueType::tARRAY:
    case ValueType::tROW:
        if (l.m_elements.size() != r.m_elements.size()) {
            return false;
        }
        for (size_t ii = 0; ii < l.m_elements.size(); ii++) {
            if (! l.m_elements[ii].equals(r.m_elements[ii])) {
                return false;
            }
        }
        return true;
    case ValueType::tRESULT_SET:
        return l.m_result == r.m_result;
    default:
        // every remaining kind is fully described by these members
        return l.m_long == r.m_long && l.m_long2 == r.m_long2 && l.m_offsetSeconds == r.m_offsetSeconds
            && l.m_negative == r.m_negative && l.m_bytes == r.m_bytes;
    }
}

std::size_t Value::hashCode() const {
    const ValueBody& b = body();
    std::size_t seed = 0;
    boost::hash_combine(seed, static_cast<int>(b.m_type));
    switch (b.m_type) {
    case ValueType::tNULL:
        break;
    case ValueType::tNUMERIC:
        boost::hash_combine(seed, b.m_decimal.hash());
        break;
    case ValueType::tDOUBLE:
    case ValueType::tREAL: {
        const double number = b.m_type == ValueType::tDOUBLE ? b.m_double : b.m_float;
        if (std::isnan(number)) {
            // every NaN is equal to every other
            boost::hash_combine(seed, 0x7ff8);
        } else {
            uint64_t bits;
            ::memcpy(&bits, &number, sizeof bits);
            boost::hash_combine(seed, bits);
        }
        break;
    }
    case ValueType::tVARCHAR_IGNORECASE:
        boost::hash_combine(seed, upperCase(b.m_bytes));
        break;
    case ValueType::tARRAY:
    case ValueType::tROW:
        for (size_t ii = 0; ii < b.m_elements.size(); ii++) {
            boost::hash_combine(seed, b.m_elements[ii].hashCode());
        }
        break;
    case ValueType::tRESULT_SET:
        boost::hash_combine(seed, b.m_result.get());
        break;
    default:
        boost::hash_combine(seed, b.m_long);
        boost::hash_combine(seed, b.m_long2);
        boost::hash_combine(seed, b.m_offsetSeconds);
        boost::hash_combine(seed, b.m_negative);
        boost::hash_combine(seed, b.m_bytes);
        break;
    }
    return seed;
}

}
