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
#include <string>
#include <vector>

namespace valuecore {

// ------------------------------------------------------------------
// Value types.
// The numeric codes are stable and double as array indexes
// (see getOrder). Code 23 is unassigned.
// ------------------------------------------------------------------
enum class ValueType : int8_t {
    tUNKNOWN                   = -1,
    tNULL                      = 0,
    tBOOLEAN                   = 1,
    tTINYINT                   = 2,
    tSMALLINT                  = 3,
    tINTEGER                   = 4,
    tBIGINT                    = 5,
    tNUMERIC                   = 6,
    tDOUBLE                    = 7,
    tREAL                      = 8,
    tTIME                      = 9,
    tDATE                      = 10,
    tTIMESTAMP                 = 11,
    tVARBINARY                 = 12,
    tVARCHAR                   = 13,
    tVARCHAR_IGNORECASE        = 14,
    tBLOB                      = 15,
    tCLOB                      = 16,
    tARRAY                     = 17,
    tRESULT_SET                = 18,
    tJAVA_OBJECT               = 19,
    tUUID                      = 20,
    tCHAR                      = 21,
    tGEOMETRY                  = 22,
    tTIMESTAMP_TZ              = 24,
    tENUM                      = 25,
    tINTERVAL_YEAR             = 26,
    tINTERVAL_MONTH            = 27,
    tINTERVAL_DAY              = 28,
    tINTERVAL_HOUR             = 29,
    tINTERVAL_MINUTE           = 30,
    tINTERVAL_SECOND           = 31,
    tINTERVAL_YEAR_TO_MONTH    = 32,
    tINTERVAL_DAY_TO_HOUR      = 33,
    tINTERVAL_DAY_TO_MINUTE    = 34,
    tINTERVAL_DAY_TO_SECOND    = 35,
    tINTERVAL_HOUR_TO_MINUTE   = 36,
    tINTERVAL_HOUR_TO_SECOND   = 37,
    tINTERVAL_MINUTE_TO_SECOND = 38,
    tROW                       = 39,
    tJSON                      = 40,
    tTIME_TZ                   = 41
};

// One past the largest type code.
const int VALUE_TYPE_COUNT = 42;

/** Every assigned type except UNKNOWN, in code order. */
const std::vector<ValueType>& allValueTypes();

/** SQL name of the type, e.g. "INTERVAL DAY TO SECOND". */
std::string getTypeName(ValueType type);
/** Inverse of getTypeName; tUNKNOWN for an unrecognised name. */
ValueType stringToValueType(std::string const& name);

/** Interval qualifier text without the INTERVAL keyword, e.g. "DAY TO SECOND". */
std::string getIntervalQualifierName(ValueType type);

// ------------------------------------------------------------------
// Promotion order
// ------------------------------------------------------------------

/**
 * Rank of the type in the promotion order. When two operands of
 * different types meet, both are converted to the one with the
 * larger rank.
 */
int getOrder(ValueType type);

/**
 * The type both operands are converted to before a binary operation.
 * Commutative; getHigherOrder(t, t) == t. Throws UnknownTypeException
 * when both are UNKNOWN, or when one is UNKNOWN and the other NULL.
 */
ValueType getHigherOrder(ValueType t1, ValueType t2);

// ------------------------------------------------------------------
// Type predicates
// ------------------------------------------------------------------
bool isNumeric(ValueType type);
bool isIntegralType(ValueType type);
bool isIntervalType(ValueType type);
bool isYearMonthIntervalType(ValueType type);
bool isCharacterType(ValueType type);
bool isDateTimeType(ValueType type);
bool isLargeObjectType(ValueType type);

inline bool isFloatingPointType(ValueType type) {
    return type == ValueType::tDOUBLE || type == ValueType::tREAL;
}

// ------------------------------------------------------------------
// Hex helpers
// ------------------------------------------------------------------

/** 0..15 for a hex digit of either case, -1 otherwise. */
int32_t hexCharToInt(char c);
/** Decodes pairs of hex digits; false on odd length or a bad digit. */
bool hexDecodeToBinary(std::string const& hexString, std::string* bytesOut);
/** Lowercase hex of every byte. */
std::string hexEncode(std::string const& bytes);

// ------------------------------------------------------------------
// UTF-8 helpers
// ------------------------------------------------------------------

/** Number of code points in UTF-8 text. */
inline int64_t getCharLength(std::string const& text) {
    // count every byte that is not a continuation byte
    int64_t count = 0;
    for (size_t i = 0; i < text.size(); i++) {
        if ((text[i] & 0xc0) != 0x80) count++;
    }
    return count;
}

/** The first 'chars' code points of UTF-8 text. */
inline std::string getCharPrefix(std::string const& text, int64_t chars) {
    int64_t seen = 0;
    size_t i = 0;
    for (; i < text.size(); i++) {
        if ((text[i] & 0xc0) != 0x80 && seen++ == chars) {
            break;
        }
    }
    return text.substr(0, i);
}

}
