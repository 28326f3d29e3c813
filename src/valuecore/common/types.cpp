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

#include <cctype>
#include <map>
#include <string>

#include "common/types.h"
#include "common/debuglog.h"
#include "common/FatalException.hpp"
#include "common/ValueExceptions.h"

namespace valuecore {
using namespace std;

template<typename K, typename V>
inline V lookup(map<K, V> const& dictionary, K const& key, V const& defaultValue) {
   auto const iter = dictionary.find(key);
   return iter == dictionary.cend() ? defaultValue : iter->second;
}

template<typename K, typename V>
map<V, K> revert(map<K, V>const& original) {
   map<V, K> reverted;
   for(auto const& kv : original) {
      reverted.emplace(make_pair(kv.second, kv.first));
   }
   return reverted;
}

map<ValueType, string> const mapOfTypeName {
   {ValueType::tUNKNOWN, "UNKNOWN"},
   {ValueType::tNULL, "NULL"},
   {ValueType::tBOOLEAN, "BOOLEAN"},
   {ValueType::tTINYINT, "TINYINT"},
   {ValueType::tSMALLINT, "SMALLINT"},
   {ValueType::tINTEGER, "INTEGER"},
   {ValueType::tBIGINT, "BIGINT"},
   {ValueType::tNUMERIC, "NUMERIC"},
   {ValueType::tDOUBLE, "DOUBLE PRECISION"},
   {ValueType::tREAL, "REAL"},
   {ValueType::tTIME, "TIME"},
   {ValueType::tDATE, "DATE"},
   {ValueType::tTIMESTAMP, "TIMESTAMP"},
   {ValueType::tVARBINARY, "BINARY VARYING"},
   {ValueType::tVARCHAR, "CHARACTER VARYING"},
   {ValueType::tVARCHAR_IGNORECASE, "VARCHAR_IGNORECASE"},
   {ValueType::tBLOB, "BINARY LARGE OBJECT"},
   {ValueType::tCLOB, "CHARACTER LARGE OBJECT"},
   {ValueType::tARRAY, "ARRAY"},
   {ValueType::tRESULT_SET, "RESULT SET"},
   {ValueType::tJAVA_OBJECT, "JAVA_OBJECT"},
   {ValueType::tUUID, "UUID"},
   {ValueType::tCHAR, "CHARACTER"},
   {ValueType::tGEOMETRY, "GEOMETRY"},
   {ValueType::tTIMESTAMP_TZ, "TIMESTAMP WITH TIME ZONE"},
   {ValueType::tENUM, "ENUM"},
   {ValueType::tINTERVAL_YEAR, "INTERVAL YEAR"},
   {ValueType::tINTERVAL_MONTH, "INTERVAL MONTH"},
   {ValueType::tINTERVAL_DAY, "INTERVAL DAY"},
   {ValueType::tINTERVAL_HOUR, "INTERVAL HOUR"},
   {ValueType::tINTERVAL_MINUTE, "INTERVAL MINUTE"},
   {ValueType::tINTERVAL_SECOND, "INTERVAL SECOND"},
   {ValueType::tINTERVAL_YEAR_TO_MONTH, "INTERVAL YEAR TO MONTH"},
   {ValueType::tINTERVAL_DAY_TO_HOUR, "INTERVAL DAY TO HOUR"},
   {ValueType::tINTERVAL_DAY_TO_MINUTE, "INTERVAL DAY TO MINUTE"},
   {ValueType::tINTERVAL_DAY_TO_SECOND, "INTERVAL DAY TO SECOND"},
   {ValueType::tINTERVAL_HOUR_TO_MINUTE, "INTERVAL HOUR TO MINUTE"},
   {ValueType::tINTERVAL_HOUR_TO_SECOND, "INTERVAL HOUR TO SECOND"},
   {ValueType::tINTERVAL_MINUTE_TO_SECOND, "INTERVAL MINUTE TO SECOND"},
   {ValueType::tROW, "ROW"},
   {ValueType::tJSON, "JSON"},
   {ValueType::tTIME_TZ, "TIME WITH TIME ZONE"}
};

map<string, ValueType> const mapToValueType = revert(mapOfTypeName);

const vector<ValueType>& allValueTypes() {
    static const vector<ValueType> types = [] {
        vector<ValueType> result;
        for (auto const& kv : mapOfTypeName) {
            if (kv.first != ValueType::tUNKNOWN) {
                result.push_back(kv.first);
            }
        }
        return result;
    }();
    return types;
}

string getTypeName(ValueType type) {
  return lookup(mapOfTypeName, type,
         string("UNKNOWN[").append(std::to_string(static_cast<int>(type))).append("]"));
}

ValueType stringToValueType(string const& name) {
   return lookup(mapToValueType, name, ValueType::tUNKNOWN);
}

string getIntervalQualifierName(ValueType type) {
    vcassert(isIntervalType(type));
    // strip the "INTERVAL " prefix
    return getTypeName(type).substr(9);
}

int getOrder(ValueType type) {
    switch (type) {
    case ValueType::tUNKNOWN:
        return 1000;
    case ValueType::tNULL:
        return 2000;
    // character strings
    case ValueType::tVARCHAR:
        return 10000;
    case ValueType::tCLOB:
        return 11000;
    case ValueType::tCHAR:
        return 12000;
    case ValueType::tVARCHAR_IGNORECASE:
        return 13000;
    // boolean and numerics
    case ValueType::tBOOLEAN:
        return 20000;
    case ValueType::tTINYINT:
        return 21000;
    case ValueType::tSMALLINT:
        return 22000;
    case ValueType::tINTEGER:
        return 23000;
    case ValueType::tBIGINT:
        return 24000;
    case ValueType::tNUMERIC:
        return 25000;
    case ValueType::tREAL:
        return 26000;
    case ValueType::tDOUBLE:
        return 27000;
    // year-month intervals
    case ValueType::tINTERVAL_YEAR:
        return 28000;
    case ValueType::tINTERVAL_MONTH:
        return 28100;
    case ValueType::tINTERVAL_YEAR_TO_MONTH:
        return 28200;
    // day-time intervals
    case ValueType::tINTERVAL_DAY:
        return 29000;
    case ValueType::tINTERVAL_HOUR:
        return 29100;
    case ValueType::tINTERVAL_DAY_TO_HOUR:
        return 29200;
    case ValueType::tINTERVAL_MINUTE:
        return 29300;
    case ValueType::tINTERVAL_HOUR_TO_MINUTE:
        return 29400;
    case ValueType::tINTERVAL_DAY_TO_MINUTE:
        return 29500;
    case ValueType::tINTERVAL_SECOND:
        return 29600;
    case ValueType::tINTERVAL_MINUTE_TO_SECOND:
        return 29700;
    case ValueType::tINTERVAL_HOUR_TO_SECOND:
        return 29800;
    case ValueType::tINTERVAL_DAY_TO_SECOND:
        return 29900;
    // datetime
    case ValueType::tTIME:
        return 30000;
    case ValueType::tTIME_TZ:
        return 30500;
    case ValueType::tDATE:
        return 31000;
    case ValueType::tTIMESTAMP:
        return 32000;
    case ValueType::tTIMESTAMP_TZ:
        return 34000;
    // binary strings and others
    case ValueType::tVARBINARY:
        return 40000;
    case ValueType::tBLOB:
        return 41000;
    case ValueType::tJAVA_OBJECT:
        return 42000;
    case ValueType::tUUID:
        return 43000;
    case ValueType::tGEOMETRY:
        return 44000;
    case ValueType::tENUM:
        return 45000;
    case ValueType::tJSON:
        return 46000;
    // collections
    case ValueType::tARRAY:
        return 50000;
    case ValueType::tROW:
        return 51000;
    case ValueType::tRESULT_SET:
        return 52000;
    }
    throwFatalException("getOrder: invalid type code %d", static_cast<int>(type));
}

ValueType getHigherOrder(ValueType t1, ValueType t2) {
    if (t1 == t2) {
        if (t1 == ValueType::tUNKNOWN) {
            throw UnknownTypeException("?, ?");
        }
        return t1;
    }
    if (t1 == ValueType::tUNKNOWN && t2 == ValueType::tNULL) {
        throw UnknownTypeException("?, NULL");
    }
    if (t2 == ValueType::tUNKNOWN && t1 == ValueType::tNULL) {
        throw UnknownTypeException("NULL, ?");
    }
    return getOrder(t1) > getOrder(t2) ? t1 : t2;
}

bool isNumeric(ValueType type) {
    switch (type) {
        case ValueType::tTINYINT:
        case ValueType::tSMALLINT:
        case ValueType::tINTEGER:
        case ValueType::tBIGINT:
        case ValueType::tNUMERIC:
        case ValueType::tDOUBLE:
        case ValueType::tREAL:
            return true;
        default:
            return false;
    }
}

bool isIntegralType(ValueType type) {
    switch (type) {
        case ValueType::tTINYINT:
        case ValueType::tSMALLINT:
        case ValueType::tINTEGER:
        case ValueType::tBIGINT:
            return true;
        default:
            return false;
    }
}

bool isIntervalType(ValueType type) {
    return type >= ValueType::tINTERVAL_YEAR && type <= ValueType::tINTERVAL_MINUTE_TO_SECOND;
}

bool isYearMonthIntervalType(ValueType type) {
    return type == ValueType::tINTERVAL_YEAR || type == ValueType::tINTERVAL_MONTH
        || type == ValueType::tINTERVAL_YEAR_TO_MONTH;
}

bool isCharacterType(ValueType type) {
    switch (type) {
        case ValueType::tVARCHAR:
        case ValueType::tVARCHAR_IGNORECASE:
        case ValueType::tCHAR:
        case ValueType::tCLOB:
            return true;
        default:
            return false;
    }
}

bool isDateTimeType(ValueType type) {
    switch (type) {
        case ValueType::tDATE:
        case ValueType::tTIME:
        case ValueType::tTIME_TZ:
        case ValueType::tTIMESTAMP:
        case ValueType::tTIMESTAMP_TZ:
            return true;
        default:
            return false;
    }
}

bool isLargeObjectType(ValueType type) {
    return type == ValueType::tBLOB || type == ValueType::tCLOB;
}

int32_t hexCharToInt(char c) {
    c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    if ((c < '0' || c > '9') && (c < 'A' || c > 'F')) {
        return -1;
    }
    int32_t retval;
    if (c >= 'A')
        retval = c - 'A' + 10;
    else
        retval = c - '0';
    vcassert(retval >=0 && retval < 16);
    return retval;
}

bool hexDecodeToBinary(string const& hexString, string* bytesOut) {
    vcassert(bytesOut);
    const size_t len = hexString.size();
    if ((len % 2) != 0)
        return false;

    string result;
    result.reserve(len / 2);
    for (size_t i = 0; i < len / 2; i++) {
        int32_t high = hexCharToInt(hexString[i * 2]);
        int32_t low = hexCharToInt(hexString[i * 2 + 1]);
        if ((high == -1) || (low == -1))
            return false;
        result.push_back(static_cast<char>(high * 16 + low));
    }
    bytesOut->swap(result);
    return true;
}

string hexEncode(string const& bytes) {
    static const char HEX[] = "0123456789abcdef";
    string result;
    result.reserve(bytes.size() * 2);
    for (char c : bytes) {
        const unsigned char b = static_cast<unsigned char>(c);
        result.push_back(HEX[b >> 4]);
        result.push_back(HEX[b & 0x0f]);
    }
    return result;
}

// namespace valuecore
}
