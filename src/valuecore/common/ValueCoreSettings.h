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
#include <memory>
#include <string>
#include <vector>

#include "json/json.h"

#include "common/ValueCoreException.h"
#include "logging/LogDefs.h"

#define throwConfigurationException(...) do {                   \
   char msg[8192];                                              \
   snprintf(msg, sizeof msg, __VA_ARGS__);                      \
   msg[sizeof msg - 1] = '\0';                                  \
   throw valuecore::ValueCoreException(                         \
       valuecore::ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_CONFIGURATION, msg); \
} while (false)

namespace valuecore {

class CastDataProvider;
class ValueCache;

/**
 * Represents a JSON value of a settings document. Throws configuration
 * exceptions when a value is missing or of the wrong kind.
 */
class SettingsDomValue {
    Json::Value const m_value;
public:
    SettingsDomValue(Json::Value const& value) : m_value(value) {}

    int32_t asInt() const;
    int64_t asInt64() const;
    bool asBool() const;
    std::string asStr() const;

    bool isObject() const {
        return m_value.isObject();
    }

    bool hasKey(const char* key) const {
        return m_value.isObject() && m_value.isMember(key);
    }

    bool hasNonNullKey(const char* key) const {
        return hasKey(key) && ! m_value[key].isNull();
    }

    SettingsDomValue valueForKey(const char* key) const;

    /** Keys of an object, in document order. */
    std::vector<std::string> keys() const;
};

/**
 * Parses a settings document and owns it; values handed out by operator()
 * copy what they refer to.
 */
class SettingsDomRoot {
public:
    SettingsDomRoot(const SettingsDomRoot& other) = delete;
    SettingsDomRoot& operator=(const SettingsDomRoot& other) = delete;
    SettingsDomRoot(const char* json) : m_document(fromJSONString(json)) {}

    bool isNull() const {
        return m_document.isNull();
    }

    SettingsDomValue operator()() const {
        return SettingsDomValue(m_document);
    }

private:
    Json::Value const m_document;
    static Json::Value fromJSONString(char const* json);
};

/**
 * Process settings for the value core:
 *
 *   {
 *     "objectCache": true,
 *     "objectCacheSize": 1024,
 *     "defaultTimeZoneOffsetSeconds": 0,
 *     "logLevels": { "VALUE": "WARN", "CACHE": "INFO", "HOST": "INFO" }
 *   }
 *
 * Every key is optional.
 */
class ValueCoreSettings {
public:
    static ValueCoreSettings defaults();
    static ValueCoreSettings fromJSONString(const char* json);
    static ValueCoreSettings fromFile(std::string const& path);

    bool isObjectCacheEnabled() const {
        return m_objectCache;
    }

    int getObjectCacheSize() const {
        return m_objectCacheSize;
    }

    int32_t getDefaultTimeZoneOffsetSeconds() const {
        return m_defaultTimeZoneOffsetSeconds;
    }

    LogLevel getLogLevel(LoggerId id) const;

    /** Argument for LogManager::setLogLevels(). */
    int64_t packedLogLevels() const;

    /** A cache of the configured size, enabled or not as configured. */
    std::unique_ptr<ValueCache> createValueCache() const;

    /** System clock provider in the configured default offset zone. */
    std::unique_ptr<CastDataProvider> createDefaultCastDataProvider() const;

private:
    ValueCoreSettings();

    void load(SettingsDomValue const& root);

    bool m_objectCache;
    int m_objectCacheSize;
    int32_t m_defaultTimeZoneOffsetSeconds;
    LogLevel m_valueLogLevel;
    LogLevel m_cacheLogLevel;
    LogLevel m_hostLogLevel;
};

}
