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

#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#include "common/CastDataProvider.h"
#include "common/DateTimeUtils.h"
#include "common/ValueCache.h"
#include "common/ValueCoreSettings.h"
#include "logging/LogManager.h"

namespace valuecore {

// ------------------------------------------------------------------
// SettingsDomValue
// ------------------------------------------------------------------

int32_t SettingsDomValue::asInt() const {
    if (m_value.isNull()) {
        throwConfigurationException("SettingsDomValue: int value is null");
    } else if (m_value.isInt()) {
        return m_value.asInt();
    } else if (m_value.isString()) {
        return static_cast<int32_t>(strtoimax(m_value.asCString(), NULL, 10));
    }
    throwConfigurationException("SettingsDomValue: int value is not an integer");
}

int64_t SettingsDomValue::asInt64() const {
    if (m_value.isNull()) {
        throwConfigurationException("SettingsDomValue: int64 value is null");
    } else if (m_value.isInt64()) {
        return m_value.asInt64();
    } else if (m_value.isInt()) {
        return m_value.asInt();
    } else if (m_value.isString()) {
        return static_cast<int64_t>(strtoimax(m_value.asCString(), NULL, 10));
    }
    throwConfigurationException("SettingsDomValue: int64 value is non-integral");
}

bool SettingsDomValue::asBool() const {
    if (m_value.isNull() || ! m_value.isBool()) {
        throwConfigurationException("SettingsDomValue: value is null or not a bool");
    }
    return m_value.asBool();
}

std::string SettingsDomValue::asStr() const {
    if (m_value.isNull() || ! m_value.isString()) {
        throwConfigurationException("SettingsDomValue: value is null or not a string");
    }
    return m_value.asString();
}

SettingsDomValue SettingsDomValue::valueForKey(const char* key) const {
    if (! m_value.isObject()) {
        throwConfigurationException("SettingsDomValue: value holding %s is not an object", key);
    }
    Json::Value const value = m_value[key];
    if (value.isNull()) {
        throwConfigurationException("SettingsDomValue: %s key is null or missing", key);
    }
    return SettingsDomValue(value);
}

std::vector<std::string> SettingsDomValue::keys() const {
    if (! m_value.isObject()) {
        throwConfigurationException("SettingsDomValue: value is not an object");
    }
    return m_value.getMemberNames();
}

Json::Value SettingsDomRoot::fromJSONString(char const* json) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value document;
    std::string errors;
    const size_t length = strlen(json);
    if (! reader->parse(json, json + length, &document, &errors)) {
        throwConfigurationException("Cannot parse settings: %s", errors.c_str());
    }
    return document;
}

// ------------------------------------------------------------------
// ValueCoreSettings
// ------------------------------------------------------------------

ValueCoreSettings::ValueCoreSettings()
    : m_objectCache(true),
      m_objectCacheSize(ValueCache::DEFAULT_SIZE),
      m_defaultTimeZoneOffsetSeconds(0),
      m_valueLogLevel(LOGLEVEL_WARN),
      m_cacheLogLevel(LOGLEVEL_INFO),
      m_hostLogLevel(LOGLEVEL_INFO) {
}

ValueCoreSettings ValueCoreSettings::defaults() {
    return ValueCoreSettings();
}

ValueCoreSettings ValueCoreSettings::fromJSONString(const char* json) {
    SettingsDomRoot root(json);
    ValueCoreSettings settings;
    if (! root.isNull()) {
        settings.load(root());
    }
    LogManager::getThreadLogger(LOGGERID_HOST)->logf(LOGLEVEL_INFO,
            "Loaded value core settings: object cache %s, size %d, default time zone offset %d",
            settings.m_objectCache ? "on" : "off", settings.m_objectCacheSize,
            settings.m_defaultTimeZoneOffsetSeconds);
    return settings;
}

ValueCoreSettings ValueCoreSettings::fromFile(std::string const& path) {
    std::ifstream in(path.c_str());
    if (! in) {
        throwConfigurationException("Cannot open settings file %s", path.c_str());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throwConfigurationException("Cannot read settings file %s", path.c_str());
    }
    LogManager::getThreadLogger(LOGGERID_HOST)->logf(LOGLEVEL_INFO, "Reading settings from %s", path.c_str());
    return fromJSONString(buffer.str().c_str());
}

void ValueCoreSettings::load(SettingsDomValue const& root) {
    if (! root.isObject()) {
        throwConfigurationException("Settings must be a JSON object");
    }
    if (root.hasNonNullKey("objectCache")) {
        m_objectCache = root.valueForKey("objectCache").asBool();
    }
    if (root.hasNonNullKey("objectCacheSize")) {
        const int64_t size = root.valueForKey("objectCacheSize").asInt64();
        if (size <= 0 || size > (1 << 30) || (size & (size - 1)) != 0) {
            throwConfigurationException("objectCacheSize must be a positive power of two, not %" PRId64, size);
        }
        m_objectCacheSize = static_cast<int>(size);
    }
    if (root.hasNonNullKey("defaultTimeZoneOffsetSeconds")) {
        const int64_t offset = root.valueForKey("defaultTimeZoneOffsetSeconds").asInt64();
        if (offset < -MAX_TIME_ZONE_OFFSET_SECONDS || offset > MAX_TIME_ZONE_OFFSET_SECONDS) {
            throwConfigurationException("defaultTimeZoneOffsetSeconds %" PRId64 " is beyond +/- 18 hours", offset);
        }
        m_defaultTimeZoneOffsetSeconds = static_cast<int32_t>(offset);
    }
    if (root.hasNonNullKey("logLevels")) {
        SettingsDomValue levels = root.valueForKey("logLevels");
        std::vector<std::string> names = levels.keys();
        for (size_t ii = 0; ii < names.size(); ii++) {
            const LoggerId id = LogManager::loggerIdFromName(names[ii]);
            const std::string levelText = levels.valueForKey(names[ii].c_str()).asStr();
            LogLevel level;
            if (! LogManager::levelFromName(levelText, &level)) {
                throwConfigurationException("Unknown log level %s for logger %s",
                                            levelText.c_str(), names[ii].c_str());
            }
            switch (id) {
            case LOGGERID_VALUE:
                m_valueLogLevel = level;
                break;
            case LOGGERID_CACHE:
                m_cacheLogLevel = level;
                break;
            case LOGGERID_HOST:
                m_hostLogLevel = level;
                break;
            default:
                throwConfigurationException("Unknown logger %s", names[ii].c_str());
            }
        }
    }
}

LogLevel ValueCoreSettings::getLogLevel(LoggerId id) const {
    switch (id) {
    case LOGGERID_VALUE:
        return m_valueLogLevel;
    case LOGGERID_CACHE:
        return m_cacheLogLevel;
    case LOGGERID_HOST:
        return m_hostLogLevel;
    default:
        throwConfigurationException("Unknown logger id %d", static_cast<int>(id));
    }
}

int64_t ValueCoreSettings::packedLogLevels() const {
    return LogManager::packLogLevels(m_valueLogLevel, m_cacheLogLevel, m_hostLogLevel);
}

std::unique_ptr<ValueCache> ValueCoreSettings::createValueCache() const {
    std::unique_ptr<ValueCache> cache(new ValueCache(m_objectCacheSize));
    cache->setEnabled(m_objectCache);
    return cache;
}

std::unique_ptr<CastDataProvider> ValueCoreSettings::createDefaultCastDataProvider() const {
    return std::unique_ptr<CastDataProvider>(new SystemCastDataProvider(m_defaultTimeZoneOffsetSeconds));
}

}
