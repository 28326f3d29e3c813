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

#include <fstream>
#include <memory>
#include <string>

#include "harness.h"

#include "common/CastDataProvider.h"
#include "common/Value.hpp"
#include "common/ValueCache.h"
#include "common/ValueCoreException.h"
#include "common/ValueCoreSettings.h"
#include "logging/LogManager.h"

using namespace valuecore;

#define ASSERT_CONFIGURATION_ERROR(json)                                          \
    do {                                                                          \
        try {                                                                     \
            ValueCoreSettings::fromJSONString(json);                              \
            FAIL("expected a configuration error");                               \
        } catch (ValueCoreException& e) {                                         \
            EXPECT_TRUE(e.getType() == ValueCoreExceptionType::VALUECORE_EXCEPTION_TYPE_CONFIGURATION); \
        }                                                                         \
    } while (false)

class ValueCoreSettingsTest : public Test {};

TEST_F(ValueCoreSettingsTest, Defaults) {
    ValueCoreSettings settings = ValueCoreSettings::defaults();
    EXPECT_TRUE(settings.isObjectCacheEnabled());
    EXPECT_EQ(ValueCache::DEFAULT_SIZE, settings.getObjectCacheSize());
    EXPECT_EQ(0, settings.getDefaultTimeZoneOffsetSeconds());
    EXPECT_EQ(LOGLEVEL_WARN, settings.getLogLevel(LOGGERID_VALUE));
    EXPECT_EQ(LOGLEVEL_INFO, settings.getLogLevel(LOGGERID_CACHE));
    EXPECT_EQ(LOGLEVEL_INFO, settings.getLogLevel(LOGGERID_HOST));
    EXPECT_EQ(LogManager::packLogLevels(LOGLEVEL_WARN, LOGLEVEL_INFO, LOGLEVEL_INFO),
              settings.packedLogLevels());

    ValueCoreSettings empty = ValueCoreSettings::fromJSONString("{}");
    EXPECT_EQ(ValueCache::DEFAULT_SIZE, empty.getObjectCacheSize());
    ValueCoreSettings nulls = ValueCoreSettings::fromJSONString("{\"objectCacheSize\": null}");
    EXPECT_EQ(ValueCache::DEFAULT_SIZE, nulls.getObjectCacheSize());
}

TEST_F(ValueCoreSettingsTest, FromJSONString) {
    ValueCoreSettings settings = ValueCoreSettings::fromJSONString(
            "{ \"objectCache\": false,"
            "  \"objectCacheSize\": \"256\","
            "  \"defaultTimeZoneOffsetSeconds\": -19800,"
            "  \"logLevels\": { \"value\": \"debug\", \"HOST\": \"OFF\" } }");
    EXPECT_FALSE(settings.isObjectCacheEnabled());
    EXPECT_EQ(256, settings.getObjectCacheSize());
    EXPECT_EQ(-19800, settings.getDefaultTimeZoneOffsetSeconds());
    EXPECT_EQ(LOGLEVEL_DEBUG, settings.getLogLevel(LOGGERID_VALUE));
    EXPECT_EQ(LOGLEVEL_INFO, settings.getLogLevel(LOGGERID_CACHE));
    EXPECT_EQ(LOGLEVEL_OFF, settings.getLogLevel(LOGGERID_HOST));

    LogManager manager(NULL);
    manager.setLogLevels(settings.packedLogLevels());
    EXPECT_EQ(LOGLEVEL_DEBUG, LogManager::getLogLevel(LOGGERID_VALUE));
    EXPECT_EQ(LOGLEVEL_INFO, LogManager::getLogLevel(LOGGERID_CACHE));
    EXPECT_EQ(LOGLEVEL_OFF, LogManager::getLogLevel(LOGGERID_HOST));
}

TEST_F(ValueCoreSettingsTest, ConfigurationErrors) {
    ASSERT_CONFIGURATION_ERROR("{ \"objectCache\": ");
    ASSERT_CONFIGURATION_ERROR("[1, 2]");
    ASSERT_CONFIGURATION_ERROR("{ \"objectCache\": 1 }");
    ASSERT_CONFIGURATION_ERROR("{ \"objectCacheSize\": 1000 }");
    ASSERT_CONFIGURATION_ERROR("{ \"objectCacheSize\": 0 }");
    ASSERT_CONFIGURATION_ERROR("{ \"objectCacheSize\": 2.5 }");
    ASSERT_CONFIGURATION_ERROR("{ \"defaultTimeZoneOffsetSeconds\": 64801 }");
    ASSERT_CONFIGURATION_ERROR("{ \"logLevels\": { \"NETWORK\": \"INFO\" } }");
    ASSERT_CONFIGURATION_ERROR("{ \"logLevels\": { \"VALUE\": \"LOUD\" } }");
    ASSERT_CONFIGURATION_ERROR("{ \"logLevels\": { \"VALUE\": 3 } }");
    ASSERT_CONFIGURATION_ERROR("{ \"logLevels\": \"INFO\" }");
}

TEST_F(ValueCoreSettingsTest, FromFile) {
    stupidunit::ChTempDir tempDir;
    {
        std::ofstream out("settings.json");
        out << "{ \"objectCacheSize\": 64, \"defaultTimeZoneOffsetSeconds\": 3600 }" << std::endl;
    }
    ValueCoreSettings settings = ValueCoreSettings::fromFile("settings.json");
    EXPECT_EQ(64, settings.getObjectCacheSize());
    EXPECT_EQ(3600, settings.getDefaultTimeZoneOffsetSeconds());

    try {
        ValueCoreSettings::fromFile("missing.json");
        FAIL("expected a configuration error");
    } catch (ValueCoreException& e) {
        EXPECT_NE(std::string::npos, e.message().find("missing.json"));
    }
}

TEST_F(ValueCoreSettingsTest, CreatesCacheAndProvider) {
    ValueCoreSettings settings = ValueCoreSettings::fromJSONString(
            "{ \"objectCache\": false, \"objectCacheSize\": 32, \"defaultTimeZoneOffsetSeconds\": 7200 }");
    std::unique_ptr<ValueCache> cache = settings.createValueCache();
    EXPECT_EQ(32, cache->getSize());
    EXPECT_FALSE(cache->isEnabled());
    EXPECT_TRUE(ValueCoreSettings::defaults().createValueCache()->isEnabled());

    std::unique_ptr<CastDataProvider> provider = settings.createDefaultCastDataProvider();
    EXPECT_EQ("+02:00", provider->currentTimeZone().getId());
    Value now = provider->currentTimestamp();
    EXPECT_TRUE(now.getValueType() == ValueType::tTIMESTAMP_TZ);
    EXPECT_EQ(7200, now.getTimeZoneOffsetSeconds());
    EXPECT_TRUE(provider->getGeometryCodec() == NULL);
}

int main() {
    return TestSuite::globalInstance()->runAll();
}
