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

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "harness.h"

#include "common/CastDataProvider.h"
#include "common/DateTimeUtils.h"
#include "common/ExtTypeInfo.h"
#include "common/GeometryCodec.h"
#include "common/SQLException.h"
#include "common/TypeInfo.h"
#include "common/Value.hpp"
#include "common/ValueExceptions.h"
#include "common/ValueFactory.hpp"

using namespace valuecore;

/*
 * Stands in for the engine's geometry library. Its "EWKB" is the text
 * "<type code>|<srid>|<wkt>", which is enough to exercise the type and
 * SRID checks without a real geometry parser.
 */
class TestGeometryCodec : public GeometryCodec {
public:
    std::string parseEwkb(std::string const& ewkb) const {
        split(ewkb);
        return ewkb;
    }

    std::string parseWkt(std::string const& text) const {
        std::string wkt = boost::algorithm::trim_copy(text);
        int32_t srid = 0;
        if (boost::algorithm::istarts_with(wkt, "SRID=")) {
            const size_t semicolon = wkt.find(';');
            if (semicolon == std::string::npos) {
                throw GeometryCodecException("missing ';' after SRID");
            }
            srid = std::atoi(wkt.substr(5, semicolon - 5).c_str());
            wkt = wkt.substr(semicolon + 1);
        }
        return std::to_string(typeOf(wkt)) + "|" + std::to_string(srid) + "|" + wkt;
    }

    std::string toWkt(std::string const& ewkb) const {
        const std::vector<std::string> parts = split(ewkb);
        return parts[1] == "0" ? parts[2] : "SRID=" + parts[1] + ";" + parts[2];
    }

    std::string ewkbToGeoJson(std::string const& ewkb) const {
        const std::vector<std::string> parts = split(ewkb);
        return parts[0] == "1" ? "{\"type\": \"Point\"}" : "{\"type\": \"LineString\"}";
    }

    std::string geoJsonToEwkb(std::string const& json, int32_t srid) const {
        if (json.find("Point") == std::string::npos) {
            throw GeometryCodecException("unsupported GeoJSON");
        }
        return "1|" + std::to_string(srid) + "|POINT (0 0)";
    }

    int32_t getSrid(std::string const& ewkb) const {
        return std::atoi(split(ewkb)[1].c_str());
    }

    int getGeometryType(std::string const& ewkb) const {
        return std::atoi(split(ewkb)[0].c_str());
    }

private:
    static int typeOf(std::string const& wkt) {
        if (boost::algorithm::istarts_with(wkt, "POINT")) {
            return ExtTypeInfoGeometry::POINT;
        }
        if (boost::algorithm::istarts_with(wkt, "LINESTRING")) {
            return ExtTypeInfoGeometry::LINE_STRING;
        }
        throw GeometryCodecException("unknown geometry " + wkt);
    }

    static std::vector<std::string> split(std::string const& ewkb) {
        std::vector<std::string> parts;
        boost::algorithm::split(parts, ewkb, boost::algorithm::is_any_of("|"));
        if (parts.size() != 3) {
            throw GeometryCodecException("corrupt geometry");
        }
        return parts;
    }
};

static std::vector<std::string> labels(const char* a, const char* b, const char* c = NULL) {
    std::vector<std::string> result;
    result.push_back(a);
    result.push_back(b);
    if (c != NULL) {
        result.push_back(c);
    }
    return result;
}

class ExtTypeInfoTest : public Test {
public:
    ExtTypeInfoTest()
        : m_codec(std::make_shared<TestGeometryCodec>()),
          m_provider(ValueFactory::getTimestampTzValue(datetime::dateValue(2021, 1, 1), 0, 0), m_codec)
    {
    }

    Value geometry(std::string const& wkt) const {
        return ValueFactory::getStringValue(wkt).convertTo(ValueType::tGEOMETRY, &m_provider);
    }

protected:
    std::shared_ptr<const GeometryCodec> m_codec;
    SimpleCastDataProvider m_provider;
};

TEST_F(ExtTypeInfoTest, EnumDomain) {
    std::shared_ptr<const ExtTypeInfoEnum> domain = ExtTypeInfoEnum::create(labels(" red", "green ", "it's"));
    EXPECT_EQ(3, domain->getCount());
    EXPECT_EQ("red", domain->getEnumerator(0));
    EXPECT_EQ("ENUM('red', 'green', 'it''s')", domain->getCreateSQL());
    EXPECT_TRUE(domain->equals(*ExtTypeInfoEnum::create(labels("red", "green", "it's"))));
    EXPECT_FALSE(domain->equals(*ExtTypeInfoEnum::create(labels("green", "red", "it's"))));

    ASSERT_SQL_EXCEPTION(EnumValueNotPermittedException, SQLException::data_exception_value_not_permitted,
                         ExtTypeInfoEnum::create(std::vector<std::string>()));
    ASSERT_SQL_EXCEPTION(EnumValueNotPermittedException, SQLException::data_exception_value_not_permitted,
                         ExtTypeInfoEnum::create(labels("a", " ")));
    ASSERT_SQL_EXCEPTION(EnumValueNotPermittedException, SQLException::data_exception_value_not_permitted,
                         ExtTypeInfoEnum::create(labels("a", "A")));
    ASSERT_SQL_EXCEPTION(EnumValueNotPermittedException, SQLException::data_exception_value_not_permitted,
                         domain->getEnumerator(3));
}

TEST_F(ExtTypeInfoTest, EnumValues) {
    std::shared_ptr<const ExtTypeInfoEnum> domain = ExtTypeInfoEnum::create(labels("red", "green"));
    TypeInfo enumType(ValueType::tENUM, 5, 0, domain);
    EXPECT_EQ("ENUM('red', 'green')", enumType.toString());

    Value green = ValueFactory::getStringValue("GREEN").convertTo(enumType, NULL);
    EXPECT_TRUE(green.getValueType() == ValueType::tENUM);
    EXPECT_EQ(1, green.getEnumOrdinal());
    EXPECT_EQ("green", green.getString());
    EXPECT_EQ("'green'", green.getTraceSQL());
    EXPECT_TRUE(green.getEnumerators() == domain);
    EXPECT_TRUE(green.getType().getExtTypeInfo() == domain);

    EXPECT_TRUE(ValueFactory::getIntegerValue(0).convertTo(enumType, NULL) == domain->getValue("red"));
    EXPECT_EQ(1, green.asInt());
    EXPECT_EQ("green", green.asString());

    ASSERT_SQL_EXCEPTION(EnumValueNotPermittedException, SQLException::data_exception_value_not_permitted,
                         ValueFactory::getIntegerValue(5).convertTo(enumType, NULL));
    ASSERT_SQL_EXCEPTION(EnumValueNotPermittedException, SQLException::data_exception_value_not_permitted,
                         ValueFactory::getStringValue("blue").convertTo(enumType, NULL));
    ASSERT_THROWS(DataConversionException, ValueFactory::getStringValue("red").convertTo(ValueType::tENUM));
    ASSERT_THROWS(DataConversionException, ValueFactory::getDoubleValue(1.0).convertTo(enumType, NULL));
    ASSERT_THROWS(DataConversionException, green.convertTo(ValueType::tDOUBLE));
    ASSERT_THROWS(DataConversionException, green.convertTo(ValueType::tDATE));
}

TEST_F(ExtTypeInfoTest, EnumCastBetweenDomains) {
    std::shared_ptr<const ExtTypeInfoEnum> small = ExtTypeInfoEnum::create(labels("b", "c"));
    std::shared_ptr<const ExtTypeInfoEnum> large = ExtTypeInfoEnum::create(labels("a", "b", "c"));
    Value c = small->getValue("c");
    Value cast = large->cast(c, NULL);
    EXPECT_EQ(2, cast.getEnumOrdinal());
    EXPECT_TRUE(cast.getEnumerators() == large);
    EXPECT_TRUE(small->cast(c, NULL).isSameInstance(c));
    ASSERT_THROWS(EnumValueNotPermittedException, small->cast(large->getValue("a"), NULL));
}

TEST_F(ExtTypeInfoTest, GeometryFromText) {
    Value point = geometry("POINT (1 2)");
    EXPECT_TRUE(point.getValueType() == ValueType::tGEOMETRY);
    EXPECT_EQ("POINT (1 2)", point.getString());
    EXPECT_EQ("GEOMETRY 'POINT (1 2)'", point.getTraceSQL());
    EXPECT_TRUE(point.getGeometryCodec() == m_codec);
    EXPECT_EQ("1|0|POINT (1 2)", point.asBytes());

    Value fromBytes = ValueFactory::getBinaryValue("2|0|LINESTRING (0 0, 1 1)")
            .convertTo(ValueType::tGEOMETRY, &m_provider);
    EXPECT_EQ("LINESTRING (0 0, 1 1)", fromBytes.getString());
    EXPECT_EQ(-1, point.compareTo(fromBytes));

    ASSERT_SQL_EXCEPTION(DataConversionException, SQLException::data_exception_invalid_character_value_for_cast,
                         geometry("CIRCLE (0 0, 1)"));
    try {
        geometry("CIRCLE (0 0, 1)");
        FAIL("expected DataConversionException");
    } catch (DataConversionException& e) {
        EXPECT_NE(std::string::npos, e.message().find("unknown geometry"));
    }
    ASSERT_THROWS(DataConversionException,
                  ValueFactory::getBinaryValue("junk").convertTo(ValueType::tGEOMETRY, &m_provider));
    // the default provider has no geometry support
    ASSERT_THROWS(DataConversionException, ValueFactory::getStringValue("POINT (1 2)").convertTo(ValueType::tGEOMETRY));
}

TEST_F(ExtTypeInfoTest, GeometryConstraints) {
    std::shared_ptr<const ExtTypeInfoGeometry> points =
            std::make_shared<ExtTypeInfoGeometry>(ExtTypeInfoGeometry::POINT, true, 4326);
    EXPECT_EQ("GEOMETRY(POINT, 4326)", points->getCreateSQL());
    EXPECT_EQ("GEOMETRY(LINESTRING)", ExtTypeInfoGeometry(ExtTypeInfoGeometry::LINE_STRING, false, 0).getCreateSQL());
    EXPECT_EQ("GEOMETRY", ExtTypeInfoGeometry(0, false, 0).getCreateSQL());
    EXPECT_TRUE(points->equals(ExtTypeInfoGeometry(ExtTypeInfoGeometry::POINT, true, 4326)));
    EXPECT_FALSE(points->equals(ExtTypeInfoGeometry(ExtTypeInfoGeometry::POINT, true, 0)));

    TypeInfo pointType(ValueType::tGEOMETRY, 0, 0, points);
    Value ok = ValueFactory::getStringValue("SRID=4326;POINT (1 2)").convertTo(pointType, &m_provider);
    EXPECT_EQ(4326, m_codec->getSrid(ok.asBytes()));
    EXPECT_EQ("SRID=4326;POINT (1 2)", ok.getString());

    ASSERT_SQL_EXCEPTION(SQLException, SQLException::integrity_constraint_violation,
                         ValueFactory::getStringValue("POINT (1 2)").convertTo(pointType, &m_provider));
    ASSERT_SQL_EXCEPTION(SQLException, SQLException::integrity_constraint_violation,
                         ValueFactory::getStringValue("SRID=4326;LINESTRING (0 0, 1 1)")
                         .convertTo(pointType, &m_provider));
    // a geometry already of the type is still checked
    ASSERT_SQL_EXCEPTION(SQLException, SQLException::integrity_constraint_violation,
                         geometry("POINT (1 2)").convertTo(pointType, &m_provider));
}

TEST_F(ExtTypeInfoTest, GeometryAndJson) {
    Value json = geometry("POINT (1 2)").convertTo(ValueType::tJSON);
    EXPECT_EQ("{\"type\":\"Point\"}", json.getString());

    std::shared_ptr<const ExtTypeInfoGeometry> srid =
            std::make_shared<ExtTypeInfoGeometry>(0, true, 3857);
    Value fromJson = json.convertTo(ValueType::tGEOMETRY, srid.get(), &m_provider, std::string());
    EXPECT_EQ(3857, m_codec->getSrid(fromJson.asBytes()));
    ASSERT_THROWS(DataConversionException,
                  ValueFactory::getJsonValue("{\"type\":\"Polygon\"}").convertTo(ValueType::tGEOMETRY, &m_provider));

    Value javaObject = geometry("POINT (1 2)").convertTo(ValueType::tJAVA_OBJECT);
    EXPECT_EQ("1|0|POINT (1 2)", javaObject.asBytes());
}

int main() {
    return TestSuite::globalInstance()->runAll();
}
