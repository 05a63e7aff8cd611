#include <gtest/gtest.h>
#include "../src/core/CoordinateExtractor.h"
#include "../src/core/PoiRecord.h"
#include <limits>
#include <spdlog/spdlog.h>

using nlohmann::json;

static struct DisableLogging
{
    DisableLogging() { spdlog::set_level(spdlog::level::off); }
} _disableLogging;

// ====================
// extractLocation Tests
// ====================

TEST(CoordinateExtractor, ExtractLocation_GeoJsonPoint)
{
    json loc = {{"type", "Point"}, {"coordinates", {108.2428, 16.0544}}};
    auto p = poi::extractLocation(loc);
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->latitude, 16.0544);
    EXPECT_DOUBLE_EQ(p->longitude, 108.2428);
}

TEST(CoordinateExtractor, ExtractLocation_BareArrayIsLngLat)
{
    auto p = poi::extractLocation(json::array({108.2428, 16.0544}));
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->latitude, 16.0544);
    EXPECT_DOUBLE_EQ(p->longitude, 108.2428);
}

TEST(CoordinateExtractor, ExtractLocation_LatitudeLongitudeKeys)
{
    auto p = poi::extractLocation(json{{"latitude", 16.0544}, {"longitude", 108.2428}});
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->latitude, 16.0544);
    EXPECT_DOUBLE_EQ(p->longitude, 108.2428);
}

TEST(CoordinateExtractor, ExtractLocation_LatLngKeys)
{
    auto p = poi::extractLocation(json{{"lat", 16.0544}, {"lng", 108.2428}});
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->latitude, 16.0544);
}

TEST(CoordinateExtractor, ExtractLocation_IntegerCoordinates)
{
    auto p = poi::extractLocation(json::array({108, 16}));
    ASSERT_TRUE(p.has_value());
    EXPECT_DOUBLE_EQ(p->latitude, 16.0);
    EXPECT_DOUBLE_EQ(p->longitude, 108.0);
}

TEST(CoordinateExtractor, ExtractLocation_Invalid)
{
    EXPECT_FALSE(poi::extractLocation(json(nullptr)).has_value());
    EXPECT_FALSE(poi::extractLocation(json("16.05,108.24")).has_value());
    EXPECT_FALSE(poi::extractLocation(json::array({108.2428})).has_value());
    EXPECT_FALSE(poi::extractLocation(json::array({"108.2", "16.0"})).has_value());
    EXPECT_FALSE(poi::extractLocation(json::array({true, false})).has_value());
    EXPECT_FALSE(poi::extractLocation(json{{"type", "Point"}}).has_value());
    EXPECT_FALSE(poi::extractLocation(json{{"coordinates", nullptr}}).has_value());
    EXPECT_FALSE(poi::extractLocation(json{{"latitude", 16.0}}).has_value());
    EXPECT_FALSE(poi::extractLocation(json::object()).has_value());
}

TEST(CoordinateExtractor, ExtractLocation_NonFiniteOrOutOfRange)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_FALSE(poi::extractLocation(json{{"lat", nan}, {"lng", 108.2428}}).has_value());
    EXPECT_FALSE(poi::extractLocation(json::array({inf, 16.0544})).has_value());
    EXPECT_FALSE(poi::extractLocation(json{{"lat", 500.0}, {"lng", 108.2428}}).has_value());
    EXPECT_FALSE(poi::extractLocation(json{{"latitude", 16.0544}, {"longitude", -180.5}}).has_value());
    EXPECT_FALSE(poi::extractLocation(json{{"coordinates", {108.2428, -90.01}}}).has_value());

    // Boundaries are valid
    auto corner = poi::extractLocation(json::array({180.0, -90.0}));
    ASSERT_TRUE(corner.has_value());
    EXPECT_DOUBLE_EQ(corner->latitude, -90.0);
    EXPECT_DOUBLE_EQ(corner->longitude, 180.0);
}

TEST(CoordinateExtractor, ExtractCoordinates_OutOfRangeIsExcluded)
{
    std::vector<poi::PoiRecord> records = {
        poi::PoiRecord("a", "A", json::array({108.2428, 16.0544})),
        poi::PoiRecord("b", "B", json{{"lat", 500.0}, {"lng", 108.0}}),
    };

    auto extracted = poi::extractCoordinates(records);

    EXPECT_EQ(extracted.indices, (std::vector<size_t>{0}));
    EXPECT_EQ(extracted.excluded, (std::vector<size_t>{1}));
}

// ====================
// extractCoordinates Tests
// ====================

TEST(CoordinateExtractor, ExtractCoordinates_PreservesOrderAndMapping)
{
    std::vector<poi::PoiRecord> records = {
        poi::PoiRecord("a", "A", json::array({108.0, 16.0})),
        poi::PoiRecord("b", "B", nullptr),
        poi::PoiRecord("c", "C", json{{"lat", 16.2}, {"lng", 108.2}}),
        poi::PoiRecord("d", "D", json::array({"x", "y"})),
    };

    auto extracted = poi::extractCoordinates(records);

    ASSERT_EQ(extracted.size(), 2u);
    EXPECT_EQ(extracted.indices, (std::vector<size_t>{0, 2}));
    EXPECT_EQ(extracted.excluded, (std::vector<size_t>{1, 3}));
    EXPECT_DOUBLE_EQ(extracted.coords[1].latitude, 16.2);
    EXPECT_DOUBLE_EQ(extracted.coords[1].longitude, 108.2);
}

TEST(CoordinateExtractor, ExtractCoordinates_Empty)
{
    auto extracted = poi::extractCoordinates({});
    EXPECT_TRUE(extracted.empty());
    EXPECT_TRUE(extracted.excluded.empty());
}

TEST(CoordinateExtractor, ExtractCoordinates_NoneValid)
{
    std::vector<poi::PoiRecord> records = {
        poi::PoiRecord("a", "A", nullptr),
        poi::PoiRecord("b", "B", json::object()),
    };
    auto extracted = poi::extractCoordinates(records);
    EXPECT_TRUE(extracted.empty());
    EXPECT_EQ(extracted.excluded.size(), 2u);
}

// ====================
// PoiRecord Tests
// ====================

TEST(PoiRecord, FromJson_KnownFieldsAndAttributes)
{
    json j = {
        {"poi_id", "poi_1"},
        {"name", "Mỹ Khê Beach"},
        {"dedupe_key", "mykhebeach_w6ugr4s"},
        {"location", {{"type", "Point"}, {"coordinates", {108.2428, 16.0544}}}},
        {"rating", 4.7},
        {"tags", {"beach", "swimming"}},
    };

    auto record = poi::PoiRecord::fromJson(j);
    EXPECT_EQ(record.poi_id, "poi_1");
    EXPECT_EQ(record.name, "Mỹ Khê Beach");
    ASSERT_TRUE(record.dedupe_key.has_value());
    EXPECT_EQ(*record.dedupe_key, "mykhebeach_w6ugr4s");
    EXPECT_EQ(record.location["type"], "Point");
    EXPECT_DOUBLE_EQ(record.attributes["rating"].get<double>(), 4.7);
    EXPECT_FALSE(record.attributes.contains("name"));
}

TEST(PoiRecord, FromJson_EmptyDedupeKeyIsAbsent)
{
    auto record = poi::PoiRecord::fromJson(json{{"name", "X"}, {"dedupe_key", ""}});
    EXPECT_FALSE(record.dedupe_key.has_value());
}

TEST(PoiRecord, ToJson_RoundTripsUnchanged)
{
    json j = {
        {"name", "Marble Mountains"},
        {"location", {108.2625, 16.0036}},
        {"category", "attraction"},
    };
    EXPECT_EQ(poi::PoiRecord::fromJson(j).toJson(), j);
}

TEST(PoiRecord, ToJson_NonObjectPassesThrough)
{
    json j = "just a string";
    auto record = poi::PoiRecord::fromJson(j);
    EXPECT_EQ(record.toJson(), j);
    EXPECT_FALSE(poi::extractLocation(record).has_value());
}

TEST(PoiRecord, Equality)
{
    poi::PoiRecord a("a", "A", json::array({1.0, 2.0}));
    poi::PoiRecord b = a;
    EXPECT_EQ(a, b);
    b.attributes["note"] = "changed";
    EXPECT_NE(a, b);
}
