#include <gtest/gtest.h>
#include "../src/core/GeoPoint.h"
#include "../src/core/GeoCenter.h"
#include "../src/core/PoiRecord.h"

// ====================
// haversineKm Tests
// ====================

TEST(GeoPoint, Haversine_SamePointIsZero)
{
    EXPECT_DOUBLE_EQ(poi::haversineKm(16.0544, 108.2428, 16.0544, 108.2428), 0.0);
}

TEST(GeoPoint, Haversine_OneDegreeOfLatitude)
{
    // 2 * pi * 6371 / 360
    EXPECT_NEAR(poi::haversineKm(0.0, 0.0, 1.0, 0.0), 111.195, 0.01);
}

TEST(GeoPoint, Haversine_IsSymmetric)
{
    poi::GeoPoint a(16.0544, 108.2428);
    poi::GeoPoint b(12.2528, 109.1967);
    EXPECT_DOUBLE_EQ(poi::haversineKm(a, b), poi::haversineKm(b, a));
}

TEST(GeoPoint, Haversine_DaNangToNhaTrang)
{
    poi::GeoPoint da_nang(16.0544, 108.2428);
    poi::GeoPoint nha_trang(12.2528, 109.1967);
    double d = poi::haversineKm(da_nang, nha_trang);
    EXPECT_GT(d, 400.0);
    EXPECT_LT(d, 450.0);
}

TEST(GeoPoint, Haversine_CustomRadius)
{
    double unit = poi::haversineKm(0.0, 0.0, 0.0, 90.0, 1.0);
    EXPECT_NEAR(unit, M_PI / 2.0, 1e-12);
}

// ====================
// degreeDistance Tests
// ====================

TEST(GeoPoint, DegreeDistance_IsEuclidean)
{
    poi::GeoPoint a(10.0, 20.0);
    poi::GeoPoint b(10.03, 20.04);
    EXPECT_NEAR(poi::degreeDistance(a, b), 0.05, 1e-12);
}

TEST(GeoPoint, DegreeDistance_RadiusConversion)
{
    // 2 km is 0.018 degrees in the planar approximation
    EXPECT_NEAR(2.0 * DEGREES_PER_KM, 0.018018, 1e-6);
}

// ====================
// GeoCenter Tests
// ====================

TEST(GeoCenter, ClusterCenter_MeanOfLocatedRecords)
{
    std::vector<poi::PoiRecord> records = {
        poi::PoiRecord("a", "A", nlohmann::json::array({108.0, 16.0})),
        poi::PoiRecord("b", "B", nlohmann::json::array({108.2, 16.2})),
        poi::PoiRecord("c", "C", nullptr),
    };

    poi::GeoPoint center = poi::clusterCenter(records);
    EXPECT_NEAR(center.latitude, 16.1, 1e-12);
    EXPECT_NEAR(center.longitude, 108.1, 1e-12);
}

TEST(GeoCenter, ClusterCenter_EmptyIsOrigin)
{
    std::vector<poi::PoiRecord> records;
    EXPECT_EQ(poi::clusterCenter(records), poi::GeoPoint(0.0, 0.0));
}

TEST(GeoCenter, ClusterCenter_NoneLocatedIsOrigin)
{
    std::vector<poi::PoiRecord> records = {
        poi::PoiRecord("a", "A", nullptr),
        poi::PoiRecord("b", "B", "not a location"),
    };
    EXPECT_EQ(poi::clusterCenter(records), poi::GeoPoint(0.0, 0.0));
}

TEST(GeoCenter, CentroidOf_SelectsMembers)
{
    std::vector<poi::GeoPoint> coords = {{0.0, 0.0}, {10.0, 10.0}, {20.0, 30.0}};
    poi::GeoPoint c = poi::centroidOf(coords, {1, 2});
    EXPECT_DOUBLE_EQ(c.latitude, 15.0);
    EXPECT_DOUBLE_EQ(c.longitude, 20.0);
}
