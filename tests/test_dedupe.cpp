#include <gtest/gtest.h>
#include "../src/core/DedupeKey.h"
#include "../src/core/DuplicateMatcher.h"
#include <spdlog/spdlog.h>

using nlohmann::json;

static struct DisableLogging
{
    DisableLogging() { spdlog::set_level(spdlog::level::off); }
} _disableLogging;

static poi::PoiRecord makePoi(const std::string &name, double lat, double lng)
{
    return poi::PoiRecord("", name, json{{"type", "Point"}, {"coordinates", {lng, lat}}});
}

// ====================
// generateDedupeKey Tests
// ====================

TEST(DedupeKey, Generate_DiacriticVariantsShareKey)
{
    std::string a = poi::generateDedupeKey("Mỹ Khê Beach", 16.0544, 108.2428);
    std::string b = poi::generateDedupeKey("My Khe Beach", 16.0545, 108.2429);

    EXPECT_EQ(a, "mykhebeach_w6ugr4s");
    EXPECT_EQ(a, b);
}

TEST(DedupeKey, Generate_DistantSameNameDiffers)
{
    std::string da_nang = poi::generateDedupeKey("Mỹ Khê Beach", 16.0544, 108.2428);
    std::string nha_trang = poi::generateDedupeKey("Mỹ Khê Beach", 12.2528, 109.1967);

    EXPECT_NE(da_nang, nha_trang);
    EXPECT_EQ(nha_trang, "mykhebeach_w6jtsyd");
}

TEST(DedupeKey, Generate_PrecisionControlsCell)
{
    EXPECT_EQ(poi::generateDedupeKey("Mỹ Khê Beach", 16.0544, 108.2428, 5), "mykhebeach_w6ugr");
}

TEST(DedupeKey, Generate_ParenthesizedTextIgnored)
{
    EXPECT_EQ(poi::generateDedupeKey("Cầu Rồng (Dragon Bridge)", 16.0611, 108.2272),
              poi::generateDedupeKey("Cau Rong", 16.0611, 108.2272));
}

TEST(DedupeKey, Generate_InvalidPrecisionThrows)
{
    EXPECT_THROW(poi::generateDedupeKey("x", 16.0, 108.0, 0), std::invalid_argument);
    EXPECT_THROW(poi::generateDedupeKey("x", 16.0, 108.0, 13), std::invalid_argument);
}

// ====================
// dedupeKeyFor / assignIdentity Tests
// ====================

TEST(DedupeKey, KeyFor_PrefersStoredKey)
{
    auto record = makePoi("Mỹ Khê Beach", 16.0544, 108.2428);
    record.dedupe_key = "legacy_key";

    EXPECT_EQ(poi::dedupeKeyFor(record), std::optional<std::string>("legacy_key"));
}

TEST(DedupeKey, KeyFor_NoLocation)
{
    poi::PoiRecord record("", "Somewhere", nullptr);
    EXPECT_FALSE(poi::dedupeKeyFor(record).has_value());
}

TEST(DedupeKey, AssignIdentity_FillsKeyAndId)
{
    auto record = makePoi("Mỹ Khê Beach", 16.0544, 108.2428);

    EXPECT_TRUE(poi::assignIdentity(record));
    ASSERT_TRUE(record.dedupe_key.has_value());
    EXPECT_EQ(*record.dedupe_key, "mykhebeach_w6ugr4s");
    EXPECT_EQ(record.poi_id, "poi_mykhebeach_w6ugr4s");
}

TEST(DedupeKey, AssignIdentity_KeepsExistingValues)
{
    auto record = makePoi("Mỹ Khê Beach", 16.0544, 108.2428);
    record.poi_id = "poi_42";
    record.dedupe_key = "old_key";

    EXPECT_TRUE(poi::assignIdentity(record));
    EXPECT_EQ(record.poi_id, "poi_42");
    EXPECT_EQ(*record.dedupe_key, "old_key");
}

TEST(DedupeKey, AssignIdentity_StoredKeyWithoutLocation)
{
    poi::PoiRecord record("", "Somewhere", nullptr);
    record.dedupe_key = "somewhere_w6ugr4s";

    EXPECT_TRUE(poi::assignIdentity(record));
    EXPECT_EQ(record.poi_id, "poi_somewhere_w6ugr4s");
}

TEST(DedupeKey, AssignIdentity_NoLocationLeavesRecord)
{
    poi::PoiRecord record("", "Somewhere", nullptr);
    poi::PoiRecord before = record;

    EXPECT_FALSE(poi::assignIdentity(record));
    EXPECT_EQ(record, before);
}

// ====================
// DuplicateMatcher Tests
// ====================

TEST(DuplicateMatcher, SameKeyIsDuplicate)
{
    auto a = makePoi("Mỹ Khê Beach", 16.0544, 108.2428);
    auto b = makePoi("My Khe Beach", 16.0545, 108.2429);

    EXPECT_TRUE(poi::areDuplicates(a, b));
    EXPECT_TRUE(poi::areDuplicates(b, a));
}

TEST(DuplicateMatcher, NeighboringCellsMatchByDistance)
{
    // ~32 m apart, keys end in ...4s and ...4t
    auto a = makePoi("Dragon Bridge", 16.0544, 108.2440);
    auto b = makePoi("Dragon Bridge", 16.0544, 108.2443);
    ASSERT_NE(poi::dedupeKeyFor(a), poi::dedupeKeyFor(b));

    EXPECT_TRUE(poi::areDuplicates(a, b));
}

TEST(DuplicateMatcher, SameNameBeyondThreshold)
{
    // ~214 m apart in different cells
    auto a = makePoi("Dragon Bridge", 16.0544, 108.2440);
    auto b = makePoi("Dragon Bridge", 16.0544, 108.2460);

    EXPECT_FALSE(poi::areDuplicates(a, b));
}

TEST(DuplicateMatcher, DifferentNamesSameSpot)
{
    auto a = makePoi("Han Market", 16.0683, 108.2240);
    auto b = makePoi("Con Market", 16.0683, 108.2240);

    EXPECT_FALSE(poi::areDuplicates(a, b));
}

TEST(DuplicateMatcher, UnnamedNeighborsNotMatchedByDistance)
{
    auto a = makePoi("", 16.0544, 108.2440);
    auto b = makePoi("", 16.0544, 108.2443);

    EXPECT_FALSE(poi::areDuplicates(a, b));
}

TEST(DuplicateMatcher, StoredKeysCompared)
{
    poi::PoiRecord a("", "Anything", nullptr);
    poi::PoiRecord b("", "Else", nullptr);
    a.dedupe_key = "shared_w6ugr4s";
    b.dedupe_key = "shared_w6ugr4s";

    EXPECT_TRUE(poi::areDuplicates(a, b));
}

TEST(DuplicateMatcher, UnlocatedNeverFuzzyMatches)
{
    poi::PoiRecord a("", "Dragon Bridge", nullptr);
    auto b = makePoi("Dragon Bridge", 16.0544, 108.2440);

    EXPECT_FALSE(poi::areDuplicates(a, b));
}

TEST(DuplicateMatcher, Defaults)
{
    poi::DuplicateMatcher matcher;
    EXPECT_DOUBLE_EQ(matcher.distanceThresholdMeters(), 150.0);
    EXPECT_EQ(matcher.precision(), 7);
    EXPECT_DOUBLE_EQ(matcher.minNameSimilarity(), 1.0);
}

TEST(DuplicateMatcher, ParamsWidenThreshold)
{
    auto a = makePoi("Dragon Bridge", 16.0544, 108.2440);
    auto b = makePoi("Dragon Bridge", 16.0544, 108.2460);

    poi::AlgorithmParameters params;
    params.set("distance_threshold_m", 300);
    poi::DuplicateMatcher matcher(params);

    EXPECT_DOUBLE_EQ(matcher.distanceThresholdMeters(), 300.0);
    EXPECT_TRUE(matcher.areDuplicates(a, b));
}

TEST(DuplicateMatcher, ParamsCoarserPrecision)
{
    auto a = makePoi("Dragon Bridge", 16.0544, 108.2440);
    auto b = makePoi("Dragon Bridge", 16.0544, 108.2460);

    poi::AlgorithmParameters params;
    params.set("precision", 5);
    poi::DuplicateMatcher matcher(params);

    EXPECT_TRUE(matcher.areDuplicates(a, b));
}

TEST(DuplicateMatcher, ParamsFuzzyNames)
{
    auto a = makePoi("Han Market", 16.0683, 108.2240);
    auto b = makePoi("Han Markets", 16.0684, 108.2241);

    poi::AlgorithmParameters params;
    params.set("min_name_similarity", 0.9);
    poi::DuplicateMatcher matcher(params);

    EXPECT_FALSE(poi::areDuplicates(a, b));
    EXPECT_TRUE(matcher.areDuplicates(a, b));
}

TEST(DuplicateMatcher, Collapse_KeepsFirstSeen)
{
    std::vector<poi::PoiRecord> records = {
        makePoi("Mỹ Khê Beach", 16.0544, 108.2428),
        makePoi("Han Market", 16.0683, 108.2240),
        makePoi("My Khe Beach", 16.0545, 108.2429),
        makePoi("MỸ KHÊ BEACH (north end)", 16.0544, 108.2428),
    };
    records[0].poi_id = "first";

    poi::DedupeResult result = poi::DuplicateMatcher().collapse(records);

    ASSERT_EQ(result.canonical.size(), 2u);
    EXPECT_EQ(result.canonical[0].poi_id, "first");
    EXPECT_EQ(result.canonical[1].name, "Han Market");
    ASSERT_EQ(result.duplicates.count(0), 1u);
    EXPECT_EQ(result.duplicates[0].size(), 2u);
    EXPECT_EQ(result.duplicates.count(1), 0u);
    EXPECT_EQ(result.duplicateCount(), 2u);
}

TEST(DuplicateMatcher, Collapse_Empty)
{
    poi::DedupeResult result = poi::DuplicateMatcher().collapse({});
    EXPECT_TRUE(result.canonical.empty());
    EXPECT_EQ(result.duplicateCount(), 0u);
}
