/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "FakeTables.hpp"
#include "Geo/GeoLookup.hpp"

namespace
{
	WIPAddress Ip(char const* Str)
	{
		return *WIPAddress::FromString(Str);
	}
} // namespace

class GeoLookupTest : public ::testing::Test
{
protected:
	std::shared_ptr<WDatabaseSnapshot> Snapshot = WFakeDatabase{}.WithDefaults().Build();
};

TEST_F(GeoLookupTest, MergesAsnAndCity)
{
	auto const Record = WGeoLookup::Lookup(Ip("8.8.8.8"), *Snapshot);

	ASSERT_TRUE(Record.Asn.has_value());
	EXPECT_EQ(Record.Asn->Number, 15169u);
	EXPECT_EQ(Record.Asn->Organization, "GOOGLE");
	EXPECT_EQ(Record.Asn->Info, "谷歌");
	ASSERT_TRUE(Record.Span.has_value());
	EXPECT_EQ(Record.Span->ToString(), "8.8.8.0/24");

	ASSERT_TRUE(Record.Placement.has_value());
	EXPECT_EQ(Record.Placement->Country->Code, "US");
	ASSERT_TRUE(Record.Placement->Location.has_value());
	EXPECT_DOUBLE_EQ(Record.Placement->Location->Latitude, 37.751);
	// An empty catalog type is reported as the generic category
	EXPECT_EQ(Record.Placement->Category, "其他网络");
}

TEST_F(GeoLookupTest, RegionTableReplacesPlacementForCoveredCountry)
{
	auto const Record = WGeoLookup::Lookup(Ip("1.80.1.1"), *Snapshot);

	ASSERT_TRUE(Record.Asn.has_value());
	EXPECT_EQ(Record.Asn->Number, 4134u);
	EXPECT_EQ(Record.Asn->Info, "中国电信");

	ASSERT_TRUE(Record.Placement.has_value());
	auto const& Placement = *Record.Placement;
	EXPECT_EQ(Placement.Regions, (std::vector<std::string>{ "陕西省", "西安市", "雁塔区" }));
	EXPECT_EQ(Placement.RegionsShort, (std::vector<std::string>{ "陕西", "西安", "雁塔" }));
	EXPECT_EQ(Placement.Category, "宽带");
	EXPECT_EQ(Placement.Country->Code, "CN");
	EXPECT_EQ(Placement.RegisteredCountry->Code, "CN");
	// The region entry has no coordinates of its own
	EXPECT_FALSE(Placement.Location.has_value());
}

TEST_F(GeoLookupTest, CityPlacementWithoutRegionHit)
{
	// Inside the city block but outside the region block
	auto const Record = WGeoLookup::Lookup(Ip("1.81.0.1"), *Snapshot);

	ASSERT_TRUE(Record.Placement.has_value());
	EXPECT_EQ(Record.Placement->Regions, (std::vector<std::string>{ "陕西省", "西安市" }));
	EXPECT_EQ(Record.Placement->RegionsShort, (std::vector<std::string>{ "SN", "西安" }));
	EXPECT_TRUE(Record.Placement->Location.has_value());
	EXPECT_EQ(Record.Placement->Category, "宽带");
}

TEST_F(GeoLookupTest, RegionTableIgnoredOutsideCoveredCountry)
{
	auto const Record = WGeoLookup::Lookup(Ip("1.36.0.1"), *Snapshot);

	ASSERT_TRUE(Record.Placement.has_value());
	EXPECT_EQ(Record.Placement->Country->Code, "HK");
	EXPECT_TRUE(Record.Placement->Regions.empty());
}

TEST_F(GeoLookupTest, PrivateAddressHasReservedSpanOnly)
{
	auto const Record = WGeoLookup::Lookup(Ip("10.0.0.1"), *Snapshot);

	EXPECT_EQ(Record.Address.ToString(), "10.0.0.1");
	EXPECT_FALSE(Record.Asn.has_value());
	EXPECT_FALSE(Record.Placement.has_value());
	ASSERT_TRUE(Record.Span.has_value());
	EXPECT_EQ(Record.Span->ToString(), "10.0.0.0/8");
}

TEST_F(GeoLookupTest, AsnZeroIsAMiss)
{
	auto const Record = WGeoLookup::Lookup(Ip("203.0.113.5"), *Snapshot);

	EXPECT_FALSE(Record.Asn.has_value());
	ASSERT_TRUE(Record.Span.has_value());
	EXPECT_EQ(Record.Span->ToString(), "203.0.113.0/24");
}

TEST_F(GeoLookupTest, UnknownPublicAddressIsEmpty)
{
	auto const Record = WGeoLookup::Lookup(Ip("9.9.9.9"), *Snapshot);

	EXPECT_FALSE(Record.Asn.has_value());
	EXPECT_FALSE(Record.Span.has_value());
	EXPECT_FALSE(Record.Placement.has_value());
}

TEST_F(GeoLookupTest, AsnWithoutCatalogEntryHasNoInfo)
{
	WFakeDatabase Database;
	Database.Asn->AddAsn("9.9.9.0/24", 19281, "QUAD9");
	auto const Bare = Database.Build();

	auto const Record = WGeoLookup::Lookup(Ip("9.9.9.9"), *Bare);
	ASSERT_TRUE(Record.Asn.has_value());
	EXPECT_FALSE(Record.Asn->Info.has_value());
	EXPECT_FALSE(Record.Placement.has_value());
}

TEST_F(GeoLookupTest, CatalogTypeFillsRegionRecordWithoutNet)
{
	WFakeDatabase Database;
	Database.WithDefaults();
	WGeoPlacement Weinan{};
	Weinan.Regions = { "陕西省", "渭南市" };
	Weinan.RegionsShort = { "陕西", "渭南" };
	Database.Region->AddPlacement("1.82.0.0/16", Weinan);
	auto const Custom = Database.Build();

	auto const Record = WGeoLookup::Lookup(Ip("1.82.3.4"), *Custom);
	ASSERT_TRUE(Record.Placement.has_value());
	EXPECT_EQ(Record.Placement->Regions, (std::vector<std::string>{ "陕西省", "渭南市" }));
	EXPECT_EQ(Record.Placement->Category, "宽带");
}

TEST_F(GeoLookupTest, RegionNetWinsOverCatalogType)
{
	WFakeDatabase Database;
	Database.WithDefaults();
	WGeoPlacement Campus{};
	Campus.Regions = { "陕西省", "西安市" };
	Campus.RegionsShort = { "陕西", "西安" };
	Campus.Category = "教育网";
	Database.Region->AddPlacement("1.83.0.0/16", Campus);
	auto const Custom = Database.Build();

	auto const Record = WGeoLookup::Lookup(Ip("1.83.0.9"), *Custom);
	ASSERT_TRUE(Record.Placement.has_value());
	EXPECT_EQ(Record.Placement->Category, "教育网");
	EXPECT_EQ(Record.Asn->NetworkType, "宽带");
}

TEST_F(GeoLookupTest, CatalogTypeKeptWithoutPlacement)
{
	WFakeDatabase Database;
	Database.WithDefaults();
	Database.Asn->AddAsn("36.96.0.0/11", 4134, "Chinanet");
	auto const Custom = Database.Build();

	auto const Record = WGeoLookup::Lookup(Ip("36.100.1.1"), *Custom);
	EXPECT_FALSE(Record.Placement.has_value());
	ASSERT_TRUE(Record.Asn.has_value());
	EXPECT_EQ(Record.Asn->Number, 4134u);
	EXPECT_EQ(Record.Asn->NetworkType, "宽带");
}
