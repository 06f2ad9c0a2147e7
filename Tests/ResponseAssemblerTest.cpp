/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "Communication/ResponseAssembler.hpp"

namespace
{
	WGeoRecord MakeFullRecord()
	{
		WGeoRecord Record{};
		Record.Address = *WIPAddress::FromString("1.80.1.1");
		Record.Asn = WAsnRecord{ .Number = 4134, .Organization = "Chinanet", .Info = "中国电信" };
		Record.Span = WNetworkSpan::FromString("1.80.0.0/13");

		WGeoPlacement Placement{};
		Placement.Location = WGeoLocation{ 34.25, 108.93 };
		Placement.Country = WCountry{ "CN", "中国" };
		Placement.RegisteredCountry = WCountry{ "CN", "中国" };
		Placement.Regions = { "陕西省", "西安市" };
		Placement.RegionsShort = { "陕西", "西安" };
		Placement.Category = "宽带";
		Record.Placement = Placement;
		return Record;
	}
} // namespace

TEST(ResponseAssemblerTest, FullRecord)
{
	auto const Json = WResponseAssembler::AssembleRecord(MakeFullRecord());

	EXPECT_EQ(Json["ip"].string_value(), "1.80.1.1");
	EXPECT_EQ(Json["as"]["number"].int_value(), 4134);
	EXPECT_EQ(Json["as"]["name"].string_value(), "Chinanet");
	EXPECT_EQ(Json["as"]["info"].string_value(), "中国电信");
	EXPECT_EQ(Json["addr"].string_value(), "1.80.0.0/13");
	EXPECT_DOUBLE_EQ(Json["location"]["latitude"].number_value(), 34.25);
	EXPECT_DOUBLE_EQ(Json["location"]["longitude"].number_value(), 108.93);
	EXPECT_EQ(Json["country"]["code"].string_value(), "CN");
	EXPECT_EQ(Json["registered_country"]["name"].string_value(), "中国");
	ASSERT_EQ(Json["regions"].array_items().size(), 2u);
	EXPECT_EQ(Json["regions"][1].string_value(), "西安市");
	EXPECT_EQ(Json["regions_short"][0].string_value(), "陕西");
	EXPECT_EQ(Json["type"].string_value(), "宽带");
}

TEST(ResponseAssemblerTest, AbsentValuesAreNull)
{
	WGeoRecord Record{};
	Record.Address = *WIPAddress::FromString("10.0.0.1");
	Record.Span = WNetworkSpan::FromString("10.0.0.0/8");

	auto const Json = WResponseAssembler::AssembleRecord(Record);
	for (auto const* Key : { "as", "location", "country", "registered_country", "type" })
	{
		EXPECT_TRUE(Json[Key].is_null()) << Key;
	}
	EXPECT_TRUE(Json["regions"].is_array());
	EXPECT_TRUE(Json["regions"].array_items().empty());
	EXPECT_TRUE(Json["regions_short"].is_array());
	EXPECT_EQ(Json["addr"].string_value(), "10.0.0.0/8");
	EXPECT_EQ(Json.object_items().size(), 9u);
}

TEST(ResponseAssemblerTest, InfoFallsBackToOrganization)
{
	auto Record = MakeFullRecord();
	Record.Asn->Info.reset();

	auto const Json = WResponseAssembler::AssembleRecord(Record);
	EXPECT_EQ(Json["as"]["info"].string_value(), "Chinanet");
}

TEST(ResponseAssemblerTest, TypeFromCatalogWithoutPlacement)
{
	WGeoRecord Record{};
	Record.Address = *WIPAddress::FromString("36.100.1.1");
	Record.Asn = WAsnRecord{ .Number = 4134, .Organization = "Chinanet", .Info = "中国电信", .NetworkType = "宽带" };

	auto const Json = WResponseAssembler::AssembleRecord(Record);
	EXPECT_TRUE(Json["country"].is_null());
	EXPECT_EQ(Json["type"].string_value(), "宽带");
}

TEST(ResponseAssemblerTest, SingleAddressIsFlat)
{
	WResolutionResult Result{};
	Result.Host = "1.80.1.1";
	Result.Records.push_back(MakeFullRecord());

	auto const Json = WResponseAssembler::Assemble(Result);
	EXPECT_EQ(Json["ip"].string_value(), "1.80.1.1");
	EXPECT_TRUE(Json["ips"].is_null());
}

TEST(ResponseAssemblerTest, HostnameListsEveryAddress)
{
	WResolutionResult Result{};
	Result.Host = "example.cn";
	Result.bSingleAddress = false;
	Result.Records.push_back(MakeFullRecord());

	auto const Json = WResponseAssembler::Assemble(Result);
	EXPECT_EQ(Json["host"].string_value(), "example.cn");
	ASSERT_EQ(Json["ips"].array_items().size(), 1u);
	EXPECT_EQ(Json["ips"][0]["ip"].string_value(), "1.80.1.1");
}

TEST(ResponseAssemblerTest, OutputIsDeterministic)
{
	auto const Record = MakeFullRecord();
	EXPECT_EQ(WResponseAssembler::AssembleRecord(Record).dump(), WResponseAssembler::AssembleRecord(Record).dump());
}

TEST(ResponseAssemblerTest, ErrorBody)
{
	auto const Json = WResponseAssembler::AssembleError(400, "INVALID_HOST", "invalid host 'x y'");
	EXPECT_EQ(Json["code"].int_value(), 400);
	EXPECT_EQ(Json["error"].string_value(), "INVALID_HOST");
	EXPECT_EQ(Json["message"].string_value(), "invalid host 'x y'");
}
