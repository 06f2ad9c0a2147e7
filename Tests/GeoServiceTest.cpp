/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "FakeTables.hpp"
#include "Json.hpp"
#include "Communication/GeoService.hpp"

class GeoServiceTest : public ::testing::Test
{
protected:
	std::shared_ptr<WFakeHostLookup> Lookup = std::make_shared<WFakeHostLookup>();

	WSnapshotManager Manager{ [](WDatabasePaths const&) { return WFakeDatabase{}.WithDefaults().Build(); } };

	std::unique_ptr<WGeoService> Service;

	void SetUp() override
	{
		Lookup->V4["dns.google"] = { "8.8.8.8", "8.8.4.4" };
		Lookup->V6["dns.google"] = { "2001:4860:4860::8888" };
		Manager.LoadInitial({});
		Service = std::make_unique<WGeoService>(Manager, WResolver(Lookup), true);
	}

	WHttpResponse Get(std::string const& Path, std::optional<std::string> HostArgument = std::nullopt)
	{
		WHttpRequest Request{};
		Request.Path = Path;
		Request.HostArgument = std::move(HostArgument);
		Request.PeerAddress = *WIPAddress::FromString("8.8.8.8");
		return Service->Handle(Request);
	}

	static WJson Parse(WHttpResponse const& Response)
	{
		std::string Err;
		auto        Json = WJson::parse(Response.Body, Err);
		EXPECT_TRUE(Err.empty()) << Err;
		return Json;
	}
};

TEST(GeoServiceRouteTest, RoutesEntryPoints)
{
	EXPECT_EQ(WGeoService::Route("/", std::nullopt).Kind, ERouteKind::ClientAddress);
	EXPECT_EQ(WGeoService::Route("", std::nullopt).Kind, ERouteKind::ClientAddress);
	EXPECT_EQ(WGeoService::Route("/api", std::nullopt).Kind, ERouteKind::ClientAddress);
	EXPECT_EQ(WGeoService::Route("/api/", std::string{}).Kind, ERouteKind::ClientAddress);

	auto const Query = WGeoService::Route("/api", std::string("1.1.1.1"));
	EXPECT_EQ(Query.Kind, ERouteKind::HostQuery);
	EXPECT_EQ(Query.Host, "1.1.1.1");

	EXPECT_EQ(WGeoService::Route("/api/example.com", std::nullopt).Host, "example.com");
	EXPECT_EQ(WGeoService::Route("/example.com", std::nullopt).Host, "example.com");
	EXPECT_EQ(WGeoService::Route("/2001:db8::1", std::nullopt).Host, "2001:db8::1");

	EXPECT_EQ(WGeoService::Route("/a/b", std::nullopt).Kind, ERouteKind::NotFound);
	EXPECT_EQ(WGeoService::Route("/api/a/b", std::nullopt).Kind, ERouteKind::NotFound);
}

TEST_F(GeoServiceTest, EntryPointsAreEquivalent)
{
	auto const Path = Get("/8.8.8.8");
	auto const Api = Get("/api/8.8.8.8");
	auto const Query = Get("/api", "8.8.8.8");

	EXPECT_EQ(Path.Status, 200);
	EXPECT_EQ(Path.Body, Api.Body);
	EXPECT_EQ(Path.Body, Query.Body);

	auto const Json = Parse(Path);
	EXPECT_EQ(Json["ip"].string_value(), "8.8.8.8");
	EXPECT_EQ(Json["as"]["number"].int_value(), 15169);
	EXPECT_EQ(Json["addr"].string_value(), "8.8.8.0/24");
	EXPECT_EQ(Json["country"]["code"].string_value(), "US");
}

TEST_F(GeoServiceTest, RootAnswersForTheClient)
{
	WHttpRequest Request{};
	Request.Path = "/";
	Request.PeerAddress = *WIPAddress::FromString("10.0.0.2");
	Request.Headers["x-forwarded-for"] = "1.80.2.3";

	auto const Json = Parse(Service->Handle(Request));
	EXPECT_EQ(Json["ip"].string_value(), "1.80.2.3");
	EXPECT_EQ(Json["regions_short"][0].string_value(), "陕西");
}

TEST_F(GeoServiceTest, HostnameReturnsEveryAddress)
{
	auto const Response = Get("/dns.google");
	EXPECT_EQ(Response.Status, 200);

	auto const Json = Parse(Response);
	EXPECT_EQ(Json["host"].string_value(), "dns.google");
	ASSERT_EQ(Json["ips"].array_items().size(), 3u);
	EXPECT_EQ(Json["ips"][0]["ip"].string_value(), "8.8.8.8");
	EXPECT_EQ(Json["ips"][1]["ip"].string_value(), "8.8.4.4");
	EXPECT_EQ(Json["ips"][2]["ip"].string_value(), "2001:4860:4860::8888");
	EXPECT_TRUE(Json["ips"][1]["as"].is_null());
}

TEST_F(GeoServiceTest, ErrorsMapToStatusCodes)
{
	auto const Invalid = Get("/not a host");
	EXPECT_EQ(Invalid.Status, 400);
	EXPECT_EQ(Parse(Invalid)["error"].string_value(), "INVALID_HOST");

	auto const Unknown = Get("/nxdomain.invalid");
	EXPECT_EQ(Unknown.Status, 404);
	EXPECT_EQ(Parse(Unknown)["error"].string_value(), "NO_SUCH_HOST");

	auto const Nested = Get("/a/b");
	EXPECT_EQ(Nested.Status, 404);
	EXPECT_EQ(Parse(Nested)["error"].string_value(), "NOT_FOUND");

	WHttpRequest Post{};
	Post.Method = "POST";
	auto const NotAllowed = Service->Handle(Post);
	EXPECT_EQ(NotAllowed.Status, 405);
	EXPECT_EQ(Parse(NotAllowed)["error"].string_value(), "METHOD_NOT_ALLOWED");
}

TEST(GeoServiceUnloadedTest, NoSnapshotIsInternalError)
{
	WSnapshotManager Manager{ [](WDatabasePaths const&) { return WFakeDatabase{}.Build(); } };
	WGeoService      Service(Manager, WResolver(std::make_shared<WFakeHostLookup>()), true);

	WHttpRequest Request{};
	Request.Path = "/8.8.8.8";
	auto const Response = Service.Handle(Request);
	EXPECT_EQ(Response.Status, 500);
	EXPECT_NE(Response.Body.find("INTERNAL_ERROR"), std::string::npos);
}
