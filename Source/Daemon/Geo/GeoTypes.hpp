/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "IPAddress.hpp"
#include "NetworkSpan.hpp"
#include "Types.hpp"

struct WAsnRecord
{
	WAsn        Number{};
	std::string Organization{};

	// Localized operator name and network use from the ASN catalog
	std::optional<std::string> Info{};
	std::optional<std::string> NetworkType{};
};

struct WCountry
{
	std::string Code{};
	std::string Name{};
};

struct WGeoLocation
{
	double Latitude{};
	double Longitude{};
};

struct WGeoPlacement
{
	std::optional<WGeoLocation> Location{};
	std::optional<WCountry>     Country{};
	std::optional<WCountry>     RegisteredCountry{};

	// Country level first, most specific last. RegionsShort is parallel to Regions.
	std::vector<std::string> Regions{};
	std::vector<std::string> RegionsShort{};

	// Network use, e.g. "datacenter" or "broadband"
	std::optional<std::string> Category{};
};

// What a single table knows about an address
struct WTableMatch
{
	WNetworkSpan                 Span{};
	std::optional<WAsnRecord>    Asn{};
	std::optional<WGeoPlacement> Placement{};
};

struct WGeoRecord
{
	WIPAddress                   Address{};
	std::optional<WAsnRecord>    Asn{};
	std::optional<WNetworkSpan>  Span{};
	std::optional<WGeoPlacement> Placement{};
};

struct WResolutionResult
{
	std::string             Host{};
	std::vector<WGeoRecord> Records{};

	// Literal or client address queries are answered flat, hostnames as { host, ips }
	bool bSingleAddress{ true };
};
