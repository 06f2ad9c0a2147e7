/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "GeoTable.hpp"
#include "MaxMindDB.hpp"

// What a City record holds, names already picked in the preferred language
struct WCityRecord
{
	std::optional<WGeoLocation> Location{};
	std::optional<WCountry>     Country{};
	std::optional<WCountry>     RegisteredCountry{};
	std::optional<std::string>  Province{};
	std::optional<std::string>  ProvinceIsoCode{};
	std::optional<std::string>  City{};
};

// GeoLite2-City style .mmdb, the global baseline for placements
class WMaxMindCityTable final : public IGeoTable
{
	WMaxMindDB Db;

	// Preferred name languages, first hit wins
	std::vector<std::string> Languages;

	// Places in this country get CJK administrative suffixes
	std::string SuffixCountry;

	[[nodiscard]] std::optional<WCountry> ReadCountry(WMaxMindEntry const& Entry, char const* Key) const;

public:
	WMaxMindCityTable(
		std::filesystem::path const& Path, std::vector<std::string> Languages_, std::string SuffixCountry_);

	// Regions get 省/市 suffixes and short names when the country is SuffixCountry and the name is CJK,
	// otherwise the subdivision ISO code is the short province name
	[[nodiscard]] static WGeoPlacement Shape(WCityRecord Record, std::string const& SuffixCountry);

	[[nodiscard]] std::optional<WTableMatch> LongestPrefixMatch(WIPAddress const& Address) const override;

	[[nodiscard]] EGeoTableKind::Type GetKind() const override { return EGeoTableKind::City; }

	[[nodiscard]] std::string Describe() const override { return Db.Describe(); }

	[[nodiscard]] std::size_t GetSize() const override { return Db.GetNodeCount(); }
};
