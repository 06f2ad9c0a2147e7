/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <filesystem>
#include <string>

#include "GeoTable.hpp"
#include "MaxMindDB.hpp"

struct WRegionRecord
{
	std::optional<std::string>  Province{};
	std::optional<std::string>  City{};
	std::optional<std::string>  Districts{};
	std::optional<std::string>  Net{};
	std::optional<WGeoLocation> Location{};
};

// GeoCN style .mmdb: province / city / districts / net, location is optional.
// Records carry no country, the table covers exactly CoveredCountry.
class WMaxMindRegionTable final : public IRegionTable
{
	WMaxMindDB  Db;
	std::string CoveredCountry;

public:
	WMaxMindRegionTable(std::filesystem::path const& Path, std::string CoveredCountry_);

	// Empty if the record names no administrative level
	[[nodiscard]] static std::optional<WGeoPlacement> Shape(WRegionRecord Record);

	[[nodiscard]] std::optional<WTableMatch> LongestPrefixMatch(WIPAddress const& Address) const override;

	[[nodiscard]] std::string const& GetCoveredCountry() const override { return CoveredCountry; }

	[[nodiscard]] std::string Describe() const override { return Db.Describe(); }

	[[nodiscard]] std::size_t GetSize() const override { return Db.GetNodeCount(); }
};
