/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RegionTable.hpp"

#include "RegionNames.hpp"

WMaxMindRegionTable::WMaxMindRegionTable(std::filesystem::path const& Path, std::string CoveredCountry_)
	: Db(Path, "region", "")
	, CoveredCountry(std::move(CoveredCountry_))
{
}

std::optional<WTableMatch> WMaxMindRegionTable::LongestPrefixMatch(WIPAddress const& Address) const
{
	auto Entry = Db.Lookup(Address);
	if (!Entry)
	{
		return std::nullopt;
	}

	WRegionRecord Record{};
	Record.Province = WMaxMindDB::GetString(*Entry, { "province" });
	Record.City = WMaxMindDB::GetString(*Entry, { "city" });
	Record.Districts = WMaxMindDB::GetString(*Entry, { "districts" });
	Record.Net = WMaxMindDB::GetString(*Entry, { "net" });

	auto Latitude = WMaxMindDB::GetDouble(*Entry, { "location", "latitude" });
	auto Longitude = WMaxMindDB::GetDouble(*Entry, { "location", "longitude" });
	if (Latitude && Longitude)
	{
		Record.Location = WGeoLocation{ *Latitude, *Longitude };
	}

	auto Placement = Shape(std::move(Record));
	if (!Placement)
	{
		return std::nullopt;
	}

	WTableMatch Match{};
	Match.Span = WNetworkSpan::Make(Address, Entry->PrefixLength);
	Match.Placement = std::move(Placement);
	return Match;
}

std::optional<WGeoPlacement> WMaxMindRegionTable::Shape(WRegionRecord Record)
{
	WGeoPlacement Placement{};
	for (auto* Name : { &Record.Province, &Record.City, &Record.Districts })
	{
		if (!*Name || (*Name)->empty())
		{
			continue;
		}
		Placement.RegionsShort.push_back(WRegionNames::ShortName(**Name));
		Placement.Regions.push_back(std::move(**Name));
	}

	if (Placement.Regions.empty())
	{
		// a record without any administrative level can't improve on the global table
		return std::nullopt;
	}

	Placement.Location = Record.Location;
	if (Record.Net && !Record.Net->empty())
	{
		Placement.Category = std::move(*Record.Net);
	}
	return Placement;
}
