/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "CityTable.hpp"

#include "RegionNames.hpp"

WMaxMindCityTable::WMaxMindCityTable(
	std::filesystem::path const& Path, std::vector<std::string> Languages_, std::string SuffixCountry_)
	: Db(Path, "city", "City")
	, Languages(std::move(Languages_))
	, SuffixCountry(std::move(SuffixCountry_))
{
}

std::optional<WCountry> WMaxMindCityTable::ReadCountry(WMaxMindEntry const& Entry, char const* Key) const
{
	auto Name = WMaxMindDB::GetLocalizedName(Entry, { Key }, Languages);
	if (!Name)
	{
		return std::nullopt;
	}
	return WCountry{
		.Code = WMaxMindDB::GetString(Entry, { Key, "iso_code" }).value_or(""),
		.Name = std::move(*Name),
	};
}

std::optional<WTableMatch> WMaxMindCityTable::LongestPrefixMatch(WIPAddress const& Address) const
{
	auto Entry = Db.Lookup(Address);
	if (!Entry)
	{
		return std::nullopt;
	}

	WCityRecord Record{};

	auto Latitude = WMaxMindDB::GetDouble(*Entry, { "location", "latitude" });
	auto Longitude = WMaxMindDB::GetDouble(*Entry, { "location", "longitude" });
	if (Latitude && Longitude)
	{
		Record.Location = WGeoLocation{ *Latitude, *Longitude };
	}

	Record.Country = ReadCountry(*Entry, "country");
	Record.RegisteredCountry = ReadCountry(*Entry, "registered_country");
	Record.Province = WMaxMindDB::GetLocalizedName(*Entry, { "subdivisions", "0" }, Languages);
	Record.ProvinceIsoCode = WMaxMindDB::GetString(*Entry, { "subdivisions", "0", "iso_code" });
	Record.City = WMaxMindDB::GetLocalizedName(*Entry, { "city" }, Languages);

	WTableMatch Match{};
	Match.Span = WNetworkSpan::Make(Address, Entry->PrefixLength);
	Match.Placement = Shape(std::move(Record), SuffixCountry);
	return Match;
}

WGeoPlacement WMaxMindCityTable::Shape(WCityRecord Record, std::string const& SuffixCountry)
{
	WGeoPlacement Placement{};
	Placement.Location = Record.Location;
	Placement.Country = std::move(Record.Country);
	Placement.RegisteredCountry = std::move(Record.RegisteredCountry);

	bool const bSuffixed = Placement.Country && !SuffixCountry.empty() && Placement.Country->Code == SuffixCountry;

	if (auto& Province = Record.Province)
	{
		if (bSuffixed && WRegionNames::ContainsCjk(*Province))
		{
			Placement.Regions.push_back(WRegionNames::WithProvinceSuffix(*Province));
			Placement.RegionsShort.push_back(WRegionNames::ShortName(*Province));
		}
		else
		{
			auto const& IsoCode = Record.ProvinceIsoCode;
			Placement.RegionsShort.push_back(IsoCode ? *IsoCode : WRegionNames::ShortName(*Province));
			Placement.Regions.push_back(std::move(*Province));
		}
	}

	if (auto& City = Record.City)
	{
		if (bSuffixed && WRegionNames::ContainsCjk(*City))
		{
			Placement.Regions.push_back(WRegionNames::WithCitySuffix(*City));
		}
		else
		{
			Placement.Regions.push_back(*City);
		}
		Placement.RegionsShort.push_back(WRegionNames::ShortName(*City));
	}
	return Placement;
}
