/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "GeoLookup.hpp"

namespace
{
	void MergeRegion(WIPAddress const& Address, IRegionTable const& RegionTable, WGeoPlacement& Placement)
	{
		if (!Placement.Country || Placement.Country->Code != RegionTable.GetCoveredCountry())
		{
			return;
		}

		auto RegionMatch = RegionTable.LongestPrefixMatch(Address);
		if (!RegionMatch || !RegionMatch->Placement)
		{
			return;
		}

		WGeoPlacement Merged = std::move(*RegionMatch->Placement);
		Merged.Country = std::move(Placement.Country);
		Merged.RegisteredCountry = std::move(Placement.RegisteredCountry);
		Placement = std::move(Merged);
	}
} // namespace

WGeoRecord WGeoLookup::Lookup(WIPAddress const& Address, WDatabaseSnapshot const& Snapshot)
{
	WGeoRecord Record{};
	Record.Address = Address;

	if (auto AsnMatch = Snapshot.GetAsnTable().LongestPrefixMatch(Address); AsnMatch && AsnMatch->Asn)
	{
		// AS0 is how ip2asn marks unrouted space
		if (AsnMatch->Asn->Number != 0)
		{
			Record.Asn = std::move(AsnMatch->Asn);
			Record.Span = AsnMatch->Span;
			if (auto const* Entry = Snapshot.GetAsnCatalog().Find(Record.Asn->Number))
			{
				Record.Asn->Info = Entry->Name;
				Record.Asn->NetworkType = Entry->Type;
			}
		}
	}

	if (!Record.Asn)
	{
		Record.Span = FindReservedBlock(Address);
	}

	auto CityMatch = Snapshot.GetCityTable().LongestPrefixMatch(Address);
	if (CityMatch && CityMatch->Placement)
	{
		Record.Placement = std::move(CityMatch->Placement);
		MergeRegion(Address, Snapshot.GetRegionTable(), *Record.Placement);
	}

	// The catalog type applies whichever placement won, unless the region record named its own
	if (Record.Placement && !Record.Placement->Category && Record.Asn)
	{
		Record.Placement->Category = Record.Asn->NetworkType;
	}
	return Record;
}
