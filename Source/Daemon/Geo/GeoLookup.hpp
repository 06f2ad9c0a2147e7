/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include "DatabaseSnapshot.hpp"
#include "GeoTypes.hpp"

class WGeoLookup
{
public:
	// Merges the ASN, city and region tables of Snapshot into one record. A miss in any table is
	// not an error, the corresponding fields are simply absent.
	[[nodiscard]] static WGeoRecord Lookup(WIPAddress const& Address, WDatabaseSnapshot const& Snapshot);
};
