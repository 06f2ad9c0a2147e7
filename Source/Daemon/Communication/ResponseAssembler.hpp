/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <string_view>

#include "Json.hpp"
#include "Geo/GeoTypes.hpp"

class WResponseAssembler
{
public:
	// Flat record for single address queries, { host, ips } for hostnames
	[[nodiscard]] static WJson Assemble(WResolutionResult const& Result);

	// Every key is always present, absent values are null
	[[nodiscard]] static WJson AssembleRecord(WGeoRecord const& Record);

	[[nodiscard]] static WJson AssembleError(int Status, std::string_view Code, std::string const& Message);
};
