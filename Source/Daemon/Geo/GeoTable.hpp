/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>

#include "GeoTypes.hpp"

namespace EGeoTableKind
{
	enum Type : uint8_t
	{
		Asn,
		City,
		Region
	};
} // namespace EGeoTableKind

// A prefix table mapping address ranges to records. Implementations must be safe for concurrent
// const access, a snapshot shares one instance between all request threads.
class IGeoTable
{
public:
	virtual ~IGeoTable() = default;

	[[nodiscard]] virtual std::optional<WTableMatch> LongestPrefixMatch(WIPAddress const& Address) const = 0;

	[[nodiscard]] virtual EGeoTableKind::Type GetKind() const = 0;

	// Human readable description for logs, e.g. "GeoLite2-City (2026-10-14)"
	[[nodiscard]] virtual std::string Describe() const = 0;

	[[nodiscard]] virtual std::size_t GetSize() const { return 0; }
};

// Region tables only apply to addresses the global table places in CoveredCountry
class IRegionTable : public IGeoTable
{
public:
	[[nodiscard]] EGeoTableKind::Type GetKind() const override { return EGeoTableKind::Region; }

	[[nodiscard]] virtual std::string const& GetCoveredCountry() const = 0;
};
