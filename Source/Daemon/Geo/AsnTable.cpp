/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AsnTable.hpp"

#include <spdlog/fmt/fmt.h>

#include "GeoError.hpp"

WMaxMindAsnTable::WMaxMindAsnTable(std::filesystem::path const& Path) : Db(Path, "asn", "ASN") {}

std::optional<WTableMatch> WMaxMindAsnTable::LongestPrefixMatch(WIPAddress const& Address) const
{
	auto Entry = Db.Lookup(Address);
	if (!Entry)
	{
		return std::nullopt;
	}

	auto Number = WMaxMindDB::GetUInt32(*Entry, { "autonomous_system_number" });
	if (!Number)
	{
		return std::nullopt;
	}

	WTableMatch Match{};
	Match.Span = WNetworkSpan::Make(Address, Entry->PrefixLength);
	Match.Asn = WAsnRecord{
		.Number = *Number,
		.Organization = WMaxMindDB::GetString(*Entry, { "autonomous_system_organization" }).value_or(""),
	};
	return Match;
}

WIP2AsnTable::WIP2AsnTable(std::filesystem::path const& Path) : Db(Path)
{
	if (!Db.Init())
	{
		throw WDatabaseLoadError("asn", "cannot load ip2asn TSV " + Path.string());
	}
}

std::optional<WTableMatch> WIP2AsnTable::LongestPrefixMatch(WIPAddress const& Address) const
{
	auto Result = Db.Lookup(Address);
	if (!Result)
	{
		return std::nullopt;
	}

	auto Span = WNetworkSpan::FromRange(Address, Result->RangeStart, Result->RangeEnd);
	if (!Span)
	{
		return std::nullopt;
	}

	WTableMatch Match{};
	Match.Span = *Span;
	Match.Asn = WAsnRecord{
		.Number = Result->ASN,
		.Organization = std::move(Result->Organization),
	};
	return Match;
}

std::string WIP2AsnTable::Describe() const
{
	return fmt::format("ip2asn TSV ({} ranges, {} KiB)", Db.GetSize(), Db.MemoryUsage() / 1024);
}
