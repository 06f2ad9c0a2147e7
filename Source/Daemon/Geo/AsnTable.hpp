/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <filesystem>

#include "GeoTable.hpp"
#include "MaxMindDB.hpp"
#include "IP2Asn/IP2AsnDB.hpp"

// GeoLite2-ASN style .mmdb
class WMaxMindAsnTable final : public IGeoTable
{
	WMaxMindDB Db;

public:
	explicit WMaxMindAsnTable(std::filesystem::path const& Path);

	[[nodiscard]] std::optional<WTableMatch> LongestPrefixMatch(WIPAddress const& Address) const override;

	[[nodiscard]] EGeoTableKind::Type GetKind() const override { return EGeoTableKind::Asn; }

	[[nodiscard]] std::string Describe() const override { return Db.Describe(); }

	[[nodiscard]] std::size_t GetSize() const override { return Db.GetNodeCount(); }
};

// iptoasn.com ip2asn-combined.tsv
class WIP2AsnTable final : public IGeoTable
{
	WIP2AsnDB Db;

public:
	// Throws WDatabaseLoadError if the TSV can't be mapped or holds no usable range
	explicit WIP2AsnTable(std::filesystem::path const& Path);

	[[nodiscard]] std::optional<WTableMatch> LongestPrefixMatch(WIPAddress const& Address) const override;

	[[nodiscard]] EGeoTableKind::Type GetKind() const override { return EGeoTableKind::Asn; }

	[[nodiscard]] std::string Describe() const override;

	[[nodiscard]] std::size_t GetSize() const override { return Db.GetSize(); }
};
