/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <maxminddb.h>

#include "IPAddress.hpp"

struct WMaxMindEntry
{
	MMDB_entry_s Entry{};

	// Prefix length of the matched network, relative to the looked up address' family
	uint8_t PrefixLength{};
};

// Owns one memory mapped .mmdb file. Lookups are const and safe from any thread.
class WMaxMindDB
{
	MMDB_s                Db{};
	std::filesystem::path Path;
	std::string           TableName;

	[[nodiscard]] static bool GetValue(
		WMaxMindEntry const& Entry, std::vector<char const*> Keys, MMDB_entry_data_s& OutData);

public:
	// Throws WDatabaseLoadError naming TableName if the file can't be opened or its database_type
	// doesn't contain ExpectedType (an empty ExpectedType skips that check)
	WMaxMindDB(std::filesystem::path Path_, std::string TableName_, std::string_view ExpectedType);
	~WMaxMindDB();

	WMaxMindDB(WMaxMindDB const&) = delete;
	WMaxMindDB& operator=(WMaxMindDB const&) = delete;

	[[nodiscard]] std::optional<WMaxMindEntry> Lookup(WIPAddress const& Address) const;

	// Converts the netmask libmaxminddb reports into a prefix length for Family
	[[nodiscard]] static uint8_t ToPrefixLength(unsigned Netmask, EIPFamily::Type Family, unsigned DatabaseIpVersion);

	[[nodiscard]] static std::optional<std::string> GetString(
		WMaxMindEntry const& Entry, std::initializer_list<char const*> Keys);
	[[nodiscard]] static std::optional<double>   GetDouble(WMaxMindEntry const& Entry, std::initializer_list<char const*> Keys);
	[[nodiscard]] static std::optional<uint32_t> GetUInt32(WMaxMindEntry const& Entry, std::initializer_list<char const*> Keys);

	// Looks up <Keys...>/names/<Language> for each language in order, returns the first hit
	[[nodiscard]] static std::optional<std::string> GetLocalizedName(WMaxMindEntry const& Entry,
		std::initializer_list<char const*> Keys, std::vector<std::string> const& Languages);

	[[nodiscard]] std::string GetDatabaseType() const;
	[[nodiscard]] std::string GetBuildDate() const;
	[[nodiscard]] std::size_t GetNodeCount() const { return Db.metadata.node_count; }
	[[nodiscard]] std::string Describe() const { return GetDatabaseType() + " (" + GetBuildDate() + ")"; }
};
