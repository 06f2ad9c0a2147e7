/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

#include "Types.hpp"

struct WAsnCatalogEntry
{
	std::string                Name{};
	std::optional<std::string> Type{};
};

// Localized operator names and network types keyed by ASN, read from asn_info.json
class WAsnCatalog
{
	std::unordered_map<WAsn, WAsnCatalogEntry> Entries;

public:
	// A missing file yields an empty catalog, malformed JSON throws WDatabaseLoadError ("asn-catalog")
	static WAsnCatalog Load(std::filesystem::path const& Path);

	static WAsnCatalog Parse(std::string const& Contents, std::string const& Source = "asn_info.json");

	[[nodiscard]] WAsnCatalogEntry const* Find(WAsn Asn) const;

	[[nodiscard]] std::size_t GetSize() const { return Entries.size(); }
};
