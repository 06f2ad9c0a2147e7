/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AsnCatalog.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

#include "GeoError.hpp"
#include "Json.hpp"

namespace
{
	// Network type used when the catalog lists an operator with an empty type
	constexpr char const* OtherNetworkType = "其他网络";
} // namespace

WAsnCatalog WAsnCatalog::Load(std::filesystem::path const& Path)
{
	if (!std::filesystem::exists(Path))
	{
		spdlog::info("No ASN catalog at {}, operator names fall back to the ASN table", Path.string());
		return {};
	}

	std::ifstream File(Path);
	if (!File)
	{
		throw WDatabaseLoadError("asn-catalog", "cannot read " + Path.string());
	}
	std::stringstream Buffer;
	Buffer << File.rdbuf();

	return Parse(Buffer.str(), Path.string());
}

WAsnCatalog WAsnCatalog::Parse(std::string const& Contents, std::string const& Source)
{
	std::string Err;
	auto const  Json = WJson::parse(Contents, Err);
	if (!Err.empty())
	{
		throw WDatabaseLoadError("asn-catalog", Source + " is malformed JSON: " + Err);
	}
	if (!Json.is_object())
	{
		throw WDatabaseLoadError("asn-catalog", Source + " top level value is not an object");
	}

	WAsnCatalog Catalog{};
	auto const& AsnInfo = Json[JSON_KEY_ASN_INFO];
	if (!AsnInfo.is_object())
	{
		// {} is what a fresh install ships with
		return Catalog;
	}

	for (auto const& [Key, Value] : AsnInfo.object_items())
	{
		WAsn       Asn{};
		auto const Result = std::from_chars(Key.data(), Key.data() + Key.size(), Asn);
		if (Result.ec != std::errc() || Result.ptr != Key.data() + Key.size())
		{
			spdlog::warn("Skipping ASN catalog entry with non-numeric key '{}'", Key);
			continue;
		}

		auto const& Name = Value[JSON_KEY_NAME];
		if (!Name.is_string() || Name.string_value().empty())
		{
			spdlog::warn("Skipping ASN catalog entry AS{} without a name", Asn);
			continue;
		}

		WAsnCatalogEntry Entry{};
		Entry.Name = Name.string_value();
		if (auto const& Type = Value[JSON_KEY_TYPE]; Type.is_string())
		{
			Entry.Type = Type.string_value().empty() ? OtherNetworkType : Type.string_value();
		}
		Catalog.Entries.emplace(Asn, std::move(Entry));
	}
	return Catalog;
}

WAsnCatalogEntry const* WAsnCatalog::Find(WAsn Asn) const
{
	auto It = Entries.find(Asn);
	if (It == Entries.end())
	{
		return nullptr;
	}
	return &It->second;
}
