/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "MaxMindDB.hpp"

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"
#include "GeoError.hpp"

WMaxMindDB::WMaxMindDB(std::filesystem::path Path_, std::string TableName_, std::string_view ExpectedType)
	: Path(std::move(Path_))
	, TableName(std::move(TableName_))
{
	if (!std::filesystem::exists(Path))
	{
		throw WDatabaseLoadError(TableName, "database not found at " + Path.string());
	}

	int const Status = MMDB_open(Path.c_str(), MMDB_MODE_MMAP, &Db);
	if (Status != MMDB_SUCCESS)
	{
		std::string Message = "cannot open " + Path.string() + ": " + MMDB_strerror(Status);
		if (Status == MMDB_IO_ERROR)
		{
			Message += " (" + WErrnoUtil::StrError() + ")";
		}
		throw WDatabaseLoadError(TableName, Message);
	}

	auto const DatabaseType = GetDatabaseType();
	if (!ExpectedType.empty() && DatabaseType.find(ExpectedType) == std::string::npos)
	{
		MMDB_close(&Db);
		throw WDatabaseLoadError(TableName,
			Path.string() + " has database_type '" + DatabaseType + "', expected a " + std::string(ExpectedType)
				+ " database");
	}

	spdlog::debug("Opened MMDB {} as {} table (type: {} version: {}.{})", Path.string(), TableName, DatabaseType,
		Db.metadata.binary_format_major_version, Db.metadata.binary_format_minor_version);
}

WMaxMindDB::~WMaxMindDB()
{
	MMDB_close(&Db);
}

std::optional<WMaxMindEntry> WMaxMindDB::Lookup(WIPAddress const& Address) const
{
	sockaddr_storage Storage{};
	Address.ToSockAddr(Storage);

	int  MmdbError = MMDB_SUCCESS;
	auto Result = MMDB_lookup_sockaddr(&Db, reinterpret_cast<sockaddr const*>(&Storage), &MmdbError);
	if (MmdbError != MMDB_SUCCESS)
	{
		// an IPv4-only database simply has no answer for IPv6 addresses
		if (MmdbError != MMDB_IPV6_LOOKUP_IN_IPV4_DATABASE_ERROR)
		{
			spdlog::warn("MMDB lookup of {} in {} failed: {}", Address.ToString(), TableName, MMDB_strerror(MmdbError));
		}
		return std::nullopt;
	}

	if (!Result.found_entry)
	{
		return std::nullopt;
	}

	WMaxMindEntry Entry{};
	Entry.Entry = Result.entry;

	Entry.PrefixLength = ToPrefixLength(Result.netmask, Address.Family, Db.metadata.ip_version);
	return Entry;
}

uint8_t WMaxMindDB::ToPrefixLength(unsigned Netmask, EIPFamily::Type Family, unsigned DatabaseIpVersion)
{
	// IPv4 addresses live under ::/96 in IPv6 databases and the netmask counts from the IPv6 root
	if (Family == EIPFamily::IPv4 && DatabaseIpVersion == 6)
	{
		Netmask = Netmask >= 96 ? Netmask - 96 : 0;
	}
	return static_cast<uint8_t>(std::min<unsigned>(Netmask, Family == EIPFamily::IPv4 ? 32 : 128));
}

bool WMaxMindDB::GetValue(WMaxMindEntry const& Entry, std::vector<char const*> Keys, MMDB_entry_data_s& OutData)
{
	Keys.push_back(nullptr);
	MMDB_entry_s Start = Entry.Entry;
	OutData = {};
	return MMDB_aget_value(&Start, &OutData, Keys.data()) == MMDB_SUCCESS && OutData.has_data;
}

std::optional<std::string> WMaxMindDB::GetString(WMaxMindEntry const& Entry, std::initializer_list<char const*> Keys)
{
	MMDB_entry_data_s Data{};
	if (!GetValue(Entry, Keys, Data) || Data.type != MMDB_DATA_TYPE_UTF8_STRING)
	{
		return std::nullopt;
	}
	return std::string(Data.utf8_string, Data.data_size);
}

std::optional<double> WMaxMindDB::GetDouble(WMaxMindEntry const& Entry, std::initializer_list<char const*> Keys)
{
	MMDB_entry_data_s Data{};
	if (!GetValue(Entry, Keys, Data))
	{
		return std::nullopt;
	}
	switch (Data.type)
	{
		case MMDB_DATA_TYPE_DOUBLE:
			return Data.double_value;
		case MMDB_DATA_TYPE_FLOAT:
			return static_cast<double>(Data.float_value);
		default:
			return std::nullopt;
	}
}

std::optional<uint32_t> WMaxMindDB::GetUInt32(WMaxMindEntry const& Entry, std::initializer_list<char const*> Keys)
{
	MMDB_entry_data_s Data{};
	if (!GetValue(Entry, Keys, Data))
	{
		return std::nullopt;
	}
	switch (Data.type)
	{
		case MMDB_DATA_TYPE_UINT16:
			return Data.uint16;
		case MMDB_DATA_TYPE_UINT32:
			return Data.uint32;
		default:
			return std::nullopt;
	}
}

std::optional<std::string> WMaxMindDB::GetLocalizedName(
	WMaxMindEntry const& Entry, std::initializer_list<char const*> Keys, std::vector<std::string> const& Languages)
{
	for (auto const& Language : Languages)
	{
		std::vector<char const*> Path(Keys);
		Path.push_back("names");
		Path.push_back(Language.c_str());

		MMDB_entry_data_s Data{};
		if (GetValue(Entry, Path, Data) && Data.type == MMDB_DATA_TYPE_UTF8_STRING && Data.data_size > 0)
		{
			return std::string(Data.utf8_string, Data.data_size);
		}
	}
	return std::nullopt;
}

std::string WMaxMindDB::GetDatabaseType() const
{
	return Db.metadata.database_type ? std::string(Db.metadata.database_type) : std::string();
}

std::string WMaxMindDB::GetBuildDate() const
{
	auto const Epoch = static_cast<std::time_t>(Db.metadata.build_epoch);
	std::tm    Tm{};
	gmtime_r(&Epoch, &Tm);
	char Buffer[32]{};
	std::strftime(Buffer, sizeof(Buffer), "%Y-%m-%d", &Tm);
	return Buffer;
}
