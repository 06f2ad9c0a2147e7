/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DaemonConfig.hpp"

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <pwd.h>
#include <unistd.h>
#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

namespace
{
	std::string Join(std::vector<std::string> const& Values)
	{
		std::string Result;
		for (auto const& Value : Values)
		{
			if (!Result.empty())
			{
				Result += ",";
			}
			Result += Value;
		}
		return Result;
	}
} // namespace

WDaemonConfig::WDaemonConfig()
{
	if (std::filesystem::exists("./wegweiserd.ini"))
	{
		Load("./wegweiserd.ini");
	}
	else if (std::filesystem::exists("/etc/wegweiser/wegweiserd.ini"))
	{
		Load("/etc/wegweiser/wegweiserd.ini");
	}
	else
	{
		spdlog::info("no configuration file found, using defaults");
	}
	ApplyEnvironment();
}

void WDaemonConfig::LogConfig() const
{
	spdlog::info("database directory={}", DatabaseDirectory);
	spdlog::info("asn file={} city file={} region file={} ({})", AsnFile, CityFile, RegionFile, RegionCountry);
	spdlog::info("asn catalog={}", AsnCatalogFile);
	spdlog::info("languages={}", Join(Languages));
	spdlog::info("reload check interval={}s", ReloadCheckIntervalSec);
	spdlog::info("listen={}:{} workers={}", ListenAddress, Port, WorkerThreads == 0 ? std::string("auto") : std::to_string(WorkerThreads));
	spdlog::info("trust forwarded headers={}", bTrustForwardedHeaders);
	spdlog::info("resolver timeout={}ms threads={}", ResolveTimeoutMs, ResolveThreads);
}

bool WDaemonConfig::Load(std::string const& Path)
{
	INIReader Reader(Path);

	auto SafeGet = [&](std::string const& Section, std::string const& Name, std::string& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = Reader.Get(Section, Name, OutVal);
		}
	};

	if (Reader.ParseError() < 0)
	{
		spdlog::error("can't load '{}': {}", Path, Reader.ParseErrorMessage());
		return false;
	}
	if (Reader.ParseError() > 0)
	{
		spdlog::error("can't load '{}': syntax error on line {}", Path, Reader.ParseError());
		return false;
	}

	SafeGet("database", "directory", DatabaseDirectory);
	SafeGet("database", "asn_file", AsnFile);
	SafeGet("database", "city_file", CityFile);
	SafeGet("database", "region_file", RegionFile);
	SafeGet("database", "region_country", RegionCountry);
	SafeGet("database", "asn_catalog_file", AsnCatalogFile);
	if (Reader.HasValue("database", "languages"))
	{
		auto Parsed = ParseList(Reader.Get("database", "languages", ""));
		if (!Parsed.empty())
		{
			Languages = std::move(Parsed);
		}
	}
	ReloadCheckIntervalSec = Reader.GetInteger("database", "reload_check_interval", ReloadCheckIntervalSec);

	SafeGet("server", "listen_address", ListenAddress);
	Port = static_cast<int>(Reader.GetInteger("server", "port", Port));
	auto const Workers = Reader.GetInteger("server", "worker_threads", static_cast<long>(WorkerThreads));
	WorkerThreads = Workers > 0 ? static_cast<std::size_t>(Workers) : 0;
	bTrustForwardedHeaders = Reader.GetBoolean("server", "trust_forwarded_headers", bTrustForwardedHeaders);

	ResolveTimeoutMs = Reader.GetInteger("resolver", "timeout_ms", ResolveTimeoutMs);
	auto const ResolverThreads = Reader.GetInteger("resolver", "threads", static_cast<long>(ResolveThreads));

	SafeGet("log", "level", LogLevel);

	SafeGet("daemon", "user", DaemonUser);

	if (Port <= 0 || Port > 65535)
	{
		spdlog::warn("invalid port {} in '{}', using 8080", Port, Path);
		Port = 8080;
	}
	if (ResolveTimeoutMs <= 0)
	{
		spdlog::warn("invalid resolver timeout {} in '{}', using 3000ms", ResolveTimeoutMs, Path);
		ResolveTimeoutMs = 3000;
	}
	if (ResolverThreads <= 0)
	{
		spdlog::warn("invalid resolver thread count {} in '{}', using 4", ResolverThreads, Path);
		ResolveThreads = 4;
	}
	else
	{
		ResolveThreads = static_cast<std::size_t>(ResolverThreads);
	}
	return true;
}

void WDaemonConfig::ApplyEnvironment()
{
	if (char const* Value = std::getenv("MMDB_PATH"); Value && *Value)
	{
		DatabaseDirectory = Value;
	}
	if (char const* Value = std::getenv("WEGWEISER_LISTEN_ADDRESS"); Value && *Value)
	{
		ListenAddress = Value;
	}
	if (char const* Value = std::getenv("WEGWEISER_PORT"); Value && *Value)
	{
		try
		{
			auto const Parsed = std::stoi(Value);
			if (Parsed > 0 && Parsed <= 65535)
			{
				Port = Parsed;
			}
			else
			{
				spdlog::warn("WEGWEISER_PORT={} is out of range, keeping {}", Value, Port);
			}
		}
		catch (std::exception const&)
		{
			spdlog::warn("Failed to parse WEGWEISER_PORT={}, keeping {}", Value, Port);
		}
	}
	if (char const* Value = std::getenv("WEGWEISER_LOG_LEVEL"); Value && *Value)
	{
		LogLevel = Value;
	}
}

WDatabasePaths WDaemonConfig::GetDatabasePaths() const
{
	std::filesystem::path const Directory(DatabaseDirectory);

	WDatabasePaths Paths{};
	Paths.AsnFile = Directory / AsnFile;
	Paths.CityFile = Directory / CityFile;
	Paths.RegionFile = Directory / RegionFile;
	Paths.AsnCatalogFile = Directory / AsnCatalogFile;
	Paths.RegionCountry = RegionCountry;
	Paths.Languages = Languages;
	return Paths;
}

std::vector<std::string> WDaemonConfig::ParseList(std::string const& Value)
{
	std::vector<std::string> Result;
	std::stringstream        Stream(Value);
	std::string              Item;
	while (std::getline(Stream, Item, ','))
	{
		auto const First = Item.find_first_not_of(" \t");
		if (First == std::string::npos)
		{
			continue;
		}
		auto const Last = Item.find_last_not_of(" \t");
		Result.push_back(Item.substr(First, Last - First + 1));
	}
	return Result;
}

bool WDaemonConfig::DropPrivileges() const
{
	if (DaemonUser.empty() || geteuid() != 0)
	{
		return true;
	}

	passwd* PW = getpwnam(DaemonUser.c_str());
	if (!PW)
	{
		spdlog::critical("User {} not found", DaemonUser);
		return false;
	}

	if (setgid(PW->pw_gid) != 0 || setuid(PW->pw_uid) != 0)
	{
		spdlog::critical("Failed to drop privileges: {}", WErrnoUtil::StrError());
		return false;
	}

	spdlog::info("Dropped privileges to {}", DaemonUser);
	return true;
}
