/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "Singleton.hpp"
#include "Geo/DatabaseSnapshot.hpp"

struct WDaemonConfig final : TSingleton<WDaemonConfig>
{
	// [database]
	std::string              DatabaseDirectory{ "data" };
	std::string              AsnFile{ "GeoLite2-ASN.mmdb" }; // a .tsv selects the ip2asn backend
	std::string              CityFile{ "GeoLite2-City.mmdb" };
	std::string              RegionFile{ "GeoCN.mmdb" };
	std::string              RegionCountry{ "CN" };
	std::string              AsnCatalogFile{ "asn_info.json" };
	std::vector<std::string> Languages{ "zh-CN", "en" };
	int64_t                  ReloadCheckIntervalSec{ 60 }; // 0 disables the periodic check

	// [server]
	std::string ListenAddress{ "0.0.0.0" };
	int         Port{ 8080 };
	std::size_t WorkerThreads{ 0 }; // 0 = hardware concurrency
	bool        bTrustForwardedHeaders{ true };

	// [resolver]
	int64_t     ResolveTimeoutMs{ 3000 };
	std::size_t ResolveThreads{ 4 };

	// [log]
	std::string LogLevel{ "info" };

	// [daemon]
	std::string DaemonUser{}; // empty keeps the current user

	WDaemonConfig();

	void LogConfig() const;

	// Returns false if the file couldn't be parsed, values read so far are kept
	bool Load(std::string const& Path);

	// MMDB_PATH, WEGWEISER_LISTEN_ADDRESS, WEGWEISER_PORT, WEGWEISER_LOG_LEVEL
	void ApplyEnvironment();

	[[nodiscard]] WDatabasePaths GetDatabasePaths() const;

	bool DropPrivileges() const;

	// "zh-CN, en" -> { "zh-CN", "en" }
	static std::vector<std::string> ParseList(std::string const& Value);
};
