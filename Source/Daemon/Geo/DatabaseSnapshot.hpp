/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "AsnCatalog.hpp"
#include "GeoTable.hpp"
#include "Types.hpp"

// Everything a snapshot is built from
struct WDatabasePaths
{
	std::filesystem::path AsnFile{};
	std::filesystem::path CityFile{};
	std::filesystem::path RegionFile{};
	std::filesystem::path AsnCatalogFile{};

	std::string              RegionCountry{ "CN" };
	std::vector<std::string> Languages{ "zh-CN", "en" };
};

struct WFileStamp
{
	std::filesystem::path Path{};

	// Both unset if the file didn't exist
	std::optional<std::filesystem::file_time_type> MTime{};
	std::optional<std::uintmax_t>                  Size{};

	static WFileStamp Read(std::filesystem::path const& Path);
};

inline bool operator==(WFileStamp const& Lhs, WFileStamp const& Rhs)
{
	return Lhs.Path == Rhs.Path && Lhs.MTime == Rhs.MTime && Lhs.Size == Rhs.Size;
}

class WDatabaseSnapshot;
using WSnapshotPtr = std::shared_ptr<WDatabaseSnapshot const>;

// Immutable bundle of tables. Shared between requests, freed once the last lookup drops it.
class WDatabaseSnapshot
{
	std::unique_ptr<IGeoTable const>    AsnTable;
	std::unique_ptr<IGeoTable const>    CityTable;
	std::unique_ptr<IRegionTable const> RegionTable;
	WAsnCatalog                         AsnCatalog;

	WMsec               LoadTime{};
	WSnapshotGeneration Generation{};

	std::vector<WFileStamp> Stamps;

public:
	WDatabaseSnapshot(std::unique_ptr<IGeoTable const> AsnTable_, std::unique_ptr<IGeoTable const> CityTable_,
		std::unique_ptr<IRegionTable const> RegionTable_, WAsnCatalog AsnCatalog_,
		std::vector<WFileStamp> Stamps_ = {});

	// Opens and validates every table, throws WDatabaseLoadError naming the first one that failed
	static std::shared_ptr<WDatabaseSnapshot> Load(WDatabasePaths const& Paths);

	// Stamps of the files Paths points to right now, in the order Load records them
	static std::vector<WFileStamp> ReadStamps(WDatabasePaths const& Paths);

	[[nodiscard]] IGeoTable const&    GetAsnTable() const { return *AsnTable; }
	[[nodiscard]] IGeoTable const&    GetCityTable() const { return *CityTable; }
	[[nodiscard]] IRegionTable const& GetRegionTable() const { return *RegionTable; }
	[[nodiscard]] WAsnCatalog const&  GetAsnCatalog() const { return AsnCatalog; }

	[[nodiscard]] WMsec                          GetLoadTime() const { return LoadTime; }
	[[nodiscard]] WSnapshotGeneration            GetGeneration() const { return Generation; }
	[[nodiscard]] std::vector<WFileStamp> const& GetStamps() const { return Stamps; }

	// Assigned by the snapshot manager before the snapshot becomes visible
	void SetGeneration(WSnapshotGeneration Generation_) { Generation = Generation_; }

	void LogSummary() const;
};
