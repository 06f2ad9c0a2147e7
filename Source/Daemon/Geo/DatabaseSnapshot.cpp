/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DatabaseSnapshot.hpp"

#include <system_error>
#include <spdlog/spdlog.h>

#include "AsnTable.hpp"
#include "CityTable.hpp"
#include "GeoError.hpp"
#include "RegionTable.hpp"
#include "Time.hpp"

WFileStamp WFileStamp::Read(std::filesystem::path const& Path)
{
	WFileStamp      Stamp{};
	std::error_code Ec;
	Stamp.Path = Path;

	auto const MTime = std::filesystem::last_write_time(Path, Ec);
	if (Ec)
	{
		return Stamp;
	}
	auto const Size = std::filesystem::file_size(Path, Ec);
	if (Ec)
	{
		return Stamp;
	}
	Stamp.MTime = MTime;
	Stamp.Size = Size;
	return Stamp;
}

WDatabaseSnapshot::WDatabaseSnapshot(std::unique_ptr<IGeoTable const> AsnTable_,
	std::unique_ptr<IGeoTable const> CityTable_, std::unique_ptr<IRegionTable const> RegionTable_,
	WAsnCatalog AsnCatalog_, std::vector<WFileStamp> Stamps_)
	: AsnTable(std::move(AsnTable_))
	, CityTable(std::move(CityTable_))
	, RegionTable(std::move(RegionTable_))
	, AsnCatalog(std::move(AsnCatalog_))
	, LoadTime(WTime::GetEpochMs())
	, Stamps(std::move(Stamps_))
{
	if (!AsnTable || !CityTable || !RegionTable)
	{
		throw WGeoError(EGeoError::DatabaseUnavailable, "snapshot is missing a table");
	}
}

std::vector<WFileStamp> WDatabaseSnapshot::ReadStamps(WDatabasePaths const& Paths)
{
	return {
		WFileStamp::Read(Paths.AsnFile),
		WFileStamp::Read(Paths.CityFile),
		WFileStamp::Read(Paths.RegionFile),
		WFileStamp::Read(Paths.AsnCatalogFile),
	};
}

std::shared_ptr<WDatabaseSnapshot> WDatabaseSnapshot::Load(WDatabasePaths const& Paths)
{
	auto const StartTime = WTime::GetSteadyMs();

	// Stamped before opening so a file replaced mid-load is picked up by the next change check
	auto Stamps = ReadStamps(Paths);

	std::unique_ptr<IGeoTable const> AsnTable;
	if (Paths.AsnFile.extension() == ".tsv")
	{
		AsnTable = std::make_unique<WIP2AsnTable>(Paths.AsnFile);
	}
	else
	{
		AsnTable = std::make_unique<WMaxMindAsnTable>(Paths.AsnFile);
	}

	auto CityTable = std::make_unique<WMaxMindCityTable>(Paths.CityFile, Paths.Languages, Paths.RegionCountry);
	auto RegionTable = std::make_unique<WMaxMindRegionTable>(Paths.RegionFile, Paths.RegionCountry);
	auto AsnCatalog = WAsnCatalog::Load(Paths.AsnCatalogFile);

	auto Snapshot = std::make_shared<WDatabaseSnapshot>(
		std::move(AsnTable), std::move(CityTable), std::move(RegionTable), std::move(AsnCatalog), std::move(Stamps));

	spdlog::debug("Loaded database snapshot in {}", WTime::FormatDuration(WTime::GetSteadyMs() - StartTime));
	return Snapshot;
}

void WDatabaseSnapshot::LogSummary() const
{
	spdlog::info("Database snapshot #{}:", Generation);
	spdlog::info("  asn:    {}", AsnTable->Describe());
	spdlog::info("  city:   {}", CityTable->Describe());
	spdlog::info("  region: {} (covers {})", RegionTable->Describe(), RegionTable->GetCoveredCountry());
	spdlog::info("  asn catalog: {} entries", AsnCatalog.GetSize());
}
