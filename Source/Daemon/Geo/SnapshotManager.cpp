/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SnapshotManager.hpp"

#include <spdlog/spdlog.h>

#include "GeoError.hpp"

WSnapshotManager::WSnapshotManager(FSnapshotLoader Loader_) : Loader(std::move(Loader_)) {}

void WSnapshotManager::Publish(std::shared_ptr<WDatabaseSnapshot> NewSnapshot)
{
	NewSnapshot->SetGeneration(NextGeneration++);
	WSnapshotPtr Published = std::move(NewSnapshot);
	Snapshot.store(Published, std::memory_order_release);

	Published->LogSummary();
	OnSnapshotPublished(Published);
}

void WSnapshotManager::LoadInitial(WDatabasePaths const& Paths)
{
	std::lock_guard Lock(ReloadMutex);
	auto            NewSnapshot = Loader(Paths);
	if (!NewSnapshot)
	{
		throw WGeoError(EGeoError::DatabaseUnavailable, "snapshot loader returned nothing");
	}
	Publish(std::move(NewSnapshot));
}

bool WSnapshotManager::Reload(WDatabasePaths const& Paths)
{
	std::lock_guard Lock(ReloadMutex);

	std::shared_ptr<WDatabaseSnapshot> NewSnapshot;
	try
	{
		NewSnapshot = Loader(Paths);
	}
	catch (WDatabaseLoadError const& Error)
	{
		spdlog::error("Database reload failed, keeping snapshot #{}: {}",
			Current() ? Current()->GetGeneration() : 0, Error.what());
		return false;
	}
	catch (std::exception const& Error)
	{
		spdlog::error("Unexpected error during database reload: {}", Error.what());
		return false;
	}

	if (!NewSnapshot)
	{
		spdlog::error("Database reload produced no snapshot");
		return false;
	}

	Publish(std::move(NewSnapshot));
	return true;
}

bool WSnapshotManager::HasChangedOnDisk(WDatabasePaths const& Paths) const
{
	auto const Live = Current();
	if (!Live)
	{
		return true;
	}
	return WDatabaseSnapshot::ReadStamps(Paths) != Live->GetStamps();
}
