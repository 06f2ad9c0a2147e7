/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <sigslot/signal.hpp>

#include "DatabaseSnapshot.hpp"

// Owns the live snapshot. Readers take a reference with Current() and keep it for the whole request,
// reloads build a new snapshot off to the side and swap it in with one atomic store.
class WSnapshotManager
{
public:
	using FSnapshotLoader = std::function<std::shared_ptr<WDatabaseSnapshot>(WDatabasePaths const&)>;

private:
	std::atomic<WSnapshotPtr> Snapshot{};

	// Orders reloads, never taken by readers
	std::mutex ReloadMutex;

	WSnapshotGeneration NextGeneration{ 1 };

	FSnapshotLoader Loader;

	void Publish(std::shared_ptr<WDatabaseSnapshot> NewSnapshot);

public:
	explicit WSnapshotManager(FSnapshotLoader Loader_ = &WDatabaseSnapshot::Load);

	// Fired on the reloading thread after a new snapshot became current
	sigslot::signal<WSnapshotPtr const&> OnSnapshotPublished;

	// Startup load, throws WDatabaseLoadError
	void LoadInitial(WDatabasePaths const& Paths);

	// Returns false and keeps serving the previous snapshot if the new one fails to load
	bool Reload(WDatabasePaths const& Paths);

	[[nodiscard]] WSnapshotPtr Current() const { return Snapshot.load(std::memory_order_acquire); }

	// True if a file Paths points to differs from what the current snapshot was built from
	[[nodiscard]] bool HasChangedOnDisk(WDatabasePaths const& Paths) const;
};
