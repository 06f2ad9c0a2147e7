/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>

#include "Singleton.hpp"
#include "Communication/GeoService.hpp"
#include "Communication/HttpServer.hpp"
#include "Geo/SnapshotManager.hpp"

class WDaemon : public TSingleton<WDaemon>
{
	WSnapshotManager SnapshotManager;

	std::unique_ptr<WGeoService> GeoService{};
	std::unique_ptr<WHttpServer> HttpServer{};

	WMsec LastReloadCheck{};

	void OnSnapshotPublished(WSnapshotPtr const& Snapshot);

	// SIGHUP or changed files on disk
	void CheckReload();

public:
	WDaemon();

	// Loads the first snapshot, a failure here is fatal
	bool InitDatabases();
	bool InitServer();

	void RunLoop();
};
