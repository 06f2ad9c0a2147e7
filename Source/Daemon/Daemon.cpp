//
// Created by usr on 19/11/2025.
//

#include "Daemon.hpp"

#include <functional>
#include <thread>
#include <spdlog/spdlog.h>

#include "DaemonConfig.hpp"
#include "SignalHandler.hpp"
#include "Time.hpp"
#include "Geo/GeoError.hpp"

WDaemon::WDaemon()
{
	SnapshotManager.OnSnapshotPublished.connect(std::bind(&WDaemon::OnSnapshotPublished, this, std::placeholders::_1));
}

void WDaemon::OnSnapshotPublished(WSnapshotPtr const& Snapshot)
{
	spdlog::info("Serving database snapshot #{} loaded at {}", Snapshot->GetGeneration(), Snapshot->GetLoadTime());
}

bool WDaemon::InitDatabases()
{
	auto const Paths = WDaemonConfig::GetInstance().GetDatabasePaths();
	try
	{
		SnapshotManager.LoadInitial(Paths);
	}
	catch (WGeoError const& Error)
	{
		spdlog::critical("Failed to load databases: {}", Error.what());
		return false;
	}
	LastReloadCheck = WTime::GetSteadyMs();
	return true;
}

bool WDaemon::InitServer()
{
	auto const& Cfg = WDaemonConfig::GetInstance();

	WResolver Resolver(
		std::make_shared<WSystemHostLookup>(), std::chrono::milliseconds(Cfg.ResolveTimeoutMs), Cfg.ResolveThreads);
	GeoService = std::make_unique<WGeoService>(SnapshotManager, std::move(Resolver), Cfg.bTrustForwardedHeaders);

	WHttpServerOptions Options{};
	Options.ListenAddress = Cfg.ListenAddress;
	Options.Port = Cfg.Port;
	Options.WorkerThreads = Cfg.WorkerThreads;
	HttpServer = std::make_unique<WHttpServer>(*GeoService, Options);

	if (!HttpServer->StartListenThread())
	{
		spdlog::error("Failed to start HTTP server on {}:{}", Cfg.ListenAddress, Cfg.Port);
		return false;
	}
	return true;
}

void WDaemon::CheckReload()
{
	auto const& Cfg = WDaemonConfig::GetInstance();

	if (WSignalHandler::GetInstance().bReloadRequested.exchange(false))
	{
		spdlog::info("Reload requested");
		SnapshotManager.Reload(Cfg.GetDatabasePaths());
		LastReloadCheck = WTime::GetSteadyMs();
		return;
	}

	if (Cfg.ReloadCheckIntervalSec <= 0)
	{
		return;
	}

	auto const Now = WTime::GetSteadyMs();
	if (Now - LastReloadCheck < Cfg.ReloadCheckIntervalSec * 1000)
	{
		return;
	}
	LastReloadCheck = Now;

	auto const Paths = Cfg.GetDatabasePaths();
	if (SnapshotManager.HasChangedOnDisk(Paths))
	{
		spdlog::info("Database files changed on disk, reloading");
		SnapshotManager.Reload(Paths);
	}
}

void WDaemon::RunLoop()
{
	WSignalHandler& SignalHandler = WSignalHandler::GetInstance();

	while (!SignalHandler.bStop)
	{
		CheckReload();
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}

	spdlog::info("Shutting down");
	if (HttpServer)
	{
		HttpServer->Stop();
	}
	if (GeoService)
	{
		GeoService->Stop();
	}
}
