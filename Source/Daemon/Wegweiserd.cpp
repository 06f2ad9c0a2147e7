/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Daemon.hpp"
#include "DaemonConfig.hpp"

#include <cstdlib>
#include <spdlog/spdlog.h>

#include "SignalHandler.hpp"

int main()
{
	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	auto const& Config = WDaemonConfig::GetInstance();
	auto const  Level = spdlog::level::from_str(Config.LogLevel);
	if (Level == spdlog::level::off && Config.LogLevel != "off")
	{
		spdlog::warn("Unknown log level '{}', using info", Config.LogLevel);
	}
	else
	{
		spdlog::set_level(Level);
	}

	spdlog::info("Wegweiser daemon starting");
	Config.LogConfig();

	// Installs the SIGINT/SIGTERM/SIGHUP handlers
	WSignalHandler::GetInstance();

	if (!WDaemon::GetInstance().InitDatabases())
	{
		return EXIT_FAILURE;
	}

	if (!WDaemon::GetInstance().InitServer())
	{
		return EXIT_FAILURE;
	}

	if (!Config.DropPrivileges())
	{
		spdlog::error("Failed to drop privileges");
		return EXIT_FAILURE;
	}

	WDaemon::GetInstance().RunLoop();
	spdlog::info("Wegweiser daemon stopped");
	return EXIT_SUCCESS;
}
