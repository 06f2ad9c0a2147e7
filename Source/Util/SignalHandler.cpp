//
// Created by usr on 09/10/2025.
//

#include "SignalHandler.hpp"

#include <csignal>

static void OnSigint(int)
{
	WSignalHandler::GetInstance().bStop = true;
}

static void OnSighup(int)
{
	WSignalHandler::GetInstance().bReloadRequested = true;
}

WSignalHandler::WSignalHandler()
{
	signal(SIGINT, OnSigint);
	signal(SIGTERM, OnSigint);
	signal(SIGHUP, OnSighup);
	// a client hanging up mid-write must not take the daemon down
	signal(SIGPIPE, SIG_IGN);
}
