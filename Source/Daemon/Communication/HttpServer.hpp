/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <libwebsockets.h>

#include "HttpMessage.hpp"
#include "Types.hpp"
#include "WorkerPool.hpp"

class WGeoService;

// Per connection data, allocated and zeroed by libwebsockets
struct WHttpSession
{
	WRequestId RequestId;
};

struct WHttpServerOptions
{
	std::string ListenAddress{ "0.0.0.0" };
	int         Port{ 8080 };
	std::size_t WorkerThreads{ 0 };
};

// Parses requests on the lws service thread, runs them on the worker pool and hands the response
// back to the service thread for writing
class WHttpServer
{
	struct WPendingRequest
	{
		lws*                         Wsi{ nullptr };
		std::string                  Path{};
		WMsec                        StartTime{};
		std::optional<WHttpResponse> Response{};
	};

	WGeoService const& Service;
	WHttpServerOptions Options;

	lws_context*      Context{ nullptr };
	std::thread       ListenThread;
	std::atomic<bool> bRunning{ false };

	std::unique_ptr<WWorkerPool> Pool;

	std::atomic<WRequestId>                          NextRequestId{ 1 };
	std::mutex                                       PendingMutex;
	std::unordered_map<WRequestId, WPendingRequest>  PendingRequests;
	std::vector<WRequestId>                          CompletedRequests;

	void ListenThreadFunction() const;

	void CompleteRequest(WRequestId RequestId, WHttpResponse Response);

public:
	WHttpServer(WGeoService const& Service_, WHttpServerOptions Options_);
	~WHttpServer();

	WHttpServer(WHttpServer const&) = delete;
	WHttpServer& operator=(WHttpServer const&) = delete;

	// Value of the first host= argument, later ones are ignored
	[[nodiscard]] static std::optional<std::string> FindHostArgument(std::vector<std::string> const& Arguments);

	bool StartListenThread();
	void Stop();

	// Called from the lws callback on the service thread
	int  HandleRequest(lws* Wsi, WHttpSession* Session, char const* Path);
	int  HandleWritable(lws* Wsi, WHttpSession* Session);
	void HandleClosed(WHttpSession* Session);
	void HandleWaitCancelled();
};
