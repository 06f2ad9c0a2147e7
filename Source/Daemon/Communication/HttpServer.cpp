/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "HttpServer.hpp"

#include <algorithm>
#include <cstring>
#include <string_view>
#include <pthread.h>
#include <spdlog/spdlog.h>

#include "GeoService.hpp"
#include "ResponseAssembler.hpp"
#include "Time.hpp"

namespace
{
	// Seconds lws keeps a connection without a response before dropping it
	constexpr int PendingRequestTimeout = 30;

	// Headers lws has no token for
	constexpr char const* CustomHeaders[] = {
		"cf-connecting-ip",
		"fastly-client-ip",
		"x-azure-clientip",
		"x-akamai-client-ip",
		"true-client-ip",
		"x-cdn-src-ip",
		"x-real-ip",
		"forwarded",
	};

	std::optional<std::string> ReadCustomHeader(lws* Wsi, char const* Name)
	{
		std::string const Key = std::string(Name) + ":";
		int const         Length = lws_hdr_custom_length(Wsi, Key.c_str(), static_cast<int>(Key.size()));
		if (Length <= 0)
		{
			return std::nullopt;
		}

		std::string Value(static_cast<size_t>(Length) + 1, '\0');
		int const   Copied = lws_hdr_custom_copy(
			Wsi, Value.data(), static_cast<int>(Value.size()), Key.c_str(), static_cast<int>(Key.size()));
		if (Copied < 0)
		{
			return std::nullopt;
		}
		Value.resize(static_cast<size_t>(Copied));
		return Value;
	}

	std::optional<std::string> ReadHeader(lws* Wsi, lws_token_indexes Token)
	{
		int const Length = lws_hdr_total_length(Wsi, Token);
		if (Length <= 0)
		{
			return std::nullopt;
		}

		std::string Value(static_cast<size_t>(Length) + 1, '\0');
		int const   Copied = lws_hdr_copy(Wsi, Value.data(), static_cast<int>(Value.size()), Token);
		if (Copied < 0)
		{
			return std::nullopt;
		}
		Value.resize(static_cast<size_t>(Copied));
		return Value;
	}

	// Every query argument, lws has already URL decoded each one
	std::vector<std::string> ReadQueryArguments(lws* Wsi)
	{
		std::vector<std::string> Arguments;
		for (int Index = 0;; ++Index)
		{
			// 0 for both a missing and an empty fragment, the copy tells them apart
			int const   Length = lws_hdr_fragment_length(Wsi, WSI_TOKEN_HTTP_URI_ARGS, Index);
			std::string Argument(static_cast<size_t>(std::max(Length, 0)) + 1, '\0');
			int const   Copied = lws_hdr_copy_fragment(
				Wsi, Argument.data(), static_cast<int>(Argument.size()), WSI_TOKEN_HTTP_URI_ARGS, Index);
			if (Copied < 0)
			{
				break;
			}
			Argument.resize(static_cast<size_t>(Copied));
			Arguments.push_back(std::move(Argument));
		}
		return Arguments;
	}

	std::string ReadMethod(lws* Wsi)
	{
		if (lws_hdr_total_length(Wsi, WSI_TOKEN_GET_URI) > 0)
		{
			return "GET";
		}
		if (lws_hdr_total_length(Wsi, WSI_TOKEN_POST_URI) > 0)
		{
			return "POST";
		}
		return "OTHER";
	}

	WIPAddress ReadPeerAddress(lws* Wsi)
	{
		char        Buffer[INET6_ADDRSTRLEN + 8]{};
		char const* Peer = lws_get_peer_simple(Wsi, Buffer, sizeof(Buffer));
		if (!Peer)
		{
			return {};
		}
		return WIPAddress::FromString(Peer).value_or(WIPAddress{});
	}
} // namespace

void LwsLogCallback(int Level, char const* Line)
{
	std::string Msg(Line);
	while (!Msg.empty() && (Msg.back() == '\n' || Msg.back() == '\r'))
	{
		Msg.pop_back();
	}

	// Strip libwebsockets timestamp prefix (format: [YYYY/MM/DD HH:MM:SS:FFFF] )
	if (Msg.size() > 30 && Msg.front() == '[')
	{
		Msg = Msg.substr(30);
	}

	switch (Level)
	{
		case LLL_ERR:
			spdlog::error("lws: {}", Msg);
			break;
		case LLL_WARN:
			spdlog::warn("lws: {}", Msg);
			break;
		case LLL_NOTICE:
		case LLL_INFO:
			spdlog::info("lws: {}", Msg);
			break;
		default:
			spdlog::debug("lws: {}", Msg);
			break;
	}
}

int HttpCallback(lws* Wsi, lws_callback_reasons Reason, void* User, void* In, size_t Len)
{
	auto* Server = static_cast<WHttpServer*>(lws_context_user(lws_get_context(Wsi)));
	auto* Session = static_cast<WHttpSession*>(User);

	if (!Server)
	{
		return lws_callback_http_dummy(Wsi, Reason, User, In, Len);
	}

	switch (Reason)
	{
		case LWS_CALLBACK_HTTP:
			return Server->HandleRequest(Wsi, Session, static_cast<char const*>(In));

		case LWS_CALLBACK_HTTP_WRITEABLE:
			return Server->HandleWritable(Wsi, Session);

		case LWS_CALLBACK_CLOSED_HTTP:
			Server->HandleClosed(Session);
			break;

		case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
			Server->HandleWaitCancelled();
			break;

		default:
			break;
	}

	return lws_callback_http_dummy(Wsi, Reason, User, In, Len);
}

WHttpServer::WHttpServer(WGeoService const& Service_, WHttpServerOptions Options_)
	: Service(Service_)
	, Options(std::move(Options_))
{
}

WHttpServer::~WHttpServer()
{
	Stop();
}

void WHttpServer::ListenThreadFunction() const
{
	pthread_setname_np(pthread_self(), "http-server");

	while (bRunning && Context)
	{
		lws_service(Context, 100);
	}
}

std::optional<std::string> WHttpServer::FindHostArgument(std::vector<std::string> const& Arguments)
{
	for (std::string_view const Argument : Arguments)
	{
		if (Argument.starts_with("host="))
		{
			return std::string(Argument.substr(5));
		}
	}
	return std::nullopt;
}

bool WHttpServer::StartListenThread()
{
	// Redirect libwebsockets logging to spdlog
	lws_set_log_level(LLL_ERR | LLL_WARN, LwsLogCallback);

	static lws_protocols Protocols[] = {
		{ "http", HttpCallback, sizeof(WHttpSession), 0, 0, nullptr, 0 },
		// Null terminator
		{ nullptr, nullptr, 0, 0, 0, nullptr, 0 }
	};

	lws_context_creation_info Info{};
	Info.port = Options.Port;
	// lws binds every interface when iface is unset
	if (!Options.ListenAddress.empty() && Options.ListenAddress != "0.0.0.0" && Options.ListenAddress != "::")
	{
		Info.iface = Options.ListenAddress.c_str();
	}
	Info.protocols = Protocols;
	Info.user = this;
	Info.gid = static_cast<gid_t>(-1);
	Info.uid = static_cast<uid_t>(-1);

	Pool = std::make_unique<WWorkerPool>(Options.WorkerThreads, "geo-worker");

	Context = lws_create_context(&Info);
	if (!Context)
	{
		spdlog::error("Failed to create libwebsockets context on {}:{}", Options.ListenAddress, Options.Port);
		Pool.reset();
		return false;
	}

	bRunning = true;
	ListenThread = std::thread(&WHttpServer::ListenThreadFunction, this);

	spdlog::info("HTTP server listening on {}:{} with {} worker thread(s)", Options.ListenAddress, Options.Port,
		Pool->GetThreadCount());
	return true;
}

void WHttpServer::Stop()
{
	// Drain the workers first, they still hand responses to the live context
	if (Pool)
	{
		Pool->Stop();
	}

	bRunning = false;

	// Wake up lws_service() so it can exit promptly
	if (Context)
	{
		lws_cancel_service(Context);
	}

	if (ListenThread.joinable())
	{
		ListenThread.join();
	}

	if (Context)
	{
		lws_context_destroy(Context);
		Context = nullptr;
	}

	Pool.reset();

	std::lock_guard Lock(PendingMutex);
	PendingRequests.clear();
	CompletedRequests.clear();
}

int WHttpServer::HandleRequest(lws* Wsi, WHttpSession* Session, char const* Path)
{
	if (!Session)
	{
		return -1;
	}

	WHttpRequest Request{};
	Request.Method = ReadMethod(Wsi);
	Request.Path = Path && *Path ? Path : "/";
	Request.HostArgument = FindHostArgument(ReadQueryArguments(Wsi));
	Request.PeerAddress = ReadPeerAddress(Wsi);

	for (auto const* Name : CustomHeaders)
	{
		if (auto Value = ReadCustomHeader(Wsi, Name))
		{
			Request.Headers.emplace(Name, std::move(*Value));
		}
	}
	if (auto Value = ReadHeader(Wsi, WSI_TOKEN_X_FORWARDED_FOR))
	{
		Request.Headers.emplace("x-forwarded-for", std::move(*Value));
	}

	auto const RequestId = NextRequestId++;
	Session->RequestId = RequestId;
	{
		std::lock_guard Lock(PendingMutex);
		PendingRequests[RequestId] = WPendingRequest{ Wsi, Request.Method + " " + Request.Path, WTime::GetSteadyMs(), {} };
	}

	lws_set_timeout(Wsi, PENDING_TIMEOUT_HTTP_CONTENT, PendingRequestTimeout);

	bool const bSubmitted = Pool && Pool->Submit([this, RequestId, Request = std::move(Request)] {
		CompleteRequest(RequestId, Service.Handle(Request));
	});
	if (!bSubmitted)
	{
		std::lock_guard Lock(PendingMutex);
		if (auto It = PendingRequests.find(RequestId); It != PendingRequests.end())
		{
			It->second.Response = WHttpResponse{ 503,
				WResponseAssembler::AssembleError(503, "INTERNAL_ERROR", "server is shutting down").dump() };
		}
		lws_callback_on_writable(Wsi);
	}
	return 0;
}

void WHttpServer::CompleteRequest(WRequestId RequestId, WHttpResponse Response)
{
	{
		std::lock_guard Lock(PendingMutex);
		auto            It = PendingRequests.find(RequestId);
		if (It == PendingRequests.end())
		{
			// client went away while we were working on it
			return;
		}
		It->second.Response = std::move(Response);
		CompletedRequests.push_back(RequestId);
	}

	if (Context)
	{
		lws_cancel_service(Context);
	}
}

void WHttpServer::HandleWaitCancelled()
{
	std::lock_guard Lock(PendingMutex);
	for (auto const RequestId : CompletedRequests)
	{
		if (auto It = PendingRequests.find(RequestId); It != PendingRequests.end())
		{
			lws_callback_on_writable(It->second.Wsi);
		}
	}
	CompletedRequests.clear();
}

int WHttpServer::HandleWritable(lws* Wsi, WHttpSession* Session)
{
	if (!Session)
	{
		return 0;
	}

	WPendingRequest Pending;
	{
		std::lock_guard Lock(PendingMutex);
		auto            It = PendingRequests.find(Session->RequestId);
		if (It == PendingRequests.end() || !It->second.Response)
		{
			return 0;
		}
		Pending = std::move(It->second);
		PendingRequests.erase(It);
		Session->RequestId = 0;
	}

	auto const& Response = *Pending.Response;

	uint8_t  HeaderBuffer[LWS_PRE + 1024];
	uint8_t* Start = &HeaderBuffer[LWS_PRE];
	uint8_t* Pos = Start;
	uint8_t* End = &HeaderBuffer[sizeof(HeaderBuffer) - 1];

	if (lws_add_http_common_headers(Wsi, static_cast<unsigned int>(Response.Status), HttpJsonContentType,
			static_cast<lws_filepos_t>(Response.Body.size()), &Pos, End))
	{
		return 1;
	}
	if (lws_finalize_write_http_header(Wsi, Start, &Pos, End))
	{
		return 1;
	}

	// lws needs LWS_PRE bytes of headroom in front of the payload
	std::vector<uint8_t> Body(LWS_PRE + Response.Body.size());
	std::memcpy(Body.data() + LWS_PRE, Response.Body.data(), Response.Body.size());
	int const Written = lws_write(Wsi, Body.data() + LWS_PRE, Response.Body.size(), LWS_WRITE_HTTP_FINAL);
	if (Written < static_cast<int>(Response.Body.size()))
	{
		spdlog::warn("Short write answering {}", Pending.Path);
		return -1;
	}

	spdlog::debug("{} -> {} ({})", Pending.Path, Response.Status,
		WTime::FormatDuration(WTime::GetSteadyMs() - Pending.StartTime));

	if (lws_http_transaction_completed(Wsi))
	{
		return -1;
	}
	return 0;
}

void WHttpServer::HandleClosed(WHttpSession* Session)
{
	if (!Session || Session->RequestId == 0)
	{
		return;
	}

	std::lock_guard Lock(PendingMutex);
	PendingRequests.erase(Session->RequestId);
	Session->RequestId = 0;
}
