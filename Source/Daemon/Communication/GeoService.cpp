/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "GeoService.hpp"

#include <spdlog/spdlog.h>

#include "ResponseAssembler.hpp"
#include "Geo/GeoError.hpp"
#include "Geo/GeoLookup.hpp"
#include "Net/ClientAddress.hpp"
#include "Net/HostClassifier.hpp"

namespace
{
	WHttpResponse MakeError(int Status, std::string_view Code, std::string const& Message)
	{
		return { Status, WResponseAssembler::AssembleError(Status, Code, Message).dump() };
	}

	int StatusForError(EGeoError Code)
	{
		switch (Code)
		{
			case EGeoError::InvalidHost:
				return 400;
			case EGeoError::NoSuchHost:
				return 404;
			case EGeoError::DatabaseLoad:
			case EGeoError::DatabaseUnavailable:
			default:
				return 500;
		}
	}
} // namespace

WGeoService::WGeoService(WSnapshotManager const& Snapshots_, WResolver Resolver_, bool bTrustForwardedHeaders_)
	: Snapshots(Snapshots_)
	, Resolver(std::move(Resolver_))
	, bTrustForwardedHeaders(bTrustForwardedHeaders_)
{
}

void WGeoService::Stop()
{
	Resolver.Stop();
}

WRoute WGeoService::Route(std::string_view Path, std::optional<std::string> const& HostArgument)
{
	if (Path.empty() || Path == "/")
	{
		return { ERouteKind::ClientAddress, {} };
	}

	if (Path == "/api" || Path == "/api/")
	{
		if (HostArgument && !HostArgument->empty())
		{
			return { ERouteKind::HostQuery, *HostArgument };
		}
		return { ERouteKind::ClientAddress, {} };
	}

	std::string_view Host = Path.substr(1);
	if (Path.starts_with("/api/"))
	{
		Host = Path.substr(5);
	}

	if (Host.empty() || Host.find('/') != std::string_view::npos)
	{
		return { ERouteKind::NotFound, {} };
	}
	return { ERouteKind::HostQuery, std::string(Host) };
}

WResolutionResult WGeoService::QueryAddress(WIPAddress const& Address, WDatabaseSnapshot const& Snapshot)
{
	WResolutionResult Result{};
	Result.Host = Address.ToString();
	Result.bSingleAddress = true;
	Result.Records.push_back(WGeoLookup::Lookup(Address, Snapshot));
	return Result;
}

WResolutionResult WGeoService::Query(std::string_view Host, WDatabaseSnapshot const& Snapshot) const
{
	auto const Classified = WHostClassifier::Classify(Host);
	if (Classified.Kind == EHostKind::Address)
	{
		return QueryAddress(Classified.Address, Snapshot);
	}

	WResolutionResult Result{};
	Result.Host = Classified.Hostname;
	Result.bSingleAddress = false;
	for (auto const& Address : Resolver.Resolve(Classified.Hostname))
	{
		Result.Records.push_back(WGeoLookup::Lookup(Address, Snapshot));
	}
	return Result;
}

WHttpResponse WGeoService::Handle(WHttpRequest const& Request) const
{
	if (Request.Method != "GET")
	{
		return MakeError(405, "METHOD_NOT_ALLOWED", "only GET is supported");
	}

	auto const RequestRoute = Route(Request.Path, Request.HostArgument);
	if (RequestRoute.Kind == ERouteKind::NotFound)
	{
		return MakeError(404, "NOT_FOUND", "no such endpoint: " + Request.Path);
	}

	// One snapshot for the whole request, a concurrent reload doesn't affect it
	auto const Snapshot = Snapshots.Current();
	if (!Snapshot)
	{
		return MakeError(500, WGeoError::CodeName(EGeoError::DatabaseUnavailable), "no database loaded");
	}

	try
	{
		WResolutionResult Result;
		if (RequestRoute.Kind == ERouteKind::ClientAddress)
		{
			auto const Client =
				WClientAddress::Determine(Request.Headers, Request.PeerAddress, bTrustForwardedHeaders);
			Result = QueryAddress(Client, *Snapshot);
		}
		else
		{
			Result = Query(RequestRoute.Host, *Snapshot);
		}
		return { 200, WResponseAssembler::Assemble(Result).dump() };
	}
	catch (WGeoError const& Error)
	{
		auto const Status = StatusForError(Error.GetCode());
		if (Status >= 500)
		{
			spdlog::error("Request {} failed: {}", Request.Path, Error.what());
			return MakeError(Status, WGeoError::CodeName(EGeoError::DatabaseUnavailable), Error.what());
		}
		spdlog::debug("Request {} rejected: {}", Request.Path, Error.what());
		return MakeError(Status, WGeoError::CodeName(Error.GetCode()), Error.what());
	}
	catch (std::exception const& Error)
	{
		spdlog::error("Internal error while handling {}: {}", Request.Path, Error.what());
		return MakeError(500, WGeoError::CodeName(EGeoError::DatabaseUnavailable), "internal error");
	}
}
