/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "HttpMessage.hpp"
#include "Geo/SnapshotManager.hpp"
#include "Geo/GeoTypes.hpp"
#include "Net/Resolver.hpp"

namespace ERouteKind
{
	enum Type : uint8_t
	{
		ClientAddress,
		HostQuery,
		NotFound
	};
} // namespace ERouteKind

struct WRoute
{
	ERouteKind::Type Kind{ ERouteKind::NotFound };
	std::string      Host{};
};

// Runs one request through classification, resolution, lookup and response assembly
class WGeoService
{
	WSnapshotManager const& Snapshots;
	WResolver               Resolver;
	bool                    bTrustForwardedHeaders{ true };

public:
	WGeoService(WSnapshotManager const& Snapshots_, WResolver Resolver_, bool bTrustForwardedHeaders_);

	// "/", "/api" -> client address, "/api/{host}", "/{host}" and "/api?host=" -> host query
	[[nodiscard]] static WRoute Route(std::string_view Path, std::optional<std::string> const& HostArgument);

	// Answers everything with a JSON body, never throws
	[[nodiscard]] WHttpResponse Handle(WHttpRequest const& Request) const;

	// Throws WGeoError for invalid or unresolvable hosts
	[[nodiscard]] WResolutionResult Query(std::string_view Host, WDatabaseSnapshot const& Snapshot) const;

	// Joins the resolver threads, call once no more requests arrive
	void Stop();

	[[nodiscard]] static WResolutionResult QueryAddress(WIPAddress const& Address, WDatabaseSnapshot const& Snapshot);
};
