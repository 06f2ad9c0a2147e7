/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "IPAddress.hpp"

// Lower case header name -> value
using WHeaderMap = std::map<std::string, std::string>;

class WClientAddress
{
public:
	// Headers consulted, in order of precedence, when proxy headers are trusted
	static constexpr char const* CdnHeaders[] = {
		"cf-connecting-ip",
		"fastly-client-ip",
		"x-azure-clientip",
		"x-akamai-client-ip",
		"true-client-ip",
		"x-cdn-src-ip",
	};
	static constexpr char const* RealIpHeader = "x-real-ip";
	static constexpr char const* ForwardedForHeader = "x-forwarded-for";
	static constexpr char const* ForwardedHeader = "forwarded";

	// The address the client is observed as. Private addresses in headers are skipped, without a
	// usable header the (unmapped) peer address is returned.
	[[nodiscard]] static WIPAddress Determine(
		WHeaderMap const& Headers, WIPAddress const& PeerAddress, bool bTrustForwardedHeaders);

	// Parses a bare address, "[v6]:port", "v4:port" or a quoted variant of those
	[[nodiscard]] static std::optional<WIPAddress> ParseHeaderAddress(std::string_view Value);

	// RFC 1918, loopback, link-local, ULA, CGNAT and unspecified addresses
	[[nodiscard]] static bool IsPrivate(WIPAddress const& Address);
};
