/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>

#include "IPAddress.hpp"
#include "Net/ClientAddress.hpp"

struct WHttpRequest
{
	std::string Method{ "GET" };

	// URL decoded, without the query string
	std::string Path{ "/" };

	// Value of the host= query argument, if present
	std::optional<std::string> HostArgument{};

	WIPAddress PeerAddress{};
	WHeaderMap Headers{};
};

struct WHttpResponse
{
	int         Status{ 200 };
	std::string Body{};
};

static constexpr char const* HttpJsonContentType = "application/json; charset=utf-8";
