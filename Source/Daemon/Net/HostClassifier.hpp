/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <string_view>

#include "IPAddress.hpp"

namespace EHostKind
{
	enum Type : uint8_t
	{
		Address,
		Hostname
	};
} // namespace EHostKind

struct WClassifiedHost
{
	EHostKind::Type Kind{};

	// Set for EHostKind::Address, IPv4-mapped IPv6 is already unmapped
	WIPAddress Address{};

	// Set for EHostKind::Hostname, lower case without the trailing dot
	std::string Hostname{};
};

class WHostClassifier
{
public:
	static constexpr std::size_t MaxInputLength = 255;
	static constexpr std::size_t MaxHostnameLength = 253;
	static constexpr std::size_t MaxLabelLength = 63;

	// Throws WGeoError(InvalidHost). Never touches the network.
	[[nodiscard]] static WClassifiedHost Classify(std::string_view Raw);

	[[nodiscard]] static bool IsValidHostname(std::string_view Name);
};
