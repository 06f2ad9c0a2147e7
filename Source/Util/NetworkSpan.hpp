/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>

#include "IPAddress.hpp"

// A CIDR block. Host bits of Network are always zero.
struct WNetworkSpan
{
	WIPAddress Network{};
	uint8_t    PrefixLength{};

	// Masks Address down to PrefixLength bits, longer prefixes are clamped to the family's width
	[[nodiscard]] static WNetworkSpan Make(WIPAddress const& Address, uint8_t PrefixLength);

	// Largest aligned block that contains Address and stays within [First, Last]
	[[nodiscard]] static std::optional<WNetworkSpan> FromRange(
		WIPAddress const& Address, WIPAddress const& First, WIPAddress const& Last);

	[[nodiscard]] static std::optional<WNetworkSpan> FromString(std::string const& Cidr);

	[[nodiscard]] bool Contains(WIPAddress const& Address) const;

	[[nodiscard]] WIPAddress LastAddress() const;

	[[nodiscard]] std::string ToString() const
	{
		return Network.ToString() + "/" + std::to_string(PrefixLength);
	}
};

inline bool operator==(WNetworkSpan const& Lhs, WNetworkSpan const& Rhs)
{
	return Lhs.Network == Rhs.Network && Lhs.PrefixLength == Rhs.PrefixLength;
}

// Compares two addresses of the same family by their numeric value
int CompareAddress(WIPAddress const& Lhs, WIPAddress const& Rhs);

// Returns the well-known special-purpose block (RFC 1918, loopback, link-local, ULA, ...) containing Address
std::optional<WNetworkSpan> FindReservedBlock(WIPAddress const& Address);
