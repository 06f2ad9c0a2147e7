/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "NetworkSpan.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <vector>

namespace
{
	void ApplyMask(WIPAddress& Address, uint8_t PrefixLength, bool bSetHostBits)
	{
		unsigned const Width = Address.BitLength();
		for (unsigned Bit = PrefixLength; Bit < Width; ++Bit)
		{
			auto const Mask = static_cast<uint8_t>(0x80u >> (Bit % 8));
			if (bSetHostBits)
			{
				Address.Bytes[Bit / 8] |= Mask;
			}
			else
			{
				Address.Bytes[Bit / 8] &= static_cast<uint8_t>(~Mask);
			}
		}
	}

	std::vector<WNetworkSpan> const& GetReservedBlocks()
	{
		static std::vector<WNetworkSpan> const Blocks = [] {
			// Ordered most specific first per family so the first hit is the longest prefix
			constexpr char const* Cidrs[] = {
				"255.255.255.255/32",
				"192.0.0.0/24",
				"192.0.2.0/24",
				"198.51.100.0/24",
				"203.0.113.0/24",
				"169.254.0.0/16",
				"192.168.0.0/16",
				"198.18.0.0/15",
				"172.16.0.0/12",
				"100.64.0.0/10",
				"0.0.0.0/8",
				"10.0.0.0/8",
				"127.0.0.0/8",
				"224.0.0.0/4",
				"240.0.0.0/4",
				"::/128",
				"::1/128",
				"64:ff9b::/96",
				"2001:db8::/32",
				"fe80::/10",
				"ff00::/8",
				"fc00::/7",
			};

			std::vector<WNetworkSpan> Result;
			for (auto const* Cidr : Cidrs)
			{
				if (auto Span = WNetworkSpan::FromString(Cidr))
				{
					Result.push_back(*Span);
				}
			}
			return Result;
		}();
		return Blocks;
	}
} // namespace

WNetworkSpan WNetworkSpan::Make(WIPAddress const& Address, uint8_t PrefixLength)
{
	WNetworkSpan Span{};
	Span.PrefixLength = std::min(PrefixLength, Address.BitLength());
	Span.Network = Address;
	ApplyMask(Span.Network, Span.PrefixLength, false);
	return Span;
}

std::optional<WNetworkSpan> WNetworkSpan::FromRange(
	WIPAddress const& Address, WIPAddress const& First, WIPAddress const& Last)
{
	if (Address.Family != First.Family || Address.Family != Last.Family)
	{
		return std::nullopt;
	}
	if (CompareAddress(Address, First) < 0 || CompareAddress(Address, Last) > 0)
	{
		return std::nullopt;
	}

	for (unsigned Prefix = 0; Prefix <= Address.BitLength(); ++Prefix)
	{
		auto const Span = Make(Address, static_cast<uint8_t>(Prefix));
		if (CompareAddress(Span.Network, First) >= 0 && CompareAddress(Span.LastAddress(), Last) <= 0)
		{
			return Span;
		}
	}
	return std::nullopt;
}

std::optional<WNetworkSpan> WNetworkSpan::FromString(std::string const& Cidr)
{
	auto const Slash = Cidr.find('/');
	if (Slash == std::string::npos)
	{
		return std::nullopt;
	}

	auto const Address = WIPAddress::FromString(std::string_view(Cidr).substr(0, Slash));
	if (!Address)
	{
		return std::nullopt;
	}

	unsigned   Prefix{};
	auto const PrefixStr = std::string_view(Cidr).substr(Slash + 1);
	auto const [Ptr, Ec] = std::from_chars(PrefixStr.data(), PrefixStr.data() + PrefixStr.size(), Prefix);
	if (Ec != std::errc() || Ptr != PrefixStr.data() + PrefixStr.size() || Prefix > Address->BitLength())
	{
		return std::nullopt;
	}
	return Make(*Address, static_cast<uint8_t>(Prefix));
}

bool WNetworkSpan::Contains(WIPAddress const& Address) const
{
	if (Address.Family != Network.Family)
	{
		return false;
	}
	return Make(Address, PrefixLength).Network == Network;
}

WIPAddress WNetworkSpan::LastAddress() const
{
	WIPAddress Last = Network;
	ApplyMask(Last, PrefixLength, true);
	return Last;
}

int CompareAddress(WIPAddress const& Lhs, WIPAddress const& Rhs)
{
	if (Lhs.Family != Rhs.Family)
	{
		return Lhs.Family < Rhs.Family ? -1 : 1;
	}
	return std::memcmp(Lhs.Bytes.data(), Rhs.Bytes.data(), Lhs.Bytes.size());
}

std::optional<WNetworkSpan> FindReservedBlock(WIPAddress const& Address)
{
	for (auto const& Block : GetReservedBlocks())
	{
		if (Block.Contains(Address))
		{
			return Block;
		}
	}
	return std::nullopt;
}
