/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ClientAddress.hpp"

#include <algorithm>
#include <vector>
#include <spdlog/spdlog.h>

#include "NetworkSpan.hpp"

namespace
{
	std::string_view Trim(std::string_view Str)
	{
		auto const First = Str.find_first_not_of(" \t");
		if (First == std::string_view::npos)
		{
			return {};
		}
		auto const Last = Str.find_last_not_of(" \t");
		return Str.substr(First, Last - First + 1);
	}

	std::vector<WNetworkSpan> const& GetPrivateBlocks()
	{
		static std::vector<WNetworkSpan> const Blocks = [] {
			constexpr char const* Cidrs[] = {
				"0.0.0.0/8",
				"10.0.0.0/8",
				"100.64.0.0/10",
				"127.0.0.0/8",
				"169.254.0.0/16",
				"172.16.0.0/12",
				"192.0.2.0/24",
				"192.168.0.0/16",
				"198.51.100.0/24",
				"203.0.113.0/24",
				"255.255.255.255/32",
				"::/128",
				"::1/128",
				"2001:db8::/32",
				"fc00::/7",
				"fe80::/10",
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

	std::optional<WIPAddress> FromHeader(WHeaderMap const& Headers, char const* Name)
	{
		auto It = Headers.find(Name);
		if (It == Headers.end())
		{
			return std::nullopt;
		}

		auto Address = WClientAddress::ParseHeaderAddress(It->second);
		if (!Address)
		{
			spdlog::debug("Ignoring unparsable {} header '{}'", Name, It->second);
			return std::nullopt;
		}
		if (WClientAddress::IsPrivate(*Address))
		{
			return std::nullopt;
		}
		return Address;
	}

	// First element of a comma separated list
	std::string_view FirstHop(std::string_view Value)
	{
		return Trim(Value.substr(0, Value.find(',')));
	}

	// for= parameter of the first element of an RFC 7239 Forwarded header
	std::optional<std::string_view> ForwardedFor(std::string_view Value)
	{
		auto Element = FirstHop(Value);
		while (!Element.empty())
		{
			auto const Semicolon = Element.find(';');
			auto       Pair = Trim(Element.substr(0, Semicolon));
			Element = Semicolon == std::string_view::npos ? std::string_view{} : Element.substr(Semicolon + 1);

			auto const Equals = Pair.find('=');
			if (Equals == std::string_view::npos)
			{
				continue;
			}
			auto const Key = Trim(Pair.substr(0, Equals));
			if (Key.size() == 3 && (Key[0] == 'f' || Key[0] == 'F') && (Key[1] == 'o' || Key[1] == 'O')
				&& (Key[2] == 'r' || Key[2] == 'R'))
			{
				return Trim(Pair.substr(Equals + 1));
			}
		}
		return std::nullopt;
	}
} // namespace

std::optional<WIPAddress> WClientAddress::ParseHeaderAddress(std::string_view Value)
{
	Value = Trim(Value);
	if (Value.size() >= 2 && Value.front() == '"' && Value.back() == '"')
	{
		Value = Value.substr(1, Value.size() - 2);
	}
	if (Value.empty())
	{
		return std::nullopt;
	}

	if (Value.front() == '[')
	{
		auto const Close = Value.find(']');
		if (Close == std::string_view::npos)
		{
			return std::nullopt;
		}
		Value = Value.substr(1, Close - 1);
	}
	else if (auto const Colon = Value.find(':');
		Colon != std::string_view::npos && Value.find(':', Colon + 1) == std::string_view::npos)
	{
		// exactly one colon: IPv4 with a port
		Value = Value.substr(0, Colon);
	}

	auto Address = WIPAddress::FromString(Value);
	if (!Address)
	{
		return std::nullopt;
	}
	return Address->Unmapped();
}

bool WClientAddress::IsPrivate(WIPAddress const& Address)
{
	auto const Unmapped = Address.Unmapped();
	return std::ranges::any_of(GetPrivateBlocks(), [&Unmapped](WNetworkSpan const& Block) { return Block.Contains(Unmapped); });
}

WIPAddress WClientAddress::Determine(
	WHeaderMap const& Headers, WIPAddress const& PeerAddress, bool bTrustForwardedHeaders)
{
	if (bTrustForwardedHeaders)
	{
		for (auto const* Header : CdnHeaders)
		{
			if (auto Address = FromHeader(Headers, Header))
			{
				return *Address;
			}
		}

		if (auto Address = FromHeader(Headers, RealIpHeader))
		{
			return *Address;
		}

		if (auto It = Headers.find(ForwardedForHeader); It != Headers.end())
		{
			if (auto Address = ParseHeaderAddress(FirstHop(It->second)); Address && !IsPrivate(*Address))
			{
				return *Address;
			}
		}

		if (auto It = Headers.find(ForwardedHeader); It != Headers.end())
		{
			if (auto For = ForwardedFor(It->second))
			{
				if (auto Address = ParseHeaderAddress(*For); Address && !IsPrivate(*Address))
				{
					return *Address;
				}
			}
		}
	}

	return PeerAddress.Unmapped();
}
