/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace EIPFamily
{
	enum Type : uint8_t
	{
		Unknown = 0,
		IPv4 = 4,
		IPv6 = 6
	};
} // namespace EIPFamily

struct WIPAddress
{
	// IPv4: first 4 bytes used; IPv6: all 16 bytes used.
	std::array<uint8_t, 16> Bytes{};
	EIPFamily::Type         Family{};

	[[nodiscard]] static std::optional<WIPAddress> FromString(std::string_view Str)
	{
		// inet_pton wants a NUL terminated string
		char Buffer[INET6_ADDRSTRLEN]{};
		if (Str.empty() || Str.size() >= sizeof(Buffer))
		{
			return std::nullopt;
		}
		std::memcpy(Buffer, Str.data(), Str.size());

		WIPAddress Address{};
		in_addr    Addr4{};
		if (inet_pton(AF_INET, Buffer, &Addr4) == 1)
		{
			Address.FromIPv4Uint32(Addr4.s_addr);
			return Address;
		}

		in6_addr Addr6{};
		if (inet_pton(AF_INET6, Buffer, &Addr6) == 1)
		{
			std::memcpy(Address.Bytes.data(), Addr6.s6_addr, 16);
			Address.Family = EIPFamily::IPv6;
			return Address;
		}
		return std::nullopt;
	}

	[[nodiscard]] static std::optional<WIPAddress> FromSockAddr(sockaddr const* SockAddr)
	{
		if (!SockAddr)
		{
			return std::nullopt;
		}

		WIPAddress Address{};
		if (SockAddr->sa_family == AF_INET)
		{
			Address.FromIPv4Uint32(reinterpret_cast<sockaddr_in const*>(SockAddr)->sin_addr.s_addr);
			return Address;
		}
		if (SockAddr->sa_family == AF_INET6)
		{
			std::memcpy(Address.Bytes.data(), reinterpret_cast<sockaddr_in6 const*>(SockAddr)->sin6_addr.s6_addr, 16);
			Address.Family = EIPFamily::IPv6;
			return Address;
		}
		return std::nullopt;
	}

	// Fills Storage with a port-less socket address, returns the length to pass along with it
	socklen_t ToSockAddr(sockaddr_storage& Storage) const
	{
		Storage = {};
		if (Family == EIPFamily::IPv4)
		{
			auto* Addr4 = reinterpret_cast<sockaddr_in*>(&Storage);
			Addr4->sin_family = AF_INET;
			Addr4->sin_addr.s_addr = htonl(ToInt());
			return sizeof(sockaddr_in);
		}

		auto* Addr6 = reinterpret_cast<sockaddr_in6*>(&Storage);
		Addr6->sin6_family = AF_INET6;
		std::memcpy(Addr6->sin6_addr.s6_addr, Bytes.data(), 16);
		return sizeof(sockaddr_in6);
	}

	[[nodiscard]] std::string ToString() const
	{
		if (Family == EIPFamily::IPv4)
		{
			in_addr Addr4{};
			Addr4.s_addr = htonl(ToInt());
			char        Buffer[INET_ADDRSTRLEN];
			char const* Result = inet_ntop(AF_INET, &Addr4, Buffer, INET_ADDRSTRLEN);
			if (Result)
			{
				return { Buffer };
			}
			return {};
		}

		in6_addr Addr6{};
		for (unsigned long i = 0; i < 16; ++i)
		{
			Addr6.s6_addr[i] = Bytes[i];
		}
		char        Buffer[INET6_ADDRSTRLEN];
		char const* Result = inet_ntop(AF_INET6, &Addr6, Buffer, INET6_ADDRSTRLEN);
		if (Result)
		{
			return { Buffer };
		}
		return {};
	}

	// IPv4 address in host byte order
	[[nodiscard]] uint32_t ToInt() const
	{
		return (static_cast<uint32_t>(Bytes[0]) << 24) | (static_cast<uint32_t>(Bytes[1]) << 16)
			| (static_cast<uint32_t>(Bytes[2]) << 8) | static_cast<uint32_t>(Bytes[3]);
	}

	[[nodiscard]] uint8_t BitLength() const { return Family == EIPFamily::IPv4 ? 32 : 128; }

	[[nodiscard]] bool IsIPv4Mapped() const
	{
		if (Family != EIPFamily::IPv6)
		{
			return false;
		}
		for (unsigned long i = 0; i < 10; ++i)
		{
			if (Bytes[i] != 0)
				return false;
		}
		return Bytes[10] == 0xFF && Bytes[11] == 0xFF;
	}

	// ::ffff:a.b.c.d -> a.b.c.d, everything else is returned unchanged
	[[nodiscard]] WIPAddress Unmapped() const
	{
		if (!IsIPv4Mapped())
		{
			return *this;
		}
		WIPAddress Address{};
		Address.Bytes[0] = Bytes[12];
		Address.Bytes[1] = Bytes[13];
		Address.Bytes[2] = Bytes[14];
		Address.Bytes[3] = Bytes[15];
		Address.Family = EIPFamily::IPv4;
		return Address;
	}

	void FromIPv4Uint32(uint32_t IPv4Addr_NetworkByteOrder)
	{
		auto IPv4Addr_HostByteOrder = ntohl(IPv4Addr_NetworkByteOrder);
		Bytes = {};
		Bytes[0] = static_cast<uint8_t>((IPv4Addr_HostByteOrder >> 24) & 0xFF);
		Bytes[1] = static_cast<uint8_t>((IPv4Addr_HostByteOrder >> 16) & 0xFF);
		Bytes[2] = static_cast<uint8_t>((IPv4Addr_HostByteOrder >> 8) & 0xFF);
		Bytes[3] = static_cast<uint8_t>(IPv4Addr_HostByteOrder & 0xFF);
		Family = EIPFamily::IPv4;
	}
};

inline bool operator==(WIPAddress const& Lhs, WIPAddress const& Rhs)
{
	return Lhs.Bytes == Rhs.Bytes && Lhs.Family == Rhs.Family;
}

inline bool operator!=(WIPAddress const& Lhs, WIPAddress const& Rhs)
{
	return !(Lhs == Rhs);
}
