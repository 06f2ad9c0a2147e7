/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "Net/ClientAddress.hpp"

namespace
{
	WIPAddress const Peer = *WIPAddress::FromString("198.18.0.10");

	std::string Determine(WHeaderMap const& Headers, bool bTrust = true)
	{
		return WClientAddress::Determine(Headers, Peer, bTrust).ToString();
	}
} // namespace

TEST(ClientAddressTest, FallsBackToPeer)
{
	EXPECT_EQ(Determine({}), "198.18.0.10");
	auto const Mapped = *WIPAddress::FromString("::ffff:203.0.114.7");
	EXPECT_EQ(WClientAddress::Determine({}, Mapped, true).ToString(), "203.0.114.7");
}

TEST(ClientAddressTest, CdnHeadersWinOverForwardedFor)
{
	WHeaderMap const Headers = {
		{ "x-forwarded-for", "5.6.7.8" },
		{ "x-real-ip", "4.4.4.4" },
		{ "true-client-ip", "3.3.3.3" },
		{ "cf-connecting-ip", "1.1.1.1" },
	};
	EXPECT_EQ(Determine(Headers), "1.1.1.1");
}

TEST(ClientAddressTest, PrecedenceWithoutCdnHeaders)
{
	EXPECT_EQ(Determine({ { "x-real-ip", "4.4.4.4" }, { "x-forwarded-for", "5.6.7.8" } }), "4.4.4.4");
	EXPECT_EQ(Determine({ { "x-forwarded-for", "5.6.7.8, 10.0.0.1" }, { "forwarded", "for=9.9.9.9" } }), "5.6.7.8");
	EXPECT_EQ(Determine({ { "forwarded", "for=\"[2606:4700::1111]:4711\";proto=https" } }), "2606:4700::1111");
	EXPECT_EQ(Determine({ { "forwarded", "proto=https;For=9.9.9.9, for=8.8.8.8" } }), "9.9.9.9");
}

TEST(ClientAddressTest, PrivateHeaderValuesAreSkipped)
{
	WHeaderMap const Headers = {
		{ "cf-connecting-ip", "10.1.2.3" },
		{ "x-real-ip", "192.168.1.1" },
		{ "x-forwarded-for", "5.6.7.8" },
	};
	EXPECT_EQ(Determine(Headers), "5.6.7.8");
	EXPECT_EQ(Determine({ { "x-forwarded-for", "127.0.0.1" } }), "198.18.0.10");
}

TEST(ClientAddressTest, UnparsableHeadersAreSkipped)
{
	EXPECT_EQ(Determine({ { "x-real-ip", "unknown" }, { "x-forwarded-for", "5.6.7.8" } }), "5.6.7.8");
	EXPECT_EQ(Determine({ { "forwarded", "for=_hidden" } }), "198.18.0.10");
}

TEST(ClientAddressTest, UntrustedHeadersAreIgnored)
{
	EXPECT_EQ(Determine({ { "cf-connecting-ip", "1.1.1.1" } }, false), "198.18.0.10");
}

TEST(ClientAddressTest, ParsesHeaderAddressForms)
{
	EXPECT_EQ(WClientAddress::ParseHeaderAddress("1.2.3.4")->ToString(), "1.2.3.4");
	EXPECT_EQ(WClientAddress::ParseHeaderAddress(" 1.2.3.4:8080 ")->ToString(), "1.2.3.4");
	EXPECT_EQ(WClientAddress::ParseHeaderAddress("\"[2001:db8::1]:443\"")->ToString(), "2001:db8::1");
	EXPECT_EQ(WClientAddress::ParseHeaderAddress("2001:db8::1")->ToString(), "2001:db8::1");
	EXPECT_EQ(WClientAddress::ParseHeaderAddress("::ffff:1.2.3.4")->ToString(), "1.2.3.4");
	EXPECT_FALSE(WClientAddress::ParseHeaderAddress("").has_value());
	EXPECT_FALSE(WClientAddress::ParseHeaderAddress("[2001:db8::1").has_value());
}

TEST(ClientAddressTest, ClassifiesPrivateAddresses)
{
	for (auto const* Str : { "10.0.0.1", "172.16.5.4", "192.168.0.1", "127.0.0.1", "169.254.1.1", "100.64.0.1",
			 "0.0.0.0", "::1", "::", "fd12::1", "fe80::1", "::ffff:10.0.0.1" })
	{
		EXPECT_TRUE(WClientAddress::IsPrivate(*WIPAddress::FromString(Str))) << Str;
	}
	for (auto const* Str : { "8.8.8.8", "172.32.0.1", "100.128.0.1", "2001:4860:4860::8888" })
	{
		EXPECT_FALSE(WClientAddress::IsPrivate(*WIPAddress::FromString(Str))) << Str;
	}
}
