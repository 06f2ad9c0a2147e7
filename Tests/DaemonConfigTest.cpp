/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <cstdlib>
#include <gtest/gtest.h>

#include "DaemonConfig.hpp"
#include "FakeTables.hpp"

class DaemonConfigTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		for (auto const* Name : { "MMDB_PATH", "WEGWEISER_LISTEN_ADDRESS", "WEGWEISER_PORT", "WEGWEISER_LOG_LEVEL" })
		{
			unsetenv(Name);
		}
	}

	void TearDown() override { SetUp(); }

	WTempDirectory Dir;
};

TEST_F(DaemonConfigTest, ReadsIniFile)
{
	auto const Path = Dir.Write("wegweiserd.ini", R"(
[database]
directory = /var/lib/wegweiser
asn_file = ip2asn-combined.tsv
region_country = CN
languages = en, zh-CN
reload_check_interval = 0

[server]
listen_address = ::
port = 9090
worker_threads = 4
trust_forwarded_headers = false

[resolver]
timeout_ms = 1500
threads = 8

[log]
level = debug

[daemon]
user = nobody
)");

	WDaemonConfig Config;
	ASSERT_TRUE(Config.Load(Path.string()));

	EXPECT_EQ(Config.DatabaseDirectory, "/var/lib/wegweiser");
	EXPECT_EQ(Config.AsnFile, "ip2asn-combined.tsv");
	EXPECT_EQ(Config.CityFile, "GeoLite2-City.mmdb");
	EXPECT_EQ(Config.Languages, (std::vector<std::string>{ "en", "zh-CN" }));
	EXPECT_EQ(Config.ReloadCheckIntervalSec, 0);
	EXPECT_EQ(Config.ListenAddress, "::");
	EXPECT_EQ(Config.Port, 9090);
	EXPECT_EQ(Config.WorkerThreads, 4u);
	EXPECT_FALSE(Config.bTrustForwardedHeaders);
	EXPECT_EQ(Config.ResolveTimeoutMs, 1500);
	EXPECT_EQ(Config.ResolveThreads, 8u);
	EXPECT_EQ(Config.LogLevel, "debug");
	EXPECT_EQ(Config.DaemonUser, "nobody");

	auto const Paths = Config.GetDatabasePaths();
	EXPECT_EQ(Paths.AsnFile, std::filesystem::path("/var/lib/wegweiser/ip2asn-combined.tsv"));
	EXPECT_EQ(Paths.AsnCatalogFile, std::filesystem::path("/var/lib/wegweiser/asn_info.json"));
	EXPECT_EQ(Paths.Languages, Config.Languages);
}

TEST_F(DaemonConfigTest, InvalidValuesFallBackToDefaults)
{
	auto const Path = Dir.Write("bad-values.ini", "[server]\nport = 70000\n[resolver]\ntimeout_ms = -5\nthreads = 0\n");

	WDaemonConfig Config;
	ASSERT_TRUE(Config.Load(Path.string()));
	EXPECT_EQ(Config.Port, 8080);
	EXPECT_EQ(Config.ResolveTimeoutMs, 3000);
	EXPECT_EQ(Config.ResolveThreads, 4u);
}

TEST_F(DaemonConfigTest, BrokenFilesAreRejected)
{
	WDaemonConfig Config;
	EXPECT_FALSE(Config.Load((Dir.Get() / "missing.ini").string()));
	EXPECT_FALSE(Config.Load(Dir.Write("broken.ini", "[database\ndirectory = x\n").string()));
}

TEST_F(DaemonConfigTest, EnvironmentOverridesFile)
{
	setenv("MMDB_PATH", "/srv/mmdb", 1);
	setenv("WEGWEISER_PORT", "8443", 1);
	setenv("WEGWEISER_LOG_LEVEL", "warn", 1);

	WDaemonConfig Config;
	ASSERT_TRUE(Config.Load(Dir.Write("wegweiserd.ini", "[database]\ndirectory = data\n[server]\nport = 9000\n").string()));
	Config.ApplyEnvironment();

	EXPECT_EQ(Config.DatabaseDirectory, "/srv/mmdb");
	EXPECT_EQ(Config.Port, 8443);
	EXPECT_EQ(Config.LogLevel, "warn");
}

TEST_F(DaemonConfigTest, BadPortInEnvironmentIsIgnored)
{
	WDaemonConfig Config;
	auto const    Before = Config.Port;

	setenv("WEGWEISER_PORT", "http", 1);
	Config.ApplyEnvironment();
	EXPECT_EQ(Config.Port, Before);

	setenv("WEGWEISER_PORT", "0", 1);
	Config.ApplyEnvironment();
	EXPECT_EQ(Config.Port, Before);
}

TEST(DaemonConfigParseListTest, SplitsAndTrims)
{
	EXPECT_EQ(WDaemonConfig::ParseList("zh-CN, en"), (std::vector<std::string>{ "zh-CN", "en" }));
	EXPECT_EQ(WDaemonConfig::ParseList(" de ,, fr\t"), (std::vector<std::string>{ "de", "fr" }));
	EXPECT_TRUE(WDaemonConfig::ParseList("").empty());
}
