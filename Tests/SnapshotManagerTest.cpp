/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <atomic>
#include <thread>
#include <gtest/gtest.h>

#include "FakeTables.hpp"
#include "Geo/GeoError.hpp"
#include "Geo/GeoLookup.hpp"
#include "Geo/SnapshotManager.hpp"

namespace
{
	// Every snapshot names its load number in the ASN organization of 8.8.8.0/24
	std::shared_ptr<WDatabaseSnapshot> MakeTaggedSnapshot(int Tag)
	{
		WFakeDatabase Database;
		Database.Asn->AddAsn("8.8.8.0/24", 15169, "load-" + std::to_string(Tag));
		return Database.Build();
	}

	std::string TagOf(WDatabaseSnapshot const& Snapshot)
	{
		auto const Record = WGeoLookup::Lookup(*WIPAddress::FromString("8.8.8.8"), Snapshot);
		return Record.Asn ? Record.Asn->Organization : std::string{};
	}
} // namespace

class SnapshotManagerTest : public ::testing::Test
{
protected:
	std::atomic<int>  Loads{ 0 };
	std::atomic<bool> bFailNext{ false };

	WSnapshotManager Manager{ [this](WDatabasePaths const&) -> std::shared_ptr<WDatabaseSnapshot> {
		if (bFailNext.exchange(false))
		{
			throw WDatabaseLoadError("city", "GeoLite2-City.mmdb is truncated");
		}
		return MakeTaggedSnapshot(++Loads);
	} };

	WDatabasePaths Paths{};
};

TEST_F(SnapshotManagerTest, NothingLoadedInitially)
{
	EXPECT_EQ(Manager.Current(), nullptr);
	EXPECT_TRUE(Manager.HasChangedOnDisk(Paths));
}

TEST_F(SnapshotManagerTest, ReloadIncrementsGeneration)
{
	Manager.LoadInitial(Paths);
	auto const First = Manager.Current();
	ASSERT_NE(First, nullptr);
	EXPECT_EQ(First->GetGeneration(), 1u);
	EXPECT_EQ(TagOf(*First), "load-1");

	EXPECT_TRUE(Manager.Reload(Paths));
	auto const Second = Manager.Current();
	EXPECT_EQ(Second->GetGeneration(), 2u);
	EXPECT_EQ(TagOf(*Second), "load-2");

	// A reader holding the old snapshot keeps a working copy
	EXPECT_EQ(TagOf(*First), "load-1");
}

TEST_F(SnapshotManagerTest, FailedReloadKeepsServingOldSnapshot)
{
	Manager.LoadInitial(Paths);
	auto const Before = Manager.Current();

	bFailNext = true;
	EXPECT_FALSE(Manager.Reload(Paths));
	EXPECT_EQ(Manager.Current(), Before);
	EXPECT_EQ(Manager.Current()->GetGeneration(), 1u);

	EXPECT_TRUE(Manager.Reload(Paths));
	EXPECT_EQ(Manager.Current()->GetGeneration(), 2u);
}

TEST_F(SnapshotManagerTest, FailedInitialLoadThrows)
{
	bFailNext = true;
	EXPECT_THROW(Manager.LoadInitial(Paths), WDatabaseLoadError);
	EXPECT_EQ(Manager.Current(), nullptr);
}

TEST_F(SnapshotManagerTest, SignalFiresOnPublish)
{
	std::vector<WSnapshotGeneration> Published;
	Manager.OnSnapshotPublished.connect([&Published](WSnapshotPtr const& Snapshot) {
		Published.push_back(Snapshot->GetGeneration());
	});

	Manager.LoadInitial(Paths);
	bFailNext = true;
	(void)Manager.Reload(Paths);
	(void)Manager.Reload(Paths);

	EXPECT_EQ(Published, (std::vector<WSnapshotGeneration>{ 1, 2 }));
}

TEST_F(SnapshotManagerTest, ConcurrentReadersSeeConsistentSnapshots)
{
	Manager.LoadInitial(Paths);

	std::atomic<bool> bDone{ false };
	std::atomic<int>  Mismatches{ 0 };
	std::atomic<int>  Reads{ 0 };

	std::vector<std::thread> Readers;
	for (int i = 0; i < 4; ++i)
	{
		Readers.emplace_back([&] {
			while (!bDone)
			{
				auto const Snapshot = Manager.Current();
				if (TagOf(*Snapshot) != "load-" + std::to_string(Snapshot->GetGeneration()))
				{
					++Mismatches;
				}
				++Reads;
			}
		});
	}

	for (int i = 0; i < 50; ++i)
	{
		EXPECT_TRUE(Manager.Reload(Paths));
	}
	bDone = true;
	for (auto& Reader : Readers)
	{
		Reader.join();
	}

	EXPECT_EQ(Mismatches, 0);
	EXPECT_GT(Reads, 0);
	EXPECT_EQ(Manager.Current()->GetGeneration(), 51u);
}

TEST(DatabaseSnapshotTest, MissingTableIsRejected)
{
	EXPECT_THROW((void)WDatabaseSnapshot(nullptr, std::make_unique<WFakeTable>(EGeoTableKind::City),
					 std::make_unique<WFakeRegionTable>(), WAsnCatalog{}),
		WGeoError);
}

TEST(DatabaseSnapshotTest, LoadNamesTheFailingTable)
{
	WTempDirectory Dir;
	WDatabasePaths Paths{};
	Paths.AsnFile = Dir.Get() / "missing-asn.mmdb";
	Paths.CityFile = Dir.Get() / "missing-city.mmdb";
	Paths.RegionFile = Dir.Get() / "missing-region.mmdb";
	Paths.AsnCatalogFile = Dir.Get() / "asn_info.json";

	try
	{
		(void)WDatabaseSnapshot::Load(Paths);
		FAIL() << "expected WDatabaseLoadError";
	}
	catch (WDatabaseLoadError const& Error)
	{
		EXPECT_EQ(Error.GetTable(), "asn");
	}
}

TEST(DatabaseSnapshotTest, StampsTrackFileChanges)
{
	WTempDirectory Dir;
	WDatabasePaths Paths{};
	Paths.AsnFile = Dir.Write("asn.tsv", "1.0.0.0\t1.0.0.255\t13335\tUS\tCLOUDFLARENET\n");
	Paths.CityFile = Dir.Get() / "city.mmdb";
	Paths.RegionFile = Dir.Get() / "region.mmdb";
	Paths.AsnCatalogFile = Dir.Get() / "asn_info.json";

	auto const Before = WDatabaseSnapshot::ReadStamps(Paths);
	ASSERT_EQ(Before.size(), 4u);
	EXPECT_TRUE(Before[0].Size.has_value());
	EXPECT_FALSE(Before[1].Size.has_value());

	Dir.Write("asn.tsv", "1.0.0.0\t1.0.0.255\t13335\tUS\tCLOUDFLARENET\n1.0.1.0\t1.0.3.255\t0\tNone\tNot routed\n");
	EXPECT_NE(WDatabaseSnapshot::ReadStamps(Paths), Before);
}
