/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "IP2AsnDB.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"

namespace
{
	int CmpIPv6(std::array<uint8_t, 16> const& A, std::array<uint8_t, 16> const& B)
	{
		return std::memcmp(A.data(), B.data(), A.size());
	}

	// Splits off the next tab separated field, returns false if there is no tab left
	bool NextField(std::string_view& Line, std::string_view& OutField)
	{
		auto const Tab = Line.find('\t');
		if (Tab == std::string_view::npos)
		{
			return false;
		}
		OutField = Line.substr(0, Tab);
		Line.remove_prefix(Tab + 1);
		return true;
	}

} // namespace

WIP2AsnDB::WIP2AsnDB(std::filesystem::path Path) : DatabasePath(std::move(Path)) {}

WIP2AsnDB::~WIP2AsnDB()
{
	UnmapDatabase();
}

bool WIP2AsnDB::Init()
{
	if (!std::filesystem::exists(DatabasePath))
	{
		spdlog::error("IP2ASN TSV not found at {}", DatabasePath.string());
		return false;
	}

	if (!MapDatabase())
	{
		return false;
	}

	if (!BuildIndex())
	{
		UnmapDatabase();
		return false;
	}
	return true;
}

bool WIP2AsnDB::MapDatabase()
{
	UnmapDatabase();

	DatabaseFd = ::open(DatabasePath.c_str(), O_RDONLY | O_CLOEXEC);
	if (DatabaseFd < 0)
	{
		spdlog::error("Failed to open IP2ASN TSV at {}: {}", DatabasePath.string(), WErrnoUtil::StrError());
		return false;
	}

	struct stat st{};
	if (fstat(DatabaseFd, &st) != 0)
	{
		spdlog::error("Failed to stat IP2ASN TSV at {}: {}", DatabasePath.string(), WErrnoUtil::StrError());
		::close(DatabaseFd);
		DatabaseFd = -1;
		return false;
	}

	if (st.st_size == 0)
	{
		spdlog::error("IP2ASN TSV at {} is empty", DatabasePath.string());
		::close(DatabaseFd);
		DatabaseFd = -1;
		return false;
	}

	DatabaseMappingSize = static_cast<size_t>(st.st_size);
	DatabaseMapping = mmap(nullptr, DatabaseMappingSize, PROT_READ, MAP_PRIVATE, DatabaseFd, 0);
	if (DatabaseMapping == MAP_FAILED)
	{
		spdlog::error("Failed to mmap IP2ASN TSV at {}: {}", DatabasePath.string(), WErrnoUtil::StrError());
		DatabaseMapping = nullptr;
		::close(DatabaseFd);
		DatabaseFd = -1;
		DatabaseMappingSize = 0;
		return false;
	}

	return true;
}

void WIP2AsnDB::UnmapDatabase()
{
	if (DatabaseMapping)
	{
		munmap(DatabaseMapping, DatabaseMappingSize);
		DatabaseMapping = nullptr;
		DatabaseMappingSize = 0;
	}
	if (DatabaseFd >= 0)
	{
		::close(DatabaseFd);
		DatabaseFd = -1;
	}
	V4Entries.clear();
	V6Entries.clear();
}

std::string_view WIP2AsnDB::GetLineAtOffset(uint64_t Offset) const
{
	if (!DatabaseMapping || Offset >= DatabaseMappingSize)
	{
		return {};
	}

	std::string_view const Contents(static_cast<char const*>(DatabaseMapping), DatabaseMappingSize);
	auto                   Line = Contents.substr(Offset);
	if (auto const NewLine = Line.find('\n'); NewLine != std::string_view::npos)
	{
		Line = Line.substr(0, NewLine);
	}
	if (!Line.empty() && Line.back() == '\r')
	{
		Line.remove_suffix(1);
	}
	return Line;
}

bool WIP2AsnDB::BuildIndex()
{
	V4Entries.clear();
	V6Entries.clear();
	MalformedLines = 0;

	uint64_t Offset = 0;
	while (Offset < DatabaseMappingSize)
	{
		auto const Line = GetLineAtOffset(Offset);
		auto const LineOffset = Offset;

		// advance past the '\n' terminating this line (GetLineAtOffset may have stripped a '\r' too)
		auto const* Begin = static_cast<char const*>(DatabaseMapping) + Offset;
		auto const* NewLine =
			static_cast<char const*>(std::memchr(Begin, '\n', DatabaseMappingSize - static_cast<size_t>(Offset)));
		Offset = NewLine ? static_cast<uint64_t>(NewLine - static_cast<char const*>(DatabaseMapping)) + 1
						 : DatabaseMappingSize;

		if (Line.empty())
		{
			continue;
		}

		auto             Rest = Line;
		std::string_view StartStr, EndStr;
		if (!NextField(Rest, StartStr) || !NextField(Rest, EndStr))
		{
			++MalformedLines;
			continue;
		}

		auto Start = WIPAddress::FromString(StartStr);
		auto End = WIPAddress::FromString(EndStr);
		if (!Start || !End || Start->Family != End->Family)
		{
			++MalformedLines;
			continue;
		}

		if (Start->Family == EIPFamily::IPv4)
		{
			WIP2AsnIndexEntryV4 Entry{};
			Entry.Start = Start->ToInt();
			Entry.End = End->ToInt();
			Entry.Offset = LineOffset;
			V4Entries.push_back(Entry);
		}
		else
		{
			WIP2AsnIndexEntryV6 Entry{};
			Entry.Start = Start->Bytes;
			Entry.End = End->Bytes;
			Entry.Offset = LineOffset;
			V6Entries.push_back(Entry);
		}
	}

	std::ranges::sort(V4Entries, [](auto const& A, auto const& B) { return A.Start < B.Start; });
	std::ranges::sort(V6Entries, [](auto const& A, auto const& B) { return CmpIPv6(A.Start, B.Start) < 0; });

	if (V4Entries.empty() && V6Entries.empty())
	{
		spdlog::error("IP2ASN TSV at {} contains no usable ranges ({} malformed lines)", DatabasePath.string(),
			MalformedLines);
		return false;
	}

	if (MalformedLines > 0)
	{
		spdlog::warn("Skipped {} malformed lines in IP2ASN TSV at {}", MalformedLines, DatabasePath.string());
	}

	spdlog::info("Built IP2ASN index: {} IPv4 entries, {} IPv6 entries", V4Entries.size(), V6Entries.size());
	return true;
}

std::optional<WIP2AsnLookupResult> WIP2AsnDB::ReadEntryAtOffset(uint64_t Offset) const
{
	auto Rest = GetLineAtOffset(Offset);
	if (Rest.empty())
	{
		return std::nullopt;
	}

	std::string_view StartStr, EndStr, AsnStr, CountryStr;
	if (!NextField(Rest, StartStr) || !NextField(Rest, EndStr) || !NextField(Rest, AsnStr)
		|| !NextField(Rest, CountryStr))
	{
		return std::nullopt;
	}

	auto Start = WIPAddress::FromString(StartStr);
	auto End = WIPAddress::FromString(EndStr);
	if (!Start || !End)
	{
		return std::nullopt;
	}

	WIP2AsnLookupResult Result{};
	Result.RangeStart = *Start;
	Result.RangeEnd = *End;
	Result.Country = std::string(CountryStr);
	Result.Organization = std::string(Rest);

	auto ParseResult = std::from_chars(AsnStr.data(), AsnStr.data() + AsnStr.size(), Result.ASN);
	if (ParseResult.ec != std::errc())
	{
		Result.ASN = 0;
	}

	return Result;
}

std::optional<WIP2AsnLookupResult> WIP2AsnDB::LookupIPv4(uint32_t IP) const
{
	if (V4Entries.empty())
	{
		return std::nullopt;
	}

	auto const Begin = V4Entries.begin();
	auto const End = V4Entries.end();
	auto       It =
		std::upper_bound(Begin, End, IP, [](uint32_t value, WIP2AsnIndexEntryV4 const& e) { return value < e.Start; });

	if (It == Begin)
	{
		return std::nullopt;
	}
	--It;
	if (IP >= It->Start && IP <= It->End)
	{
		return ReadEntryAtOffset(It->Offset);
	}
	return std::nullopt;
}

std::optional<WIP2AsnLookupResult> WIP2AsnDB::LookupIPv6(std::array<uint8_t, 16> const& IPBytes) const
{
	if (V6Entries.empty())
	{
		return std::nullopt;
	}
	auto Begin = V6Entries.begin();
	auto End = V6Entries.end();
	auto It = std::upper_bound(Begin, End, IPBytes,
		[](std::array<uint8_t, 16> const& value, WIP2AsnIndexEntryV6 const& e) { return CmpIPv6(value, e.Start) < 0; });
	if (It == Begin)
	{
		return std::nullopt;
	}
	--It;
	if (CmpIPv6(IPBytes, It->Start) >= 0 && CmpIPv6(IPBytes, It->End) <= 0)
	{
		return ReadEntryAtOffset(It->Offset);
	}
	return std::nullopt;
}

std::optional<WIP2AsnLookupResult> WIP2AsnDB::Lookup(WIPAddress const& IP) const
{
	if (IP.Family == EIPFamily::IPv4)
	{
		return LookupIPv4(IP.ToInt());
	}
	return LookupIPv6(IP.Bytes);
}
