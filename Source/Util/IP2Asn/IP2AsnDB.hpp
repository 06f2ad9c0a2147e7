/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "IPAddress.hpp"
#include "Types.hpp"

struct WIP2AsnLookupResult
{
	WAsn        ASN{};
	std::string Country;
	std::string Organization;

	// The TSV range the address fell into, both ends inclusive
	WIPAddress RangeStart{};
	WIPAddress RangeEnd{};
};

struct WIP2AsnIndexEntryV4
{
	uint32_t Start{};  // IPv4 address in host byte order
	uint32_t End{};    // inclusive
	uint64_t Offset{}; // byte offset in the TSV
};

struct WIP2AsnIndexEntryV6
{
	std::array<uint8_t, 16> Start{};
	std::array<uint8_t, 16> End{};
	uint64_t                Offset{}; // byte offset in the TSV
};

// Read-only view of an iptoasn.com style TSV (start, end, asn, country, description).
// The TSV stays memory mapped for the lifetime of the object, the range index lives on the heap.
class WIP2AsnDB
{
	std::filesystem::path DatabasePath;

	int         DatabaseFd{ -1 };
	void*       DatabaseMapping{ nullptr };
	size_t      DatabaseMappingSize{ 0 };
	std::size_t MalformedLines{ 0 };

	std::vector<WIP2AsnIndexEntryV4> V4Entries;
	std::vector<WIP2AsnIndexEntryV6> V6Entries;

	[[nodiscard]] std::string_view GetLineAtOffset(uint64_t Offset) const;

	[[nodiscard]] std::optional<WIP2AsnLookupResult> ReadEntryAtOffset(uint64_t Offset) const;

	bool MapDatabase();
	void UnmapDatabase();
	bool BuildIndex();

	[[nodiscard]] std::optional<WIP2AsnLookupResult> LookupIPv4(uint32_t IP) const;
	[[nodiscard]] std::optional<WIP2AsnLookupResult> LookupIPv6(std::array<uint8_t, 16> const& IPBytes) const;

public:
	explicit WIP2AsnDB(std::filesystem::path Path);
	~WIP2AsnDB();

	WIP2AsnDB(WIP2AsnDB const&) = delete;
	WIP2AsnDB& operator=(WIP2AsnDB const&) = delete;

	bool Init();

	[[nodiscard]] std::optional<WIP2AsnLookupResult> Lookup(WIPAddress const& IP) const;

	[[nodiscard]] std::size_t GetSize() const { return V4Entries.size() + V6Entries.size(); }

	[[nodiscard]] std::size_t GetMalformedLines() const { return MalformedLines; }

	[[nodiscard]] std::size_t MemoryUsage() const
	{
		return DatabaseMappingSize + V4Entries.capacity() * sizeof(WIP2AsnIndexEntryV4)
			+ V6Entries.capacity() * sizeof(WIP2AsnIndexEntryV6);
	}
};
