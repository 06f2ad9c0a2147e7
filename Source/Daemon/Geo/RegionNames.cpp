/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "RegionNames.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

namespace
{
	constexpr std::array<std::string_view, 7> AdministrativeAffixes = {
		"省",
		"自治区",
		"维吾尔",
		"壮族",
		"回族",
		"市",
		"特别行政区",
	};

	// Municipalities and SARs, kept whole
	constexpr std::array<std::string_view, 6> WholeNames = {
		"北京",
		"上海",
		"天津",
		"重庆",
		"香港",
		"澳门",
	};

	bool IsContinuationByte(unsigned char Byte)
	{
		return (Byte & 0xC0) == 0x80;
	}

	std::string_view Trim(std::string_view Name)
	{
		auto const First = Name.find_first_not_of(" \t\r\n");
		if (First == std::string_view::npos)
		{
			return {};
		}
		auto const Last = Name.find_last_not_of(" \t\r\n");
		return Name.substr(First, Last - First + 1);
	}

	void RemoveAll(std::string& Str, std::string_view Needle)
	{
		std::size_t Pos = 0;
		while ((Pos = Str.find(Needle, Pos)) != std::string::npos)
		{
			Str.erase(Pos, Needle.size());
		}
	}
} // namespace

bool WRegionNames::IsAscii(std::string_view Name)
{
	return std::ranges::all_of(Name, [](char C) { return static_cast<unsigned char>(C) < 0x80; });
}

bool WRegionNames::ContainsCjk(std::string_view Name)
{
	for (std::size_t i = 0; i < Name.size(); ++i)
	{
		auto const Lead = static_cast<unsigned char>(Name[i]);
		if ((Lead & 0xF0) != 0xE0 || i + 2 >= Name.size())
		{
			continue;
		}

		// three byte sequences cover U+0800..U+FFFF
		uint32_t const CodePoint = ((Lead & 0x0Fu) << 12) | ((static_cast<unsigned char>(Name[i + 1]) & 0x3Fu) << 6)
			| (static_cast<unsigned char>(Name[i + 2]) & 0x3Fu);
		if ((CodePoint >= 0x4E00 && CodePoint <= 0x9FFF) || (CodePoint >= 0x3400 && CodePoint <= 0x4DBF))
		{
			return true;
		}
	}
	return false;
}

std::size_t WRegionNames::CountCodePoints(std::string_view Name)
{
	return static_cast<std::size_t>(
		std::ranges::count_if(Name, [](char C) { return !IsContinuationByte(static_cast<unsigned char>(C)); }));
}

std::string WRegionNames::TruncateCodePoints(std::string_view Name, std::size_t Count)
{
	std::size_t Seen = 0;
	for (std::size_t i = 0; i < Name.size(); ++i)
	{
		if (IsContinuationByte(static_cast<unsigned char>(Name[i])))
		{
			continue;
		}
		if (Seen == Count)
		{
			return std::string(Name.substr(0, i));
		}
		++Seen;
	}
	return std::string(Name);
}

std::string WRegionNames::WithProvinceSuffix(std::string_view Name)
{
	if (Name.ends_with("省") || Name.ends_with("自治区") || Name.ends_with("特别行政区"))
	{
		return std::string(Name);
	}
	return std::string(Name) + "省";
}

std::string WRegionNames::WithCitySuffix(std::string_view Name)
{
	if (Name.ends_with("市"))
	{
		return std::string(Name);
	}
	return std::string(Name) + "市";
}

std::string WRegionNames::ShortName(std::string_view Name)
{
	auto const Trimmed = Trim(Name);
	if (IsAscii(Trimmed))
	{
		return std::string(Trimmed);
	}

	std::string Short(Trimmed);
	for (auto const Affix : AdministrativeAffixes)
	{
		RemoveAll(Short, Affix);
	}

	if (std::ranges::find(WholeNames, std::string_view(Short)) != WholeNames.end())
	{
		return Short;
	}

	if (CountCodePoints(Short) <= 2)
	{
		return Short;
	}
	return TruncateCodePoints(Short, 2);
}
