/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <string_view>

// Shaping of administrative region names. All strings are UTF-8.
class WRegionNames
{
public:
	[[nodiscard]] static bool IsAscii(std::string_view Name);

	// True if Name contains at least one CJK unified ideograph
	[[nodiscard]] static bool ContainsCjk(std::string_view Name);

	[[nodiscard]] static std::size_t CountCodePoints(std::string_view Name);

	// First Count code points of Name
	[[nodiscard]] static std::string TruncateCodePoints(std::string_view Name, std::size_t Count);

	// Appends 省 unless the name already carries 省, 自治区 or 特别行政区
	[[nodiscard]] static std::string WithProvinceSuffix(std::string_view Name);

	// Appends 市 unless already present
	[[nodiscard]] static std::string WithCitySuffix(std::string_view Name);

	// 广东省 -> 广东, 新疆维吾尔自治区 -> 新疆, 北京市 -> 北京, ASCII names are returned unchanged
	[[nodiscard]] static std::string ShortName(std::string_view Name);
};
