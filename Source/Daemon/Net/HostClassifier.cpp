/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "HostClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>

#include "Geo/GeoError.hpp"

namespace
{
	std::string_view Trim(std::string_view Str)
	{
		auto const First = Str.find_first_not_of(" \t\r\n\v\f");
		if (First == std::string_view::npos)
		{
			return {};
		}
		auto const Last = Str.find_last_not_of(" \t\r\n\v\f");
		return Str.substr(First, Last - First + 1);
	}

	[[noreturn]] void ThrowInvalid(std::string_view Raw, char const* Reason)
	{
		throw WGeoError(EGeoError::InvalidHost, "invalid host '" + std::string(Raw) + "': " + Reason);
	}

	bool IsDottedQuad(std::string_view Str)
	{
		return std::ranges::count(Str, '.') == 3
			&& std::ranges::all_of(Str, [](char C) { return C == '.' || std::isdigit(static_cast<unsigned char>(C)); });
	}

	// Parses an IPv6 literal, an optional %zone is dropped
	std::optional<WIPAddress> ParseIPv6(std::string_view Str)
	{
		if (auto const Zone = Str.find('%'); Zone != std::string_view::npos)
		{
			if (Zone + 1 == Str.size())
			{
				return std::nullopt;
			}
			Str = Str.substr(0, Zone);
		}
		auto Address = WIPAddress::FromString(Str);
		if (!Address || Address->Family != EIPFamily::IPv6)
		{
			return std::nullopt;
		}
		return Address;
	}

	bool IsLabelChar(char C)
	{
		return std::isalnum(static_cast<unsigned char>(C)) || C == '-' || C == '_';
	}
} // namespace

bool WHostClassifier::IsValidHostname(std::string_view Name)
{
	if (Name.empty() || Name.size() > MaxHostnameLength)
	{
		return false;
	}

	std::size_t Start = 0;
	while (Start <= Name.size())
	{
		auto End = Name.find('.', Start);
		if (End == std::string_view::npos)
		{
			End = Name.size();
		}

		auto const Label = Name.substr(Start, End - Start);
		if (Label.empty() || Label.size() > MaxLabelLength)
		{
			return false;
		}
		if (Label.front() == '-' || Label.back() == '-')
		{
			return false;
		}
		if (!std::ranges::all_of(Label, IsLabelChar))
		{
			return false;
		}
		Start = End + 1;
	}
	return true;
}

WClassifiedHost WHostClassifier::Classify(std::string_view Raw)
{
	auto const Input = Trim(Raw);
	if (Input.empty())
	{
		ThrowInvalid(Raw, "empty host");
	}
	if (Input.size() > MaxInputLength)
	{
		ThrowInvalid(Input.substr(0, 32), "host too long");
	}

	WClassifiedHost Result{};
	Result.Kind = EHostKind::Address;

	if (Input.front() == '[')
	{
		if (Input.back() != ']')
		{
			ThrowInvalid(Input, "unterminated bracket");
		}
		auto Address = ParseIPv6(Input.substr(1, Input.size() - 2));
		if (!Address)
		{
			ThrowInvalid(Input, "brackets must contain an IPv6 address");
		}
		Result.Address = Address->Unmapped();
		return Result;
	}

	if (IsDottedQuad(Input))
	{
		auto Address = WIPAddress::FromString(Input);
		if (!Address || Address->Family != EIPFamily::IPv4)
		{
			ThrowInvalid(Input, "malformed IPv4 address");
		}
		Result.Address = *Address;
		return Result;
	}

	if (Input.find(':') != std::string_view::npos)
	{
		auto Address = ParseIPv6(Input);
		if (!Address)
		{
			ThrowInvalid(Input, "malformed IPv6 address");
		}
		Result.Address = Address->Unmapped();
		return Result;
	}

	auto Name = Input;
	if (Name.back() == '.')
	{
		Name.remove_suffix(1);
	}
	if (!IsValidHostname(Name))
	{
		ThrowInvalid(Input, "not an IP address or hostname");
	}

	Result.Kind = EHostKind::Hostname;
	Result.Hostname.reserve(Name.size());
	std::ranges::transform(Name, std::back_inserter(Result.Hostname),
		[](char C) { return static_cast<char>(std::tolower(static_cast<unsigned char>(C))); });
	return Result;
}
