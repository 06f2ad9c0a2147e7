/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <stdexcept>
#include <string>

enum class EGeoError
{
	InvalidHost,
	NoSuchHost,
	DatabaseLoad,
	DatabaseUnavailable,
};

class WGeoError : public std::runtime_error
{
	EGeoError Code;

public:
	WGeoError(EGeoError Code_, std::string const& Message) : std::runtime_error(Message), Code(Code_) {}

	[[nodiscard]] EGeoError GetCode() const noexcept { return Code; }

	[[nodiscard]] static char const* CodeName(EGeoError Code)
	{
		switch (Code)
		{
			case EGeoError::InvalidHost:
				return "INVALID_HOST";
			case EGeoError::NoSuchHost:
				return "NO_SUCH_HOST";
			case EGeoError::DatabaseLoad:
				return "DATABASE_LOAD_ERROR";
			case EGeoError::DatabaseUnavailable:
			default:
				return "INTERNAL_ERROR";
		}
	}
};

// Thrown while building a snapshot; Table names the data source that failed (asn, city, region, asn-catalog)
class WDatabaseLoadError final : public WGeoError
{
	std::string Table;

public:
	WDatabaseLoadError(std::string Table_, std::string const& Message)
		: WGeoError(EGeoError::DatabaseLoad, Table_ + ": " + Message)
		, Table(std::move(Table_))
	{
	}

	[[nodiscard]] std::string const& GetTable() const noexcept { return Table; }
};
