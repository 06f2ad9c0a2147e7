/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ResponseAssembler.hpp"

namespace
{
	WJson CountryToJson(std::optional<WCountry> const& Country)
	{
		if (!Country)
		{
			return nullptr;
		}
		return WJson::object{
			{ JSON_KEY_CODE, Country->Code },
			{ JSON_KEY_NAME, Country->Name },
		};
	}

	WJson StringsToJson(std::vector<std::string> const& Strings)
	{
		WJson::array Array;
		Array.reserve(Strings.size());
		for (auto const& Str : Strings)
		{
			Array.emplace_back(Str);
		}
		return Array;
	}
} // namespace

WJson WResponseAssembler::AssembleRecord(WGeoRecord const& Record)
{
	WJson::object Json;
	Json[JSON_KEY_IP] = Record.Address.ToString();

	if (Record.Asn)
	{
		Json[JSON_KEY_AS] = WJson::object{
			{ JSON_KEY_AS_NUMBER, static_cast<double>(Record.Asn->Number) },
			{ JSON_KEY_AS_NAME, Record.Asn->Organization },
			{ JSON_KEY_AS_INFO, Record.Asn->Info.value_or(Record.Asn->Organization) },
		};
	}
	else
	{
		Json[JSON_KEY_AS] = nullptr;
	}

	Json[JSON_KEY_ADDR] = Record.Span ? WJson(Record.Span->ToString()) : WJson(nullptr);

	if (Record.Placement && Record.Placement->Location)
	{
		Json[JSON_KEY_LOCATION] = WJson::object{
			{ JSON_KEY_LATITUDE, Record.Placement->Location->Latitude },
			{ JSON_KEY_LONGITUDE, Record.Placement->Location->Longitude },
		};
	}
	else
	{
		Json[JSON_KEY_LOCATION] = nullptr;
	}

	if (Record.Placement)
	{
		auto const& Placement = *Record.Placement;
		Json[JSON_KEY_COUNTRY] = CountryToJson(Placement.Country);
		Json[JSON_KEY_REGISTERED_COUNTRY] = CountryToJson(Placement.RegisteredCountry);
		Json[JSON_KEY_REGIONS] = StringsToJson(Placement.Regions);
		Json[JSON_KEY_REGIONS_SHORT] = StringsToJson(Placement.RegionsShort);
		Json[JSON_KEY_TYPE] = Placement.Category ? WJson(*Placement.Category) : WJson(nullptr);
	}
	else
	{
		Json[JSON_KEY_COUNTRY] = nullptr;
		Json[JSON_KEY_REGISTERED_COUNTRY] = nullptr;
		Json[JSON_KEY_REGIONS] = WJson::array{};
		Json[JSON_KEY_REGIONS_SHORT] = WJson::array{};
		// The ASN catalog may still know the network use
		Json[JSON_KEY_TYPE] = Record.Asn && Record.Asn->NetworkType ? WJson(*Record.Asn->NetworkType) : WJson(nullptr);
	}

	return Json;
}

WJson WResponseAssembler::Assemble(WResolutionResult const& Result)
{
	if (Result.bSingleAddress && Result.Records.size() == 1)
	{
		return AssembleRecord(Result.Records.front());
	}

	WJson::array Ips;
	Ips.reserve(Result.Records.size());
	for (auto const& Record : Result.Records)
	{
		Ips.push_back(AssembleRecord(Record));
	}
	return WJson::object{
		{ JSON_KEY_HOST, Result.Host },
		{ JSON_KEY_IPS, Ips },
	};
}

WJson WResponseAssembler::AssembleError(int Status, std::string_view Code, std::string const& Message)
{
	return WJson::object{
		{ JSON_KEY_CODE, Status },
		{ JSON_KEY_ERROR, std::string(Code) },
		{ JSON_KEY_MESSAGE, Message },
	};
}
