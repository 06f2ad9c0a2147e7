//
// Created by usr on 27/10/2025.
//

#pragma once
#include <json11.hpp>

using WJson = json11::Json;

// Json consts
#define wJC static constexpr char const*

wJC JSON_KEY_IP = "ip";
wJC JSON_KEY_AS = "as";
wJC JSON_KEY_AS_NUMBER = "number";
wJC JSON_KEY_AS_NAME = "name";
wJC JSON_KEY_AS_INFO = "info";
wJC JSON_KEY_ADDR = "addr";
wJC JSON_KEY_LOCATION = "location";
wJC JSON_KEY_LATITUDE = "latitude";
wJC JSON_KEY_LONGITUDE = "longitude";
wJC JSON_KEY_COUNTRY = "country";
wJC JSON_KEY_REGISTERED_COUNTRY = "registered_country";
wJC JSON_KEY_CODE = "code";
wJC JSON_KEY_NAME = "name";
wJC JSON_KEY_REGIONS = "regions";
wJC JSON_KEY_REGIONS_SHORT = "regions_short";
wJC JSON_KEY_TYPE = "type";
wJC JSON_KEY_HOST = "host";
wJC JSON_KEY_IPS = "ips";
wJC JSON_KEY_ERROR = "error";
wJC JSON_KEY_MESSAGE = "message";

// asn_info.json
wJC JSON_KEY_ASN_INFO = "asn_info";
