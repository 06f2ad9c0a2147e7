//
// Created by usr on 26/10/2025.
//

#pragma once
#include <cstdint>

using WMsec = int64_t;
using WAsn = uint32_t;
using WSnapshotGeneration = uint64_t;
using WRequestId = uint64_t;
