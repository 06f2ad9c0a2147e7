#pragma once
#include <chrono>
#include <string>
#include <spdlog/fmt/fmt.h>

#include "Types.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-function"

namespace WTime
{
	static WMsec GetEpochMs()
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::system_clock::now().time_since_epoch())
			.count();
	}

	static WMsec GetSteadyMs()
	{
		return std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now().time_since_epoch())
			.count();
	}

	static std::string FormatDuration(WMsec DurationMs)
	{
		if (DurationMs < 1000)
		{
			return fmt::format("{}ms", DurationMs);
		}
		return fmt::format("{:.2f}s", static_cast<double>(DurationMs) / 1000.0);
	}
} // namespace WTime

#pragma GCC diagnostic pop
