#pragma once
#include <chrono>
#include <ctime>
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

	// Local wall clock time as HH:MM:SS
	static std::string FormatClock(WMsec EpochMs)
	{
		std::time_t const Seconds = static_cast<std::time_t>(EpochMs / 1000);
		std::tm           Local{};
		if (localtime_r(&Seconds, &Local) == nullptr)
		{
			return "--:--:--";
		}
		return fmt::format("{:02}:{:02}:{:02}", Local.tm_hour, Local.tm_min, Local.tm_sec);
	}
} // namespace WTime

#pragma GCC diagnostic pop
