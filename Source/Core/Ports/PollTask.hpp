/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include <sigslot/signal.hpp>

#include "PortMonitor.hpp"
#include "Types.hpp"

// Runs PollForChange on its own thread at a fixed interval.
// A cycle runs on the tick thread so two cycles never overlap, ticks missed
// while a cycle was running are skipped instead of queued.
class WPollTask
{
public:
	using FClock = std::chrono::steady_clock;

private:
	WPortMonitor& Monitor;
	WMilliseconds Interval;

	std::thread             Thread{};
	std::atomic<bool>       bRunning{ false };
	std::mutex              WakeMutex{};
	std::condition_variable WakeCondition{};

	std::atomic<uint64_t> CycleCount{};
	std::atomic<uint64_t> SkippedTicks{};

	void ThreadFunction();

public:
	// Emitted on the poll thread
	sigslot::signal<WPortSnapshot const&> OnChanged;
	sigslot::signal<>                     OnFailed;

	WPollTask(WPortMonitor& Monitor_, WMilliseconds Interval_);
	~WPollTask();

	WPollTask(WPollTask const&) = delete;
	WPollTask& operator=(WPollTask const&) = delete;

	bool Start();

	// Waits for a running cycle to finish
	void Stop();

	// One cycle on the calling thread
	EPollResult RunOnce();

	[[nodiscard]] bool     IsRunning() const { return bRunning; }
	[[nodiscard]] uint64_t GetCycleCount() const { return CycleCount; }
	[[nodiscard]] uint64_t GetSkippedTicks() const { return SkippedTicks; }

	// The first tick on the Scheduled + n * Interval grid that lies after Now,
	// OutSkipped is the number of grid points passed over
	static FClock::time_point ComputeNextTick(
		FClock::time_point Scheduled, FClock::time_point Now, WMilliseconds Interval, uint64_t& OutSkipped);
};
