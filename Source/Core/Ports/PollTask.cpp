/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "PollTask.hpp"

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>

WPollTask::WPollTask(WPortMonitor& Monitor_, WMilliseconds Interval_)
	: Monitor(Monitor_), Interval(Interval_.count() > 0 ? Interval_ : WMilliseconds(1))
{
}

WPollTask::~WPollTask()
{
	Stop();
}

WPollTask::FClock::time_point WPollTask::ComputeNextTick(
	FClock::time_point Scheduled, FClock::time_point Now, WMilliseconds Interval, uint64_t& OutSkipped)
{
	OutSkipped = 0;
	auto Next = Scheduled + Interval;
	if (Next > Now)
	{
		return Next;
	}

	// Grid points in (Scheduled, Now] were missed
	auto const Late = Now - Scheduled;
	OutSkipped = static_cast<uint64_t>(Late / Interval);
	return Scheduled + Interval * static_cast<int64_t>(OutSkipped + 1);
}

EPollResult WPollTask::RunOnce()
{
	ZoneScopedN("PollCycle");
	WPortSnapshot Snapshot{};
	auto          Result = Monitor.PollForChange(Snapshot);
	++CycleCount;

	switch (Result)
	{
		case EPollResult::Changed:
			spdlog::debug("Port snapshot changed ({} entries)", Snapshot.Size());
			OnChanged(Snapshot);
			break;
		case EPollResult::Failed:
			spdlog::error("Poll cycle failed");
			OnFailed();
			break;
		case EPollResult::NoChange:
			break;
	}
	return Result;
}

void WPollTask::ThreadFunction()
{
	pthread_setname_np(pthread_self(), "wharf-poll");

	auto Scheduled = FClock::now();
	while (bRunning)
	{
		RunOnce();

		uint64_t Skipped{};
		Scheduled = ComputeNextTick(Scheduled, FClock::now(), Interval, Skipped);
		if (Skipped > 0)
		{
			SkippedTicks += Skipped;
			spdlog::debug("Poll cycle overran, skipped {} tick(s)", Skipped);
		}

		std::unique_lock Lock(WakeMutex);
		WakeCondition.wait_until(Lock, Scheduled, [this] { return !bRunning; });
	}
}

bool WPollTask::Start()
{
	if (bRunning.exchange(true))
	{
		return false;
	}
	Thread = std::thread(&WPollTask::ThreadFunction, this);
	spdlog::info("Polling every {} ms", Interval.count());
	return true;
}

void WPollTask::Stop()
{
	{
		std::lock_guard Lock(WakeMutex);
		bRunning = false;
	}
	WakeCondition.notify_all();

	if (Thread.joinable())
	{
		Thread.join();
	}
}
