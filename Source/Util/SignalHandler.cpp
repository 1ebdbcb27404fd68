//
// Created by usr on 09/10/2025.
//

#include "SignalHandler.hpp"

#include <csignal>
#include <thread>
#include <chrono>

static void OnStopSignal(int)
{
	WSignalHandler::GetInstance().bStop = true;
}

WSignalHandler::WSignalHandler()
{
	signal(SIGINT, OnStopSignal);
	signal(SIGTERM, OnStopSignal);
	// a client vanishing mid write must not take the daemon down
	signal(SIGPIPE, SIG_IGN);
}

void WSignalHandler::WaitForStop(int IntervalMs) const
{
	while (!bStop)
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(IntervalMs));
	}
}
