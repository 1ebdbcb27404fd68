/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Daemon.hpp"

#include <cstdlib>
#include <spdlog/spdlog.h>

#include "Config.hpp"
#include "SignalHandler.hpp"

int main()
{
	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	spdlog::info("Wharf daemon starting ({})", GIT_COMMIT_HASH);
	auto& Cfg = WConfig::GetInstance();
	Cfg.ApplyLogLevel();

	// Installs the SIGINT/SIGTERM handlers before any thread is started
	WSignalHandler::GetInstance();

	auto& Daemon = WDaemon::GetInstance();
	if (!Daemon.InitMonitor() || !Daemon.InitSocket())
	{
		return -1;
	}

	Daemon.RunLoop();
	spdlog::info("Wharf daemon stopped");
	return 0;
}
