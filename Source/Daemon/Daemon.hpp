/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <mutex>
#include <vector>

#include "Singleton.hpp"
#include "Communication/IServerSocket.hpp"
#include "Data/Protocol.hpp"
#include "Data/Termination.hpp"
#include "Os/LinuxProcessTable.hpp"
#include "Ports/PollTask.hpp"
#include "Ports/PortMonitor.hpp"

class WDaemonClient;

class WDaemon : public TSingleton<WDaemon>
{
	WLinuxProcessTable            ProcessTable{};
	std::unique_ptr<WPortMonitor> Monitor{};
	std::unique_ptr<WPollTask>    PollTask{};

	std::shared_ptr<IServerSocket> Server{};

	std::mutex                                  ClientsMutex{};
	std::vector<std::shared_ptr<WDaemonClient>> Clients{};

	void OnNewConnection(std::shared_ptr<WDaemonClient> const& Client);
	void OnClientClosed(WDaemonClient* Client);
	void OnRefreshRequest(WDaemonClient& Client);
	void OnTerminateRequest(WDaemonClient& Client, WTerminateRequest const& Request);

	void SendSnapshot(WDaemonClient& Client);
	void BroadcastSnapshot(WPortSnapshot const& Snapshot);
	void BroadcastCollectFailure();

	WSnapshotMessage MakeSnapshotMessage(WPortSnapshot const& Snapshot);

public:
	WDaemon();
	bool InitMonitor();
	bool InitSocket();

	// Blocks until SIGINT/SIGTERM
	void RunLoop();
};
