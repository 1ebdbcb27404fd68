//
// Created by usr on 19/11/2025.
//

#include "Daemon.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "Config.hpp"
#include "SignalHandler.hpp"
#include "Time.hpp"
#include "Communication/DaemonClient.hpp"
#include "Communication/DaemonWebSocket.hpp"

WDaemon::WDaemon()
{
	WConfig::GetInstance().LogConfig();
}

bool WDaemon::InitMonitor()
{
	auto const& Cfg = WConfig::GetInstance();
	Monitor = std::make_unique<WPortMonitor>(ProcessTable, Cfg.Classifier, Cfg.Resolver);
	PollTask = std::make_unique<WPollTask>(*Monitor, Cfg.PollInterval);

	if (!Monitor->IsElevated())
	{
		spdlog::warn("wharfd is not running as root, ports of other users' processes will be missing");
	}

	// Fail early if the socket tables are not readable at all
	WPortSnapshot Snapshot{};
	if (Monitor->GetSnapshot(Snapshot) != ECollectResult::Success)
	{
		spdlog::error("Initial port collection failed");
		return false;
	}
	spdlog::info("{} system and {} user ports in use", Snapshot.SystemEntries.size(), Snapshot.UserEntries.size());

	PollTask->OnChanged.connect(&WDaemon::BroadcastSnapshot, this);
	PollTask->OnFailed.connect(&WDaemon::BroadcastCollectFailure, this);
	return true;
}

bool WDaemon::InitSocket()
{
	auto const& Cfg = WConfig::GetInstance();
	Server = std::make_shared<WDaemonWebSocket>(Cfg.Port, Cfg.AuthToken);
	Server->GetNewConnectionSignal().connect(&WDaemon::OnNewConnection, this);
	Server->GetClientClosedSignal().connect(&WDaemon::OnClientClosed, this);

	if (!Server->Start())
	{
		spdlog::error("Failed to start the WebSocket server on port {}", Cfg.Port);
		return false;
	}
	return true;
}

void WDaemon::RunLoop()
{
	PollTask->Start();
	WSignalHandler::GetInstance().WaitForStop();

	spdlog::info("Stopping");
	PollTask->Stop();
	spdlog::info("Ran {} poll cycles, skipped {} ticks", PollTask->GetCycleCount(), PollTask->GetSkippedTicks());
	Server->Stop();

	std::lock_guard Lock(ClientsMutex);
	Clients.clear();
}

WSnapshotMessage WDaemon::MakeSnapshotMessage(WPortSnapshot const& Snapshot)
{
	WSnapshotMessage Message{};
	Message.Snapshot = Snapshot;
	Message.bIsElevated = Monitor->IsElevated();
	Message.CollectedAtMs = WTime::GetEpochMs();
	Message.SystemCount = static_cast<uint32_t>(Snapshot.SystemEntries.size());
	Message.UserCount = static_cast<uint32_t>(Snapshot.UserEntries.size());
	return Message;
}

void WDaemon::SendSnapshot(WDaemonClient& Client)
{
	WPortSnapshot Snapshot{};
	if (Monitor->GetSnapshot(Snapshot) != ECollectResult::Success)
	{
		Client.SendMessage(MT_CollectFailed, WCollectFailure{ "Failed to enumerate sockets" });
		return;
	}
	Client.SendMessage(MT_Snapshot, MakeSnapshotMessage(Snapshot));
}

void WDaemon::OnNewConnection(std::shared_ptr<WDaemonClient> const& Client)
{
	Client->OnRefreshRequest.connect(&WDaemon::OnRefreshRequest, this);
	Client->OnTerminateRequest.connect(&WDaemon::OnTerminateRequest, this);

	Client->SendMessage(MT_Handshake, WProtocolHandshake{ WHARF_PROTOCOL_VERSION, GIT_COMMIT_HASH });
	SendSnapshot(*Client);

	bool bFirst{};
	{
		std::lock_guard Lock(ClientsMutex);
		bFirst = Clients.empty();
		Clients.push_back(Client);
	}
	if (bFirst)
	{
		// Whatever the poll task saw while nobody listened is news now
		Monitor->ForceNextChange();
	}
}

void WDaemon::OnClientClosed(WDaemonClient* Client)
{
	std::lock_guard Lock(ClientsMutex);
	std::erase_if(Clients, [Client](auto const& Other) { return Other.get() == Client; });
}

void WDaemon::OnRefreshRequest(WDaemonClient& Client)
{
	SendSnapshot(Client);
}

void WDaemon::OnTerminateRequest(WDaemonClient& Client, WTerminateRequest const& Request)
{
	spdlog::info("Client requested termination of {} ({})", Request.Pid,
		Request.Mode == ETerminateMode::Tree ? "tree" : "single");
	Client.SendMessage(MT_TerminateResult, Monitor->Terminate(Request.Pid, Request.Mode));
}

void WDaemon::BroadcastSnapshot(WPortSnapshot const& Snapshot)
{
	std::lock_guard Lock(ClientsMutex);
	if (Clients.empty())
	{
		return;
	}

	std::string const Data = WDaemonClient::EncodeMessage(MT_Snapshot, MakeSnapshotMessage(Snapshot));
	for (auto const& Client : Clients)
	{
		if (Client->SendFramedData(Data) < 0)
		{
			spdlog::error("Failed to send snapshot to client");
		}
	}
}

void WDaemon::BroadcastCollectFailure()
{
	std::lock_guard Lock(ClientsMutex);
	std::string const Data = WDaemonClient::EncodeMessage(MT_CollectFailed, WCollectFailure{ "Failed to enumerate sockets" });
	for (auto const& Client : Clients)
	{
		Client->SendFramedData(Data);
	}
}
