/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <libwebsockets.h>

#include "Communication/IServerSocket.hpp"

class WClientWebSocket;

class WDaemonWebSocket final : public IServerSocket
{
	FNewConnectionSignal OnNewConnection;
	FClientClosedSignal  OnClientClosed;

	int         Port{};
	std::string AuthToken{};

	lws_context*      Context{ nullptr };
	std::thread       ListenThread;
	std::atomic<bool> Running{ false };
	std::mutex        ClientsMutex;

	// Map from lws* to client wrapper
	std::unordered_map<lws*, std::shared_ptr<WClientWebSocket>> Clients;
	std::unordered_map<lws*, std::shared_ptr<WDaemonClient>>    DaemonClients;

	void ListenThreadFunction() const;

public:
	WDaemonWebSocket(int Port_, std::string AuthToken_);
	~WDaemonWebSocket() override;

	FNewConnectionSignal& GetNewConnectionSignal() override { return OnNewConnection; }
	FClientClosedSignal&  GetClientClosedSignal() override { return OnClientClosed; }

	bool Start() override;
	void Stop() override;

	[[nodiscard]] bool IsAuthorized(lws* Wsi) const;

	// Called from the callback to register/unregister clients
	void                              RegisterClient(lws* Wsi, std::shared_ptr<WClientWebSocket> Client);
	void                              UnregisterClient(lws* Wsi);
	std::shared_ptr<WClientWebSocket> GetClient(lws* Wsi);

	// Turns writes queued by other threads into writable callbacks
	void FlushPendingWrites();
};
