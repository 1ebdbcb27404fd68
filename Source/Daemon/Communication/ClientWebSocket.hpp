/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

#include <libwebsockets.h>
#include <sigslot/signal.hpp>

#include "Communication/IClientSocket.hpp"

// One websocket connection. libwebsockets only allows touching a wsi from its service
// thread, so SendFramed() just queues and wakes that thread, the Service* calls below
// are made from the protocol callback and do the actual I/O.
class WClientWebSocket final : public IClientSocket
{
public:
	// Frames above this are a protocol error, a snapshot of a busy machine is a few hundred kB
	static constexpr uint32_t MaxFrameLength = 16 * 1024 * 1024;

private:
	std::atomic<lws*> Wsi{ nullptr }; // cleared once lws reports the connection closed
	lws_context*      Context{ nullptr };
	std::atomic<bool> bConnected{ true };
	std::atomic<bool> bWritePending{ false };

	sigslot::signal<WBuffer&> OnData;
	sigslot::signal<>         OnClosed;

	// Frames waiting for a writable callback, each starts with LWS_PRE bytes of headroom
	std::mutex                    OutboxMutex;
	std::deque<std::vector<char>> Outbox;

	// Service thread only, partial frames carried over between receive callbacks
	std::vector<char> Inbox;

public:
	WClientWebSocket(lws* Wsi_, lws_context* Context_);

	sigslot::signal<WBuffer&>& GetDataSignal() override { return OnData; }
	sigslot::signal<>&         GetClosedSignal() override { return OnClosed; }

	[[nodiscard]] bool IsConnected() const override;

	// Marks the connection dead, lws drops it when the next frame from the client arrives
	void Close() override;

	ssize_t SendFramed(std::string const& Data) override;

	// Service thread
	void ServiceReceive(char const* Data, size_t Len);
	void ServiceWritable();
	void ServiceClosed();
	void ServiceWakeUp();
};
