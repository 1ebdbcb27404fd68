/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ClientWebSocket.hpp"

#include <cstring>
#include <spdlog/spdlog.h>

WClientWebSocket::WClientWebSocket(lws* Wsi_, lws_context* Context_) : Wsi(Wsi_), Context(Context_) {}

bool WClientWebSocket::IsConnected() const
{
	return bConnected && Wsi != nullptr;
}

void WClientWebSocket::Close()
{
	bConnected = false;
	// The actual close is handled by libwebsockets
}

ssize_t WClientWebSocket::SendFramed(std::string const& Data)
{
	if (!IsConnected())
	{
		return -1;
	}

	// Prepare framed data with 4-byte length prefix
	auto const        Length = static_cast<uint32_t>(Data.size());
	std::vector<char> FramedData(LWS_PRE + sizeof(uint32_t) + Data.size());

	// Copy length prefix after LWS_PRE padding
	std::memcpy(FramedData.data() + LWS_PRE, &Length, sizeof(uint32_t));
	std::memcpy(FramedData.data() + LWS_PRE + sizeof(uint32_t), Data.data(), Data.size());

	{
		std::lock_guard Lock(OutboxMutex);
		Outbox.push_back(std::move(FramedData));
	}

	// lws_callback_on_writable() may only be called from the service thread,
	// wake it up and let it pick up the pending write
	bWritePending = true;
	lws_cancel_service(Context);

	return static_cast<ssize_t>(sizeof(uint32_t) + Data.size());
}

void WClientWebSocket::ServiceReceive(char const* Data, size_t Len)
{
	// Accumulate data (handle fragmented messages)
	Inbox.insert(Inbox.end(), Data, Data + Len);

	// Try to extract complete frames
	while (Inbox.size() >= sizeof(uint32_t))
	{
		uint32_t FrameLength = 0;
		std::memcpy(&FrameLength, Inbox.data(), sizeof(uint32_t));

		if (FrameLength > MaxFrameLength)
		{
			spdlog::warn("Dropping client frame of {} bytes", FrameLength);
			Inbox.clear();
			bConnected = false;
			return;
		}

		if (Inbox.size() < sizeof(uint32_t) + FrameLength)
		{
			// Not enough data for complete frame
			break;
		}

		WBuffer FrameBuffer(FrameLength);
		FrameBuffer.Write(Inbox.data() + sizeof(uint32_t), FrameLength);

		Inbox.erase(
			Inbox.begin(), Inbox.begin() + static_cast<ptrdiff_t>(sizeof(uint32_t) + FrameLength));

		OnData(FrameBuffer);
	}
}

void WClientWebSocket::ServiceWritable()
{
	std::lock_guard Lock(OutboxMutex);

	if (Outbox.empty() || !Wsi)
	{
		return;
	}

	auto& Front = Outbox.front();
	// Data starts after LWS_PRE padding
	size_t DataLen = Front.size() - LWS_PRE;
	int    Written =
		lws_write(Wsi.load(), reinterpret_cast<unsigned char*>(Front.data() + LWS_PRE), DataLen, LWS_WRITE_BINARY);

	if (Written < 0)
	{
		spdlog::error("WebSocket write failed");
		bConnected = false;
		return;
	}

	Outbox.pop_front();

	// If more data to send, request another write callback
	if (!Outbox.empty())
	{
		lws_callback_on_writable(Wsi);
	}
}

void WClientWebSocket::ServiceClosed()
{
	bConnected = false;
	Wsi = nullptr;
	OnClosed();
}

void WClientWebSocket::ServiceWakeUp()
{
	if (bWritePending.exchange(false) && Wsi && bConnected)
	{
		lws_callback_on_writable(Wsi);
	}
}
