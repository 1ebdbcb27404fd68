/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DaemonClient.hpp"

WDaemonClient::WDaemonClient(std::shared_ptr<IClientSocket> CS)
	: ClientSocket(std::move(CS)), DataConnection(ClientSocket->GetDataSignal().connect(&WDaemonClient::HandleFrame, this))
{
}

void WDaemonClient::HandleFrame(WBuffer& Frame)
{
	auto Type = ReadMessageTypeFromBuffer(Frame);
	if (Type == MT_Invalid)
	{
		spdlog::warn("Received invalid message type from client");
		return;
	}
	spdlog::debug("Received message: {}", static_cast<int>(Type));

	switch (Type)
	{
		case MT_RefreshRequest:
			OnRefreshRequest(*this);
			break;
		case MT_TerminateRequest:
		{
			WTerminateRequest Request{};
			std::stringstream Ss{ Frame.GetReadableString() };
			try
			{
				cereal::BinaryInputArchive Iar(Ss);
				Iar(Request);
			}
			catch (cereal::Exception const& E)
			{
				spdlog::warn("Malformed terminate request: {}", E.what());
				return;
			}
			OnTerminateRequest(*this, Request);
			break;
		}
		default:
			spdlog::warn("Client sent daemon-only message {}", static_cast<int>(Type));
			break;
	}
}
