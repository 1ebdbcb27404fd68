/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include "Messages.hpp"

#include <memory>
#include <sstream>
#include <utility>
#include <spdlog/spdlog.h>
#include <sigslot/signal.hpp>

// ReSharper disable CppUnusedIncludeDirective
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <cereal/archives/binary.hpp>
// ReSharper restore CppUnusedIncludeDirective

#include "Communication/IClientSocket.hpp"
#include "Data/Termination.hpp"

// One connected client, decodes its requests and sends messages to it
class WDaemonClient
{
	std::shared_ptr<IClientSocket> ClientSocket;
	sigslot::scoped_connection     DataConnection;

	void HandleFrame(WBuffer& Frame);

public:
	// Emitted on the server thread
	sigslot::signal<WDaemonClient&>                           OnRefreshRequest;
	sigslot::signal<WDaemonClient&, WTerminateRequest const&> OnTerminateRequest;

	explicit WDaemonClient(std::shared_ptr<IClientSocket> CS);

	[[nodiscard]] bool IsRunning() const { return ClientSocket->IsConnected(); }

	ssize_t SendFramedData(std::string const& Data) const { return ClientSocket->SendFramed(Data); }

	// Message type byte followed by the cereal archive of Data
	template <class T>
	static std::string EncodeMessage(EMessageType Type, T const& Data)
	{
		std::stringstream Os{};
		Os.put(static_cast<char>(Type));
		{
			cereal::BinaryOutputArchive Archive(Os);
			Archive(Data);
		}
		return Os.str();
	}

	template <class T>
	void SendMessage(EMessageType Type, T const& Data)
	{
		auto Sent = SendFramedData(EncodeMessage(Type, Data));
		if (Sent < 0)
		{
			spdlog::error("Failed to send message {} to client", static_cast<int>(Type));
		}
		else
		{
			spdlog::debug("Sent message {} ({} bytes) to client", static_cast<int>(Type), Sent);
		}
	}
};
