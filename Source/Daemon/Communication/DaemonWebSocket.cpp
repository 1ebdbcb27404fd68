/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "DaemonWebSocket.hpp"

#include <pthread.h>

#include "spdlog/spdlog.h"

#include "ClientWebSocket.hpp"
#include "DaemonClient.hpp"

static void LwsLogCallback(int Level, char const* Line)
{
	std::string Msg(Line);
	while (!Msg.empty() && (Msg.back() == '\n' || Msg.back() == '\r'))
	{
		Msg.pop_back();
	}

	// Strip libwebsockets timestamp prefix (format: [YYYY/MM/DD HH:MM:SS:FFFF] )
	if (Msg.size() > 30)
	{
		Msg = Msg.substr(30);
	}

	switch (Level)
	{
		case LLL_ERR:
			spdlog::error("{}", Msg);
			break;
		case LLL_WARN:
			spdlog::warn("{}", Msg);
			break;
		case LLL_NOTICE:
		case LLL_INFO:
			spdlog::info("{}", Msg);
			break;
		default:
			spdlog::debug("{}", Msg);
			break;
	}
}

static std::string GetQueryToken(std::string const& QueryString)
{
	// Parse query parameters (format: token=value&other=value)
	size_t TokenPos = QueryString.find("token=");
	if (TokenPos == std::string::npos || (TokenPos != 0 && QueryString[TokenPos - 1] != '&'))
	{
		return {};
	}
	size_t TokenStart = TokenPos + 6; // Skip "token="
	size_t TokenEnd = QueryString.find('&', TokenStart);
	return TokenEnd != std::string::npos ? QueryString.substr(TokenStart, TokenEnd - TokenStart)
										 : QueryString.substr(TokenStart);
}

static int WebSocketCallback(lws* Wsi, lws_callback_reasons Reason, void*, void* In, size_t Len)
{
	lws_context* Context = lws_get_context(Wsi);
	auto*        DaemonWebSocket = static_cast<WDaemonWebSocket*>(lws_context_user(Context));

	if (!DaemonWebSocket)
	{
		return 0;
	}

	switch (Reason)
	{
		case LWS_CALLBACK_FILTER_PROTOCOL_CONNECTION:
		{
			if (!DaemonWebSocket->IsAuthorized(Wsi))
			{
				spdlog::warn("WebSocket connection rejected: no valid authentication found");
				return -1; // Reject connection
			}
			break;
		}
		case LWS_CALLBACK_ESTABLISHED:
		{
			spdlog::info("WebSocket client connected");
			auto ClientWs = std::make_shared<WClientWebSocket>(Wsi, Context);
			DaemonWebSocket->RegisterClient(Wsi, ClientWs);
			break;
		}

		case LWS_CALLBACK_CLOSED:
		{
			spdlog::info("WebSocket client disconnected");
			if (auto Client = DaemonWebSocket->GetClient(Wsi))
			{
				Client->ServiceClosed();
			}
			DaemonWebSocket->UnregisterClient(Wsi);
			break;
		}

		case LWS_CALLBACK_RECEIVE:
		{
			if (auto Client = DaemonWebSocket->GetClient(Wsi))
			{
				Client->ServiceReceive(static_cast<char*>(In), Len);
				if (!Client->IsConnected())
				{
					return -1;
				}
			}
			break;
		}

		case LWS_CALLBACK_SERVER_WRITEABLE:
		{
			if (auto Client = DaemonWebSocket->GetClient(Wsi))
			{
				Client->ServiceWritable();
			}
			break;
		}

		case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
			DaemonWebSocket->FlushPendingWrites();
			break;

		default:
			break;
	}

	return 0;
}

WDaemonWebSocket::WDaemonWebSocket(int Port_, std::string AuthToken_) : Port(Port_), AuthToken(std::move(AuthToken_))
{
}

WDaemonWebSocket::~WDaemonWebSocket()
{
	Stop();
}

void WDaemonWebSocket::ListenThreadFunction() const
{
	pthread_setname_np(pthread_self(), "ws-server");

	while (Running && Context)
	{
		lws_service(Context, 10); // 10ms timeout for processing
	}
}

bool WDaemonWebSocket::IsAuthorized(lws* Wsi) const
{
	// Try to get Authorization header first (for native clients)
	char AuthHeaderBuf[256];
	int  HeaderLen = lws_hdr_copy(Wsi, AuthHeaderBuf, sizeof(AuthHeaderBuf), WSI_TOKEN_HTTP_AUTHORIZATION);
	if (HeaderLen > 0 && std::string(AuthHeaderBuf, static_cast<size_t>(HeaderLen)) == "Bearer " + AuthToken)
	{
		spdlog::debug("WebSocket connection authenticated via header");
		return true;
	}

	// Query parameter (for browser clients), lws hands out the arguments one fragment at a time
	char QueryBuf[512];
	for (int Index = 0;; ++Index)
	{
		int QueryLen = lws_hdr_copy_fragment(Wsi, QueryBuf, sizeof(QueryBuf), WSI_TOKEN_HTTP_URI_ARGS, Index);
		if (QueryLen <= 0)
		{
			break;
		}
		if (GetQueryToken(std::string(QueryBuf, static_cast<size_t>(QueryLen))) == AuthToken)
		{
			spdlog::debug("WebSocket connection authenticated via query parameter");
			return true;
		}
	}
	return false;
}

bool WDaemonWebSocket::Start()
{
	if (AuthToken.empty())
	{
		spdlog::error("Refusing to start the WebSocket server without an auth token");
		return false;
	}

	// Redirect libwebsockets logging to spdlog
	lws_set_log_level(LLL_ERR | LLL_WARN, LwsLogCallback);

	static lws_protocols Protocols[] = { // Default protocol (no subprotocol specified)
		{ "wharf-protocol", WebSocketCallback, 0, 65536, 0, nullptr, 0 },
		// Null terminator
		{ nullptr, nullptr, 0, 0, 0, nullptr, 0 }
	};

	lws_context_creation_info Info{};
	Info.port = Port;
	Info.protocols = Protocols;
	Info.user = this; // Set the user pointer to this instance
	Info.gid = static_cast<gid_t>(-1);
	Info.uid = static_cast<uid_t>(-1);
	Info.options = LWS_SERVER_OPTION_VALIDATE_UTF8;

	Context = lws_create_context(&Info);
	if (!Context)
	{
		spdlog::error("Failed to create libwebsockets context");
		return false;
	}

	Running = true;
	ListenThread = std::thread(&WDaemonWebSocket::ListenThreadFunction, this);

	spdlog::info("WebSocket server started on port {}", Port);
	return true;
}

void WDaemonWebSocket::Stop()
{
	Running = false;

	// Wake up lws_service() so it can exit promptly
	if (Context)
	{
		lws_cancel_service(Context);
	}

	if (ListenThread.joinable())
	{
		ListenThread.join();
	}

	if (Context)
	{
		lws_context_destroy(Context);
		Context = nullptr;
	}

	std::lock_guard Lock(ClientsMutex);
	Clients.clear();
	DaemonClients.clear();
}

void WDaemonWebSocket::RegisterClient(lws* Wsi, std::shared_ptr<WClientWebSocket> Client)
{
	auto NewClient = std::make_shared<WDaemonClient>(Client);
	{
		std::lock_guard Lock(ClientsMutex);
		Clients[Wsi] = std::move(Client);
		DaemonClients[Wsi] = NewClient;
	}
	OnNewConnection(NewClient);
}

void WDaemonWebSocket::UnregisterClient(lws* Wsi)
{
	std::shared_ptr<WDaemonClient> Closed{};
	{
		std::lock_guard Lock(ClientsMutex);
		Clients.erase(Wsi);
		if (auto It = DaemonClients.find(Wsi); It != DaemonClients.end())
		{
			Closed = std::move(It->second);
			DaemonClients.erase(It);
		}
	}
	if (Closed)
	{
		OnClientClosed(Closed.get());
	}
}

std::shared_ptr<WClientWebSocket> WDaemonWebSocket::GetClient(lws* Wsi)
{
	std::lock_guard Lock(ClientsMutex);
	auto            It = Clients.find(Wsi);
	if (It != Clients.end())
	{
		return It->second;
	}
	return nullptr;
}

void WDaemonWebSocket::FlushPendingWrites()
{
	std::lock_guard Lock(ClientsMutex);
	for (auto const& [Wsi, Client] : Clients)
	{
		Client->ServiceWakeUp();
	}
}
