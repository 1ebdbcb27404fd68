//
// Created by usr on 14/01/2026.
//

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "AppType.hpp"
#include "IPAddress.hpp"
#include "Json.hpp"
#include "Types.hpp"

namespace EConnectionState
{
	// Values match the kernel's TCP states in /proc/net/tcp, NONE is used for udp
	enum Type : uint8_t
	{
		None = 0,
		Established = 0x01,
		SynSent = 0x02,
		SynRecv = 0x03,
		FinWait1 = 0x04,
		FinWait2 = 0x05,
		TimeWait = 0x06,
		Close = 0x07,
		CloseWait = 0x08,
		LastAck = 0x09,
		Listen = 0x0A,
		Closing = 0x0B,
		NewSynRecv = 0x0C
	};

	inline char const* ToString(Type State)
	{
		switch (State)
		{
			case Established:
				return "ESTABLISHED";
			case SynSent:
				return "SYN_SENT";
			case SynRecv:
			case NewSynRecv:
				return "SYN_RECV";
			case FinWait1:
				return "FIN_WAIT1";
			case FinWait2:
				return "FIN_WAIT2";
			case TimeWait:
				return "TIME_WAIT";
			case Close:
				return "CLOSE";
			case CloseWait:
				return "CLOSE_WAIT";
			case LastAck:
				return "LAST_ACK";
			case Listen:
				return "LISTEN";
			case Closing:
				return "CLOSING";
			case None:
			default:
				return "NONE";
		}
	}
} // namespace EConnectionState

// One (port, pid) pair as shown to clients
struct WProcessPortEntry
{
	WPort                      Port{};
	WProcessId                 Pid{};
	std::string                Name{};
	std::optional<std::string> UserName{}; // unset if the owner could not be resolved
	std::string                Address{};  // 127.0.0.1:3000 or [::1]:3000
	EProtocol::Type            Protocol{ EProtocol::TCP };
	EConnectionState::Type     ConnectionState{ EConnectionState::None };
	EAppType                   AppType{ EAppType::Other };
	bool                       bIsSystem{};

	std::optional<WProcessId>  ParentPid{};
	std::optional<WProcessId>  RootControllerPid{};
	std::optional<std::string> RootControllerName{};
	bool                       bHasParentController{};

	void ToJson(WJson::object& Json) const;

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Port, Pid, Name, UserName, Address, Protocol, ConnectionState, AppType, bIsSystem, ParentPid,
			RootControllerPid, RootControllerName, bHasParentController);
	}
};

// Both sequences are sorted ascending by port, every entry lives in exactly one of them
struct WPortSnapshot
{
	std::vector<WProcessPortEntry> SystemEntries{};
	std::vector<WProcessPortEntry> UserEntries{};

	[[nodiscard]] size_t Size() const { return SystemEntries.size() + UserEntries.size(); }

	// Field order and sequence order are fixed, two equal snapshots always produce the same text
	void ToJson(WJson::object& Json) const;

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(SystemEntries, UserEntries);
	}
};
