/*
 * Copyright (c) 2025, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SocketTableParser.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

template <typename T>
static bool ParseHex(std::string_view Str, T& Out)
{
	if (Str.empty())
	{
		return false;
	}
	auto [Ptr, Err] = std::from_chars(Str.data(), Str.data() + Str.size(), Out, 16);
	return Err == std::errc{} && Ptr == Str.data() + Str.size();
}

bool WSocketTableParser::ParseFile(
	std::string const& FilePath, EProtocol::Type Protocol, std::vector<WSocketRecord>& OutRecords)
{
	std::ifstream File(FilePath);
	if (!File.is_open())
	{
		return false;
	}

	std::string Line;
	std::getline(File, Line); // Skip header

	while (std::getline(File, Line))
	{
		if (auto Record = ParseLine(Line, Protocol))
		{
			OutRecords.emplace_back(*Record);
		}
	}
	return true;
}

std::optional<WSocketRecord> WSocketTableParser::ParseLine(std::string const& Line, EProtocol::Type Protocol)
{
	std::istringstream Iss(Line);
	std::string        Slot, LocalAddrStr, RemAddrStr, StateStr, Queues, Timer, Retransmits, Uid, Timeout, InodeStr;

	if (!(Iss >> Slot >> LocalAddrStr >> RemAddrStr >> StateStr >> Queues >> Timer >> Retransmits >> Uid >> Timeout
			>> InodeStr))
	{
		return std::nullopt;
	}

	WSocketRecord Record{};
	Record.Protocol = Protocol;

	if (!ParseAddressPort(LocalAddrStr, Record.LocalEndpoint.Address, Record.LocalEndpoint.Port))
	{
		return std::nullopt;
	}

	uint32_t State{};
	if (!ParseHex(StateStr, State))
	{
		return std::nullopt;
	}

	// udp "states" are just the socket state the kernel reuses, report them like psutil does
	Record.ConnectionState =
		Protocol == EProtocol::TCP ? static_cast<EConnectionState::Type>(State) : EConnectionState::None;

	auto [Ptr, Err] = std::from_chars(InodeStr.data(), InodeStr.data() + InodeStr.size(), Record.Inode);
	if (Err != std::errc{})
	{
		return std::nullopt;
	}
	return Record;
}

bool WSocketTableParser::ParseAddressPort(std::string_view AddrPortStr, WIPAddress& OutAddr, WPort& OutPort)
{
	size_t const ColonPos = AddrPortStr.find(':');
	if (ColonPos == std::string_view::npos)
		return false;

	std::string_view const AddrStr = AddrPortStr.substr(0, ColonPos);
	std::string_view const PortStr = AddrPortStr.substr(ColonPos + 1);

	if (!ParseHex(PortStr, OutPort))
	{
		return false;
	}

	if (AddrStr.length() == 32)
	{
		// IPv6 is printed as 4 little endian 32 bit words
		for (size_t i = 0; i < 4; ++i)
		{
			uint32_t Word{};
			if (!ParseHex(AddrStr.substr(i * 8, 8), Word))
			{
				return false;
			}
			OutAddr.Bytes[i * 4 + 0] = static_cast<uint8_t>(Word & 0xFF);
			OutAddr.Bytes[i * 4 + 1] = static_cast<uint8_t>(Word >> 8 & 0xFF);
			OutAddr.Bytes[i * 4 + 2] = static_cast<uint8_t>(Word >> 16 & 0xFF);
			OutAddr.Bytes[i * 4 + 3] = static_cast<uint8_t>(Word >> 24 & 0xFF);
		}
		OutAddr.Family = EIPFamily::IPv6;
		return true;
	}

	if (AddrStr.length() == 8)
	{
		uint32_t Addr4{};
		if (!ParseHex(AddrStr, Addr4))
		{
			return false;
		}
		OutAddr.Bytes = {};
		OutAddr.Bytes[0] = static_cast<uint8_t>(Addr4 & 0xFF);
		OutAddr.Bytes[1] = static_cast<uint8_t>(Addr4 >> 8 & 0xFF);
		OutAddr.Bytes[2] = static_cast<uint8_t>(Addr4 >> 16 & 0xFF);
		OutAddr.Bytes[3] = static_cast<uint8_t>(Addr4 >> 24 & 0xFF);
		OutAddr.Family = EIPFamily::IPv4;
		return true;
	}

	return false;
}
