/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <algorithm>
#include <array>
#include <string>
#include <cstdint>
#include <arpa/inet.h>
#include <netinet/in.h>

#include "Types.hpp"

namespace EIPFamily
{
	enum Type : uint8_t
	{
		Unknown = 0,
		IPv4 = 4,
		IPv6 = 6
	};
} // namespace EIPFamily

namespace EProtocol
{
	enum Type : uint8_t
	{
		Unknown = 0,
		TCP = 6,
		UDP = 17
	};

	inline char const* ToString(Type Protocol)
	{
		switch (Protocol)
		{
			case TCP:
				return "TCP";
			case UDP:
				return "UDP";
			default:
				return "Unknown";
		}
	}
} // namespace EProtocol

struct WIPAddress
{
	// IPv4: first 4 bytes used; IPv6: all 16 bytes used. Network byte order.
	std::array<uint8_t, 16> Bytes{};
	EIPFamily::Type         Family{};

	[[nodiscard]] std::string ToString() const
	{
		if (Family == EIPFamily::IPv4)
		{
			in_addr Addr4{};
			std::copy(Bytes.begin(), Bytes.begin() + 4, reinterpret_cast<uint8_t*>(&Addr4.s_addr));
			char Buffer[INET_ADDRSTRLEN];
			if (inet_ntop(AF_INET, &Addr4, Buffer, INET_ADDRSTRLEN))
			{
				return { Buffer };
			}
			return {};
		}

		if (Family == EIPFamily::IPv6)
		{
			in6_addr Addr6{};
			std::copy(Bytes.begin(), Bytes.end(), Addr6.s6_addr);
			char Buffer[INET6_ADDRSTRLEN];
			if (inet_ntop(AF_INET6, &Addr6, Buffer, INET6_ADDRSTRLEN))
			{
				return { Buffer };
			}
		}
		return {};
	}

	[[nodiscard]] bool IsZero() const
	{
		size_t const Used = Family == EIPFamily::IPv4 ? 4 : 16;
		for (size_t i = 0; i < Used; ++i)
		{
			if (Bytes[i] != 0)
				return false;
		}
		return true;
	}
};

struct WEndpoint
{
	WIPAddress Address{};
	WPort      Port{}; // host byte order

	[[nodiscard]] std::string ToString() const
	{
		if (Address.Family == EIPFamily::IPv6)
		{
			return "[" + Address.ToString() + "]:" + std::to_string(Port);
		}
		return Address.ToString() + ":" + std::to_string(Port);
	}
};
