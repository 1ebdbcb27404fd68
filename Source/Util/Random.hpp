/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <random>
#include <string>

class WRandom
{
public:
	// Used for the websocket auth token when none is configured
	static std::string GenerateRandomHexString(size_t Length)
	{
		static constexpr char HexChars[] = "0123456789abcdef";
		std::random_device    Device;
		std::mt19937_64       Generator(Device());
		std::uniform_int_distribution<size_t> Distribution(0, sizeof(HexChars) - 2);

		std::string Result(Length, '0');
		for (char& C : Result)
		{
			C = HexChars[Distribution(Generator)];
		}
		return Result;
	}
};
