/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>
#include <algorithm>
#include <type_traits>

// Growable byte buffer with separate read and write cursors, holds one received frame
class WBuffer
{
	std::vector<char> Data{};
	std::size_t       ReadPos{};
	std::size_t       WritePos{};

public:
	explicit WBuffer(std::size_t Size = 1024) : Data(Size) {}

	[[nodiscard]] std::size_t GetReadableSize() const { return WritePos - ReadPos; }
	[[nodiscard]] char const* PeekReadPtr() const { return Data.data() + ReadPos; }

	std::size_t Read(char* Buf, std::size_t Len)
	{
		std::size_t const N = std::min(Len, GetReadableSize());
		if (Buf != nullptr && N > 0)
		{
			std::memcpy(Buf, Data.data() + ReadPos, N);
			ReadPos += N;
		}
		return N;
	}

	void Write(char const* Buf, std::size_t BytesToWrite)
	{
		if (Buf == nullptr || BytesToWrite == 0)
			return;

		if (WritePos + BytesToWrite > Data.size())
		{
			Data.resize(std::max(Data.size() * 2, WritePos + BytesToWrite));
		}
		std::memcpy(Data.data() + WritePos, Buf, BytesToWrite);
		WritePos += BytesToWrite;
	}

	// Unread bytes as a string, cereal archives read from a stream over this
	[[nodiscard]] std::string GetReadableString() const { return { PeekReadPtr(), GetReadableSize() }; }

	template <typename T>
	bool Read(T& Value)
	{
		static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
		return Read(reinterpret_cast<char*>(&Value), sizeof(T)) == sizeof(T);
	}
};
