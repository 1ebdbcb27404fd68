/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>

#include "Buffer.hpp"

enum EMessageType : int8_t
{
	MT_Invalid = -1,
	MT_Handshake,
	MT_Snapshot,
	MT_CollectFailed,
	MT_RefreshRequest,
	MT_TerminateRequest,
	MT_TerminateResult
};

inline EMessageType ReadMessageTypeFromBuffer(WBuffer& Buf)
{
	EMessageType Type;
	if (!Buf.Read(Type))
	{
		return MT_Invalid;
	}

	if (Type < MT_Handshake || Type > MT_TerminateResult)
	{
		return MT_Invalid;
	}
	return Type;
}
