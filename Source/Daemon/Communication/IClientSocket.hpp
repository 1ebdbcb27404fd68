/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <sys/types.h>

#include "sigslot/signal.hpp"

#include "Buffer.hpp"

class IClientSocket
{
public:
	virtual ~IClientSocket() = default;

	// One complete frame without its length prefix, starting with the message type
	virtual sigslot::signal<WBuffer&>& GetDataSignal() = 0;
	virtual sigslot::signal<>&         GetClosedSignal() = 0;

	virtual bool IsConnected() const { return false; }

	virtual void Close() = 0;

	// Queues Data behind a 4 byte length prefix, safe to call from any thread
	virtual ssize_t SendFramed(std::string const&) { return -1; }
};
