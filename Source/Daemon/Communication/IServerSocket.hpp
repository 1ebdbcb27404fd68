/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <sigslot/signal.hpp>

class WDaemonClient;

using FNewConnectionSignal = sigslot::signal<std::shared_ptr<WDaemonClient> const&>;
using FClientClosedSignal = sigslot::signal<WDaemonClient*>;

// Accepts authenticated clients on a thread of its own. Both signals are emitted on
// that thread, slots must not block it for long since all client I/O waits behind them.
class IServerSocket
{
public:
	virtual ~IServerSocket() = default;

	// False if the listener could not be set up, nothing is running then
	virtual bool Start() = 0;

	// Joins the server thread, no signal fires after this returns
	virtual void Stop() = 0;

	virtual FNewConnectionSignal& GetNewConnectionSignal() = 0;

	// The client is still alive during the call, drop any reference to it afterwards
	virtual FClientClosedSignal& GetClientClosedSignal() = 0;
};
