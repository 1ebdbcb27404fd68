/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "IPAddress.hpp"
#include "Types.hpp"
#include "Data/PortEntry.hpp"

// One row of the kernel socket tables, rebuilt every poll cycle
struct WSocketRecord
{
	WEndpoint              LocalEndpoint{};
	EProtocol::Type        Protocol{ EProtocol::TCP };
	EConnectionState::Type ConnectionState{ EConnectionState::None };
	WInode                 Inode{};
	WProcessId             Pid{}; // 0 if no visible process owns the socket

	[[nodiscard]] WPort GetPort() const { return LocalEndpoint.Port; }
};

// Point in time copy of a process, it may be gone by the time it is used
struct WProcessIdentity
{
	WProcessId                 Pid{};
	std::string                Name{};
	std::optional<std::string> UserName{};
	std::string                CommandLine{};
	std::optional<WProcessId>  ParentPid{};
};

enum class EProcessLookupStatus : uint8_t
{
	Ok,
	NotFound,
	AccessDenied
};

struct WProcessLookup
{
	EProcessLookupStatus Status{ EProcessLookupStatus::NotFound };
	WProcessIdentity     Identity{}; // only valid when Status == Ok

	[[nodiscard]] bool IsOk() const { return Status == EProcessLookupStatus::Ok; }

	static WProcessLookup Found(WProcessIdentity Identity_) { return { EProcessLookupStatus::Ok, std::move(Identity_) }; }
	static WProcessLookup Missing() { return { EProcessLookupStatus::NotFound, {} }; }
	static WProcessLookup Denied() { return { EProcessLookupStatus::AccessDenied, {} }; }
};

enum class EKillResult : uint8_t
{
	Success,
	NotFound,
	AccessDenied,
	Failed
};

struct WKillOutcome
{
	EKillResult Result{ EKillResult::Failed };
	std::string Error{}; // strerror text for anything but Success

	[[nodiscard]] bool IsSuccess() const { return Result == EKillResult::Success; }
};

// Everything the port engine needs from the operating system
class IProcessTable
{
public:
	virtual ~IProcessTable() = default;

	// False if the socket tables could not be read at all
	virtual bool ListInetSockets(std::vector<WSocketRecord>& OutRecords) = 0;

	virtual WProcessLookup GetProcessIdentity(WProcessId Pid) = 0;

	// Cheap lookups for walking ancestors, empty if the process is gone or unreadable
	virtual std::optional<std::string> GetProcessName(WProcessId Pid) = 0;
	virtual std::optional<WProcessId>  GetParent(WProcessId Pid) = 0;

	virtual WKillOutcome KillProcess(WProcessId Pid, bool bIncludeDescendants) = 0;

	virtual bool IsElevated() = 0;
};
