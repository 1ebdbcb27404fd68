/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Os/IProcessTable.hpp"
#include "Ports/ControllerResolver.hpp"

// In-memory process table, tests describe processes and sockets directly
class WFakeProcessTable : public IProcessTable
{
public:
	std::vector<WSocketRecord>                   Sockets{};
	bool                                         bSocketsFail{};
	std::map<WProcessId, WProcessIdentity>       Processes{};
	std::map<WProcessId, EProcessLookupStatus>   LookupOverrides{}; // e.g. AccessDenied for one pid
	std::map<WProcessId, EKillResult>            KillOverrides{};
	std::vector<std::pair<WProcessId, bool>>     KillCalls{};
	bool                                         bElevated{ true };
	int                                          ListCalls{};
	int                                          IdentityCalls{};

	WProcessIdentity& AddProcess(WProcessId Pid, std::string Name, std::optional<WProcessId> ParentPid = std::nullopt,
		std::string CommandLine = {}, std::optional<std::string> UserName = std::string("dev"))
	{
		WProcessIdentity Identity{};
		Identity.Pid = Pid;
		Identity.Name = std::move(Name);
		Identity.ParentPid = ParentPid;
		Identity.CommandLine = std::move(CommandLine);
		Identity.UserName = std::move(UserName);
		return Processes[Pid] = std::move(Identity);
	}

	void AddSocket(WPort Port, WProcessId Pid, EProtocol::Type Protocol = EProtocol::TCP,
		EConnectionState::Type State = EConnectionState::Listen)
	{
		WSocketRecord Record{};
		Record.LocalEndpoint.Address.Family = EIPFamily::IPv4;
		Record.LocalEndpoint.Address.Bytes[0] = 127;
		Record.LocalEndpoint.Address.Bytes[3] = 1;
		Record.LocalEndpoint.Port = Port;
		Record.Protocol = Protocol;
		Record.ConnectionState = Protocol == EProtocol::TCP ? State : EConnectionState::None;
		Record.Inode = static_cast<WInode>(Sockets.size() + 1000);
		Record.Pid = Pid;
		Sockets.push_back(Record);
	}

	bool ListInetSockets(std::vector<WSocketRecord>& OutRecords) override
	{
		++ListCalls;
		if (bSocketsFail)
		{
			return false;
		}
		OutRecords = Sockets;
		return true;
	}

	WProcessLookup GetProcessIdentity(WProcessId Pid) override
	{
		++IdentityCalls;
		if (auto It = LookupOverrides.find(Pid); It != LookupOverrides.end())
		{
			return { It->second, {} };
		}
		auto It = Processes.find(Pid);
		if (It == Processes.end())
		{
			return WProcessLookup::Missing();
		}
		return WProcessLookup::Found(It->second);
	}

	std::optional<std::string> GetProcessName(WProcessId Pid) override
	{
		if (LookupOverrides.contains(Pid))
		{
			return std::nullopt;
		}
		auto It = Processes.find(Pid);
		return It != Processes.end() ? std::optional(It->second.Name) : std::nullopt;
	}

	std::optional<WProcessId> GetParent(WProcessId Pid) override
	{
		if (LookupOverrides.contains(Pid))
		{
			return std::nullopt;
		}
		auto It = Processes.find(Pid);
		return It != Processes.end() ? It->second.ParentPid : std::nullopt;
	}

	WKillOutcome KillProcess(WProcessId Pid, bool bIncludeDescendants) override
	{
		KillCalls.emplace_back(Pid, bIncludeDescendants);
		if (auto It = KillOverrides.find(Pid); It != KillOverrides.end())
		{
			return { It->second, It->second == EKillResult::Success ? "" : "injected failure" };
		}
		if (!Processes.contains(Pid))
		{
			return { EKillResult::NotFound, "No such process" };
		}
		Processes.erase(Pid);
		return { EKillResult::Success, {} };
	}

	bool IsElevated() override { return bElevated; }
};

// Ancestry graph without a process table, pids missing from the map are unreadable
class WFakeAncestry : public IAncestrySource
{
public:
	std::map<WProcessId, WAncestor> Nodes{};
	int                             Reads{};

	void Add(WProcessId Pid, std::string Name, std::optional<WProcessId> ParentPid)
	{
		Nodes[Pid] = WAncestor{ std::move(Name), ParentPid };
	}

	std::optional<WAncestor> ReadAncestor(WProcessId Pid) override
	{
		++Reads;
		auto It = Nodes.find(Pid);
		if (It == Nodes.end())
		{
			return std::nullopt;
		}
		return It->second;
	}
};
