/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "Os/IProcessTable.hpp"

// IProcessTable backed by /proc. Sockets come from /proc/net/*, their owners are found
// by scanning /proc/<pid>/fd for "socket:[inode]" links. Without root only the caller's
// own processes expose their fds, sockets of other users are reported with pid 0.
class WLinuxProcessTable final : public IProcessTable
{
public:
	bool ListInetSockets(std::vector<WSocketRecord>& OutRecords) override;

	WProcessLookup GetProcessIdentity(WProcessId Pid) override;

	std::optional<std::string> GetProcessName(WProcessId Pid) override;

	std::optional<WProcessId> GetParent(WProcessId Pid) override;

	WKillOutcome KillProcess(WProcessId Pid, bool bIncludeDescendants) override;

	bool IsElevated() override;

	// Parses the contents of /proc/<pid>/stat into (comm, ppid), comm may contain spaces and parens
	static bool ParseStat(std::string const& Stat, std::string& OutComm, WProcessId& OutParentPid);

	// Real uid from the contents of /proc/<pid>/status
	static std::optional<uid_t> ParseRealUid(std::string const& Status);

	// The kernel cuts comm to 15 characters, widen it with argv[0] or the executable name
	static std::string WidenTruncatedName(std::string const& Comm, std::vector<std::string> const& Argv, std::string const& ExePath);

private:
	static std::unordered_map<WInode, std::vector<WProcessId>> MapSocketInodes(std::unordered_set<WInode> const& Wanted);

	static std::vector<WProcessId> CollectDescendants(WProcessId Root);

	static std::optional<std::string> LookupUserName(uid_t Uid);
};
