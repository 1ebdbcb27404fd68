/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "LinuxProcessTable.hpp"

#include <algorithm>
#include <charconv>
#include <csignal>
#include <pwd.h>
#include <sstream>
#include <unistd.h>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"
#include "Filesystem.hpp"
#include "Os/SocketTableParser.hpp"

constexpr size_t           COMM_NAME_MAX = 15; // TASK_COMM_LEN - 1
constexpr std::string_view SOCKET_LINK_PREFIX = "socket:[";

static WProcessLookup LookupFromErrno(int Error)
{
	if (WErrnoUtil::IsDenied(Error))
	{
		return WProcessLookup::Denied();
	}
	// ENOENT, ESRCH and everything else: the process is not there for us
	return WProcessLookup::Missing();
}

static EKillResult KillResultFromErrno(int Error)
{
	if (WErrnoUtil::IsGone(Error))
	{
		return EKillResult::NotFound;
	}
	if (WErrnoUtil::IsDenied(Error))
	{
		return EKillResult::AccessDenied;
	}
	return EKillResult::Failed;
}

static std::string ProcPath(WProcessId Pid, char const* Entry)
{
	return "/proc/" + std::to_string(Pid) + "/" + Entry;
}

bool WLinuxProcessTable::ListInetSockets(std::vector<WSocketRecord>& OutRecords)
{
	std::vector<WSocketRecord> Records;
	if (!WSocketTableParser::ParseFile("/proc/net/tcp", EProtocol::TCP, Records))
	{
		spdlog::error("Can't read /proc/net/tcp: {}", WErrnoUtil::StrError());
		return false;
	}

	// ipv6 and udp tables are missing if the protocol is compiled out or disabled
	for (auto const& [Path, Protocol] : { std::pair{ "/proc/net/tcp6", EProtocol::TCP },
			 std::pair{ "/proc/net/udp", EProtocol::UDP }, std::pair{ "/proc/net/udp6", EProtocol::UDP } })
	{
		if (!WSocketTableParser::ParseFile(Path, Protocol, Records))
		{
			spdlog::debug("Skipping {}: {}", Path, WErrnoUtil::StrError());
		}
	}

	std::unordered_set<WInode> Wanted;
	for (auto const& Record : Records)
	{
		if (Record.Inode != 0 && Record.GetPort() != 0)
		{
			Wanted.insert(Record.Inode);
		}
	}

	auto const Owners = MapSocketInodes(Wanted);

	OutRecords.clear();
	OutRecords.reserve(Records.size());
	for (auto& Record : Records)
	{
		auto It = Owners.find(Record.Inode);
		if (Record.Inode == 0 || It == Owners.end())
		{
			OutRecords.push_back(Record);
			continue;
		}

		// A socket inherited over fork() belongs to every process holding the fd
		for (WProcessId Pid : It->second)
		{
			Record.Pid = Pid;
			OutRecords.push_back(Record);
		}
	}
	return true;
}

std::unordered_map<WInode, std::vector<WProcessId>> WLinuxProcessTable::MapSocketInodes(
	std::unordered_set<WInode> const& Wanted)
{
	std::unordered_map<WInode, std::vector<WProcessId>> Owners;
	if (Wanted.empty())
	{
		return Owners;
	}

	for (WProcessId Pid : WFilesystem::ListProcessIds())
	{
		std::error_code Ec;
		for (auto It = stdfs::directory_iterator(ProcPath(Pid, "fd"), Ec); !Ec && It != stdfs::directory_iterator();
			 It.increment(Ec))
		{
			std::string const Target = WFilesystem::ReadLink(It->path().string());
			if (!Target.starts_with(SOCKET_LINK_PREFIX) || Target.back() != ']')
			{
				continue;
			}

			WInode      Inode{};
			char const* Begin = Target.data() + SOCKET_LINK_PREFIX.size();
			char const* End = Target.data() + Target.size() - 1;
			if (auto [Ptr, Err] = std::from_chars(Begin, End, Inode); Err != std::errc{} || Ptr != End)
			{
				continue;
			}

			if (Wanted.contains(Inode))
			{
				auto& Pids = Owners[Inode];
				// ListProcessIds is sorted, so the list stays ascending
				if (Pids.empty() || Pids.back() != Pid)
				{
					Pids.push_back(Pid);
				}
			}
		}
		// Ec is EACCES for other users' processes when not root, that's expected
	}
	return Owners;
}

WProcessLookup WLinuxProcessTable::GetProcessIdentity(WProcessId Pid)
{
	if (Pid <= 0)
	{
		return WProcessLookup::Missing();
	}

	std::string Stat;
	if (int Error = WFilesystem::ReadFile(ProcPath(Pid, "stat"), Stat); Error != 0)
	{
		return LookupFromErrno(Error);
	}

	WProcessIdentity Identity{};
	Identity.Pid = Pid;

	WProcessId ParentPid{};
	if (!ParseStat(Stat, Identity.Name, ParentPid))
	{
		spdlog::debug("Malformed stat for pid {}", Pid);
		return WProcessLookup::Missing();
	}
	if (ParentPid > 0)
	{
		Identity.ParentPid = ParentPid;
	}

	std::string CmdLine;
	if (int Error = WFilesystem::ReadFile(ProcPath(Pid, "cmdline"), CmdLine); Error != 0)
	{
		return LookupFromErrno(Error);
	}
	auto const Argv = WFilesystem::SplitNulSeparated(CmdLine);
	for (size_t i = 0; i < Argv.size(); ++i)
	{
		if (i > 0)
			Identity.CommandLine += ' ';
		Identity.CommandLine += Argv[i];
	}

	if (Identity.Name.size() == COMM_NAME_MAX)
	{
		Identity.Name = WidenTruncatedName(Identity.Name, Argv, WFilesystem::GetProcessExePath(Pid));
	}

	std::string Status;
	if (WFilesystem::ReadFile(ProcPath(Pid, "status"), Status) == 0)
	{
		if (auto Uid = ParseRealUid(Status))
		{
			Identity.UserName = LookupUserName(*Uid);
		}
	}

	return WProcessLookup::Found(std::move(Identity));
}

std::optional<std::string> WLinuxProcessTable::GetProcessName(WProcessId Pid)
{
	if (Pid <= 0)
	{
		return std::nullopt;
	}

	std::string Stat;
	if (WFilesystem::ReadFile(ProcPath(Pid, "stat"), Stat) != 0)
	{
		return std::nullopt;
	}

	std::string Comm;
	WProcessId  ParentPid{};
	if (!ParseStat(Stat, Comm, ParentPid))
	{
		return std::nullopt;
	}

	// Controller and wrapper names are short, only long ones need cmdline and exe
	if (Comm.size() == COMM_NAME_MAX)
	{
		std::string              CmdLine;
		std::vector<std::string> Argv;
		if (WFilesystem::ReadFile(ProcPath(Pid, "cmdline"), CmdLine) == 0)
		{
			Argv = WFilesystem::SplitNulSeparated(CmdLine);
		}
		Comm = WidenTruncatedName(Comm, Argv, WFilesystem::GetProcessExePath(Pid));
	}
	return Comm;
}

std::optional<WProcessId> WLinuxProcessTable::GetParent(WProcessId Pid)
{
	if (Pid <= 0)
	{
		return std::nullopt;
	}

	std::string Stat;
	if (WFilesystem::ReadFile(ProcPath(Pid, "stat"), Stat) != 0)
	{
		return std::nullopt;
	}

	std::string Comm;
	WProcessId  ParentPid{};
	if (!ParseStat(Stat, Comm, ParentPid) || ParentPid <= 0)
	{
		return std::nullopt;
	}
	return ParentPid;
}

WKillOutcome WLinuxProcessTable::KillProcess(WProcessId Pid, bool bIncludeDescendants)
{
	if (Pid <= 0)
	{
		// kill() with 0 or a negative pid signals whole process groups
		return { EKillResult::NotFound, "invalid pid " + std::to_string(Pid) };
	}
	if (Pid == 1)
	{
		return { EKillResult::Failed, "refusing to signal init" };
	}

	// Gather the tree before the root goes away, orphans get reparented and can't be found afterwards
	std::vector<WProcessId> Descendants;
	if (bIncludeDescendants)
	{
		Descendants = CollectDescendants(Pid);
	}

	// Root first so it can't respawn the children we are about to kill
	if (kill(Pid, SIGKILL) != 0)
	{
		int const Error = errno;
		return { KillResultFromErrno(Error), WErrnoUtil::StrError(Error) };
	}

	for (WProcessId Child : Descendants)
	{
		if (kill(Child, SIGKILL) != 0 && errno != ESRCH)
		{
			spdlog::warn("Failed to kill descendant {} of {}: {}", Child, Pid, WErrnoUtil::StrError());
		}
	}

	if (!Descendants.empty())
	{
		spdlog::info("Killed process tree of {} ({} descendants)", Pid, Descendants.size());
	}
	return { EKillResult::Success, {} };
}

std::vector<WProcessId> WLinuxProcessTable::CollectDescendants(WProcessId Root)
{
	std::unordered_map<WProcessId, std::vector<WProcessId>> Children;
	for (WProcessId Pid : WFilesystem::ListProcessIds())
	{
		std::string Stat, Comm;
		WProcessId  ParentPid{};
		if (WFilesystem::ReadFile(ProcPath(Pid, "stat"), Stat) == 0 && ParseStat(Stat, Comm, ParentPid))
		{
			Children[ParentPid].push_back(Pid);
		}
	}

	// Breadth first, guarded against pid reuse creating a loop
	std::vector<WProcessId>        Result;
	std::unordered_set<WProcessId> Visited{ Root };
	std::vector<WProcessId>        Queue{ Root };
	for (size_t i = 0; i < Queue.size(); ++i)
	{
		auto It = Children.find(Queue[i]);
		if (It == Children.end())
			continue;

		for (WProcessId Child : It->second)
		{
			if (Visited.insert(Child).second)
			{
				Queue.push_back(Child);
				Result.push_back(Child);
			}
		}
	}
	return Result;
}

bool WLinuxProcessTable::IsElevated()
{
	return geteuid() == 0;
}

bool WLinuxProcessTable::ParseStat(std::string const& Stat, std::string& OutComm, WProcessId& OutParentPid)
{
	// pid (comm) state ppid ...
	auto const Open = Stat.find('(');
	auto const Close = Stat.rfind(')');
	if (Open == std::string::npos || Close == std::string::npos || Close < Open)
	{
		return false;
	}

	OutComm = Stat.substr(Open + 1, Close - Open - 1);

	std::istringstream Iss(Stat.substr(Close + 1));
	std::string        State;
	if (!(Iss >> State >> OutParentPid))
	{
		return false;
	}
	return true;
}

std::optional<uid_t> WLinuxProcessTable::ParseRealUid(std::string const& Status)
{
	std::istringstream Iss(Status);
	std::string        Line;
	while (std::getline(Iss, Line))
	{
		if (!Line.starts_with("Uid:"))
			continue;

		std::istringstream Fields(Line.substr(4));
		uid_t              Uid{};
		if (Fields >> Uid)
		{
			return Uid;
		}
		return std::nullopt;
	}
	return std::nullopt;
}

std::string WLinuxProcessTable::WidenTruncatedName(
	std::string const& Comm, std::vector<std::string> const& Argv, std::string const& ExePath)
{
	if (!Argv.empty())
	{
		// argv[0] may carry arguments when a process rewrote its title
		std::string Arg0 = Argv[0].substr(0, Argv[0].find(' '));
		std::string Candidate = WFilesystem::BaseName(Arg0);
		if (Candidate.starts_with(Comm))
		{
			return Candidate;
		}
	}

	if (!ExePath.empty())
	{
		std::string Candidate = WFilesystem::BaseName(ExePath);
		if (Candidate.starts_with(Comm))
		{
			return Candidate;
		}
	}
	return Comm;
}

std::optional<std::string> WLinuxProcessTable::LookupUserName(uid_t Uid)
{
	long BufSize = sysconf(_SC_GETPW_R_SIZE_MAX);
	std::vector<char> Buf(BufSize > 0 ? static_cast<size_t>(BufSize) : 4096);

	passwd  Pwd{};
	passwd* Result = nullptr;
	if (getpwuid_r(Uid, &Pwd, Buf.data(), Buf.size(), &Result) == 0 && Result != nullptr)
	{
		return std::string(Result->pw_name);
	}
	// No passwd entry (containers, deleted users), show the raw uid like ps does
	return std::to_string(Uid);
}
