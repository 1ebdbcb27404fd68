/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <charconv>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "Config.hpp"
#include "Json.hpp"
#include "Time.hpp"
#include "Data/AppType.hpp"
#include "Data/PortEntry.hpp"
#include "Os/LinuxProcessTable.hpp"
#include "Ports/PortMonitor.hpp"

namespace
{
	enum class EScope : uint8_t
	{
		All,
		User,
		System
	};

	struct WListOptions
	{
		bool                    bJson{};
		EScope                  Scope{ EScope::All };
		std::optional<EAppType> Type{};
	};

	void PrintUsage()
	{
		std::fputs("usage: wharf [-v] <command>\n"
				   "  list [--json] [--type <tag>] [--user|--system]\n"
				   "  kill <pid>\n"
				   "  kill-tree <pid>\n"
				   "  trace <pid>\n",
			stderr);
	}

	std::optional<WProcessId> ParsePid(std::string_view Arg)
	{
		WProcessId Pid{};
		auto [Ptr, Err] = std::from_chars(Arg.data(), Arg.data() + Arg.size(), Pid);
		if (Err != std::errc{} || Ptr != Arg.data() + Arg.size() || Pid <= 0)
		{
			return std::nullopt;
		}
		return Pid;
	}

	bool ParseListOptions(std::vector<std::string_view> const& Args, WListOptions& OutOptions)
	{
		for (size_t i = 0; i < Args.size(); ++i)
		{
			if (Args[i] == "--json")
			{
				OutOptions.bJson = true;
			}
			else if (Args[i] == "--user")
			{
				OutOptions.Scope = EScope::User;
			}
			else if (Args[i] == "--system")
			{
				OutOptions.Scope = EScope::System;
			}
			else if (Args[i] == "--type" && i + 1 < Args.size())
			{
				OutOptions.Type = WAppType::FromTag(Args[++i]);
				if (!OutOptions.Type)
				{
					fmt::print(stderr, "unknown app type '{}'\n", Args[i]);
					return false;
				}
			}
			else
			{
				fmt::print(stderr, "unknown option '{}'\n", Args[i]);
				return false;
			}
		}
		return true;
	}

	std::vector<WProcessPortEntry> Filter(std::vector<WProcessPortEntry> const& Entries, WListOptions const& Options)
	{
		std::vector<WProcessPortEntry> Result{};
		for (auto const& Entry : Entries)
		{
			if (!Options.Type || Entry.AppType == *Options.Type)
			{
				Result.push_back(Entry);
			}
		}
		return Result;
	}

	void PrintTable(std::string_view Title, std::vector<WProcessPortEntry> const& Entries)
	{
		fmt::print("{} ({})\n", Title, Entries.size());
		if (Entries.empty())
		{
			fmt::print("  none\n\n");
			return;
		}

		fmt::print("  {:<6} {:<8} {:<24} {:<16} {:<28} {:<5} {:<12} {:<10} {}\n", "PORT", "PID", "NAME", "USER",
			"ADDRESS", "PROTO", "STATE", "TYPE", "CONTROLLER");
		for (auto const& Entry : Entries)
		{
			std::string Controller = "-";
			if (Entry.bHasParentController)
			{
				Controller = fmt::format("{} ({})", Entry.RootControllerName.value_or("?"), *Entry.RootControllerPid);
			}
			fmt::print("  {:<6} {:<8} {:<24} {:<16} {:<28} {:<5} {:<12} {:<10} {}\n", Entry.Port, Entry.Pid,
				Entry.Name, Entry.UserName.value_or("Unknown"), Entry.Address, EProtocol::ToString(Entry.Protocol),
				EConnectionState::ToString(Entry.ConnectionState), WAppType::ToLabel(Entry.AppType), Controller);
		}
		fmt::print("\n");
	}

	int RunList(WPortMonitor& Monitor, WListOptions const& Options)
	{
		WPortSnapshot Snapshot{};
		if (Monitor.GetSnapshot(Snapshot) != ECollectResult::Success)
		{
			fmt::print(stderr, "failed to enumerate sockets\n");
			return 1;
		}

		WPortSnapshot Filtered{};
		if (Options.Scope != EScope::User)
		{
			Filtered.SystemEntries = Filter(Snapshot.SystemEntries, Options);
		}
		if (Options.Scope != EScope::System)
		{
			Filtered.UserEntries = Filter(Snapshot.UserEntries, Options);
		}

		bool const bElevated = Monitor.IsElevated();
		if (Options.bJson)
		{
			WJson::object Data{};
			Filtered.ToJson(Data);

			WJson::object Json{};
			Json[JSON_KEY_DATA] = Data;
			Json[JSON_KEY_COUNTS] = WJson::object{ { JSON_KEY_SYSTEM, static_cast<int>(Filtered.SystemEntries.size()) },
				{ JSON_KEY_USER, static_cast<int>(Filtered.UserEntries.size()) } };
			Json[JSON_KEY_IS_ADMIN] = bElevated;
			fmt::print("{}\n", WJson(Json).dump());
			return 0;
		}

		if (!bElevated)
		{
			fmt::print(stderr, "warning: not running as root, ports of other users' processes are not shown\n\n");
		}
		if (Options.Scope != EScope::System)
		{
			PrintTable("User processes", Filtered.UserEntries);
		}
		if (Options.Scope != EScope::User)
		{
			PrintTable("System processes", Filtered.SystemEntries);
		}
		fmt::print("{} user, {} system at {}\n", Filtered.UserEntries.size(), Filtered.SystemEntries.size(),
			WTime::FormatClock(WTime::GetEpochMs()));
		return 0;
	}

	int RunKill(WPortMonitor& Monitor, WProcessId Pid, ETerminateMode Mode)
	{
		if (!Monitor.IsElevated())
		{
			fmt::print(stderr, "warning: not running as root, only your own processes can be killed\n");
		}
		auto Outcome = Monitor.Terminate(Pid, Mode);
		fmt::print(Outcome.IsSuccess() ? stdout : stderr, "{}\n", Outcome.Message);
		return Outcome.IsSuccess() ? 0 : 1;
	}

	int RunTrace(WPortMonitor& Monitor, WProcessId Pid)
	{
		auto Trace = Monitor.Trace(Pid);
		if (!Trace.bFound)
		{
			fmt::print("no controller above {}\n", Pid);
			return 1;
		}
		fmt::print("{} is controlled by {} (PID: {})\n", Pid, *Trace.RootControllerName, *Trace.RootControllerPid);
		return 0;
	}
} // namespace

int main(int argc, char** argv)
{
	std::vector<std::string_view> Args(argv + 1, argv + argc);

	spdlog::set_level(spdlog::level::warn);
	if (!Args.empty() && (Args.front() == "-v" || Args.front() == "--verbose"))
	{
		spdlog::set_level(spdlog::level::debug);
		Args.erase(Args.begin());
	}

	if (Args.empty())
	{
		PrintUsage();
		return 2;
	}

	auto const&        Cfg = WConfig::GetInstance();
	WLinuxProcessTable ProcessTable{};
	WPortMonitor       Monitor(ProcessTable, Cfg.Classifier, Cfg.Resolver);

	std::string_view const        Command = Args.front();
	std::vector<std::string_view> const Rest(Args.begin() + 1, Args.end());

	if (Command == "list")
	{
		WListOptions Options{};
		if (!ParseListOptions(Rest, Options))
		{
			PrintUsage();
			return 2;
		}
		return RunList(Monitor, Options);
	}

	if (Command == "kill" || Command == "kill-tree" || Command == "trace")
	{
		std::optional<WProcessId> Pid = Rest.size() == 1 ? ParsePid(Rest.front()) : std::nullopt;
		if (!Pid)
		{
			PrintUsage();
			return 2;
		}
		if (Command == "trace")
		{
			return RunTrace(Monitor, *Pid);
		}
		return RunKill(Monitor, *Pid, Command == "kill" ? ETerminateMode::Single : ETerminateMode::Tree);
	}

	PrintUsage();
	return 2;
}
