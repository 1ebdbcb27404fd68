/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "PortCollector.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>

WPortCollector::WPortCollector(
	IProcessTable& Table_, WProcessClassifier const& Classifier_, WControllerResolver const& Resolver_)
	: Table(Table_), Classifier(Classifier_), Resolver(Resolver_), Ancestry(Table_)
{
}

void WPortCollector::BuildEntry(
	WSocketRecord const& Record, WProcessIdentity const& Identity, WProcessPortEntry& OutEntry)
{
	OutEntry.Port = Record.GetPort();
	OutEntry.Pid = Identity.Pid;
	OutEntry.Name = Identity.Name;
	OutEntry.UserName = Identity.UserName;
	OutEntry.Address = Record.LocalEndpoint.ToString();
	OutEntry.Protocol = Record.Protocol;
	OutEntry.ConnectionState = Record.ConnectionState;
	OutEntry.AppType = WProcessClassifier::DetectAppType(Identity.Name, Identity.CommandLine);
	OutEntry.bIsSystem = Classifier.IsSystemProcess(Identity.Name, Identity.UserName);
	OutEntry.ParentPid = Identity.ParentPid;

	WControllerTrace Trace{};
	if (Identity.ParentPid)
	{
		Trace = Resolver.TraceFromParent(Ancestry, Identity.Pid, *Identity.ParentPid);
	}
	if (Trace.bFound)
	{
		OutEntry.RootControllerPid = Trace.RootControllerPid;
		OutEntry.RootControllerName = std::move(Trace.RootControllerName);
		OutEntry.bHasParentController = true;
	}
	else
	{
		OutEntry.RootControllerPid = Identity.ParentPid;
		OutEntry.RootControllerName.reset();
		OutEntry.bHasParentController = false;
	}
}

ECollectResult WPortCollector::Collect(WPortSnapshot& OutSnapshot)
{
	ZoneScopedN("WPortCollector::Collect");

	std::vector<WSocketRecord> Records{};
	if (!Table.ListInetSockets(Records))
	{
		spdlog::error("Failed to enumerate sockets");
		return ECollectResult::SocketEnumerationFailed;
	}

	WPortSnapshot                         Snapshot{};
	std::set<std::pair<WPort, WProcessId>> Seen{};
	size_t                                Dropped{};

	for (auto const& Record : Records)
	{
		if (Record.GetPort() == 0 || Record.Pid <= 0)
		{
			continue;
		}
		if (!Seen.emplace(Record.GetPort(), Record.Pid).second)
		{
			continue;
		}

		auto Lookup = Table.GetProcessIdentity(Record.Pid);
		if (!Lookup.IsOk())
		{
			spdlog::debug("Dropping port {} of pid {}: {}", Record.GetPort(), Record.Pid,
				Lookup.Status == EProcessLookupStatus::AccessDenied ? "access denied" : "process gone");
			++Dropped;
			continue;
		}

		WProcessPortEntry Entry{};
		BuildEntry(Record, Lookup.Identity, Entry);
		if (Entry.bIsSystem)
		{
			Snapshot.SystemEntries.emplace_back(std::move(Entry));
		}
		else
		{
			Snapshot.UserEntries.emplace_back(std::move(Entry));
		}
	}

	auto ByPort = [](WProcessPortEntry const& A, WProcessPortEntry const& B) { return A.Port < B.Port; };
	std::ranges::stable_sort(Snapshot.SystemEntries, ByPort);
	std::ranges::stable_sort(Snapshot.UserEntries, ByPort);

	spdlog::debug("Collected {} system and {} user entries ({} dropped)", Snapshot.SystemEntries.size(),
		Snapshot.UserEntries.size(), Dropped);
	OutSnapshot = std::move(Snapshot);
	return ECollectResult::Success;
}
