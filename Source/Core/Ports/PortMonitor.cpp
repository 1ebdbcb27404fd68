/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "PortMonitor.hpp"

#include <spdlog/spdlog.h>
#include <tracy/Tracy.hpp>

static ETerminationStatus ToTerminationStatus(EKillResult Result)
{
	switch (Result)
	{
		case EKillResult::Success:
			return ETerminationStatus::Success;
		case EKillResult::NotFound:
			return ETerminationStatus::NotFound;
		case EKillResult::AccessDenied:
			return ETerminationStatus::AccessDenied;
		case EKillResult::Failed:
		default:
			return ETerminationStatus::OtherFailure;
	}
}

static std::string NotFoundMessage(WProcessId Pid)
{
	return "Process with PID " + std::to_string(Pid) + " not found";
}

static std::string AccessDeniedMessage()
{
	return "Access denied. Run with elevated rights to kill this process.";
}

WPortMonitor::WPortMonitor(
	IProcessTable& Table_, WClassifierConfig const& ClassifierConfig, WResolverConfig const& ResolverConfig)
	: Table(Table_), Classifier(ClassifierConfig), Resolver(ResolverConfig)
{
}

ECollectResult WPortMonitor::GetSnapshot(WPortSnapshot& OutSnapshot)
{
	WPortCollector Collector(Table, Classifier, Resolver);
	return Collector.Collect(OutSnapshot);
}

EPollResult WPortMonitor::PollForChange(WPortSnapshot& OutSnapshot)
{
	ZoneScopedN("WPortMonitor::PollForChange");
	if (GetSnapshot(OutSnapshot) != ECollectResult::Success)
	{
		// Clients were told the cycle failed, whatever comes next has to be pushed again
		ChangeDetector.Reset();
		return EPollResult::Failed;
	}
	return ChangeDetector.HasChanged(OutSnapshot) ? EPollResult::Changed : EPollResult::NoChange;
}

WControllerTrace WPortMonitor::Trace(WProcessId Pid)
{
	WProcessTableAncestry Ancestry(Table);
	return Resolver.Trace(Ancestry, Pid);
}

WTerminationOutcome WPortMonitor::Terminate(WProcessId Pid, ETerminateMode Mode)
{
	WTerminationOutcome Outcome = Mode == ETerminateMode::Tree ? TerminateTree(Pid) : TerminateSingle(Pid);
	if (Outcome.IsSuccess())
	{
		spdlog::info("{}", Outcome.Message);
	}
	else
	{
		spdlog::warn("Terminating {} failed: {}", Pid, Outcome.Message);
	}
	return Outcome;
}

WTerminationOutcome WPortMonitor::TerminateSingle(WProcessId Pid)
{
	WTerminationOutcome Outcome{};
	Outcome.Pid = Pid;
	Outcome.TargetPid = Pid;

	auto Lookup = Table.GetProcessIdentity(Pid);
	if (Lookup.Status == EProcessLookupStatus::NotFound)
	{
		Outcome.Status = ETerminationStatus::NotFound;
		Outcome.Message = NotFoundMessage(Pid);
		return Outcome;
	}
	if (Lookup.Status == EProcessLookupStatus::AccessDenied)
	{
		Outcome.Status = ETerminationStatus::AccessDenied;
		Outcome.Message = AccessDeniedMessage();
		return Outcome;
	}
	std::string const& Name = Lookup.Identity.Name;

	auto Kill = Table.KillProcess(Pid, false);
	Outcome.Status = ToTerminationStatus(Kill.Result);
	switch (Outcome.Status)
	{
		case ETerminationStatus::Success:
			Outcome.Message = "Process " + Name + " (PID: " + std::to_string(Pid) + ") terminated successfully";
			break;
		case ETerminationStatus::NotFound:
			Outcome.Message = NotFoundMessage(Pid);
			break;
		case ETerminationStatus::AccessDenied:
			Outcome.Message = AccessDeniedMessage();
			break;
		case ETerminationStatus::OtherFailure:
			Outcome.Message = Kill.Error.empty() ? "Failed to terminate process " + std::to_string(Pid) : Kill.Error;
			break;
	}
	return Outcome;
}

WTerminationOutcome WPortMonitor::TerminateTree(WProcessId Pid)
{
	auto Trace = this->Trace(Pid);
	if (!Trace.bFound || !Trace.RootControllerPid)
	{
		spdlog::debug("No controller above {}, terminating it alone", Pid);
		return TerminateSingle(Pid);
	}

	WProcessId const ControllerPid = *Trace.RootControllerPid;
	auto             Kill = Table.KillProcess(ControllerPid, true);
	if (!Kill.IsSuccess())
	{
		spdlog::warn("Killing tree of {} ({}) failed: {}, falling back to {}", *Trace.RootControllerName,
			ControllerPid, Kill.Error, Pid);
		return TerminateSingle(Pid);
	}

	WTerminationOutcome Outcome{};
	Outcome.Status = ETerminationStatus::Success;
	Outcome.Pid = Pid;
	Outcome.TargetPid = ControllerPid;
	Outcome.Message = "Process tree of " + *Trace.RootControllerName + " (PID: " + std::to_string(ControllerPid)
		+ ") terminated successfully";
	return Outcome;
}
