/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include "ChangeDetector.hpp"
#include "ControllerResolver.hpp"
#include "PortCollector.hpp"
#include "ProcessClassifier.hpp"
#include "Data/Termination.hpp"
#include "Os/IProcessTable.hpp"

enum class EPollResult : uint8_t
{
	Changed,
	NoChange,
	Failed
};

// Entry point of the port engine, owns the classifier, resolver and change detector
// for one monitoring session. The process table must outlive the monitor.
class WPortMonitor
{
	IProcessTable&      Table;
	WProcessClassifier  Classifier;
	WControllerResolver Resolver;
	WChangeDetector     ChangeDetector{};

	WTerminationOutcome TerminateSingle(WProcessId Pid);
	WTerminationOutcome TerminateTree(WProcessId Pid);

public:
	WPortMonitor(IProcessTable& Table_, WClassifierConfig const& ClassifierConfig = WClassifierConfig::Defaults(),
		WResolverConfig const& ResolverConfig = WResolverConfig::Defaults());

	// A full collection, the change detector is not consulted
	ECollectResult GetSnapshot(WPortSnapshot& OutSnapshot);

	// OutSnapshot is filled for both Changed and NoChange
	EPollResult PollForChange(WPortSnapshot& OutSnapshot);

	WTerminationOutcome Terminate(WProcessId Pid, ETerminateMode Mode);

	WControllerTrace Trace(WProcessId Pid);

	bool IsElevated() { return Table.IsElevated(); }

	// Makes the next PollForChange() report a change
	void ForceNextChange() { ChangeDetector.Reset(); }
};
