/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <vector>

#include "ControllerResolver.hpp"
#include "ProcessClassifier.hpp"
#include "Data/PortEntry.hpp"
#include "Os/IProcessTable.hpp"

enum class ECollectResult : uint8_t
{
	Success,
	SocketEnumerationFailed
};

// Builds one classified and resolved snapshot of all (port, pid) pairs
class WPortCollector
{
	IProcessTable&             Table;
	WProcessClassifier const&  Classifier;
	WControllerResolver const& Resolver;
	WProcessTableAncestry      Ancestry;

	void BuildEntry(WSocketRecord const& Record, WProcessIdentity const& Identity, WProcessPortEntry& OutEntry);

public:
	WPortCollector(IProcessTable& Table_, WProcessClassifier const& Classifier_, WControllerResolver const& Resolver_);

	// OutSnapshot is only written on success
	ECollectResult Collect(WPortSnapshot& OutSnapshot);
};
