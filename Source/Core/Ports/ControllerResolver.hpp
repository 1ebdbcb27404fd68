/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "Types.hpp"

class IProcessTable;

struct WAncestor
{
	std::string               Name{};
	std::optional<WProcessId> ParentPid{};
};

class IAncestrySource
{
public:
	virtual ~IAncestrySource() = default;

	// Empty if the process is gone or cannot be inspected
	virtual std::optional<WAncestor> ReadAncestor(WProcessId Pid) = 0;
};

// Reads ancestors through the process table, only name and parent are needed
class WProcessTableAncestry : public IAncestrySource
{
	IProcessTable& Table;

public:
	explicit WProcessTableAncestry(IProcessTable& Table_)
		: Table(Table_)
	{
	}

	std::optional<WAncestor> ReadAncestor(WProcessId Pid) override;
};

struct WResolverConfig
{
	std::vector<std::string> Controllers{}; // runtimes that own a dev server, e.g. node, python
	std::vector<std::string> Wrappers{};    // shells and launchers that may sit between them
	int                      MaxDepth{ 64 };

	static WResolverConfig Defaults();
};

struct WControllerTrace
{
	std::optional<WProcessId>  RootControllerPid{};
	std::optional<std::string> RootControllerName{};
	bool                       bFound{};
};

class WControllerResolver
{
	std::unordered_set<std::string> Controllers{};
	std::unordered_set<std::string> Wrappers{};
	int                             MaxDepth{};

public:
	explicit WControllerResolver(WResolverConfig const& Config = WResolverConfig::Defaults());

	// Walks up from the parent of LeafPid through controllers and wrappers,
	// the highest controller seen on the way is the result
	[[nodiscard]] WControllerTrace Trace(IAncestrySource& Source, WProcessId LeafPid) const;

	// Same walk for a leaf whose parent is already known, the leaf itself is not read
	[[nodiscard]] WControllerTrace TraceFromParent(IAncestrySource& Source, WProcessId LeafPid, WProcessId ParentPid) const;

	[[nodiscard]] bool IsController(std::string const& Name) const;
	[[nodiscard]] bool IsWrapper(std::string const& Name) const;
	[[nodiscard]] int  GetMaxDepth() const { return MaxDepth; }
};
