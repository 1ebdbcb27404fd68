/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ControllerResolver.hpp"

#include <spdlog/spdlog.h>

#include "StringUtil.hpp"
#include "Os/IProcessTable.hpp"

std::optional<WAncestor> WProcessTableAncestry::ReadAncestor(WProcessId Pid)
{
	auto Name = Table.GetProcessName(Pid);
	if (!Name)
	{
		return std::nullopt;
	}
	return WAncestor{ std::move(*Name), Table.GetParent(Pid) };
}

WResolverConfig WResolverConfig::Defaults()
{
	WResolverConfig Config{};
	Config.Controllers = { "node", "node.exe", "npm", "python", "python.exe", "python3", "python3.exe", "pythonw.exe",
		"php", "php.exe", "php-cgi.exe", "java", "java.exe", "javaw.exe", "ruby", "ruby.exe", "dotnet", "dotnet.exe",
		"deno", "deno.exe", "bun", "bun.exe" };
	Config.Wrappers = { "cmd.exe", "powershell.exe", "pwsh.exe", "pwsh", "conhost.exe", "windowsterminal.exe", "sh",
		"bash", "dash", "zsh", "fish", "bash.exe", "sh.exe", "npx", "npm.cmd", "npx.cmd", "yarn", "pnpm", "env", "sudo",
		"nohup", "setsid" };
	return Config;
}

WControllerResolver::WControllerResolver(WResolverConfig const& Config)
	: Controllers(WStringUtil::ToLowerSet(Config.Controllers))
	, Wrappers(WStringUtil::ToLowerSet(Config.Wrappers))
	, MaxDepth(Config.MaxDepth > 0 ? Config.MaxDepth : 1)
{
}

bool WControllerResolver::IsController(std::string const& Name) const
{
	return Controllers.contains(WStringUtil::ToLower(Name));
}

bool WControllerResolver::IsWrapper(std::string const& Name) const
{
	return Wrappers.contains(WStringUtil::ToLower(Name));
}

WControllerTrace WControllerResolver::Trace(IAncestrySource& Source, WProcessId LeafPid) const
{
	WControllerTrace Result{};

	auto Leaf = Source.ReadAncestor(LeafPid);
	if (!Leaf || !Leaf->ParentPid)
	{
		return Result;
	}
	return TraceFromParent(Source, LeafPid, *Leaf->ParentPid);
}

WControllerTrace WControllerResolver::TraceFromParent(
	IAncestrySource& Source, WProcessId LeafPid, WProcessId ParentPid) const
{
	WControllerTrace Result{};

	std::unordered_set<WProcessId> Visited{ LeafPid };
	WProcessId                     Current = ParentPid;

	for (int Depth = 0; Depth < MaxDepth; ++Depth)
	{
		if (Current <= 0 || !Visited.insert(Current).second)
		{
			break;
		}

		auto Ancestor = Source.ReadAncestor(Current);
		if (!Ancestor)
		{
			break;
		}

		std::string const Name = WStringUtil::ToLower(Ancestor->Name);
		bool const        bController = Controllers.contains(Name);
		if (bController)
		{
			Result.RootControllerPid = Current;
			Result.RootControllerName = Ancestor->Name;
			Result.bFound = true;
		}

		if (!bController && !Wrappers.contains(Name))
		{
			break;
		}

		if (!Ancestor->ParentPid)
		{
			break;
		}
		Current = *Ancestor->ParentPid;
	}

	if (Result.bFound)
	{
		spdlog::debug("Controller of {} is {} ({})", LeafPid, *Result.RootControllerName, *Result.RootControllerPid);
	}
	return Result;
}
