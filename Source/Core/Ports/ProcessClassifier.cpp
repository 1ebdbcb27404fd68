/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProcessClassifier.hpp"

#include <algorithm>

#include "StringUtil.hpp"

WClassifierConfig WClassifierConfig::Defaults()
{
	WClassifierConfig Config{};
	Config.SystemProcesses = {
		// Windows
		"system", "svchost.exe", "services.exe", "lsass.exe", "csrss.exe", "wininit.exe", "winlogon.exe", "smss.exe",
		"dwm.exe", "explorer.exe", "spoolsv.exe", "searchindexer.exe", "msdtc.exe", "fontdrvhost.exe", "registry",
		"memory compression", "ntoskrnl.exe", "audiodg.exe", "conhost.exe", "dllhost.exe", "sihost.exe",
		"taskhostw.exe", "runtimebroker.exe", "shellexperiencehost.exe", "startmenuexperiencehost.exe", "ctfmon.exe",
		"securityhealthservice.exe", "sgrmbroker.exe", "microsoftedgeupdate.exe", "wmiprvse.exe", "wudfhost.exe",
		// Linux
		"systemd", "systemd-resolved", "systemd-networkd", "systemd-timesyncd", "sshd", "cupsd", "avahi-daemon",
		"dnsmasq", "chronyd", "rpcbind", "rpc.statd", "networkmanager", "containerd", "dockerd"
	};
	Config.SystemAccountMarkers = { "SYSTEM", "LOCAL SERVICE", "NETWORK SERVICE" };
	return Config;
}

bool WAppTypeRule::Matches(std::string_view LowerName, std::string_view LowerCommandLine) const
{
	if (!NameMarkers.empty() && !WStringUtil::ContainsAny(LowerName, NameMarkers))
	{
		return false;
	}
	if (!NameSuffix.empty() && !LowerName.ends_with(NameSuffix))
	{
		return false;
	}
	if (!CommandMarkers.empty() && !WStringUtil::ContainsAny(LowerCommandLine, CommandMarkers))
	{
		return false;
	}
	return true;
}

WProcessClassifier::WProcessClassifier(WClassifierConfig const& Config)
	: SystemProcesses(WStringUtil::ToLowerSet(Config.SystemProcesses))
{
	SystemAccountMarkers.reserve(Config.SystemAccountMarkers.size());
	for (auto const& Marker : Config.SystemAccountMarkers)
	{
		SystemAccountMarkers.push_back(WStringUtil::ToUpper(Marker));
	}
}

bool WProcessClassifier::IsSystemProcess(std::string_view Name, std::optional<std::string> const& UserName) const
{
	if (SystemProcesses.contains(WStringUtil::ToLower(Name)))
	{
		return true;
	}

	if (UserName.has_value() && !UserName->empty())
	{
		return WStringUtil::ContainsAny(WStringUtil::ToUpper(*UserName), SystemAccountMarkers);
	}
	return false;
}

std::vector<WAppTypeRule> const& WProcessClassifier::GetAppTypeRules()
{
	static std::vector<std::string> const NodeNames{ "node", "npm" };
	static std::vector<std::string> const PythonNames{ "python", "python3", "pythonw" };
	static std::vector<std::string> const PhpNames{ "php", "httpd", "apache" };

	// A family's last rule has no command markers so once a family's name matched nothing below it is tried
	static std::vector<WAppTypeRule> const Rules{
		{ EAppType::NextJs, NodeNames, { "next", "next-server" } },
		{ EAppType::React, NodeNames, { "react", "vite" } },
		{ EAppType::Vue, NodeNames, { "vue" } },
		{ EAppType::Angular, NodeNames, { "angular" } },
		{ EAppType::Express, NodeNames, { "express" } },
		{ EAppType::Static, NodeNames, { "serve" } },
		{ EAppType::Node, NodeNames, {} },

		{ EAppType::Flask, PythonNames, { "flask" } },
		{ EAppType::Django, PythonNames, { "django", "manage.py" } },
		{ EAppType::FastApi, PythonNames, { "fastapi", "uvicorn" } },
		{ EAppType::Python, PythonNames, {} },

		{ EAppType::Laravel, PhpNames, { "laravel", "artisan" } },
		{ EAppType::Php, PhpNames, {} },

		{ EAppType::Spring, { "java" }, { "spring" } },
		{ EAppType::Java, { "java" }, {} },

		{ EAppType::DotNet, { "dotnet" }, {} },
		{ EAppType::DotNet, {}, { "aspnet" }, ".exe" },

		{ EAppType::MySql, { "mysql", "mysqld" }, {} },
		{ EAppType::Postgres, { "postgres", "postgresql" }, {} },
		{ EAppType::MongoDb, { "mongo" }, {} },
		{ EAppType::Redis, { "redis" }, {} },

		{ EAppType::Nginx, { "nginx" }, {} },
		// Shadowed by the php family above, kept so the table mirrors the full detection order
		{ EAppType::Apache, { "apache", "httpd" }, {} },

		{ EAppType::Browser, { "chrome", "msedge", "firefox" }, {} },
	};
	return Rules;
}

EAppType WProcessClassifier::DetectAppType(std::string_view Name, std::string_view CommandLine)
{
	std::string const LowerName = WStringUtil::ToLower(Name);
	std::string const LowerCommandLine = WStringUtil::ToLower(CommandLine);

	auto const& Rules = GetAppTypeRules();
	auto const  It = std::ranges::find_if(
		 Rules, [&](WAppTypeRule const& Rule) { return Rule.Matches(LowerName, LowerCommandLine); });
	return It != Rules.end() ? It->Tag : EAppType::Other;
}
