/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Config.hpp"

#include <limits>

#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "Random.hpp"
#include "StringUtil.hpp"

WConfig::WConfig()
{
	SetDefaults();
	if (WFilesystem::Exists("./wharfd.ini"))
	{
		Load("./wharfd.ini");
	}
	else if (WFilesystem::Exists("/etc/wharf/wharfd.ini"))
	{
		Load("/etc/wharf/wharfd.ini");
	}
	else
	{
		spdlog::info("no configuration file found, using defaults");
	}

	if (AuthToken.empty())
	{
		AuthToken = WRandom::GenerateRandomHexString(32);
		spdlog::info("no auth_token configured, generated one for this run: {}", AuthToken);
	}
}

void WConfig::LogConfig() const
{
	spdlog::info("config file={}", LoadedFrom.empty() ? "<defaults>" : LoadedFrom);
	spdlog::info("port={}", Port);
	spdlog::info("poll interval={}ms", PollInterval.count());
	spdlog::info("log level={}", LogLevel);
	spdlog::info("{} system processes, {} system accounts", Classifier.SystemProcesses.size(),
		Classifier.SystemAccountMarkers.size());
	spdlog::info("{} controllers, {} wrappers, max depth {}", Resolver.Controllers.size(), Resolver.Wrappers.size(),
		Resolver.MaxDepth);
}

void WConfig::ApplyLogLevel() const
{
	auto Level = spdlog::level::from_str(LogLevel);
	if (Level == spdlog::level::off && LogLevel != "off")
	{
		spdlog::warn("unknown log level '{}', keeping {}", LogLevel,
			spdlog::level::to_string_view(spdlog::get_level()));
		return;
	}
	spdlog::set_level(Level);
}

bool WConfig::Load(std::string const& Path)
{
	INIReader Reader(Path);

	auto SafeGet = [&](std::string const& Section, std::string const& Name, std::string& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = Reader.Get(Section, Name, OutVal);
		}
	};

	// A present key replaces the whole default list
	auto SafeGetList = [&](std::string const& Section, std::string const& Name, std::vector<std::string>& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = WStringUtil::SplitList(Reader.Get(Section, Name, ""));
		}
	};

	if (Reader.ParseError() < 0)
	{
		spdlog::error("can't load '{}': {}", Path, Reader.ParseErrorMessage());
		return false;
	}
	if (Reader.ParseError() > 0)
	{
		spdlog::warn("'{}' has a syntax error on line {}", Path, Reader.ParseError());
	}

	// Range checked as long, a cast first would wrap huge values into range
	long const RawPort = Reader.GetInteger("daemon", "port", Port);
	if (RawPort <= 0 || RawPort > 65535)
	{
		spdlog::warn("port {} is out of range, using 5000", RawPort);
		Port = 5000;
	}
	else
	{
		Port = static_cast<int>(RawPort);
	}
	SafeGet("daemon", "auth_token", AuthToken);
	PollInterval = WMilliseconds(Reader.GetInteger("daemon", "poll_interval_ms", PollInterval.count()));
	SafeGet("daemon", "log_level", LogLevel);

	SafeGetList("classifier", "system_processes", Classifier.SystemProcesses);
	SafeGetList("classifier", "system_accounts", Classifier.SystemAccountMarkers);

	SafeGetList("resolver", "controllers", Resolver.Controllers);
	SafeGetList("resolver", "wrappers", Resolver.Wrappers);
	long const RawMaxDepth = Reader.GetInteger("resolver", "max_depth", Resolver.MaxDepth);
	if (RawMaxDepth <= 0 || RawMaxDepth > std::numeric_limits<int>::max())
	{
		spdlog::warn("max_depth {} is out of range, using 64", RawMaxDepth);
		Resolver.MaxDepth = 64;
	}
	else
	{
		Resolver.MaxDepth = static_cast<int>(RawMaxDepth);
	}

	if (PollInterval.count() <= 0)
	{
		spdlog::warn("poll_interval_ms must be positive, using 2000");
		PollInterval = WMilliseconds(2000);
	}

	LoadedFrom = Path;
	return true;
}

void WConfig::SetDefaults()
{
	Port = 5000;
	AuthToken.clear();
	PollInterval = WMilliseconds(2000);
	LogLevel = "info";
	Classifier = WClassifierConfig::Defaults();
	Resolver = WResolverConfig::Defaults();
	LoadedFrom.clear();
}
