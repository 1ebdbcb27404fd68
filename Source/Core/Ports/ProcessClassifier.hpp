/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "Data/AppType.hpp"

struct WClassifierConfig
{
	std::vector<std::string> SystemProcesses{};      // matched case insensitive against the whole name
	std::vector<std::string> SystemAccountMarkers{}; // matched case insensitive as substring of the user name

	static WClassifierConfig Defaults();
};

// A process matches a rule when all non-empty conditions hold:
// the lower-cased name contains one of NameMarkers, ends with NameSuffix
// and the lower-cased command line contains one of CommandMarkers.
struct WAppTypeRule
{
	EAppType                 Tag{ EAppType::Other };
	std::vector<std::string> NameMarkers{};
	std::vector<std::string> CommandMarkers{};
	std::string              NameSuffix{};

	[[nodiscard]] bool Matches(std::string_view LowerName, std::string_view LowerCommandLine) const;
};

class WProcessClassifier
{
	std::unordered_set<std::string> SystemProcesses{};
	std::vector<std::string>        SystemAccountMarkers{};

public:
	explicit WProcessClassifier(WClassifierConfig const& Config = WClassifierConfig::Defaults());

	[[nodiscard]] bool IsSystemProcess(std::string_view Name, std::optional<std::string> const& UserName) const;

	// First matching rule wins, see GetAppTypeRules() for the order
	static EAppType DetectAppType(std::string_view Name, std::string_view CommandLine);

	// The rules in priority order. A command line that mentions several frameworks gets the
	// earliest one, e.g. "vite ... vue" is react because react/vite is checked before vue.
	static std::vector<WAppTypeRule> const& GetAppTypeRules();
};
