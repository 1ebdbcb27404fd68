/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>

#include "Singleton.hpp"
#include "Types.hpp"
#include "Ports/ControllerResolver.hpp"
#include "Ports/ProcessClassifier.hpp"

struct WConfig final : TSingleton<WConfig>
{
	int           Port{ 5000 };
	std::string   AuthToken{}; // random if not configured
	WMilliseconds PollInterval{ 2000 };
	std::string   LogLevel{ "info" };

	WClassifierConfig Classifier{};
	WResolverConfig   Resolver{};

	std::string LoadedFrom{}; // empty if running on defaults

	WConfig();

	void LogConfig() const;

	// Applies the level from LogLevel to spdlog
	void ApplyLogLevel() const;

	// Keys missing from the file keep their current value
	bool Load(std::string const& Path);
	void SetDefaults();
};
