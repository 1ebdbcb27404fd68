/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>

// Application framework a listening process most likely belongs to.
// The underlying values are part of the wire format, only append.
enum class EAppType : uint8_t
{
	Other,
	Node,
	NextJs,
	React,
	Vue,
	Angular,
	Express,
	Static,
	Python,
	Flask,
	Django,
	FastApi,
	Php,
	Laravel,
	Java,
	Spring,
	DotNet,
	MySql,
	Postgres,
	MongoDb,
	Redis,
	Nginx,
	Apache,
	Browser,
	Count
};

namespace WAppType
{
	struct WAppTypeName
	{
		EAppType         Type;
		std::string_view Tag;   // nextjs
		std::string_view Label; // Next.js
	};

	inline constexpr WAppTypeName Names[] = {
		{ EAppType::Other, "other", "Other" },
		{ EAppType::Node, "node", "Node.js" },
		{ EAppType::NextJs, "nextjs", "Next.js" },
		{ EAppType::React, "react", "React" },
		{ EAppType::Vue, "vue", "Vue" },
		{ EAppType::Angular, "angular", "Angular" },
		{ EAppType::Express, "express", "Express" },
		{ EAppType::Static, "static", "Static" },
		{ EAppType::Python, "python", "Python" },
		{ EAppType::Flask, "flask", "Flask" },
		{ EAppType::Django, "django", "Django" },
		{ EAppType::FastApi, "fastapi", "FastAPI" },
		{ EAppType::Php, "php", "PHP" },
		{ EAppType::Laravel, "laravel", "Laravel" },
		{ EAppType::Java, "java", "Java" },
		{ EAppType::Spring, "spring", "Spring" },
		{ EAppType::DotNet, "dotnet", ".NET" },
		{ EAppType::MySql, "mysql", "MySQL" },
		{ EAppType::Postgres, "postgres", "Postgres" },
		{ EAppType::MongoDb, "mongodb", "MongoDB" },
		{ EAppType::Redis, "redis", "Redis" },
		{ EAppType::Nginx, "nginx", "Nginx" },
		{ EAppType::Apache, "apache", "Apache" },
		{ EAppType::Browser, "browser", "Browser" },
	};

	static_assert(std::size(Names) == static_cast<size_t>(EAppType::Count));

	constexpr std::string_view ToTag(EAppType Type)
	{
		auto const Index = static_cast<size_t>(Type);
		return Index < std::size(Names) ? Names[Index].Tag : Names[0].Tag;
	}

	constexpr std::string_view ToLabel(EAppType Type)
	{
		auto const Index = static_cast<size_t>(Type);
		return Index < std::size(Names) ? Names[Index].Label : Names[0].Label;
	}

	constexpr std::optional<EAppType> FromTag(std::string_view Tag)
	{
		for (auto const& Name : Names)
		{
			if (Name.Tag == Tag)
			{
				return Name.Type;
			}
		}
		return std::nullopt;
	}
} // namespace WAppType
