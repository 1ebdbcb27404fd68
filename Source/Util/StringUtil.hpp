/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>
#include <unordered_set>

class WStringUtil
{
public:
	static std::string ToLower(std::string_view In)
	{
		std::string Out(In);
		std::ranges::transform(Out, Out.begin(), [](unsigned char C) { return static_cast<char>(std::tolower(C)); });
		return Out;
	}

	static std::string ToUpper(std::string_view In)
	{
		std::string Out(In);
		std::ranges::transform(Out, Out.begin(), [](unsigned char C) { return static_cast<char>(std::toupper(C)); });
		return Out;
	}

	static std::string Trim(std::string_view In)
	{
		auto const Begin = In.find_first_not_of(" \t\r\n");
		if (Begin == std::string_view::npos)
		{
			return {};
		}
		auto const End = In.find_last_not_of(" \t\r\n");
		return std::string(In.substr(Begin, End - Begin + 1));
	}

	static bool ContainsAny(std::string_view Haystack, std::vector<std::string> const& Needles)
	{
		return std::ranges::any_of(
			Needles, [&](std::string const& Needle) { return Haystack.find(Needle) != std::string_view::npos; });
	}

	// "a, b,,c" -> {"a", "b", "c"}
	static std::vector<std::string> SplitList(std::string_view List, char Delimiter = ',')
	{
		std::vector<std::string> Items{};
		size_t                   Start = 0;
		while (Start <= List.size())
		{
			size_t End = List.find(Delimiter, Start);
			if (End == std::string_view::npos)
			{
				End = List.size();
			}
			if (auto Item = Trim(List.substr(Start, End - Start)); !Item.empty())
			{
				Items.emplace_back(std::move(Item));
			}
			Start = End + 1;
		}
		return Items;
	}

	// Lower-cased set, names are always compared lower-cased
	static std::unordered_set<std::string> ToLowerSet(std::vector<std::string> const& Items)
	{
		std::unordered_set<std::string> Set{};
		for (auto const& Item : Items)
		{
			Set.insert(ToLower(Item));
		}
		return Set;
	}
};
