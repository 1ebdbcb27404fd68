/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Config.hpp"
#include "StringUtil.hpp"

#include <gtest/gtest.h>

#include <fstream>

namespace
{
	class ConfigTest : public ::testing::Test
	{
	protected:
		WConfig& Cfg = WConfig::GetInstance();

		void SetUp() override { Cfg.SetDefaults(); }
		void TearDown() override { Cfg.SetDefaults(); }

		static std::string WriteIni(std::string const& Name, std::string const& Content)
		{
			std::string const Path = ::testing::TempDir() + Name;
			std::ofstream     File(Path);
			File << Content;
			return Path;
		}
	};
} // namespace

TEST(StringUtilTest, SplitListTrimsAndDropsEmptyItems)
{
	auto Items = WStringUtil::SplitList(" node, npm ,,python3 ,");
	ASSERT_EQ(Items.size(), 3u);
	EXPECT_EQ(Items[0], "node");
	EXPECT_EQ(Items[1], "npm");
	EXPECT_EQ(Items[2], "python3");

	EXPECT_TRUE(WStringUtil::SplitList("").empty());
	EXPECT_TRUE(WStringUtil::SplitList(" , ").empty());
	EXPECT_EQ(WStringUtil::SplitList("memory compression").front(), "memory compression");
}

TEST_F(ConfigTest, DefaultsWithoutFile)
{
	EXPECT_EQ(Cfg.Port, 5000);
	EXPECT_EQ(Cfg.PollInterval, WMilliseconds(2000));
	EXPECT_EQ(Cfg.LogLevel, "info");
	EXPECT_EQ(Cfg.Resolver.MaxDepth, 64);
	EXPECT_FALSE(Cfg.Classifier.SystemProcesses.empty());
	EXPECT_EQ(Cfg.Classifier.SystemAccountMarkers.size(), 3u);
}

TEST_F(ConfigTest, LoadOverridesPresentKeys)
{
	auto Path = WriteIni("wharf_config.ini",
		"[daemon]\n"
		"port = 6001\n"
		"auth_token = secret\n"
		"poll_interval_ms = 500\n"
		"log_level = debug\n"
		"[classifier]\n"
		"system_accounts = root, daemon\n"
		"[resolver]\n"
		"controllers = node, deno\n"
		"max_depth = 8\n");

	ASSERT_TRUE(Cfg.Load(Path));
	EXPECT_EQ(Cfg.Port, 6001);
	EXPECT_EQ(Cfg.AuthToken, "secret");
	EXPECT_EQ(Cfg.PollInterval, WMilliseconds(500));
	EXPECT_EQ(Cfg.LogLevel, "debug");
	EXPECT_EQ(Cfg.Classifier.SystemAccountMarkers, (std::vector<std::string>{ "root", "daemon" }));
	EXPECT_EQ(Cfg.Resolver.Controllers, (std::vector<std::string>{ "node", "deno" }));
	EXPECT_EQ(Cfg.Resolver.MaxDepth, 8);
	EXPECT_EQ(Cfg.LoadedFrom, Path);

	// Absent keys keep their defaults
	EXPECT_EQ(Cfg.Classifier.SystemProcesses, WClassifierConfig::Defaults().SystemProcesses);
	EXPECT_EQ(Cfg.Resolver.Wrappers, WResolverConfig::Defaults().Wrappers);
}

TEST_F(ConfigTest, InvalidNumbersFallBackToDefaults)
{
	auto Path = WriteIni("wharf_bad.ini",
		"[daemon]\n"
		"port = 70000\n"
		"poll_interval_ms = 0\n"
		"[resolver]\n"
		"max_depth = -1\n");

	ASSERT_TRUE(Cfg.Load(Path));
	EXPECT_EQ(Cfg.Port, 5000);
	EXPECT_EQ(Cfg.PollInterval, WMilliseconds(2000));
	EXPECT_EQ(Cfg.Resolver.MaxDepth, 64);
}

TEST_F(ConfigTest, ValuesBeyondIntAreRejected)
{
	// 2^32 + 6000 and 2^32 + 8 would land on valid values after truncation to int
	auto Path = WriteIni("wharf_huge.ini",
		"[daemon]\n"
		"port = 4294973296\n"
		"[resolver]\n"
		"max_depth = 4294967304\n");

	ASSERT_TRUE(Cfg.Load(Path));
	EXPECT_EQ(Cfg.Port, 5000);
	EXPECT_EQ(Cfg.Resolver.MaxDepth, 64);
}

TEST_F(ConfigTest, MissingFileIsAnError)
{
	EXPECT_FALSE(Cfg.Load(::testing::TempDir() + "wharf_does_not_exist.ini"));
	EXPECT_TRUE(Cfg.LoadedFrom.empty());
}
