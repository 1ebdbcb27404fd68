/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Ports/ProcessClassifier.hpp"

#include <gtest/gtest.h>

TEST(ProcessClassifierTest, NodeWithNextServerIsNextJs)
{
	EXPECT_EQ(WProcessClassifier::DetectAppType("node.exe", "node C:\\app\\node_modules\\.bin\\next-server"),
		EAppType::NextJs);
	EXPECT_EQ(WProcessClassifier::DetectAppType("node", "node /srv/app/node_modules/next/dist/bin/next dev"),
		EAppType::NextJs);
}

TEST(ProcessClassifierTest, NodeFamilyKeywords)
{
	EXPECT_EQ(WProcessClassifier::DetectAppType("node", "node node_modules/.bin/vite"), EAppType::React);
	EXPECT_EQ(WProcessClassifier::DetectAppType("node", "node vue-cli-service serve"), EAppType::Vue);
	EXPECT_EQ(WProcessClassifier::DetectAppType("node", "node ng serve --project angular-app"), EAppType::Angular);
	EXPECT_EQ(WProcessClassifier::DetectAppType("node", "node server.js --express"), EAppType::Express);
	EXPECT_EQ(WProcessClassifier::DetectAppType("npm", "npm exec serve dist"), EAppType::Static);
	EXPECT_EQ(WProcessClassifier::DetectAppType("node", "node index.js"), EAppType::Node);
}

TEST(ProcessClassifierTest, EarlierRuleWinsOverMoreSpecificKeyword)
{
	// react/vite is checked before vue
	EXPECT_EQ(WProcessClassifier::DetectAppType("node", "node vite --config vue.config.js"), EAppType::React);
	// next is checked before everything else in the node family
	EXPECT_EQ(WProcessClassifier::DetectAppType("npm", "npm run serve -- --next"), EAppType::NextJs);
	EXPECT_EQ(WProcessClassifier::DetectAppType("node", "node serve.js --express"), EAppType::Express);
}

TEST(ProcessClassifierTest, PythonFamily)
{
	EXPECT_EQ(WProcessClassifier::DetectAppType("python3", "python3 -m flask run"), EAppType::Flask);
	EXPECT_EQ(WProcessClassifier::DetectAppType("python", "python manage.py runserver"), EAppType::Django);
	EXPECT_EQ(WProcessClassifier::DetectAppType("python3", "/usr/bin/python3 -m uvicorn main:app"), EAppType::FastApi);
	EXPECT_EQ(WProcessClassifier::DetectAppType("pythonw.exe", "pythonw.exe tool.py"), EAppType::Python);
}

TEST(ProcessClassifierTest, PhpFamilyShadowsApache)
{
	EXPECT_EQ(WProcessClassifier::DetectAppType("php", "php artisan serve"), EAppType::Laravel);
	EXPECT_EQ(WProcessClassifier::DetectAppType("php-fpm", "php-fpm: master process"), EAppType::Php);
	EXPECT_EQ(WProcessClassifier::DetectAppType("httpd", "/usr/sbin/httpd -DFOREGROUND"), EAppType::Php);
	EXPECT_EQ(WProcessClassifier::DetectAppType("apache2", "/usr/sbin/apache2 -k start"), EAppType::Php);
}

TEST(ProcessClassifierTest, OtherRuntimesAndServers)
{
	EXPECT_EQ(WProcessClassifier::DetectAppType("java", "java -jar spring-boot-app.jar"), EAppType::Spring);
	EXPECT_EQ(WProcessClassifier::DetectAppType("java", "java -jar app.jar"), EAppType::Java);
	EXPECT_EQ(WProcessClassifier::DetectAppType("dotnet", "dotnet run"), EAppType::DotNet);
	EXPECT_EQ(WProcessClassifier::DetectAppType("MyApi.exe", "MyApi.exe --urls http://+:5000 ASPNETCORE"),
		EAppType::DotNet);
	EXPECT_EQ(WProcessClassifier::DetectAppType("mysqld", ""), EAppType::MySql);
	EXPECT_EQ(WProcessClassifier::DetectAppType("postgres", "postgres -D /var/lib/postgres"), EAppType::Postgres);
	EXPECT_EQ(WProcessClassifier::DetectAppType("mongod", ""), EAppType::MongoDb);
	EXPECT_EQ(WProcessClassifier::DetectAppType("redis-server", "redis-server *:6379"), EAppType::Redis);
	EXPECT_EQ(WProcessClassifier::DetectAppType("nginx", "nginx: master process"), EAppType::Nginx);
	EXPECT_EQ(WProcessClassifier::DetectAppType("firefox", ""), EAppType::Browser);
	EXPECT_EQ(WProcessClassifier::DetectAppType("sshd", "sshd: /usr/sbin/sshd -D"), EAppType::Other);
}

TEST(ProcessClassifierTest, MatchingIsCaseInsensitive)
{
	EXPECT_EQ(WProcessClassifier::DetectAppType("NODE.EXE", "NODE NEXT DEV"), EAppType::NextJs);
	EXPECT_EQ(WProcessClassifier::DetectAppType("Chrome.exe", ""), EAppType::Browser);
}

TEST(ProcessClassifierTest, ExeWithoutAspnetIsOther)
{
	EXPECT_EQ(WProcessClassifier::DetectAppType("game.exe", "game.exe --port 7777"), EAppType::Other);
}

TEST(ProcessClassifierTest, RuleTableKeepsDetectionOrder)
{
	auto const& Rules = WProcessClassifier::GetAppTypeRules();
	ASSERT_EQ(Rules.size(), 24u);
	EXPECT_EQ(Rules.front().Tag, EAppType::NextJs);
	EXPECT_EQ(Rules[6].Tag, EAppType::Node);
	EXPECT_TRUE(Rules[6].CommandMarkers.empty());
	EXPECT_EQ(Rules[16].NameSuffix, ".exe");
	EXPECT_EQ(Rules.back().Tag, EAppType::Browser);
}

TEST(ProcessClassifierTest, SystemProcessByName)
{
	WProcessClassifier Classifier{};
	EXPECT_TRUE(Classifier.IsSystemProcess("svchost.exe", std::string("dev")));
	EXPECT_TRUE(Classifier.IsSystemProcess("SVCHOST.EXE", std::nullopt));
	EXPECT_TRUE(Classifier.IsSystemProcess("sshd", std::string("root")));
	EXPECT_FALSE(Classifier.IsSystemProcess("node", std::string("dev")));
}

TEST(ProcessClassifierTest, SystemProcessByAccount)
{
	WProcessClassifier Classifier{};
	EXPECT_TRUE(Classifier.IsSystemProcess("node.exe", std::string("NT AUTHORITY\\SYSTEM")));
	EXPECT_TRUE(Classifier.IsSystemProcess("foo.exe", std::string("nt authority\\network service")));
	EXPECT_FALSE(Classifier.IsSystemProcess("node", std::string("root")));
	EXPECT_FALSE(Classifier.IsSystemProcess("node", std::nullopt));
	EXPECT_FALSE(Classifier.IsSystemProcess("node", std::string("")));
}

TEST(ProcessClassifierTest, ConfiguredTablesReplaceDefaults)
{
	WClassifierConfig Config{};
	Config.SystemProcesses = { "Postgres" };
	Config.SystemAccountMarkers = { "daemon" };
	WProcessClassifier Classifier(Config);

	EXPECT_TRUE(Classifier.IsSystemProcess("postgres", std::string("dev")));
	EXPECT_TRUE(Classifier.IsSystemProcess("node", std::string("daemon")));
	EXPECT_FALSE(Classifier.IsSystemProcess("svchost.exe", std::string("dev")));
}

TEST(ProcessClassifierTest, AppTypeTagsRoundTrip)
{
	for (auto const& Name : WAppType::Names)
	{
		EXPECT_EQ(WAppType::FromTag(Name.Tag), Name.Type);
	}
	EXPECT_EQ(WAppType::ToLabel(EAppType::NextJs), "Next.js");
	EXPECT_FALSE(WAppType::FromTag("cobol").has_value());
}
