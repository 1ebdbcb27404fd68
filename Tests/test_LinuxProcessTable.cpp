/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Os/LinuxProcessTable.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <csignal>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
	struct WScopedFd
	{
		int Fd{ -1 };

		explicit WScopedFd(int Fd_)
			: Fd(Fd_)
		{
		}
		~WScopedFd()
		{
			if (Fd >= 0)
				close(Fd);
		}
		WScopedFd(WScopedFd const&) = delete;
		WScopedFd& operator=(WScopedFd const&) = delete;
	};

	[[noreturn]] void SleepForever()
	{
		for (;;)
			pause();
	}
} // namespace

TEST(LinuxProcessTableTest, ParseStatHandlesParensInName)
{
	std::string Comm;
	WProcessId  ParentPid{};
	ASSERT_TRUE(WLinuxProcessTable::ParseStat("1234 (my (weird) proc) S 77 1234 1234 0 -1 4194560", Comm, ParentPid));
	EXPECT_EQ(Comm, "my (weird) proc");
	EXPECT_EQ(ParentPid, 77);

	EXPECT_FALSE(WLinuxProcessTable::ParseStat("garbage", Comm, ParentPid));
}

TEST(LinuxProcessTableTest, ParseRealUid)
{
	EXPECT_EQ(WLinuxProcessTable::ParseRealUid("Name:\tnode\nUmask:\t0022\nUid:\t1000\t1001\t1001\t1001\n"), 1000u);
	EXPECT_FALSE(WLinuxProcessTable::ParseRealUid("Name:\tnode\n").has_value());
}

TEST(LinuxProcessTableTest, WidenTruncatedName)
{
	EXPECT_EQ(WLinuxProcessTable::WidenTruncatedName("systemd-resolve", { "/lib/systemd/systemd-resolved" }, ""),
		"systemd-resolved");
	EXPECT_EQ(WLinuxProcessTable::WidenTruncatedName(
				  "chrome_crashpad", { "something-else" }, "/opt/google/chrome/chrome_crashpad_handler"),
		"chrome_crashpad_handler");
	EXPECT_EQ(WLinuxProcessTable::WidenTruncatedName("kworker/0:1-eve", {}, ""), "kworker/0:1-eve");
}

TEST(LinuxProcessTableTest, KillRefusesInvalidPids)
{
	WLinuxProcessTable Table{};
	EXPECT_EQ(Table.KillProcess(0, false).Result, EKillResult::NotFound);
	EXPECT_EQ(Table.KillProcess(-5, true).Result, EKillResult::NotFound);
	EXPECT_EQ(Table.KillProcess(1, false).Result, EKillResult::Failed);
}

TEST(LinuxProcessTableTest, ListsOwnLoopbackListener)
{
	WScopedFd Listener(socket(AF_INET, SOCK_STREAM, 0));
	ASSERT_GE(Listener.Fd, 0);

	sockaddr_in Addr{};
	Addr.sin_family = AF_INET;
	Addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	Addr.sin_port = 0;
	ASSERT_EQ(bind(Listener.Fd, reinterpret_cast<sockaddr*>(&Addr), sizeof(Addr)), 0);
	ASSERT_EQ(listen(Listener.Fd, 1), 0);

	socklen_t Len = sizeof(Addr);
	ASSERT_EQ(getsockname(Listener.Fd, reinterpret_cast<sockaddr*>(&Addr), &Len), 0);
	WPort const Port = ntohs(Addr.sin_port);

	WLinuxProcessTable         Table{};
	std::vector<WSocketRecord> Records;
	ASSERT_TRUE(Table.ListInetSockets(Records));

	auto It = std::ranges::find_if(Records, [&](WSocketRecord const& Record) {
		return Record.GetPort() == Port && Record.Pid == getpid();
	});
	ASSERT_NE(It, Records.end());
	EXPECT_EQ(It->Protocol, EProtocol::TCP);
	EXPECT_EQ(It->ConnectionState, EConnectionState::Listen);
	EXPECT_EQ(It->LocalEndpoint.ToString(), "127.0.0.1:" + std::to_string(Port));
	EXPECT_NE(It->Inode, 0u);
}

TEST(LinuxProcessTableTest, IdentityOfOwnProcess)
{
	WLinuxProcessTable Table{};
	auto               Lookup = Table.GetProcessIdentity(getpid());
	ASSERT_TRUE(Lookup.IsOk());
	EXPECT_EQ(Lookup.Identity.Pid, getpid());
	EXPECT_FALSE(Lookup.Identity.Name.empty());
	EXPECT_FALSE(Lookup.Identity.CommandLine.empty());
	EXPECT_TRUE(Lookup.Identity.UserName.has_value());
	EXPECT_EQ(Lookup.Identity.ParentPid, getppid());

	EXPECT_EQ(Table.GetProcessName(getpid()), Lookup.Identity.Name);
	EXPECT_EQ(Table.GetParent(getpid()), getppid());
}

TEST(LinuxProcessTableTest, ReapedProcessIsNotFound)
{
	pid_t Child = fork();
	ASSERT_GE(Child, 0);
	if (Child == 0)
	{
		_exit(0);
	}
	int Status{};
	ASSERT_EQ(waitpid(Child, &Status, 0), Child);

	WLinuxProcessTable Table{};
	EXPECT_EQ(Table.GetProcessIdentity(Child).Status, EProcessLookupStatus::NotFound);
	EXPECT_FALSE(Table.GetProcessName(Child).has_value());
	EXPECT_FALSE(Table.GetParent(Child).has_value());
	EXPECT_EQ(Table.KillProcess(Child, false).Result, EKillResult::NotFound);
}

TEST(LinuxProcessTableTest, KillTreeTakesDescendants)
{
	// Orphaned grandchildren come back to us so they can be reaped
	ASSERT_EQ(prctl(PR_SET_CHILD_SUBREAPER, 1), 0);

	int Pipe[2];
	ASSERT_EQ(pipe(Pipe), 0);

	pid_t Child = fork();
	ASSERT_GE(Child, 0);
	if (Child == 0)
	{
		close(Pipe[0]);
		pid_t Grandchild = fork();
		if (Grandchild == 0)
		{
			SleepForever();
		}
		if (write(Pipe[1], &Grandchild, sizeof(Grandchild)) != sizeof(Grandchild))
		{
			_exit(1);
		}
		SleepForever();
	}

	close(Pipe[1]);
	pid_t Grandchild{};
	ASSERT_EQ(read(Pipe[0], &Grandchild, sizeof(Grandchild)), static_cast<ssize_t>(sizeof(Grandchild)));
	close(Pipe[0]);
	ASSERT_GT(Grandchild, 0);

	WLinuxProcessTable Table{};
	EXPECT_EQ(Table.GetParent(Grandchild), Child);

	auto Outcome = Table.KillProcess(Child, true);
	EXPECT_TRUE(Outcome.IsSuccess()) << Outcome.Error;
	if (!Outcome.IsSuccess())
	{
		kill(Child, SIGKILL);
		kill(Grandchild, SIGKILL);
	}

	int Status{};
	ASSERT_EQ(waitpid(Child, &Status, 0), Child);
	EXPECT_TRUE(WIFSIGNALED(Status));
	EXPECT_EQ(WTERMSIG(Status), SIGKILL);

	ASSERT_EQ(waitpid(Grandchild, &Status, 0), Grandchild);
	EXPECT_TRUE(WIFSIGNALED(Status));
	EXPECT_EQ(WTERMSIG(Status), SIGKILL);

	EXPECT_EQ(prctl(PR_SET_CHILD_SUBREAPER, 0), 0);
}
