/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Communication/DaemonClient.hpp"
#include "Data/Protocol.hpp"

#include <gtest/gtest.h>

namespace
{
	class WFakeClientSocket : public IClientSocket
	{
	public:
		sigslot::signal<WBuffer&> OnData;
		sigslot::signal<>         OnClosed;
		std::vector<std::string>  Sent{};
		bool                      bConnected{ true };

		sigslot::signal<WBuffer&>& GetDataSignal() override { return OnData; }
		sigslot::signal<>&         GetClosedSignal() override { return OnClosed; }

		bool IsConnected() const override { return bConnected; }
		void Close() override { bConnected = false; }

		ssize_t SendFramed(std::string const& Data) override
		{
			if (!bConnected)
			{
				return -1;
			}
			Sent.push_back(Data);
			return static_cast<ssize_t>(Data.size() + sizeof(uint32_t));
		}

		void Receive(std::string const& Frame)
		{
			WBuffer Buffer(Frame.size());
			Buffer.Write(Frame.data(), Frame.size());
			OnData(Buffer);
		}
	};

	template <class T>
	T Decode(std::string const& Message, EMessageType ExpectedType)
	{
		EXPECT_FALSE(Message.empty());
		EXPECT_EQ(static_cast<EMessageType>(Message.front()), ExpectedType);

		T                 Value{};
		std::stringstream Ss{ Message.substr(1) };
		cereal::BinaryInputArchive Archive(Ss);
		Archive(Value);
		return Value;
	}
} // namespace

TEST(DaemonClientTest, RefreshRequestIsForwarded)
{
	auto          Socket = std::make_shared<WFakeClientSocket>();
	WDaemonClient Client(Socket);

	int Refreshes{};
	Client.OnRefreshRequest.connect([&](WDaemonClient& Sender) {
		EXPECT_EQ(&Sender, &Client);
		++Refreshes;
	});

	Socket->Receive(std::string(1, static_cast<char>(MT_RefreshRequest)));
	EXPECT_EQ(Refreshes, 1);
}

TEST(DaemonClientTest, TerminateRequestIsDecoded)
{
	auto          Socket = std::make_shared<WFakeClientSocket>();
	WDaemonClient Client(Socket);

	WTerminateRequest Received{};
	int               Requests{};
	Client.OnTerminateRequest.connect([&](WDaemonClient&, WTerminateRequest const& Request) {
		Received = Request;
		++Requests;
	});

	Socket->Receive(WDaemonClient::EncodeMessage(MT_TerminateRequest, WTerminateRequest{ 4242, ETerminateMode::Tree }));
	ASSERT_EQ(Requests, 1);
	EXPECT_EQ(Received.Pid, 4242);
	EXPECT_EQ(Received.Mode, ETerminateMode::Tree);
}

TEST(DaemonClientTest, TruncatedOrUnknownFramesAreIgnored)
{
	auto          Socket = std::make_shared<WFakeClientSocket>();
	WDaemonClient Client(Socket);

	int Requests{};
	Client.OnTerminateRequest.connect([&](WDaemonClient&, WTerminateRequest const&) { ++Requests; });
	Client.OnRefreshRequest.connect([&](WDaemonClient&) { ++Requests; });

	Socket->Receive(std::string(1, static_cast<char>(MT_TerminateRequest)) + "\x01");
	Socket->Receive(std::string(1, static_cast<char>(42)));
	Socket->Receive(std::string{});
	Socket->Receive(std::string(1, static_cast<char>(MT_Snapshot)));
	EXPECT_EQ(Requests, 0);
}

TEST(DaemonClientTest, SendMessageFramesTypeAndPayload)
{
	auto          Socket = std::make_shared<WFakeClientSocket>();
	WDaemonClient Client(Socket);

	WSnapshotMessage Message{};
	WProcessPortEntry Entry{};
	Entry.Port = 3000;
	Entry.Pid = 1200;
	Entry.Name = "node.exe";
	Entry.AppType = EAppType::NextJs;
	Entry.RootControllerName = "node.exe";
	Message.Snapshot.UserEntries.push_back(Entry);
	Message.UserCount = 1;

	Client.SendMessage(MT_Snapshot, Message);
	ASSERT_EQ(Socket->Sent.size(), 1u);

	auto Decoded = Decode<WSnapshotMessage>(Socket->Sent.front(), MT_Snapshot);
	ASSERT_EQ(Decoded.Snapshot.UserEntries.size(), 1u);
	EXPECT_EQ(Decoded.Snapshot.UserEntries.front().AppType, EAppType::NextJs);
	EXPECT_EQ(Decoded.Snapshot.UserEntries.front().RootControllerName, "node.exe");
	EXPECT_EQ(Decoded.UserCount, 1u);
}

TEST(DaemonClientTest, SendToClosedSocketFails)
{
	auto          Socket = std::make_shared<WFakeClientSocket>();
	WDaemonClient Client(Socket);
	Socket->Close();

	EXPECT_FALSE(Client.IsRunning());
	EXPECT_LT(Client.SendFramedData("x"), 0);
}
