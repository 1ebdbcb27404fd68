//
// Created by usr on 25/11/2025.
//

#pragma once

#define WHARF_PROTOCOL_VERSION 1
#include <cstdint>
#include <string>

#include "PortEntry.hpp"
#include "Types.hpp"

struct WProtocolHandshake
{
	uint8_t     ProtocolVersion{ WHARF_PROTOCOL_VERSION };
	std::string CommitHash{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(ProtocolVersion, CommitHash);
	}
};

struct WSnapshotMessage
{
	WPortSnapshot Snapshot{};
	bool          bIsElevated{};
	WMsec         CollectedAtMs{};

	// Redundant with the snapshot, kept so clients can show totals without walking it
	uint32_t SystemCount{};
	uint32_t UserCount{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Snapshot, bIsElevated, CollectedAtMs, SystemCount, UserCount);
	}
};

struct WCollectFailure
{
	std::string Message{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Message);
	}
};
