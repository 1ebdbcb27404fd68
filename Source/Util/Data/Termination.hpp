//
// Created by usr on 14/01/2026.
//

#pragma once
#include <string>

#include "Types.hpp"

enum class ETerminateMode : uint8_t
{
	Single,
	Tree // kill the root controller and everything below it
};

enum class ETerminationStatus : uint8_t
{
	Success,
	NotFound,
	AccessDenied,
	OtherFailure
};

struct WTerminateRequest
{
	WProcessId     Pid{};
	ETerminateMode Mode{ ETerminateMode::Single };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Pid, Mode);
	}
};

struct WTerminationOutcome
{
	ETerminationStatus Status{ ETerminationStatus::OtherFailure };
	WProcessId         Pid{};     // the pid the request was made for
	WProcessId         TargetPid{}; // the pid that was actually signalled
	std::string        Message{};

	[[nodiscard]] bool IsSuccess() const { return Status == ETerminationStatus::Success; }

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(Status, Pid, TargetPid, Message);
	}
};
