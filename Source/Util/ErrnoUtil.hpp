/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cerrno>
#include <cstring>
#include <string>

class WErrnoUtil
{
public:
	static std::string StrError() { return StrError(errno); }

	static std::string StrError(int Error) { return std::string(strerror(Error)); }

	// The pid disappeared between listing and use
	static bool IsGone(int Error) { return Error == ENOENT || Error == ESRCH; }

	static bool IsDenied(int Error) { return Error == EACCES || Error == EPERM; }
};
