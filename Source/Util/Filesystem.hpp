//
// Created by usr on 09/10/2025.
//

#pragma once

#include "Types.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <filesystem>
#include <fcntl.h>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace stdfs = std::filesystem;

class WFilesystem
{
public:
	static bool Exists(stdfs::path const& p)
	{
		std::error_code Ec;
		return stdfs::exists(p, Ec);
	}

	// Reads a whole (proc) file. Returns 0 on success or the errno of the failed call,
	// /proc files report a size of 0 so this reads until EOF instead of trusting stat().
	static int ReadFile(std::string const& Path, std::string& OutContent)
	{
		OutContent.clear();
		int Fd = open(Path.c_str(), O_RDONLY | O_CLOEXEC);
		if (Fd < 0)
		{
			return errno;
		}

		char Chunk[4096];
		while (true)
		{
			ssize_t N = read(Fd, Chunk, sizeof(Chunk));
			if (N < 0)
			{
				if (errno == EINTR)
					continue;
				int Error = errno;
				close(Fd);
				return Error;
			}
			if (N == 0)
				break;
			OutContent.append(Chunk, static_cast<size_t>(N));
		}
		close(Fd);
		return 0;
	}

	static std::vector<std::string> SplitNulSeparated(std::string const& Buffer)
	{
		std::vector<std::string> Parts{};
		std::string              Current{};
		for (char C : Buffer)
		{
			if (C == '\0')
			{
				Parts.emplace_back(std::move(Current));
				Current.clear();
			}
			else
			{
				Current.push_back(C);
			}
		}
		// Some proc files may not end with a NUL
		if (!Current.empty())
		{
			Parts.emplace_back(std::move(Current));
		}
		return Parts;
	}

	// Readlink helper that returns the symlink target as string; returns empty on failure.
	static std::string ReadLink(std::string const& Path)
	{
		std::vector<char> Buf(256);
		while (true)
		{
			ssize_t N = ::readlink(Path.c_str(), Buf.data(), Buf.size());
			if (N < 0)
			{
				return {};
			}
			if (static_cast<size_t>(N) < Buf.size())
			{
				return { Buf.data(), static_cast<size_t>(N) };
			}
			Buf.resize(Buf.size() * 2);
		}
	}

	static std::string StripDeletedSuffix(std::string S)
	{
		constexpr std::string_view Suffix = " (deleted)";
		if (S.ends_with(Suffix))
		{
			S.erase(S.size() - Suffix.size());
		}
		return S;
	}

	static std::string BaseName(std::string_view Path)
	{
		auto Slash = Path.rfind('/');
		if (Slash == std::string_view::npos)
		{
			return std::string(Path);
		}
		return std::string(Path.substr(Slash + 1));
	}

	static std::string GetProcessExePath(WProcessId PID)
	{
		if (PID <= 0)
			return {};
		std::string Target = ReadLink("/proc/" + std::to_string(PID) + "/exe");
		if (Target.empty())
			return {};
		return StripDeletedSuffix(Target);
	}

	// All numeric entries of /proc, i.e. the pids alive right now
	static std::vector<WProcessId> ListProcessIds()
	{
		std::vector<WProcessId> Pids{};
		std::error_code         Ec;
		for (auto It = stdfs::directory_iterator("/proc", Ec); !Ec && It != stdfs::directory_iterator();
			 It.increment(Ec))
		{
			std::string const Name = It->path().filename().string();
			WProcessId        Pid{};
			auto [Ptr, Err] = std::from_chars(Name.data(), Name.data() + Name.size(), Pid);
			if (Err == std::errc{} && Ptr == Name.data() + Name.size() && Pid > 0)
			{
				Pids.push_back(Pid);
			}
		}
		std::ranges::sort(Pids);
		return Pids;
	}
};
