//
// Created by usr on 26/10/2025.
//

#pragma once
#include <sys/types.h>
#include <cstddef>
#include <cstdint>
#include <chrono>

using WProcessId = pid_t;
using WPort = uint16_t;
using WInode = uint64_t;
using WMsec = int64_t;
using WDigest = std::size_t;
using WMilliseconds = std::chrono::milliseconds;
