//
// Created by usr on 14/11/2025.
//

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "IPAddress.hpp"
#include "Os/IProcessTable.hpp"

// Reads the kernel socket tables in /proc/net/{tcp,tcp6,udp,udp6}.
// Every line is one socket:
//   sl local_address rem_address st tx_queue:rx_queue tr:tm->when retrnsmt uid timeout inode ...
// addresses are hex in the kernel's (little endian) byte order, ports are hex in host order.
// Pids are not part of these files, the caller maps inodes to processes.
class WSocketTableParser
{
public:
	// False only if the file could not be opened, malformed lines are skipped
	static bool ParseFile(std::string const& FilePath, EProtocol::Type Protocol, std::vector<WSocketRecord>& OutRecords);

	static std::optional<WSocketRecord> ParseLine(std::string const& Line, EProtocol::Type Protocol);

	// parse hex address:port format, the family is derived from the address length
	static bool ParseAddressPort(std::string_view AddrPortStr, WIPAddress& OutAddr, WPort& OutPort);
};
