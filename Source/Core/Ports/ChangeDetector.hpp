//
// Created by usr on 15/01/2026.
//

#pragma once
#include <mutex>
#include <optional>
#include <string>

#include "Types.hpp"
#include "Data/PortEntry.hpp"

// Remembers the digest of the last reported snapshot
class WChangeDetector
{
	std::mutex             Mutex{};
	std::optional<WDigest> LastDigest{};

public:
	// True if the snapshot differs from the last one seen (or nothing was seen yet),
	// the stored digest is replaced in that case
	bool HasChanged(WPortSnapshot const& Snapshot);

	// The next HasChanged() call reports a change
	void Reset();

	static std::string ToCanonicalJson(WPortSnapshot const& Snapshot);
	static WDigest     Digest(WPortSnapshot const& Snapshot);
};
