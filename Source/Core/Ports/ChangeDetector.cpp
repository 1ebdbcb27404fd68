//
// Created by usr on 15/01/2026.
//

#include "ChangeDetector.hpp"

#include <functional>

#include "Json.hpp"

std::string WChangeDetector::ToCanonicalJson(WPortSnapshot const& Snapshot)
{
	WJson::object Json{};
	Snapshot.ToJson(Json);
	// json11 objects are std::maps so keys are always dumped sorted
	return WJson(Json).dump();
}

WDigest WChangeDetector::Digest(WPortSnapshot const& Snapshot)
{
	return std::hash<std::string>{}(ToCanonicalJson(Snapshot));
}

bool WChangeDetector::HasChanged(WPortSnapshot const& Snapshot)
{
	WDigest const               Current = Digest(Snapshot);
	std::lock_guard<std::mutex> Lock(Mutex);
	if (LastDigest && *LastDigest == Current)
	{
		return false;
	}
	LastDigest = Current;
	return true;
}

void WChangeDetector::Reset()
{
	std::lock_guard<std::mutex> Lock(Mutex);
	LastDigest.reset();
}
