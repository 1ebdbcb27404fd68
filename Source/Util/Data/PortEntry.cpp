//
// Created by usr on 14/01/2026.
//

#include "PortEntry.hpp"

template <typename T>
static WJson OptionalToJson(std::optional<T> const& Value)
{
	if (Value.has_value())
	{
		return WJson(*Value);
	}
	return WJson(nullptr);
}

void WProcessPortEntry::ToJson(WJson::object& Json) const
{
	Json[JSON_KEY_PORT] = static_cast<int>(Port);
	Json[JSON_KEY_PID] = static_cast<int>(Pid);
	Json[JSON_KEY_NAME] = Name;
	Json[JSON_KEY_USERNAME] = UserName.value_or("Unknown");
	Json[JSON_KEY_ADDRESS] = Address;
	Json[JSON_KEY_PROTOCOL] = EProtocol::ToString(Protocol);
	Json[JSON_KEY_CONN_STATUS] = EConnectionState::ToString(ConnectionState);
	Json[JSON_KEY_APP_TYPE] = std::string(WAppType::ToTag(AppType));
	Json[JSON_KEY_IS_SYSTEM] = bIsSystem;
	Json[JSON_KEY_PARENT_PID] = OptionalToJson(ParentPid);
	Json[JSON_KEY_ROOT_PID] = OptionalToJson(RootControllerPid);
	Json[JSON_KEY_ROOT_NAME] = OptionalToJson(RootControllerName);
	Json[JSON_KEY_HAS_CONTROLLER] = bHasParentController;
}

static WJson::array EntriesToJson(std::vector<WProcessPortEntry> const& Entries)
{
	WJson::array Array;
	Array.reserve(Entries.size());
	for (auto const& Entry : Entries)
	{
		WJson::object EntryJson;
		Entry.ToJson(EntryJson);
		Array.emplace_back(EntryJson);
	}
	return Array;
}

void WPortSnapshot::ToJson(WJson::object& Json) const
{
	Json[JSON_KEY_SYSTEM] = EntriesToJson(SystemEntries);
	Json[JSON_KEY_USER] = EntriesToJson(UserEntries);
}
