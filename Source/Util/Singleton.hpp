#pragma once

// Lazily constructed, process wide instance. Only used for state that really
// is process wide (configuration, signal flags), the port engine itself is
// owned by whoever runs a monitoring session.
template <typename T>
class TSingleton
{
public:
	static T& GetInstance()
	{
		static T Instance{};
		return Instance;
	}

	TSingleton(TSingleton const&) = delete;
	TSingleton& operator=(TSingleton const&) = delete;

protected:
	TSingleton() = default;
	virtual ~TSingleton() = default;
};
