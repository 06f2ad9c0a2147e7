#pragma once

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
