/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "WorkerPool.hpp"

#include <algorithm>
#include <pthread.h>
#include <spdlog/spdlog.h>

WWorkerPool::WWorkerPool(std::size_t ThreadCount, std::string Name_) : Name(std::move(Name_))
{
	if (ThreadCount == 0)
	{
		ThreadCount = std::max(1u, std::thread::hardware_concurrency());
	}

	Workers.reserve(ThreadCount);
	for (std::size_t i = 0; i < ThreadCount; ++i)
	{
		Workers.emplace_back(&WWorkerPool::WorkerThreadFunction, this, i);
	}
	spdlog::debug("Started {} {} thread(s)", ThreadCount, Name);
}

WWorkerPool::~WWorkerPool()
{
	Stop();
}

void WWorkerPool::WorkerThreadFunction(std::size_t Index)
{
	// thread names are limited to 15 characters
	auto const ThreadName = (Name + "-" + std::to_string(Index)).substr(0, 15);
	pthread_setname_np(pthread_self(), ThreadName.c_str());

	while (true)
	{
		FJob Job;
		{
			std::unique_lock Lock(JobsMutex);
			JobsCondition.wait(Lock, [this] { return bStopping || !Jobs.empty(); });
			if (Jobs.empty())
			{
				return;
			}
			Job = std::move(Jobs.front());
			Jobs.pop();
		}

		try
		{
			Job();
		}
		catch (std::exception const& Error)
		{
			spdlog::error("Uncaught exception in {} job: {}", Name, Error.what());
		}
	}
}

bool WWorkerPool::Submit(FJob Job)
{
	{
		std::lock_guard Lock(JobsMutex);
		if (bStopping)
		{
			return false;
		}
		Jobs.push(std::move(Job));
	}
	JobsCondition.notify_one();
	return true;
}

void WWorkerPool::Stop()
{
	{
		std::lock_guard Lock(JobsMutex);
		bStopping = true;
	}
	JobsCondition.notify_all();

	for (auto& Worker : Workers)
	{
		if (Worker.joinable())
		{
			Worker.join();
		}
	}
	Workers.clear();
}
