/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// Fixed set of threads working off a FIFO job queue
class WWorkerPool
{
	using FJob = std::function<void()>;

	std::vector<std::thread> Workers;
	std::queue<FJob>         Jobs;
	std::mutex               JobsMutex;
	std::condition_variable  JobsCondition;
	bool                     bStopping{ false };

	std::string Name;

	void WorkerThreadFunction(std::size_t Index);

public:
	// ThreadCount 0 picks the hardware concurrency
	explicit WWorkerPool(std::size_t ThreadCount, std::string Name_ = "worker");
	~WWorkerPool();

	WWorkerPool(WWorkerPool const&) = delete;
	WWorkerPool& operator=(WWorkerPool const&) = delete;

	// Returns false if the pool is shutting down and the job was dropped
	bool Submit(FJob Job);

	// Runs the jobs still queued, then joins all threads
	void Stop();

	[[nodiscard]] std::size_t GetThreadCount() const { return Workers.size(); }
};
