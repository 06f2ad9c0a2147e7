/*
 * Copyright (c) 2025, Alex <uni@vrsal.xyz>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "IPAddress.hpp"
#include "WorkerPool.hpp"

class IHostLookup
{
public:
	virtual ~IHostLookup() = default;

	// Addresses of one family in resolver order, empty if the name has none. May block for a long time.
	virtual std::vector<WIPAddress> Lookup(std::string const& Hostname, EIPFamily::Type Family) = 0;
};

// getaddrinfo(3) restricted to one address family
class WSystemHostLookup final : public IHostLookup
{
public:
	std::vector<WIPAddress> Lookup(std::string const& Hostname, EIPFamily::Type Family) override;
};

// Forward resolution with A and AAAA queries in flight at the same time
class WResolver
{
	std::shared_ptr<IHostLookup> Backend;
	std::chrono::milliseconds    Timeout;

	// getaddrinfo can't be cancelled, a timed out query keeps its lookup thread busy until it returns
	std::shared_ptr<WWorkerPool> LookupPool;

	using FLookupFuture = std::future<std::vector<WIPAddress>>;

	[[nodiscard]] FLookupFuture StartLookup(std::string const& Hostname, EIPFamily::Type Family,
		std::chrono::steady_clock::time_point Deadline) const;

	// Empty on failure or timeout
	[[nodiscard]] static std::vector<WIPAddress> Collect(FLookupFuture& Future,
		std::chrono::steady_clock::time_point Deadline, std::string const& Hostname, char const* Query);

public:
	explicit WResolver(std::shared_ptr<IHostLookup> Backend_ = std::make_shared<WSystemHostLookup>(),
		std::chrono::milliseconds Timeout_ = std::chrono::milliseconds(3000), std::size_t LookupThreads = 4);

	// IPv4 results first, then IPv6, duplicates removed. Throws WGeoError(NoSuchHost) if both queries
	// came back empty.
	[[nodiscard]] std::vector<WIPAddress> Resolve(std::string const& Hostname) const;

	// Waits for running lookups, queued ones past their deadline are skipped. Resolve fails afterwards.
	void Stop();

	[[nodiscard]] std::chrono::milliseconds GetTimeout() const { return Timeout; }
};
