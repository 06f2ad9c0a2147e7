//
// Created by usr on 17/11/2025.
//

#include "Resolver.hpp"

#include <algorithm>
#include <netdb.h>
#include <spdlog/spdlog.h>

#include "Geo/GeoError.hpp"

std::vector<WIPAddress> WSystemHostLookup::Lookup(std::string const& Hostname, EIPFamily::Type Family)
{
	addrinfo Hints{};
	Hints.ai_family = Family == EIPFamily::IPv4 ? AF_INET : AF_INET6;
	// one entry per address instead of one per socket type
	Hints.ai_socktype = SOCK_STREAM;

	addrinfo* Info = nullptr;
	int const Result = getaddrinfo(Hostname.c_str(), nullptr, &Hints, &Info);
	if (Result != 0)
	{
		// getaddrinfo returns GAI error codes, not errno
		if (Result == EAI_NONAME || Result == EAI_NODATA)
		{
			spdlog::debug("No {} records for {}", Family == EIPFamily::IPv4 ? "A" : "AAAA", Hostname);
		}
		else
		{
			spdlog::warn("Resolver failed for {}: {} ({})", Hostname, gai_strerror(Result), Result);
		}
		return {};
	}

	std::vector<WIPAddress> Addresses;
	for (auto const* It = Info; It; It = It->ai_next)
	{
		if (auto Address = WIPAddress::FromSockAddr(It->ai_addr))
		{
			Addresses.push_back(*Address);
		}
	}
	freeaddrinfo(Info);
	return Addresses;
}

WResolver::WResolver(std::shared_ptr<IHostLookup> Backend_, std::chrono::milliseconds Timeout_, std::size_t LookupThreads)
	: Backend(std::move(Backend_))
	, Timeout(Timeout_)
	, LookupPool(std::make_shared<WWorkerPool>(LookupThreads, "resolver"))
{
}

WResolver::FLookupFuture WResolver::StartLookup(
	std::string const& Hostname, EIPFamily::Type Family, std::chrono::steady_clock::time_point Deadline) const
{
	auto Task = std::make_shared<std::packaged_task<std::vector<WIPAddress>()>>(
		[LookupBackend = Backend, Hostname, Family, Deadline]() -> std::vector<WIPAddress> {
			// Nobody is waiting for the answer anymore
			if (std::chrono::steady_clock::now() >= Deadline)
			{
				return {};
			}
			return LookupBackend->Lookup(Hostname, Family);
		});
	auto Future = Task->get_future();

	// A dropped job destroys the task, the future then reports a broken promise
	if (!LookupPool->Submit([Task] { (*Task)(); }))
	{
		spdlog::debug("Resolver is stopping, not querying {}", Hostname);
	}
	return Future;
}

void WResolver::Stop()
{
	LookupPool->Stop();
}

std::vector<WIPAddress> WResolver::Collect(FLookupFuture& Future, std::chrono::steady_clock::time_point Deadline,
	std::string const& Hostname, char const* Query)
{
	if (Future.wait_until(Deadline) != std::future_status::ready)
	{
		spdlog::warn("{} query for {} timed out", Query, Hostname);
		return {};
	}

	try
	{
		return Future.get();
	}
	catch (std::exception const& Error)
	{
		spdlog::warn("{} query for {} failed: {}", Query, Hostname, Error.what());
		return {};
	}
}

std::vector<WIPAddress> WResolver::Resolve(std::string const& Hostname) const
{
	auto const Deadline = std::chrono::steady_clock::now() + Timeout;

	auto V4Future = StartLookup(Hostname, EIPFamily::IPv4, Deadline);
	auto V6Future = StartLookup(Hostname, EIPFamily::IPv6, Deadline);

	auto Addresses = Collect(V4Future, Deadline, Hostname, "A");
	auto V6Addresses = Collect(V6Future, Deadline, Hostname, "AAAA");
	Addresses.insert(Addresses.end(), V6Addresses.begin(), V6Addresses.end());

	// Keep the first occurrence of every address
	std::vector<WIPAddress> Unique;
	Unique.reserve(Addresses.size());
	for (auto const& Address : Addresses)
	{
		auto const Normalized = Address.Unmapped();
		if (std::ranges::find(Unique, Normalized) == Unique.end())
		{
			Unique.push_back(Normalized);
		}
	}

	if (Unique.empty())
	{
		throw WGeoError(EGeoError::NoSuchHost, "cannot resolve host '" + Hostname + "'");
	}

	spdlog::debug("Resolved {} to {} address(es)", Hostname, Unique.size());
	return Unique;
}
