// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "ca/SigningKey.hxx"

#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server.h>
#include <grpcpp/resource_quota.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

Instance::Instance(std::shared_ptr<const SigningKey> _signing_key,
		   const SigningPolicy &policy,
		   unsigned max_threads)
	:signing_key(std::move(_signing_key)),
	 handler(signing_key, policy)
{
	builder.RegisterService(&service);

	if (max_threads > 0) {
		grpc::ResourceQuota quota{"leima"};
		quota.SetMaxThreads(static_cast<int>(max_threads));
		builder.SetResourceQuota(quota);
	}
}

Instance::~Instance() noexcept
{
	Shutdown();
}

void
Instance::AddListener(const std::string &address)
{
	if (server)
		throw std::logic_error{"Server already started"};

	int &port = selected_ports.emplace_front(0);
	builder.AddListeningPort(address, grpc::InsecureServerCredentials(),
				 &port);
}

void
Instance::Start()
{
	server = builder.BuildAndStart();
	if (!server)
		throw std::runtime_error{"Failed to start the gRPC server"};

	for (const int port : selected_ports)
		if (port == 0)
			throw std::runtime_error{"Failed to bind a gRPC listener"};

	spdlog::info("Listening on port {}", GetLastPort());
}

void
Instance::Run() noexcept
{
	if (server)
		server->Wait();
}

void
Instance::Shutdown() noexcept
{
	if (server)
		server->Shutdown(std::chrono::system_clock::now() +
				 std::chrono::seconds{5});
}
