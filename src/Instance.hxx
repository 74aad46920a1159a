// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "service/Handler.hxx"
#include "service/GrpcService.hxx"

#include <grpcpp/server_builder.h>

#include <forward_list>
#include <memory>
#include <string>

class SigningKey;

class Instance final {
	const std::shared_ptr<const SigningKey> signing_key;

	const SigningHandler handler;

	GrpcSigningService service{handler};

	grpc::ServerBuilder builder;

	/**
	 * The ports selected by gRPC for each listener, in reverse
	 * order of AddListener() calls.  Valid after Start().
	 */
	std::forward_list<int> selected_ports;

	std::unique_ptr<grpc::Server> server;

public:
	/**
	 * @param max_threads the maximum number of gRPC worker
	 * threads; zero means the gRPC default
	 */
	Instance(std::shared_ptr<const SigningKey> _signing_key,
		 const SigningPolicy &policy,
		 unsigned max_threads=0);

	~Instance() noexcept;

	Instance(const Instance &) = delete;
	Instance &operator=(const Instance &) = delete;

	const SigningKey &GetSigningKey() const noexcept {
		return *signing_key;
	}

	/**
	 * Register a listener address.  Must be called before
	 * Start().
	 */
	void AddListener(const std::string &address);

	/**
	 * Start the gRPC server.  Throws on error.
	 */
	void Start();

	/**
	 * Returns the port of the most recently added listener (the
	 * one selected by the kernel if the address specified port
	 * 0).
	 */
	[[gnu::pure]]
	int GetLastPort() const noexcept {
		return selected_ports.empty() ? 0 : selected_ports.front();
	}

	/**
	 * Block until Shutdown() is called.
	 */
	void Run() noexcept;

	/**
	 * Stop accepting requests and let pending requests finish.
	 * May be called from any thread.
	 */
	void Shutdown() noexcept;
};
