// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>

static constexpr unsigned LEIMA_DEFAULT_PORT = 50051;

struct Config {
	/**
	 * gRPC listener addresses, e.g. "[::]:50051".
	 */
	std::vector<std::string> listeners;

	/**
	 * The maximum number of gRPC worker threads; zero means the
	 * gRPC default.
	 */
	unsigned max_threads = 0;

	/**
	 * The PEM file containing the CA private key.
	 */
	std::string key_file;

	std::chrono::seconds default_validity = std::chrono::hours{1};

	/**
	 * Zero means unlimited.
	 */
	std::chrono::seconds max_validity{};

	std::string log_level = "info";

	/**
	 * Fill in defaults and check for inconsistencies.  Throws
	 * std::runtime_error on error.
	 */
	void Check();
};

/**
 * Parse configuration from a stream in INI format.  Throws an
 * exception on error.
 */
void
LoadConfig(Config &config, std::istream &is);

/**
 * Load and parse the specified configuration file.  Throws an
 * exception on error.
 */
void
LoadConfigFile(Config &config, const char *path);
