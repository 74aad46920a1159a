// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>

struct CommandLine {
	std::string config_path = "/etc/leima/leima.conf";

	bool verbose = false;

	/**
	 * Only check the configuration and the signing key, then
	 * exit.
	 */
	bool check = false;
};

/**
 * Parse the command line.  Prints usage and exits if "--help" was
 * given.  Throws on error.
 */
CommandLine
ParseCommandLine(int argc, char **argv);
