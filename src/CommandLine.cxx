// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include <iostream>

#include <stdlib.h>

namespace po = boost::program_options;

CommandLine
ParseCommandLine(int argc, char **argv)
{
	CommandLine cmdline;

	po::options_description desc{"Options"};
	desc.add_options()
		("help,h", "print this help")
		("config,c", po::value(&cmdline.config_path),
		 "configuration file path")
		("verbose,v", po::bool_switch(&cmdline.verbose),
		 "enable debug logging")
		("check", po::bool_switch(&cmdline.check),
		 "check the configuration and the signing key, then exit")
		;

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);

	if (vm.count("help")) {
		std::cout << "Usage: " << argv[0] << " [OPTIONS]\n\n"
			  << desc << std::endl;
		exit(EXIT_SUCCESS);
	}

	po::notify(vm);

	return cmdline;
}
