// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Config.hxx"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include <fmt/core.h>
#include <spdlog/common.h>

#include <fstream>
#include <stdexcept>

namespace po = boost::program_options;

void
Config::Check()
{
	if (listeners.empty())
		listeners.emplace_back(fmt::format("[::]:{}", LEIMA_DEFAULT_PORT));

	if (key_file.empty())
		throw std::runtime_error{"No signing key_file configured"};

	if (default_validity.count() <= 0)
		throw std::runtime_error{"default_validity must be positive"};

	if (max_validity.count() < 0)
		throw std::runtime_error{"max_validity must not be negative"};

	if (max_validity.count() > 0 && default_validity > max_validity)
		throw std::runtime_error{"default_validity exceeds max_validity"};

	if (spdlog::level::from_str(log_level) == spdlog::level::off &&
	    log_level != "off")
		throw std::runtime_error{fmt::format("Unknown log level '{}'", log_level)};
}

static po::options_description
MakeOptionsDescription(Config &config)
{
	po::options_description desc;
	desc.add_options()
		("server.listen", po::value(&config.listeners)->composing())
		("server.max_threads", po::value(&config.max_threads))
		("signing.key_file", po::value(&config.key_file))
		("signing.default_validity", po::value<long>()
		 ->notifier([&config](long value){ config.default_validity = std::chrono::seconds{value}; }))
		("signing.max_validity", po::value<long>()
		 ->notifier([&config](long value){ config.max_validity = std::chrono::seconds{value}; }))
		("log.level", po::value(&config.log_level))
		;
	return desc;
}

void
LoadConfig(Config &config, std::istream &is)
{
	const auto desc = MakeOptionsDescription(config);

	po::variables_map vm;
	po::store(po::parse_config_file(is, desc), vm);
	po::notify(vm);
}

void
LoadConfigFile(Config &config, const char *path)
{
	std::ifstream is{path};
	if (!is)
		throw std::runtime_error{fmt::format("Failed to open {}", path)};

	try {
		LoadConfig(config, is);
	} catch (const po::error &e) {
		throw std::runtime_error{fmt::format("{}: {}", path, e.what())};
	}
}
