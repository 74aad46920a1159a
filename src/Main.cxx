// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Instance.hxx"
#include "CommandLine.hxx"
#include "Config.hxx"
#include "backend/LocalKeyBackend.hxx"
#include "ca/SigningKey.hxx"
#include "config.h"

#ifdef HAVE_LIBSYSTEMD
#include <systemd/sd-daemon.h>
#endif

#include <sodium/core.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <stdexcept>
#include <system_error>
#include <thread>

#include <signal.h>
#include <stdlib.h>

static void
SetupLogger(const Config &config, const CommandLine &cmdline)
{
	auto logger = spdlog::stderr_logger_mt("leima");
	spdlog::set_default_logger(std::move(logger));

	/* systemd-journald adds its own time stamps */
	spdlog::set_pattern("[%l] %v");

	spdlog::set_level(cmdline.verbose
			  ? spdlog::level::debug
			  : spdlog::level::from_str(config.log_level));
}

/**
 * Block the signals we handle in the signal thread; must be called
 * before any other thread is created so they inherit the mask.
 */
static sigset_t
BlockShutdownSignals()
{
	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);

	if (int e = pthread_sigmask(SIG_BLOCK, &signals, nullptr); e != 0)
		throw std::system_error(e, std::system_category(),
					"pthread_sigmask() failed");

	return signals;
}

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);

	Config config;
	LoadConfigFile(config, cmdline.config_path.c_str());
	config.Check();

	SetupLogger(config, cmdline);

	if (sodium_init() < 0)
		throw std::runtime_error{"sodium_init() failed"};

	auto signing_key = std::make_shared<const SigningKey>(LocalKeyBackend::LoadFile(config.key_file.c_str()));

	spdlog::info("CA key {}", signing_key->GetFingerprint());
	spdlog::debug("{}", signing_key->FormatPublicKeyLine());

	if (cmdline.check)
		return EXIT_SUCCESS;

	const sigset_t signals = BlockShutdownSignals();

	Instance instance{
		signing_key,
		SigningPolicy{config.default_validity, config.max_validity},
		config.max_threads,
	};

	for (const auto &i : config.listeners)
		instance.AddListener(i);

	instance.Start();

	std::thread signal_thread{[&instance, &signals](){
		int sig;
		if (sigwait(&signals, &sig) == 0)
			spdlog::info("Caught signal {}, shutting down", sig);
		instance.Shutdown();
	}};

#ifdef HAVE_LIBSYSTEMD
	/* tell systemd we're ready */
	sd_notify(0, "READY=1");
#endif

	/* main loop */
	instance.Run();

	signal_thread.join();

	return EXIT_SUCCESS;
} catch (const std::exception &e) {
	spdlog::critical("{}", e.what());
	return EXIT_FAILURE;
}
