// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "cert/Type.hxx"
#include "cert/Options.hxx"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

/**
 * The identity claims and restrictions of a certificate to be
 * issued.
 */
struct CertificateParameters {
	CertificateType type = CertificateType::USER;

	std::string key_id;

	uint_least64_t serial;

	std::vector<std::string> principals;

	uint_least64_t valid_after, valid_before;

	OptionMap critical_options;

	OptionMap extensions;

	/**
	 * Initialize with defaults: a random serial, valid from now
	 * for the given duration, all extensions permitted.
	 */
	explicit CertificateParameters(std::chrono::seconds validity=std::chrono::hours{1});
};

/**
 * The current time in seconds since the epoch.
 */
uint_least64_t
GetUnixTime() noexcept;

/**
 * Generate a random serial number.
 */
uint_least64_t
GenerateSerial() noexcept;
