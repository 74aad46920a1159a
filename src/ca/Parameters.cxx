// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Parameters.hxx"

#include <sodium/randombytes.h>

uint_least64_t
GetUnixTime() noexcept
{
	const auto now = std::chrono::system_clock::now();
	return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

uint_least64_t
GenerateSerial() noexcept
{
	uint_least64_t serial;
	randombytes_buf(&serial, sizeof(serial));
	return serial;
}

CertificateParameters::CertificateParameters(std::chrono::seconds validity)
	:serial(GenerateSerial()),
	 valid_after(GetUnixTime()),
	 valid_before(valid_after + validity.count()),
	 extensions(PermitAllExtensions())
{
}
