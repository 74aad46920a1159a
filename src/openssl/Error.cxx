// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Error.hxx"

#include <openssl/err.h>

#include <string>

static std::string
FormatSslError(const char *msg)
{
	std::string result{msg};

	const unsigned long error = ERR_get_error();
	if (error != 0) {
		char buffer[256];
		ERR_error_string_n(error, buffer, sizeof(buffer));
		result += ": ";
		result += buffer;
	}

	ERR_clear_error();
	return result;
}

SslError::SslError(const char *msg)
	:std::runtime_error(FormatSslError(msg)) {}
