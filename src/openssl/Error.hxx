// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * An error reported by OpenSSL.  The constructor appends (and
 * clears) the OpenSSL error queue.
 */
class SslError : public std::runtime_error {
public:
	explicit SslError(const char *msg="OpenSSL error");
};
