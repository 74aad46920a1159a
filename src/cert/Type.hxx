// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <string_view>

/**
 * @see https://cvsweb.openbsd.org/src/usr.bin/ssh/PROTOCOL.certkeys
 */
enum class CertificateType : uint_least32_t {
	USER = 1,
	HOST = 2,
};

[[gnu::const]]
constexpr std::string_view
ToString(CertificateType type) noexcept
{
	switch (type) {
	case CertificateType::USER:
		return "user";

	case CertificateType::HOST:
		return "host";
	}

	return "unknown";
}
