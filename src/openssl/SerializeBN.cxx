// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "SerializeBN.hxx"
#include "Error.hxx"
#include "ssh/Serializer.hxx"

#include <stdexcept>

static constexpr std::size_t MAX_BIGNUM = 16384 / 8;

void
Serialize(SSH::Serializer &s, const BIGNUM &bn)
{
	if (BN_is_negative(&bn))
		throw std::invalid_argument{"Negative BIGNUM"};

	const int length = BN_num_bytes(&bn);
	if (length < 0 || std::size_t(length) > MAX_BIGNUM)
		throw std::invalid_argument{"Invalid BN size"};

	auto dest = s.BeginWriteN(length);
	if (BN_bn2bin(&bn, reinterpret_cast<unsigned char *>(dest.data())) != length)
		throw SslError{};

	s.CommitBignum2(length);
}
