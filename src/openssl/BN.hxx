// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"
#include "Error.hxx"

#include <cstddef>
#include <span>

template<bool clear>
inline UniqueBIGNUM<clear>
NewUniqueBIGNUM()
{
	auto *bn = BN_new();
	if (bn == nullptr)
		throw SslError{};

	return UniqueBIGNUM<clear>{bn};
}

template<bool clear>
inline UniqueBIGNUM<clear>
BN_bin2bn(std::span<const std::byte> src)
{
	auto bn = NewUniqueBIGNUM<clear>();
	if (BN_bin2bn(reinterpret_cast<const unsigned char *>(src.data()),
		      src.size(), bn.get()) == nullptr)
		throw SslError{};
	return bn;
}
