// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <initializer_list>
#include <span>

enum class DigestAlgorithm {
	SHA256,
	SHA384,
	SHA512,
};

static constexpr std::size_t DIGEST_MAX_SIZE = 64;

[[gnu::const]]
std::size_t
DigestSize(DigestAlgorithm a) noexcept;

/**
 * Calculate the digest of the given data.  Throws SslError on
 * error.
 *
 * @param dest a buffer of at least DigestSize() bytes
 * @return the number of bytes written to #dest
 */
std::size_t
Digest(DigestAlgorithm a, std::span<const std::byte> src,
       std::byte *dest);

std::size_t
Digest(DigestAlgorithm a,
       std::initializer_list<std::span<const std::byte>> src,
       std::byte *dest);
