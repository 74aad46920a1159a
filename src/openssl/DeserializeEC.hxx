// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"

#include <cstddef>
#include <span>
#include <string_view>

/**
 * Construct an EC public key from the encoded point "Q".
 *
 * @param curve_name the OpenSSL group name, e.g. "P-256"
 */
UniqueEVP_PKEY
DeserializeECPublic(std::string_view curve_name, std::span<const std::byte> q);
