// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"

#include <cstddef>
#include <span>

/**
 * Parse the body of an SSH "mpint".  Throws std::invalid_argument if
 * the number is negative or too large.
 */
UniqueBIGNUM<true>
DeserializeBIGNUM(std::span<const std::byte> src);
