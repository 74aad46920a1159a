// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"

#include <cstddef>
#include <span>

UniqueEVP_PKEY
DeserializeRSAPublic(std::span<const std::byte> e,
		     std::span<const std::byte> n);
