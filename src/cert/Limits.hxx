// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>

/**
 * The same limit OpenSSH applies to certificates it reads.
 */
static constexpr std::size_t MAX_CERTIFICATE_SIZE = 32768;

static constexpr std::size_t NONCE_SIZE = 32;

static constexpr std::size_t MAX_PRINCIPALS = 256;
static constexpr std::size_t MAX_PRINCIPAL_LENGTH = 255;
static constexpr std::size_t MAX_KEY_ID_LENGTH = 1024;
static constexpr std::size_t MAX_OPTION_NAME_LENGTH = 255;
static constexpr std::size_t MAX_OPTION_VALUE_LENGTH = 4096;
