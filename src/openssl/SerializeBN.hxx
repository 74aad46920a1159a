// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/bn.h>

namespace SSH { class Serializer; }

/**
 * Write the body of an SSH "mpint" (without the length prefix).
 */
void
Serialize(SSH::Serializer &s, const BIGNUM &bn);
