// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <openssl/evp.h>

namespace SSH { class Serializer; }

/**
 * Write the encoded public key (for EC keys: the uncompressed point
 * "Q") without a length prefix.
 */
void
SerializePublicKey(SSH::Serializer &s, const EVP_PKEY &key);
