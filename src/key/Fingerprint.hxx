// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string>

/**
 * Calculate the OpenSSH fingerprint of a public key blob, e.g.
 * "SHA256:Y8Q3...".
 */
std::string
GetFingerprint(std::span<const std::byte> public_key_blob);
