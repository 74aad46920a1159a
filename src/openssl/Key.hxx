// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Unique.hxx"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * Generate a new EC key pair.
 *
 * @param group_name an OpenSSL group name such as "P-256"
 */
UniqueEVP_PKEY
GenerateEcKey(const char *group_name);

/**
 * Load a private key from a PEM file.  Throws SslError on error.
 */
UniqueEVP_PKEY
LoadPrivateKeyFile(const char *path);

/**
 * Decode a PEM "PUBLIC KEY" (SubjectPublicKeyInfo).
 */
UniqueEVP_PKEY
DecodePublicKeyPEM(std::string_view pem);

/**
 * Decode a DER SubjectPublicKeyInfo.
 */
UniqueEVP_PKEY
DecodePublicKeyDER(std::span<const std::byte> der);

std::string
EncodePublicKeyPEM(EVP_PKEY &key);

std::vector<std::byte>
EncodePublicKeyDER(EVP_PKEY &key);

std::string
EncodePrivateKeyPEM(EVP_PKEY &key);

/**
 * Returns the OpenSSL group name of an EC key, e.g. "P-256" or
 * "prime256v1".
 */
std::string
GetGroupName(const EVP_PKEY &key);
