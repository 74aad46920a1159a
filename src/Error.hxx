// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

/**
 * A certificate could not be serialized because a field is missing
 * or exceeds a protocol limit.
 */
class EncodingError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * A certificate byte stream is truncated, has trailing garbage or
 * contains an unknown tag.
 */
class DecodingError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The signing backend returned something that is not a DER encoded
 * ECDSA signature.
 */
class MalformedSignatureError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The cloud signing API could not be reached (network, throttling,
 * authentication).  May succeed if tried again later.
 */
class BackendUnavailableError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * The signing key referenced by the backend configuration does not
 * exist or is disabled.
 */
class KeyNotFoundError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * A signing request violates a protocol limit or the signing policy.
 */
class ValidationError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};
