// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "Request.hxx"

namespace leima::v1 {
class SignCertificateRequest;
class SignCertificateResponse;
}

/**
 * Convert a protobuf request.  Throws ValidationError if an enum
 * value is out of range.
 */
SigningRequest
FromProto(const leima::v1::SignCertificateRequest &src);

void
ToProto(leima::v1::SignCertificateRequest &dest, const SigningRequest &src);

/**
 * Convert a protobuf response.  A response which carries neither a
 * certificate nor an error is reported as an INTERNAL error.
 */
SigningResponse
FromProto(const leima::v1::SignCertificateResponse &src);

void
ToProto(leima::v1::SignCertificateResponse &dest, const SigningResponse &src);
