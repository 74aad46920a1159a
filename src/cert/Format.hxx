// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

struct Certificate;

/**
 * Format the certificate for an "id_*-cert.pub" file.
 */
std::string
FormatCertificateLine(const Certificate &cert, std::string_view comment);

/**
 * Parse a line from an "id_*-cert.pub" file.  Throws
 * std::invalid_argument or DecodingError.
 */
Certificate
ParseCertificateLine(std::string_view line);
