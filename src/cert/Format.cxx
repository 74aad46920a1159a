// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Format.hxx"
#include "Certificate.hxx"
#include "key/TextFile.hxx"

std::string
FormatCertificateLine(const Certificate &cert, std::string_view comment)
{
	return FormatPublicKeyLine(cert.GetKeyType(), cert.Encode(), comment);
}

Certificate
ParseCertificateLine(std::string_view line)
{
	return Certificate::Parse(ParsePublicKeyLine(line).blob);
}
