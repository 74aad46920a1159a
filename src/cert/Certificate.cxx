// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Certificate.hxx"
#include "Limits.hxx"
#include "Error.hxx"
#include "key/Key.hxx"
#include "key/Parser.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"

#include <fmt/core.h>

#include <stdexcept>
#include <utility>

using std::string_view_literals::operator""sv;

static constexpr auto cert_suffix = "-cert-v01@openssh.com"sv;

/**
 * Split the subject key blob into its type string and the type
 * specific parts.
 */
static std::pair<std::string_view, std::span<const std::byte>>
SplitPublicKeyBlob(std::span<const std::byte> blob)
{
	if (blob.empty())
		throw EncodingError{"No subject key"};

	try {
		SSH::Deserializer d{blob};
		const auto type = d.ReadString();
		if (!IsSupportedPublicKeyType(type))
			throw EncodingError{fmt::format("Unsupported subject key type '{}'", type)};

		return {type, d.GetRest()};
	} catch (SSH::MalformedPacket) {
		throw EncodingError{"Malformed subject key"};
	}
}

std::string
Certificate::GetKeyType() const
{
	std::string result{SplitPublicKeyBlob(public_key).first};
	result.append(cert_suffix);
	return result;
}

void
Certificate::CheckValidity() const
{
	if (valid_after >= valid_before)
		throw ValidationError{"Validity window is empty"};
}

static void
SerializePrincipals(SSH::Serializer &s,
		    const std::vector<std::string> &principals)
{
	if (principals.size() > MAX_PRINCIPALS)
		throw EncodingError{"Too many principals"};

	const auto length = s.PrepareLength();
	for (const auto &i : principals) {
		if (i.size() > MAX_PRINCIPAL_LENGTH)
			throw EncodingError{"Principal too long"};

		s.WriteString(i);
	}
	s.CommitLength(length);
}

static void
SerializeOptionsString(SSH::Serializer &s, const OptionMap &options)
{
	const auto length = s.PrepareLength();
	SerializeOptions(s, options);
	s.CommitLength(length);
}

void
Certificate::Serialize(SSH::Serializer &s, bool with_signature) const
try {
	const auto [subject_type, subject_parts] = SplitPublicKeyBlob(public_key);

	if (nonce.empty())
		throw EncodingError{"No nonce"};

	if (signature_key.empty())
		throw EncodingError{"No signature key"};

	if (with_signature && signature.empty())
		throw EncodingError{"No signature"};

	if (key_id.size() > MAX_KEY_ID_LENGTH)
		throw EncodingError{"Key id too long"};

	const auto key_type_mark = s.PrepareLength();
	s.WriteN(AsBytes(subject_type));
	s.WriteN(AsBytes(cert_suffix));
	s.CommitLength(key_type_mark);

	s.WriteLengthEncoded(nonce);
	s.WriteN(subject_parts);
	s.WriteU64(serial);
	s.WriteU32(static_cast<uint_least32_t>(type));
	s.WriteString(key_id);
	SerializePrincipals(s, principals);
	s.WriteU64(valid_after);
	s.WriteU64(valid_before);
	SerializeOptionsString(s, critical_options);
	SerializeOptionsString(s, extensions);
	s.WriteLengthEncoded(reserved);
	s.WriteLengthEncoded(signature_key);

	if (with_signature)
		s.WriteLengthEncoded(signature);

	if (s.size() > MAX_CERTIFICATE_SIZE)
		throw EncodingError{"Certificate too large"};
} catch (const std::length_error &e) {
	throw EncodingError{e.what()};
}

std::vector<std::byte>
Certificate::Encode() const
{
	SSH::Serializer s;
	Serialize(s, true);
	return s.Release();
}

std::vector<std::byte>
Certificate::ToBeSigned() const
{
	SSH::Serializer s;
	Serialize(s, false);
	return s.Release();
}

static CertificateType
ParseCertificateType(uint_least32_t value)
{
	switch (static_cast<CertificateType>(value)) {
	case CertificateType::USER:
	case CertificateType::HOST:
		return static_cast<CertificateType>(value);
	}

	throw DecodingError{fmt::format("Unknown certificate type {}", value)};
}

static std::vector<std::string>
ParsePrincipals(std::span<const std::byte> src)
{
	std::vector<std::string> principals;

	SSH::Deserializer d{src};
	while (!d.empty())
		principals.emplace_back(d.ReadString());

	return principals;
}

/**
 * Reconstruct the full public key blob from the type and the type
 * specific parts.
 */
static std::vector<std::byte>
MakePublicKeyBlob(std::string_view type, std::span<const std::byte> parts)
{
	SSH::Serializer s;
	s.WriteString(type);
	s.WriteN(parts);
	return s.Release();
}

Certificate
Certificate::Parse(std::span<const std::byte> src)
try {
	if (src.size() > MAX_CERTIFICATE_SIZE)
		throw DecodingError{"Certificate too large"};

	SSH::Deserializer d{src};

	const auto key_type = d.ReadString();
	if (!key_type.ends_with(cert_suffix))
		throw DecodingError{fmt::format("Unknown certificate key type '{}'", key_type)};

	const auto subject_type = key_type.substr(0, key_type.size() - cert_suffix.size());
	if (!IsSupportedPublicKeyType(subject_type))
		throw DecodingError{fmt::format("Unknown certificate key type '{}'", key_type)};

	Certificate cert;
	cert.nonce = ToVector(d.ReadLengthEncoded());

	const auto parts_mark = d.Mark();
	ParsePublicKeyParts(subject_type, d);
	cert.public_key = MakePublicKeyBlob(subject_type, d.Since(parts_mark));

	cert.serial = d.ReadU64();
	cert.type = ParseCertificateType(d.ReadU32());
	cert.key_id = d.ReadString();
	cert.principals = ParsePrincipals(d.ReadLengthEncoded());
	cert.valid_after = d.ReadU64();
	cert.valid_before = d.ReadU64();
	cert.critical_options = DeserializeOptions(d.ReadLengthEncoded());
	cert.extensions = DeserializeOptions(d.ReadLengthEncoded());
	cert.reserved = ToVector(d.ReadLengthEncoded());
	cert.signature_key = ToVector(d.ReadLengthEncoded());
	cert.signature = ToVector(d.ReadLengthEncoded());

	if (!d.empty())
		throw DecodingError{"Garbage after certificate"};

	return cert;
} catch (SSH::MalformedPacket) {
	throw DecodingError{"Truncated certificate"};
} catch (const std::invalid_argument &e) {
	throw DecodingError{e.what()};
}
