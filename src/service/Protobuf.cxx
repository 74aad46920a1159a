// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Protobuf.hxx"
#include "Error.hxx"
#include "Bytes.hxx"
#include "leima.pb.h"

static std::vector<std::byte>
ToBytes(const std::string &s)
{
	return ToVector(AsBytes(s));
}

static std::string
ToString(std::span<const std::byte> s)
{
	return std::string{ToStringView(s)};
}

static CertificateType
FromProto(leima::v1::CertificateType type)
{
	switch (type) {
	case leima::v1::CERTIFICATE_TYPE_UNSPECIFIED:
	case leima::v1::CERTIFICATE_TYPE_USER:
		return CertificateType::USER;

	case leima::v1::CERTIFICATE_TYPE_HOST:
		return CertificateType::HOST;

	default:
		throw ValidationError{"Bad certificate type"};
	}
}

static leima::v1::CertificateType
ToProto(CertificateType type) noexcept
{
	switch (type) {
	case CertificateType::USER:
		return leima::v1::CERTIFICATE_TYPE_USER;

	case CertificateType::HOST:
		return leima::v1::CERTIFICATE_TYPE_HOST;
	}

	return leima::v1::CERTIFICATE_TYPE_USER;
}

static OptionMap
FromProto(const google::protobuf::Map<std::string, std::string> &src)
{
	OptionMap dest;
	for (const auto &[name, value] : src)
		dest.emplace(name, value);
	return dest;
}

static void
ToProto(google::protobuf::Map<std::string, std::string> &dest,
	const OptionMap &src)
{
	for (const auto &[name, value] : src)
		dest[name] = value;
}

SigningRequest
FromProto(const leima::v1::SignCertificateRequest &src)
{
	SigningRequest r;
	r.public_key = ToBytes(src.public_key());
	r.principals.assign(src.principals().begin(), src.principals().end());
	r.type = FromProto(src.type());
	r.key_id = src.key_id();

	if (src.has_serial())
		r.serial = src.serial();

	if (src.has_valid_after())
		r.valid_after = src.valid_after();

	if (src.has_valid_before())
		r.valid_before = src.valid_before();

	r.critical_options = FromProto(src.critical_options());

	if (src.has_extensions())
		r.extensions = FromProto(src.extensions().entries());

	return r;
}

void
ToProto(leima::v1::SignCertificateRequest &dest, const SigningRequest &src)
{
	dest.set_public_key(ToString(src.public_key));

	for (const auto &i : src.principals)
		dest.add_principals(i);

	dest.set_type(ToProto(src.type));
	dest.set_key_id(src.key_id);

	if (src.serial)
		dest.set_serial(*src.serial);

	if (src.valid_after)
		dest.set_valid_after(*src.valid_after);

	if (src.valid_before)
		dest.set_valid_before(*src.valid_before);

	ToProto(*dest.mutable_critical_options(), src.critical_options);

	if (src.extensions)
		ToProto(*dest.mutable_extensions()->mutable_entries(),
			*src.extensions);
}

static SigningErrorCode
FromProto(leima::v1::ErrorCode code) noexcept
{
	switch (code) {
	case leima::v1::ERROR_CODE_INVALID_REQUEST:
		return SigningErrorCode::INVALID_REQUEST;

	case leima::v1::ERROR_CODE_ENCODING_FAILED:
		return SigningErrorCode::ENCODING_FAILED;

	case leima::v1::ERROR_CODE_MALFORMED_SIGNATURE:
		return SigningErrorCode::MALFORMED_SIGNATURE;

	case leima::v1::ERROR_CODE_BACKEND_UNAVAILABLE:
		return SigningErrorCode::BACKEND_UNAVAILABLE;

	case leima::v1::ERROR_CODE_KEY_NOT_FOUND:
		return SigningErrorCode::KEY_NOT_FOUND;

	default:
		return SigningErrorCode::INTERNAL;
	}
}

static leima::v1::ErrorCode
ToProto(SigningErrorCode code) noexcept
{
	switch (code) {
	case SigningErrorCode::INVALID_REQUEST:
		return leima::v1::ERROR_CODE_INVALID_REQUEST;

	case SigningErrorCode::ENCODING_FAILED:
		return leima::v1::ERROR_CODE_ENCODING_FAILED;

	case SigningErrorCode::MALFORMED_SIGNATURE:
		return leima::v1::ERROR_CODE_MALFORMED_SIGNATURE;

	case SigningErrorCode::BACKEND_UNAVAILABLE:
		return leima::v1::ERROR_CODE_BACKEND_UNAVAILABLE;

	case SigningErrorCode::KEY_NOT_FOUND:
		return leima::v1::ERROR_CODE_KEY_NOT_FOUND;

	case SigningErrorCode::INTERNAL:
		break;
	}

	return leima::v1::ERROR_CODE_INTERNAL;
}

SigningResponse
FromProto(const leima::v1::SignCertificateResponse &src)
{
	switch (src.result_case()) {
	case leima::v1::SignCertificateResponse::kCertificate:
		return ToBytes(src.certificate());

	case leima::v1::SignCertificateResponse::kError:
		return SigningError{
			FromProto(src.error().code()),
			src.error().message(),
		};

	case leima::v1::SignCertificateResponse::RESULT_NOT_SET:
		break;
	}

	return SigningError{SigningErrorCode::INTERNAL, "Empty response"};
}

void
ToProto(leima::v1::SignCertificateResponse &dest, const SigningResponse &src)
{
	if (const auto *certificate = std::get_if<std::vector<std::byte>>(&src)) {
		dest.set_certificate(ToString(*certificate));
	} else {
		const auto &error = std::get<SigningError>(src);
		auto &e = *dest.mutable_error();
		e.set_code(ToProto(error.code));
		e.set_message(error.message);
	}
}
