// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Validate.hxx"
#include "Request.hxx"
#include "Error.hxx"
#include "ca/Parameters.hxx"
#include "cert/Certificate.hxx"
#include "cert/Limits.hxx"
#include "key/Key.hxx"
#include "key/Parser.hxx"

#include <fmt/core.h>

#include <set>
#include <span>
#include <tuple> // for std::tie()
#include <stdexcept>

static constexpr uint_least64_t
SaturatingAdd(uint_least64_t a, uint_least64_t b) noexcept
{
	return b > Certificate::VALID_FOREVER - a
		? Certificate::VALID_FOREVER
		: a + b;
}

std::pair<uint_least64_t, uint_least64_t>
ResolveValidity(const SigningRequest &request, const SigningPolicy &policy,
		uint_least64_t now) noexcept
{
	const uint_least64_t valid_after = request.valid_after.value_or(now);
	const uint_least64_t valid_before = request.valid_before
		? *request.valid_before
		: SaturatingAdd(valid_after, policy.default_validity.count());

	return {valid_after, valid_before};
}

static void
ValidatePublicKey(std::span<const std::byte> public_key)
try {
	if (public_key.empty())
		throw ValidationError{"No public key"};

	ParsePublicKeyBlob(public_key);
} catch (const std::invalid_argument &e) {
	throw ValidationError{fmt::format("Bad public key: {}", e.what())};
}

static void
ValidatePrincipals(const std::vector<std::string> &principals)
{
	if (principals.size() > MAX_PRINCIPALS)
		throw ValidationError{"Too many principals"};

	std::set<std::string_view> seen;
	for (const auto &i : principals) {
		if (i.empty())
			throw ValidationError{"Empty principal"};

		if (i.size() > MAX_PRINCIPAL_LENGTH)
			throw ValidationError{"Principal too long"};

		if (!seen.emplace(i).second)
			throw ValidationError{fmt::format("Duplicate principal '{}'", i)};
	}
}

static void
ValidateOptions(const OptionMap &options, const char *what)
{
	for (const auto &[name, value] : options) {
		if (name.empty())
			throw ValidationError{fmt::format("Empty {} name", what)};

		if (name.size() > MAX_OPTION_NAME_LENGTH)
			throw ValidationError{fmt::format("{} name too long", what)};

		if (value.size() > MAX_OPTION_VALUE_LENGTH)
			throw ValidationError{fmt::format("Value of {} '{}' too long", what, name)};
	}
}

static void
ValidateCriticalOptions(const OptionMap &options)
{
	ValidateOptions(options, "critical option");

	for (const auto &i : options)
		if (!IsKnownCriticalOption(i.first))
			throw ValidationError{fmt::format("Unknown critical option '{}'", i.first)};
}

void
ValidateSigningRequest(const SigningRequest &request,
		       const SigningPolicy &policy,
		       uint_least64_t now)
{
	ValidatePublicKey(request.public_key);

	switch (request.type) {
	case CertificateType::USER:
	case CertificateType::HOST:
		break;

	default:
		throw ValidationError{"Bad certificate type"};
	}

	ValidatePrincipals(request.principals);

	if (request.key_id.size() > MAX_KEY_ID_LENGTH)
		throw ValidationError{"Key id too long"};

	ValidateCriticalOptions(request.critical_options);

	if (request.extensions)
		ValidateOptions(*request.extensions, "extension");

	const auto [valid_after, valid_before] = ResolveValidity(request, policy, now);
	if (valid_after >= valid_before)
		throw ValidationError{"Validity window is empty"};

	if (policy.max_validity.count() > 0 &&
	    valid_before - valid_after > static_cast<uint_least64_t>(policy.max_validity.count()))
		throw ValidationError{fmt::format("Validity exceeds the maximum of {} seconds",
						  policy.max_validity.count())};
}

CertificateParameters
ToCertificateParameters(const SigningRequest &request,
			const SigningPolicy &policy,
			uint_least64_t now)
{
	CertificateParameters p{policy.default_validity};

	p.type = request.type;
	p.key_id = request.key_id;

	if (request.serial)
		p.serial = *request.serial;

	p.principals = request.principals;

	std::tie(p.valid_after, p.valid_before) = ResolveValidity(request, policy, now);

	p.critical_options = request.critical_options;

	if (request.extensions)
		p.extensions = *request.extensions;
	else if (request.type == CertificateType::HOST)
		/* extensions are only defined for user
		   certificates */
		p.extensions.clear();

	return p;
}
