// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "EcdsaSignature.hxx"
#include "BN.hxx"
#include "Error.hxx"
#include "Unique.hxx"
#include "../Error.hxx"
#include "ssh/Serializer.hxx"

#include <openssl/crypto.h>
#include <openssl/err.h>

#include <fmt/core.h>

static std::vector<std::byte>
ToFixedWidth(const BIGNUM &bn, std::size_t width)
{
	if (BN_is_negative(&bn))
		throw MalformedSignatureError{"Negative ECDSA signature component"};

	const int size = BN_num_bytes(&bn);
	if (size < 0 || std::size_t(size) > width)
		throw MalformedSignatureError{fmt::format("ECDSA signature component too large ({} > {} bytes)",
							  size, width)};

	std::vector<std::byte> result(width);
	if (BN_bn2binpad(&bn, reinterpret_cast<unsigned char *>(result.data()),
			 width) != static_cast<int>(width))
		throw SslError{"BN_bn2binpad() failed"};

	return result;
}

EcdsaSignature
DerToRaw(std::span<const std::byte> der, std::size_t component_width)
{
	const auto *p = reinterpret_cast<const unsigned char *>(der.data());
	const UniqueECDSA_SIG sig{d2i_ECDSA_SIG(nullptr, &p, der.size())};
	if (!sig) {
		ERR_clear_error();
		throw MalformedSignatureError{"Not a DER-encoded ECDSA signature"};
	}

	if (p != reinterpret_cast<const unsigned char *>(der.data() + der.size()))
		throw MalformedSignatureError{"Garbage after DER-encoded ECDSA signature"};

	const BIGNUM *sig_r, *sig_s;
	ECDSA_SIG_get0(sig.get(), &sig_r, &sig_s);

	return {
		ToFixedWidth(*sig_r, component_width),
		ToFixedWidth(*sig_s, component_width),
	};
}

std::vector<std::byte>
ToDer(const ECDSA_SIG &sig)
{
	const int size = i2d_ECDSA_SIG(&sig, nullptr);
	if (size <= 0)
		throw SslError{"i2d_ECDSA_SIG() failed"};

	std::vector<std::byte> result(size);
	auto *p = reinterpret_cast<unsigned char *>(result.data());
	if (i2d_ECDSA_SIG(&sig, &p) != size)
		throw SslError{"i2d_ECDSA_SIG() failed"};

	return result;
}

std::vector<std::byte>
RawToDer(std::span<const std::byte> r, std::span<const std::byte> s)
{
	auto bn_r = BN_bin2bn<false>(r);
	auto bn_s = BN_bin2bn<false>(s);

	const UniqueECDSA_SIG sig{ECDSA_SIG_new()};
	if (!sig)
		throw SslError{};

	if (!ECDSA_SIG_set0(sig.get(), bn_r.get(), bn_s.get()))
		throw SslError{};

	/* ownership was transferred to the ECDSA_SIG */
	bn_r.release();
	bn_s.release();

	return ToDer(*sig);
}

std::vector<std::byte>
RawToDer(std::span<const std::byte> raw)
{
	if (raw.empty() || raw.size() % 2 != 0)
		throw MalformedSignatureError{"Malformed raw ECDSA signature"};

	const std::size_t width = raw.size() / 2;
	return RawToDer(raw.first(width), raw.subspan(width));
}

void
SerializeEcdsaSignature(SSH::Serializer &s, std::string_view type,
			const EcdsaSignature &signature)
{
	s.WriteString(type);

	const auto blob_length = s.PrepareLength();

	const auto r_length = s.PrepareLength();
	s.WriteBignum2(signature.r);
	s.CommitLength(r_length);

	const auto s_length = s.PrepareLength();
	s.WriteBignum2(signature.s);
	s.CommitLength(s_length);

	s.CommitLength(blob_length);
}
