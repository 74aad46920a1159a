// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "service/Handler.hxx"
#include "service/Protobuf.hxx"
#include "service/Request.hxx"
#include "service/Validate.hxx"
#include "backend/LocalKeyBackend.hxx"
#include "ca/SigningKey.hxx"
#include "ca/Parameters.hxx"
#include "cert/Certificate.hxx"
#include "cert/Verify.hxx"
#include "key/ECDSAKey.hxx"
#include "openssl/Key.hxx"
#include "ssh/Serializer.hxx"
#include "Error.hxx"
#include "leima.pb.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using std::string_view_literals::operator""sv;

static std::vector<std::byte>
MakeSubjectKey()
{
	const ECDSAKey key{GenerateEcKey("P-256")};
	SSH::Serializer s;
	key.SerializePublic(s);
	return s.Release();
}

static SigningRequest
MakeRequest()
{
	SigningRequest request;
	request.public_key = MakeSubjectKey();
	request.principals = {"test.user"};
	request.key_id = "test";
	return request;
}

/**
 * A backend with a valid public key whose Sign() method misbehaves
 * in a configurable way.
 */
class BrokenBackend final : public SigningBackend {
	const LocalKeyBackend key{GenerateEcKey("P-256")};

	/**
	 * Used for #WRONG_KEY.
	 */
	const LocalKeyBackend other_key{GenerateEcKey("P-256")};

public:
	enum class Mode {
		OK,
		UNAVAILABLE,
		NOT_FOUND,
		GARBAGE,
		WRONG_KEY,

		/**
		 * Sign after a delay, ignoring the deadline.
		 */
		SLOW,
	} mode = Mode::OK;

	mutable std::atomic_uint n_calls{0};

	std::span<const std::byte> GetPublicKeyBlob() const noexcept override {
		return key.GetPublicKeyBlob();
	}

	DigestAlgorithm GetDigestAlgorithm() const noexcept override {
		return key.GetDigestAlgorithm();
	}

	std::vector<std::byte> Sign(std::span<const std::byte> digest,
				    SigningDeadline deadline) const override {
		++n_calls;

		switch (mode) {
		case Mode::OK:
			break;

		case Mode::SLOW:
			std::this_thread::sleep_for(std::chrono::milliseconds{200});
			break;

		case Mode::UNAVAILABLE:
			throw BackendUnavailableError{"Connection refused"};

		case Mode::NOT_FOUND:
			throw KeyNotFoundError{"No such key"};

		case Mode::GARBAGE:
			return {std::byte{0x30}, std::byte{0x01}};

		case Mode::WRONG_KEY:
			return other_key.Sign(digest, deadline);
		}

		return key.Sign(digest, deadline);
	}
};

class SigningHandlerTest : public testing::Test {
protected:
	const std::shared_ptr<BrokenBackend> backend = std::make_shared<BrokenBackend>();

	SigningHandler handler{
		std::make_shared<const SigningKey>(backend),
		SigningPolicy{std::chrono::hours{1}, std::chrono::hours{24}},
	};

	Certificate Sign(const SigningRequest &request) {
		const auto response = handler.HandleSigningRequest(request);
		if (const auto *error = std::get_if<SigningError>(&response))
			throw std::runtime_error{error->message};

		return Certificate::Parse(std::get<std::vector<std::byte>>(response));
	}

	SigningErrorCode GetErrorCode(const SigningRequest &request) {
		const auto response = handler.HandleSigningRequest(request);
		const auto *error = std::get_if<SigningError>(&response);
		if (error == nullptr)
			throw std::runtime_error{"Unexpected success"};

		EXPECT_FALSE(error->message.empty());
		return error->code;
	}
};

TEST_F(SigningHandlerTest, User)
{
	const auto request = MakeRequest();
	const auto now = GetUnixTime();
	const auto cert = Sign(request);

	EXPECT_EQ(cert.type, CertificateType::USER);
	EXPECT_EQ(cert.principals, request.principals);
	EXPECT_EQ(cert.key_id, "test");
	EXPECT_EQ(cert.public_key, request.public_key);
	EXPECT_EQ(cert.extensions, PermitAllExtensions());
	EXPECT_GE(cert.valid_after, now);
	EXPECT_EQ(cert.valid_before - cert.valid_after, 3600U);
	EXPECT_EQ(VerifyCertificate(cert, "test.user"sv, cert.valid_after),
		  CertificateStatus::OK);
}

TEST_F(SigningHandlerTest, Host)
{
	auto request = MakeRequest();
	request.type = CertificateType::HOST;
	request.principals = {"host.example.com", "host"};
	request.serial = 42;
	request.valid_after = 1000;
	request.valid_before = 2000;

	const auto cert = Sign(request);
	EXPECT_EQ(cert.type, CertificateType::HOST);
	EXPECT_EQ(cert.serial, 42U);
	EXPECT_EQ(cert.valid_after, 1000U);
	EXPECT_EQ(cert.valid_before, 2000U);
	EXPECT_TRUE(cert.extensions.empty());
	EXPECT_TRUE(VerifyCertificateSignature(cert));
}

TEST_F(SigningHandlerTest, Options)
{
	auto request = MakeRequest();
	request.critical_options = {
		{"force-command", "/usr/bin/backup"},
		{"source-address", "10.0.0.0/8"},
	};
	request.extensions = OptionMap{{"permit-pty", {}}};

	const auto cert = Sign(request);
	EXPECT_EQ(cert.critical_options, request.critical_options);
	EXPECT_EQ(cert.extensions, *request.extensions);

	/* explicitly no extensions */
	request.extensions = OptionMap{};
	EXPECT_TRUE(Sign(request).extensions.empty());
}

TEST_F(SigningHandlerTest, EmptyPrincipals)
{
	auto request = MakeRequest();
	request.principals.clear();

	const auto cert = Sign(request);
	EXPECT_TRUE(cert.principals.empty());
	EXPECT_EQ(VerifyCertificate(cert, "anybody"sv, cert.valid_after),
		  CertificateStatus::OK);
}

TEST_F(SigningHandlerTest, BackendUnavailable)
{
	backend->mode = BrokenBackend::Mode::UNAVAILABLE;

	const auto response = handler.HandleSigningRequest(MakeRequest());
	ASSERT_TRUE(std::holds_alternative<SigningError>(response));
	EXPECT_EQ(std::get<SigningError>(response).code,
		  SigningErrorCode::BACKEND_UNAVAILABLE);
}

TEST_F(SigningHandlerTest, DeadlineExceeded)
{
	backend->mode = BrokenBackend::Mode::SLOW;

	const auto deadline = std::chrono::system_clock::now() + std::chrono::milliseconds{50};
	const auto response = handler.HandleSigningRequest(MakeRequest(), deadline);
	ASSERT_TRUE(std::holds_alternative<SigningError>(response));
	EXPECT_EQ(std::get<SigningError>(response).code,
		  SigningErrorCode::BACKEND_UNAVAILABLE);
	EXPECT_EQ(backend->n_calls.load(), 1U);
}

TEST_F(SigningHandlerTest, DeadlineExpired)
{
	const auto deadline = std::chrono::system_clock::now() - std::chrono::seconds{1};
	const auto response = handler.HandleSigningRequest(MakeRequest(), deadline);
	ASSERT_TRUE(std::holds_alternative<SigningError>(response));
	EXPECT_EQ(std::get<SigningError>(response).code,
		  SigningErrorCode::BACKEND_UNAVAILABLE);

	/* the backend was not bothered */
	EXPECT_EQ(backend->n_calls.load(), 0U);
}

TEST_F(SigningHandlerTest, DeadlineMet)
{
	backend->mode = BrokenBackend::Mode::SLOW;

	const auto deadline = std::chrono::system_clock::now() + std::chrono::minutes{1};
	const auto response = handler.HandleSigningRequest(MakeRequest(), deadline);
	ASSERT_TRUE(std::holds_alternative<std::vector<std::byte>>(response));
	EXPECT_EQ(VerifyCertificate(Certificate::Parse(std::get<std::vector<std::byte>>(response)),
				    "test.user"sv, GetUnixTime()),
		  CertificateStatus::OK);
}

TEST_F(SigningHandlerTest, BackendErrors)
{
	backend->mode = BrokenBackend::Mode::NOT_FOUND;
	EXPECT_EQ(GetErrorCode(MakeRequest()), SigningErrorCode::KEY_NOT_FOUND);

	backend->mode = BrokenBackend::Mode::GARBAGE;
	EXPECT_EQ(GetErrorCode(MakeRequest()), SigningErrorCode::MALFORMED_SIGNATURE);

	backend->mode = BrokenBackend::Mode::WRONG_KEY;
	EXPECT_EQ(GetErrorCode(MakeRequest()), SigningErrorCode::MALFORMED_SIGNATURE);

	backend->mode = BrokenBackend::Mode::OK;
	EXPECT_NO_THROW(Sign(MakeRequest()));
}

TEST_F(SigningHandlerTest, InvalidRequest)
{
	{
		auto request = MakeRequest();
		request.public_key.clear();
		EXPECT_EQ(GetErrorCode(request), SigningErrorCode::INVALID_REQUEST);
	}

	{
		auto request = MakeRequest();
		request.public_key.pop_back();
		EXPECT_EQ(GetErrorCode(request), SigningErrorCode::INVALID_REQUEST);
	}

	{
		auto request = MakeRequest();
		request.principals = {"a", "b", "a"};
		EXPECT_EQ(GetErrorCode(request), SigningErrorCode::INVALID_REQUEST);
	}

	{
		auto request = MakeRequest();
		request.principals = {""};
		EXPECT_EQ(GetErrorCode(request), SigningErrorCode::INVALID_REQUEST);
	}

	{
		auto request = MakeRequest();
		request.principals = {std::string(256, 'x')};
		EXPECT_EQ(GetErrorCode(request), SigningErrorCode::INVALID_REQUEST);
	}

	{
		auto request = MakeRequest();
		request.key_id.assign(2000, 'x');
		EXPECT_EQ(GetErrorCode(request), SigningErrorCode::INVALID_REQUEST);
	}

	{
		auto request = MakeRequest();
		request.critical_options = {{"no-such-option", {}}};
		EXPECT_EQ(GetErrorCode(request), SigningErrorCode::INVALID_REQUEST);
	}

	{
		auto request = MakeRequest();
		request.valid_after = 2000;
		request.valid_before = 2000;
		EXPECT_EQ(GetErrorCode(request), SigningErrorCode::INVALID_REQUEST);
	}

	{
		/* exceeds the maximum validity of 24 hours */
		auto request = MakeRequest();
		request.valid_after = 1000;
		request.valid_before = 1000 + 25 * 3600;
		EXPECT_EQ(GetErrorCode(request), SigningErrorCode::INVALID_REQUEST);
	}

	{
		auto request = MakeRequest();
		request.type = static_cast<CertificateType>(3);
		EXPECT_EQ(GetErrorCode(request), SigningErrorCode::INVALID_REQUEST);
	}
}

TEST(ResolveValidity, Defaults)
{
	const SigningPolicy policy{std::chrono::minutes{5}, {}};

	SigningRequest request;
	EXPECT_EQ(ResolveValidity(request, policy, 1000),
		  std::make_pair(uint_least64_t{1000}, uint_least64_t{1300}));

	request.valid_after = 5000;
	EXPECT_EQ(ResolveValidity(request, policy, 1000),
		  std::make_pair(uint_least64_t{5000}, uint_least64_t{5300}));

	request.valid_before = 6000;
	EXPECT_EQ(ResolveValidity(request, policy, 1000),
		  std::make_pair(uint_least64_t{5000}, uint_least64_t{6000}));

	/* saturate instead of overflowing */
	request.valid_after = Certificate::VALID_FOREVER - 10;
	request.valid_before.reset();
	EXPECT_EQ(ResolveValidity(request, policy, 1000).second,
		  Certificate::VALID_FOREVER);
}

TEST(Protobuf, Request)
{
	SigningRequest request;
	request.public_key = MakeSubjectKey();
	request.principals = {"a", "b"};
	request.type = CertificateType::HOST;
	request.key_id = "id";
	request.serial = 0;
	request.valid_before = 1234;
	request.critical_options = {{"force-command", "ls"}};
	request.extensions = OptionMap{};

	leima::v1::SignCertificateRequest proto;
	ToProto(proto, request);
	EXPECT_TRUE(proto.has_serial());
	EXPECT_FALSE(proto.has_valid_after());
	EXPECT_TRUE(proto.has_extensions());

	const auto result = FromProto(proto);
	EXPECT_EQ(result.public_key, request.public_key);
	EXPECT_EQ(result.principals, request.principals);
	EXPECT_EQ(result.type, request.type);
	EXPECT_EQ(result.key_id, request.key_id);
	EXPECT_EQ(result.serial, request.serial);
	EXPECT_EQ(result.valid_after, request.valid_after);
	EXPECT_EQ(result.valid_before, request.valid_before);
	EXPECT_EQ(result.critical_options, request.critical_options);
	ASSERT_TRUE(result.extensions);
	EXPECT_TRUE(result.extensions->empty());

	/* not specified */
	proto.clear_extensions();
	proto.clear_type();
	const auto result2 = FromProto(proto);
	EXPECT_FALSE(result2.extensions);
	EXPECT_EQ(result2.type, CertificateType::USER);
}

TEST(Protobuf, UnknownCertificateType)
{
	/* field 3 (type), varint 7 */
	leima::v1::SignCertificateRequest proto;
	ASSERT_TRUE(proto.ParseFromString(std::string{"\x18\x07", 2}));
	EXPECT_THROW(FromProto(proto), ValidationError);
}

TEST(Protobuf, Response)
{
	{
		const std::vector<std::byte> certificate{std::byte{1}, std::byte{2}};

		leima::v1::SignCertificateResponse proto;
		ToProto(proto, SigningResponse{certificate});
		EXPECT_TRUE(proto.has_certificate());

		const auto result = FromProto(proto);
		ASSERT_TRUE(std::holds_alternative<std::vector<std::byte>>(result));
		EXPECT_EQ(std::get<std::vector<std::byte>>(result), certificate);
	}

	{
		leima::v1::SignCertificateResponse proto;
		ToProto(proto, SigningResponse{SigningError{SigningErrorCode::KEY_NOT_FOUND, "gone"}});
		EXPECT_TRUE(proto.has_error());
		EXPECT_EQ(proto.error().code(), leima::v1::ERROR_CODE_KEY_NOT_FOUND);

		const auto result = FromProto(proto);
		ASSERT_TRUE(std::holds_alternative<SigningError>(result));
		EXPECT_EQ(std::get<SigningError>(result).code, SigningErrorCode::KEY_NOT_FOUND);
		EXPECT_EQ(std::get<SigningError>(result).message, "gone");
	}

	{
		const leima::v1::SignCertificateResponse proto;
		const auto result = FromProto(proto);
		ASSERT_TRUE(std::holds_alternative<SigningError>(result));
		EXPECT_EQ(std::get<SigningError>(result).code, SigningErrorCode::INTERNAL);
	}
}
