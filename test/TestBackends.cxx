// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "backend/AwsKmsBackend.hxx"
#include "backend/AwsKmsClient.hxx"
#include "backend/AzureKeyVaultBackend.hxx"
#include "backend/AzureKeyVaultClient.hxx"
#include "backend/GcpKmsBackend.hxx"
#include "backend/GcpKmsClient.hxx"
#include "backend/LocalKeyBackend.hxx"
#include "ca/SigningKey.hxx"
#include "ca/Parameters.hxx"
#include "cert/Certificate.hxx"
#include "cert/Verify.hxx"
#include "key/ECDSAKey.hxx"
#include "key/EcCurve.hxx"
#include "openssl/EcdsaSignature.hxx"
#include "openssl/Error.hxx"
#include "openssl/Key.hxx"
#include "openssl/Sign.hxx"
#include "ssh/Serializer.hxx"
#include "Error.hxx"

#include <openssl/core_names.h>

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <fstream>
#include <stdexcept>

#include <stdlib.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

static std::vector<std::byte>
MakeSubjectKey()
{
	const ECDSAKey key{GenerateEcKey("P-256")};
	SSH::Serializer s;
	key.SerializePublic(s);
	return s.Release();
}

/**
 * Issue a certificate with the backend and verify it.
 */
static void
CheckBackend(std::shared_ptr<const SigningBackend> backend)
{
	const SigningKey key{std::move(backend)};

	CertificateParameters parameters;
	parameters.principals = {"test.user"};

	const auto cert = key.SignCertificate(MakeSubjectKey(), parameters);
	EXPECT_EQ(VerifyCertificate(Certificate::Parse(cert.Encode()),
				    "test.user"sv, GetUnixTime()),
		  CertificateStatus::OK);
}

/**
 * Returns the digest algorithm implied by the size of the digest.
 */
static DigestAlgorithm
GuessDigestAlgorithm(std::span<const std::byte> digest)
{
	switch (digest.size()) {
	case 32:
		return DigestAlgorithm::SHA256;

	case 48:
		return DigestAlgorithm::SHA384;

	case 64:
		return DigestAlgorithm::SHA512;
	}

	throw std::invalid_argument{"Bad digest size"};
}

class FakeAwsKmsClient final : public AwsKmsClient {
	const UniqueEVP_PKEY key;

public:
	std::string key_spec, key_usage = "SIGN_VERIFY";

	/**
	 * If not empty, all calls throw an #AwsKmsError with this
	 * exception name.
	 */
	std::string error;

	SigningDeadline last_deadline{};

	FakeAwsKmsClient(const char *group_name, std::string_view _key_spec)
		:key(GenerateEcKey(group_name)), key_spec(_key_spec) {}

	std::string_view GetRegion() const noexcept override {
		return "eu-central-1"sv;
	}

	AwsKmsPublicKey GetPublicKey(std::string_view key_id) override {
		if (!error.empty())
			throw AwsKmsError{error, "fake"};

		if (key_id != "alias/ca"sv)
			throw AwsKmsError{"NotFoundException", "no such key"};

		return {EncodePublicKeyDER(*key), key_spec, key_usage};
	}

	std::vector<std::byte> SignDigest(std::string_view,
					  AwsKmsSigningAlgorithm algorithm,
					  std::span<const std::byte> digest,
					  SigningDeadline deadline) override {
		if (!error.empty())
			throw AwsKmsError{error, "fake"};

		last_deadline = deadline;

		const auto digest_algorithm = GuessDigestAlgorithm(digest);
		switch (algorithm) {
		case AwsKmsSigningAlgorithm::ECDSA_SHA_256:
			EXPECT_EQ(digest_algorithm, DigestAlgorithm::SHA256);
			break;

		case AwsKmsSigningAlgorithm::ECDSA_SHA_384:
			EXPECT_EQ(digest_algorithm, DigestAlgorithm::SHA384);
			break;

		case AwsKmsSigningAlgorithm::ECDSA_SHA_512:
			EXPECT_EQ(digest_algorithm, DigestAlgorithm::SHA512);
			break;
		}

		return ::SignDigest(*key, digest_algorithm, digest);
	}
};

static const AwsKmsBackendConfig aws_config{"alias/ca", "eu-central-1"};

TEST(AwsKmsBackend, Sign)
{
	CheckBackend(std::make_shared<AwsKmsBackend>(std::make_shared<FakeAwsKmsClient>("P-256", "ECC_NIST_P256"),
						     aws_config));
	CheckBackend(std::make_shared<AwsKmsBackend>(std::make_shared<FakeAwsKmsClient>("P-384", "ECC_NIST_P384"),
						     aws_config));
	CheckBackend(std::make_shared<AwsKmsBackend>(std::make_shared<FakeAwsKmsClient>("P-521", "ECC_NIST_P521"),
						     aws_config));
}

TEST(AwsKmsBackend, BadKey)
{
	auto client = std::make_shared<FakeAwsKmsClient>("P-256", "ECC_NIST_P384");
	EXPECT_THROW(AwsKmsBackend(client, aws_config), std::invalid_argument);

	client->key_spec = "ECC_SECG_P256K1";
	EXPECT_THROW(AwsKmsBackend(client, aws_config), std::invalid_argument);

	client->key_spec = "ECC_NIST_P256";
	client->key_usage = "ENCRYPT_DECRYPT";
	EXPECT_THROW(AwsKmsBackend(client, aws_config), std::invalid_argument);

	client->key_usage = "SIGN_VERIFY";
	EXPECT_NO_THROW(AwsKmsBackend(client, aws_config));

	EXPECT_THROW(AwsKmsBackend(client, AwsKmsBackendConfig{"alias/ca", "us-east-1"}),
		     std::invalid_argument);
	EXPECT_THROW(AwsKmsBackend(client, AwsKmsBackendConfig{"alias/other", "eu-central-1"}),
		     KeyNotFoundError);
}

TEST(AwsKmsBackend, Errors)
{
	auto client = std::make_shared<FakeAwsKmsClient>("P-256", "ECC_NIST_P256");
	const AwsKmsBackend backend{client, aws_config};
	const std::array<std::byte, 32> digest{};

	client->error = "DisabledException";
	EXPECT_THROW(backend.Sign(digest, NO_SIGNING_DEADLINE), KeyNotFoundError);

	client->error = "KMSInvalidStateException";
	EXPECT_THROW(backend.Sign(digest, NO_SIGNING_DEADLINE), KeyNotFoundError);

	client->error = "ThrottlingException";
	EXPECT_THROW(backend.Sign(digest, NO_SIGNING_DEADLINE), BackendUnavailableError);

	client->error = "KeyUnavailableException";
	EXPECT_THROW(backend.Sign(digest, NO_SIGNING_DEADLINE), BackendUnavailableError);

	client->error = "DependencyTimeoutException";
	EXPECT_THROW(AwsKmsBackend(client, aws_config), BackendUnavailableError);
}

/**
 * Returns the uncompressed point of an EC key.
 */
static std::vector<std::byte>
GetPublicPoint(const EVP_PKEY &key)
{
	std::vector<std::byte> result(256);
	std::size_t size;
	if (!EVP_PKEY_get_octet_string_param(&key, OSSL_PKEY_PARAM_PUB_KEY,
					     reinterpret_cast<unsigned char *>(result.data()),
					     result.size(), &size))
		throw SslError{};

	result.resize(size);
	return result;
}

class FakeAzureKeyVaultClient final : public AzureKeyVaultClient {
	const UniqueEVP_PKEY key;
	const EcCurve &curve;

public:
	/**
	 * Strip leading null bytes from the JWK coordinates.
	 */
	bool strip_coordinates = false;

	/**
	 * Truncate signatures.
	 */
	bool truncate_signature = false;

	unsigned error_status = 0;
	std::string error_code;

	SigningDeadline last_deadline{};

	explicit FakeAzureKeyVaultClient(const char *group_name)
		:key(GenerateEcKey(group_name)), curve(GetEcCurve(*key)) {}

	std::string_view GetVaultUrl() const noexcept override {
		return "https://example.vault.azure.net/"sv;
	}

	AzureJsonWebKey GetKey(std::string_view name,
			       std::string_view version) override {
		if (error_status != 0)
			throw AzureRequestFailedError{error_status, error_code, "fake"};

		if (name != "ca"sv || !version.empty())
			throw AzureRequestFailedError{404, "KeyNotFound", "no such key"};

		const auto point = GetPublicPoint(*key);
		const std::size_t width = curve.component_width;

		AzureJsonWebKey jwk;
		jwk.kty = "EC-HSM";
		jwk.crv = curve.group_name;
		jwk.x.assign(point.begin() + 1, point.begin() + 1 + width);
		jwk.y.assign(point.begin() + 1 + width, point.end());

		if (strip_coordinates) {
			while (!jwk.x.empty() && jwk.x.front() == std::byte{})
				jwk.x.erase(jwk.x.begin());
			jwk.x.insert(jwk.x.begin(), std::byte{});
		}

		return jwk;
	}

	std::vector<std::byte> Sign(std::string_view, std::string_view,
				    AzureSignatureAlgorithm,
				    std::span<const std::byte> digest,
				    SigningDeadline deadline) override {
		if (error_status != 0)
			throw AzureRequestFailedError{error_status, error_code, "fake"};

		last_deadline = deadline;

		auto raw = DerToRaw(::SignDigest(*key, GuessDigestAlgorithm(digest), digest),
				    curve.component_width);

		std::vector<std::byte> result = std::move(raw.r);
		result.insert(result.end(), raw.s.begin(), raw.s.end());

		if (truncate_signature)
			result.pop_back();

		return result;
	}
};

static const AzureKeyVaultBackendConfig azure_config{"https://example.vault.azure.net", "ca", {}};

TEST(AzureKeyVaultBackend, Sign)
{
	CheckBackend(std::make_shared<AzureKeyVaultBackend>(std::make_shared<FakeAzureKeyVaultClient>("P-256"),
							    azure_config));
	CheckBackend(std::make_shared<AzureKeyVaultBackend>(std::make_shared<FakeAzureKeyVaultClient>("P-384"),
							    azure_config));
	CheckBackend(std::make_shared<AzureKeyVaultBackend>(std::make_shared<FakeAzureKeyVaultClient>("P-521"),
							    azure_config));

	auto client = std::make_shared<FakeAzureKeyVaultClient>("P-521");
	client->strip_coordinates = true;
	CheckBackend(std::make_shared<AzureKeyVaultBackend>(client, azure_config));
}

TEST(AzureKeyVaultBackend, Errors)
{
	auto client = std::make_shared<FakeAzureKeyVaultClient>("P-256");

	EXPECT_THROW(AzureKeyVaultBackend(client, AzureKeyVaultBackendConfig{"https://other.vault.azure.net/", "ca", {}}),
		     std::invalid_argument);
	EXPECT_THROW(AzureKeyVaultBackend(client, AzureKeyVaultBackendConfig{"https://example.vault.azure.net/", "other", {}}),
		     KeyNotFoundError);

	const AzureKeyVaultBackend backend{client, azure_config};
	const std::array<std::byte, 32> digest{};

	client->truncate_signature = true;
	EXPECT_THROW(backend.Sign(digest, NO_SIGNING_DEADLINE), MalformedSignatureError);
	client->truncate_signature = false;

	client->error_status = 403;
	client->error_code = "KeyDisabled";
	EXPECT_THROW(backend.Sign(digest, NO_SIGNING_DEADLINE), KeyNotFoundError);

	client->error_status = 503;
	client->error_code = {};
	EXPECT_THROW(backend.Sign(digest, NO_SIGNING_DEADLINE), BackendUnavailableError);

	client->error_status = 429;
	EXPECT_THROW(AzureKeyVaultBackend(client, azure_config),
		     BackendUnavailableError);
}

class FakeGcpKmsClient final : public GcpKmsClient {
	const UniqueEVP_PKEY key;

public:
	std::string algorithm;

	grpc::Status status = grpc::Status::OK;

	std::string last_sign_name;
	SigningDeadline last_deadline{};

	FakeGcpKmsClient(const char *group_name, std::string_view _algorithm)
		:key(GenerateEcKey(group_name)), algorithm(_algorithm) {}

	grpc::Status GetPublicKey(const std::string &name,
				  GcpKmsPublicKey &response) override {
		if (!status.ok())
			return status;

		response.pem = EncodePublicKeyPEM(*key);
		response.algorithm = algorithm;
		response.name = name + "/canonical";
		return grpc::Status::OK;
	}

	grpc::Status AsymmetricSign(const std::string &name,
				    DigestAlgorithm digest_algorithm,
				    std::span<const std::byte> digest,
				    SigningDeadline deadline,
				    std::vector<std::byte> &signature) override {
		if (!status.ok())
			return status;

		EXPECT_EQ(digest_algorithm, GuessDigestAlgorithm(digest));
		last_sign_name = name;
		last_deadline = deadline;
		signature = ::SignDigest(*key, digest_algorithm, digest);
		return grpc::Status::OK;
	}
};

static constexpr auto gcp_key_name = "projects/p/locations/global/keyRings/r/cryptoKeys/ca/cryptoKeyVersions/1";

TEST(GcpKmsBackend, Sign)
{
	auto client = std::make_shared<FakeGcpKmsClient>("P-256", "EC_SIGN_P256_SHA256");
	CheckBackend(std::make_shared<GcpKmsBackend>(client, gcp_key_name));

	/* the name returned by GetPublicKey is used for signing */
	EXPECT_EQ(client->last_sign_name, std::string{gcp_key_name} + "/canonical");

	CheckBackend(std::make_shared<GcpKmsBackend>(std::make_shared<FakeGcpKmsClient>("P-384", "EC_SIGN_P384_SHA384"),
						     gcp_key_name));
}

TEST(GcpKmsBackend, BadKey)
{
	EXPECT_THROW(GcpKmsBackend(std::make_shared<FakeGcpKmsClient>("P-256", "EC_SIGN_SECP256K1_SHA256"),
				   gcp_key_name),
		     std::invalid_argument);
	EXPECT_THROW(GcpKmsBackend(std::make_shared<FakeGcpKmsClient>("P-256", "EC_SIGN_P384_SHA384"),
				   gcp_key_name),
		     std::invalid_argument);
	EXPECT_THROW(GcpKmsBackend(std::make_shared<FakeGcpKmsClient>("P-521", "RSA_SIGN_PSS_2048_SHA256"),
				   gcp_key_name),
		     std::invalid_argument);
}

TEST(GcpKmsBackend, Errors)
{
	auto client = std::make_shared<FakeGcpKmsClient>("P-256", "EC_SIGN_P256_SHA256");
	const GcpKmsBackend backend{client, gcp_key_name};
	const std::array<std::byte, 32> digest{};

	client->status = grpc::Status{grpc::StatusCode::FAILED_PRECONDITION, "disabled"};
	EXPECT_THROW(backend.Sign(digest, NO_SIGNING_DEADLINE), KeyNotFoundError);

	client->status = grpc::Status{grpc::StatusCode::UNAVAILABLE, "unavailable"};
	EXPECT_THROW(backend.Sign(digest, NO_SIGNING_DEADLINE), BackendUnavailableError);

	client->status = grpc::Status{grpc::StatusCode::DEADLINE_EXCEEDED, "timeout"};
	EXPECT_THROW(backend.Sign(digest, NO_SIGNING_DEADLINE), BackendUnavailableError);

	client->status = grpc::Status{grpc::StatusCode::NOT_FOUND, "not found"};
	EXPECT_THROW(GcpKmsBackend(client, gcp_key_name), KeyNotFoundError);
}

/**
 * Issue a certificate with a deadline and return the deadline the
 * cloud client was given.
 */
template<typename C>
static SigningDeadline
SignWithDeadline(std::shared_ptr<const SigningBackend> backend, const C &client,
		 SigningDeadline deadline)
{
	const SigningKey key{std::move(backend)};
	key.SignCertificate(MakeSubjectKey(), CertificateParameters{}, deadline);
	return client.last_deadline;
}

TEST(CloudBackends, Deadline)
{
	const auto deadline = std::chrono::system_clock::now() + std::chrono::minutes{5};

	auto aws = std::make_shared<FakeAwsKmsClient>("P-256", "ECC_NIST_P256");
	EXPECT_EQ(SignWithDeadline(std::make_shared<AwsKmsBackend>(aws, aws_config),
				   *aws, deadline),
		  deadline);

	auto azure = std::make_shared<FakeAzureKeyVaultClient>("P-384");
	EXPECT_EQ(SignWithDeadline(std::make_shared<AzureKeyVaultBackend>(azure, azure_config),
				   *azure, deadline),
		  deadline);

	auto gcp = std::make_shared<FakeGcpKmsClient>("P-256", "EC_SIGN_P256_SHA256");
	EXPECT_EQ(SignWithDeadline(std::make_shared<GcpKmsBackend>(gcp, gcp_key_name),
				   *gcp, deadline),
		  deadline);

	/* without a deadline, the client is told so */
	EXPECT_EQ(SignWithDeadline(std::make_shared<GcpKmsBackend>(gcp, gcp_key_name),
				   *gcp, NO_SIGNING_DEADLINE),
		  NO_SIGNING_DEADLINE);
}

TEST(CloudBackends, ExpiredDeadline)
{
	auto aws = std::make_shared<FakeAwsKmsClient>("P-256", "ECC_NIST_P256");
	const SigningKey key{std::make_shared<AwsKmsBackend>(aws, aws_config)};

	const auto expired = std::chrono::system_clock::now() - std::chrono::seconds{1};
	EXPECT_THROW(key.SignCertificate(MakeSubjectKey(), CertificateParameters{}, expired),
		     BackendUnavailableError);

	/* the cloud service was not contacted */
	EXPECT_EQ(aws->last_deadline, SigningDeadline{});
}

TEST(LocalKeyBackend, LoadFile)
{
	auto key = GenerateEcKey("P-384");
	const auto pem = EncodePrivateKeyPEM(*key);

	char path[] = "/tmp/leima-test-XXXXXX";
	const int fd = mkstemp(path);
	ASSERT_GE(fd, 0);
	close(fd);

	std::ofstream{path} << pem;

	const auto backend = LocalKeyBackend::LoadFile(path);
	unlink(path);

	EXPECT_EQ(backend->GetDigestAlgorithm(), DigestAlgorithm::SHA384);
	EXPECT_EQ(&backend->GetCurve(), &ec_curves[1]);
	CheckBackend(backend);
}

TEST(LocalKeyBackend, UnsupportedKey)
{
	EXPECT_THROW(LocalKeyBackend{GenerateEcKey("secp256k1")},
		     std::invalid_argument);
}
