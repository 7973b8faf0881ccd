#include "serve/test-tls-helper.hpp"

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <cstddef>
#include <format>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "serve/temp-file.hpp"

namespace serve::test {

namespace {

using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;
using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&::EVP_PKEY_CTX_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&::X509_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;

std::string DrainBio(BIO* bio) {
  char* data = nullptr;
  const long len = BIO_get_mem_data(bio, &data);
  return {data, static_cast<std::size_t>(len)};
}

void AddNameEntry(X509_NAME* name, const char* field, const char* value) {
  X509_NAME_add_entry_by_txt(name, field, MBSTRING_ASC, reinterpret_cast<const unsigned char*>(value), -1, -1, 0);
}

}  // namespace

std::pair<std::string, std::string> MakeEphemeralCertKey(const char* commonName, int validSeconds) {
  PKeyCtxPtr kctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr), &::EVP_PKEY_CTX_free);
  EVP_PKEY* rawKey = nullptr;
  if (!kctx || EVP_PKEY_keygen_init(kctx.get()) != 1 || EVP_PKEY_CTX_set_rsa_keygen_bits(kctx.get(), 2048) != 1 ||
      EVP_PKEY_keygen(kctx.get(), &rawKey) != 1) {
    throw std::runtime_error("MakeEphemeralCertKey: RSA key generation failed");
  }
  PKeyPtr pkey(rawKey, &::EVP_PKEY_free);

  X509Ptr x509(X509_new(), &::X509_free);
  if (!x509) {
    throw std::runtime_error("MakeEphemeralCertKey: X509_new failed");
  }
  ASN1_INTEGER_set(X509_get_serialNumber(x509.get()), 1);
  X509_gmtime_adj(X509_getm_notBefore(x509.get()), 0);
  X509_gmtime_adj(X509_getm_notAfter(x509.get()), validSeconds);
  X509_set_pubkey(x509.get(), pkey.get());
  X509_NAME* name = X509_get_subject_name(x509.get());
  AddNameEntry(name, "C", "XX");
  AddNameEntry(name, "O", "ServeTest");
  AddNameEntry(name, "CN", commonName);
  X509_set_issuer_name(x509.get(), name);
  if (X509_sign(x509.get(), pkey.get(), EVP_sha256()) <= 0) {
    throw std::runtime_error("MakeEphemeralCertKey: X509_sign failed");
  }

  BioPtr certBio(BIO_new(BIO_s_mem()), &::BIO_free);
  BioPtr keyBio(BIO_new(BIO_s_mem()), &::BIO_free);
  if (!certBio || !keyBio || PEM_write_bio_X509(certBio.get(), x509.get()) != 1 ||
      PEM_write_bio_PrivateKey(keyBio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    throw std::runtime_error("MakeEphemeralCertKey: PEM serialization failed");
  }
  return {DrainBio(certBio.get()), DrainBio(keyBio.get())};
}

CertKeyFiles WriteEphemeralCertKey(const ScopedTempDir& dir, std::string_view name) {
  auto [certPem, keyPem] = MakeEphemeralCertKey();
  return {dir.writeFile(std::format("{}.crt", name), certPem), dir.writeFile(std::format("{}.key", name), keyPem)};
}

}  // namespace serve::test
