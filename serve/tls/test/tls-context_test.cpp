#include "serve/tls-context.hpp"

#include <gtest/gtest.h>
#include <openssl/ssl.h>

#include <string>

#include "serve/temp-file.hpp"
#include "serve/test-tls-helper.hpp"

namespace serve {

TEST(TlsContextTest, LoadsValidCertificateAndKey) {
  test::ScopedTempDir dir;
  const auto files = test::WriteEphemeralCertKey(dir);

  TlsContext ctx(files.cert, files.key);
  ASSERT_NE(ctx.raw(), nullptr);
  EXPECT_NE(::SSL_CTX_get0_certificate(ctx.raw()), nullptr);
}

TEST(TlsContextTest, MissingCertificateThrows) {
  test::ScopedTempDir dir;
  const auto files = test::WriteEphemeralCertKey(dir);

  EXPECT_THROW(TlsContext(dir.dirPath() / "nope.crt", files.key), TlsLoadError);
}

TEST(TlsContextTest, MissingKeyThrows) {
  test::ScopedTempDir dir;
  const auto files = test::WriteEphemeralCertKey(dir);

  EXPECT_THROW(TlsContext(files.cert, dir.dirPath() / "nope.key"), TlsLoadError);
}

TEST(TlsContextTest, GarbagePemThrows) {
  test::ScopedTempDir dir;
  const auto files = test::WriteEphemeralCertKey(dir);
  const auto garbage = dir.writeFile("garbage.crt", "-----BEGIN CERTIFICATE-----\nnot base64\n");

  EXPECT_THROW(TlsContext(garbage, files.key), TlsLoadError);
}

TEST(TlsContextTest, MismatchedKeyThrowsWithReason) {
  test::ScopedTempDir dir;
  const auto first = test::WriteEphemeralCertKey(dir, "first");
  const auto second = test::WriteEphemeralCertKey(dir, "second");

  try {
    TlsContext ctx(first.cert, second.key);
    FAIL() << "expected TlsLoadError";
  } catch (const TlsLoadError& ex) {
    EXPECT_NE(std::string(ex.what()).find("does not match"), std::string::npos);
  }
}

TEST(TlsContextTest, IsMovable) {
  test::ScopedTempDir dir;
  const auto files = test::WriteEphemeralCertKey(dir);

  TlsContext ctx(files.cert, files.key);
  SSL_CTX* raw = ctx.raw();
  TlsContext moved(std::move(ctx));
  EXPECT_EQ(moved.raw(), raw);
}

}  // namespace serve
