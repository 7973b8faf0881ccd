#include "serve/response-compressor.hpp"

#include <gtest/gtest.h>
#include <zlib.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "serve/compression-config.hpp"
#include "serve/encoding.hpp"
#include "serve/file.hpp"
#include "serve/http-constants.hpp"
#include "serve/http-request.hpp"
#include "serve/http-response.hpp"
#include "serve/http-status-code.hpp"
#include "serve/temp-file.hpp"

namespace serve {

namespace {

std::string MakeHtml() {
  std::string html = "<html><body><ul>\n";
  for (int idx = 0; idx < 400; ++idx) {
    html += "<li>item number " + std::to_string(idx) + " of a long static list</li>\n";
  }
  html += "</ul></body></html>\n";
  return html;
}

std::string Gunzip(std::string_view compressed) {
  z_stream stream{};
  EXPECT_EQ(inflateInit2(&stream, MAX_WBITS + 16), Z_OK);
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
  stream.avail_in = static_cast<uInt>(compressed.size());
  std::string out;
  char buf[4096];
  int ret = Z_OK;
  do {
    stream.next_out = reinterpret_cast<Bytef*>(buf);
    stream.avail_out = sizeof(buf);
    ret = inflate(&stream, Z_NO_FLUSH);
    out.append(buf, sizeof(buf) - stream.avail_out);
  } while (ret == Z_OK);
  EXPECT_EQ(ret, Z_STREAM_END);
  inflateEnd(&stream);
  return out;
}

}  // namespace

class ResponseCompressorTest : public ::testing::Test {
 protected:
  const HttpRequest& request(std::string_view extraHeaders) {
    _raw = "GET /index.html HTTP/1.1\r\nHost: localhost\r\n";
    _raw.append(extraHeaders);
    _raw.append("\r\n");
    EXPECT_EQ(_request.initTrySetHead(_raw, 8192), http::StatusCodeOK);
    return _request;
  }

  HttpResponse htmlFileResponse() {
    const auto path = tmp.writeFile("index.html", html);
    HttpResponse resp;
    resp.addHeader(http::ContentType, "text/html; charset=utf-8");
    resp.file(File(path.string()));
    return resp;
  }

  test::ScopedTempDir tmp;
  std::string html = MakeHtml();
  ResponseCompressor compressor{CompressionConfig{}};

 private:
  std::string _raw;
  HttpRequest _request;
};

TEST_F(ResponseCompressorTest, GzipFileBody) {
  auto resp = htmlFileResponse();
  compressor.apply(request("Accept-Encoding: gzip\r\n"), resp);
  EXPECT_EQ(resp.headerValue(http::ContentEncoding), "gzip");
  EXPECT_EQ(resp.headerValue(http::Vary), http::AcceptEncoding);
  EXPECT_FALSE(resp.hasFile());
  EXPECT_LT(resp.bodyLength(), html.size());
  EXPECT_EQ(Gunzip(resp.bodyView()), html);
}

TEST_F(ResponseCompressorTest, BrotliPreferredWhenAccepted) {
  auto resp = htmlFileResponse();
  compressor.apply(request("Accept-Encoding: gzip, br\r\n"), resp);
  const auto encoding = resp.headerValue(http::ContentEncoding);
  ASSERT_TRUE(encoding);
  // zstd ranks first when built in, but is not accepted here.
  EXPECT_EQ(*encoding, "br");
}

TEST_F(ResponseCompressorTest, NoAcceptEncodingKeepsIdentity) {
  auto resp = htmlFileResponse();
  compressor.apply(request(""), resp);
  EXPECT_FALSE(resp.headerValue(http::ContentEncoding));
  EXPECT_EQ(resp.headerValue(http::Vary), http::AcceptEncoding);
  EXPECT_TRUE(resp.hasFile());
  EXPECT_EQ(resp.bodyLength(), html.size());
}

TEST_F(ResponseCompressorTest, RangeRequestsAreNotCompressed) {
  auto resp = htmlFileResponse();
  const auto& req = request("Accept-Encoding: gzip\r\nRange: bytes=0-10\r\n");
  EXPECT_FALSE(compressor.isEligible(req, resp));
  compressor.apply(req, resp);
  EXPECT_FALSE(resp.headerValue(http::ContentEncoding));
  EXPECT_FALSE(resp.headerValue(http::Vary));
}

TEST_F(ResponseCompressorTest, SmallBodiesAreNotCompressed) {
  HttpResponse resp;
  resp.body("tiny", "text/html");
  EXPECT_FALSE(compressor.isEligible(request("Accept-Encoding: gzip\r\n"), resp));
}

TEST_F(ResponseCompressorTest, BinaryContentTypesAreNotCompressed) {
  const auto path = tmp.writeFile("photo.png", html);
  HttpResponse resp;
  resp.addHeader(http::ContentType, "image/png");
  resp.file(File(path.string()));
  EXPECT_FALSE(compressor.isEligible(request("Accept-Encoding: gzip\r\n"), resp));
}

TEST_F(ResponseCompressorTest, OnlyOkAndNotFoundAreCompressed) {
  auto resp = htmlFileResponse();
  EXPECT_TRUE(compressor.isEligible(request("Accept-Encoding: gzip\r\n"), resp));
  resp.status(http::StatusCodeNotFound);
  EXPECT_TRUE(compressor.isEligible(request("Accept-Encoding: gzip\r\n"), resp));
  resp.status(http::StatusCodePartialContent);
  EXPECT_FALSE(compressor.isEligible(request("Accept-Encoding: gzip\r\n"), resp));
}

TEST_F(ResponseCompressorTest, IncompressibleDataStaysIdentity) {
  std::string noise(4096, '\0');
  uint32_t state = 0x12345678;
  for (auto& ch : noise) {
    state = state * 1664525U + 1013904223U;
    ch = static_cast<char>(state >> 24);
  }
  HttpResponse resp;
  resp.body(noise, "text/plain");
  compressor.apply(request("Accept-Encoding: gzip\r\n"), resp);
  EXPECT_FALSE(resp.headerValue(http::ContentEncoding));
  EXPECT_EQ(resp.bodyView(), noise);
}

TEST_F(ResponseCompressorTest, IdentityRefusedWithoutAlternativeIsNotAcceptable) {
  auto resp = htmlFileResponse();
  compressor.apply(request("Accept-Encoding: identity;q=0, compress\r\n"), resp);
  EXPECT_EQ(resp.status(), http::StatusCodeNotAcceptable);
  EXPECT_FALSE(resp.hasFile());
}

TEST_F(ResponseCompressorTest, RejectsInvalidConfig) {
  CompressionConfig cfg;
  cfg.minBytes = 10;
  cfg.maxBytes = 5;
  EXPECT_THROW(ResponseCompressor{cfg}, std::invalid_argument);
}

}  // namespace serve
