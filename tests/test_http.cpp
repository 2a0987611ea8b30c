/**
 * @file test_http.cpp
 * @brief Catch2 tests for the HTTP request parser and response serializer.
 */

#include "pdfmerge/http.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using pdfmerge::http::ParseError;
using pdfmerge::http::RequestParser;

namespace {

RequestParser::State FeedAll(RequestParser& p, const std::string& s) { return p.Feed(s.data(), s.size()); }

}  // namespace

// ============================================================================
// RequestParser
// ============================================================================

TEST_CASE("http - GET without body completes at end of headers", "[http]") {
  RequestParser p(1024U, 1024U);
  auto st = FeedAll(p, "GET /healthz?verbose=1 HTTP/1.1\r\nHost: x\r\nX-Thing:  a b \r\n\r\n");
  REQUIRE(st == RequestParser::State::kComplete);
  auto& req = p.GetRequest();
  CHECK(req.method == "GET");
  CHECK(req.path == "/healthz");
  CHECK(req.query == "verbose=1");
  CHECK(req.version == "HTTP/1.1");
  REQUIRE(req.FindHeader("x-thing") != nullptr);
  CHECK(*req.FindHeader("x-thing") == "a b");
  CHECK(req.FindHeader("missing") == nullptr);
}

TEST_CASE("http - POST body arrives in pieces", "[http]") {
  RequestParser p(1024U, 1024U);
  CHECK(FeedAll(p, "POST /merge HTTP/1.1\r\nContent-") == RequestParser::State::kHeaders);
  CHECK(FeedAll(p, "Length: 10\r\n\r\n0123") == RequestParser::State::kBody);
  CHECK(p.ContentLength() == 10U);
  CHECK(FeedAll(p, "456789EXTRA") == RequestParser::State::kComplete);
  CHECK(p.GetRequest().body == "0123456789");
  // Further input is ignored once complete.
  CHECK(FeedAll(p, "more") == RequestParser::State::kComplete);
}

TEST_CASE("http - malformed request line", "[http]") {
  RequestParser p(1024U, 1024U);
  REQUIRE(FeedAll(p, "GARBAGE\r\n\r\n") == RequestParser::State::kError);
  CHECK(p.GetError() == ParseError::kBadRequest);

  RequestParser q(1024U, 1024U);
  REQUIRE(FeedAll(q, "GET / FTP/1.0\r\n\r\n") == RequestParser::State::kError);
  CHECK(q.GetError() == ParseError::kBadRequest);

  RequestParser r(1024U, 1024U);
  REQUIRE(FeedAll(r, "GET / HTTP/1.1\r\nnocolon\r\n\r\n") == RequestParser::State::kError);
}

TEST_CASE("http - header size bound", "[http]") {
  RequestParser p(32U, 1024U);
  REQUIRE(FeedAll(p, "GET / HTTP/1.1\r\nX-Long: " + std::string(64U, 'a')) ==
          RequestParser::State::kError);
  CHECK(p.GetError() == ParseError::kHeaderTooLarge);
  CHECK(pdfmerge::http::StatusFor(p.GetError()) == 431);
}

TEST_CASE("http - body size and length checks", "[http]") {
  RequestParser big(1024U, 100U);
  REQUIRE(FeedAll(big, "POST /merge HTTP/1.1\r\nContent-Length: 101\r\n\r\n") ==
          RequestParser::State::kError);
  CHECK(big.GetError() == ParseError::kPayloadTooLarge);
  CHECK(pdfmerge::http::StatusFor(big.GetError()) == 413);

  RequestParser no_len(1024U, 100U);
  REQUIRE(FeedAll(no_len, "POST /merge HTTP/1.1\r\n\r\n") == RequestParser::State::kError);
  CHECK(no_len.GetError() == ParseError::kLengthRequired);

  RequestParser bad_len(1024U, 100U);
  REQUIRE(FeedAll(bad_len, "POST /merge HTTP/1.1\r\nContent-Length: 12x\r\n\r\n") ==
          RequestParser::State::kError);
  CHECK(bad_len.GetError() == ParseError::kBadRequest);
}

TEST_CASE("http - chunked uploads are not implemented", "[http]") {
  RequestParser p(1024U, 1024U);
  REQUIRE(FeedAll(p, "POST /merge HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n") ==
          RequestParser::State::kError);
  CHECK(p.GetError() == ParseError::kNotImplemented);
  CHECK(pdfmerge::http::StatusFor(p.GetError()) == 501);
}

// ============================================================================
// Response
// ============================================================================

TEST_CASE("http - SerializeHead writes status, headers and length", "[http]") {
  pdfmerge::http::Response resp;
  resp.status = 415;
  resp.SetHeader("Content-Type", "application/json");
  resp.SetHeader("content-type", "text/plain");
  resp.SetHeader("Content-Length", "999");
  resp.body = "{}";

  REQUIRE(resp.FindHeader("CONTENT-TYPE") != nullptr);
  CHECK(*resp.FindHeader("CONTENT-TYPE") == "text/plain");

  const std::string head = pdfmerge::http::SerializeHead(resp);
  CHECK(head.find("HTTP/1.1 415 Unsupported Media Type\r\n") == 0U);
  CHECK(head.find("Content-Type: text/plain\r\n") != std::string::npos);
  CHECK(head.find("Content-Length: 2\r\n") != std::string::npos);
  CHECK(head.find("999") == std::string::npos);
  CHECK(head.find("Connection: close\r\n\r\n") != std::string::npos);
}

TEST_CASE("http - binary payload length comes from the shared bytes", "[http]") {
  pdfmerge::http::Response resp;
  resp.body = "ignored";
  resp.bytes = std::make_shared<pdfmerge::ByteBuffer>(1234U, 0x00);
  CHECK(resp.BodySize() == 1234U);
  CHECK(pdfmerge::http::SerializeHead(resp).find("Content-Length: 1234\r\n") != std::string::npos);
}
