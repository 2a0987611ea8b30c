/**
 * @file http.hpp
 * @brief Minimal HTTP/1.1 request parser and response serializer.
 *
 * Scope is what the merge endpoint needs: one request per connection,
 * Content-Length bodies only (no chunked uploads), case-insensitive header
 * lookup. The parser is incremental so the server can bound header and body
 * sizes before buffering them.
 */

#ifndef PDFMERGE_HTTP_HPP_
#define PDFMERGE_HTTP_HPP_

#include "pdfmerge/document_model.hpp"
#include "pdfmerge/vocabulary.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>

#include <string>
#include <utility>
#include <vector>

namespace pdfmerge {
namespace http {

enum class ParseError : uint8_t {
  kBadRequest = 0,
  kHeaderTooLarge,
  kPayloadTooLarge,
  kLengthRequired,
  kNotImplemented,
};

inline const char* ToString(ParseError e) noexcept {
  switch (e) {
    case ParseError::kBadRequest: return "BAD_REQUEST";
    case ParseError::kHeaderTooLarge: return "HEADER_TOO_LARGE";
    case ParseError::kPayloadTooLarge: return "PAYLOAD_TOO_LARGE";
    case ParseError::kLengthRequired: return "LENGTH_REQUIRED";
    case ParseError::kNotImplemented: return "NOT_IMPLEMENTED";
  }
  return "HTTP_UNKNOWN";
}

using Header = std::pair<std::string, std::string>;

inline std::string ToLower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

inline std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
  return s.substr(b, e - b);
}

struct Request {
  std::string method;
  std::string path;
  std::string query;
  std::string version;
  std::vector<Header> headers;  ///< Names lower-cased.
  std::string body;

  /// First header named @p name (lower case), or nullptr.
  const std::string* FindHeader(const char* name) const {
    for (const auto& h : headers) {
      if (h.first == name) return &h.second;
    }
    return nullptr;
  }
};

struct Response {
  int status{200};
  std::vector<Header> headers;
  std::string body;         ///< Used when bytes is null.
  SharedBytes bytes;        ///< Binary payload, shared with the result cache.

  void SetHeader(const std::string& name, const std::string& value) {
    for (auto& h : headers) {
      if (ToLower(h.first) == ToLower(name)) {
        h.second = value;
        return;
      }
    }
    headers.emplace_back(name, value);
  }

  const std::string* FindHeader(const std::string& name) const {
    for (const auto& h : headers) {
      if (ToLower(h.first) == ToLower(name)) return &h.second;
    }
    return nullptr;
  }

  size_t BodySize() const noexcept { return bytes ? bytes->size() : body.size(); }
};

inline const char* ReasonPhrase(int status) noexcept {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 411: return "Length Required";
    case 413: return "Payload Too Large";
    case 415: return "Unsupported Media Type";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 503: return "Service Unavailable";
    default: return "Unknown";
  }
}

inline int StatusFor(ParseError e) noexcept {
  switch (e) {
    case ParseError::kBadRequest: return 400;
    case ParseError::kHeaderTooLarge: return 431;
    case ParseError::kPayloadTooLarge: return 413;
    case ParseError::kLengthRequired: return 411;
    case ParseError::kNotImplemented: return 501;
  }
  return 400;
}

/// Status line and headers, with Content-Length and Connection: close added.
inline std::string SerializeHead(const Response& resp) {
  std::string out = "HTTP/1.1 " + std::to_string(resp.status) + " " + ReasonPhrase(resp.status) + "\r\n";
  for (const auto& h : resp.headers) {
    if (ToLower(h.first) == "content-length") continue;
    out += h.first + ": " + h.second + "\r\n";
  }
  out += "Content-Length: " + std::to_string(resp.BodySize()) + "\r\n";
  out += "Connection: close\r\n\r\n";
  return out;
}

// ============================================================================
// RequestParser
// ============================================================================

class RequestParser final {
 public:
  enum class State : uint8_t { kHeaders = 0, kBody, kComplete, kError };

  RequestParser(size_t max_header_bytes, size_t max_body_bytes) noexcept
      : max_header_bytes_(max_header_bytes), max_body_bytes_(max_body_bytes) {}

  /**
   * @brief Consume bytes from the connection.
   * @return Current state; on kError, GetError() tells why.
   */
  State Feed(const char* data, size_t len) {
    if (state_ == State::kComplete || state_ == State::kError) return state_;
    if (state_ == State::kHeaders) {
      head_.append(data, len);
      const size_t end = head_.find("\r\n\r\n");
      if (end == std::string::npos) {
        if (head_.size() > max_header_bytes_) return SetError(ParseError::kHeaderTooLarge);
        return state_;
      }
      if (end > max_header_bytes_) return SetError(ParseError::kHeaderTooLarge);
      std::string rest = head_.substr(end + 4U);
      head_.resize(end);
      if (!ParseHead()) return state_;
      state_ = State::kBody;
      if (content_length_ == 0U) {
        state_ = State::kComplete;
        return state_;
      }
      req_.body.reserve(content_length_);
      return AppendBody(rest.data(), rest.size());
    }
    return AppendBody(data, len);
  }

  State GetState() const noexcept { return state_; }
  ParseError GetError() const noexcept { return error_; }
  Request& GetRequest() noexcept { return req_; }
  size_t ContentLength() const noexcept { return content_length_; }

 private:
  State SetError(ParseError e) {
    error_ = e;
    state_ = State::kError;
    return state_;
  }

  State AppendBody(const char* data, size_t len) {
    const size_t want = content_length_ - req_.body.size();
    req_.body.append(data, len < want ? len : want);
    if (req_.body.size() == content_length_) state_ = State::kComplete;
    return state_;
  }

  bool ParseHead() {
    size_t pos = head_.find("\r\n");
    const std::string line = head_.substr(0, pos);
    const size_t sp1 = line.find(' ');
    const size_t sp2 = line.rfind(' ');
    if (sp1 == std::string::npos || sp2 == sp1) {
      SetError(ParseError::kBadRequest);
      return false;
    }
    req_.method = line.substr(0, sp1);
    const std::string target = line.substr(sp1 + 1U, sp2 - sp1 - 1U);
    req_.version = line.substr(sp2 + 1U);
    if (req_.version.compare(0, 5, "HTTP/") != 0 || target.empty()) {
      SetError(ParseError::kBadRequest);
      return false;
    }
    const size_t q = target.find('?');
    req_.path = target.substr(0, q);
    if (q != std::string::npos) req_.query = target.substr(q + 1U);

    while (pos != std::string::npos) {
      const size_t start = pos + 2U;
      pos = head_.find("\r\n", start);
      const std::string h = head_.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
      if (h.empty()) continue;
      const size_t colon = h.find(':');
      if (colon == std::string::npos || colon == 0U) {
        SetError(ParseError::kBadRequest);
        return false;
      }
      req_.headers.emplace_back(ToLower(Trim(h.substr(0, colon))), Trim(h.substr(colon + 1U)));
    }

    if (const std::string* te = req_.FindHeader("transfer-encoding")) {
      if (ToLower(*te) != "identity") {
        SetError(ParseError::kNotImplemented);
        return false;
      }
    }
    const std::string* cl = req_.FindHeader("content-length");
    if (cl == nullptr) {
      if (req_.method == "POST" || req_.method == "PUT") {
        SetError(ParseError::kLengthRequired);
        return false;
      }
      content_length_ = 0U;
      return true;
    }
    char* end = nullptr;
    const unsigned long long v = std::strtoull(cl->c_str(), &end, 10);
    if (cl->empty() || end == nullptr || *end != '\0') {
      SetError(ParseError::kBadRequest);
      return false;
    }
    if (v > max_body_bytes_) {
      SetError(ParseError::kPayloadTooLarge);
      return false;
    }
    content_length_ = static_cast<size_t>(v);
    return true;
  }

  size_t max_header_bytes_;
  size_t max_body_bytes_;
  State state_{State::kHeaders};
  ParseError error_{ParseError::kBadRequest};
  std::string head_;
  size_t content_length_{0U};
  Request req_;
};

}  // namespace http
}  // namespace pdfmerge

#endif  // PDFMERGE_HTTP_HPP_
