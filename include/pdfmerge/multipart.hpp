/**
 * @file multipart.hpp
 * @brief multipart/form-data body splitting (RFC 7578 subset).
 *
 * Parts are returned in body order. File parts (those with a filename in
 * Content-Disposition) carry their bytes as SharedBytes so they can be handed
 * to the merge engine without another copy.
 */

#ifndef PDFMERGE_MULTIPART_HPP_
#define PDFMERGE_MULTIPART_HPP_

#include "pdfmerge/document_model.hpp"
#include "pdfmerge/http.hpp"
#include "pdfmerge/vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <string>
#include <vector>

namespace pdfmerge {

enum class MultipartError : uint8_t {
  kNotMultipart = 0,
  kMissingBoundary,
  kMalformed,
  kTooManyParts,
};

inline const char* ToString(MultipartError e) noexcept {
  switch (e) {
    case MultipartError::kNotMultipart: return "NOT_MULTIPART";
    case MultipartError::kMissingBoundary: return "MISSING_BOUNDARY";
    case MultipartError::kMalformed: return "MALFORMED_MULTIPART";
    case MultipartError::kTooManyParts: return "TOO_MANY_PARTS";
  }
  return "MULTIPART_UNKNOWN";
}

struct MultipartPart {
  std::string name;          ///< Form field name.
  std::string filename;      ///< Empty for plain fields.
  std::string content_type;  ///< Declared type, lower-cased.
  SharedBytes data;

  bool IsFile() const noexcept { return !filename.empty(); }
  std::string Text() const {
    return data ? std::string(data->begin(), data->end()) : std::string();
  }
};

/// Boundary parameter of a multipart/form-data Content-Type.
inline expected<std::string, MultipartError> ParseBoundary(const std::string& content_type) {
  const std::string lower = http::ToLower(content_type);
  if (lower.find("multipart/form-data") == std::string::npos) {
    return expected<std::string, MultipartError>::error(MultipartError::kNotMultipart);
  }
  const size_t p = lower.find("boundary=");
  if (p == std::string::npos) {
    return expected<std::string, MultipartError>::error(MultipartError::kMissingBoundary);
  }
  std::string b = content_type.substr(p + 9U);
  const size_t semi = b.find(';');
  if (semi != std::string::npos) b.resize(semi);
  b = http::Trim(b);
  if (b.size() >= 2U && b.front() == '"' && b.back() == '"') b = b.substr(1U, b.size() - 2U);
  if (b.empty() || b.size() > 70U) {
    return expected<std::string, MultipartError>::error(MultipartError::kMissingBoundary);
  }
  return expected<std::string, MultipartError>::success(b);
}

namespace detail {

/// Value of `key="..."` (or unquoted) inside a header value.
inline std::string HeaderParam(const std::string& value, const char* key) {
  const std::string lower = http::ToLower(value);
  const std::string needle = std::string(key) + "=";
  size_t p = 0;
  while ((p = lower.find(needle, p)) != std::string::npos) {
    // Skip matches inside a longer key ("name=" within "filename=").
    if (p == 0U || lower[p - 1U] == ' ' || lower[p - 1U] == ';') break;
    p += needle.size();
  }
  if (p == std::string::npos) return std::string();
  p += needle.size();
  if (p < value.size() && value[p] == '"') {
    const size_t end = value.find('"', p + 1U);
    if (end == std::string::npos) return std::string();
    return value.substr(p + 1U, end - p - 1U);
  }
  const size_t end = value.find(';', p);
  return http::Trim(value.substr(p, end == std::string::npos ? std::string::npos : end - p));
}

}  // namespace detail

/**
 * @brief Split @p body into parts.
 * @param max_parts Upper bound on parts accepted (0 = unbounded).
 */
inline expected<std::vector<MultipartPart>, MultipartError> ParseMultipart(
    const std::string& body, const std::string& boundary, size_t max_parts = 0U) {
  using R = expected<std::vector<MultipartPart>, MultipartError>;
  const std::string delim = "--" + boundary;
  std::vector<MultipartPart> parts;

  size_t pos = body.find(delim);
  if (pos == std::string::npos) return R::error(MultipartError::kMalformed);

  while (true) {
    pos += delim.size();
    if (body.compare(pos, 2, "--") == 0) break;  // closing delimiter
    if (body.compare(pos, 2, "\r\n") != 0) return R::error(MultipartError::kMalformed);
    pos += 2U;

    const size_t head_end = body.find("\r\n\r\n", pos);
    if (head_end == std::string::npos) return R::error(MultipartError::kMalformed);

    MultipartPart part;
    size_t line = pos;
    while (line < head_end) {
      size_t eol = body.find("\r\n", line);
      if (eol == std::string::npos || eol > head_end) eol = head_end;
      const std::string h = body.substr(line, eol - line);
      const size_t colon = h.find(':');
      if (colon != std::string::npos) {
        const std::string key = http::ToLower(http::Trim(h.substr(0, colon)));
        const std::string value = http::Trim(h.substr(colon + 1U));
        if (key == "content-disposition") {
          part.name = detail::HeaderParam(value, "name");
          part.filename = detail::HeaderParam(value, "filename");
        } else if (key == "content-type") {
          part.content_type = http::ToLower(value);
        }
      }
      line = eol + 2U;
    }

    const size_t data_begin = head_end + 4U;
    const size_t next = body.find("\r\n" + delim, data_begin);
    if (next == std::string::npos) return R::error(MultipartError::kMalformed);
    part.data = std::make_shared<ByteBuffer>(body.begin() + static_cast<std::ptrdiff_t>(data_begin),
                                             body.begin() + static_cast<std::ptrdiff_t>(next));
    parts.push_back(std::move(part));
    if (max_parts != 0U && parts.size() > max_parts) return R::error(MultipartError::kTooManyParts);
    pos = next + 2U;
  }
  return R::success(std::move(parts));
}

}  // namespace pdfmerge

#endif  // PDFMERGE_MULTIPART_HPP_
