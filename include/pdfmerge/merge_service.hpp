/**
 * @file merge_service.hpp
 * @brief Transport-independent request handling for the merge endpoint.
 *
 *   POST /merge    multipart/form-data, repeated "files" parts, optional
 *                  "lastModified" fields (one per file, in order) and an
 *                  optional "options" JSON field
 *   GET  /healthz  JSON: pool, memory, cache and request counters
 *
 * Upload limits are all checked before the engine is invoked. Failures are
 * returned as JSON {"error": message, "code": CODE}; internal details never
 * reach the client.
 */

#ifndef PDFMERGE_MERGE_SERVICE_HPP_
#define PDFMERGE_MERGE_SERVICE_HPP_

#include "pdfmerge/http.hpp"
#include "pdfmerge/log.hpp"
#include "pdfmerge/memory_governor.hpp"
#include "pdfmerge/merge_engine.hpp"
#include "pdfmerge/multipart.hpp"
#include "pdfmerge/platform.hpp"
#include "pdfmerge/result_cache.hpp"
#include "pdfmerge/service_config.hpp"
#include "pdfmerge/vocabulary.hpp"
#include "pdfmerge/worker_pool.hpp"

#include <nlohmann/json.hpp>

#include <cinttypes>
#include <cstdint>
#include <cstdlib>
#include <ctime>

#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace pdfmerge {

// ============================================================================
// Upload validation
// ============================================================================

enum class UploadError : uint8_t {
  kInvalidContentType = 0,
  kMalformedRequest,
  kTooFewFiles,
  kTooManyFiles,
  kInvalidFileType,
  kEmptyFile,
  kFileTooLarge,
  kTotalSizeExceeded,
  kInvalidOptions,
};

inline const char* ToString(UploadError e) noexcept {
  switch (e) {
    case UploadError::kInvalidContentType: return "INVALID_CONTENT_TYPE";
    case UploadError::kMalformedRequest: return "MALFORMED_REQUEST";
    case UploadError::kTooFewFiles: return "TOO_FEW_FILES";
    case UploadError::kTooManyFiles: return "TOO_MANY_FILES";
    case UploadError::kInvalidFileType: return "INVALID_FILE_TYPE";
    case UploadError::kEmptyFile: return "EMPTY_FILE";
    case UploadError::kFileTooLarge: return "FILE_TOO_LARGE";
    case UploadError::kTotalSizeExceeded: return "TOTAL_SIZE_EXCEEDED";
    case UploadError::kInvalidOptions: return "INVALID_OPTIONS";
  }
  return "UPLOAD_UNKNOWN";
}

inline int StatusFor(UploadError e) noexcept {
  switch (e) {
    case UploadError::kInvalidContentType: return 415;
    case UploadError::kFileTooLarge:
    case UploadError::kTotalSizeExceeded: return 413;
    default: return 400;
  }
}

inline int StatusFor(MergeError e) noexcept {
  switch (e) {
    case MergeError::kNoInput:
    case MergeError::kAllFilesFailed: return 400;
    case MergeError::kTimeout: return 408;
    case MergeError::kAborted:
    case MergeError::kMemoryLimitExceeded:
    case MergeError::kQueueFull:
    case MergeError::kPoolShuttingDown: return 503;
    default: return 500;
  }
}

struct UploadFailure {
  UploadError code{UploadError::kMalformedRequest};
  std::string message;
};

struct UploadedFile {
  std::string name;
  std::string content_type;
  SharedBytes data;
  uint64_t last_modified{0U};

  uint64_t Size() const noexcept { return data ? data->size() : 0U; }
};

struct MergeUpload {
  std::vector<UploadedFile> files;
  bool remove_annotations{false};
  optional<bool> use_object_streams;
  optional<bool> optimize;
};

namespace detail {

inline bool EndsWithPdf(const std::string& name) {
  const std::string lower = http::ToLower(name);
  return lower.size() >= 4U && lower.compare(lower.size() - 4U, 4U, ".pdf") == 0;
}

inline std::string MiBText(uint64_t bytes) { return std::to_string(bytes / kMiB) + "MB"; }

inline expected<void, UploadFailure> UploadFail(UploadError code, std::string msg) {
  return expected<void, UploadFailure>::error(UploadFailure{code, std::move(msg)});
}

}  // namespace detail

/**
 * @brief Count, type, emptiness and size checks, in that order.
 *
 * A file is accepted as PDF when it declares application/pdf, or declares no
 * type (or application/octet-stream) and has a ".pdf" name.
 */
inline expected<void, UploadFailure> ValidateUploadFiles(const std::vector<UploadedFile>& files,
                                                         const RequestLimits& limits) {
  using detail::UploadFail;
  if (files.size() < limits.min_files) {
    return UploadFail(UploadError::kTooFewFiles,
                      limits.min_files == 2U
                          ? std::string("At least two PDF files are required")
                          : "At least " + std::to_string(limits.min_files) + " PDF files are required");
  }
  if (files.size() > limits.max_files) {
    return UploadFail(UploadError::kTooManyFiles,
                      "Maximum " + std::to_string(limits.max_files) + " files allowed");
  }
  uint64_t total = 0U;
  for (const auto& f : files) {
    const bool declared_pdf = f.content_type == "application/pdf";
    const bool untyped = f.content_type.empty() || f.content_type == "application/octet-stream";
    if (!declared_pdf && !(untyped && detail::EndsWithPdf(f.name))) {
      return UploadFail(UploadError::kInvalidFileType, "File " + f.name + " is not a valid PDF");
    }
    if (f.Size() == 0U) {
      return UploadFail(UploadError::kEmptyFile, "File " + f.name + " is empty");
    }
    if (f.Size() > limits.max_file_size) {
      return UploadFail(UploadError::kFileTooLarge, "File " + f.name + " exceeds maximum size of " +
                                                        detail::MiBText(limits.max_file_size));
    }
    total += f.Size();
  }
  if (total > limits.max_total_size) {
    return UploadFail(UploadError::kTotalSizeExceeded,
                      "Total file size exceeds " + detail::MiBText(limits.max_total_size) + " limit");
  }
  return expected<void, UploadFailure>::success();
}

/// Split and check a POST /merge request.
inline expected<MergeUpload, UploadFailure> ParseUpload(const http::Request& req,
                                                        const RequestLimits& limits) {
  using R = expected<MergeUpload, UploadFailure>;
  const std::string* ct = req.FindHeader("content-type");
  auto boundary = ParseBoundary(ct != nullptr ? *ct : std::string());
  if (!boundary.has_value()) {
    if (boundary.get_error() == MultipartError::kNotMultipart) {
      return R::error(UploadFailure{UploadError::kInvalidContentType,
                                    "Content type must be multipart/form-data"});
    }
    return R::error(UploadFailure{UploadError::kMalformedRequest, "Missing multipart boundary"});
  }

  // Files plus one lastModified field each, plus options.
  const size_t max_parts = static_cast<size_t>(limits.max_files) * 2U + 8U;
  auto parts = ParseMultipart(req.body, boundary.value(), max_parts);
  if (!parts.has_value()) {
    if (parts.get_error() == MultipartError::kTooManyParts) {
      return R::error(UploadFailure{UploadError::kTooManyFiles,
                                    "Maximum " + std::to_string(limits.max_files) + " files allowed"});
    }
    return R::error(UploadFailure{UploadError::kMalformedRequest, "Malformed multipart body"});
  }

  MergeUpload up;
  std::vector<uint64_t> modified;
  for (auto& p : parts.value()) {
    if (p.name == "files") {
      up.files.push_back(UploadedFile{p.filename.empty() ? std::string("unnamed.pdf") : p.filename,
                                      p.content_type, p.data, 0U});
    } else if (p.name == "lastModified") {
      modified.push_back(std::strtoull(p.Text().c_str(), nullptr, 10));
    } else if (p.name == "options") {
      nlohmann::json j = nlohmann::json::parse(p.Text(), nullptr, false);
      if (j.is_discarded() || !j.is_object()) {
        return R::error(UploadFailure{UploadError::kInvalidOptions, "options must be a JSON object"});
      }
      auto flag = [&j](const char* key, bool* out) {
        auto it = j.find(key);
        if (it == j.end()) return true;
        if (!it->is_boolean()) return false;
        *out = it->get<bool>();
        return true;
      };
      bool remove = false;
      bool streams = true;
      bool optimize = true;
      if (!flag("removeAnnotations", &remove) || !flag("useObjectStreams", &streams) ||
          !flag("optimize", &optimize)) {
        return R::error(UploadFailure{UploadError::kInvalidOptions, "options values must be booleans"});
      }
      up.remove_annotations = remove;
      if (j.contains("useObjectStreams")) up.use_object_streams = optional<bool>(streams);
      if (j.contains("optimize")) up.optimize = optional<bool>(optimize);
    }
  }
  for (size_t i = 0; i < up.files.size() && i < modified.size(); ++i) {
    up.files[i].last_modified = modified[i];
  }

  auto valid = ValidateUploadFiles(up.files, limits);
  if (!valid.has_value()) return R::error(valid.get_error());
  return R::success(std::move(up));
}

// ============================================================================
// MergeService
// ============================================================================

struct ServiceCounters {
  uint64_t requests{0U};
  uint64_t errors{0U};
  uint64_t merges{0U};
  uint64_t cache_hits{0U};
  uint64_t total_response_ms{0U};

  double AverageResponseMs() const noexcept {
    return requests == 0U ? 0.0 : static_cast<double>(total_response_ms) / requests;
  }
};

class MergeService final {
 public:
  MergeService(MergeEngine& engine, WorkerPool& pool, const ServiceConfig& cfg,
               MemoryGovernor* governor = nullptr, ResultCache* cache = nullptr)
      : engine_(engine),
        pool_(pool),
        cfg_(cfg),
        governor_(governor),
        cache_(cache),
        started_ms_(SteadyNowMs()) {}

  MergeService(const MergeService&) = delete;
  MergeService& operator=(const MergeService&) = delete;

  /// Route one request. Never throws.
  http::Response Handle(const http::Request& req) {
    const uint64_t t0 = SteadyNowMs();
    http::Response resp;
    try {
      resp = Route(req);
    } catch (const std::exception& e) {
      PDFMERGE_LOG_ERROR("Http", "%s %s failed: %s", req.method.c_str(), req.path.c_str(), e.what());
      resp = ErrorResponse(500, "INTERNAL", "An unexpected error occurred");
    }
    const uint64_t dt = SteadyNowMs() - t0;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      ++counters_.requests;
      counters_.total_response_ms += dt;
      if (resp.status >= 400) ++counters_.errors;
    }
    PDFMERGE_LOG_INFO("Http", "%s %s -> %d (%" PRIu64 " ms)", req.method.c_str(), req.path.c_str(),
                      resp.status, dt);
    return resp;
  }

  /// Abort every merge currently running through this service.
  void AbortInFlight() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (AbortSignal* s : in_flight_) s->Abort();
    stopping_ = true;
  }

  ServiceCounters GetCounters() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return counters_;
  }

  const ServiceConfig& Config() const noexcept { return cfg_; }

  /// Merges currently registered for AbortInFlight().
  size_t InFlightCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return in_flight_.size();
  }

  static http::Response ErrorResponse(int status, const char* code, const std::string& message) {
    http::Response resp;
    resp.status = status;
    nlohmann::json j;
    j["error"] = message;
    j["code"] = code;
    resp.body = j.dump();
    resp.SetHeader("Content-Type", "application/json");
    return resp;
  }

  /// "merged-YYYY-MM-DD.pdf" (UTC).
  static std::string OutputFileName() {
    const std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "merged-%Y-%m-%d.pdf", &tm_utc);
    return buf;
  }

 private:
  http::Response Route(const http::Request& req) {
    if (req.path == "/merge") {
      if (req.method != "POST") {
        http::Response r = ErrorResponse(405, "METHOD_NOT_ALLOWED", "Method not allowed");
        r.SetHeader("Allow", "POST");
        return r;
      }
      return HandleMerge(req);
    }
    if (req.path == "/healthz") {
      if (req.method != "GET") {
        http::Response r = ErrorResponse(405, "METHOD_NOT_ALLOWED", "Method not allowed");
        r.SetHeader("Allow", "GET");
        return r;
      }
      return HandleHealth();
    }
    return ErrorResponse(404, "NOT_FOUND", "Not found");
  }

  http::Response HandleMerge(const http::Request& req) {
    auto upload = ParseUpload(req, cfg_.limits);
    if (!upload.has_value()) {
      const UploadFailure& f = upload.get_error();
      PDFMERGE_LOG_WARN("Http", "rejected upload: %s (%s)", ToString(f.code), f.message.c_str());
      return ErrorResponse(StatusFor(f.code), ToString(f.code), f.message);
    }
    MergeUpload& up = upload.value();

    MergeOptions opts;
    opts.optimize = up.optimize.value_or(cfg_.optimize_output);
    opts.optimize_options.remove_annotations = up.remove_annotations;
    opts.use_object_streams = up.use_object_streams.value_or(cfg_.use_object_streams);
    opts.max_processing_ms = cfg_.limits.max_processing_ms;

    std::string key;
    if (cache_ != nullptr && cache_->Enabled()) {
      std::vector<CacheKeyPart> parts;
      parts.reserve(up.files.size());
      std::string order;
      for (const auto& f : up.files) {
        parts.push_back(CacheKeyPart{f.name, f.Size(), f.last_modified, ContentDigest(f.data)});
        order += DigestHex(parts.back().digest).substr(0, 8);
      }
      key = BuildCacheKey(parts);
      // Page order follows upload order, so the same set reordered is a different result.
      key += "#" + order;
      key += "#a" + std::to_string(opts.optimize_options.remove_annotations ? 1 : 0) + "s" +
             std::to_string(opts.use_object_streams ? 1 : 0) + "o" + std::to_string(opts.optimize ? 1 : 0);
      auto hit = cache_->Find(key);
      if (hit.has_value()) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          ++counters_.cache_hits;
        }
        PDFMERGE_LOG_INFO("Cache", "returning cached result (%zu bytes)", hit.value().data->size());
        return PdfResponse(hit.value().data, hit.value().processing_ms, true,
                           hit.value().warning_count);
      }
    }

    std::vector<SharedBytes> inputs;
    inputs.reserve(up.files.size());
    for (const auto& f : up.files) inputs.push_back(f.data);

    AbortSignal abort;
    InFlightGuard tracked(*this, &abort);
    if (!tracked.Active()) {
      return ErrorResponse(503, ToString(MergeError::kPoolShuttingDown), "Service is shutting down");
    }
    MergeResult result = engine_.ProcessPdfs(inputs, opts, nullptr, nullptr, &abort);

    if (!result.has_value()) {
      const MergeFailure& f = result.get_error();
      const int status = StatusFor(f.code);
      const std::string msg = status == 500 ? std::string("Failed to merge PDF files") : f.message;
      return ErrorResponse(status, ToString(f.code), msg);
    }

    MergeOutput& out = result.value();
    SharedBytes bytes = std::make_shared<ByteBuffer>(std::move(out.data));
    const uint32_t warnings = static_cast<uint32_t>(out.warnings.size());
    {
      std::lock_guard<std::mutex> lock(mtx_);
      ++counters_.merges;
    }
    if (cache_ != nullptr && !key.empty()) {
      (void)cache_->Insert(key, CachedResult{bytes, out.stats.total_pages, out.stats.processing_ms,
                                             warnings});
    }
    http::Response resp = PdfResponse(bytes, out.stats.processing_ms, false, warnings);
    return resp;
  }

  http::Response HandleHealth() {
    nlohmann::json j;
    const PoolMetrics pm = pool_.GetMetrics();
    const ServiceCounters sc = GetCounters();
    const EngineStats es = engine_.GetStats();

    j["status"] = pool_.IsShuttingDown() ? "shutting_down" : "ok";
    j["uptime_ms"] = SteadyNowMs() - started_ms_;
    j["pool"] = {{"active_workers", pm.active_workers},
                 {"total_workers", pm.total_workers},
                 {"queue_length", pm.queue_length},
                 {"total_processed", pm.total_processed},
                 {"total_failed", pm.total_failed},
                 {"total_rejected", pm.total_rejected},
                 {"average_wait_ms", pm.average_wait_ms},
                 {"cpu_time_ms", pm.cpu_time_ms}};
    if (governor_ != nullptr) {
      const MemoryGovernorStats ms = governor_->GetStats();
      j["memory"] = {{"used_bytes", governor_->Sample()},
                     {"peak_bytes", ms.peak_used_bytes},
                     {"ceiling_bytes", governor_->Config().ceiling_bytes},
                     {"reclaims", ms.reclaims},
                     {"over_limit", governor_->IsOverLimit()}};
    }
    j["engine"] = {{"active_runs", es.active_runs},
                   {"runs_succeeded", es.runs_succeeded},
                   {"runs_failed", es.runs_failed}};
    if (cache_ != nullptr) {
      const ResultCacheStats cs = cache_->GetStats();
      j["cache"] = {{"entries", cs.entries}, {"bytes", cs.bytes}, {"hits", cs.hits},
                    {"misses", cs.misses}};
    }
    j["requests"] = {{"total", sc.requests},
                     {"errors", sc.errors},
                     {"merges", sc.merges},
                     {"cache_hits", sc.cache_hits},
                     {"average_response_ms", sc.AverageResponseMs()}};

    http::Response resp;
    resp.status = 200;
    resp.body = j.dump();
    resp.SetHeader("Content-Type", "application/json");
    resp.SetHeader("Cache-Control", "no-store");
    return resp;
  }

  static http::Response PdfResponse(const SharedBytes& bytes, uint64_t processing_ms, bool hit,
                                    uint32_t warnings) {
    http::Response resp;
    resp.status = 200;
    resp.bytes = bytes;
    resp.SetHeader("Content-Type", "application/pdf");
    resp.SetHeader("Content-Disposition", "attachment; filename=\"" + OutputFileName() + "\"");
    resp.SetHeader("Content-Length", std::to_string(bytes->size()));
    resp.SetHeader("Cache-Control", "private, max-age=300");
    resp.SetHeader("X-Processing-Time", std::to_string(processing_ms));
    resp.SetHeader("X-Cache", hit ? "HIT" : "MISS");
    resp.SetHeader("X-Merge-Warnings", std::to_string(warnings));
    return resp;
  }

  /// Registers a signal for AbortInFlight() for the guard's lifetime.
  class InFlightGuard final {
   public:
    InFlightGuard(MergeService& svc, AbortSignal* s) : svc_(svc), s_(s), active_(svc.Track(s)) {}
    ~InFlightGuard() {
      if (active_) svc_.Untrack(s_);
    }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

    bool Active() const noexcept { return active_; }

   private:
    MergeService& svc_;
    AbortSignal* s_;
    bool active_;
  };

  bool Track(AbortSignal* s) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return false;
    in_flight_.push_back(s);
    return true;
  }

  void Untrack(AbortSignal* s) {
    std::lock_guard<std::mutex> lock(mtx_);
    in_flight_.erase(std::remove(in_flight_.begin(), in_flight_.end(), s), in_flight_.end());
  }

  MergeEngine& engine_;
  WorkerPool& pool_;
  const ServiceConfig cfg_;
  MemoryGovernor* governor_;
  ResultCache* cache_;
  const uint64_t started_ms_;

  mutable std::mutex mtx_;
  ServiceCounters counters_;
  std::vector<AbortSignal*> in_flight_;
  bool stopping_{false};
};

}  // namespace pdfmerge

#endif  // PDFMERGE_MERGE_SERVICE_HPP_
