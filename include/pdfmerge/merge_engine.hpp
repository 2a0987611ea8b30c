/**
 * @file merge_engine.hpp
 * @brief Staged merge orchestration over a DocumentModel and a WorkerPool.
 *
 * Stages (progress weights in progress.hpp):
 *
 *   initialization -> validation -> loading -> merging -> optimizing
 *                  -> finalizing -> complete
 *
 * - Validation runs for all inputs in parallel on the pool, results cached
 *   per request-scoped BufferId. A buffer passed twice is checked once.
 * - Loading parses every valid file in parallel on the pool (strict or
 *   lenient by size and validation outcome).
 * - Merging then walks the files in submission order: copy pages in
 *   fixed-size sub-batches that run concurrently under a shared counting
 *   semaphore, then append the sub-batches in scheduling order. A file whose
 *   load or any copy fails contributes no pages and becomes a
 *   "File N skipped" warning.
 * - Abort and deadline are checked at stage and sub-batch boundaries and
 *   while waiting on pool tasks. Memory is checked every N files.
 * - Optimization is best-effort; serialization failure fails the run.
 *
 * ProcessPdfs() blocks the calling thread and must not itself run on the
 * engine's WorkerPool. Tasks hold shared ownership of the documents they
 * touch, so a run that stops early never leaves a task with a dangling
 * reference to its output. Validation and load tasks point at the validator
 * and model, so those must outlive WorkerPool::WaitForWorkers().
 * The validation cache is cleared whenever the last concurrent run ends.
 */

#ifndef PDFMERGE_MERGE_ENGINE_HPP_
#define PDFMERGE_MERGE_ENGINE_HPP_

#include "pdfmerge/buffer_registry.hpp"
#include "pdfmerge/document_model.hpp"
#include "pdfmerge/log.hpp"
#include "pdfmerge/memory_governor.hpp"
#include "pdfmerge/platform.hpp"
#include "pdfmerge/progress.hpp"
#include "pdfmerge/semaphore.hpp"
#include "pdfmerge/validator.hpp"
#include "pdfmerge/vocabulary.hpp"
#include "pdfmerge/worker_pool.hpp"

#include <cinttypes>
#include <cstdint>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace pdfmerge {

// ============================================================================
// Types
// ============================================================================

enum class MergeError : uint8_t {
  kNoInput = 0,
  kAborted,
  kTimeout,
  kMemoryLimitExceeded,
  kQueueFull,
  kPoolShuttingDown,
  kWorkerCrashed,
  kAllFilesFailed,
  kSaveFailed,
  kInternal,
};

inline const char* ToString(MergeError e) noexcept {
  switch (e) {
    case MergeError::kNoInput: return "NO_INPUT";
    case MergeError::kAborted: return "ABORTED";
    case MergeError::kTimeout: return "PROCESSING_TIMEOUT";
    case MergeError::kMemoryLimitExceeded: return "MEMORY_LIMIT_EXCEEDED";
    case MergeError::kQueueFull: return "QUEUE_FULL";
    case MergeError::kPoolShuttingDown: return "POOL_SHUTTING_DOWN";
    case MergeError::kWorkerCrashed: return "WORKER_CRASHED";
    case MergeError::kAllFilesFailed: return "ALL_FILES_FAILED";
    case MergeError::kSaveFailed: return "SAVE_FAILED";
    case MergeError::kInternal: return "INTERNAL";
  }
  return "MERGE_UNKNOWN";
}

struct MergeFailure {
  MergeError code{MergeError::kInternal};
  std::string message;
};

struct MergeStats {
  uint32_t total_pages{0U};
  uint64_t total_size{0U};   ///< Sum of input sizes.
  uint64_t output_size{0U};
  uint64_t processing_ms{0U};
  double compression_ratio{0.0};  ///< output_size / total_size
  uint32_t files_merged{0U};
  uint32_t files_skipped{0U};
};

struct MergeOutput {
  ByteBuffer data;
  MergeStats stats;
  std::vector<std::string> warnings;
};

using MergeResult = expected<MergeOutput, MergeFailure>;

/// Per-run knobs. Engine-wide limits live in EngineConfig.
struct MergeOptions {
  bool optimize{true};
  OptimizeOptions optimize_options;
  bool use_object_streams{true};
  uint32_t max_processing_ms{180000U};  ///< 0 disables the deadline.
  int32_t priority{kPriorityNormal};
};

struct EngineConfig {
  uint32_t max_concurrent_operations{8U};
  uint32_t sub_batch_size{5U};
  uint32_t memory_check_interval_files{5U};
  uint64_t large_file_threshold_bytes{50ULL * kMiB};
  uint32_t yield_delay_ms{5U};
  uint32_t progress_log_interval_ms{100U};
};

/// Set from any thread; observed by one run at its next checkpoint.
class AbortSignal final {
 public:
  void Abort() noexcept { aborted_.store(true, std::memory_order_release); }
  bool IsAborted() const noexcept { return aborted_.load(std::memory_order_acquire); }
  void Reset() noexcept { aborted_.store(false, std::memory_order_release); }

 private:
  std::atomic<bool> aborted_{false};
};

using ProgressFn = void (*)(const ProgressSnapshot& snapshot, void* ctx);

struct EngineStats {
  uint64_t runs_started{0U};
  uint64_t runs_succeeded{0U};
  uint64_t runs_failed{0U};
  uint32_t active_runs{0U};
  uint64_t cleanups{0U};
};

// ============================================================================
// MergeEngine
// ============================================================================

class MergeEngine final {
 public:
  MergeEngine(DocumentModel& model, WorkerPool& pool, Validator& validator,
              BufferRegistry& registry, MemoryGovernor* governor = nullptr,
              const EngineConfig& cfg = EngineConfig{})
      : model_(model),
        pool_(pool),
        validator_(validator),
        registry_(registry),
        governor_(governor),
        cfg_(Sanitize(cfg)),
        limiter_(std::make_shared<LightSemaphore>(cfg_.max_concurrent_operations)) {
    if (governor_ != nullptr) {
      auto hook = governor_->AddReclaimHook("merge-engine", &MergeEngine::ReclaimHook, this);
      if (hook.has_value()) {
        reclaim_hook_ = hook.value();
      } else {
        PDFMERGE_LOG_WARN("Engine", "reclaim hook not registered: %s", ToString(hook.get_error()));
      }
    }
  }

  ~MergeEngine() {
    if (governor_ != nullptr && reclaim_hook_ != 0U) {
      governor_->RemoveReclaimHook(reclaim_hook_);
    }
  }

  MergeEngine(const MergeEngine&) = delete;
  MergeEngine& operator=(const MergeEngine&) = delete;
  MergeEngine(MergeEngine&&) = delete;
  MergeEngine& operator=(MergeEngine&&) = delete;

  /**
   * @brief Merge @p inputs in order.
   *
   * @param progress Invoked on the calling thread after every unit of work.
   * @param abort    Optional; checked at stage and batch boundaries.
   * @return Merged bytes with stats and per-file warnings, or the run-level
   *         failure. No partial output is ever returned.
   */
  MergeResult ProcessPdfs(const std::vector<SharedBytes>& inputs, const MergeOptions& options,
                          ProgressFn progress = nullptr, void* progress_ctx = nullptr,
                          const AbortSignal* abort = nullptr) {
    {
      std::lock_guard<std::mutex> lock(stats_mtx_);
      ++stats_.runs_started;
      ++stats_.active_runs;
    }

    Run run(cfg_, options, progress, progress_ctx, abort);
    MergeResult result = MergeResult::error(MergeFailure{});
    {
      RequestScope scope(registry_, validator_);
      result = Execute(inputs, options, scope, run);
    }

    bool last_run = false;
    {
      std::lock_guard<std::mutex> lock(stats_mtx_);
      --stats_.active_runs;
      last_run = stats_.active_runs == 0U;
      if (result.has_value()) {
        ++stats_.runs_succeeded;
      } else {
        ++stats_.runs_failed;
      }
    }
    if (last_run) Cleanup();
    if (!result.has_value()) {
      PDFMERGE_LOG_WARN("Engine", "merge failed after %" PRIu64 " ms: %s (%s)", run.ElapsedMs(),
                        ToString(result.get_error().code), result.get_error().message.c_str());
    }
    return result;
  }

  /**
   * @brief Drops every cached validation result. Runs when the last
   *        concurrent merge ends and when the memory governor reclaims.
   */
  void Cleanup() {
    const size_t dropped = validator_.Cache().Clear();
    {
      std::lock_guard<std::mutex> lock(stats_mtx_);
      ++stats_.cleanups;
    }
    if (dropped != 0U) {
      PDFMERGE_LOG_INFO("Engine", "cleanup dropped %zu cached validation result(s)", dropped);
    }
  }

  EngineStats GetStats() const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    return stats_;
  }

  const EngineConfig& Config() const noexcept { return cfg_; }

  /// Free copy-limiter permits right now.
  uint32_t AvailablePermits() const noexcept { return limiter_->Count(); }

 private:
  // --------------------------------------------------------------------------
  // Request scope: registers inputs, drops cache entries and ids at exit.
  // --------------------------------------------------------------------------
  class RequestScope final {
   public:
    RequestScope(BufferRegistry& registry, Validator& validator)
        : registry_(registry), validator_(validator) {}

    ~RequestScope() {
      for (const BufferId& id : ids_) {
        validator_.Drop(id);
        registry_.Release(id);
      }
    }

    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;

    /// The same buffer passed twice keeps its first id.
    BufferId Add(const SharedBytes& bytes) {
      for (const auto& seen : seen_) {
        if (seen.first == bytes.get()) return seen.second;
      }
      BufferId id = registry_.Register(bytes);
      ids_.push_back(id);
      seen_.emplace_back(bytes.get(), id);
      return id;
    }

   private:
    BufferRegistry& registry_;
    Validator& validator_;
    std::vector<BufferId> ids_;
    std::vector<std::pair<const ByteBuffer*, BufferId>> seen_;
  };

  /// Copy-limiter unit owned by a sub-batch task; returned when the task is
  /// destroyed, including when the pool drops it unrun.
  struct PermitHolder {
    explicit PermitHolder(std::shared_ptr<LightSemaphore> s)
        : sem(std::move(s)), permit(*sem, std::adopt_lock) {}
    std::shared_ptr<LightSemaphore> sem;
    SemaphorePermit permit;
  };

  // --------------------------------------------------------------------------
  // Per-run state: deadline, abort flag, progress and warnings.
  // --------------------------------------------------------------------------
  class Run final {
   public:
    Run(const EngineConfig& cfg, const MergeOptions& options, ProgressFn fn, void* ctx,
        const AbortSignal* abort)
        : fn_(fn),
          ctx_(ctx),
          abort_(abort),
          start_us_(SteadyNowUs()),
          deadline_us_(options.max_processing_ms == 0U
                           ? 0U
                           : start_us_ + static_cast<uint64_t>(options.max_processing_ms) * 1000U),
          log_interval_us_(static_cast<uint64_t>(cfg.progress_log_interval_ms) * 1000U) {}

    expected<void, MergeFailure> Checkpoint() const {
      if (abort_ != nullptr && abort_->IsAborted()) {
        return expected<void, MergeFailure>::error(
            MergeFailure{MergeError::kAborted, "Merge aborted"});
      }
      if (deadline_us_ != 0U && SteadyNowUs() > deadline_us_) {
        return expected<void, MergeFailure>::error(
            MergeFailure{MergeError::kTimeout, "Processing time limit exceeded"});
      }
      return expected<void, MergeFailure>::success();
    }

    void Report(Stage stage, double local, uint32_t file_index, uint32_t total_files) {
      const ProgressSnapshot snap = tracker_.Update(stage, local, file_index, total_files);
      const uint64_t now = SteadyNowUs();
      if (stage == Stage::kComplete || now - last_log_us_ >= log_interval_us_) {
        last_log_us_ = now;
        PDFMERGE_LOG_DEBUG("Progress", "%s %.1f%% (overall %.1f%%, file %u/%u, eta %" PRIu64 " ms)",
                           ToString(stage), snap.stage_progress, snap.overall_progress,
                           file_index, total_files, snap.eta_ms);
      }
      if (fn_ != nullptr) fn_(snap, ctx_);
    }

    void Warn(std::string msg) {
      const uint64_t now = SteadyNowUs();
      if (now - last_warn_log_us_ >= log_interval_us_) {
        last_warn_log_us_ = now;
        PDFMERGE_LOG_WARN("Engine", "%s", msg.c_str());
      }
      warnings_.push_back(std::move(msg));
    }

    ProgressTracker& Tracker() noexcept { return tracker_; }
    std::vector<std::string>& Warnings() noexcept { return warnings_; }
    uint64_t ElapsedMs() const noexcept { return (SteadyNowUs() - start_us_) / 1000U; }

   private:
    ProgressFn fn_;
    void* ctx_;
    const AbortSignal* abort_;
    uint64_t start_us_;
    uint64_t deadline_us_;
    uint64_t log_interval_us_;
    uint64_t last_log_us_{0U};
    uint64_t last_warn_log_us_{0U};
    ProgressTracker tracker_;
    std::vector<std::string> warnings_;
  };

  using LoadResult = expected<std::shared_ptr<Document>, DocumentFailure>;
  using CopyResult = expected<std::unique_ptr<CopiedPages>, DocumentFailure>;

  static constexpr uint32_t kPollIntervalMs = 20U;

  static EngineConfig Sanitize(EngineConfig cfg) noexcept {
    if (cfg.max_concurrent_operations == 0U) cfg.max_concurrent_operations = 1U;
    if (cfg.sub_batch_size == 0U) cfg.sub_batch_size = 1U;
    if (cfg.memory_check_interval_files == 0U) cfg.memory_check_interval_files = 1U;
    return cfg;
  }

  static void ReclaimHook(void* ctx) { static_cast<MergeEngine*>(ctx)->Cleanup(); }

  static MergeResult Fail(MergeError code, const std::string& msg) {
    return MergeResult::error(MergeFailure{code, msg});
  }

  template <typename Fn, typename R = std::invoke_result_t<std::decay_t<Fn>&>>
  expected<TaskFuture<R>, MergeFailure> SubmitTask(Fn&& fn, int32_t priority) {
    auto r = pool_.Submit(std::forward<Fn>(fn), priority);
    if (!r.has_value()) {
      const bool full = r.get_error() == PoolError::kQueueFull;
      return expected<TaskFuture<R>, MergeFailure>::error(
          MergeFailure{full ? MergeError::kQueueFull : MergeError::kPoolShuttingDown,
                       full ? "Worker pool queue is full" : "Worker pool is shutting down"});
    }
    return expected<TaskFuture<R>, MergeFailure>::success(std::move(r.value()));
  }

  /// Wait for a task while honoring abort and deadline.
  template <typename R>
  static expected<R, MergeFailure> Await(TaskFuture<R>& future, const Run& run) {
    while (future.wait_for(std::chrono::milliseconds(kPollIntervalMs)) !=
           std::future_status::ready) {
      auto cp = run.Checkpoint();
      if (!cp.has_value()) {
        return expected<R, MergeFailure>::error(std::move(cp.get_error()));
      }
    }
    expected<R, TaskError> r = future.get();
    if (!r.has_value()) {
      if (r.get_error() == TaskError::kShuttingDown) {
        return expected<R, MergeFailure>::error(
            MergeFailure{MergeError::kPoolShuttingDown, "Worker pool is shutting down"});
      }
      return expected<R, MergeFailure>::error(
          MergeFailure{MergeError::kWorkerCrashed, "worker crashed while processing"});
    }
    return expected<R, MergeFailure>::success(std::move(r.value()));
  }

  /// Block for a copy permit, polling abort and deadline.
  expected<void, MergeFailure> AcquirePermit(const Run& run) {
    while (!limiter_->WaitFor(static_cast<uint64_t>(kPollIntervalMs) * 1000U)) {
      auto cp = run.Checkpoint();
      if (!cp.has_value()) return cp;
    }
    return expected<void, MergeFailure>::success();
  }

  expected<void, MergeFailure> CheckMemory(uint32_t files_done) {
    if (governor_ == nullptr) return expected<void, MergeFailure>::success();
    const bool due = files_done % cfg_.memory_check_interval_files == 0U;
    if (!due && !governor_->IsOverLimit()) return expected<void, MergeFailure>::success();
    auto st = governor_->CheckAndReclaim();
    if (!st.has_value()) {
      return expected<void, MergeFailure>::error(
          MergeFailure{MergeError::kMemoryLimitExceeded, "Memory limit exceeded"});
    }
    return expected<void, MergeFailure>::success();
  }

  // --------------------------------------------------------------------------
  // Stage driver
  // --------------------------------------------------------------------------

  MergeResult Execute(const std::vector<SharedBytes>& inputs, const MergeOptions& options,
                      RequestScope& scope, Run& run) {
    const uint32_t n = static_cast<uint32_t>(inputs.size());
    if (n == 0U) return Fail(MergeError::kNoInput, "No files provided");

    // -- initialization ------------------------------------------------------
    run.Report(Stage::kInitialization, 0.0, 0U, n);
    uint64_t total_bytes = 0U;
    std::vector<BufferId> ids;
    ids.reserve(n);
    for (const SharedBytes& in : inputs) {
      total_bytes += in ? in->size() : 0U;
      ids.push_back(scope.Add(in));
    }
    run.Tracker().SetTotals(0U, total_bytes);
    run.Report(Stage::kInitialization, 100.0, 0U, n);
    PDFMERGE_LOG_INFO("Engine", "merging %u file(s), %" PRIu64 " bytes", n, total_bytes);

    auto cp = run.Checkpoint();
    if (!cp.has_value()) return MergeResult::error(std::move(cp.get_error()));

    // -- validation ----------------------------------------------------------
    std::vector<ValidationResult> checks;
    auto vr = ValidateAll(inputs, ids, options, run, &checks);
    if (!vr.has_value()) return MergeResult::error(std::move(vr.get_error()));

    uint32_t total_pages = 0U;
    for (uint32_t i = 0U; i < n; ++i) {
      if (checks[i].has_value()) {
        total_pages += checks[i].value().page_count;
      } else {
        run.Warn(SkipMessage(i, checks[i].get_error().message));
      }
    }
    run.Tracker().SetTotals(total_pages, total_bytes);

    cp = run.Checkpoint();
    if (!cp.has_value()) return MergeResult::error(std::move(cp.get_error()));

    // -- loading -------------------------------------------------------------
    std::vector<std::shared_ptr<Document>> docs;
    auto lr = LoadAll(inputs, checks, options, run, &docs);
    if (!lr.has_value()) return MergeResult::error(std::move(lr.get_error()));

    cp = run.Checkpoint();
    if (!cp.has_value()) return MergeResult::error(std::move(cp.get_error()));

    // -- merging -------------------------------------------------------------
    auto created = model_.CreateOutput();
    if (!created.has_value()) {
      return Fail(MergeError::kInternal, "Failed to create output document");
    }
    std::shared_ptr<OutputDocument> output(std::move(created.value()));

    uint32_t merged_files = 0U;
    run.Report(Stage::kMerging, 0.0, 0U, n);
    for (uint32_t i = 0U; i < n; ++i) {
      cp = run.Checkpoint();
      if (!cp.has_value()) return MergeResult::error(std::move(cp.get_error()));

      if (docs[i]) {
        const bool large = inputs[i]->size() > cfg_.large_file_threshold_bytes;
        auto fr = MergeFile(i, n, docs[i], large, options, output, run);
        docs[i].reset();
        if (!fr.has_value()) return MergeResult::error(std::move(fr.get_error()));
        if (fr.value()) ++merged_files;
      }
      run.Tracker().AddBytes(inputs[i] ? inputs[i]->size() : 0U);
      run.Report(Stage::kMerging, run.Tracker().PageFraction(), i + 1U, n);

      auto mem = CheckMemory(i + 1U);
      if (!mem.has_value()) return MergeResult::error(std::move(mem.get_error()));
    }

    if (merged_files == 0U || output->PageCount() == 0U) {
      return Fail(MergeError::kAllFilesFailed, "No valid PDF files to merge");
    }

    // -- optimizing ----------------------------------------------------------
    cp = run.Checkpoint();
    if (!cp.has_value()) return MergeResult::error(std::move(cp.get_error()));
    run.Report(Stage::kOptimizing, 0.0, n, n);
    if (options.optimize) {
      Optimize(output, options, run);
    }
    run.Report(Stage::kOptimizing, 100.0, n, n);

    // -- finalizing ----------------------------------------------------------
    cp = run.Checkpoint();
    if (!cp.has_value()) return MergeResult::error(std::move(cp.get_error()));
    run.Report(Stage::kFinalizing, 0.0, n, n);

    SaveOptions save_opts;
    save_opts.use_object_streams = options.use_object_streams;
    auto fut = SubmitTask([output, save_opts]() { return output->Save(save_opts); },
                          options.priority);
    if (!fut.has_value()) return MergeResult::error(std::move(fut.get_error()));
    auto saved = Await(fut.value(), run);
    if (!saved.has_value()) return MergeResult::error(std::move(saved.get_error()));
    if (!saved.value().has_value()) {
      return Fail(MergeError::kSaveFailed,
                  "Failed to save merged document: " + saved.value().get_error().message);
    }

    cp = run.Checkpoint();
    if (!cp.has_value()) return MergeResult::error(std::move(cp.get_error()));

    MergeOutput out;
    out.data = std::move(saved.value().value());
    out.stats.total_pages = output->PageCount();
    out.stats.total_size = total_bytes;
    out.stats.output_size = out.data.size();
    out.stats.processing_ms = run.ElapsedMs();
    out.stats.compression_ratio =
        total_bytes == 0U ? 0.0
                          : static_cast<double>(out.data.size()) / static_cast<double>(total_bytes);
    out.stats.files_merged = merged_files;
    out.stats.files_skipped = n - merged_files;
    out.warnings = std::move(run.Warnings());

    run.Report(Stage::kFinalizing, 100.0, n, n);
    run.Report(Stage::kComplete, 100.0, n, n);
    PDFMERGE_LOG_INFO("Engine",
                      "merged %u/%u file(s): %u pages, %" PRIu64 " -> %" PRIu64
                      " bytes (ratio %.2f) in %" PRIu64 " ms",
                      merged_files, n, out.stats.total_pages, total_bytes, out.stats.output_size,
                      out.stats.compression_ratio, out.stats.processing_ms);
    return MergeResult::success(std::move(out));
  }

  expected<void, MergeFailure> ValidateAll(const std::vector<SharedBytes>& inputs,
                                           const std::vector<BufferId>& ids,
                                           const MergeOptions& options, Run& run,
                                           std::vector<ValidationResult>* out) {
    const uint32_t n = static_cast<uint32_t>(inputs.size());
    run.Report(Stage::kValidation, 0.0, 0U, n);

    // A repeated buffer shares the first occurrence's id and its check.
    std::vector<uint32_t> first_of(n);
    for (uint32_t i = 0U; i < n; ++i) {
      first_of[i] = i;
      for (uint32_t j = 0U; j < i; ++j) {
        if (ids[j] == ids[i]) {
          first_of[i] = j;
          break;
        }
      }
    }

    std::vector<TaskFuture<ValidationResult>> futures(n);
    Validator* validator = &validator_;
    for (uint32_t i = 0U; i < n; ++i) {
      if (first_of[i] != i) continue;
      SharedBytes bytes = inputs[i];
      const BufferId id = ids[i];
      auto fut = SubmitTask([validator, id, bytes]() { return validator->Validate(id, bytes); },
                            options.priority);
      if (!fut.has_value()) return expected<void, MergeFailure>::error(std::move(fut.get_error()));
      futures[i] = std::move(fut.value());
    }

    out->clear();
    out->reserve(n);
    for (uint32_t i = 0U; i < n; ++i) {
      if (first_of[i] != i) {
        const ValidationResult repeated = (*out)[first_of[i]];
        out->push_back(repeated);
        run.Report(Stage::kValidation, 100.0 * (i + 1U) / n, i + 1U, n);
        continue;
      }
      auto r = Await(futures[i], run);
      if (!r.has_value()) {
        if (r.get_error().code != MergeError::kWorkerCrashed) {
          return expected<void, MergeFailure>::error(std::move(r.get_error()));
        }
        out->push_back(ValidationResult::error(
            ValidationFailure{ValidationError::kLoadFailed, r.get_error().message}));
      } else {
        out->push_back(std::move(r.value()));
      }
      run.Report(Stage::kValidation, 100.0 * (i + 1U) / n, i + 1U, n);
    }
    return expected<void, MergeFailure>::success();
  }

  /**
   * @brief Load every validated file, in parallel on the pool, in the parse
   *        mode its validation picked. Large files always load leniently.
   *
   * @param docs Filled with one entry per input; null where the file is
   *        skipped (warning recorded).
   */
  expected<void, MergeFailure> LoadAll(const std::vector<SharedBytes>& inputs,
                                       const std::vector<ValidationResult>& checks,
                                       const MergeOptions& options, Run& run,
                                       std::vector<std::shared_ptr<Document>>* docs) {
    const uint32_t n = static_cast<uint32_t>(inputs.size());
    run.Report(Stage::kLoading, 0.0, 0U, n);

    std::vector<TaskFuture<LoadResult>> futures(n);
    std::vector<ParseMode> modes(n, ParseMode::kStrict);
    DocumentModel* model = &model_;
    for (uint32_t i = 0U; i < n; ++i) {
      if (!checks[i].has_value()) continue;
      const bool large = inputs[i]->size() > cfg_.large_file_threshold_bytes;
      modes[i] = (large || checks[i].value().parse_mode == ParseMode::kLenient) ? ParseMode::kLenient
                                                                                 : ParseMode::kStrict;
      SharedBytes bytes = inputs[i];
      const ParseMode mode = modes[i];
      auto fut = SubmitTask([model, bytes, mode]() { return model->Load(bytes, mode); },
                            options.priority);
      if (!fut.has_value()) return expected<void, MergeFailure>::error(std::move(fut.get_error()));
      futures[i] = std::move(fut.value());
    }

    docs->assign(n, std::shared_ptr<Document>());
    for (uint32_t i = 0U; i < n; ++i) {
      if (checks[i].has_value()) {
        auto loaded = Await(futures[i], run);
        if (!loaded.has_value()) {
          if (loaded.get_error().code != MergeError::kWorkerCrashed) {
            return expected<void, MergeFailure>::error(std::move(loaded.get_error()));
          }
          run.Warn(SkipMessage(i, loaded.get_error().message));
        } else if (!loaded.value().has_value()) {
          run.Warn(SkipMessage(i, loaded.value().get_error().message));
        } else {
          (*docs)[i] = std::move(loaded.value().value());
          PDFMERGE_LOG_DEBUG("Engine", "file %u/%u loaded (%s)", i + 1U, n, ToString(modes[i]));
        }
      }
      run.Report(Stage::kLoading, 100.0 * (i + 1U) / n, i + 1U, n);
    }
    return expected<void, MergeFailure>::success();
  }

  /**
   * @brief Copy all pages of one loaded file.
   * @return true when pages were appended, false when the file was skipped
   *         (warning recorded).
   */
  expected<bool, MergeFailure> MergeFile(uint32_t index, uint32_t total_files,
                                         const std::shared_ptr<Document>& doc, bool large,
                                         const MergeOptions& options,
                                         const std::shared_ptr<OutputDocument>& output, Run& run) {
    const uint32_t pages = doc->PageCount();

    // Schedule every sub-batch, then collect in scheduling order.
    std::vector<TaskFuture<CopyResult>> batches;
    std::shared_ptr<LightSemaphore> limiter = limiter_;
    for (uint32_t first = 0U; first < pages; first += cfg_.sub_batch_size) {
      auto cp = run.Checkpoint();
      if (!cp.has_value()) return expected<bool, MergeFailure>::error(std::move(cp.get_error()));

      std::vector<uint32_t> indices;
      const uint32_t last = std::min(pages, first + cfg_.sub_batch_size);
      for (uint32_t p = first; p < last; ++p) indices.push_back(p);

      auto permit = AcquirePermit(run);
      if (!permit.has_value()) return expected<bool, MergeFailure>::error(std::move(permit.get_error()));
      auto held = std::make_shared<PermitHolder>(limiter);

      auto fut = SubmitTask(
          [held, output, doc, indices]() {
            CopyResult r = output->CopyPages(doc, indices);
            held->permit.Release();
            return r;
          },
          options.priority);
      held.reset();
      if (!fut.has_value()) return expected<bool, MergeFailure>::error(std::move(fut.get_error()));
      batches.push_back(std::move(fut.value()));

      if (large && cfg_.yield_delay_ms > 0U && last < pages) {
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.yield_delay_ms));
      }
    }

    std::vector<std::unique_ptr<CopiedPages>> copied;
    copied.reserve(batches.size());
    std::string failure;
    for (auto& fut : batches) {
      auto r = Await(fut, run);
      if (!r.has_value()) {
        if (r.get_error().code != MergeError::kWorkerCrashed) {
          return expected<bool, MergeFailure>::error(std::move(r.get_error()));
        }
        if (failure.empty()) failure = r.get_error().message;
        continue;
      }
      if (!r.value().has_value()) {
        if (failure.empty()) failure = r.value().get_error().message;
        continue;
      }
      copied.push_back(std::move(r.value().value()));
    }
    if (!failure.empty()) {
      run.Warn(SkipMessage(index, failure));
      return expected<bool, MergeFailure>::success(false);
    }

    for (auto& batch : copied) {
      const uint32_t count = batch->Count();
      auto appended = output->AppendPages(std::move(batch));
      if (!appended.has_value()) {
        // Earlier sub-batches of this file are already linked; the output
        // cannot be trusted any more.
        return expected<bool, MergeFailure>::error(
            MergeFailure{MergeError::kInternal, "Failed to append pages: " + appended.get_error().message});
      }
      run.Tracker().AddPages(count);
      run.Report(Stage::kMerging, run.Tracker().PageFraction(), index, total_files);
    }
    PDFMERGE_LOG_DEBUG("Engine", "file %u/%u: %u page(s) merged", index + 1U, total_files, pages);
    return expected<bool, MergeFailure>::success(true);
  }

  void Optimize(const std::shared_ptr<OutputDocument>& output, const MergeOptions& options,
                Run& run) {
    const OptimizeOptions opts = options.optimize_options;
    auto fut = SubmitTask([output, opts]() { return output->Optimize(opts); }, options.priority);
    if (!fut.has_value()) {
      PDFMERGE_LOG_WARN("Engine", "optimization skipped: %s", fut.get_error().message.c_str());
      return;
    }
    auto r = Await(fut.value(), run);
    if (!r.has_value()) {
      PDFMERGE_LOG_WARN("Engine", "optimization skipped: %s", r.get_error().message.c_str());
      return;
    }
    if (!r.value().has_value()) {
      PDFMERGE_LOG_WARN("Engine", "optimization failed, keeping unoptimized output: %s",
                        r.value().get_error().message.c_str());
    }
  }

  static std::string SkipMessage(uint32_t index, const std::string& reason) {
    return "File " + std::to_string(index + 1U) + " skipped: " + reason;
  }

  DocumentModel& model_;
  WorkerPool& pool_;
  Validator& validator_;
  BufferRegistry& registry_;
  MemoryGovernor* governor_;
  const EngineConfig cfg_;
  std::shared_ptr<LightSemaphore> limiter_;
  ReclaimHookId reclaim_hook_{0U};

  mutable std::mutex stats_mtx_;
  EngineStats stats_;
};

}  // namespace pdfmerge

#endif  // PDFMERGE_MERGE_ENGINE_HPP_
