/**
 * @file shutdown.hpp
 * @brief Signal-driven graceful shutdown for the merge server (POSIX).
 *
 * SIGINT/SIGTERM write one byte to a self-pipe (async-signal-safe); the main
 * thread blocked in WaitForShutdown() wakes and runs the registered steps in
 * LIFO order, so the last thing started is the first thing stopped:
 *
 *   register: monitors -> pool -> listener
 *   shutdown: listener -> pool (with timeout) -> monitors
 */

#ifndef PDFMERGE_SHUTDOWN_HPP_
#define PDFMERGE_SHUTDOWN_HPP_

#include "pdfmerge/log.hpp"
#include "pdfmerge/platform.hpp"
#include "pdfmerge/vocabulary.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <unistd.h>

namespace pdfmerge {

enum class ShutdownError : uint8_t {
  kStepsFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

inline const char* ToString(ShutdownError e) noexcept {
  switch (e) {
    case ShutdownError::kStepsFull: return "SHUTDOWN_STEPS_FULL";
    case ShutdownError::kPipeCreationFailed: return "PIPE_CREATION_FAILED";
    case ShutdownError::kSignalInstallFailed: return "SIGNAL_INSTALL_FAILED";
    case ShutdownError::kAlreadyInstantiated: return "ALREADY_INSTANTIATED";
  }
  return "SHUTDOWN_UNKNOWN";
}

/// Shutdown step. @p signo is 0 for a manual Quit().
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief One per process. A second instance is inert (IsValid() == false).
 *
 * @code
 *   pdfmerge::ShutdownManager mgr;
 *   mgr.Register("memory monitor", &StopMonitor, &governor);
 *   mgr.Register("listener", &StopServer, &server);
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();
 * @endcode
 */
class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxSteps = 16U;

  ShutdownManager() noexcept {
    if (detail::GetShutdownInstance() != nullptr) return;
    detail::GetShutdownInstance() = this;
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    valid_ = true;
  }

  ~ShutdownManager() {
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(const char* name, ShutdownFn fn, void* ctx) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || step_count_ >= kMaxSteps) {
      return expected<void, ShutdownError>::error(ShutdownError::kStepsFull);
    }
    steps_[step_count_] = Step{name, fn, ctx};
    ++step_count_;
    return expected<void, ShutdownError>::success();
  }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 || ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    // A client closing mid-response must not kill the server.
    struct sigaction ign;
    ign.sa_handler = SIG_IGN;
    ::sigemptyset(&ign.sa_mask);
    ign.sa_flags = 0;
    (void)::sigaction(SIGPIPE, &ign, nullptr);
    return expected<void, ShutdownError>::success();
  }

  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (shutdown_flag_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      if (pipe_fd_[1] >= 0) {
        const uint8_t byte = 1;
        (void)::write(pipe_fd_[1], &byte, 1);
      }
    }
  }

  /// Block until a signal or Quit(), then run the steps newest first.
  void WaitForShutdown() {
    if (pipe_fd_[0] >= 0 && !shutdown_flag_.load()) {
      uint8_t buf = 0;
      (void)::read(pipe_fd_[0], &buf, 1);
    }
    const int signo = signo_.load(std::memory_order_relaxed);
    PDFMERGE_LOG_INFO("Server", "shutdown requested (signal %d), %u step(s)", signo, step_count_);
    for (uint32_t i = step_count_; i > 0U; --i) {
      const Step& s = steps_[i - 1U];
      PDFMERGE_LOG_INFO("Server", "shutdown: %s", s.name);
      s.fn(signo, s.ctx);
    }
  }

  bool IsShutdownRequested() const noexcept { return shutdown_flag_.load(); }

 private:
  struct Step {
    const char* name;
    ShutdownFn fn;
    void* ctx;
  };

  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      self->shutdown_flag_.store(true);
      self->signo_.store(signo, std::memory_order_relaxed);
      if (self->pipe_fd_[1] >= 0) {
        const uint8_t byte = 1;
        (void)::write(self->pipe_fd_[1], &byte, 1);
      }
    }
  }

  Step steps_[kMaxSteps] = {};
  uint32_t step_count_{0U};
  std::atomic<bool> shutdown_flag_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2] = {-1, -1};
  bool valid_{false};
};

}  // namespace pdfmerge

#endif  // PDFMERGE_SHUTDOWN_HPP_
