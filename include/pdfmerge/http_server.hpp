/**
 * MIT License
 *
 * Copyright (c) 2024 pdfmerge contributors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file http_server.hpp
 * @brief sockpp TCP acceptor feeding MergeService.
 *
 * The accept thread only accepts; each connection is read, handled and
 * answered on a request-thread WorkerPool, so no parsing or merging ever runs
 * on the accepting thread. One request per connection (Connection: close).
 *
 * Only available when PDFMERGE_HAS_SOCKPP is defined.
 */

#ifndef PDFMERGE_HTTP_SERVER_HPP_
#define PDFMERGE_HTTP_SERVER_HPP_

#include "pdfmerge/platform.hpp"

#ifdef PDFMERGE_HAS_SOCKPP

#include "pdfmerge/http.hpp"
#include "pdfmerge/log.hpp"
#include "pdfmerge/merge_service.hpp"
#include "pdfmerge/service_config.hpp"
#include "pdfmerge/vocabulary.hpp"
#include "pdfmerge/worker_pool.hpp"

#include <sockpp/inet_address.h>
#include <sockpp/tcp_acceptor.h>
#include <sockpp/tcp_socket.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <utility>

namespace pdfmerge {

enum class NetError : uint8_t {
  kInvalidAddress = 0,
  kListenFailed,
  kAlreadyRunning,
};

inline const char* ToString(NetError e) noexcept {
  switch (e) {
    case NetError::kInvalidAddress: return "INVALID_ADDRESS";
    case NetError::kListenFailed: return "LISTEN_FAILED";
    case NetError::kAlreadyRunning: return "ALREADY_RUNNING";
  }
  return "NET_UNKNOWN";
}

struct HttpServerStats {
  uint64_t accepted{0U};
  uint64_t rejected{0U};    ///< Request pool full or shutting down.
  uint64_t read_errors{0U};
};

class HttpServer final {
 public:
  HttpServer(MergeService& service, const ServerConfig& cfg)
      : service_(service), cfg_(cfg), requests_(MakePoolConfig(cfg)) {}

  ~HttpServer() { Stop(); }

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /**
   * @brief Bind host:port and start the accept thread.
   * @param host Interface address to bind.
   */
  expected<void, NetError> Start(const char* host = "0.0.0.0") {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, NetError>::error(NetError::kAlreadyRunning);
    }
    auto addr = sockpp::inet_address::create(host, cfg_.port);
    if (!addr) {
      return expected<void, NetError>::error(NetError::kInvalidAddress);
    }
    auto res = acc_.open(addr.value(), cfg_.backlog);
    if (!res) {
      PDFMERGE_LOG_ERROR("Server", "listen on %s:%u failed: %s", host, cfg_.port,
                         res.error_message().c_str());
      return expected<void, NetError>::error(NetError::kListenFailed);
    }
    requests_.Start();
    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread(&HttpServer::AcceptLoop, this);
    PDFMERGE_LOG_INFO("Server", "listening on %s:%u (%u request threads)", host, Port(),
                      cfg_.request_threads);
    return expected<void, NetError>::success();
  }

  /// Stop accepting, then drain in-flight requests. Idempotent.
  void Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    (void)acc_.shutdown();
    if (accept_thread_.joinable()) accept_thread_.join();
    acc_.close();
    const PoolShutdownReport r = requests_.Shutdown();
    PDFMERGE_LOG_INFO("Server", "stopped (rejected %u queued connection(s), %u abandoned)",
                      r.rejected_tasks, r.abandoned_workers);
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  uint16_t Port() const { return acc_.address().port(); }

  HttpServerStats GetStats() const {
    HttpServerStats s;
    s.accepted = accepted_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    s.read_errors = read_errors_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  static PoolConfig MakePoolConfig(const ServerConfig& cfg) {
    PoolConfig pc;
    pc.name.assign(TruncateToCapacity, "http");
    pc.size = cfg.request_threads;
    pc.min_workers = cfg.request_threads;
    pc.prewarm_workers = cfg.request_threads;
    pc.max_queue_size = cfg.backlog > 0 ? static_cast<uint32_t>(cfg.backlog) : 16U;
    pc.metrics_interval_ms = 0U;
    pc.shutdown_timeout_ms = cfg.read_timeout_ms;
    return pc;
  }

  void AcceptLoop() {
    while (running_.load(std::memory_order_acquire)) {
      auto res = acc_.accept();
      if (!res) {
        if (!running_.load(std::memory_order_acquire)) break;
        PDFMERGE_LOG_WARN("Server", "accept failed: %s", res.error_message().c_str());
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      accepted_.fetch_add(1U, std::memory_order_relaxed);
      sockpp::tcp_socket sock = res.release();
      auto sub = requests_.Submit(
          [this, s = std::move(sock)]() mutable { Serve(std::move(s)); }, kPriorityNormal);
      if (!sub.has_value()) {
        rejected_.fetch_add(1U, std::memory_order_relaxed);
        PDFMERGE_LOG_WARN("Server", "connection dropped: %s", ToString(sub.get_error()));
      }
    }
  }

  void Serve(sockpp::tcp_socket sock) {
    (void)sock.read_timeout(std::chrono::milliseconds(cfg_.read_timeout_ms));
    http::RequestParser parser(cfg_.max_header_bytes, cfg_.max_request_bytes);
    char buf[64 * 1024];
    while (parser.GetState() != http::RequestParser::State::kComplete &&
           parser.GetState() != http::RequestParser::State::kError) {
      auto n = sock.read(buf, sizeof(buf));
      if (!n || n.value() == 0U) {
        read_errors_.fetch_add(1U, std::memory_order_relaxed);
        PDFMERGE_LOG_DEBUG("Server", "connection closed before a full request was read");
        return;
      }
      (void)parser.Feed(buf, n.value());
    }

    http::Response resp;
    if (parser.GetState() == http::RequestParser::State::kError) {
      const http::ParseError e = parser.GetError();
      resp = MergeService::ErrorResponse(http::StatusFor(e), http::ToString(e),
                                         http::ReasonPhrase(http::StatusFor(e)));
    } else {
      resp = service_.Handle(parser.GetRequest());
    }

    const std::string head = http::SerializeHead(resp);
    if (!WriteAll(sock, head.data(), head.size())) return;
    if (resp.bytes) {
      (void)WriteAll(sock, resp.bytes->data(), resp.bytes->size());
    } else {
      (void)WriteAll(sock, resp.body.data(), resp.body.size());
    }
    (void)sock.shutdown(SHUT_WR);
  }

  static bool WriteAll(sockpp::tcp_socket& sock, const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    while (len > 0U) {
      auto n = sock.write(p, len);
      if (!n || n.value() == 0U) {
        PDFMERGE_LOG_DEBUG("Server", "write failed, client went away");
        return false;
      }
      p += n.value();
      len -= n.value();
    }
    return true;
  }

  MergeService& service_;
  const ServerConfig cfg_;
  sockpp::tcp_acceptor acc_;
  WorkerPool requests_;
  std::thread accept_thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> accepted_{0U};
  std::atomic<uint64_t> rejected_{0U};
  std::atomic<uint64_t> read_errors_{0U};
};

}  // namespace pdfmerge

#endif  // PDFMERGE_HAS_SOCKPP

#endif  // PDFMERGE_HTTP_SERVER_HPP_
