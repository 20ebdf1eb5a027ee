#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include <httplib.h>

#include "metrics.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

using Millis = std::chrono::milliseconds;

struct UrlParts {
  std::string origin;  // scheme://host[:port]
  std::string path;    // starts with '/'
};

// Throws std::invalid_argument for anything that is not http(s)://host[...].
UrlParts split_url(const std::string& url);

struct PoolConfig {
  size_t max_connections{10};
  Millis max_idle{30'000};
  Millis max_lifetime{300'000};
  size_t max_pending_acquires{50};
  Millis evict_interval{60'000};
};

// Bounded set of keep-alive HTTP clients keyed by origin. Idle and over-age
// connections are closed by a background evictor thread.
class ConnectionPool {
public:
  struct Connection {
    std::string origin;
    std::unique_ptr<httplib::Client> client;
    TimePoint created;
    TimePoint last_used;
  };

  class Lease {
  public:
    Lease() = default;
    Lease(ConnectionPool* pool, std::unique_ptr<Connection> conn)
        : pool_(pool), conn_(std::move(conn)) {}
    Lease(Lease&& o) noexcept;
    Lease& operator=(Lease&& o) noexcept;
    ~Lease();

    explicit operator bool() const { return conn_ != nullptr; }
    httplib::Client& client() { return *conn_->client; }
    // The connection is closed instead of returned to the pool.
    void discard() { reusable_ = false; }

  private:
    void give_back();

    ConnectionPool* pool_{nullptr};
    std::unique_ptr<Connection> conn_;
    bool reusable_{true};
  };

  enum class AcquireStatus { Ok, Exhausted, TimedOut, ShutDown };

  struct Acquired {
    AcquireStatus status{AcquireStatus::ShutDown};
    Lease lease;
  };

  explicit ConnectionPool(PoolConfig cfg = {});
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  // Waits for a free slot until `deadline`. Fails fast with Exhausted when
  // max_pending_acquires callers are already waiting.
  Acquired acquire(const std::string& origin, TimePoint deadline);

  // Closes idle connections past max_idle or max_lifetime. Returns how many.
  size_t evict_expired();

  // Aborts every request currently running on a leased connection.
  void cancel_all();

  void shutdown();

  size_t idle_count() const;
  size_t leased_count() const;
  size_t waiting_count() const;
  const PoolConfig& config() const { return cfg_; }

private:
  void release(std::unique_ptr<Connection> conn, bool reusable);
  bool expired(const Connection& c, TimePoint now) const;
  std::unique_ptr<Connection> make_connection(const std::string& origin) const;
  void evictor_loop();

  PoolConfig cfg_;
  mutable std::mutex mu_;
  std::condition_variable slot_cv_;
  std::condition_variable evict_cv_;
  std::deque<std::unique_ptr<Connection>> idle_;
  std::unordered_set<httplib::Client*> in_use_;
  size_t waiting_{0};
  bool shutdown_{false};
  std::thread evictor_;
};

struct HttpResponse {
  enum class Failure { None, Transport, Timeout, PoolExhausted, Cancelled };

  int status{0};
  Bytes body;
  Failure failure{Failure::None};
  std::string error;

  bool success() const { return failure == Failure::None && status >= 200 && status < 300; }
};

// Seam between the fetch policy and the network.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse get(const std::string& url, Millis timeout) = 0;
  // Aborts requests in flight. Later requests are unaffected.
  virtual void cancel() {}
  virtual void shutdown() {}
};

// The timeout bounds the whole request, body included. cancel() is observed
// before the request is sent and between received chunks, so it also reaches
// requests that have no socket yet and redirect hops.
class PooledHttpTransport : public HttpTransport {
public:
  explicit PooledHttpTransport(PoolConfig cfg = {}) : pool_(cfg) {}

  HttpResponse get(const std::string& url, Millis timeout) override;
  void cancel() override;
  void shutdown() override { pool_.shutdown(); }

  ConnectionPool& pool() { return pool_; }

private:
  ConnectionPool pool_;
  std::atomic<uint64_t> cancel_epoch_{0};
};

enum class FetchStatus { Ok, HttpError, TransportError, Timeout, PoolExhausted, Cancelled };

const char* to_string(FetchStatus s);

struct FetchResult {
  FetchStatus status{FetchStatus::TransportError};
  RawImage image;
  int http_status{0};
  std::string error;
  std::string source_url;

  bool ok() const { return status == FetchStatus::Ok; }
};

struct FetcherConfig {
  std::string fallback_url;
  Millis timeout{10'000};  // whole fetch, primary plus fallback
};

// Primary-then-fallback download of one image. Never throws; every failure is
// reported through FetchResult.
//
// Each attempt runs on a fetch worker while the caller waits for the response,
// the deadline or cancel(), whichever comes first. An attempt abandoned at the
// deadline is cancelled on the transport and joined when the fetcher is destroyed.
class ImageFetcher {
public:
  ImageFetcher(FetcherConfig cfg, MetricsCollector& metrics,
               std::shared_ptr<HttpTransport> transport);
  ~ImageFetcher();

  FetchResult fetch(const std::string& primary_url);

  // Fails the fetch in progress and every later one with Cancelled.
  void cancel();
  void shutdown();

  const FetcherConfig& config() const { return cfg_; }

private:
  struct PendingAttempt {
    bool done{false};
    HttpResponse response;
  };

  HttpResponse attempt(const std::string& url, TimePoint deadline);
  HttpResponse await(const std::string& url, TimePoint deadline);

  FetcherConfig cfg_;
  MetricsCollector& metrics_;
  std::shared_ptr<HttpTransport> transport_;
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> shut_down_{false};

  std::mutex wait_mu_;
  std::condition_variable wait_cv_;
  // Declared last: joined before the members its tasks touch are destroyed.
  WorkerPool attempts_{2, "fetch"};
};
