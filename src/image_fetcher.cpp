#include "image_fetcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace std::chrono;

UrlParts split_url(const std::string& url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    throw std::invalid_argument("URL without scheme: " + url);
  }
  const std::string scheme = url.substr(0, scheme_end);
  if (scheme != "http" && scheme != "https") {
    throw std::invalid_argument("Unsupported URL scheme '" + scheme + "' in " + url);
  }
  const auto host_begin = scheme_end + 3;
  const auto path_begin = url.find('/', host_begin);
  UrlParts parts;
  parts.origin = url.substr(0, path_begin);
  parts.path = path_begin == std::string::npos ? "/" : url.substr(path_begin);
  if (parts.origin.size() <= host_begin) {
    throw std::invalid_argument("URL without host: " + url);
  }
  return parts;
}

// ---------------------------------------------------------------------------
// ConnectionPool

ConnectionPool::Lease::Lease(Lease&& o) noexcept
    : pool_(o.pool_), conn_(std::move(o.conn_)), reusable_(o.reusable_) {
  o.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& o) noexcept {
  if (this != &o) {
    give_back();
    pool_ = o.pool_;
    conn_ = std::move(o.conn_);
    reusable_ = o.reusable_;
    o.pool_ = nullptr;
  }
  return *this;
}

ConnectionPool::Lease::~Lease() { give_back(); }

void ConnectionPool::Lease::give_back() {
  if (pool_ && conn_) pool_->release(std::move(conn_), reusable_);
  pool_ = nullptr;
}

ConnectionPool::ConnectionPool(PoolConfig cfg) : cfg_(cfg) {
  if (cfg_.max_connections == 0) {
    throw std::invalid_argument("ConnectionPool needs at least one connection");
  }
  evictor_ = std::thread([this] { evictor_loop(); });
}

ConnectionPool::~ConnectionPool() { shutdown(); }

bool ConnectionPool::expired(const Connection& c, TimePoint now) const {
  return now - c.last_used >= cfg_.max_idle || now - c.created >= cfg_.max_lifetime;
}

std::unique_ptr<ConnectionPool::Connection> ConnectionPool::make_connection(
    const std::string& origin) const {
  auto conn = std::make_unique<Connection>();
  conn->origin = origin;
  conn->client = std::make_unique<httplib::Client>(origin);
  conn->client->set_keep_alive(true);
  conn->client->set_follow_location(true);
  conn->created = Clock::now();
  conn->last_used = conn->created;
  return conn;
}

ConnectionPool::Acquired ConnectionPool::acquire(const std::string& origin, TimePoint deadline) {
  Acquired out;
  std::unique_ptr<Connection> stale;
  std::unique_lock<std::mutex> lk(mu_);

  bool waited = false;
  for (;;) {
    if (shutdown_) {
      out.status = AcquireStatus::ShutDown;
      return out;
    }

    const auto now = Clock::now();
    auto same = std::find_if(idle_.begin(), idle_.end(), [&](const auto& c) {
      return c->origin == origin && !expired(*c, now);
    });
    if (same != idle_.end()) {
      auto conn = std::move(*same);
      idle_.erase(same);
      in_use_.insert(conn->client.get());
      out.status = AcquireStatus::Ok;
      out.lease = Lease(this, std::move(conn));
      return out;
    }

    const size_t total = idle_.size() + in_use_.size();
    if (total < cfg_.max_connections || !idle_.empty()) {
      if (total >= cfg_.max_connections) {
        // Recycle the least recently returned idle slot for this origin.
        stale = std::move(idle_.front());
        idle_.pop_front();
      }
      auto conn = make_connection(origin);
      in_use_.insert(conn->client.get());
      out.status = AcquireStatus::Ok;
      out.lease = Lease(this, std::move(conn));
      lk.unlock();
      return out;
    }

    if (!waited && waiting_ >= cfg_.max_pending_acquires) {
      spdlog::warn("Connection pool exhausted: {} leased, {} waiting", in_use_.size(), waiting_);
      out.status = AcquireStatus::Exhausted;
      return out;
    }
    if (Clock::now() >= deadline) {
      out.status = AcquireStatus::TimedOut;
      return out;
    }

    ++waiting_;
    waited = true;
    slot_cv_.wait_until(lk, deadline);
    --waiting_;
  }
}

void ConnectionPool::release(std::unique_ptr<Connection> conn, bool reusable) {
  {
    std::lock_guard<std::mutex> g(mu_);
    in_use_.erase(conn->client.get());
    const auto now = Clock::now();
    if (!shutdown_ && reusable && now - conn->created < cfg_.max_lifetime) {
      conn->last_used = now;
      idle_.push_back(std::move(conn));
    }
  }
  slot_cv_.notify_one();
  // Anything still owned here is closed outside the lock.
}

size_t ConnectionPool::evict_expired() {
  std::vector<std::unique_ptr<Connection>> closed;
  {
    std::lock_guard<std::mutex> g(mu_);
    const auto now = Clock::now();
    for (auto it = idle_.begin(); it != idle_.end();) {
      if (expired(**it, now)) {
        closed.push_back(std::move(*it));
        it = idle_.erase(it);
      } else {
        ++it;
      }
    }
  }
  if (!closed.empty()) {
    spdlog::debug("Evicted {} idle HTTP connections", closed.size());
    slot_cv_.notify_all();
  }
  return closed.size();
}

void ConnectionPool::evictor_loop() {
  std::unique_lock<std::mutex> lk(mu_);
  while (!shutdown_) {
    evict_cv_.wait_for(lk, cfg_.evict_interval, [this] { return shutdown_; });
    if (shutdown_) break;
    lk.unlock();
    evict_expired();
    lk.lock();
  }
}

void ConnectionPool::cancel_all() {
  std::lock_guard<std::mutex> g(mu_);
  for (auto* client : in_use_) client->stop();
}

void ConnectionPool::shutdown() {
  std::deque<std::unique_ptr<Connection>> closed;
  {
    std::lock_guard<std::mutex> g(mu_);
    if (shutdown_) return;
    shutdown_ = true;
    for (auto* client : in_use_) client->stop();
    closed.swap(idle_);
  }
  evict_cv_.notify_all();
  slot_cv_.notify_all();
  if (evictor_.joinable()) evictor_.join();
  spdlog::info("HTTP connection pool shut down ({} idle connections closed)", closed.size());
}

size_t ConnectionPool::idle_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return idle_.size();
}

size_t ConnectionPool::leased_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return in_use_.size();
}

size_t ConnectionPool::waiting_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return waiting_;
}

// ---------------------------------------------------------------------------
// PooledHttpTransport

void PooledHttpTransport::cancel() {
  cancel_epoch_.fetch_add(1);
  pool_.cancel_all();
}

HttpResponse PooledHttpTransport::get(const std::string& url, Millis timeout) {
  const uint64_t epoch = cancel_epoch_.load();
  HttpResponse resp;
  UrlParts parts;
  try {
    parts = split_url(url);
  } catch (const std::invalid_argument& e) {
    resp.failure = HttpResponse::Failure::Transport;
    resp.error = e.what();
    return resp;
  }

  const auto deadline = Clock::now() + timeout;
  auto acquired = pool_.acquire(parts.origin, deadline);
  switch (acquired.status) {
    case ConnectionPool::AcquireStatus::Ok:
      break;
    case ConnectionPool::AcquireStatus::Exhausted:
      resp.failure = HttpResponse::Failure::PoolExhausted;
      resp.error = "connection pool exhausted";
      return resp;
    case ConnectionPool::AcquireStatus::TimedOut:
      resp.failure = HttpResponse::Failure::Timeout;
      resp.error = "timed out waiting for a pooled connection";
      return resp;
    case ConnectionPool::AcquireStatus::ShutDown:
      resp.failure = HttpResponse::Failure::Cancelled;
      resp.error = "connection pool shut down";
      return resp;
  }

  const auto remaining = duration_cast<microseconds>(deadline - Clock::now());
  if (remaining.count() <= 0) {
    resp.failure = HttpResponse::Failure::Timeout;
    resp.error = "deadline passed before request";
    return resp;
  }
  const auto secs = static_cast<time_t>(remaining.count() / 1'000'000);
  const auto usecs = static_cast<time_t>(remaining.count() % 1'000'000);

  auto cancelled = [this, epoch] { return cancel_epoch_.load() != epoch; };
  if (cancelled()) {
    resp.failure = HttpResponse::Failure::Cancelled;
    resp.error = "request cancelled";
    return resp;
  }

  httplib::Client& cli = acquired.lease.client();
  cli.set_connection_timeout(secs, usecs);
  cli.set_read_timeout(secs, usecs);
  cli.set_write_timeout(secs, usecs);

  // Socket timeouts apply per operation; the progress hook enforces the overall
  // deadline and cancellation while the body trickles in, redirects included.
  auto res = cli.Get(parts.path, [&](uint64_t, uint64_t) {
    return !cancelled() && Clock::now() < deadline;
  });
  if (!res) {
    acquired.lease.discard();
    const auto err = res.error();
    if (cancelled()) {
      resp.failure = HttpResponse::Failure::Cancelled;
    } else if (Clock::now() >= deadline) {
      resp.failure = HttpResponse::Failure::Timeout;
    } else {
      resp.failure = err == httplib::Error::Canceled ? HttpResponse::Failure::Cancelled
                                                     : HttpResponse::Failure::Transport;
    }
    resp.error = httplib::to_string(err);
    return resp;
  }

  resp.status = res->status;
  resp.body.assign(res->body.begin(), res->body.end());
  return resp;
}

// ---------------------------------------------------------------------------
// ImageFetcher

const char* to_string(FetchStatus s) {
  switch (s) {
    case FetchStatus::Ok:
      return "ok";
    case FetchStatus::HttpError:
      return "http_error";
    case FetchStatus::TransportError:
      return "transport_error";
    case FetchStatus::Timeout:
      return "timeout";
    case FetchStatus::PoolExhausted:
      return "pool_exhausted";
    case FetchStatus::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

namespace {

FetchStatus status_of(const HttpResponse& r) {
  switch (r.failure) {
    case HttpResponse::Failure::None:
      return r.success() ? FetchStatus::Ok : FetchStatus::HttpError;
    case HttpResponse::Failure::Transport:
      return FetchStatus::TransportError;
    case HttpResponse::Failure::Timeout:
      return FetchStatus::Timeout;
    case HttpResponse::Failure::PoolExhausted:
      return FetchStatus::PoolExhausted;
    case HttpResponse::Failure::Cancelled:
      return FetchStatus::Cancelled;
  }
  return FetchStatus::TransportError;
}

std::string describe(const HttpResponse& r) {
  if (r.failure == HttpResponse::Failure::None) return "HTTP " + std::to_string(r.status);
  return r.error;
}

}  // namespace

ImageFetcher::ImageFetcher(FetcherConfig cfg, MetricsCollector& metrics,
                           std::shared_ptr<HttpTransport> transport)
    : cfg_(std::move(cfg)), metrics_(metrics), transport_(std::move(transport)) {
  if (!transport_) transport_ = std::make_shared<PooledHttpTransport>();
}

ImageFetcher::~ImageFetcher() { shutdown(); }

HttpResponse ImageFetcher::await(const std::string& url, TimePoint deadline) {
  const auto remaining = duration_cast<milliseconds>(deadline - Clock::now());
  HttpResponse r;
  if (remaining.count() <= 0) {
    r.failure = HttpResponse::Failure::Timeout;
    r.error = "fetch deadline exceeded";
    return r;
  }

  auto pending = std::make_shared<PendingAttempt>();
  try {
    attempts_.submit([this, pending, url, remaining, transport = transport_] {
      HttpResponse resp;
      try {
        resp = transport->get(url, remaining);
      } catch (const std::exception& e) {
        resp.failure = HttpResponse::Failure::Transport;
        resp.error = e.what();
      } catch (...) {
        resp.failure = HttpResponse::Failure::Transport;
        resp.error = "unknown transport exception";
      }
      {
        std::lock_guard<std::mutex> g(wait_mu_);
        pending->response = std::move(resp);
        pending->done = true;
      }
      wait_cv_.notify_all();
    });
  } catch (const std::runtime_error& e) {
    r.failure = HttpResponse::Failure::Cancelled;
    r.error = e.what();
    return r;
  }

  std::unique_lock<std::mutex> lk(wait_mu_);
  wait_cv_.wait_until(lk, deadline, [&] { return pending->done || cancelled_.load(); });
  if (pending->done) return std::move(pending->response);
  lk.unlock();

  // Abandoned: the worker finishes on its own once the transport lets go.
  transport_->cancel();
  r.failure = cancelled_ ? HttpResponse::Failure::Cancelled : HttpResponse::Failure::Timeout;
  r.error = cancelled_ ? "fetch cancelled" : "fetch deadline exceeded";
  return r;
}

HttpResponse ImageFetcher::attempt(const std::string& url, TimePoint deadline) {
  HttpResponse r = await(url, deadline);
  if (cancelled_) {
    r.failure = HttpResponse::Failure::Cancelled;
    r.error = "fetch cancelled";
  } else if (Clock::now() > deadline) {
    r.failure = HttpResponse::Failure::Timeout;
    r.error = "fetch deadline exceeded";
  }

  if (r.success()) {
    spdlog::debug("Downloaded {} bytes from {}", r.body.size(), url);
  } else {
    spdlog::error("Download failed for {}: {}", url, describe(r));
  }
  return r;
}

FetchResult ImageFetcher::fetch(const std::string& primary_url) {
  FetchResult out;
  if (cancelled_) {
    out.status = FetchStatus::Cancelled;
    out.error = "fetcher cancelled";
    return out;
  }

  const auto deadline = Clock::now() + cfg_.timeout;
  HttpResponse r = attempt(primary_url, deadline);
  out.source_url = primary_url;

  const auto primary_status = status_of(r);
  const bool escalate = primary_status == FetchStatus::HttpError ||
                        primary_status == FetchStatus::TransportError ||
                        primary_status == FetchStatus::PoolExhausted;
  if (escalate && !cfg_.fallback_url.empty()) {
    spdlog::warn("Primary URL failed, trying fallback: {}", describe(r));
    r = attempt(cfg_.fallback_url, deadline);
    out.source_url = cfg_.fallback_url;
  }

  out.status = status_of(r);
  out.http_status = r.status;
  if (!out.ok()) {
    out.error = describe(r);
    return out;
  }

  metrics_.record_download(r.body.size());
  out.image = make_raw_image(std::move(r.body));
  return out;
}

void ImageFetcher::cancel() {
  {
    std::lock_guard<std::mutex> g(wait_mu_);
    cancelled_ = true;
  }
  wait_cv_.notify_all();
  transport_->cancel();
}

void ImageFetcher::shutdown() {
  if (shut_down_.exchange(true)) return;
  cancel();
  transport_->shutdown();
}
