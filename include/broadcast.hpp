#pragma once
#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

template <typename T>
class Broadcaster;

// One consumer's view of a Broadcaster. Receives only values published after it
// was created. Unregisters itself when destroyed.
template <typename T>
class Subscription {
public:
  struct Queue {
    std::mutex mu;
    std::condition_variable cv;
    std::deque<T> items;
    size_t capacity{16};
    uint64_t dropped{0};
    bool closed{false};
  };

  Subscription() = default;
  explicit Subscription(std::shared_ptr<Queue> q) : q_(std::move(q)) {}
  Subscription(Subscription&&) noexcept = default;
  Subscription& operator=(Subscription&&) noexcept = default;
  ~Subscription() { close(); }

  // Blocks until a value arrives, the timeout passes (nullopt) or the stream is
  // closed and drained (nullopt).
  template <typename Rep, typename Period>
  std::optional<T> next(std::chrono::duration<Rep, Period> timeout) {
    if (!q_) return std::nullopt;
    std::unique_lock<std::mutex> lk(q_->mu);
    q_->cv.wait_for(lk, timeout, [this] { return q_->closed || !q_->items.empty(); });
    return pop_locked();
  }

  std::optional<T> next() {
    if (!q_) return std::nullopt;
    std::unique_lock<std::mutex> lk(q_->mu);
    q_->cv.wait(lk, [this] { return q_->closed || !q_->items.empty(); });
    return pop_locked();
  }

  std::optional<T> try_next() {
    if (!q_) return std::nullopt;
    std::lock_guard<std::mutex> g(q_->mu);
    return pop_locked();
  }

  bool closed() const {
    if (!q_) return true;
    std::lock_guard<std::mutex> g(q_->mu);
    return q_->closed && q_->items.empty();
  }

  uint64_t dropped() const {
    if (!q_) return 0;
    std::lock_guard<std::mutex> g(q_->mu);
    return q_->dropped;
  }

  void close() {
    if (!q_) return;
    {
      std::lock_guard<std::mutex> g(q_->mu);
      q_->closed = true;
    }
    q_->cv.notify_all();
  }

private:
  std::optional<T> pop_locked() {
    if (q_->items.empty()) return std::nullopt;
    T v = std::move(q_->items.front());
    q_->items.pop_front();
    return v;
  }

  std::shared_ptr<Queue> q_;
};

// Fans each published value out to every live subscription. The producer runs
// once per value regardless of how many consumers exist.
template <typename T>
class Broadcaster {
public:
  using Queue = typename Subscription<T>::Queue;

  explicit Broadcaster(size_t queue_capacity = 16) : capacity_(queue_capacity ? queue_capacity : 1) {}
  ~Broadcaster() { close(); }

  Subscription<T> subscribe() {
    auto q = std::make_shared<Queue>();
    q->capacity = capacity_;
    std::lock_guard<std::mutex> g(mu_);
    if (closed_) q->closed = true;
    else subscribers_.push_back(q);
    return Subscription<T>(std::move(q));
  }

  // Returns how many subscribers received the value.
  size_t publish(const T& value) {
    std::vector<std::shared_ptr<Queue>> targets;
    {
      std::lock_guard<std::mutex> g(mu_);
      if (closed_) return 0;
      for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        if (auto q = it->lock()) {
          targets.push_back(std::move(q));
          ++it;
        } else {
          it = subscribers_.erase(it);
        }
      }
    }

    size_t delivered = 0;
    for (auto& q : targets) {
      {
        std::lock_guard<std::mutex> g(q->mu);
        if (q->closed) continue;
        if (q->items.size() >= q->capacity) {
          q->items.pop_front();
          ++q->dropped;
          spdlog::warn("Subscriber queue full ({}), dropping oldest result", q->capacity);
        }
        q->items.push_back(value);
      }
      q->cv.notify_all();
      ++delivered;
    }
    return delivered;
  }

  // Ends the stream: consumers drain what is queued, then next() returns nullopt.
  void close() {
    std::vector<std::weak_ptr<Queue>> subs;
    {
      std::lock_guard<std::mutex> g(mu_);
      if (closed_) return;
      closed_ = true;
      subs.swap(subscribers_);
    }
    for (auto& w : subs) {
      if (auto q = w.lock()) {
        {
          std::lock_guard<std::mutex> g(q->mu);
          q->closed = true;
        }
        q->cv.notify_all();
      }
    }
  }

  size_t subscriber_count() {
    std::lock_guard<std::mutex> g(mu_);
    size_t n = 0;
    for (auto& w : subscribers_) {
      if (auto q = w.lock()) {
        std::lock_guard<std::mutex> qg(q->mu);
        if (!q->closed) ++n;
      }
    }
    return n;
  }

  bool closed() const {
    std::lock_guard<std::mutex> g(mu_);
    return closed_;
  }

private:
  size_t capacity_;
  mutable std::mutex mu_;
  std::vector<std::weak_ptr<Queue>> subscribers_;
  bool closed_{false};
};
