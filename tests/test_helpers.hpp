#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/opencv.hpp>

#include "image_fetcher.hpp"
#include "types.hpp"

inline Bytes encode_image(const cv::Mat& img, const std::string& ext = ".png") {
  Bytes buf;
  cv::imencode(ext, img, buf);
  return buf;
}

// Dark frame with a few bright discs, encoded as JPEG like the real feed.
inline Bytes make_solar_jpeg(int w = 128, int h = 96) {
  cv::Mat img(h, w, CV_8UC3, cv::Scalar(20, 20, 20));
  cv::circle(img, cv::Point(w / 3, h / 2), 14, cv::Scalar(255, 255, 255), -1);
  cv::rectangle(img, cv::Rect(w / 2, h / 4, w / 4, h / 3), cv::Scalar(120, 60, 200), -1);
  return encode_image(img, ".jpg");
}

// Scripted HttpTransport. Unknown URLs answer 404.
class FakeTransport : public HttpTransport {
public:
  struct Reply {
    int status{200};
    Bytes body;
    HttpResponse::Failure failure{HttpResponse::Failure::None};
    std::chrono::milliseconds delay{0};
  };

  void on(const std::string& url, Reply reply) {
    std::lock_guard<std::mutex> g(mu_);
    replies_[url] = std::move(reply);
  }

  // The next `n` calls fail with a transport error regardless of URL.
  void fail_next(int n) { fail_next_ = n; }

  // The next `n` calls throw something that is not a std::exception.
  void throw_next(int n) { throw_next_ = n; }

  // Requests hang until cancel() is called.
  void block_until_cancel() { block_ = true; }

  HttpResponse get(const std::string& url, std::chrono::milliseconds /*timeout*/) override {
    Reply reply;
    {
      std::lock_guard<std::mutex> g(mu_);
      calls_.push_back(url);
      auto it = replies_.find(url);
      reply = it != replies_.end() ? it->second : Reply{404, {}, HttpResponse::Failure::None, {}};
    }
    calls_cv_.notify_all();

    if (throw_next_.load() > 0) {
      throw_next_.fetch_sub(1);
      throw 42;
    }
    if (block_) {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return cancelled_; });
      HttpResponse r;
      r.failure = HttpResponse::Failure::Cancelled;
      r.error = "cancelled";
      return r;
    }
    if (reply.delay.count() > 0) std::this_thread::sleep_for(reply.delay);

    HttpResponse r;
    if (fail_next_.load() > 0) {
      fail_next_.fetch_sub(1);
      r.failure = HttpResponse::Failure::Transport;
      r.error = "connection refused";
      return r;
    }
    r.status = reply.status;
    r.body = reply.body;
    r.failure = reply.failure;
    if (r.failure != HttpResponse::Failure::None) r.error = "scripted failure";
    return r;
  }

  void cancel() override {
    {
      std::lock_guard<std::mutex> g(mu_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  std::vector<std::string> calls() {
    std::lock_guard<std::mutex> g(mu_);
    return calls_;
  }

  bool wait_for_calls(size_t n, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    return calls_cv_.wait_for(lk, timeout, [&] { return calls_.size() >= n; });
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable calls_cv_;
  std::map<std::string, Reply> replies_;
  std::vector<std::string> calls_;
  std::atomic<int> fail_next_{0};
  std::atomic<int> throw_next_{0};
  std::atomic<bool> block_{false};
  bool cancelled_{false};
};
