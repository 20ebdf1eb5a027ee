#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of worker threads draining a FIFO task queue.
class WorkerPool {
public:
  WorkerPool(size_t num_threads, std::string name);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Exceptions thrown by `fn` surface from the returned future's get().
  template <typename F>
  auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    std::future<R> fut = task->get_future();
    {
      std::lock_guard<std::mutex> g(mu_);
      if (stopping_) throw std::runtime_error("WorkerPool '" + name_ + "' is shut down");
      tasks_.emplace_back([task] { (*task)(); });
    }
    cv_.notify_one();
    return fut;
  }

  // Runs queued tasks to completion, then joins the workers. Idempotent.
  void shutdown();

  size_t size() const { return workers_.size(); }
  const std::string& name() const { return name_; }

private:
  void worker_loop();

  std::string name_;
  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> tasks_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_{false};
};

size_t default_parallelism();
