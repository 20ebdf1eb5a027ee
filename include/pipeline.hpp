#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "broadcast.hpp"
#include "edge_processor.hpp"
#include "image_fetcher.hpp"
#include "metrics.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

struct PipelineConfig {
  std::string primary_url{"https://sohowww.nascom.nasa.gov/data/realtime/eit_195/1024/latest.jpg"};
  std::string fallback_url{"https://soho.nascom.nasa.gov/data/realtime/eit_195/1024/latest.jpg"};
  Millis interval{5'000};
  Millis fetch_timeout{10'000};
  size_t subscriber_queue_capacity{16};
  int log_every_n_frames{10};
  PoolConfig pool;
  ProcessingConfig processing;
};

// Periodic fetch -> (parallel | sequential) Sobel -> merge -> publish loop.
//
// Lifecycle is Idle -> Running -> Stopped; a stopped pipeline cannot be
// restarted. Rounds run one at a time on a dedicated worker, so results are
// published in tick order. A failed round is logged and the next tick proceeds.
//
// stop() drops the round in flight: its processing is allowed to finish but the
// result is never published.
class Pipeline {
public:
  Pipeline(PipelineConfig cfg, MetricsCollector& m,
           std::shared_ptr<HttpTransport> transport = nullptr);
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  void start();  // No-op while running; throws std::logic_error once stopped
  void stop();   // Cancel timer and fetch, drain the round, close the stream

  bool running() const { return state_.load() == PipelineState::Running; }
  PipelineState state() const { return state_.load(); }

  // Only results published after this call are delivered.
  Subscription<ProcessedResultPtr> subscribe() { return stream_.subscribe(); }

  MetricsSnapshot metrics_snapshot() const { return metrics_.snapshot(); }
  uint64_t frame_count() const { return frame_counter_.load(); }
  uint64_t skipped_ticks() const { return skipped_ticks_.load(); }
  const PipelineConfig& config() const { return cfg_; }

private:
  void timer_loop();
  void tick();
  bool run_round();

  PipelineConfig cfg_;
  MetricsCollector& metrics_;

  ImageFetcher fetcher_;
  ParallelEdgeProcessor parallel_;
  SequentialEdgeProcessor sequential_;
  Broadcaster<ProcessedResultPtr> stream_;

  std::unique_ptr<WorkerPool> round_pool_;
  std::unique_ptr<WorkerPool> processing_pool_;

  std::mutex lifecycle_mu_;
  std::mutex publish_mu_;  // orders the last publish against stop()
  std::atomic<PipelineState> state_{PipelineState::Idle};
  std::atomic<bool> round_in_flight_{false};
  std::atomic<uint64_t> frame_counter_{0};
  std::atomic<uint64_t> skipped_ticks_{0};

  std::mutex timer_mu_;
  std::condition_variable timer_cv_;
  std::thread timer_thread_;
};
