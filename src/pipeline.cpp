#include "pipeline.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

using namespace std::chrono;

Pipeline::Pipeline(PipelineConfig cfg, MetricsCollector& m,
                   std::shared_ptr<HttpTransport> transport)
    : cfg_(std::move(cfg)),
      metrics_(m),
      fetcher_(FetcherConfig{cfg_.fallback_url, cfg_.fetch_timeout}, m,
               transport ? std::move(transport)
                         : std::shared_ptr<HttpTransport>(
                               std::make_shared<PooledHttpTransport>(cfg_.pool))),
      parallel_(cfg_.processing, &m),
      sequential_(cfg_.processing, &m),
      stream_(cfg_.subscriber_queue_capacity) {
  if (cfg_.primary_url.empty()) {
    throw std::invalid_argument("Pipeline needs a primary image URL");
  }
  if (cfg_.interval.count() <= 0) cfg_.interval = Millis(1);
}

Pipeline::~Pipeline() { stop(); }

void Pipeline::start() {
  std::lock_guard<std::mutex> g(lifecycle_mu_);
  const auto s = state_.load();
  if (s == PipelineState::Running) return;
  if (s == PipelineState::Stopped) {
    throw std::logic_error("Pipeline was stopped; create a new instance to run again");
  }

  round_pool_ = std::make_unique<WorkerPool>(1, "round");
  processing_pool_ = std::make_unique<WorkerPool>(2, "processing");
  state_ = PipelineState::Running;
  timer_thread_ = std::thread([this] { timer_loop(); });
  spdlog::info("Solar data pipeline started (every {} ms from {})", cfg_.interval.count(),
               cfg_.primary_url);
}

void Pipeline::stop() {
  std::lock_guard<std::mutex> g(lifecycle_mu_);
  PipelineState prev;
  {
    std::lock_guard<std::mutex> pg(publish_mu_);
    prev = state_.exchange(PipelineState::Stopped);
  }
  if (prev == PipelineState::Stopped) return;

  {
    std::lock_guard<std::mutex> tg(timer_mu_);
  }
  timer_cv_.notify_all();
  if (timer_thread_.joinable()) timer_thread_.join();

  // Unblocks a fetch in progress; processing already dispatched runs to the join.
  fetcher_.cancel();
  if (round_pool_) round_pool_->shutdown();
  if (processing_pool_) processing_pool_->shutdown();
  parallel_.shutdown();
  sequential_.shutdown();
  fetcher_.shutdown();
  stream_.close();

  if (prev == PipelineState::Running) {
    spdlog::info("Solar data pipeline stopped after {} frames", frame_counter_.load());
  }
}

void Pipeline::timer_loop() {
  std::unique_lock<std::mutex> lk(timer_mu_);
  while (state_.load() == PipelineState::Running) {
    lk.unlock();
    tick();
    lk.lock();
    timer_cv_.wait_for(lk, cfg_.interval,
                       [this] { return state_.load() != PipelineState::Running; });
  }
}

void Pipeline::tick() {
  if (round_in_flight_.exchange(true)) {
    skipped_ticks_.fetch_add(1);
    spdlog::warn("Previous round still in flight, skipping tick");
    return;
  }
  try {
    round_pool_->submit([this] {
      struct InFlightReset {
        std::atomic<bool>& flag;
        ~InFlightReset() { flag = false; }
      } reset{round_in_flight_};
      try {
        run_round();
      } catch (const std::exception& e) {
        spdlog::error("Pipeline error, round abandoned: {}", e.what());
      } catch (...) {
        spdlog::error("Pipeline error, round abandoned: unknown exception");
      }
    });
  } catch (const std::runtime_error& e) {
    // Pool already shut down by stop().
    round_in_flight_ = false;
    spdlog::debug("Tick after shutdown ignored: {}", e.what());
  }
}

bool Pipeline::run_round() {
  FetchResult fetched = fetcher_.fetch(cfg_.primary_url);
  if (!fetched.ok()) {
    if (fetched.status == FetchStatus::Cancelled) {
      spdlog::info("Fetch cancelled by shutdown");
    } else {
      spdlog::error("Round abandoned, download failed ({}): {}", to_string(fetched.status),
                    fetched.error);
    }
    return false;
  }

  RawImage image = std::move(fetched.image);
  const size_t original_size = image->size();
  const auto t0 = Clock::now();

  auto par = processing_pool_->submit([this, image, original_size] {
    ProcessOutput o = parallel_.process(image);
    return ProcessedResult::parallel_only(std::move(o.bytes), o.duration_ns, original_size);
  });
  auto seq = processing_pool_->submit([this, image, original_size] {
    ProcessOutput o = sequential_.process(image);
    return ProcessedResult::sequential_only(std::move(o.bytes), o.duration_ns, original_size);
  });
  image.reset();

  // Both paths finish before either outcome is looked at.
  par.wait();
  seq.wait();
  ProcessedResult merged = ProcessedResult::merge(par.get(), seq.get());

  const auto total_ns = duration_cast<nanoseconds>(Clock::now() - t0).count();
  metrics_.record_processing(total_ns);

  auto result = std::make_shared<const ProcessedResult>(std::move(merged));
  size_t receivers = 0;
  uint64_t frame = 0;
  {
    std::lock_guard<std::mutex> g(publish_mu_);
    if (state_.load() != PipelineState::Running) {
      spdlog::info("Pipeline stopped during round, dropping result");
      return false;
    }
    receivers = stream_.publish(result);
    frame = frame_counter_.fetch_add(1) + 1;
  }

  spdlog::debug("Frame {} published to {} subscribers (parallel={:.2f}ms sequential={:.2f}ms)",
                frame, receivers, result->parallel_duration_ns() / 1e6,
                result->sequential_duration_ns() / 1e6);
  if (cfg_.log_every_n_frames > 0 && frame % cfg_.log_every_n_frames == 0) {
    spdlog::info("Processed {} frames. Avg latency: {:.2f} ms", frame,
                 metrics_.average_latency_ms());
  }
  return true;
}
