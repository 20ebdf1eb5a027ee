#include "types.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

ProcessedResult::ProcessedResult(std::optional<Bytes> parallel_output,
                                 std::optional<Bytes> sequential_output,
                                 int64_t parallel_duration_ns, int64_t sequential_duration_ns,
                                 size_t original_size_bytes)
    : parallel_output_(std::move(parallel_output)),
      sequential_output_(std::move(sequential_output)),
      parallel_duration_ns_(parallel_duration_ns),
      sequential_duration_ns_(sequential_duration_ns),
      original_size_bytes_(original_size_bytes) {
  if (!parallel_output_ && !sequential_output_) {
    throw std::invalid_argument("ProcessedResult needs at least one output");
  }
}

ProcessedResult ProcessedResult::parallel_only(Bytes output, int64_t duration_ns,
                                               size_t original_size) {
  return ProcessedResult(std::move(output), std::nullopt, duration_ns, 0, original_size);
}

ProcessedResult ProcessedResult::sequential_only(Bytes output, int64_t duration_ns,
                                                 size_t original_size) {
  return ProcessedResult(std::nullopt, std::move(output), 0, duration_ns, original_size);
}

ProcessedResult ProcessedResult::merge(const ProcessedResult& a, const ProcessedResult& b) {
  return ProcessedResult(a.parallel_output_ ? a.parallel_output_ : b.parallel_output_,
                         a.sequential_output_ ? a.sequential_output_ : b.sequential_output_,
                         a.parallel_output_ ? a.parallel_duration_ns_ : b.parallel_duration_ns_,
                         a.sequential_output_ ? a.sequential_duration_ns_
                                              : b.sequential_duration_ns_,
                         std::max(a.original_size_bytes_, b.original_size_bytes_));
}

const Bytes& ProcessedResult::data() const {
  return parallel_output_ ? *parallel_output_ : *sequential_output_;
}

double ProcessedResult::speedup() const {
  if (parallel_duration_ns_ <= 0 || sequential_duration_ns_ <= 0) return 1.0;
  return static_cast<double>(sequential_duration_ns_) /
         static_cast<double>(parallel_duration_ns_);
}

bool ProcessedResult::operator==(const ProcessedResult& o) const {
  return parallel_output_ == o.parallel_output_ && sequential_output_ == o.sequential_output_ &&
         parallel_duration_ns_ == o.parallel_duration_ns_ &&
         sequential_duration_ns_ == o.sequential_duration_ns_ &&
         original_size_bytes_ == o.original_size_bytes_;
}

std::string FlareEvent::to_string() const {
  return fmt::format("Flare at ({},{}) size={} intensity={}", x, y, size, intensity);
}

const char* to_string(PipelineState s) {
  switch (s) {
    case PipelineState::Idle:
      return "idle";
    case PipelineState::Running:
      return "running";
    case PipelineState::Stopped:
      return "stopped";
  }
  return "unknown";
}
