#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

using Bytes = std::vector<uint8_t>;

// Encoded image payload shared by the two processing tasks of one round.
using RawImage = std::shared_ptr<const Bytes>;

inline RawImage make_raw_image(Bytes bytes) {
  return std::make_shared<const Bytes>(std::move(bytes));
}

// Fault inside a processing worker; caught at the round boundary.
class ProcessingError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ProcessOutput {
  Bytes bytes;
  int64_t duration_ns{0};
};

class ProcessedResult {
public:
  ProcessedResult(std::optional<Bytes> parallel_output, std::optional<Bytes> sequential_output,
                  int64_t parallel_duration_ns, int64_t sequential_duration_ns,
                  size_t original_size_bytes);

  // Partial results carry one path's output only.
  static ProcessedResult parallel_only(Bytes output, int64_t duration_ns, size_t original_size);
  static ProcessedResult sequential_only(Bytes output, int64_t duration_ns, size_t original_size);

  // Joins the two partials of one round. Present fields of `a` win over `b`.
  static ProcessedResult merge(const ProcessedResult& a, const ProcessedResult& b);

  const std::optional<Bytes>& parallel_output() const { return parallel_output_; }
  const std::optional<Bytes>& sequential_output() const { return sequential_output_; }
  int64_t parallel_duration_ns() const { return parallel_duration_ns_; }
  int64_t sequential_duration_ns() const { return sequential_duration_ns_; }
  size_t original_size_bytes() const { return original_size_bytes_; }

  // Parallel output when present, otherwise the sequential one.
  const Bytes& data() const;

  double speedup() const;

  bool operator==(const ProcessedResult& o) const;
  bool operator!=(const ProcessedResult& o) const { return !(*this == o); }

private:
  std::optional<Bytes> parallel_output_;
  std::optional<Bytes> sequential_output_;
  int64_t parallel_duration_ns_{0};
  int64_t sequential_duration_ns_{0};
  size_t original_size_bytes_{0};
};

using ProcessedResultPtr = std::shared_ptr<const ProcessedResult>;

// One connected bright region of a frame.
struct FlareEvent {
  int x{0};
  int y{0};
  int size{0};
  int intensity{0};

  std::string to_string() const;
  bool operator==(const FlareEvent& o) const {
    return x == o.x && y == o.y && size == o.size && intensity == o.intensity;
  }
};

enum class PipelineState { Idle, Running, Stopped };

const char* to_string(PipelineState s);
