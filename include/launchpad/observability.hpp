#pragma once

// launchpad/observability.hpp - Structured provisioning events and stats.
//
// DESIGN:
//   Every stage emits one StageEvent; every pipeline run emits one
//   ProvisionEvent at its terminal outcome. Events are:
//     - recorded in the process-global ProvisionStats (ProvisionEvent only),
//     - passed to a registered hook if one is set, otherwise
//     - appended as one JSON line to $LAUNCHPAD_EVENT_LOG when set.
//
//   Event fields carry ids, codes and durations only. Command output and
//   secrets never appear in events; they live in the stage log.
//
// Emission never fails the pipeline: an unwritable event log is ignored.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "launchpad/types.hpp"

namespace launchpad {

struct StageEvent {
  std::string deployment_id;
  std::string sandbox_id;
  std::string stage;
  std::uint32_t index{0};  // 1-based position in the pipeline
  bool ok{false};
  std::string error_code;
  std::uint64_t duration_ns{0};
};

struct ProvisionEvent {
  std::string deployment_id;
  std::string sandbox_id;
  std::string flavor;
  bool ok{false};
  std::string error_class;
  std::string error_code;
  std::string failed_stage;
  std::uint64_t duration_ns{0};
  std::string verify_method;
  bool weak_verification{false};
  std::uint32_t verify_rounds{0};
  std::size_t cleanup_errors{0};
  std::size_t file_count{0};
  std::size_t bytes_in{0};
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) ms, 2^i ms); bucket 0 is [0, 1ms).
// Provisioning runs take seconds to minutes, so milliseconds are the unit.
class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 24;  // up to ~2.3 hours

  void record(std::uint64_t duration_ns);

  // Approximate percentile in milliseconds, p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  std::uint64_t sum_ms() const { return sum_ms_.load(std::memory_order_relaxed); }
  double mean_ms() const;

  std::string to_json() const;

 private:
  std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_ms_{0};
};

// ---------------------------------------------------------------------------
// ProvisionStats - process-global counters
// ---------------------------------------------------------------------------
// Thread-safe; all counters are atomic. Exposed via `launchpad deploy --stats`.
class ProvisionStats {
 public:
  void record_run(const ProvisionEvent& ev);
  std::string to_json() const;

  std::atomic<std::uint64_t> total_runs{0};
  std::atomic<std::uint64_t> successful_runs{0};
  std::atomic<std::uint64_t> failed_runs{0};
  std::atomic<std::uint64_t> weak_verifications{0};
  std::atomic<std::uint64_t> cleanup_errors{0};

  // Indexed by ErrorClass.
  std::array<std::atomic<std::uint64_t>, 6> failures_by_class{};

  LatencyHistogram latency_histogram;
};

ProvisionStats& global_provision_stats();

void emit_stage_event(const StageEvent& ev);
void emit_provision_event(const ProvisionEvent& ev);

std::string stage_event_to_json(const StageEvent& ev);
std::string provision_event_to_json(const ProvisionEvent& ev);

// Hooks replace the JSONL file sink. Pass nullptr to restore it.
using StageEventHook = void (*)(const StageEvent&);
using ProvisionEventHook = void (*)(const ProvisionEvent&);
void set_stage_event_hook(StageEventHook hook);
void set_provision_event_hook(ProvisionEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  std::uint64_t& out_ns;
  explicit ScopeTimer(std::uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace launchpad
