#include "launchpad/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>

#include "launchpad/jsonlite.hpp"

namespace launchpad {

namespace {

inline std::size_t bucket_for_ms(std::uint64_t duration_ms) {
  if (duration_ms == 0) return 0;
  const std::size_t b = static_cast<std::size_t>(std::bit_width(duration_ms));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

std::string fixed(double v, const char* fmt) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}

std::atomic<StageEventHook> g_stage_hook{nullptr};
std::atomic<ProvisionEventHook> g_provision_hook{nullptr};

// O_APPEND keeps concurrent single-line writes whole on POSIX.
void append_event_line(const std::string& line) {
  const char* log_path = std::getenv("LAUNCHPAD_EVENT_LOG");
  if (!log_path || !log_path[0]) return;
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fputc('\n', f);
    std::fclose(f);
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t ms = duration_ns / 1000000u;
  buckets_[bucket_for_ms(ms)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_ms_.fetch_add(ms, std::memory_order_relaxed);
}

double LatencyHistogram::mean_ms() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_ms_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const std::uint64_t target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target && cumulative > 0) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(128);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  out += fixed(mean_ms(), "%.2f");
  out += ",\"p50_ms\":";
  out += fixed(percentile(0.50), "%.2f");
  out += ",\"p95_ms\":";
  out += fixed(percentile(0.95), "%.2f");
  out += ",\"p99_ms\":";
  out += fixed(percentile(0.99), "%.2f");
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// ProvisionStats
// ---------------------------------------------------------------------------

void ProvisionStats::record_run(const ProvisionEvent& ev) {
  total_runs.fetch_add(1, std::memory_order_relaxed);
  if (ev.ok) {
    successful_runs.fetch_add(1, std::memory_order_relaxed);
    if (ev.weak_verification) weak_verifications.fetch_add(1, std::memory_order_relaxed);
  } else {
    failed_runs.fetch_add(1, std::memory_order_relaxed);
    ErrorClass cls = ErrorClass::none;
    if (ev.error_class == to_string(ErrorClass::client_input)) cls = ErrorClass::client_input;
    else if (ev.error_class == to_string(ErrorClass::credential)) cls = ErrorClass::credential;
    else if (ev.error_class == to_string(ErrorClass::provisioning)) cls = ErrorClass::provisioning;
    else if (ev.error_class == to_string(ErrorClass::verification)) cls = ErrorClass::verification;
    failures_by_class[static_cast<std::size_t>(cls)].fetch_add(1, std::memory_order_relaxed);
  }
  cleanup_errors.fetch_add(ev.cleanup_errors, std::memory_order_relaxed);
  latency_histogram.record(ev.duration_ns);
}

std::string ProvisionStats::to_json() const {
  auto load = [](const std::atomic<std::uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  auto by_class = [&](ErrorClass c) { return load(failures_by_class[static_cast<std::size_t>(c)]); };

  std::string out;
  out.reserve(512);
  out += "{\"total_runs\":";
  out += load(total_runs);
  out += ",\"successful_runs\":";
  out += load(successful_runs);
  out += ",\"failed_runs\":";
  out += load(failed_runs);
  out += ",\"weak_verifications\":";
  out += load(weak_verifications);
  out += ",\"cleanup_errors\":";
  out += load(cleanup_errors);
  out += ",\"failures\":{\"ClientInputError\":";
  out += by_class(ErrorClass::client_input);
  out += ",\"CredentialError\":";
  out += by_class(ErrorClass::credential);
  out += ",\"ProvisioningError\":";
  out += by_class(ErrorClass::provisioning);
  out += ",\"VerificationError\":";
  out += by_class(ErrorClass::verification);
  out += "},\"latency\":";
  out += latency_histogram.to_json();
  out += '}';
  return out;
}

ProvisionStats& global_provision_stats() {
  static ProvisionStats inst;
  return inst;
}

// ---------------------------------------------------------------------------
// Event serialization + emission
// ---------------------------------------------------------------------------

std::string stage_event_to_json(const StageEvent& ev) {
  jsonlite::Object o;
  o["event"] = "stage";
  o["deployment_id"] = ev.deployment_id;
  o["sandbox_id"] = ev.sandbox_id;
  o["stage"] = ev.stage;
  o["index"] = static_cast<std::uint64_t>(ev.index);
  o["ok"] = ev.ok;
  o["error_code"] = ev.error_code;
  o["duration_ns"] = static_cast<std::uint64_t>(ev.duration_ns);
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

std::string provision_event_to_json(const ProvisionEvent& ev) {
  jsonlite::Object o;
  o["event"] = "provision";
  o["deployment_id"] = ev.deployment_id;
  o["sandbox_id"] = ev.sandbox_id;
  o["flavor"] = ev.flavor;
  o["ok"] = ev.ok;
  o["error_class"] = ev.error_class;
  o["error_code"] = ev.error_code;
  o["failed_stage"] = ev.failed_stage;
  o["duration_ns"] = static_cast<std::uint64_t>(ev.duration_ns);
  o["verify_method"] = ev.verify_method;
  o["weak_verification"] = ev.weak_verification;
  o["verify_rounds"] = static_cast<std::uint64_t>(ev.verify_rounds);
  o["cleanup_errors"] = static_cast<std::uint64_t>(ev.cleanup_errors);
  o["file_count"] = static_cast<std::uint64_t>(ev.file_count);
  o["bytes_in"] = static_cast<std::uint64_t>(ev.bytes_in);
  return jsonlite::to_json(jsonlite::Value(std::move(o)));
}

void set_stage_event_hook(StageEventHook hook) {
  g_stage_hook.store(hook, std::memory_order_release);
}

void set_provision_event_hook(ProvisionEventHook hook) {
  g_provision_hook.store(hook, std::memory_order_release);
}

void emit_stage_event(const StageEvent& ev) {
  if (StageEventHook hook = g_stage_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }
  append_event_line(stage_event_to_json(ev));
}

void emit_provision_event(const ProvisionEvent& ev) {
  global_provision_stats().record_run(ev);
  if (ProvisionEventHook hook = g_provision_hook.load(std::memory_order_acquire)) {
    hook(ev);
    return;
  }
  append_event_line(provision_event_to_json(ev));
}

}  // namespace launchpad
