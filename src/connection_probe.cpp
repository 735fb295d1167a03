#include "connection_probe.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <thread>

#include "errors.hpp"
#include "http_client.hpp"

const char* to_string(QualityTier tier) {
  switch(tier) {
    case QualityTier::Poor:      return "poor";
    case QualityTier::Fair:      return "fair";
    case QualityTier::Good:      return "good";
    case QualityTier::Excellent: return "excellent";
  }
  return "unknown";
}

QualityTier classify_connection(double latency_ms, double throughput_bps, const ProbeThresholds& thresholds) {
  if(throughput_bps >= thresholds.excellent_bps && latency_ms < thresholds.excellent_max_latency_ms) {
    return QualityTier::Excellent;
  }
  if(throughput_bps >= thresholds.good_bps) return QualityTier::Good;
  if(throughput_bps >= thresholds.fair_bps) return QualityTier::Fair;
  return QualityTier::Poor;
}

ConnectionProbe::ConnectionProbe(HttpClient& client, Options options, std::shared_ptr<Logger> logger)
  : client_(client),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("probe")) {
  if(options_.ping_samples == 0) options_.ping_samples = 1;
  if(options_.retries == 0) options_.retries = 1;
}

ConnectionProfile ConnectionProbe::measure() {
  using clock = std::chrono::steady_clock;

  auto attempt = [&](const char* what, auto&& request) -> bool {
    for(std::size_t i = 1; i <= options_.retries; ++i) {
      try {
        request();
        return true;
      } catch(const TransportError& e) {
        logger_->debug("{} attempt {}/{} failed: {}", what, i, options_.retries, e.what());
      }
      if(i < options_.retries) std::this_thread::sleep_for(options_.retry_pause);
    }
    return false;
  };

  std::optional<double> best_rtt;
  for(std::size_t sample = 0; sample < options_.ping_samples; ++sample) {
    double rtt = 0.0;
    bool ok = attempt("ping", [&]{
      auto started = clock::now();
      client_.get("/ping");
      rtt = std::chrono::duration<double, std::milli>(clock::now() - started).count();
    });
    if(ok) best_rtt = std::min(best_rtt.value_or(std::numeric_limits<double>::max()), rtt);
  }

  ConnectionProfile profile;
  if(!best_rtt) {
    logger_->warn("Server did not answer /ping; assuming a poor connection");
    profile.degraded = true;
    return profile;
  }
  profile.latency_ms = *best_rtt;

  std::string target = "/speedtest";
  if(options_.payload_bytes > 0) target += "?size=" + std::to_string(options_.payload_bytes);

  uint64_t received = 0;
  double elapsed = 0.0;
  bool ok = attempt("speedtest", [&]{
    received = 0;
    auto started = clock::now();
    client_.stream(target, {}, [&](const HttpResponse&, const char*, std::size_t size){
      received += size;
      return true;
    });
    elapsed = std::chrono::duration<double>(clock::now() - started).count();
  });
  if(!ok || received == 0) {
    logger_->warn("Throughput test failed; assuming a poor connection");
    profile.degraded = true;
    profile.tier = QualityTier::Poor;
    return profile;
  }

  profile.throughput_bps = static_cast<double>(received) / std::max(elapsed, 1e-6);
  profile.tier = classify_connection(profile.latency_ms, profile.throughput_bps, options_.thresholds);
  logger_->info("Connection: {:.1f} ms, {:.1f} KiB/s -> {}",
                profile.latency_ms, profile.throughput_bps / 1024.0, to_string(profile.tier));
  return profile;
}
