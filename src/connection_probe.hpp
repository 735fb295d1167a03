#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "log.hpp"

class HttpClient;

enum class QualityTier { Poor, Fair, Good, Excellent };

const char* to_string(QualityTier tier);

struct ConnectionProfile {
  double latency_ms = 0.0;
  double throughput_bps = 0.0; // bytes per second
  QualityTier tier = QualityTier::Poor;
  bool degraded = false;       // measurement failed, tier is a conservative guess

  bool operator==(const ConnectionProfile& o) const {
    return latency_ms == o.latency_ms && throughput_bps == o.throughput_bps &&
           tier == o.tier && degraded == o.degraded;
  }
};

struct ProbeThresholds {
  double excellent_bps = 5.0 * 1024 * 1024;
  double excellent_max_latency_ms = 50.0;
  double good_bps = 1.0 * 1024 * 1024;
  double fair_bps = 200.0 * 1024;
};

QualityTier classify_connection(double latency_ms,
                                double throughput_bps,
                                const ProbeThresholds& thresholds = ProbeThresholds{});

// Measures latency (best of several /ping round trips) and throughput (one
// /speedtest payload) against the server.
class ConnectionProbe {
public:
  struct Options {
    std::size_t ping_samples = 3;
    std::size_t retries = 3;
    std::chrono::milliseconds retry_pause{200};
    uint64_t payload_bytes = 0; // 0 = server default
    ProbeThresholds thresholds;
  };

  ConnectionProbe(HttpClient& client, Options options, std::shared_ptr<Logger> logger = nullptr);

  // Never throws on transport failure: an unreachable server yields a
  // degraded Poor profile so the session can still proceed conservatively.
  ConnectionProfile measure();

private:
  HttpClient& client_;
  Options options_;
  std::shared_ptr<Logger> logger_;
};
