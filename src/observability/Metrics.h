#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace observability {

struct MetricsKey {
    std::string path;
    std::string method;
    int code;
    bool operator==(MetricsKey const& o) const noexcept {
        return path == o.path && method == o.method && code == o.code;
    }
};

struct MetricsKeyHash {
    size_t operator()(MetricsKey const& k) const noexcept {
        size_t seed = 0;
        auto mix = [&](size_t v){ seed ^= v + 0x9e3779b97f4a7c15ULL + (seed<<6) + (seed>>2); };
        mix(std::hash<std::string>()(k.path));
        mix(std::hash<std::string>()(k.method));
        mix(std::hash<int>()(k.code));
        return seed;
    }
};

// Process-wide request counters and latency histograms in Prometheus text format.
// `path` is expected to be a route pattern (e.g. /todos/{id}), not a raw target.
class Metrics {
public:
    static Metrics& instance();
    static const std::vector<double>& latency_buckets_ms();

    void inc(const std::string& path, const std::string& method, int code);
    void observe_latency(const std::string& path, const std::string& method, double latency_ms);
    void record(const std::string& path, const std::string& method, int code, double latency_ms);
    std::string scrape() const;
private:
    Metrics() = default;
    struct HistData {
        std::vector<uint64_t> buckets;
        double sum = 0.0;
        uint64_t count = 0;
    };
    std::unordered_map<MetricsKey, uint64_t, MetricsKeyHash> counters_;
    std::unordered_map<MetricsKey, HistData, MetricsKeyHash> hist_;
    mutable std::mutex mu_;
};

}
