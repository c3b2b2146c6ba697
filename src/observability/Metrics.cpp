#include "Metrics.h"
#include <sstream>

namespace observability {

static std::string escape_label(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == '\\') out += "\\\\";
        else if (c == '"') out += "\\\"";
        else if (c == '\n') out += "\\n";
        else out.push_back(c);
    }
    return out;
}

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

const std::vector<double>& Metrics::latency_buckets_ms() {
    static const std::vector<double> buckets = {1,2,5,10,20,50,100,200,500,1000,2000,5000};
    return buckets;
}

void Metrics::inc(const std::string& path, const std::string& method, int code) {
    MetricsKey k{path, method, code};
    std::lock_guard<std::mutex> lock(mu_);
    counters_[k] += 1;
}

void Metrics::observe_latency(const std::string& path, const std::string& method, double latency_ms) {
    const auto& buckets = latency_buckets_ms();
    MetricsKey k{path, method, 0};
    std::lock_guard<std::mutex> lock(mu_);
    auto& h = hist_[k];
    if (h.buckets.empty()) h.buckets.assign(buckets.size(), 0);
    h.count += 1;
    h.sum += latency_ms;
    for (size_t i = 0; i < buckets.size(); ++i) {
        if (latency_ms <= buckets[i]) h.buckets[i] += 1;
    }
}

void Metrics::record(const std::string& path, const std::string& method, int code, double latency_ms) {
    inc(path, method, code);
    observe_latency(path, method, latency_ms);
}

std::string Metrics::scrape() const {
    const auto& buckets = latency_buckets_ms();
    std::ostringstream ss;
    ss << "# HELP http_requests_total Total HTTP requests\n";
    ss << "# TYPE http_requests_total counter\n";
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& p : counters_) {
        ss << "http_requests_total{path=\"" << escape_label(p.first.path) << "\",method=\"" << escape_label(p.first.method)
           << "\",code=\"" << p.first.code << "\"} " << p.second << "\n";
    }
    ss << "# HELP http_request_duration_ms Histogram of request durations\n";
    ss << "# TYPE http_request_duration_ms histogram\n";
    for (const auto& p : hist_) {
        const std::string labels = "path=\"" + escape_label(p.first.path) + "\",method=\"" + escape_label(p.first.method) + "\"";
        const auto& h = p.second;
        for (size_t i = 0; i < buckets.size(); ++i) {
            ss << "http_request_duration_ms_bucket{" << labels << ",le=\"" << buckets[i] << "\"} " << h.buckets[i] << "\n";
        }
        ss << "http_request_duration_ms_bucket{" << labels << ",le=\"+Inf\"} " << h.count << "\n";
        ss << "http_request_duration_ms_sum{" << labels << "} " << h.sum << "\n";
        ss << "http_request_duration_ms_count{" << labels << "} " << h.count << "\n";
    }
    return ss.str();
}

}
