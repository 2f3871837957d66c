#include "utilities/metrics.h"
#include <sstream>

namespace chunkvault {

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry inst;
    return inst;
}

std::string MetricsRegistry::makeKey(const std::string& name, const MetricLabels& labels) {
    return name + labelsToString(labels);
}

MetricsRegistry::SeriesKey MetricsRegistry::splitKey(const std::string& key) {
    auto brace = key.find('{');
    if (brace == std::string::npos) return {key, ""};
    return {key.substr(0, brace), key.substr(brace)};
}

void MetricsRegistry::setGauge(const std::string& name, double value, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lg(mtx_);
    gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(const std::string& name, double value,
                                       const MetricLabels& labels) {
    std::lock_guard<std::mutex> lg(mtx_);
    counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string& name, double value, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lg(mtx_);
    auto& h = histograms_[makeKey(name, labels)];
    h.sum += value;
    h.count += 1;
}

double MetricsRegistry::counterValue(const std::string& name, const MetricLabels& labels) const {
    std::lock_guard<std::mutex> lg(mtx_);
    auto it = counters_.find(makeKey(name, labels));
    return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gaugeValue(const std::string& name, const MetricLabels& labels) const {
    std::lock_guard<std::mutex> lg(mtx_);
    auto it = gauges_.find(makeKey(name, labels));
    return it == gauges_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(const MetricLabels& labels) {
    if (labels.empty()) return "";
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& kv : labels) {
        if (!first) oss << ',';
        first = false;
        oss << kv.first << "=\"" << kv.second << "\"";
    }
    oss << '}';
    return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
    std::lock_guard<std::mutex> lg(mtx_);
    std::ostringstream oss;
    for (const auto& kv : gauges_) {
        oss << kv.first << ' ' << kv.second << '\n';
    }
    for (const auto& kv : counters_) {
        oss << kv.first << ' ' << kv.second << '\n';
    }
    for (const auto& kv : histograms_) {
        SeriesKey key = splitKey(kv.first);
        oss << key.name << "_sum" << key.labels << ' ' << kv.second.sum << '\n';
        oss << key.name << "_count" << key.labels << ' ' << kv.second.count << '\n';
    }
    return oss.str();
}

void MetricsRegistry::reset() {
    std::lock_guard<std::mutex> lg(mtx_);
    gauges_.clear();
    counters_.clear();
    histograms_.clear();
}

} // namespace chunkvault
