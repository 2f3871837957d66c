#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkvault {

using MetricLabels = std::map<std::string, std::string>;

/**
 * @brief Process-wide registry of gauges, counters and histograms rendered
 * in Prometheus text format.
 */
class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    void setGauge(const std::string& name, double value, const MetricLabels& labels = {});
    void incrementCounter(const std::string& name, double value = 1.0,
                          const MetricLabels& labels = {});
    /** Record one observation; exported as <name>_sum and <name>_count. */
    void observe(const std::string& name, double value, const MetricLabels& labels = {});

    /** Current counter value, 0 when never incremented. */
    double counterValue(const std::string& name, const MetricLabels& labels = {}) const;
    /** Current gauge value, 0 when never set. */
    double gaugeValue(const std::string& name, const MetricLabels& labels = {}) const;

    std::string toPrometheus() const;

    /** Drop every series. Used by unit tests. */
    void reset();

    static std::string labelsToString(const MetricLabels& labels);

private:
    MetricsRegistry() = default;
    struct Histogram { double sum{0}; unsigned long count{0}; };
    struct SeriesKey {
        std::string name;
        std::string labels;
    };
    static std::string makeKey(const std::string& name, const MetricLabels& labels);
    static SeriesKey splitKey(const std::string& key);

    mutable std::mutex mtx_;
    std::unordered_map<std::string, double> gauges_;
    std::unordered_map<std::string, double> counters_;
    std::unordered_map<std::string, Histogram> histograms_;
};

} // namespace chunkvault
