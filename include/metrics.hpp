#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <mutex>
#include <sstream>

namespace tether {

// Process-wide counters, gauges and summaries, exported on /metrics in the
// Prometheus text format.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Optional # HELP line for a metric.
    void describe(const std::string& name, const std::string& help) {
        std::lock_guard<std::mutex> lock(mutex_);
        help_[name] = help;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        if (value < 0) return;  // counters are monotonic
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] -= value;
    }

    // Records one sample into a summary (exported as _count and _sum).
    void observe(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        Summary& s = summaries_[name];
        s.count += 1;
        s.sum += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return it != counters_.end() ? it->second : 0.0;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return it != gauges_.end() ? it->second : 0.0;
    }

    // Sample count of a summary.
    uint64_t get_summary_count(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = summaries_.find(name);
        return it != summaries_.end() ? it->second.count : 0;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
        summaries_.clear();
    }

    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        auto header = [&](const std::string& name, const char* type) {
            if (auto it = help_.find(name); it != help_.end()) {
                ss << "# HELP " << name << " " << it->second << "\n";
            }
            ss << "# TYPE " << name << " " << type << "\n";
        };

        for (const auto& [name, val] : counters_) {
            header(name, "counter");
            ss << name << " " << val << "\n";
        }
        for (const auto& [name, val] : gauges_) {
            header(name, "gauge");
            ss << name << " " << val << "\n";
        }
        for (const auto& [name, s] : summaries_) {
            header(name, "summary");
            ss << name << "_count " << s.count << "\n";
            ss << name << "_sum " << s.sum << "\n";
        }
        return ss.str();
    }

private:
    struct Summary {
        uint64_t count = 0;
        double sum = 0;
    };

    MetricsRegistry() = default;

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, Summary> summaries_;
    std::map<std::string, std::string> help_;
    std::mutex mutex_;
};

}
