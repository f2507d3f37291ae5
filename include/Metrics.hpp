#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace filesync {

using MetricTags = std::map<std::string, std::string>;

/**
 * MetricsSink receives counters, histogram samples and timings from every
 * component. Components take a reference at construction so tests can hand
 * in their own instance.
 */
class MetricsSink {
public:
  virtual ~MetricsSink() = default;

  virtual void incrementCounter(const std::string &name, int64_t value = 1,
                                const MetricTags &tags = {}) = 0;
  virtual void recordHistogram(const std::string &name, double value,
                               const MetricTags &tags = {}) = 0;
  virtual void recordTiming(const std::string &name, double milliseconds,
                            const MetricTags &tags = {}) = 0;
};

class NullMetrics : public MetricsSink {
public:
  void incrementCounter(const std::string &, int64_t,
                        const MetricTags &) override {}
  void recordHistogram(const std::string &, double,
                       const MetricTags &) override {}
  void recordTiming(const std::string &, double, const MetricTags &) override {}
};

struct HistogramSummary {
  size_t count = 0;
  double min = 0.0;
  double max = 0.0;
  double mean = 0.0;
};

/**
 * Thread-safe in-process sink. Tagged series are stored under
 * "name{key=value,...}". Each histogram keeps its most recent samples only.
 */
class InMemoryMetrics : public MetricsSink {
public:
  explicit InMemoryMetrics(size_t maxSamples = 1000);

  void incrementCounter(const std::string &name, int64_t value = 1,
                        const MetricTags &tags = {}) override;
  void recordHistogram(const std::string &name, double value,
                       const MetricTags &tags = {}) override;
  void recordTiming(const std::string &name, double milliseconds,
                    const MetricTags &tags = {}) override;

  int64_t counter(const std::string &name, const MetricTags &tags = {}) const;
  HistogramSummary histogram(const std::string &name,
                             const MetricTags &tags = {}) const;
  HistogramSummary timing(const std::string &name,
                          const MetricTags &tags = {}) const;

  std::string toJson() const;
  void reset();

private:
  static std::string seriesKey(const std::string &name, const MetricTags &tags);
  static HistogramSummary summarize(const std::vector<double> &samples);
  void append(std::map<std::string, std::vector<double>> &series,
              const std::string &key, double value);

  size_t m_maxSamples;
  mutable std::mutex m_mutex;
  std::map<std::string, int64_t> m_counters;
  std::map<std::string, std::vector<double>> m_histograms;
  std::map<std::string, std::vector<double>> m_timings;
};

// Process-wide convenience instance; the executables use it, tests don't.
MetricsSink &defaultMetrics();

class ScopedTimer {
public:
  ScopedTimer(MetricsSink &sink, std::string name, MetricTags tags = {});
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;

private:
  MetricsSink &m_sink;
  std::string m_name;
  MetricTags m_tags;
  std::chrono::steady_clock::time_point m_start;
};

} // namespace filesync
