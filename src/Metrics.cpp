#include "Metrics.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include <numeric>

using json = nlohmann::json;

namespace filesync {

InMemoryMetrics::InMemoryMetrics(size_t maxSamples)
    : m_maxSamples(maxSamples == 0 ? 1 : maxSamples) {}

std::string InMemoryMetrics::seriesKey(const std::string &name,
                                       const MetricTags &tags) {
  if (tags.empty())
    return name;
  std::string key = name + "{";
  bool first = true;
  for (const auto &[k, v] : tags) {
    if (!first)
      key += ",";
    key += k + "=" + v;
    first = false;
  }
  return key + "}";
}

HistogramSummary
InMemoryMetrics::summarize(const std::vector<double> &samples) {
  HistogramSummary summary;
  if (samples.empty())
    return summary;
  summary.count = samples.size();
  auto [lo, hi] = std::minmax_element(samples.begin(), samples.end());
  summary.min = *lo;
  summary.max = *hi;
  summary.mean = std::accumulate(samples.begin(), samples.end(), 0.0) /
                 static_cast<double>(samples.size());
  return summary;
}

void InMemoryMetrics::append(std::map<std::string, std::vector<double>> &series,
                             const std::string &key, double value) {
  auto &samples = series[key];
  samples.push_back(value);
  if (samples.size() > m_maxSamples)
    samples.erase(samples.begin(),
                  samples.begin() + (samples.size() - m_maxSamples));
}

void InMemoryMetrics::incrementCounter(const std::string &name, int64_t value,
                                       const MetricTags &tags) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_counters[seriesKey(name, tags)] += value;
}

void InMemoryMetrics::recordHistogram(const std::string &name, double value,
                                      const MetricTags &tags) {
  std::lock_guard<std::mutex> lock(m_mutex);
  append(m_histograms, seriesKey(name, tags), value);
}

void InMemoryMetrics::recordTiming(const std::string &name,
                                   double milliseconds,
                                   const MetricTags &tags) {
  std::lock_guard<std::mutex> lock(m_mutex);
  append(m_timings, seriesKey(name, tags), milliseconds);
}

int64_t InMemoryMetrics::counter(const std::string &name,
                                 const MetricTags &tags) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_counters.find(seriesKey(name, tags));
  return it == m_counters.end() ? 0 : it->second;
}

HistogramSummary InMemoryMetrics::histogram(const std::string &name,
                                            const MetricTags &tags) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_histograms.find(seriesKey(name, tags));
  return it == m_histograms.end() ? HistogramSummary{}
                                  : summarize(it->second);
}

HistogramSummary InMemoryMetrics::timing(const std::string &name,
                                         const MetricTags &tags) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_timings.find(seriesKey(name, tags));
  return it == m_timings.end() ? HistogramSummary{} : summarize(it->second);
}

std::string InMemoryMetrics::toJson() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  json out;
  out["counters"] = json::object();
  for (const auto &[key, value] : m_counters)
    out["counters"][key] = value;

  auto dumpSeries = [](const std::map<std::string, std::vector<double>> &s) {
    json series = json::object();
    for (const auto &[key, samples] : s) {
      auto summary = summarize(samples);
      series[key] = {{"count", summary.count},
                     {"min", summary.min},
                     {"max", summary.max},
                     {"mean", summary.mean}};
    }
    return series;
  };
  out["histograms"] = dumpSeries(m_histograms);
  out["timings"] = dumpSeries(m_timings);
  return out.dump();
}

void InMemoryMetrics::reset() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_counters.clear();
  m_histograms.clear();
  m_timings.clear();
}

MetricsSink &defaultMetrics() {
  static InMemoryMetrics instance;
  return instance;
}

ScopedTimer::ScopedTimer(MetricsSink &sink, std::string name, MetricTags tags)
    : m_sink(sink), m_name(std::move(name)), m_tags(std::move(tags)),
      m_start(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
  auto elapsed = std::chrono::steady_clock::now() - m_start;
  m_sink.recordTiming(
      m_name,
      std::chrono::duration<double, std::milli>(elapsed).count(), m_tags);
}

} // namespace filesync
