#include "chunkup/utilities/metrics.h"
#include <algorithm>
#include <sstream>
#include <vector>

namespace chunkup {

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

static std::string makeKey(const std::string &name,
                           const std::map<std::string, std::string> &labels) {
  std::ostringstream oss;
  oss << name << MetricsRegistry::labelsToString(labels);
  return oss.str();
}

static void splitKey(const std::string &key, std::string &name,
                     std::string &labels) {
  auto nameEnd = key.find('{');
  name = key.substr(0, nameEnd);
  labels = nameEnd == std::string::npos ? "" : key.substr(nameEnd);
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::addGauge(const std::string &name, double delta,
                               const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] += delta;
}

void MetricsRegistry::incrementCounter(
    const std::string &name, double value,
    const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &h = histograms_[makeKey(name, labels)];
  h.sum += value;
  h.count += 1;
}

double MetricsRegistry::counterValue(
    const std::string &name,
    const std::map<std::string, std::string> &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(
    const std::map<std::string, std::string> &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << kv.second << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::ostringstream oss;
  std::string name;
  std::string labels;
  // Sorted output keeps the exposition stable between scrapes.
  std::vector<std::pair<std::string, double>> scalars(gauges_.begin(),
                                                      gauges_.end());
  scalars.insert(scalars.end(), counters_.begin(), counters_.end());
  std::sort(scalars.begin(), scalars.end());
  for (const auto &kv : scalars) {
    splitKey(kv.first, name, labels);
    oss << name << labels << ' ' << kv.second << '\n';
  }
  std::vector<std::pair<std::string, Histogram>> hists(histograms_.begin(),
                                                       histograms_.end());
  std::sort(hists.begin(), hists.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });
  for (const auto &kv : hists) {
    splitKey(kv.first, name, labels);
    oss << name << "_sum" << labels << ' ' << kv.second.sum << '\n';
    oss << name << "_count" << labels << ' ' << kv.second.count << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  histograms_.clear();
}

} // namespace chunkup
