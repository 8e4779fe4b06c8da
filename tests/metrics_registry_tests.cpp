#include "chunkup/utilities/metrics.h"
#include <gtest/gtest.h>

using chunkup::MetricsRegistry;

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
  std::map<std::string, std::string> labels{{"k", "v"}, {"a", "b"}};
  std::string formatted = MetricsRegistry::labelsToString(labels);
  // Map iteration is ordered, so "a" should come before "k".
  EXPECT_EQ(formatted, "{a=\"b\",k=\"v\"}");
}

/**
 * @brief Validate gauge, counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
  auto &m = MetricsRegistry::instance();
  m.reset();
  m.setGauge("chunkup_upload_inflight", 2, {{"pool", "upload"}});
  m.addGauge("chunkup_upload_inflight", 1, {{"pool", "upload"}});
  m.incrementCounter("chunkup_chunks_uploaded_total", 3);
  m.observe("chunkup_chunk_upload_bytes", 1024);
  std::string metrics = m.toPrometheus();
  EXPECT_NE(metrics.find("chunkup_upload_inflight{pool=\"upload\"} 3"),
            std::string::npos);
  EXPECT_NE(metrics.find("chunkup_chunks_uploaded_total 3"), std::string::npos);
  EXPECT_NE(metrics.find("chunkup_chunk_upload_bytes_sum 1024"),
            std::string::npos);
  EXPECT_NE(metrics.find("chunkup_chunk_upload_bytes_count 1"),
            std::string::npos);
  EXPECT_DOUBLE_EQ(m.counterValue("chunkup_chunks_uploaded_total"), 3);
  EXPECT_DOUBLE_EQ(m.counterValue("never_touched_total"), 0);
  m.reset();
  EXPECT_TRUE(m.toPrometheus().empty());
}
