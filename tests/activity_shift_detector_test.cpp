// File: tests/activity_shift_detector_test.cpp
#include <gtest/gtest.h>

#include <algorithm>

#include "sx/core/model/activity_shift_detector.hpp"

namespace sx {
namespace {

FeatureVector window(double typing, double idle, int focus_losses, Seconds length = 30.0) {
  FeatureVector fv;
  fv.avg_typing_speed = typing;
  fv.avg_idle_duration = idle;
  fv.focus_loss_count = focus_losses;
  fv.window_start = 1000.0 - length;
  fv.window_end = 1000.0;
  return fv;
}

class ActivityShiftDetectorTest : public ::testing::Test {
 protected:
  void SetUp() override { detector.set_baseline(BaselineProfile{200.0, 2.0, 0.5}); }

  ActivityShiftDetector detector;
};

TEST_F(ActivityShiftDetectorTest, IdleThenBurstScoresIdleBurst) {
  const AnomalyScores s = detector.compute_scores(window(400.0, 5.0, 0));
  EXPECT_NEAR(s.idle_burst, 70.0, 1e-9);
  EXPECT_DOUBLE_EQ(s.focus_instability, 0.0);
  EXPECT_NEAR(s.overall, 70.0, 1e-9);
}

TEST_F(ActivityShiftDetectorTest, TabSwitchingScoresFocusInstability) {
  const AnomalyScores s = detector.compute_scores(window(200.0, 1.5, 15));
  EXPECT_DOUBLE_EQ(s.focus_instability, 70.0);
  EXPECT_DOUBLE_EQ(s.idle_burst, 0.0);
  EXPECT_DOUBLE_EQ(s.behavioral_drift, 0.0);
  EXPECT_DOUBLE_EQ(s.overall, 70.0);
}

TEST_F(ActivityShiftDetectorTest, SlowTypingScoresDrift) {
  const AnomalyScores s = detector.compute_scores(window(50.0, 2.0, 0));
  EXPECT_DOUBLE_EQ(s.behavioral_drift, 70.0);
  EXPECT_DOUBLE_EQ(s.idle_burst, 0.0);
  EXPECT_DOUBLE_EQ(s.overall, 70.0);
}

TEST_F(ActivityShiftDetectorTest, NearBaselineIsNormal) {
  for (const auto& fv : {window(210.0, 2.1, 0), window(180.0, 1.8, 0), window(220.0, 2.2, 0)}) {
    const AnomalyScores s = detector.compute_scores(fv);
    EXPECT_LT(s.overall, 30.0);
    EXPECT_EQ(detector.explain(s), "Normal behavior detected");
  }
}

TEST_F(ActivityShiftDetectorTest, DriftGrowsLinearlyAboveThreshold) {
  // 40% deviation -> (0.4 - 0.3) * 200 = 20.
  EXPECT_NEAR(detector.behavioral_drift_score(window(280.0, 0.0, 0)), 20.0, 1e-9);
  EXPECT_NEAR(detector.behavioral_drift_score(window(120.0, 0.0, 0)), 20.0, 1e-9);
  EXPECT_DOUBLE_EQ(detector.behavioral_drift_score(window(260.0, 0.0, 0)), 0.0);
}

TEST_F(ActivityShiftDetectorTest, IdleBurstNeedsBothConditions) {
  EXPECT_DOUBLE_EQ(detector.idle_burst_score(window(400.0, 2.0, 0)), 0.0);  // no long idle
  EXPECT_DOUBLE_EQ(detector.idle_burst_score(window(250.0, 5.0, 0)), 0.0);  // no burst
}

TEST_F(ActivityShiftDetectorTest, ScoresStayInRange) {
  const FeatureVector extremes[] = {
      window(1e6, 1e6, 1000), window(0.0, 0.0, 0), window(1e6, 0.0, 0), window(0.0, 1e6, 1000),
      window(400.0, 5.0, 15, 0.0),
  };
  for (const auto& fv : extremes) {
    const AnomalyScores s = detector.compute_scores(fv);
    const DetectorConfig& c = detector.config();
    for (double v : {s.idle_burst, s.focus_instability, s.behavioral_drift, s.overall}) {
      EXPECT_GE(v, 0.0);
    }
    EXPECT_LE(s.idle_burst, c.idle_scale);
    EXPECT_LE(s.focus_instability, c.focus_scale);
    EXPECT_LE(s.behavioral_drift, c.drift_scale);
    EXPECT_LE(s.overall, std::max({c.idle_scale, c.focus_scale, c.drift_scale}));
    EXPECT_DOUBLE_EQ(s.overall, std::max({s.idle_burst, s.focus_instability, s.behavioral_drift}));
  }
}

TEST_F(ActivityShiftDetectorTest, ExplainJoinsBands) {
  AnomalyScores s;
  s.idle_burst = 65.0;
  s.focus_instability = 40.0;
  s.behavioral_drift = 10.0;
  EXPECT_EQ(detector.explain(s),
            "CRITICAL: Extreme typing burst after idle - possible copy-paste | "
            "WARNING: Frequent focus changes");

  s = AnomalyScores{};
  s.behavioral_drift = 61.0;
  EXPECT_EQ(detector.explain(s), "CRITICAL: Typing speed drastically changed");
}

TEST_F(ActivityShiftDetectorTest, KeepsBoundedOverallHistory) {
  for (int i = 0; i < 25; ++i) detector.compute_scores(window(200.0, 2.0, 0));
  EXPECT_EQ(detector.recent_overall().size(), 10u);

  detector.reset();
  EXPECT_TRUE(detector.recent_overall().empty());
  EXPECT_TRUE(detector.has_baseline());
}

TEST(ActivityShiftDetectorNoBaselineTest, AllZeros) {
  ActivityShiftDetector d;
  const AnomalyScores s = d.compute_scores(window(400.0, 5.0, 15));
  EXPECT_DOUBLE_EQ(s.overall, 0.0);
  EXPECT_DOUBLE_EQ(s.idle_burst, 0.0);
  EXPECT_FALSE(d.has_baseline());
  EXPECT_TRUE(d.recent_overall().empty());
}

TEST(ActivityShiftDetectorNoBaselineTest, ZeroBaselineRatesScoreZero) {
  ActivityShiftDetector d;
  d.set_baseline(BaselineProfile{0.0, 0.0, 0.0});
  const AnomalyScores s = d.compute_scores(window(400.0, 5.0, 15));
  EXPECT_DOUBLE_EQ(s.idle_burst, 0.0);
  EXPECT_DOUBLE_EQ(s.focus_instability, 0.0);
  EXPECT_DOUBLE_EQ(s.behavioral_drift, 0.0);
}

}  // namespace
}  // namespace sx
