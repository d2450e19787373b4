// File: tests/feature_extractor_test.cpp
#include <gtest/gtest.h>

#include "sx/core/model/feature_extractor.hpp"

namespace sx {
namespace {

FeatureExtractor make_extractor(Seconds window_s = 30.0) {
  FeaturesConfig cfg;
  cfg.window_s = window_s;
  return FeatureExtractor(cfg);
}

TEST(FeatureExtractorTest, EmptyWindowYieldsZeros) {
  auto fx = make_extractor();
  const FeatureVector fv = fx.compute_features(100.0);

  EXPECT_EQ(fv.key_press_count, 0);
  EXPECT_EQ(fv.focus_loss_count, 0);
  EXPECT_DOUBLE_EQ(fv.avg_typing_speed, 0.0);
  EXPECT_DOUBLE_EQ(fv.avg_idle_duration, 0.0);
  EXPECT_DOUBLE_EQ(fv.avg_mouse_speed, 0.0);
  EXPECT_DOUBLE_EQ(fv.inter_key_interval, 0.0);
  EXPECT_DOUBLE_EQ(fv.window_start, 70.0);
  EXPECT_DOUBLE_EQ(fv.window_end, 100.0);
  EXPECT_DOUBLE_EQ(fv.window_length(), 30.0);
}

TEST(FeatureExtractorTest, TypingSpeedIsPressesPerMinuteOverWindow) {
  auto fx = make_extractor();
  for (int i = 0; i < 10; ++i) {
    fx.add_event(InteractionEvent::key_press(100.0 + i));
    fx.add_event(InteractionEvent::key_release(100.05 + i));
  }

  const FeatureVector fv = fx.compute_features(110.0);
  EXPECT_EQ(fv.key_press_count, 10);
  EXPECT_NEAR(fv.avg_typing_speed, 20.0, 1e-9);  // 10 presses / 30 s * 60
  EXPECT_NEAR(fv.inter_key_interval, 1.0, 1e-9);
}

TEST(FeatureExtractorTest, SinglePressHasNoSpeed) {
  auto fx = make_extractor();
  fx.add_event(InteractionEvent::key_press(5.0));

  const FeatureVector fv = fx.compute_features(10.0);
  EXPECT_EQ(fv.key_press_count, 1);
  EXPECT_DOUBLE_EQ(fv.avg_typing_speed, 0.0);
  EXPECT_DOUBLE_EQ(fv.inter_key_interval, 0.0);
}

TEST(FeatureExtractorTest, PrunesEventsOlderThanWindow) {
  auto fx = make_extractor();
  fx.add_event(InteractionEvent::key_press(0.0));
  fx.add_event(InteractionEvent::key_press(29.0));
  fx.add_event(InteractionEvent::key_press(50.0));
  EXPECT_EQ(fx.size(), 3u);

  const FeatureVector fv = fx.compute_features(60.0);
  EXPECT_EQ(fx.size(), 1u);
  EXPECT_EQ(fv.key_press_count, 1);
}

TEST(FeatureExtractorTest, EventOnCutoffIsKept) {
  auto fx = make_extractor();
  fx.add_event(InteractionEvent::key_press(30.0));
  fx.add_event(InteractionEvent::key_press(40.0));

  const FeatureVector fv = fx.compute_features(60.0);
  EXPECT_EQ(fv.key_press_count, 2);
}

TEST(FeatureExtractorTest, LateEventIsInsertedInOrder) {
  auto fx = make_extractor();
  fx.add_event(InteractionEvent::mouse(EventKind::kMouseMove, 1.0, 0, 0));
  fx.add_event(InteractionEvent::mouse(EventKind::kMouseMove, 3.0, 0, 20));
  fx.add_event(InteractionEvent::mouse(EventKind::kMouseMove, 2.0, 0, 10));  // late

  // Sorted path 0 -> 10 -> 20 is 20 px over 2 s. Arrival order would give 30 px.
  const FeatureVector fv = fx.compute_features(10.0);
  EXPECT_DOUBLE_EQ(fv.avg_mouse_speed, 10.0);
}

TEST(FeatureExtractorTest, LateEventOlderThanWindowIsPruned) {
  auto fx = make_extractor();
  fx.add_event(InteractionEvent::key_press(100.0));
  fx.add_event(InteractionEvent::key_press(10.0));

  const FeatureVector fv = fx.compute_features(110.0);
  EXPECT_EQ(fv.key_press_count, 1);
  EXPECT_EQ(fx.size(), 1u);
}

TEST(FeatureExtractorTest, IdleDurationAveragesIdlePeriodsOnly) {
  auto fx = make_extractor();
  fx.add_event(InteractionEvent::idle(10.0, 2.0));
  fx.add_event(InteractionEvent::idle(10.0, 2.0, /*ended=*/true));
  fx.add_event(InteractionEvent::idle(20.0, 4.0));
  fx.add_event(InteractionEvent::idle(20.0, 4.0, /*ended=*/true));

  const FeatureVector fv = fx.compute_features(25.0);
  EXPECT_DOUBLE_EQ(fv.avg_idle_duration, 3.0);
}

TEST(FeatureExtractorTest, CountsFocusLossesOnly) {
  auto fx = make_extractor();
  fx.add_event(InteractionEvent::focus(1.0, true));
  fx.add_event(InteractionEvent::focus(2.0, false));
  fx.add_event(InteractionEvent::focus(3.0, true));
  fx.add_event(InteractionEvent::focus(4.0, false));
  fx.add_event(InteractionEvent::focus(5.0, true));

  const FeatureVector fv = fx.compute_features(10.0);
  EXPECT_EQ(fv.focus_loss_count, 3);
}

TEST(FeatureExtractorTest, ClearEmptiesBuffer) {
  auto fx = make_extractor();
  fx.add_event(InteractionEvent::key_press(1.0));
  fx.clear();
  EXPECT_EQ(fx.size(), 0u);
  EXPECT_DOUBLE_EQ(fx.window_duration(), 30.0);
}

}  // namespace
}  // namespace sx
