// test/test_tracking_error.cpp
#include <gtest/gtest.h>

#include "pan_tilt_tracker/tracking_error.hpp"

namespace {

SelectedTarget target_at(double x, double y)
{
    return SelectedTarget{x, y, 100, 0};
}

} // namespace

TEST(TrackingError, CenteredTargetHasNoError)
{
    auto error = compute_tracking_error(target_at(320.0, 240.0), 640.0, 480.0);
    EXPECT_DOUBLE_EQ(error.x, 0.0);
    EXPECT_DOUBLE_EQ(error.y, 0.0);
}

TEST(TrackingError, FrameEdgesMapToUnitError)
{
    auto top_left = compute_tracking_error(target_at(0.0, 0.0), 640.0, 480.0);
    EXPECT_DOUBLE_EQ(top_left.x, -1.0);
    EXPECT_DOUBLE_EQ(top_left.y, -1.0);

    auto bottom_right = compute_tracking_error(target_at(640.0, 480.0), 640.0, 480.0);
    EXPECT_DOUBLE_EQ(bottom_right.x, 1.0);
    EXPECT_DOUBLE_EQ(bottom_right.y, 1.0);
}

TEST(TrackingError, RightOfCenterIsPositive)
{
    auto error = compute_tracking_error(target_at(480.0, 120.0), 640.0, 480.0);
    EXPECT_DOUBLE_EQ(error.x, 0.5);
    EXPECT_DOUBLE_EQ(error.y, -0.5);
}

TEST(TrackingError, OutsideFrameIsNotClamped)
{
    auto error = compute_tracking_error(target_at(800.0, 240.0), 640.0, 480.0);
    EXPECT_DOUBLE_EQ(error.x, 1.5);
}

TEST(TrackingError, TinyFrameNormalizesByAtLeastOnePixel)
{
    auto error = compute_tracking_error(target_at(1.5, 0.0), 1.0, 1.0);
    EXPECT_DOUBLE_EQ(error.x, 1.0);
    EXPECT_DOUBLE_EQ(error.y, -0.5);
}
