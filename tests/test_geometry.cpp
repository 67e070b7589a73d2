#include <gtest/gtest.h>
#include "util/geometry.h"

TEST(Geometry, CenterAndDistance) {
    const cv::Point2f c = util::center(cv::Rect2f(10, 20, 40, 60));
    EXPECT_FLOAT_EQ(c.x, 30.0f);
    EXPECT_FLOAT_EQ(c.y, 50.0f);
    EXPECT_FLOAT_EQ(util::distance(cv::Point2f(0, 0), cv::Point2f(3, 4)), 5.0f);
}

TEST(Geometry, ClampRectToFrame) {
    const cv::Rect2f r = util::clampRect(cv::Rect2f(-10, -5, 50, 50), cv::Size(30, 30));
    EXPECT_FLOAT_EQ(r.x, 0.0f);
    EXPECT_FLOAT_EQ(r.y, 0.0f);
    EXPECT_FLOAT_EQ(r.width, 30.0f);
    EXPECT_FLOAT_EQ(r.height, 30.0f);
}

TEST(Geometry, ClampRectKeepsInsideAndEmptiesOutside) {
    const cv::Rect2f inside(5.5f, 6.0f, 10.0f, 4.0f);
    EXPECT_EQ(util::clampRect(inside, cv::Size(30, 30)), inside);

    const cv::Rect2f edge = util::clampRect(cv::Rect2f(25, 28, 10, 10), cv::Size(30, 30));
    EXPECT_FLOAT_EQ(edge.width, 5.0f);
    EXPECT_FLOAT_EQ(edge.height, 2.0f);

    EXPECT_TRUE(util::clampRect(cv::Rect2f(40, 40, 10, 10), cv::Size(30, 30)).empty());
    EXPECT_TRUE(util::clampRect(cv::Rect2f(-20, 5, 10, 10), cv::Size(30, 30)).empty());
}

TEST(Geometry, PixelRoiOutsideFrameIsEmpty) {
    EXPECT_EQ(util::toPixelRoi(cv::Rect2f(200, 200, 10, 10), cv::Size(100, 100)).area(), 0);
    const cv::Rect roi = util::toPixelRoi(cv::Rect2f(90.5f, 10, 20, 20), cv::Size(100, 100));
    EXPECT_EQ(roi, cv::Rect(90, 10, 10, 20));
}
