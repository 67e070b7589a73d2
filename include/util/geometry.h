#pragma once
#include <opencv2/core.hpp>

namespace util {

// Center of rectangle (pixels).
cv::Point2f center(const cv::Rect2f& r);

// Euclidean distance between two points (pixels).
float distance(const cv::Point2f& a, const cv::Point2f& b);

// Rectangle from corner coordinates (x1,y1)-(x2,y2).
cv::Rect2f fromCorners(float x1, float y1, float x2, float y2);

// Clamp rectangle to frame bounds (0..W, 0..H); empty if nothing is left.
cv::Rect2f clampRect(const cv::Rect2f& r, const cv::Size& frameSize);

// Integer ROI inside the frame, empty if the rectangle is outside.
cv::Rect toPixelRoi(const cv::Rect2f& r, const cv::Size& frameSize);

} // namespace util
