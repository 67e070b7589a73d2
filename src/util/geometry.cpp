#include "util/geometry.h"
#include <algorithm>
#include <cmath>

namespace util {

cv::Point2f center(const cv::Rect2f& r) {
    return cv::Point2f(r.x + r.width * 0.5f, r.y + r.height * 0.5f);
}

float distance(const cv::Point2f& a, const cv::Point2f& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx*dx + dy*dy);
}

cv::Rect2f fromCorners(float x1, float y1, float x2, float y2) {
    return cv::Rect2f(x1, y1, x2 - x1, y2 - y1);
}

cv::Rect2f clampRect(const cv::Rect2f& r, const cv::Size& frameSize) {
    // пересечение с кадром; вне кадра -> пустой Rect2f()
    const cv::Rect2f frame(0.0f, 0.0f, static_cast<float>(frameSize.width), static_cast<float>(frameSize.height));
    return r & frame;
}

cv::Rect toPixelRoi(const cv::Rect2f& r, const cv::Size& frameSize) {
    int x1 = std::max(0, (int)r.x);
    int y1 = std::max(0, (int)r.y);
    int x2 = std::min(frameSize.width,  (int)(r.x + r.width));
    int y2 = std::min(frameSize.height, (int)(r.y + r.height));
    if (x2 <= x1 || y2 <= y1) return cv::Rect(0, 0, 0, 0);
    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

} // namespace util
