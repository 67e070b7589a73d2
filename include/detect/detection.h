#pragma once
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "config.h"

// Сырая детекция от внешнего детектора (координаты кадра).
struct Detection {
    cv::Rect2f bbox; // - x1,y1 = tl(), x2,y2 = br().
    int class_id = -1; // - COCO class id.
    float confidence = 0.0f;

    // Центр в целых пикселях: углы усекаются до int, затем (x1 + x2) / 2.
    // Координаты после обрезки по кадру неотрицательны, деление = floor.
    cv::Point2f centroid() const {
        const int x1 = static_cast<int>(bbox.x);
        const int y1 = static_cast<int>(bbox.y);
        const int x2 = static_cast<int>(bbox.x + bbox.width);
        const int y2 = static_cast<int>(bbox.y + bbox.height);
        return cv::Point2f(static_cast<float>((x1 + x2) / 2), static_cast<float>((y1 + y2) / 2));
    }
};

// Внешний детектор объектов.
class ObjectDetector {
public:
    virtual ~ObjectDetector() = default;

    virtual std::vector<Detection> detect(const cv::Mat &frame_bgr) = 0;
};

// COCO-имя машины: car, motorcycle, bus, truck; иначе "unknown".
const char *vehicle_class_name(int class_id);

// Оставляет только машины нужных классов с confidence > min_confidence,
// bbox обрезается по кадру; пустые bbox отбрасываются.
std::vector<Detection> filter_vehicle_detections(const std::vector<Detection> &detections,
                                                 const IntakeConfig &cfg,
                                                 const cv::Size &frame_size);
