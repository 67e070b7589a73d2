#include "detect/detection.h"
#include "util/geometry.h"
#include <algorithm>

const char *vehicle_class_name(int class_id) {
    switch (class_id) {
        case 2: return "car";
        case 3: return "motorcycle";
        case 5: return "bus";
        case 7: return "truck";
        default: return "unknown";
    }
}

std::vector<Detection> filter_vehicle_detections(const std::vector<Detection> &detections,
                                                 const IntakeConfig &cfg,
                                                 const cv::Size &frame_size) {
    std::vector<Detection> out;
    out.reserve(detections.size());
    for (const auto &d : detections) {
        if (std::find(cfg.vehicle_classes.begin(), cfg.vehicle_classes.end(), d.class_id)
            == cfg.vehicle_classes.end()) {
            continue;
        }
        if (d.confidence <= cfg.min_confidence) {
            continue;
        }
        Detection clipped = d;
        if (frame_size.width > 0 && frame_size.height > 0) {
            clipped.bbox = util::clampRect(d.bbox, frame_size);
        }
        if (clipped.bbox.width <= 0.0f || clipped.bbox.height <= 0.0f) {
            continue;
        }
        out.push_back(clipped);
    }
    return out;
}
