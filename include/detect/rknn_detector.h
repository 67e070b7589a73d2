#pragma once
#include <opencv2/core.hpp>
#include <rknn_api.h>
#include <vector>
#include "config.h"
#include "detect/detection.h"

// YOLOv8 на NPU Rockchip (RKNN runtime).
// Возвращает все классы; отбор машин делает filter_vehicle_detections().
class RknnDetector : public ObjectDetector {
public:
    // Загружает модель; при ошибке бросает std::runtime_error.
    RknnDetector(const DetectorConfig &cfg, bool log = false);
    ~RknnDetector() override;

    RknnDetector(const RknnDetector &) = delete;
    RknnDetector &operator=(const RknnDetector &) = delete;

    // Детекции в координатах входного кадра (BGR).
    std::vector<Detection> detect(const cv::Mat &frame_bgr) override;

private:
    DetectorConfig cfg_;
    bool log_ = false;
    rknn_context rknn_ctx_ = 0;
    rknn_tensor_attr input_attr_{};
    std::vector<rknn_tensor_attr> output_attrs_;

    void load_model();
    void release();
};
