#pragma once

#include <opencv2/core.hpp>
#include <rknn_api.h>
#include <vector>
#include "detect/detection.h"

// Геометрия letterbox: кадр -> вход модели.
struct Letterbox {
    cv::Size input;   // - размер входа модели.
    cv::Size frame;   // - размер исходного кадра.
    float scale = 1.0f;
    int pad_left = 0;
    int pad_top = 0;

    static Letterbox fit(const cv::Size &frame, const cv::Size &input);

    // Прямоугольник из координат входа модели в координаты кадра (с обрезкой).
    cv::Rect2f to_frame(float cx, float cy, float w, float h) const;
};

struct YoloThresholds {
    float conf = 0.35f;
    float nms = 0.45f;
};

// Выход YOLOv8 [1, 4+C, N] или [1, N, 4+C] -> детекции кадра после NMS по классам.
std::vector<Detection> decode_yolov8(const cv::Mat &output,
                                     const Letterbox &box,
                                     const YoloThresholds &th,
                                     bool verbose);

// Выбирает самый большой выходной тензор RKNN и декодирует его.
std::vector<Detection> yolo_postprocess(const std::vector<rknn_output> &outputs,
                                        const std::vector<rknn_tensor_attr> &output_attrs,
                                        const Letterbox &box,
                                        const YoloThresholds &th,
                                        bool verbose);
