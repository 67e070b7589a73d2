#include "detect/yolo_postprocess.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <opencv2/dnn.hpp>

namespace {

size_t element_count(const rknn_tensor_attr &attr) {
    size_t n = 1;
    for (uint32_t i = 0; i < attr.n_dims; ++i) n *= attr.dims[i];
    return n;
}

// Строки-кандидаты [N, 4+C]. Модель может отдавать транспонированный тензор.
cv::Mat candidate_rows(const cv::Mat &output) {
    if (output.dims == 2) return output;
    if (output.dims != 3 || output.size[1] <= 0 || output.size[2] <= 0) return cv::Mat();
    cv::Mat plane(output.size[1], output.size[2], CV_32F, const_cast<float *>(output.ptr<float>()));
    return output.size[1] < output.size[2] ? cv::Mat(plane.t()) : plane;
}

// Скоры классов либо уже вероятности, либо логиты.
bool scores_are_logits(const float *row, int cols) {
    for (int c = 4; c < cols; ++c) {
        if (row[c] < 0.0f || row[c] > 1.0f) return true;
    }
    return false;
}

} // namespace

Letterbox Letterbox::fit(const cv::Size &frame, const cv::Size &input) {
    Letterbox lb;
    lb.input = input;
    lb.frame = frame;
    if (frame.width <= 0 || frame.height <= 0) return lb;
    lb.scale = std::min(static_cast<float>(input.width) / frame.width,
                        static_cast<float>(input.height) / frame.height);
    const int w = static_cast<int>(std::round(frame.width * lb.scale));
    const int h = static_cast<int>(std::round(frame.height * lb.scale));
    lb.pad_left = (input.width - w) / 2;
    lb.pad_top = (input.height - h) / 2;
    return lb;
}

cv::Rect2f Letterbox::to_frame(float cx, float cy, float w, float h) const {
    const float x1 = (cx - 0.5f * w - pad_left) / scale;
    const float y1 = (cy - 0.5f * h - pad_top) / scale;
    const float x2 = x1 + w / scale;
    const float y2 = y1 + h / scale;
    const float fw = static_cast<float>(frame.width);
    const float fh = static_cast<float>(frame.height);
    const float l = std::clamp(x1, 0.0f, fw);
    const float t = std::clamp(y1, 0.0f, fh);
    const float r = std::clamp(x2, 0.0f, fw);
    const float b = std::clamp(y2, 0.0f, fh);
    return cv::Rect2f(l, t, std::max(0.0f, r - l), std::max(0.0f, b - t));
}

std::vector<Detection> decode_yolov8(const cv::Mat &output,
                                     const Letterbox &box,
                                     const YoloThresholds &th,
                                     bool verbose) {
    const cv::Mat rows = candidate_rows(output);
    if (rows.empty() || rows.cols < 5 || box.scale <= 0.0f) {
        std::cerr << "[POST] unsupported yolo output" << std::endl;
        return {};
    }

    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    std::vector<int> classes;

    for (int i = 0; i < rows.rows; ++i) {
        const float *row = rows.ptr<float>(i);
        const bool logits = scores_are_logits(row, rows.cols);

        const float *best = std::max_element(row + 4, row + rows.cols);
        float score = *best;
        if (logits) score = 1.0f / (1.0f + std::exp(-score));
        if (score < th.conf) continue;

        float cx = row[0], cy = row[1], w = row[2], h = row[3];
        // нормированные координаты -> пиксели входа
        if (cx <= 1.0f && cy <= 1.0f && w <= 1.0f && h <= 1.0f) {
            cx *= box.input.width;
            w *= box.input.width;
            cy *= box.input.height;
            h *= box.input.height;
        }
        const cv::Rect2f r = box.to_frame(cx, cy, w, h);
        if (r.width <= 1.0f || r.height <= 1.0f) continue;

        boxes.emplace_back(r);
        scores.push_back(score);
        classes.push_back(static_cast<int>(best - (row + 4)));
    }

    // NMS отдельно по каждому классу
    std::vector<int> keep;
    cv::dnn::NMSBoxesBatched(boxes, scores, classes, th.conf, th.nms, keep);
    if (verbose) {
        std::cout << "[POST] candidates=" << boxes.size() << " kept=" << keep.size() << std::endl;
    }

    std::vector<Detection> out;
    out.reserve(keep.size());
    for (int k : keep) {
        Detection d;
        d.bbox = cv::Rect2f(boxes[k]);
        d.class_id = classes[k];
        d.confidence = scores[k];
        out.push_back(d);
    }
    return out;
}

std::vector<Detection> yolo_postprocess(const std::vector<rknn_output> &outputs,
                                        const std::vector<rknn_tensor_attr> &output_attrs,
                                        const Letterbox &box,
                                        const YoloThresholds &th,
                                        bool verbose) {
    if (outputs.empty() || outputs.size() != output_attrs.size()) return {};

    size_t idx = 0;
    for (size_t i = 1; i < output_attrs.size(); ++i) {
        if (element_count(output_attrs[i]) > element_count(output_attrs[idx])) idx = i;
    }

    const rknn_tensor_attr &attr = output_attrs[idx];
    std::vector<int> dims(attr.dims, attr.dims + attr.n_dims);
    const cv::Mat tensor(static_cast<int>(dims.size()), dims.data(), CV_32F, outputs[idx].buf);
    return decode_yolov8(tensor, box, th, verbose);
}
