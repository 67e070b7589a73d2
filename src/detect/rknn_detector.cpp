#include "detect/rknn_detector.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <opencv2/imgproc.hpp>
#include "detect/yolo_postprocess.h"

namespace {
    cv::Size input_size_from_attr(const rknn_tensor_attr &attr) {
        if (attr.n_dims >= 4) {
            if (attr.fmt == RKNN_TENSOR_NCHW) {
                return {static_cast<int>(attr.dims[3]), static_cast<int>(attr.dims[2])};
            }
            return {static_cast<int>(attr.dims[2]), static_cast<int>(attr.dims[1])};
        }
        return {0, 0};
    }

    size_t tensor_elem_count(const rknn_tensor_attr &attr) {
        size_t count = 1;
        for (uint32_t i = 0; i < attr.n_dims; ++i) {
            count *= static_cast<size_t>(attr.dims[i]);
        }
        return count;
    }

    std::string tensor_dims_to_string(const rknn_tensor_attr &attr) {
        std::ostringstream oss;
        oss << "[";
        for (uint32_t i = 0; i < attr.n_dims; ++i) {
            oss << attr.dims[i];
            if (i + 1 < attr.n_dims) {
                oss << "x";
            }
        }
        oss << "]";
        return oss.str();
    }

    // Выходы RKNN освобождаются при любом исходе постобработки.
    class OutputsGuard {
    public:
        OutputsGuard(rknn_context ctx, std::vector<rknn_output> &outputs)
                : ctx_(ctx), outputs_(outputs) {}
        ~OutputsGuard() {
            rknn_outputs_release(ctx_, static_cast<uint32_t>(outputs_.size()), outputs_.data());
        }
        OutputsGuard(const OutputsGuard &) = delete;
        OutputsGuard &operator=(const OutputsGuard &) = delete;

    private:
        rknn_context ctx_;
        std::vector<rknn_output> &outputs_;
    };
}

RknnDetector::RknnDetector(const DetectorConfig &cfg, bool log)
        : cfg_(cfg), log_(log) {
    try {
        load_model();
    } catch (const std::exception &) {
        release();
        throw;
    }
}

RknnDetector::~RknnDetector() {
    release();
}

void RknnDetector::release() {
    if (rknn_ctx_ != 0) {
        rknn_destroy(rknn_ctx_);
        rknn_ctx_ = 0;
    }
}

void RknnDetector::load_model() {
    if (cfg_.rknn_model_path.empty()) {
        throw std::runtime_error("detector: rknn_model_path is empty");
    }

    std::ifstream file(cfg_.rknn_model_path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("failed to open rknn model file: " + cfg_.rknn_model_path);
    }
    const std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);
    std::vector<unsigned char> model_data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char *>(model_data.data()), size)) {
        throw std::runtime_error("failed to read rknn model file: " + cfg_.rknn_model_path);
    }

    if (rknn_init(&rknn_ctx_, model_data.data(), model_data.size(), 0, nullptr) != RKNN_SUCC) {
        rknn_ctx_ = 0;
        throw std::runtime_error("rknn_init failed");
    }

    rknn_input_output_num io_num{};
    if (rknn_query(rknn_ctx_, RKNN_QUERY_IN_OUT_NUM, &io_num, sizeof(io_num)) != RKNN_SUCC) {
        throw std::runtime_error("rknn_query io num failed");
    }

    input_attr_.index = 0;
    if (rknn_query(rknn_ctx_, RKNN_QUERY_INPUT_ATTR, &input_attr_, sizeof(input_attr_)) != RKNN_SUCC) {
        throw std::runtime_error("rknn_query input attr failed");
    }

    output_attrs_.resize(io_num.n_output);
    for (uint32_t i = 0; i < io_num.n_output; ++i) {
        output_attrs_[i].index = i;
        if (rknn_query(rknn_ctx_, RKNN_QUERY_OUTPUT_ATTR, &output_attrs_[i], sizeof(output_attrs_[i])) != RKNN_SUCC) {
            throw std::runtime_error("rknn_query output attr failed");
        }
        if (log_) {
            std::cout << "[DET] rknn output[" << i << "] dims="
                      << tensor_dims_to_string(output_attrs_[i])
                      << " fmt=" << output_attrs_[i].fmt
                      << " type=" << output_attrs_[i].type
                      << std::endl;
        }
    }

    std::cout << "[DET] rknn model loaded: " << cfg_.rknn_model_path
              << " (inputs=" << io_num.n_input
              << ", outputs=" << io_num.n_output << ")"
              << std::endl;
}

std::vector<Detection> RknnDetector::detect(const cv::Mat &frame_bgr) {
    if (frame_bgr.empty() || rknn_ctx_ == 0) return {};

    const cv::Size input_size = input_size_from_attr(input_attr_);
    if (input_size.width <= 0 || input_size.height <= 0) {
        throw std::runtime_error("rknn model has invalid input size");
    }

    const Letterbox box = Letterbox::fit(frame_bgr.size(), input_size);
    const int resized_w = static_cast<int>(std::round(frame_bgr.cols * box.scale));
    const int resized_h = static_cast<int>(std::round(frame_bgr.rows * box.scale));

    cv::Mat resized;
    cv::resize(frame_bgr, resized, cv::Size(resized_w, resized_h));

    cv::Mat input(input_size, frame_bgr.type(), cv::Scalar(0, 0, 0));
    resized.copyTo(input(cv::Rect(box.pad_left, box.pad_top, resized.cols, resized.rows)));

    cv::Mat input_rgb;
    if (cfg_.rknn_swap_rb) {
        cv::cvtColor(input, input_rgb, cv::COLOR_BGR2RGB);
    } else {
        input_rgb = input;
    }

    cv::Mat input_float;
    input_rgb.convertTo(input_float, CV_32F, cfg_.rknn_scale);

    rknn_input inputs[1]{};
    inputs[0].index = 0;
    inputs[0].type = RKNN_TENSOR_FLOAT32;
    // буфер cv::Mat всегда HWC, перестановку в NCHW делает runtime
    inputs[0].fmt = RKNN_TENSOR_NHWC;
    inputs[0].size = static_cast<uint32_t>(tensor_elem_count(input_attr_) * sizeof(float));
    inputs[0].buf = input_float.data;
    if (rknn_inputs_set(rknn_ctx_, 1, inputs) != RKNN_SUCC) {
        throw std::runtime_error("rknn_inputs_set failed");
    }

    if (rknn_run(rknn_ctx_, nullptr) != RKNN_SUCC) {
        throw std::runtime_error("rknn_run failed");
    }

    std::vector<rknn_output> outputs(output_attrs_.size());
    for (auto &o : outputs) {
        o.want_float = 1;
    }
    if (rknn_outputs_get(rknn_ctx_, static_cast<uint32_t>(outputs.size()), outputs.data(), nullptr) != RKNN_SUCC) {
        throw std::runtime_error("rknn_outputs_get failed");
    }
    OutputsGuard guard(rknn_ctx_, outputs);

    YoloThresholds th;
    th.conf = cfg_.rknn_conf_threshold;
    th.nms = cfg_.rknn_nms_threshold;
    return yolo_postprocess(outputs, output_attrs_, box, th, log_);
}
