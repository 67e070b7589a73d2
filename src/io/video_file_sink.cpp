#include "io/video_file_sink.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

VideoFileSink::VideoFileSink(std::string path, const OutputConfig &cfg)
        : path_(std::move(path)), cfg_(cfg) {}

VideoFileSink::~VideoFileSink() {
    close();
}

cv::Size VideoFileSink::output_size(int width, int height, const OutputConfig &cfg) {
    int w = cfg.max_width > 0 ? std::min(width, cfg.max_width) : width;
    int h = cfg.max_height > 0 ? std::min(height, cfg.max_height) : height;
    // большинство кодеков требуют чётные размеры
    w -= w % 2;
    h -= h % 2;
    return cv::Size(w, h);
}

void VideoFileSink::open(const VideoInfo &info) {
    size_ = output_size(info.width, info.height, cfg_);
    if (size_.width <= 0 || size_.height <= 0) {
        throw std::runtime_error("invalid output frame size for " + path_);
    }
    const double fps = info.fps > 0.0 ? info.fps : 30.0;

    for (const auto &codec : cfg_.codecs) {
        if (codec.size() != 4) continue;
        const int fourcc = cv::VideoWriter::fourcc(codec[0], codec[1], codec[2], codec[3]);
        if (writer_.open(path_, fourcc, fps, size_) && writer_.isOpened()) {
            codec_ = codec;
            std::cout << "[VIDEO] writer: " << path_ << " codec=" << codec
                      << " " << size_.width << "x" << size_.height
                      << " fps=" << fps << std::endl;
            return;
        }
    }
    throw std::runtime_error("cannot initialize video writer with any codec: " + path_);
}

void VideoFileSink::write(const cv::Mat &frame) {
    if (!writer_.isOpened() || frame.empty()) return;
    if (frame.size() == size_) {
        writer_.write(frame);
        return;
    }
    cv::Mat resized;
    cv::resize(frame, resized, size_);
    writer_.write(resized);
}

void VideoFileSink::close() {
    if (writer_.isOpened()) {
        writer_.release();
    }
}
